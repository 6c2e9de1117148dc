// ==============================================================================
// lexrefine/output.hpp - Пользовательский вывод и журнал
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами уровней ([+] [!] [x] [*] [~])
// - Журнал в файл (--log) без ANSI кодов
// - Таблицы (статус задания, результаты gates, список правил)
// - JSON вывод через RapidJSON
//
// Writer разделяется потоками batch-обработки: каждая запись строки
// выполняется под мьютексом.
//
// ==============================================================================

#ifndef LEXREFINE_OUTPUT_HPP
#define LEXREFINE_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <rapidjson/document.h>

namespace lexrefine::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить informational stderr
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner: скрыть баннер

    // Путь для stdout-вывода (--output)
    std::optional<std::filesystem::path> output_path;

    // Журнал сообщений (--log): все уровни, без цвета, без учёта quiet
    std::optional<std::filesystem::path> log_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// Alias для warn
    void warning(std::string_view message) { warn(message); }

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Зелёная строка в stdout
    void green_line(std::string_view message);

    /// Жёлтая строка в stderr (если не quiet)
    void yellow_line(std::string_view message);

    /// Красная строка в stderr
    void red_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать JSON значение одной строкой
    void write_json(const rapidjson::Value& value);

    /// Записать pretty JSON (с отступами)
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    bool has_output_file() const { return output_file_ != nullptr; }

    bool has_log_file() const { return log_file_ != nullptr; }

private:
    /// Сообщение с префиксом уровня (под мьютексом, одна строка целиком)
    void message(std::string_view prefix, Color color, std::string_view text, bool to_console);

    /// Записать байты без блокировки
    void write_unlocked(Stream s, std::string_view bytes);

    void write_colored_unlocked(Stream s, std::string_view text, Color color);

    FILE* get_file(Stream s) const;

    bool open_files();
    void close_files();

    OutputConfig config_;
    FILE* output_file_ = nullptr;
    FILE* log_file_ = nullptr;
    std::mutex mutex_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц (Unicode box-drawing)
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);

    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу в stdout через Writer
    void print(Writer& w) const;

    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    std::vector<size_t> column_widths() const;

    std::string format_line(const std::vector<size_t>& widths, const char* left, const char* middle,
                            const char* right) const;

    std::string format_row(const std::vector<size_t>& widths,
                           const std::vector<std::string>& cells) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "[+] <message>\n"
std::string format_info(std::string_view message);

/// "[x] <message>\n"
std::string format_error(std::string_view message);

/// "[!] <message>\n"
std::string format_warning(std::string_view message);

/// "[*] <message>\n"
std::string format_debug(std::string_view message);

/// Однострочное представление поля: \n \r \t -> пробел, повторные пробелы
/// схлопываются, длинные значения обрезаются до limit с "..."
std::string format_field(std::string_view field, size_t limit);

/// Ширина строки в символах терминала (UTF-8 code points)
size_t display_width(std::string_view text);

std::string ansi_color_code(Color color);

std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace lexrefine::output

#endif  // LEXREFINE_OUTPUT_HPP
