// ==============================================================================
// lexrefine/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Оценка потребления памяти процессом (performance gate)
// - Атомарная запись файлов (persistence, checkpoint)
//
// ==============================================================================

#ifndef LEXREFINE_PLATFORM_HPP
#define LEXREFINE_PLATFORM_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace lexrefine::platform {

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

/// stdout подключён к терминалу
bool is_tty_stdout();

/// stderr подключён к терминалу
bool is_tty_stderr();

/// Резидентная память процесса в байтах (0 если недоступно)
std::size_t resident_memory_bytes();

/// Прочитать файл целиком. Бросает std::runtime_error при ошибке.
std::string read_file(const std::filesystem::path& path);

/// Записать файл через временный файл + rename.
/// Бросает std::runtime_error при ошибке.
void write_file_atomic(const std::filesystem::path& path, std::string_view data);

/// Форматирование момента времени в UTC (strftime формат)
std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt);

/// ISO-8601 UTC: "2024-05-01T12:30:00Z"
std::string format_iso8601(std::chrono::system_clock::time_point tp);

/// Разбор "YYYY-mm-ddTHH:MM:SS[Z]". Бросает std::invalid_argument.
std::chrono::system_clock::time_point parse_iso8601(std::string_view text);

/// Название ОС (для баннера)
std::string os_name();

}  // namespace lexrefine::platform

#endif  // LEXREFINE_PLATFORM_HPP
