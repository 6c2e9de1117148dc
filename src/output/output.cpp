// ==============================================================================
// output.cpp - Пользовательский вывод и журнал
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты первичны, std::endl не
// используется.
//
// ==============================================================================

#include "lexrefine/output.hpp"

#include "lexrefine/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace lexrefine::output {

namespace {

// ANSI SGR коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    open_files();
}

Writer::~Writer() {
    close_files();
    std::fflush(stdout);
    std::fflush(stderr);
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(s, bytes);
    write_unlocked(s, "\n");
}

void Writer::write_unlocked(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    // stdout при --output уходит в файл
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::message(std::string_view prefix, Color color, std::string_view text,
                     bool to_console) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (to_console) {
        write_colored_unlocked(Stream::Stderr, prefix, color);
        write_unlocked(Stream::Stderr, " ");
        write_unlocked(Stream::Stderr, text);
        write_unlocked(Stream::Stderr, "\n");
    }

    // Журнал получает все уровни вне зависимости от quiet
    if (log_file_ != nullptr) {
        std::fwrite(prefix.data(), 1, prefix.size(), log_file_);
        std::fputc(' ', log_file_);
        std::fwrite(text.data(), 1, text.size(), log_file_);
        std::fputc('\n', log_file_);
    }
}

void Writer::info(std::string_view message_text) {
    message("[+]", Color::Green, message_text, !config_.quiet);
}

void Writer::warn(std::string_view message_text) {
    message("[!]", Color::Yellow, message_text, !config_.quiet);
}

void Writer::error(std::string_view message_text) {
    // Ошибки печатаются всегда, даже при --quiet
    message("[x]", Color::Red, message_text, true);
}

void Writer::debug(std::string_view message_text) {
    message("[*]", Color::Cyan, message_text, config_.verbose > 0);
}

void Writer::trace(std::string_view message_text) {
    message("[~]", Color::Magenta, message_text, config_.verbose > 1);
}

void Writer::green_line(std::string_view text) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_colored_unlocked(Stream::Stdout, text, Color::Green);
    write_unlocked(Stream::Stdout, "\n");
}

void Writer::yellow_line(std::string_view text) {
    if (config_.quiet) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    write_colored_unlocked(Stream::Stderr, text, Color::Yellow);
    write_unlocked(Stream::Stderr, "\n");
}

void Writer::red_line(std::string_view text) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_colored_unlocked(Stream::Stderr, text, Color::Red);
    write_unlocked(Stream::Stderr, "\n");
}

void Writer::write_colored_unlocked(Stream s, std::string_view text, Color color) {
    // В файл - без ANSI кодов
    bool use_color = (s == Stream::Stdout && output_file_ == nullptr && supports_color(s)) ||
                     (s == Stream::Stderr && supports_color(s));

    if (use_color && color != Color::Default) {
        write_unlocked(s, ansi_color_code(color));
        write_unlocked(s, text);
        write_unlocked(s, ANSI_RESET);
    } else {
        write_unlocked(s, text);
    }
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write_unlocked(Stream::Stdout, "\n");
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write_unlocked(Stream::Stdout, "\n");
}

void Writer::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
    }
}

bool Writer::open_files() {
    bool ok = true;
    if (config_.output_path.has_value()) {
        std::string path_str = platform::path_to_utf8(*config_.output_path);
        output_file_ = std::fopen(path_str.c_str(), "wb");
        ok = ok && output_file_ != nullptr;
    }
    if (config_.log_path.has_value()) {
        std::string path_str = platform::path_to_utf8(*config_.log_path);
        log_file_ = std::fopen(path_str.c_str(), "ab");
        ok = ok && log_file_ != nullptr;
    }
    return ok;
}

void Writer::close_files() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
        std::fclose(log_file_);
        log_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

std::string Table::format_line(const std::vector<size_t>& widths, const char* left,
                               const char* middle, const char* right) const {
    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        // padding (по пробелу с каждой стороны) + ширина содержимого
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<size_t>& widths,
                              const std::vector<std::string>& cells) const {
    std::string line = BOX_V;
    for (size_t i = 0; i < widths.size(); ++i) {
        line += ' ';
        const std::string cell = (i < cells.size()) ? cells[i] : "";
        line += cell;
        size_t width = display_width(cell);
        if (width < widths[i]) {
            line.append(widths[i] - width, ' ');
        }
        line += ' ';
        line += BOX_V;
    }
    return line;
}

std::string Table::to_string() const {
    const std::vector<size_t> widths = column_widths();
    if (widths.empty()) {
        return {};
    }

    std::string result;

    result += format_line(widths, BOX_TL, BOX_TT, BOX_TR);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(widths, headers_);
        result += '\n';
        result += format_line(widths, BOX_LT, BOX_CROSS, BOX_RT);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(widths, row);
        result += '\n';
    }

    result += format_line(widths, BOX_BL, BOX_BT, BOX_BR);
    result += '\n';

    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_info(std::string_view message) {
    std::string result = "[+] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_error(std::string_view message) {
    std::string result = "[x] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_warning(std::string_view message) {
    std::string result = "[!] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_debug(std::string_view message) {
    std::string result = "[*] ";
    result.append(message);
    result.append("\n");
    return result;
}

std::string format_field(std::string_view field, size_t limit) {
    std::string result;
    result.reserve(field.size());

    bool prev_space = false;
    for (char c : field) {
        if (c == '\n' || c == '\r' || c == '\t' || c == ' ') {
            if (!prev_space) {
                result += ' ';
                prev_space = true;
            }
            continue;
        }
        result += c;
        prev_space = false;
    }

    if (limit > 0 && display_width(result) > limit) {
        // Обрезаем по границе code point
        std::string cut;
        size_t count = 0;
        for (size_t i = 0; i < result.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(result[i]);
            if ((c & 0xC0) != 0x80) {
                if (count == limit) {
                    break;
                }
                ++count;
            }
            cut += result[i];
        }
        cut += "...";
        result = std::move(cut);
    }

    return result;
}

size_t display_width(std::string_view text) {
    size_t count = 0;
    for (char c : text) {
        // continuation bytes 10xxxxxx не считаются
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace lexrefine::output
