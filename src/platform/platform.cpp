// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#include "lexrefine/platform.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#include <psapi.h>
#else
#include <unistd.h>
#endif

namespace lexrefine::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    int len =
        MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), nullptr, 0);
    if (len <= 0) {
        return std::filesystem::path(u8str);
    }
    std::wstring wstr(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8str.data(), static_cast<int>(u8str.size()), wstr.data(), len);
    return std::filesystem::path(wstr);
#else
    // Unix: пути уже в UTF-8
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    const std::wstring& wstr = p.native();
    if (wstr.empty()) {
        return {};
    }
    int len = WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), nullptr,
                                  0, nullptr, nullptr);
    if (len <= 0) {
        return p.string();
    }
    std::string result(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, wstr.data(), static_cast<int>(wstr.size()), result.data(), len,
                        nullptr, nullptr);
    return result;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Память процесса
// ----------------------------------------------------------------------------

std::size_t resident_memory_bytes() {
#ifdef _WIN32
    PROCESS_MEMORY_COUNTERS counters;
    if (GetProcessMemoryInfo(GetCurrentProcess(), &counters, sizeof(counters))) {
        return static_cast<std::size_t>(counters.WorkingSetSize);
    }
    return 0;
#elif defined(__linux__)
    // /proc/self/statm: size resident shared ... (в страницах)
    std::ifstream statm("/proc/self/statm");
    std::size_t size_pages = 0;
    std::size_t resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) {
        return 0;
    }
    long page = sysconf(_SC_PAGESIZE);
    if (page <= 0) {
        return 0;
    }
    return resident_pages * static_cast<std::size_t>(page);
#else
    return 0;
#endif
}

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("failed to open file: " + path_to_utf8(path));
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        throw std::runtime_error("failed to read file: " + path_to_utf8(path));
    }
    return oss.str();
}

void write_file_atomic(const std::filesystem::path& path, std::string_view data) {
    std::filesystem::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("failed to open file for writing: " + path_to_utf8(tmp));
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) {
            throw std::runtime_error("failed to write file: " + path_to_utf8(tmp));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("failed to replace file: " + path_to_utf8(path));
    }
}

// ----------------------------------------------------------------------------
// Время (UTC)
// ----------------------------------------------------------------------------

std::string format_utc(std::chrono::system_clock::time_point tp, const char* fmt) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif
    char buffer[64];
    size_t n = std::strftime(buffer, sizeof(buffer), fmt, &tm_utc);
    return std::string(buffer, n);
}

std::string format_iso8601(std::chrono::system_clock::time_point tp) {
    return format_utc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

std::chrono::system_clock::time_point parse_iso8601(std::string_view text) {
    std::tm tm_utc{};
    std::istringstream iss{std::string(text)};
    iss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        throw std::invalid_argument("invalid timestamp: " + std::string(text));
    }
#ifdef _WIN32
    std::time_t t = _mkgmtime(&tm_utc);
#else
    std::time_t t = timegm(&tm_utc);
#endif
    return std::chrono::system_clock::from_time_t(t);
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

}  // namespace lexrefine::platform
