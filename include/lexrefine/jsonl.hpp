// ==============================================================================
// lexrefine/jsonl.hpp - Построчное чтение JSON Lines
// ==============================================================================
//
// Назначение:
// - Корпус документов, записанные ответы оценщика, regression cases
// - Каждая непустая строка - отдельный JSON объект (RapidJSON)
// - Пустые строки пропускаются, ошибка разбора строки останавливает чтение
//
// ==============================================================================

#ifndef LEXREFINE_JSONL_HPP
#define LEXREFINE_JSONL_HPP

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <rapidjson/document.h>

namespace lexrefine::io {

struct ReaderError {
    std::string message;
    std::string path;
    std::size_t line = 0;

    std::string format() const;
};

class JsonlReader {
public:
    explicit JsonlReader(std::filesystem::path path);

    /// Открыть файл. false + last_error() если файл недоступен.
    bool open();

    /// Следующий объект. false при конце файла или ошибке (см. last_error()).
    bool next(rapidjson::Document& out);

    std::size_t line_number() const { return line_number_; }

    const std::optional<ReaderError>& last_error() const { return error_; }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::ifstream file_;
    std::optional<ReaderError> error_;
    std::size_t line_number_ = 0;
    bool opened_ = false;
};

/// Строковое поле объекта или fallback
std::string json_string(const rapidjson::Value& obj, const char* key,
                        const std::string& fallback = {});

/// Числовое поле объекта или fallback
double json_number(const rapidjson::Value& obj, const char* key, double fallback = 0.0);

}  // namespace lexrefine::io

#endif  // LEXREFINE_JSONL_HPP
