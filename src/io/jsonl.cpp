// ==============================================================================
// jsonl.cpp - Построчное чтение JSON Lines
// ==============================================================================

#include <lexrefine/jsonl.hpp>
#include <lexrefine/platform.hpp>

#include <rapidjson/error/en.h>

namespace lexrefine::io {

std::string ReaderError::format() const {
    std::string out = "jsonl error";
    if (!path.empty()) {
        out += " [" + path;
        if (line > 0) {
            out += ":" + std::to_string(line);
        }
        out += "]";
    }
    out += ": " + message;
    return out;
}

JsonlReader::JsonlReader(std::filesystem::path path) : path_(std::move(path)) {}

bool JsonlReader::open() {
    file_.open(path_, std::ios::binary);
    if (!file_.is_open()) {
        error_ = ReaderError{"could not open file", platform::path_to_utf8(path_), 0};
        return false;
    }
    opened_ = true;
    return true;
}

bool JsonlReader::next(rapidjson::Document& out) {
    if (!opened_ || error_) {
        return false;
    }

    std::string line;
    while (std::getline(file_, line)) {
        ++line_number_;

        // Пустые строки пропускаются
        auto start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            continue;
        }

        out.Parse(line.c_str(), line.size());
        if (out.HasParseError()) {
            error_ = ReaderError{std::string("parse error: ") +
                                     rapidjson::GetParseError_En(out.GetParseError()),
                                 platform::path_to_utf8(path_), line_number_};
            return false;
        }
        if (!out.IsObject()) {
            error_ = ReaderError{"line is not a JSON object", platform::path_to_utf8(path_),
                                 line_number_};
            return false;
        }
        return true;
    }
    return false;
}

std::string json_string(const rapidjson::Value& obj, const char* key,
                        const std::string& fallback) {
    if (!obj.IsObject()) {
        return fallback;
    }
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return fallback;
    }
    if (it->value.IsString()) {
        return std::string(it->value.GetString(), it->value.GetStringLength());
    }
    if (it->value.IsInt64()) {
        return std::to_string(it->value.GetInt64());
    }
    return fallback;
}

double json_number(const rapidjson::Value& obj, const char* key, double fallback) {
    if (!obj.IsObject()) {
        return fallback;
    }
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsNumber()) {
        return fallback;
    }
    return it->value.GetDouble();
}

}  // namespace lexrefine::io
