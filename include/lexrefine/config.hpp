// ==============================================================================
// lexrefine/config.hpp - Конфигурация (YAML)
// ==============================================================================
//
// Назначение:
// - Сводная структура настроек всех компонентов
// - Загрузка из YAML файла или строки; каждый ключ необязателен
//
// Неизвестные секции и ключи игнорируются. Значение вне допустимого
// диапазона - ошибка загрузки.
//
// ==============================================================================

#ifndef LEXREFINE_CONFIG_HPP
#define LEXREFINE_CONFIG_HPP

#include <lexrefine/orchestrator.hpp>
#include <lexrefine/oscillation.hpp>
#include <lexrefine/patch.hpp>
#include <lexrefine/rule.hpp>
#include <lexrefine/safety.hpp>
#include <lexrefine/store.hpp>

#include <filesystem>
#include <string>

namespace lexrefine::config {

struct PatchSettings {
    patch::SynthesisOptions synthesis;
    double similarity_threshold = store::RuleStore::DEFAULT_SIMILARITY_THRESHOLD;
};

struct Config {
    rule::ApplyOptions engine;
    PatchSettings patch;
    patch::OscillationOptions oscillation;
    safety::GateThresholds gates;
    orchestrator::Options orchestrator;  // включает dry run и rollback
};

struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    Config config;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из YAML файла
LoadResult load(const std::filesystem::path& path);

/// Разобрать конфигурацию из YAML строки
LoadResult load_from_string(const std::string& yaml, const std::string& origin = "<string>");

}  // namespace lexrefine::config

#endif  // LEXREFINE_CONFIG_HPP
