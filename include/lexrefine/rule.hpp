// ==============================================================================
// lexrefine/rule.hpp - Правило преобразования текста
// ==============================================================================
//
// Назначение:
// - Тип правила (закрытый enum) и стратегия применения на каждый тип
// - Структура Rule (идентичность, паттерн, приоритет, статистика)
// - Компиляция паттерна (std::regex, ECMAScript + icase)
// - Загрузка начального набора правил из YAML и lint
//
// Ошибка одного правила (невалидный паттерн, сбой regex) не прерывает
// обработку: результат applied=false + RuleError.
//
// ==============================================================================

#ifndef LEXREFINE_RULE_HPP
#define LEXREFINE_RULE_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace lexrefine::rule {

using Timestamp = std::chrono::system_clock::time_point;

// ============================================================================
// RuleType
// ============================================================================

enum class RuleType {
    NoiseRemoval,       // подстановка: удаление шума
    LegalFiltering,     // удаление предложений, совпавших с паттерном
    FactExtraction,     // оставить только совпадения (отключаемая категория)
    RedundancyRemoval,  // подстановка: удаление повторов
    PostNormalize       // подстановка: финальная нормализация
};

std::string to_string(RuleType t);

/// "noise_removal" -> RuleType::NoiseRemoval. Бросает std::invalid_argument.
RuleType parse_rule_type(std::string_view s);

/// Все типы в порядке объявления
const std::vector<RuleType>& all_rule_types();

// ============================================================================
// Rule
// ============================================================================

struct Rule {
    std::string rule_id;
    RuleType type = RuleType::NoiseRemoval;
    std::string pattern;
    std::string replacement;  // подставляется буквально, без $1 / $& ссылок
    int priority = 0;  // больше - раньше
    bool enabled = true;
    std::string description;
    double performance_score = 0.0;  // уверенность evaluator при создании (0..1)
    std::uint64_t usage_count = 0;   // сколько раз правило изменило текст
    Timestamp created_at{};
    Timestamp updated_at{};

    /// Применить правило без предварительной компиляции.
    /// Для пакетной обработки используется CompiledRule.
    std::pair<std::string, bool> apply(const std::string& text) const;
};

/// Создать правило с текущими timestamps
Rule make_rule(std::string rule_id, RuleType type, std::string pattern, std::string replacement,
               int priority, std::string description = {});

// ============================================================================
// Применение
// ============================================================================

/// Ошибка применения одного правила
struct RuleError {
    std::string rule_id;
    std::string message;

    std::string format() const;
};

/// Результат применения одного правила
struct ApplyOutcome {
    std::string text;
    bool applied = false;
    std::optional<RuleError> error;
};

/// Опции применения
struct ApplyOptions {
    // fact_extraction по умолчанию не активна; отключённое правило
    // пропускается с applied=false
    bool fact_extraction_enabled = false;
};

/// Правило со скомпилированным паттерном.
/// Неизменяемо после compile(), безопасно для чтения из нескольких потоков.
class CompiledRule {
public:
    /// Компиляция никогда не бросает: ошибка сохраняется и
    /// возвращается из apply() как RuleError.
    static CompiledRule compile(const Rule& rule);

    ApplyOutcome apply(const std::string& text, const ApplyOptions& options) const;

    const Rule& rule() const { return rule_; }

    bool valid() const { return regex_ != nullptr; }

    const std::string& compile_error() const { return compile_error_; }

private:
    Rule rule_;
    std::shared_ptr<const std::regex> regex_;
    std::string compile_error_;
};

/// Флаги компиляции паттернов правил
std::regex::flag_type pattern_flags();

/// Проверить паттерн. std::nullopt если валиден, иначе сообщение.
std::optional<std::string> validate_pattern(const std::string& pattern);

/// Разбить текст на предложения по [.!?]\s+ (разделители отбрасываются)
std::vector<std::string> split_sentences(const std::string& text);

// ============================================================================
// Загрузка правил из YAML
// ============================================================================

/// Ошибка загрузки/парсинга правил
struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

/// Результат загрузки правил
struct LoadResult {
    bool ok = false;
    std::vector<Rule> rules;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Проблема, найденная lint
struct LintIssue {
    std::string rule_id;
    std::string message;
};

/// Результат lint
struct LintResult {
    bool ok = false;
    std::size_t rule_count = 0;
    std::vector<LintIssue> issues;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Проверка расширения .yml/.yaml
bool is_yaml_extension(const std::filesystem::path& path);

/// Загрузить правила из YAML файла или директории с YAML файлами.
/// Формат: последовательность "rules:" или одиночный mapping.
LoadResult load(const std::filesystem::path& path);

/// Разобрать правила из YAML строки
LoadResult load_from_string(const std::string& yaml, const std::string& origin = "<string>");

/// Загрузить и проверить паттерны и уникальность rule_id
LintResult lint(const std::filesystem::path& path);

}  // namespace lexrefine::rule

#endif  // LEXREFINE_RULE_HPP
