// ==============================================================================
// lexrefine/engine.hpp - RuleEngine: применение набора правил к тексту
// ==============================================================================
//
// Назначение:
// - Отбор включённых правил (опционально по типу)
// - Сортировка: priority по убыванию, rule_id по возрастанию
// - Последовательное применение: выход правила - вход следующего
// - Статистика: длины, число сработавших правил, счётчики по типам,
//   список сработавших правил, reduction rate, ошибки правил
//
// Program - скомпилированный неизменяемый набор правил. Один Program
// закрепляется за batch и читается всеми потоками без блокировок.
//
// ==============================================================================

#ifndef LEXREFINE_ENGINE_HPP
#define LEXREFINE_ENGINE_HPP

#include <lexrefine/rule.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lexrefine::output {
class Writer;
}

namespace lexrefine::engine {

/// Сработавшее правило (изменило текст)
struct FiredRule {
    std::string rule_id;
    rule::RuleType type = rule::RuleType::NoiseRemoval;
    std::string description;
    std::size_t length_before = 0;
    std::size_t length_after = 0;
};

/// Статистика применения набора правил
struct Stats {
    std::size_t original_length = 0;
    std::size_t final_length = 0;
    std::size_t applied_rule_count = 0;
    std::map<rule::RuleType, std::size_t> per_type;
    std::vector<FiredRule> fired;
    std::vector<rule::RuleError> errors;
    double reduction_rate = 0.0;  // (original - final) / original, 0 для пустого текста

    /// rule_id -> сколько раз изменило текст (для usage_count)
    std::map<std::string, std::uint64_t> usage() const;

    bool operator==(const Stats& other) const;
};

/// Результат применения
struct Result {
    std::string text;
    Stats stats;
};

/// Скомпилированный, отсортированный набор правил
class Program {
public:
    const std::vector<rule::CompiledRule>& rules() const { return rules_; }

    std::size_t size() const { return rules_.size(); }

    const std::string& version() const { return version_; }

private:
    friend class RuleEngine;

    std::vector<rule::CompiledRule> rules_;
    std::string version_;
};

class RuleEngine {
public:
    explicit RuleEngine(rule::ApplyOptions options = {}, output::Writer* log = nullptr);

    /// Скомпилировать набор правил: только enabled, опционально один тип,
    /// сортировка priority desc / rule_id asc
    std::shared_ptr<const Program> prepare(const std::vector<rule::Rule>& rules,
                                           std::optional<rule::RuleType> type_filter = {},
                                           const std::string& version = {}) const;

    /// Применить скомпилированный набор
    Result apply(const std::string& text, const Program& program) const;

    /// prepare + apply
    Result apply_rules(const std::string& text, const std::vector<rule::Rule>& rules,
                       std::optional<rule::RuleType> type_filter = {}) const;

    const rule::ApplyOptions& options() const { return options_; }

private:
    rule::ApplyOptions options_;
    output::Writer* log_;
};

/// Порядок применения: priority по убыванию, затем rule_id
bool application_order(const rule::Rule& a, const rule::Rule& b);

}  // namespace lexrefine::engine

#endif  // LEXREFINE_ENGINE_HPP
