// ==============================================================================
// lexrefine/patch.hpp - Синтез и применение патчей правил
// ==============================================================================
//
// Назначение:
// - PatchSuggestion: кандидат в правило из предложения оценщика
// - PatchSynthesizer: порог уверенности, нормализация типа,
//   дедупликация против RuleStore и внутри входного списка
// - PatchGate: авто-применение по порогу под контролем OscillationGuard,
//   история патчей, rollback (выключение правила)
//
// Инвариант PatchGate::auto_apply:
//   auto_applied + manual_review + failed == число кандидатов
//
// ==============================================================================

#ifndef LEXREFINE_PATCH_HPP
#define LEXREFINE_PATCH_HPP

#include <lexrefine/evaluator.hpp>
#include <lexrefine/oscillation.hpp>
#include <lexrefine/rule.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lexrefine::output {
class Writer;
}

namespace lexrefine::store {
class RuleStore;
}

namespace lexrefine::patch {

// ============================================================================
// PatchSuggestion
// ============================================================================

/// Как трактуются паттерны предложения
enum class SourceKind {
    Direct,             // тип правила: pattern_before - regex, pattern_after - замена
    RegexImprovement,   // pattern_after - улучшенный regex
    NewPattern,         // pattern_after - новый regex
    FilterEnhancement,  // pattern_after - regex фильтра предложений
};

std::string to_string(SourceKind k);

struct PatchSuggestion {
    std::string suggestion_id;
    std::string description;
    rule::RuleType rule_type = rule::RuleType::NoiseRemoval;
    SourceKind source = SourceKind::Direct;
    std::string source_type;  // исходное имя типа от оценщика
    double confidence_score = 0.0;
    std::string pattern_before;
    std::string pattern_after;
    double estimated_improvement = 0.0;
    std::vector<std::string> applicable_cases;
    TimePoint created_at{};

    /// Паттерн правила, которое будет создано
    const std::string& rule_pattern() const;

    /// Замена правила, которое будет создано
    std::string rule_replacement() const;

    /// Приоритет нового правила по источнику
    int rule_priority() const;

    /// Детерминированный rule_id: "auto_<type>_<suggestion_id>"
    std::string rule_id() const;

    /// Область для OscillationGuard
    std::string area() const { return rule::to_string(rule_type); }
};

/// Некорректное предложение (пропускается, не фатально)
class PatchSynthesisError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Тип оценщика -> (RuleType, SourceKind). Бросает PatchSynthesisError.
std::pair<rule::RuleType, SourceKind> resolve_rule_type(std::string_view name);

// ============================================================================
// PatchSynthesizer
// ============================================================================

struct SynthesisOptions {
    double threshold = 0.7;  // минимальная уверенность
};

struct SynthesisReport {
    std::vector<PatchSuggestion> candidates;  // порядок входа сохранён
    std::size_t below_threshold = 0;
    std::size_t duplicates = 0;
    std::size_t malformed = 0;
};

class PatchSynthesizer {
public:
    PatchSynthesizer(const store::RuleStore& store, SynthesisOptions options = {},
                     output::Writer* log = nullptr, Clock clock = system_clock());

    SynthesisReport synthesize(const std::vector<evaluator::RawSuggestion>& raw);

    /// Проверка и нормализация одного предложения (без порога и дедупликации).
    /// Бросает PatchSynthesisError.
    PatchSuggestion wrap(const evaluator::RawSuggestion& raw);

    const SynthesisOptions& options() const { return options_; }

private:
    std::string next_suggestion_id();

    const store::RuleStore& store_;
    SynthesisOptions options_;
    output::Writer* log_;
    Clock clock_;

    std::mutex mutex_;
    std::uint64_t counter_ = 0;
};

// ============================================================================
// PatchGate
// ============================================================================

enum class PatchKind { Created, Updated, Deduplicated };

std::string to_string(PatchKind k);

/// Запись истории патчей
struct PatchRecord {
    std::string patch_id;
    std::string rule_id;
    std::string description;
    double confidence = 0.0;
    rule::RuleType rule_type = rule::RuleType::NoiseRemoval;
    PatchKind kind = PatchKind::Created;
    TimePoint applied_at{};
    bool rolled_back = false;
};

struct AppliedPatch {
    PatchSuggestion suggestion;
    std::string rule_id;
    PatchKind kind = PatchKind::Created;
    bool deduplicated() const { return kind == PatchKind::Deduplicated; }
};

struct DeferredPatch {
    PatchSuggestion suggestion;
    std::string reason;  // "confidence" | "oscillation"
};

struct FailedPatch {
    PatchSuggestion suggestion;
    std::string error;
};

struct ApplyReport {
    std::vector<AppliedPatch> auto_applied;
    std::vector<DeferredPatch> manual_review;
    std::vector<FailedPatch> failed;
    bool persistence_failed = false;  // хотя бы один FailedPatch из-за PersistenceError

    std::size_t total() const { return auto_applied.size() + manual_review.size() + failed.size(); }

    /// Сколько патчей реально изменили набор правил
    std::size_t changed_count() const;
};

class PatchGate {
public:
    PatchGate(store::RuleStore& store, OscillationGuard& guard, output::Writer* log = nullptr,
              Clock clock = system_clock());

    ApplyReport auto_apply(const std::vector<PatchSuggestion>& candidates, double auto_threshold);

    /// Выключить правило, созданное/изменённое патчем. false если патч
    /// неизвестен, был дедуплицирован или уже откатан.
    bool rollback(const std::string& patch_id);

    std::vector<PatchRecord> history() const;

private:
    /// Применить один кандидат. Бросает PersistenceError.
    AppliedPatch apply_one(const PatchSuggestion& candidate);

    store::RuleStore& store_;
    OscillationGuard& guard_;
    output::Writer* log_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::vector<PatchRecord> history_;
};

}  // namespace lexrefine::patch

#endif  // LEXREFINE_PATCH_HPP
