// ==============================================================================
// synthesizer.cpp - PatchSynthesizer
// ==============================================================================
//
// Предложения оценщика -> кандидаты PatchSuggestion:
// 1. confidence_score < threshold -> пропуск
// 2. нормализация типа и проверка полей (PatchSynthesisError -> пропуск)
// 3. дедупликация против включённых правил того же типа и внутри входа;
//    предложение с pattern_before существующего правила проходит дальше
//
// Повторяющиеся от документа к документу предложения ожидаемы и не должны
// увеличивать число правил.
//
// ==============================================================================

#include <lexrefine/output.hpp>
#include <lexrefine/patch.hpp>
#include <lexrefine/platform.hpp>
#include <lexrefine/store.hpp>

#include <cmath>

namespace lexrefine::patch {

// ============================================================================
// SourceKind / type resolution
// ============================================================================

std::string to_string(SourceKind k) {
    switch (k) {
    case SourceKind::Direct:
        return "direct";
    case SourceKind::RegexImprovement:
        return "regex_improvement";
    case SourceKind::NewPattern:
        return "new_pattern";
    case SourceKind::FilterEnhancement:
        return "filter_enhancement";
    }
    return "unknown";
}

std::pair<rule::RuleType, SourceKind> resolve_rule_type(std::string_view name) {
    if (name == "regex_improvement") {
        return {rule::RuleType::NoiseRemoval, SourceKind::RegexImprovement};
    }
    if (name == "new_pattern") {
        return {rule::RuleType::NoiseRemoval, SourceKind::NewPattern};
    }
    if (name == "filter_enhancement") {
        return {rule::RuleType::LegalFiltering, SourceKind::FilterEnhancement};
    }
    try {
        return {rule::parse_rule_type(name), SourceKind::Direct};
    } catch (const std::invalid_argument& e) {
        throw PatchSynthesisError(e.what());
    }
}

// ============================================================================
// PatchSuggestion
// ============================================================================

const std::string& PatchSuggestion::rule_pattern() const {
    if (source == SourceKind::Direct) {
        return pattern_before.empty() ? pattern_after : pattern_before;
    }
    return pattern_after.empty() ? pattern_before : pattern_after;
}

std::string PatchSuggestion::rule_replacement() const {
    if (source == SourceKind::Direct && !pattern_before.empty()) {
        return pattern_after;
    }
    return {};
}

int PatchSuggestion::rule_priority() const {
    switch (source) {
    case SourceKind::Direct:
        return 80;
    case SourceKind::FilterEnhancement:
        return 70;
    case SourceKind::RegexImprovement:
        return 60;
    case SourceKind::NewPattern:
        return 50;
    }
    return 40;
}

std::string PatchSuggestion::rule_id() const {
    return "auto_" + rule::to_string(rule_type) + "_" + suggestion_id;
}

// ============================================================================
// PatchSynthesizer
// ============================================================================

PatchSynthesizer::PatchSynthesizer(const store::RuleStore& store, SynthesisOptions options,
                                   output::Writer* log, Clock clock)
    : store_(store), options_(options), log_(log), clock_(std::move(clock)) {}

std::string PatchSynthesizer::next_suggestion_id() {
    std::uint64_t n = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        n = counter_++;
    }
    return "patch_" + platform::format_utc(clock_(), "%Y%m%d_%H%M%S") + "_" + std::to_string(n);
}

PatchSuggestion PatchSynthesizer::wrap(const evaluator::RawSuggestion& raw) {
    if (!std::isfinite(raw.confidence_score) || raw.confidence_score < 0.0 ||
        raw.confidence_score > 1.0) {
        throw PatchSynthesisError("confidence_score out of range [0, 1]");
    }
    if (raw.pattern_before.empty() && raw.pattern_after.empty()) {
        throw PatchSynthesisError("suggestion has no pattern");
    }
    if (raw.rule_type.empty()) {
        throw PatchSynthesisError("suggestion has no rule_type");
    }

    auto [type, source] = resolve_rule_type(raw.rule_type);

    PatchSuggestion s;
    s.suggestion_id = next_suggestion_id();
    s.description = raw.description;
    s.rule_type = type;
    s.source = source;
    s.source_type = raw.rule_type;
    s.confidence_score = raw.confidence_score;
    s.pattern_before = raw.pattern_before;
    s.pattern_after = raw.pattern_after;
    s.estimated_improvement = raw.estimated_improvement;
    s.applicable_cases = raw.applicable_cases;
    s.created_at = clock_();
    return s;
}

SynthesisReport PatchSynthesizer::synthesize(const std::vector<evaluator::RawSuggestion>& raw) {
    SynthesisReport report;

    for (const auto& r : raw) {
        if (r.confidence_score < options_.threshold) {
            report.below_threshold++;
            if (log_ != nullptr) {
                log_->trace("suggestion below threshold (" + std::to_string(r.confidence_score) +
                            "): " + r.description);
            }
            continue;
        }

        PatchSuggestion candidate;
        try {
            candidate = wrap(r);
        } catch (const PatchSynthesisError& e) {
            report.malformed++;
            if (log_ != nullptr) {
                log_->warn(std::string("skipping malformed suggestion: ") + e.what());
            }
            continue;
        }

        rule::Rule draft;
        draft.rule_id = candidate.rule_id();
        draft.type = candidate.rule_type;
        draft.pattern = candidate.rule_pattern();

        // Предложение для существующего правила обновляет его на месте
        // (PatchGate), поэтому с ним самим не сравнивается
        bool targets_existing =
            !candidate.pattern_before.empty() &&
            store_.find_by_pattern(candidate.rule_type, candidate.pattern_before).has_value();
        if (!targets_existing) {
            if (auto existing = store_.find_duplicate(draft)) {
                report.duplicates++;
                if (log_ != nullptr) {
                    log_->debug("suggestion duplicates rule '" + existing->rule_id + "'");
                }
                continue;
            }
        }

        bool duplicate_in_batch = false;
        for (const auto& accepted : report.candidates) {
            if (accepted.rule_type != candidate.rule_type) {
                continue;
            }
            if (accepted.rule_pattern() == draft.pattern ||
                store::pattern_similarity(accepted.rule_pattern(), draft.pattern) >=
                    store_.similarity_threshold()) {
                duplicate_in_batch = true;
                break;
            }
        }
        if (duplicate_in_batch) {
            report.duplicates++;
            continue;
        }

        report.candidates.push_back(std::move(candidate));
    }

    if (log_ != nullptr) {
        log_->debug("synthesized " + std::to_string(report.candidates.size()) + " of " +
                    std::to_string(raw.size()) + " suggestions (" +
                    std::to_string(report.below_threshold) + " below threshold, " +
                    std::to_string(report.duplicates) + " duplicates, " +
                    std::to_string(report.malformed) + " malformed)");
    }
    return report;
}

}  // namespace lexrefine::patch
