// ==============================================================================
// gate.cpp - PatchGate: авто-применение кандидатов
// ==============================================================================
//
// Для каждого кандидата:
// 1. confidence < auto_threshold              -> manual_review ("confidence")
// 2. OscillationGuard блокирует область       -> manual_review ("oscillation")
// 3. правило с pattern == pattern_before есть -> обновление на месте
//    иначе                                    -> новое правило (если не дубликат)
// 4. успех -> история патчей + track_change (только при реальном изменении)
// 5. невалидный regex / PersistenceError      -> failed
//
// RuleStore сначала сохраняет снимок и только потом публикует его, поэтому
// неудавшаяся запись не оставляет частичного состояния.
//
// ==============================================================================

#include <lexrefine/output.hpp>
#include <lexrefine/patch.hpp>
#include <lexrefine/store.hpp>

#include <algorithm>

namespace lexrefine::patch {

namespace {

constexpr const char* IMPROVED_SUFFIX = " (auto-improved)";

bool ends_with(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

std::string to_string(PatchKind k) {
    switch (k) {
    case PatchKind::Created:
        return "created";
    case PatchKind::Updated:
        return "updated";
    case PatchKind::Deduplicated:
        return "deduplicated";
    }
    return "unknown";
}

std::size_t ApplyReport::changed_count() const {
    std::size_t n = 0;
    for (const auto& a : auto_applied) {
        if (!a.deduplicated()) {
            ++n;
        }
    }
    return n;
}

PatchGate::PatchGate(store::RuleStore& store, OscillationGuard& guard, output::Writer* log,
                     Clock clock)
    : store_(store), guard_(guard), log_(log), clock_(std::move(clock)) {}

AppliedPatch PatchGate::apply_one(const PatchSuggestion& candidate) {
    const std::string& pattern = candidate.rule_pattern();
    if (auto problem = rule::validate_pattern(pattern)) {
        throw PatchSynthesisError("invalid pattern '" + pattern + "': " + *problem);
    }

    AppliedPatch applied;
    applied.suggestion = candidate;

    std::optional<rule::Rule> existing;
    if (!candidate.pattern_before.empty()) {
        existing = store_.find_by_pattern(candidate.rule_type, candidate.pattern_before);
    }

    if (existing) {
        rule::Rule updated = *existing;
        if (candidate.source == SourceKind::Direct) {
            updated.replacement = candidate.pattern_after;
        } else if (!candidate.pattern_after.empty()) {
            updated.pattern = candidate.pattern_after;
        }

        applied.rule_id = existing->rule_id;
        if (updated.pattern == existing->pattern && updated.replacement == existing->replacement) {
            applied.kind = PatchKind::Deduplicated;
            return applied;
        }
        if (auto other = store_.find_duplicate(updated)) {
            applied.rule_id = other->rule_id;
            applied.kind = PatchKind::Deduplicated;
            return applied;
        }

        if (!ends_with(updated.description, IMPROVED_SUFFIX)) {
            updated.description += IMPROVED_SUFFIX;
        }
        updated.performance_score = candidate.confidence_score;
        updated.updated_at = clock_();
        store_.upsert_one(updated);
        applied.kind = PatchKind::Updated;
        return applied;
    }

    rule::Rule created =
        rule::make_rule(candidate.rule_id(), candidate.rule_type, pattern,
                        candidate.rule_replacement(), candidate.rule_priority(),
                        "auto: " + candidate.description);
    created.performance_score = candidate.confidence_score;
    created.created_at = clock_();
    created.updated_at = created.created_at;

    if (auto duplicate = store_.find_duplicate(created)) {
        applied.rule_id = duplicate->rule_id;
        applied.kind = PatchKind::Deduplicated;
        return applied;
    }

    store_.upsert_one(created);
    applied.rule_id = created.rule_id;
    applied.kind = PatchKind::Created;
    return applied;
}

ApplyReport PatchGate::auto_apply(const std::vector<PatchSuggestion>& candidates,
                                  double auto_threshold) {
    ApplyReport report;

    for (const auto& candidate : candidates) {
        if (candidate.confidence_score < auto_threshold) {
            report.manual_review.push_back({candidate, "confidence"});
            continue;
        }

        const std::string area = candidate.area();
        if (guard_.check_oscillation(area)) {
            if (log_ != nullptr) {
                log_->warn("rule area '" + area + "' is frozen, deferring " +
                           candidate.suggestion_id);
            }
            report.manual_review.push_back({candidate, "oscillation"});
            continue;
        }

        try {
            AppliedPatch applied = apply_one(candidate);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                PatchRecord record;
                record.patch_id = candidate.suggestion_id;
                record.rule_id = applied.rule_id;
                record.description = candidate.description;
                record.confidence = candidate.confidence_score;
                record.rule_type = candidate.rule_type;
                record.kind = applied.kind;
                record.applied_at = clock_();
                history_.push_back(std::move(record));
            }

            if (!applied.deduplicated()) {
                guard_.track_change(area);
            }
            if (log_ != nullptr) {
                log_->info("patch " + candidate.suggestion_id + " " + to_string(applied.kind) +
                           " rule '" + applied.rule_id + "'");
            }
            report.auto_applied.push_back(std::move(applied));
        } catch (const PatchSynthesisError& e) {
            if (log_ != nullptr) {
                log_->warn("patch " + candidate.suggestion_id + " rejected: " + e.what());
            }
            report.failed.push_back({candidate, e.what()});
        } catch (const store::PersistenceError& e) {
            if (log_ != nullptr) {
                log_->error("patch " + candidate.suggestion_id + " not persisted: " + e.what());
            }
            report.failed.push_back({candidate, e.what()});
            report.persistence_failed = true;
        }
    }

    return report;
}

bool PatchGate::rollback(const std::string& patch_id) {
    std::string rule_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(history_.begin(), history_.end(),
                               [&](const PatchRecord& r) { return r.patch_id == patch_id; });
        if (it == history_.end() || it->kind == PatchKind::Deduplicated || it->rolled_back) {
            return false;
        }
        rule_id = it->rule_id;
    }

    if (!store_.disable(rule_id)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& r : history_) {
        if (r.patch_id == patch_id) {
            r.rolled_back = true;
        }
    }
    if (log_ != nullptr) {
        log_->info("patch " + patch_id + " rolled back, rule '" + rule_id + "' disabled");
    }
    return true;
}

std::vector<PatchRecord> PatchGate::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

}  // namespace lexrefine::patch
