// ==============================================================================
// engine.cpp - RuleEngine
// ==============================================================================
//
// Движок детерминирован: для фиксированных (text, rules) результат и
// статистика совпадают побайтно при каждом вызове.
//
// ==============================================================================

#include <lexrefine/engine.hpp>
#include <lexrefine/output.hpp>

#include <algorithm>

namespace lexrefine::engine {

namespace {

bool same_fired(const FiredRule& a, const FiredRule& b) {
    return a.rule_id == b.rule_id && a.type == b.type && a.description == b.description &&
           a.length_before == b.length_before && a.length_after == b.length_after;
}

}  // namespace

std::map<std::string, std::uint64_t> Stats::usage() const {
    std::map<std::string, std::uint64_t> counts;
    for (const auto& f : fired) {
        ++counts[f.rule_id];
    }
    return counts;
}

bool Stats::operator==(const Stats& other) const {
    if (original_length != other.original_length || final_length != other.final_length ||
        applied_rule_count != other.applied_rule_count || per_type != other.per_type ||
        reduction_rate != other.reduction_rate || fired.size() != other.fired.size() ||
        errors.size() != other.errors.size()) {
        return false;
    }
    for (size_t i = 0; i < fired.size(); ++i) {
        if (!same_fired(fired[i], other.fired[i])) {
            return false;
        }
    }
    for (size_t i = 0; i < errors.size(); ++i) {
        if (errors[i].rule_id != other.errors[i].rule_id ||
            errors[i].message != other.errors[i].message) {
            return false;
        }
    }
    return true;
}

bool application_order(const rule::Rule& a, const rule::Rule& b) {
    if (a.priority != b.priority) {
        return a.priority > b.priority;
    }
    return a.rule_id < b.rule_id;
}

RuleEngine::RuleEngine(rule::ApplyOptions options, output::Writer* log)
    : options_(options), log_(log) {}

std::shared_ptr<const Program> RuleEngine::prepare(const std::vector<rule::Rule>& rules,
                                                   std::optional<rule::RuleType> type_filter,
                                                   const std::string& version) const {
    std::vector<const rule::Rule*> selected;
    selected.reserve(rules.size());
    for (const auto& r : rules) {
        if (!r.enabled) {
            continue;
        }
        if (type_filter && r.type != *type_filter) {
            continue;
        }
        selected.push_back(&r);
    }

    std::sort(selected.begin(), selected.end(),
              [](const rule::Rule* a, const rule::Rule* b) { return application_order(*a, *b); });

    auto program = std::make_shared<Program>();
    program->version_ = version;
    program->rules_.reserve(selected.size());
    for (const rule::Rule* r : selected) {
        program->rules_.push_back(rule::CompiledRule::compile(*r));
        if (log_ != nullptr && !program->rules_.back().valid()) {
            log_->warn("rule '" + r->rule_id +
                       "' has an invalid pattern: " + program->rules_.back().compile_error());
        }
    }
    return program;
}

Result RuleEngine::apply(const std::string& text, const Program& program) const {
    Result result;
    result.text = text;
    result.stats.original_length = text.size();

    for (const auto& compiled : program.rules()) {
        const std::size_t before = result.text.size();
        rule::ApplyOutcome outcome = compiled.apply(result.text, options_);

        if (outcome.error) {
            if (log_ != nullptr) {
                log_->debug(outcome.error->format());
            }
            result.stats.errors.push_back(std::move(*outcome.error));
            continue;
        }
        if (!outcome.applied) {
            continue;
        }

        const rule::Rule& r = compiled.rule();
        result.text = std::move(outcome.text);
        result.stats.applied_rule_count++;
        result.stats.per_type[r.type]++;
        result.stats.fired.push_back(
            FiredRule{r.rule_id, r.type, r.description, before, result.text.size()});
    }

    result.stats.final_length = result.text.size();
    if (result.stats.original_length > 0) {
        result.stats.reduction_rate =
            (static_cast<double>(result.stats.original_length) -
             static_cast<double>(result.stats.final_length)) /
            static_cast<double>(result.stats.original_length);
    }
    return result;
}

Result RuleEngine::apply_rules(const std::string& text, const std::vector<rule::Rule>& rules,
                               std::optional<rule::RuleType> type_filter) const {
    auto program = prepare(rules, type_filter);
    return apply(text, *program);
}

}  // namespace lexrefine::engine
