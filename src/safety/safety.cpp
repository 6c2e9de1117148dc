// ==============================================================================
// safety.cpp - Цепочка защитных гейтов и монитор отката
// ==============================================================================

#include <lexrefine/jsonl.hpp>
#include <lexrefine/platform.hpp>
#include <lexrefine/safety.hpp>

#include <algorithm>
#include <cstdio>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

namespace lexrefine::safety {

std::string to_string(GateType g) {
    switch (g) {
    case GateType::Unit:
        return "unit";
    case GateType::Regression:
        return "regression";
    case GateType::Holdout:
        return "holdout";
    case GateType::Performance:
        return "performance";
    }
    return "unknown";
}

namespace {

std::string format_score(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", v);
    return buf;
}

Value string_array(const std::vector<std::string>& items) {
    Value arr = Value::make_array();
    for (const auto& item : items) {
        arr.push_back(Value(item));
    }
    return arr;
}

Value metrics_object(const evaluator::QualityMetrics& m) {
    Value obj = Value::make_object();
    for (const auto& [key, value] : m.to_map()) {
        obj.set(key, Value(value));
    }
    return obj;
}

std::vector<std::string> split_words(std::string_view text) {
    std::vector<std::string> words;
    std::istringstream in{std::string(text)};
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

}  // namespace

const GateResult* GateReport::find(GateType g) const {
    for (const auto& r : results) {
        if (r.gate_type == g) {
            return &r;
        }
    }
    return nullptr;
}

output::Table GateReport::to_table() const {
    output::Table table;
    table.set_headers({"Gate", "Result", "Score", "Notes"});
    for (const auto& r : results) {
        std::string notes;
        if (r.error) {
            notes = *r.error;
        } else if (const Value* msg = r.details.get("message")) {
            if (const auto* s = msg->get_string()) {
                notes = *s;
            }
        }
        table.add_row({to_string(r.gate_type), r.passed ? "PASS" : "FAIL",
                       format_score(r.score), output::format_field(notes, 60)});
    }
    return table;
}

// ----------------------------------------------------------------------------
// Fixtures
// ----------------------------------------------------------------------------

std::vector<UnitFixture> default_unit_fixtures() {
    return {
        {"unit_001", "페이지번호 제거", "내용... 페이지 1 ...더 많은 내용", "내용... ...더 많은 내용"},
        {"unit_002", "구분선 제거", "내용...\n---\n더 많은 내용", "내용...\n더 많은 내용"},
        {"unit_003", "공백 정규화", "내용...    많은    공백", "내용... 많은 공백"},
    };
}

RegressionLoadResult load_regression_cases(const std::filesystem::path& path) {
    RegressionLoadResult result;
    io::JsonlReader reader(path);
    if (!reader.open()) {
        result.error = reader.last_error()->format();
        return result;
    }

    auto string_list = [](const rapidjson::Value& obj, const char* key) {
        std::vector<std::string> out;
        auto it = obj.FindMember(key);
        if (it != obj.MemberEnd() && it->value.IsArray()) {
            for (const auto& item : it->value.GetArray()) {
                if (item.IsString()) {
                    out.emplace_back(item.GetString(), item.GetStringLength());
                }
            }
        }
        return out;
    };

    rapidjson::Document doc;
    while (reader.next(doc)) {
        RegressionCase c;
        c.case_id = io::json_string(doc, "case_id",
                                    "regression_" + std::to_string(reader.line_number()));
        c.description = io::json_string(doc, "description");
        c.input = io::json_string(doc, "input");
        c.forbidden = string_list(doc, "forbidden");
        c.required = string_list(doc, "required");
        result.cases.push_back(std::move(c));
    }
    if (reader.last_error()) {
        result.error = reader.last_error()->format();
        result.cases.clear();
        return result;
    }
    result.ok = true;
    return result;
}

bool GateThresholds::quality_ok(const evaluator::QualityMetrics& m) const {
    return m.nrr >= min_nrr && m.fpr >= min_fpr && m.ss >= min_ss &&
           m.token_reduction >= min_token_reduction;
}

// ----------------------------------------------------------------------------
// Output comparison
// ----------------------------------------------------------------------------

std::string normalize_whitespace(std::string_view text) {
    std::string out;
    for (const auto& word : split_words(text)) {
        if (!out.empty()) {
            out += ' ';
        }
        out += word;
    }
    return out;
}

double word_jaccard(std::string_view a, std::string_view b) {
    auto wa = split_words(a);
    auto wb = split_words(b);
    if (wa.empty() && wb.empty()) {
        return 1.0;
    }
    if (wa.empty() || wb.empty()) {
        return 0.0;
    }
    std::set<std::string> sa(wa.begin(), wa.end());
    std::set<std::string> sb(wb.begin(), wb.end());
    std::size_t common = 0;
    for (const auto& w : sa) {
        common += sb.count(w);
    }
    std::size_t total = sa.size() + sb.size() - common;
    return total == 0 ? 0.0 : static_cast<double>(common) / static_cast<double>(total);
}

bool outputs_match(std::string_view expected, std::string_view actual) {
    std::string e = normalize_whitespace(expected);
    std::string a = normalize_whitespace(actual);
    if (expected == actual || e == a) {
        return true;
    }
    return word_jaccard(e, a) >= 0.95;
}

// ----------------------------------------------------------------------------
// SafetyGateRunner
// ----------------------------------------------------------------------------

SafetyGateRunner::SafetyGateRunner(const engine::RuleEngine& engine,
                                   std::shared_ptr<evaluator::Evaluator> evaluator,
                                   GateThresholds thresholds, output::Writer* log)
    : engine_(engine),
      evaluator_(std::move(evaluator)),
      thresholds_(thresholds),
      log_(log),
      unit_fixtures_(default_unit_fixtures()) {}

void SafetyGateRunner::set_unit_fixtures(std::vector<UnitFixture> fixtures) {
    unit_fixtures_ = std::move(fixtures);
}

void SafetyGateRunner::set_regression_cases(std::vector<RegressionCase> cases) {
    regression_cases_ = std::move(cases);
}

void SafetyGateRunner::set_holdout_cases(std::vector<corpus::DocumentCase> cases) {
    holdout_cases_ = std::move(cases);
}

GateResult SafetyGateRunner::guarded(
    GateType type, const std::function<GateResult(const engine::Program&)>& gate,
    const engine::Program& program) const {
    try {
        return gate(program);
    } catch (const std::exception& e) {
        GateResult failed;
        failed.gate_type = type;
        failed.passed = false;
        failed.score = 0.0;
        failed.error = e.what();
        failed.details.set("error", Value(std::string(e.what())));
        return failed;
    }
}

GateReport SafetyGateRunner::run_all(const store::RuleSet& candidate) const {
    GateReport report;
    report.version = candidate.version;

    auto program = engine_.prepare(candidate.rules, std::nullopt, candidate.version);

    using Gate = GateResult (SafetyGateRunner::*)(const engine::Program&) const;
    const std::pair<GateType, Gate> chain[] = {
        {GateType::Unit, &SafetyGateRunner::run_unit},
        {GateType::Regression, &SafetyGateRunner::run_regression},
        {GateType::Holdout, &SafetyGateRunner::run_holdout},
        {GateType::Performance, &SafetyGateRunner::run_performance},
    };

    report.all_passed = true;
    for (const auto& [type, gate] : chain) {
        GateResult result = guarded(
            type, [this, gate = gate](const engine::Program& p) { return (this->*gate)(p); },
            *program);
        bool passed = result.passed;
        if (log_) {
            log_->debug("gate " + to_string(type) + " for " + candidate.version + ": " +
                        (passed ? "passed" : "failed") + " (score " +
                        format_score(result.score) + ")");
        }
        report.results.push_back(std::move(result));
        if (!passed) {
            report.all_passed = false;
            if (log_) {
                log_->warn("gate " + to_string(type) + " failed for " + candidate.version +
                           ", remaining gates skipped");
            }
            break;
        }
    }
    return report;
}

GateResult SafetyGateRunner::run_unit(const engine::Program& program) const {
    GateResult result;
    result.gate_type = GateType::Unit;

    std::size_t passed_count = 0;
    Value cases = Value::make_array();
    for (const auto& fixture : unit_fixtures_) {
        auto applied = engine_.apply(fixture.input, program);
        bool ok = outputs_match(fixture.expected_output, applied.text);
        if (ok) {
            ++passed_count;
        }
        Value entry = Value::make_object();
        entry.set("case_id", Value(fixture.case_id));
        entry.set("description", Value(fixture.description));
        entry.set("passed", Value(ok));
        if (!ok) {
            entry.set("expected", Value(fixture.expected_output));
            entry.set("actual", Value(applied.text));
        }
        cases.push_back(std::move(entry));
    }

    std::size_t total = unit_fixtures_.size();
    double ratio = total == 0 ? 0.0 : static_cast<double>(passed_count) / static_cast<double>(total);
    result.score = ratio;
    result.passed = total > 0 && ratio >= thresholds_.unit_pass_ratio;
    result.details.set("passed_tests", Value(static_cast<std::uint64_t>(passed_count)));
    result.details.set("total_tests", Value(static_cast<std::uint64_t>(total)));
    result.details.set("cases", std::move(cases));
    if (total == 0) {
        result.details.set("message", Value("no unit fixtures"));
    }
    return result;
}

GateResult SafetyGateRunner::run_regression(const engine::Program& program) const {
    GateResult result;
    result.gate_type = GateType::Regression;

    if (regression_cases_.empty()) {
        result.passed = true;
        result.score = 1.0;
        result.details.set("message", Value("no regression cases"));
        return result;
    }

    std::size_t regressions = 0;
    Value failures = Value::make_array();
    for (const auto& c : regression_cases_) {
        auto applied = engine_.apply(c.input, program);
        std::vector<std::string> problems;
        for (const auto& pattern : c.forbidden) {
            // Некорректный regex в кейсе бросает std::regex_error -> провал гейта
            std::regex re(pattern, rule::pattern_flags());
            if (std::regex_search(applied.text, re)) {
                problems.push_back("forbidden pattern matched: " + pattern);
            }
        }
        for (const auto& needle : c.required) {
            if (applied.text.find(needle) == std::string::npos) {
                problems.push_back("required text missing: " + needle);
            }
        }
        if (!problems.empty()) {
            ++regressions;
            Value entry = Value::make_object();
            entry.set("case_id", Value(c.case_id));
            entry.set("problems", string_array(problems));
            failures.push_back(std::move(entry));
        }
    }

    std::size_t total = regression_cases_.size();
    result.score = static_cast<double>(total - regressions) / static_cast<double>(total);
    result.passed = regressions == 0;
    result.details.set("regression_failures", Value(static_cast<std::uint64_t>(regressions)));
    result.details.set("total_tests", Value(static_cast<std::uint64_t>(total)));
    result.details.set("failures", std::move(failures));
    return result;
}

GateResult SafetyGateRunner::run_holdout(const engine::Program& program) const {
    GateResult result;
    result.gate_type = GateType::Holdout;

    if (holdout_cases_.empty()) {
        result.passed = true;
        result.score = 1.0;
        result.details.set("message", Value("no holdout cases"));
        return result;
    }
    if (!evaluator_) {
        throw std::runtime_error("holdout gate requires an evaluator");
    }

    std::vector<evaluator::QualityMetrics> collected;
    collected.reserve(holdout_cases_.size());
    std::size_t evaluator_errors = 0;
    for (const auto& c : holdout_cases_) {
        auto applied = engine_.apply(c.content, program);
        auto evaluation = evaluator::evaluate_with_timeout(
            evaluator_, c.content, applied.text, c.to_metadata(), thresholds_.evaluator_timeout);
        if (!evaluation.ok) {
            ++evaluator_errors;
        }
        collected.push_back(evaluation.metrics);
    }

    auto avg = evaluator::average(collected);
    result.score = avg.quality_score();
    result.passed = thresholds_.quality_ok(avg);
    result.details.set("average_metrics", metrics_object(avg));
    result.details.set("total_cases", Value(static_cast<std::uint64_t>(holdout_cases_.size())));
    result.details.set("evaluator_errors", Value(static_cast<std::uint64_t>(evaluator_errors)));
    return result;
}

GateResult SafetyGateRunner::run_performance(const engine::Program& program) const {
    GateResult result;
    result.gate_type = GateType::Performance;

    std::string input;
    const std::string unit = "테스트 내용 ";
    input.reserve(unit.size() * thresholds_.performance_repeat);
    for (std::size_t i = 0; i < thresholds_.performance_repeat; ++i) {
        input += unit;
    }

    std::size_t rss_before = platform::resident_memory_bytes();
    auto start = std::chrono::steady_clock::now();
    auto applied = engine_.apply(input, program);
    auto elapsed = std::chrono::steady_clock::now() - start;
    std::size_t rss_after = platform::resident_memory_bytes();

    double time_ms = std::chrono::duration<double, std::milli>(elapsed).count();
    std::size_t growth = rss_after > rss_before ? rss_after - rss_before : 0;
    double memory_mb =
        static_cast<double>(std::max(applied.text.size(), growth)) / (1024.0 * 1024.0);

    double score = std::min(thresholds_.max_processing_time_ms / std::max(time_ms, 1.0),
                            thresholds_.max_memory_mb / std::max(memory_mb, 1.0));
    result.score = std::min(score, 1.0);
    result.passed =
        time_ms <= thresholds_.max_processing_time_ms && memory_mb <= thresholds_.max_memory_mb;
    result.details.set("processing_time_ms", Value(time_ms));
    result.details.set("memory_usage_mb", Value(memory_mb));
    result.details.set("input_bytes", Value(static_cast<std::uint64_t>(input.size())));
    return result;
}

// ----------------------------------------------------------------------------
// AutoRollbackMonitor
// ----------------------------------------------------------------------------

AutoRollbackMonitor::AutoRollbackMonitor(RollbackOptions options, output::Writer* log)
    : options_(options), log_(log) {}

RollbackDecision AutoRollbackMonitor::should_rollback(const MetricMap& current,
                                                      const MetricMap& previous) const {
    auto metric = [](const MetricMap& m, const char* key) {
        auto it = m.find(key);
        return it == m.end() ? 0.0 : it->second;
    };

    RollbackDecision decision;
    for (const char* key : {"nrr", "fpr", "ss"}) {
        double now = metric(current, key);
        double before = metric(previous, key);
        if (now < before * options_.degradation_ratio) {
            decision.reasons.push_back(std::string(key) + " degraded: " + format_score(before) +
                                       " -> " + format_score(now));
        }
    }

    double error_now = metric(current, "error_rate");
    double error_before = metric(previous, "error_rate");
    if (error_before > 0.0 && error_now > error_before * options_.error_rate_ratio) {
        decision.reasons.push_back("error rate increased: " + format_score(error_before) +
                                   " -> " + format_score(error_now));
    }

    decision.rollback = !decision.reasons.empty();
    if (decision.rollback && log_) {
        for (const auto& reason : decision.reasons) {
            log_->warn("rollback condition: " + reason);
        }
    }
    return decision;
}

}  // namespace lexrefine::safety
