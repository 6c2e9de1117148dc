// ==============================================================================
// analysis.cpp - Агрегация batch, кластеры ошибок, критерии dry run
// ==============================================================================

#include <lexrefine/orchestrator.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <set>
#include <stdexcept>

namespace lexrefine::orchestrator {

safety::MetricMap BatchMetrics::to_metric_map() const {
    return {{"nrr", average.nrr},
            {"fpr", average.fpr},
            {"ss", average.ss},
            {"token_reduction", average.token_reduction},
            {"error_rate", error_rate}};
}

BatchMetrics aggregate(const std::vector<CaseOutcome>& outcomes) {
    BatchMetrics m;
    m.cases = outcomes.size();
    if (outcomes.empty()) {
        return m;
    }

    std::vector<evaluator::QualityMetrics> metrics;
    metrics.reserve(outcomes.size());
    double total_ms = 0.0;
    for (const auto& o : outcomes) {
        metrics.push_back(o.evaluation.metrics);
        total_ms += o.elapsed_ms;
        if (!o.success) {
            ++m.failed;
        }
        if (!o.evaluation.errors.empty()) {
            ++m.with_errors;
        }
    }
    m.average = evaluator::average(metrics);
    m.error_rate = static_cast<double>(m.with_errors) / static_cast<double>(m.cases);
    m.avg_case_ms = total_ms / static_cast<double>(m.cases);
    return m;
}

// ----------------------------------------------------------------------------
// Failure clustering
// ----------------------------------------------------------------------------

namespace {

constexpr std::size_t MAX_SAMPLE_CASES = 5;

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* needle : needles) {
        if (haystack.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string ascii_lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::string signed_count(long long v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%+lld", v);
    return buf;
}

}  // namespace

std::string classify_failure(const std::string& error_message) {
    std::string text = ascii_lower(error_message);
    if (contains_any(text, {"페이지", "page"})) {
        return "page_number";
    }
    if (contains_any(text, {"구분선", "separator"})) {
        return "separator";
    }
    if (contains_any(text, {"머리글", "바닥글", "머리말", "꼬리말", "header", "footer"})) {
        return "header_footer";
    }
    if (contains_any(text, {"참조", "reference"})) {
        return "reference";
    }
    if (contains_any(text, {"공백", "whitespace"})) {
        return "whitespace";
    }
    return "unknown";
}

std::vector<FailureCluster> cluster_failures(const std::vector<CaseOutcome>& outcomes) {
    std::map<std::string, FailureCluster> by_error;
    for (const auto& o : outcomes) {
        for (const auto& error : o.evaluation.errors) {
            auto& cluster = by_error[error];
            if (cluster.failure_count == 0) {
                cluster.error_pattern = error;
                cluster.pattern_type = classify_failure(error);
            }
            ++cluster.failure_count;
            auto& samples = cluster.sample_cases;
            if (samples.size() < MAX_SAMPLE_CASES &&
                std::find(samples.begin(), samples.end(), o.case_id) == samples.end()) {
                samples.push_back(o.case_id);
            }
        }
    }

    std::vector<FailureCluster> clusters;
    clusters.reserve(by_error.size());
    for (auto& [error, cluster] : by_error) {
        clusters.push_back(std::move(cluster));
    }
    // std::map уже упорядочил по тексту ошибки
    std::stable_sort(clusters.begin(), clusters.end(),
                     [](const FailureCluster& a, const FailureCluster& b) {
                         return a.failure_count > b.failure_count;
                     });
    return clusters;
}

std::string diff_summary(const std::string& before, const std::string& after) {
    auto lines = [](const std::string& s) {
        return static_cast<long long>(std::count(s.begin(), s.end(), '\n')) + 1;
    };
    long long lines_before = lines(before);
    long long lines_after = lines(after);
    auto chars_before = static_cast<long long>(before.size());
    auto chars_after = static_cast<long long>(after.size());

    return "Lines: " + std::to_string(lines_before) + " → " + std::to_string(lines_after) + " (" +
           signed_count(lines_after - lines_before) + "), Characters: " +
           std::to_string(chars_before) + " → " + std::to_string(chars_after) + " (" +
           signed_count(chars_after - chars_before) + ")";
}

double token_reduction_pct(const std::string& before, const std::string& after) {
    double tokens_before = std::floor(evaluator::estimate_tokens(before));
    double tokens_after = std::floor(evaluator::estimate_tokens(after));
    if (tokens_before <= 0.0) {
        return 0.0;
    }
    double pct = (tokens_before - tokens_after) / tokens_before * 100.0;
    return std::round(pct * 100.0) / 100.0;
}

std::string to_string(NextAction a) {
    switch (a) {
    case NextAction::ScaleUp:
        return "scale_up";
    case NextAction::RetrySameScale:
        return "retry_same_scale";
    case NextAction::Stabilized:
        return "stabilized";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// Dry run
// ----------------------------------------------------------------------------

std::string DryRunDecision::reason() const {
    std::string out;
    for (const auto& r : reasons) {
        if (!out.empty()) {
            out += "; ";
        }
        out += r;
    }
    return out;
}

double estimate_cost(std::size_t corpus_size, const DryRunCriteria& criteria) {
    double total_tokens = static_cast<double>(corpus_size) * criteria.tokens_per_case;
    return total_tokens / 1000.0 * criteria.usd_per_1k_tokens;
}

DryRunDecision evaluate_dry_run(const DryRunStats& stats, const DryRunCriteria& criteria) {
    DryRunDecision decision;
    char buf[128];

    double required = static_cast<double>(stats.target_size) * criteria.min_sample_ratio;
    if (stats.target_size == 0 || static_cast<double>(stats.sample_size) < required) {
        std::snprintf(buf, sizeof(buf), "Insufficient sample size: %zu < %.1f", stats.sample_size,
                      required);
        decision.reasons.emplace_back(buf);
    }
    if (stats.failure_rate > criteria.max_failure_rate) {
        std::snprintf(buf, sizeof(buf), "High failure rate: %.2f%%", stats.failure_rate * 100.0);
        decision.reasons.emplace_back(buf);
    }
    if (stats.avg_case_seconds > criteria.max_avg_case_seconds) {
        std::snprintf(buf, sizeof(buf), "Slow processing: %.2fs per case", stats.avg_case_seconds);
        decision.reasons.emplace_back(buf);
    }
    if (stats.estimated_cost_usd > criteria.budget_usd) {
        std::snprintf(buf, sizeof(buf), "High cost: $%.2f", stats.estimated_cost_usd);
        decision.reasons.emplace_back(buf);
    }

    decision.ready = decision.reasons.empty();
    return decision;
}

// ----------------------------------------------------------------------------
// JsonlCaseSink
// ----------------------------------------------------------------------------

JsonlCaseSink::JsonlCaseSink(const std::filesystem::path& path)
    : file_(path, std::ios::binary | std::ios::app) {
    if (!file_.is_open()) {
        throw std::runtime_error("could not open output file: " + path.string());
    }
}

void JsonlCaseSink::record(const CaseOutcome& outcome, const std::string& version) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> w(buffer);

    w.StartObject();
    w.Key("case_id");
    w.String(outcome.case_id.c_str(), static_cast<rapidjson::SizeType>(outcome.case_id.size()));
    w.Key("version");
    w.String(version.c_str(), static_cast<rapidjson::SizeType>(version.size()));
    w.Key("success");
    w.Bool(outcome.success);
    w.Key("output");
    w.String(outcome.output.c_str(), static_cast<rapidjson::SizeType>(outcome.output.size()));
    w.Key("applied_rules");
    w.Uint64(outcome.stats.applied_rule_count);
    w.Key("metrics");
    w.StartObject();
    for (const auto& [key, value] : outcome.evaluation.metrics.to_map()) {
        w.Key(key.c_str());
        w.Double(value);
    }
    w.EndObject();
    w.Key("errors");
    w.StartArray();
    for (const auto& e : outcome.evaluation.errors) {
        w.String(e.c_str(), static_cast<rapidjson::SizeType>(e.size()));
    }
    w.EndArray();
    w.EndObject();

    std::lock_guard<std::mutex> lock(mutex_);
    file_.write(buffer.GetString(), static_cast<std::streamsize>(buffer.GetSize()));
    file_.put('\n');
    if (!file_) {
        throw std::runtime_error("write to output file failed");
    }
    ++written_;
}

std::size_t JsonlCaseSink::written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return written_;
}

}  // namespace lexrefine::orchestrator
