// ==============================================================================
// evaluator.cpp - Контракт оценщика, разбор ответов, вызов с таймаутом
// ==============================================================================

#include <lexrefine/evaluator.hpp>
#include <lexrefine/jsonl.hpp>

#include <atomic>
#include <future>
#include <mutex>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <sstream>
#include <thread>

namespace lexrefine::evaluator {

// ============================================================================
// Data model
// ============================================================================

std::map<std::string, double> QualityMetrics::to_map() const {
    return {{"nrr", nrr},
            {"fpr", fpr},
            {"ss", ss},
            {"token_reduction", token_reduction},
            {"parsing_errors", static_cast<double>(parsing_errors)}};
}

Evaluation Evaluation::fallback(std::string message) {
    Evaluation e;
    e.ok = false;
    e.errors.push_back(std::move(message));
    return e;
}

// ============================================================================
// Response parsing
// ============================================================================

std::string extract_json(std::string_view text) {
    const std::string_view fence = "```json";
    auto fence_pos = text.find(fence);
    if (fence_pos != std::string_view::npos) {
        auto start = fence_pos + fence.size();
        auto end = text.find("```", start);
        if (end != std::string_view::npos) {
            return std::string(text.substr(start, end - start));
        }
    }

    auto first = text.find('{');
    auto last = text.rfind('}');
    if (first != std::string_view::npos && last != std::string_view::npos && last > first) {
        return std::string(text.substr(first, last - first + 1));
    }
    return std::string(text);
}

namespace {

std::vector<std::string> string_list(const rapidjson::Value& obj, const char* key) {
    std::vector<std::string> out;
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsArray()) {
        return out;
    }
    for (const auto& item : it->value.GetArray()) {
        if (item.IsString()) {
            out.emplace_back(item.GetString(), item.GetStringLength());
        } else if (item.IsInt64()) {
            out.push_back(std::to_string(item.GetInt64()));
        }
    }
    return out;
}

}  // namespace

Evaluation evaluation_from_json(const rapidjson::Value& root) {
    if (!root.IsObject()) {
        return Evaluation::fallback("parse error: response is not a JSON object");
    }

    Evaluation e;

    auto metrics_it = root.FindMember("metrics");
    if (metrics_it != root.MemberEnd() && metrics_it->value.IsObject()) {
        const rapidjson::Value& m = metrics_it->value;
        e.metrics.nrr = io::json_number(m, "nrr");
        // icr - прежнее имя fpr в ответах оценщика
        e.metrics.fpr = io::json_number(m, "fpr", io::json_number(m, "icr"));
        e.metrics.ss = io::json_number(m, "ss");
        e.metrics.token_reduction = io::json_number(m, "token_reduction");
        e.metrics.parsing_errors = static_cast<int>(io::json_number(m, "parsing_errors"));
    }

    e.errors = string_list(root, "errors");

    auto sugg_it = root.FindMember("suggestions");
    if (sugg_it != root.MemberEnd() && sugg_it->value.IsArray()) {
        for (const auto& s : sugg_it->value.GetArray()) {
            if (!s.IsObject()) {
                continue;
            }
            RawSuggestion raw;
            raw.description = io::json_string(s, "description");
            raw.confidence_score = io::json_number(s, "confidence_score");
            raw.rule_type = io::json_string(s, "rule_type");
            raw.pattern_before = io::json_string(s, "pattern_before");
            raw.pattern_after = io::json_string(s, "pattern_after");
            raw.estimated_improvement = io::json_number(s, "estimated_improvement");
            raw.applicable_cases = string_list(s, "applicable_cases");
            e.suggestions.push_back(std::move(raw));
        }
    }
    return e;
}

Evaluation parse_evaluation_response(std::string_view text) {
    std::string json = extract_json(text);

    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        std::ostringstream oss;
        oss << "parse error: " << rapidjson::GetParseError_En(doc.GetParseError()) << " at offset "
            << doc.GetErrorOffset();
        return Evaluation::fallback(oss.str());
    }
    return evaluation_from_json(doc);
}

// ============================================================================
// evaluate_with_timeout
// ============================================================================

namespace {

std::atomic<std::size_t> g_stranded{0};

/// Общее состояние вызывающего и фонового потока
struct CallState {
    std::mutex mutex;
    bool done = false;
    bool abandoned = false;
};

}  // namespace

std::size_t stranded_evaluations() {
    return g_stranded.load();
}

Evaluation evaluate_with_timeout(const std::shared_ptr<Evaluator>& evaluator,
                                 const std::string& before, const std::string& after,
                                 const Value& metadata, std::chrono::milliseconds timeout) {
    if (!evaluator) {
        return Evaluation::fallback("evaluator not configured");
    }

    std::size_t stranded = g_stranded.load();
    if (stranded >= MAX_STRANDED_EVALUATIONS) {
        return Evaluation::fallback("evaluator unavailable: " + std::to_string(stranded) +
                                    " timed-out calls still running");
    }

    auto promise = std::make_shared<std::promise<Evaluation>>();
    std::future<Evaluation> future = promise->get_future();
    auto state = std::make_shared<CallState>();

    // Поток владеет копиями аргументов и shared_ptr на оценщика:
    // после таймаута он может завершиться позже вызывающего
    std::thread worker([promise, state, evaluator, before, after, metadata]() {
        try {
            promise->set_value(evaluator->evaluate(before, after, metadata));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        std::lock_guard<std::mutex> lock(state->mutex);
        state->done = true;
        if (state->abandoned) {
            --g_stranded;
        }
    });
    worker.detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->done) {
            state->abandoned = true;
            ++g_stranded;
            return Evaluation::fallback("evaluator timeout after " +
                                        std::to_string(timeout.count()) + " ms");
        }
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return Evaluation::fallback(std::string("evaluator error: ") + e.what());
    }
}

// ============================================================================
// Helpers
// ============================================================================

QualityMetrics average(const std::vector<QualityMetrics>& metrics) {
    QualityMetrics avg;
    if (metrics.empty()) {
        return avg;
    }
    for (const auto& m : metrics) {
        avg.nrr += m.nrr;
        avg.fpr += m.fpr;
        avg.ss += m.ss;
        avg.token_reduction += m.token_reduction;
        avg.parsing_errors += m.parsing_errors;
    }
    const double n = static_cast<double>(metrics.size());
    avg.nrr /= n;
    avg.fpr /= n;
    avg.ss /= n;
    avg.token_reduction /= n;
    return avg;
}

double estimate_tokens(std::string_view text) {
    std::size_t words = 0;
    bool in_word = false;
    for (char c : text) {
        bool space = (c == ' ' || c == '\n' || c == '\t' || c == '\r' || c == '\f' || c == '\v');
        if (!space && !in_word) {
            ++words;
        }
        in_word = !space;
    }
    return static_cast<double>(words) * 1.3;
}

// ============================================================================
// ReplayEvaluator
// ============================================================================

ReplayEvaluator::LoadResult ReplayEvaluator::load(const std::filesystem::path& path) {
    LoadResult result;

    io::JsonlReader reader(path);
    if (!reader.open()) {
        result.error = reader.last_error()->format();
        return result;
    }

    rapidjson::Document doc;
    std::map<std::string, std::string> loaded;
    while (reader.next(doc)) {
        std::string case_id = io::json_string(doc, "case_id");
        if (case_id.empty()) {
            result.error = "line " + std::to_string(reader.line_number()) + ": missing case_id";
            return result;
        }

        auto it = doc.FindMember("response");
        if (it == doc.MemberEnd()) {
            result.error = "line " + std::to_string(reader.line_number()) + ": missing response";
            return result;
        }

        std::string response;
        if (it->value.IsString()) {
            response.assign(it->value.GetString(), it->value.GetStringLength());
        } else {
            rapidjson::StringBuffer buffer;
            rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
            it->value.Accept(writer);
            response.assign(buffer.GetString(), buffer.GetSize());
        }
        loaded[case_id] = std::move(response);
    }
    if (reader.last_error()) {
        result.error = reader.last_error()->format();
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, response] : loaded) {
        responses_[id] = std::move(response);
    }
    result.count = loaded.size();
    result.ok = true;
    return result;
}

void ReplayEvaluator::add(const std::string& case_id, std::string response) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[case_id] = std::move(response);
}

Evaluation ReplayEvaluator::evaluate(const std::string& /*before*/, const std::string& /*after*/,
                                     const Value& metadata) {
    std::string case_id;
    if (const Value* id = metadata.get("case_id")) {
        if (const auto* s = id->get_string()) {
            case_id = *s;
        }
    }

    std::string response;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = responses_.find(case_id);
        if (it == responses_.end()) {
            it = responses_.find("*");
        }
        if (it == responses_.end()) {
            throw EvaluatorError("no recorded response for case '" + case_id + "'");
        }
        response = it->second;
    }
    return parse_evaluation_response(response);
}

std::size_t ReplayEvaluator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return responses_.size();
}

}  // namespace lexrefine::evaluator
