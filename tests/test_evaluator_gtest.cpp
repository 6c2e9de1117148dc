// ==============================================================================
// test_evaluator_gtest.cpp - Тесты разбора ответов оценщика и таймаута
// ==============================================================================

#include <lexrefine/evaluator.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

namespace lexrefine::evaluator::test {

namespace {

std::filesystem::path fixtures_path() {
    return std::filesystem::path(LEXREFINE_FIXTURES_DIR);
}

Value metadata_for(const std::string& case_id) {
    Value meta = Value::make_object();
    meta.set("case_id", Value(case_id));
    return meta;
}

class SlowEvaluator : public Evaluator {
public:
    Evaluation evaluate(const std::string&, const std::string&, const Value&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return Evaluation{};
    }
};

/// Блокируется до release(); считает начатые вызовы
class GatedEvaluator : public Evaluator {
public:
    Evaluation evaluate(const std::string&, const std::string&, const Value&) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++calls_;
        released_cv_.wait(lock, [this] { return released_; });
        return Evaluation{};
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        released_cv_.notify_all();
    }

    std::size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable released_cv_;
    bool released_ = false;
    std::size_t calls_ = 0;
};

/// Дождаться завершения всех фоновых вызовов
bool wait_stranded_drained() {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (std::chrono::steady_clock::now() < deadline) {
        if (stranded_evaluations() == 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

class ThrowingEvaluator : public Evaluator {
public:
    Evaluation evaluate(const std::string&, const std::string&, const Value&) override {
        throw std::runtime_error("quota exceeded");
    }
};

}  // namespace

// ==============================================================================
// Parsing
// ==============================================================================

TEST(EvaluatorParseTest, ExtractJson_FromFencedBlock) {
    EXPECT_EQ(extract_json("결과:\n```json\n{\"a\": 1}\n```\n끝"), "\n{\"a\": 1}\n");
}

TEST(EvaluatorParseTest, ExtractJson_FromBraces) {
    EXPECT_EQ(extract_json("prefix {\"a\": {\"b\": 2}} suffix"), "{\"a\": {\"b\": 2}}");
    EXPECT_EQ(extract_json("no json here"), "no json here");
}

TEST(EvaluatorParseTest, ParseResponse_FullObject) {
    auto e = parse_evaluation_response(R"({
        "metrics": {"nrr": 0.9, "fpr": 0.98, "ss": 0.91, "token_reduction": 22.5, "parsing_errors": 1},
        "errors": ["머리글 잔존"],
        "suggestions": [{"description": "머리글 제거", "confidence_score": 0.85,
                         "rule_type": "new_pattern", "pattern_after": "머리글",
                         "estimated_improvement": 0.2, "applicable_cases": ["a", 7]}]
    })");

    EXPECT_TRUE(e.ok);
    EXPECT_DOUBLE_EQ(e.metrics.nrr, 0.9);
    EXPECT_DOUBLE_EQ(e.metrics.fpr, 0.98);
    EXPECT_DOUBLE_EQ(e.metrics.token_reduction, 22.5);
    EXPECT_EQ(e.metrics.parsing_errors, 1);
    ASSERT_EQ(e.errors.size(), 1u);
    ASSERT_EQ(e.suggestions.size(), 1u);
    EXPECT_EQ(e.suggestions[0].rule_type, "new_pattern");
    EXPECT_DOUBLE_EQ(e.suggestions[0].confidence_score, 0.85);
    ASSERT_EQ(e.suggestions[0].applicable_cases.size(), 2u);
    EXPECT_EQ(e.suggestions[0].applicable_cases[1], "7");
}

TEST(EvaluatorParseTest, ParseResponse_IcrAliasForFpr) {
    auto e = parse_evaluation_response(R"({"metrics": {"nrr": 0.8, "icr": 0.97}})");

    EXPECT_TRUE(e.ok);
    EXPECT_DOUBLE_EQ(e.metrics.fpr, 0.97);
    EXPECT_DOUBLE_EQ(e.metrics.ss, 0.0);
}

TEST(EvaluatorParseTest, ParseResponse_Garbage_Fallback) {
    auto e = parse_evaluation_response("평가할 수 없습니다");

    EXPECT_FALSE(e.ok);
    ASSERT_EQ(e.errors.size(), 1u);
    EXPECT_EQ(e.errors[0].rfind("parse error", 0), 0u);
    EXPECT_DOUBLE_EQ(e.metrics.quality_score(), 0.0);
}

TEST(EvaluatorParseTest, ParseResponse_NonObject_Fallback) {
    auto e = parse_evaluation_response("[1, 2, 3]");

    EXPECT_FALSE(e.ok);
}

// ==============================================================================
// Helpers
// ==============================================================================

TEST(EvaluatorHelpersTest, Average_MeansAndSumsParsingErrors) {
    QualityMetrics a;
    a.nrr = 0.8;
    a.fpr = 1.0;
    a.parsing_errors = 1;
    QualityMetrics b;
    b.nrr = 1.0;
    b.fpr = 0.9;
    b.parsing_errors = 2;

    auto avg = average({a, b});

    EXPECT_DOUBLE_EQ(avg.nrr, 0.9);
    EXPECT_DOUBLE_EQ(avg.fpr, 0.95);
    EXPECT_EQ(avg.parsing_errors, 3);
    EXPECT_DOUBLE_EQ(average({}).nrr, 0.0);
}

TEST(EvaluatorHelpersTest, EstimateTokens) {
    EXPECT_DOUBLE_EQ(estimate_tokens(""), 0.0);
    EXPECT_DOUBLE_EQ(estimate_tokens("원고의  청구를\n기각한다"), 3 * 1.3);
}

TEST(EvaluatorHelpersTest, QualityScore_AndMap) {
    QualityMetrics m;
    m.nrr = 0.9;
    m.fpr = 0.9;
    m.ss = 0.9;

    EXPECT_DOUBLE_EQ(m.quality_score(), 0.9);
    EXPECT_EQ(m.to_map().size(), 5u);
}

// ==============================================================================
// evaluate_with_timeout
// ==============================================================================

TEST(EvaluatorTimeoutTest, NoEvaluator_Fallback) {
    auto e = evaluate_with_timeout(nullptr, "a", "b", Value::make_object(),
                                   std::chrono::milliseconds(10));

    EXPECT_FALSE(e.ok);
    EXPECT_EQ(e.errors[0], "evaluator not configured");
}

TEST(EvaluatorTimeoutTest, SlowEvaluator_TimesOut) {
    auto start = std::chrono::steady_clock::now();

    auto e = evaluate_with_timeout(std::make_shared<SlowEvaluator>(), "a", "b",
                                   Value::make_object(), std::chrono::milliseconds(20));

    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_FALSE(e.ok);
    EXPECT_NE(e.errors[0].find("timeout"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::milliseconds(250));
}

TEST(EvaluatorTimeoutTest, TimedOutCall_CountedUntilItFinishes) {
    ASSERT_TRUE(wait_stranded_drained());
    auto gated = std::make_shared<GatedEvaluator>();

    auto e = evaluate_with_timeout(gated, "a", "b", Value::make_object(),
                                   std::chrono::milliseconds(10));

    EXPECT_FALSE(e.ok);
    EXPECT_EQ(stranded_evaluations(), 1u);

    gated->release();
    EXPECT_TRUE(wait_stranded_drained());
}

TEST(EvaluatorTimeoutTest, TooManyStrandedCalls_NewCallsRefused) {
    // Arrange
    ASSERT_TRUE(wait_stranded_drained());
    auto gated = std::make_shared<GatedEvaluator>();
    for (std::size_t i = 0; i < MAX_STRANDED_EVALUATIONS; ++i) {
        evaluate_with_timeout(gated, "a", "b", Value::make_object(), std::chrono::milliseconds(5));
    }
    ASSERT_EQ(stranded_evaluations(), MAX_STRANDED_EVALUATIONS);

    // Act
    auto refused = evaluate_with_timeout(gated, "a", "b", Value::make_object(),
                                         std::chrono::milliseconds(5));

    // Assert
    EXPECT_FALSE(refused.ok);
    EXPECT_EQ(refused.errors[0], "evaluator unavailable: 32 timed-out calls still running");
    gated->release();
    EXPECT_TRUE(wait_stranded_drained());
    EXPECT_EQ(gated->calls(), MAX_STRANDED_EVALUATIONS);

    auto recovered = evaluate_with_timeout(gated, "a", "b", Value::make_object(),
                                           std::chrono::milliseconds(1000));
    EXPECT_TRUE(recovered.ok);
}

TEST(EvaluatorTimeoutTest, ThrowingEvaluator_Fallback) {
    auto e = evaluate_with_timeout(std::make_shared<ThrowingEvaluator>(), "a", "b",
                                   Value::make_object(), std::chrono::milliseconds(1000));

    EXPECT_FALSE(e.ok);
    EXPECT_EQ(e.errors[0], "evaluator error: quota exceeded");
}

// ==============================================================================
// ReplayEvaluator
// ==============================================================================

TEST(ReplayEvaluatorTest, Load_FixtureResponses) {
    ReplayEvaluator replay;

    auto loaded = replay.load(fixtures_path() / "responses.jsonl");

    ASSERT_TRUE(loaded) << loaded.error;
    EXPECT_EQ(loaded.count, 2u);
    EXPECT_EQ(replay.size(), 2u);
}

TEST(ReplayEvaluatorTest, Evaluate_ByCaseIdAndWildcard) {
    ReplayEvaluator replay;
    ASSERT_TRUE(replay.load(fixtures_path() / "responses.jsonl"));

    auto specific = replay.evaluate("", "", metadata_for("2023노2002"));
    auto wildcard = replay.evaluate("", "", metadata_for("unknown"));

    EXPECT_DOUBLE_EQ(specific.metrics.nrr, 0.80);
    EXPECT_DOUBLE_EQ(specific.metrics.fpr, 0.99);
    ASSERT_EQ(specific.suggestions.size(), 1u);
    EXPECT_EQ(specific.suggestions[0].pattern_before, "서울고등법원 판결\\n");
    EXPECT_DOUBLE_EQ(wildcard.metrics.nrr, 0.95);
    EXPECT_TRUE(wildcard.suggestions.empty());
}

TEST(ReplayEvaluatorTest, Evaluate_NoRecord_Throws) {
    ReplayEvaluator replay;
    replay.add("only", R"({"metrics": {}})");

    EXPECT_THROW(replay.evaluate("", "", metadata_for("other")), EvaluatorError);
}

TEST(ReplayEvaluatorTest, Load_MalformedLine_Fails) {
    ReplayEvaluator replay;

    auto loaded = replay.load(fixtures_path() / "malformed.jsonl");

    EXPECT_FALSE(loaded);
    EXPECT_EQ(replay.size(), 0u);
}

}  // namespace lexrefine::evaluator::test
