// ==============================================================================
// test_engine_gtest.cpp - Тесты RuleEngine: порядок, статистика, детерминизм
// ==============================================================================

#include <lexrefine/engine.hpp>
#include <lexrefine/rule.hpp>

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

namespace lexrefine::engine::test {

using rule::make_rule;
using rule::Rule;
using rule::RuleType;

namespace {

std::vector<Rule> page_and_whitespace() {
    return {
        make_rule("whitespace", RuleType::PostNormalize, R"(\s{2,})", " ", 50),
        make_rule("page", RuleType::NoiseRemoval, R"(페이지 \d+\n)", "", 100),
    };
}

}  // namespace

TEST(EngineTest, EndToEnd_PageNumberThenWhitespace) {
    // Arrange
    RuleEngine engine;

    // Act
    Result result = engine.apply_rules("내용\n페이지 1\n더 많은    공백", page_and_whitespace());

    // Assert
    EXPECT_EQ(result.text, "내용\n더 많은 공백");
    EXPECT_EQ(result.stats.applied_rule_count, 2u);
    ASSERT_EQ(result.stats.fired.size(), 2u);
    EXPECT_EQ(result.stats.fired[0].rule_id, "page");
    EXPECT_EQ(result.stats.fired[1].rule_id, "whitespace");
    EXPECT_EQ(result.stats.per_type.at(RuleType::NoiseRemoval), 1u);
    EXPECT_EQ(result.stats.per_type.at(RuleType::PostNormalize), 1u);
}

TEST(EngineTest, Stats_LengthsAndReductionRate) {
    RuleEngine engine;
    const std::string input = "내용\n페이지 1\n더 많은    공백";

    Result result = engine.apply_rules(input, page_and_whitespace());

    EXPECT_EQ(result.stats.original_length, input.size());
    EXPECT_EQ(result.stats.final_length, result.text.size());
    double expected = (static_cast<double>(input.size()) - static_cast<double>(result.text.size())) /
                      static_cast<double>(input.size());
    EXPECT_DOUBLE_EQ(result.stats.reduction_rate, expected);
    EXPECT_GT(result.stats.reduction_rate, 0.0);
}

TEST(EngineTest, EmptyText_ZeroReduction) {
    RuleEngine engine;

    Result result = engine.apply_rules("", page_and_whitespace());

    EXPECT_EQ(result.text, "");
    EXPECT_EQ(result.stats.applied_rule_count, 0u);
    EXPECT_DOUBLE_EQ(result.stats.reduction_rate, 0.0);
}

TEST(EngineTest, Priority_HigherRunsFirstThenRuleId) {
    // "ab" -> b_rule (priority 10) срабатывает раньше, a_rule видит уже "xb"
    std::vector<Rule> rules = {
        make_rule("a_rule", RuleType::NoiseRemoval, "x", "y", 5),
        make_rule("b_rule", RuleType::NoiseRemoval, "a", "x", 10),
        make_rule("c_rule", RuleType::NoiseRemoval, "y", "z", 5),
    };
    RuleEngine engine;

    Result result = engine.apply_rules("ab", rules);

    EXPECT_EQ(result.text, "zb");
    ASSERT_EQ(result.stats.fired.size(), 3u);
    EXPECT_EQ(result.stats.fired[0].rule_id, "b_rule");
    EXPECT_EQ(result.stats.fired[1].rule_id, "a_rule");
    EXPECT_EQ(result.stats.fired[2].rule_id, "c_rule");
}

TEST(EngineTest, Prepare_FiltersDisabledAndType) {
    std::vector<Rule> rules = page_and_whitespace();
    rules.push_back(make_rule("off", RuleType::NoiseRemoval, "내용", "", 200));
    rules.back().enabled = false;
    RuleEngine engine;

    auto all = engine.prepare(rules, std::nullopt, "v1.2.0");
    auto only_noise = engine.prepare(rules, RuleType::NoiseRemoval);

    EXPECT_EQ(all->size(), 2u);
    EXPECT_EQ(all->version(), "v1.2.0");
    ASSERT_EQ(only_noise->size(), 1u);
    EXPECT_EQ(only_noise->rules()[0].rule().rule_id, "page");
}

TEST(EngineTest, TypeFilter_AppliesOnlyThatType) {
    RuleEngine engine;

    Result result = engine.apply_rules("내용\n페이지 1\n더 많은    공백", page_and_whitespace(),
                                       RuleType::PostNormalize);

    EXPECT_EQ(result.text, "내용\n페이지 1\n더 많은 공백");
    EXPECT_EQ(result.stats.applied_rule_count, 1u);
}

TEST(EngineTest, InvalidRule_RecordedAndSkipped) {
    std::vector<Rule> rules = page_and_whitespace();
    rules.push_back(make_rule("broken", RuleType::NoiseRemoval, "(", "", 75));
    RuleEngine engine;

    Result result = engine.apply_rules("내용\n페이지 1\n더 많은    공백", rules);

    EXPECT_EQ(result.text, "내용\n더 많은 공백");
    EXPECT_EQ(result.stats.applied_rule_count, 2u);
    ASSERT_EQ(result.stats.errors.size(), 1u);
    EXPECT_EQ(result.stats.errors[0].rule_id, "broken");
}

TEST(EngineTest, Deterministic_RepeatedRunsIdentical) {
    RuleEngine engine;
    auto program = engine.prepare(page_and_whitespace());
    const std::string input = "내용\n페이지 1\n더 많은    공백\n페이지 2\n끝";

    Result first = engine.apply(input, *program);
    for (int i = 0; i < 10; ++i) {
        Result again = engine.apply(input, *program);
        EXPECT_EQ(again.text, first.text);
        EXPECT_TRUE(again.stats == first.stats);
    }
}

TEST(EngineTest, Deterministic_InputOrderOfRulesIrrelevant) {
    std::vector<Rule> forward = page_and_whitespace();
    std::vector<Rule> reversed(forward.rbegin(), forward.rend());
    RuleEngine engine;
    const std::string input = "내용\n페이지 1\n더 많은    공백";

    EXPECT_EQ(engine.apply_rules(input, forward).text, engine.apply_rules(input, reversed).text);
}

TEST(EngineTest, SharedProgram_ConcurrentApplyMatchesSerial) {
    RuleEngine engine;
    auto program = engine.prepare(page_and_whitespace());
    const std::string input = "내용\n페이지 1\n더 많은    공백";
    const std::string expected = engine.apply(input, *program).text;

    std::vector<std::string> outputs(8);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < outputs.size(); ++i) {
        threads.emplace_back([&, i] { outputs[i] = engine.apply(input, *program).text; });
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& out : outputs) {
        EXPECT_EQ(out, expected);
    }
}

TEST(EngineTest, Idempotent_SecondPassChangesNothing) {
    RuleEngine engine;
    auto program = engine.prepare(page_and_whitespace());

    Result once = engine.apply("내용\n페이지 1\n더 많은    공백", *program);
    Result twice = engine.apply(once.text, *program);

    EXPECT_EQ(twice.text, once.text);
    EXPECT_EQ(twice.stats.applied_rule_count, 0u);
}

TEST(EngineTest, Usage_CountsFiredRules) {
    RuleEngine engine;

    Result result = engine.apply_rules("내용\n페이지 1\n더 많은    공백", page_and_whitespace());
    auto usage = result.stats.usage();

    EXPECT_EQ(usage.size(), 2u);
    EXPECT_EQ(usage.at("page"), 1u);
    EXPECT_EQ(usage.at("whitespace"), 1u);
}

TEST(EngineTest, ApplicationOrder_PriorityDescThenId) {
    Rule a = make_rule("a", RuleType::NoiseRemoval, "x", "", 1);
    Rule b = make_rule("b", RuleType::NoiseRemoval, "x", "", 1);
    Rule c = make_rule("c", RuleType::NoiseRemoval, "x", "", 9);

    EXPECT_TRUE(application_order(a, b));
    EXPECT_FALSE(application_order(b, a));
    EXPECT_TRUE(application_order(c, a));
}

}  // namespace lexrefine::engine::test
