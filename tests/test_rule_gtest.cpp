// ==============================================================================
// test_rule_gtest.cpp - Тесты правил: стратегии применения, YAML, lint
// ==============================================================================

#include <lexrefine/rule.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace lexrefine::rule::test {

namespace {

std::filesystem::path fixtures_path() {
    return std::filesystem::path(LEXREFINE_FIXTURES_DIR);
}

}  // namespace

// ==============================================================================
// RuleType
// ==============================================================================

TEST(RuleTypeTest, ToString_ParseRoundTripForEveryType) {
    for (RuleType t : all_rule_types()) {
        EXPECT_EQ(parse_rule_type(to_string(t)), t);
    }
    EXPECT_EQ(all_rule_types().size(), 5u);
}

TEST(RuleTypeTest, ParseRuleType_Unknown_Throws) {
    EXPECT_THROW(parse_rule_type("summarization"), std::invalid_argument);
    EXPECT_THROW(parse_rule_type(""), std::invalid_argument);
}

// ==============================================================================
// Стратегии применения
// ==============================================================================

TEST(RuleApplyTest, NoiseRemoval_SubstitutesEveryMatch) {
    Rule r = make_rule("page", RuleType::NoiseRemoval, R"(페이지\s*\d+)", "", 100);

    auto [text, applied] = r.apply("앞 페이지 1 중간 페이지 23 뒤");

    EXPECT_TRUE(applied);
    EXPECT_EQ(text, "앞  중간  뒤");
}

TEST(RuleApplyTest, Substitution_NoMatch_TextUnchanged) {
    Rule r = make_rule("page", RuleType::NoiseRemoval, R"(페이지\s*\d+)", "", 100);

    auto [text, applied] = r.apply("판결 이유");

    EXPECT_FALSE(applied);
    EXPECT_EQ(text, "판결 이유");
}

TEST(RuleApplyTest, Substitution_MatchWithIdenticalReplacement_NotApplied) {
    Rule r = make_rule("same", RuleType::PostNormalize, "a", "a", 1);

    auto [text, applied] = r.apply("banana");

    EXPECT_FALSE(applied);
    EXPECT_EQ(text, "banana");
}

TEST(RuleApplyTest, Substitution_ReplacementDollarIsLiteral) {
    Rule r = make_rule("fee", RuleType::PostNormalize, R"(금\s*(\d+)원)", "$1 / $& / $$", 1);

    auto [text, applied] = r.apply("소송비용 금 500원 부담");

    EXPECT_TRUE(applied);
    EXPECT_EQ(text, "소송비용 $1 / $& / $$ 부담");
}

TEST(RuleApplyTest, Pattern_IsCaseInsensitive) {
    Rule r = make_rule("hdr", RuleType::NoiseRemoval, "header", "", 1);

    auto [text, applied] = r.apply("HEADER body");

    EXPECT_TRUE(applied);
    EXPECT_EQ(text, " body");
}

TEST(RuleApplyTest, LegalFiltering_DropsMatchingSentences) {
    Rule r = make_rule("ref", RuleType::LegalFiltering, "참조", "", 10);

    auto [text, applied] = r.apply("첫 문장. 참조 판례 있음. 마지막 문장");

    EXPECT_TRUE(applied);
    EXPECT_EQ(text, "첫 문장. 마지막 문장");
}

TEST(RuleApplyTest, LegalFiltering_NothingDropped_TextUnchanged) {
    Rule r = make_rule("ref", RuleType::LegalFiltering, "참조", "", 10);
    const std::string input = "첫 문장!  둘째 문장?";

    auto [text, applied] = r.apply(input);

    EXPECT_FALSE(applied);
    EXPECT_EQ(text, input);
}

TEST(RuleApplyTest, FactExtraction_KeepsMatchesJoinedBySpace) {
    Rule r = make_rule("date", RuleType::FactExtraction, R"(\d{4}\.\d{1,2}\.\d{1,2}\.)", "", 10);
    CompiledRule compiled = CompiledRule::compile(r);
    ApplyOptions options;
    options.fact_extraction_enabled = true;

    auto outcome = compiled.apply("선고 2023.5.1. 접수 2022.12.30. 끝", options);

    EXPECT_TRUE(outcome.applied);
    EXPECT_EQ(outcome.text, "2023.5.1. 2022.12.30.");
}

TEST(RuleApplyTest, FactExtraction_DisabledByDefault_Skipped) {
    Rule r = make_rule("date", RuleType::FactExtraction, R"(\d+)", "", 10);
    CompiledRule compiled = CompiledRule::compile(r);

    auto outcome = compiled.apply("사건 123", ApplyOptions{});

    EXPECT_FALSE(outcome.applied);
    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(outcome.text, "사건 123");
}

TEST(RuleApplyTest, FactExtraction_NoMatches_TextUnchanged) {
    Rule r = make_rule("date", RuleType::FactExtraction, R"(\d+)", "", 10);
    ApplyOptions options;
    options.fact_extraction_enabled = true;

    auto outcome = CompiledRule::compile(r).apply("숫자 없음", options);

    EXPECT_FALSE(outcome.applied);
    EXPECT_EQ(outcome.text, "숫자 없음");
}

TEST(RuleApplyTest, DisabledRule_NeverApplies) {
    Rule r = make_rule("page", RuleType::NoiseRemoval, "페이지", "", 1);
    r.enabled = false;

    auto outcome = CompiledRule::compile(r).apply("페이지", ApplyOptions{});

    EXPECT_FALSE(outcome.applied);
    EXPECT_EQ(outcome.text, "페이지");
}

TEST(RuleApplyTest, InvalidPattern_ReturnsErrorAndOriginalText) {
    Rule r = make_rule("broken", RuleType::NoiseRemoval, "(unclosed", "", 1);
    CompiledRule compiled = CompiledRule::compile(r);

    auto outcome = compiled.apply("본문", ApplyOptions{});

    EXPECT_FALSE(compiled.valid());
    EXPECT_FALSE(outcome.applied);
    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(outcome.error->rule_id, "broken");
    EXPECT_NE(outcome.error->format().find("broken"), std::string::npos);
    EXPECT_EQ(outcome.text, "본문");
}

TEST(RuleApplyTest, ValidatePattern_ReportsProblems) {
    EXPECT_FALSE(validate_pattern(R"(\s{2,})").has_value());
    EXPECT_TRUE(validate_pattern("").has_value());
    EXPECT_TRUE(validate_pattern("[a-").has_value());
}

TEST(RuleApplyTest, SplitSentences_DropsDelimiters) {
    auto parts = split_sentences("하나. 둘!  셋? 넷");

    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "하나");
    EXPECT_EQ(parts[3], "넷");
}

// ==============================================================================
// YAML
// ==============================================================================

TEST(RuleLoader, LoadFile_ParsesAllFields) {
    auto result = load(fixtures_path() / "rules.yml");

    ASSERT_TRUE(result) << result.error.format();
    ASSERT_EQ(result.rules.size(), 3u);
    EXPECT_EQ(result.rules[0].rule_id, "noise_page_number");
    EXPECT_EQ(result.rules[0].type, RuleType::NoiseRemoval);
    EXPECT_EQ(result.rules[0].priority, 100);
    EXPECT_EQ(result.rules[0].replacement, "");
    EXPECT_TRUE(result.rules[0].enabled);
    EXPECT_EQ(result.rules[2].type, RuleType::PostNormalize);
    EXPECT_EQ(result.rules[2].replacement, " ");
}

TEST(RuleLoader, LoadDirectory_ReadsOnlyYamlFilesInSortedOrder) {
    auto result = load(fixtures_path() / "rules");

    ASSERT_TRUE(result) << result.error.format();
    ASSERT_EQ(result.rules.size(), 2u);
    EXPECT_EQ(result.rules[0].rule_id, "noise_page_number");
    EXPECT_EQ(result.rules[1].rule_id, "normalize_whitespace");
}

TEST(RuleLoader, MissingPath_Fails) {
    auto result = load(fixtures_path() / "does_not_exist.yml");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.message, "path does not exist");
}

TEST(RuleLoader, InvalidExtension_Fails) {
    auto result = load(fixtures_path() / "rules" / "invalid_pattern.yml.txt");

    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.message, "rule must have a yaml file extension");
}

TEST(RuleLoader, UnknownType_Fails) {
    auto result = load(fixtures_path() / "unknown_type.yml");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.message.find("summarization"), std::string::npos);
    EXPECT_TRUE(result.rules.empty());
}

TEST(RuleLoader, FromString_SingleMapping) {
    auto result = load_from_string("id: r1\ntype: redundancy_removal\npattern: '(\\S+) \\1'\n"
                                   "replacement: '$1'\npriority: 7\nenabled: false\n");

    ASSERT_TRUE(result) << result.error.format();
    ASSERT_EQ(result.rules.size(), 1u);
    EXPECT_EQ(result.rules[0].type, RuleType::RedundancyRemoval);
    EXPECT_EQ(result.rules[0].replacement, "$1");
    EXPECT_FALSE(result.rules[0].enabled);
}

TEST(RuleLoader, FromString_MissingPattern_Fails) {
    auto result = load_from_string("rules:\n  - id: r1\n    type: noise_removal\n");

    EXPECT_FALSE(result);
    EXPECT_NE(result.error.message.find("pattern"), std::string::npos);
    EXPECT_EQ(result.error.path, "<string>");
}

TEST(RuleLoader, Lint_ReportsInvalidPatternAndDuplicateId) {
    auto result = lint(fixtures_path() / "bad_rules.yml");

    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.rule_count, 2u);
    ASSERT_EQ(result.issues.size(), 2u);
    EXPECT_NE(result.issues[0].message.find("invalid pattern"), std::string::npos);
    EXPECT_EQ(result.issues[1].message, "duplicate rule id");
}

TEST(RuleLoader, Lint_CleanRules_NoIssues) {
    auto result = lint(fixtures_path() / "rules.yml");

    ASSERT_TRUE(result);
    EXPECT_EQ(result.rule_count, 3u);
    EXPECT_TRUE(result.issues.empty());
}

}  // namespace lexrefine::rule::test
