// ==============================================================================
// test_corpus_gtest.cpp - Тесты корпуса и стратифицированной выборки
// ==============================================================================

#include <lexrefine/corpus.hpp>
#include <lexrefine/jsonl.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace lexrefine::corpus::test {

namespace {

std::filesystem::path fixtures_path() {
    return std::filesystem::path(LEXREFINE_FIXTURES_DIR);
}

DocumentCase make_case(std::string id, std::string court, std::string type, int year) {
    DocumentCase c;
    c.case_id = std::move(id);
    c.court_type = std::move(court);
    c.case_type = std::move(type);
    c.year = year;
    c.content = "본문";
    return c;
}

}  // namespace

TEST(JsonlReaderTest, SkipsBlankLinesAndCountsLines) {
    io::JsonlReader reader(fixtures_path() / "corpus.jsonl");
    ASSERT_TRUE(reader.open());

    rapidjson::Document doc;
    std::size_t objects = 0;
    while (reader.next(doc)) {
        ++objects;
    }

    EXPECT_EQ(objects, 4u);
    EXPECT_FALSE(reader.last_error().has_value());
    EXPECT_EQ(reader.line_number(), 5u);
}

TEST(JsonlReaderTest, MalformedLine_ReportsLine) {
    io::JsonlReader reader(fixtures_path() / "malformed.jsonl");
    ASSERT_TRUE(reader.open());

    rapidjson::Document doc;
    EXPECT_TRUE(reader.next(doc));
    EXPECT_FALSE(reader.next(doc));

    ASSERT_TRUE(reader.last_error().has_value());
    EXPECT_EQ(reader.last_error()->line, 2u);
    EXPECT_NE(reader.last_error()->format().find("malformed.jsonl:2"), std::string::npos);
}

TEST(JsonlReaderTest, MissingFile_OpenFails) {
    io::JsonlReader reader(fixtures_path() / "absent.jsonl");

    EXPECT_FALSE(reader.open());
    ASSERT_TRUE(reader.last_error().has_value());
    EXPECT_EQ(reader.last_error()->message, "could not open file");
}

TEST(CorpusTest, JsonlSource_LoadsFixture) {
    JsonlCaseSource source(fixtures_path() / "corpus.jsonl");

    auto loaded = source.load();

    ASSERT_TRUE(loaded) << loaded.error;
    EXPECT_EQ(loaded.count, 4u);
    ASSERT_EQ(source.count(), 4u);
    const auto& cases = source.cases();
    EXPECT_EQ(cases[0].case_id, "2023가합1001");
    EXPECT_EQ(cases[0].year, 2023);
    EXPECT_EQ(cases[1].year, 2023);  // строковый год
    EXPECT_EQ(cases[1].format_type, "txt");
    EXPECT_EQ(cases[3].case_id, "case_5");
    EXPECT_EQ(cases[3].court_type, "대법원");
}

TEST(CorpusTest, JsonlSource_MalformedFile_LoadsNothing) {
    JsonlCaseSource source(fixtures_path() / "malformed.jsonl");

    auto loaded = source.load();

    EXPECT_FALSE(loaded);
    EXPECT_EQ(source.count(), 0u);
}

TEST(CorpusTest, Fetch_OffsetAndLimit) {
    MemoryCaseSource source({make_case("a", "지방법원", "민사", 2023),
                             make_case("b", "지방법원", "민사", 2023),
                             make_case("c", "지방법원", "민사", 2023)});

    auto middle = source.fetch(1, 1);
    auto tail = source.fetch(2, 10);
    auto past_end = source.fetch(5, 1);

    ASSERT_EQ(middle.size(), 1u);
    EXPECT_EQ(middle[0].case_id, "b");
    EXPECT_EQ(tail.size(), 1u);
    EXPECT_TRUE(past_end.empty());
}

TEST(CorpusTest, StratifiedSample_CoversGroupsFirst) {
    JsonlCaseSource source(fixtures_path() / "corpus.jsonl");
    ASSERT_TRUE(source.load());

    auto sample = source.stratified_sample(3, Strata::defaults());

    ASSERT_EQ(sample.size(), 3u);
    EXPECT_EQ(sample[0].case_id, "2023노2002");
    EXPECT_EQ(sample[1].case_id, "2023가합1001");
    EXPECT_EQ(sample[2].case_id, "2022구합3003");
}

TEST(CorpusTest, StratifiedSample_FillsFromOutsideStrata) {
    JsonlCaseSource source(fixtures_path() / "corpus.jsonl");
    ASSERT_TRUE(source.load());

    auto sample = source.stratified_sample(10, Strata::defaults());

    ASSERT_EQ(sample.size(), 4u);
    EXPECT_EQ(sample.back().case_id, "case_5");
}

TEST(CorpusTest, StratifiedSample_RoundRobinAcrossGroups) {
    MemoryCaseSource source({make_case("c1", "지방법원", "민사", 2023),
                             make_case("c2", "지방법원", "민사", 2023),
                             make_case("c3", "지방법원", "민사", 2023),
                             make_case("h1", "고등법원", "형사", 2022)});

    auto sample = source.stratified_sample(2, Strata::defaults());

    ASSERT_EQ(sample.size(), 2u);
    EXPECT_EQ(sample[0].case_id, "h1");
    EXPECT_EQ(sample[1].case_id, "c1");
}

TEST(CorpusTest, StratifiedSample_Deterministic) {
    JsonlCaseSource source(fixtures_path() / "corpus.jsonl");
    ASSERT_TRUE(source.load());

    auto first = source.stratified_sample(2, Strata::defaults());
    auto second = source.stratified_sample(2, Strata::defaults());

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].case_id, second[i].case_id);
    }
}

TEST(CorpusTest, DiversityScore) {
    EXPECT_DOUBLE_EQ(diversity_score({}), 0.0);
    EXPECT_DOUBLE_EQ(diversity_score({make_case("a", "지방법원", "민사", 2023),
                                      make_case("b", "고등법원", "형사", 2022)}),
                     6.0 / 15.0);
}

TEST(CorpusTest, ToMetadata_ExcludesContent) {
    auto meta = make_case("a", "지방법원", "민사", 2023).to_metadata();

    ASSERT_NE(meta.get("case_id"), nullptr);
    EXPECT_EQ(*meta.get("case_id")->get_string(), "a");
    EXPECT_DOUBLE_EQ(meta.get("year")->to_double(), 2023.0);
    EXPECT_FALSE(meta.contains("content"));
}

}  // namespace lexrefine::corpus::test
