// ==============================================================================
// test_store_gtest.cpp - Тесты RuleStore, persistence и VersionManager
// ==============================================================================

#include <lexrefine/platform.hpp>
#include <lexrefine/rule.hpp>
#include <lexrefine/store.hpp>
#include <lexrefine/version.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace lexrefine::store::test {

using rule::make_rule;
using rule::Rule;
using rule::RuleType;

namespace {

std::filesystem::path make_temp_dir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() /
               ("lexrefine_" + name + "_" +
                std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::filesystem::create_directories(dir);
    return dir;
}

std::vector<Rule> sample_rules() {
    return {
        make_rule("page", RuleType::NoiseRemoval, R"(페이지\s*\d+)", "", 100, "page numbers"),
        make_rule("ws", RuleType::PostNormalize, R"(\s{2,})", " ", 50),
    };
}

}  // namespace

// ==============================================================================
// Persistence
// ==============================================================================

TEST(PersistenceTest, Memory_EmptyByDefault) {
    MemoryPersistence persistence;

    EXPECT_FALSE(persistence.load_latest_version().has_value());
    EXPECT_EQ(persistence.save_count(), 0u);
}

TEST(PersistenceTest, Memory_FailNextSave_ThrowsOnceThenRecovers) {
    MemoryPersistence persistence;
    persistence.fail_next_save("disk full");

    EXPECT_THROW(persistence.save_version(RuleSet{"v1.0.0", {}}), PersistenceError);
    EXPECT_NO_THROW(persistence.save_version(RuleSet{"v1.0.0", {}}));
    EXPECT_EQ(persistence.save_count(), 1u);
}

TEST(PersistenceTest, JsonFile_SaveAndLoadPreservesFields) {
    auto dir = make_temp_dir("json_store");
    JsonFilePersistence persistence(dir / "rules.json");
    RuleSet set{"v1.3.0", sample_rules()};
    set.rules[0].usage_count = 42;
    set.rules[0].performance_score = 0.75;
    set.rules[1].enabled = false;

    persistence.save_version(set);
    auto loaded = persistence.load_latest_version();

    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->version, "v1.3.0");
    ASSERT_EQ(loaded->rules.size(), 2u);
    EXPECT_EQ(loaded->rules[0].rule_id, "page");
    EXPECT_EQ(loaded->rules[0].pattern, R"(페이지\s*\d+)");
    EXPECT_EQ(loaded->rules[0].description, "page numbers");
    EXPECT_EQ(loaded->rules[0].usage_count, 42u);
    EXPECT_DOUBLE_EQ(loaded->rules[0].performance_score, 0.75);
    EXPECT_EQ(loaded->rules[1].type, RuleType::PostNormalize);
    EXPECT_EQ(loaded->rules[1].replacement, " ");
    EXPECT_FALSE(loaded->rules[1].enabled);

    std::filesystem::remove_all(dir);
}

TEST(PersistenceTest, JsonFile_MissingFile_ReturnsNullopt) {
    auto dir = make_temp_dir("json_missing");
    JsonFilePersistence persistence(dir / "nothing.json");

    EXPECT_FALSE(persistence.load_latest_version().has_value());

    std::filesystem::remove_all(dir);
}

TEST(PersistenceTest, Deserialize_Malformed_ThrowsPersistenceError) {
    EXPECT_THROW(deserialize_rule_set("{not json"), PersistenceError);
    EXPECT_THROW(deserialize_rule_set("[]"), PersistenceError);
    EXPECT_THROW(deserialize_rule_set(R"({"version":"v1.0.0"})"), PersistenceError);
    EXPECT_THROW(deserialize_rule_set(
                     R"({"version":"v1.0.0","rules":[{"rule_id":"a","type":"bogus","pattern":"x"}]})"),
                 PersistenceError);
}

// ==============================================================================
// Similarity
// ==============================================================================

TEST(SimilarityTest, Keywords_StripMetaAndShortTokens) {
    auto words = pattern_keywords(R"(Header\s+(text)|a)");

    EXPECT_EQ(words.count("header"), 1u);
    EXPECT_EQ(words.count("text"), 1u);
    EXPECT_EQ(words.count("a"), 0u);
    EXPECT_EQ(words.count("s"), 0u);
}

TEST(SimilarityTest, Jaccard) {
    EXPECT_DOUBLE_EQ(pattern_similarity("header text", "header text"), 1.0);
    EXPECT_DOUBLE_EQ(pattern_similarity("header text", "header body"), 1.0 / 3.0);
    EXPECT_DOUBLE_EQ(pattern_similarity(R"(\d+)", "header"), 0.0);
}

// ==============================================================================
// RuleStore
// ==============================================================================

TEST(RuleStoreTest, LoadLatest_EmptyPersistence_DefaultVersion) {
    MemoryPersistence persistence;
    RuleStore store(persistence);

    auto set = store.load_latest();

    EXPECT_EQ(set->version, "v1.0.0");
    EXPECT_TRUE(set->rules.empty());
}

TEST(RuleStoreTest, LoadLatest_ReadsStoredSnapshot) {
    MemoryPersistence persistence(RuleSet{"v2.1.0", sample_rules()});
    RuleStore store(persistence);

    store.load_latest();

    EXPECT_EQ(store.version(), "v2.1.0");
    EXPECT_EQ(store.snapshot()->enabled_count(), 2u);
}

TEST(RuleStoreTest, ReplaceAll_PersistsAndSwapsSnapshot) {
    MemoryPersistence persistence;
    RuleStore store(persistence);
    auto before = store.snapshot();

    store.replace_all(sample_rules(), "v1.1.0");

    EXPECT_EQ(store.version(), "v1.1.0");
    EXPECT_EQ(store.snapshot()->rules.size(), 2u);
    EXPECT_EQ(persistence.save_count(), 1u);
    // Старый снимок не меняется у тех, кто его держит
    EXPECT_TRUE(before->rules.empty());
}

TEST(RuleStoreTest, ReplaceAll_PersistenceFailure_StateUnchanged) {
    MemoryPersistence persistence;
    RuleStore store(persistence);
    store.replace_all(sample_rules(), "v1.1.0");
    persistence.fail_next_save("read-only");

    EXPECT_THROW(store.replace_all({}, "v1.2.0"), PersistenceError);

    EXPECT_EQ(store.version(), "v1.1.0");
    EXPECT_EQ(store.snapshot()->rules.size(), 2u);
}

TEST(RuleStoreTest, ResetInMemory_RestoresSnapshotWithoutSaving) {
    MemoryPersistence persistence;
    RuleStore store(persistence);
    store.replace_all(sample_rules(), "v1.1.0");
    auto before = store.snapshot();
    store.upsert_one(make_rule("hdr", RuleType::NoiseRemoval, "머리글", "", 10));
    std::size_t saves = persistence.save_count();

    store.reset_in_memory(before);

    EXPECT_EQ(store.snapshot()->rules.size(), 2u);
    EXPECT_FALSE(store.find("hdr").has_value());
    EXPECT_EQ(persistence.save_count(), saves);
}

TEST(MemoryPersistenceTest, FailSaveIf_FailsOnlyMatchingSave) {
    MemoryPersistence persistence;
    persistence.fail_save_if([](const RuleSet& set) { return set.version == "v1.2.0"; },
                             "read-only");

    EXPECT_NO_THROW(persistence.save_version(RuleSet{"v1.1.0", {}}));
    EXPECT_THROW(persistence.save_version(RuleSet{"v1.2.0", {}}), PersistenceError);
    EXPECT_NO_THROW(persistence.save_version(RuleSet{"v1.2.0", {}}));
    EXPECT_EQ(persistence.save_count(), 2u);
}

TEST(RuleStoreTest, UpsertOne_InsertsThenReplaces) {
    MemoryPersistence persistence;
    RuleStore store(persistence);
    store.replace_all(sample_rules(), "v1.1.0");

    store.upsert_one(make_rule("hdr", RuleType::NoiseRemoval, "머리글", "", 10));
    Rule updated = *store.find("page");
    updated.priority = 1;
    store.upsert_one(updated);

    EXPECT_EQ(store.snapshot()->rules.size(), 3u);
    EXPECT_EQ(store.find("page")->priority, 1);
    EXPECT_EQ(store.version(), "v1.1.0");
}

TEST(RuleStoreTest, FindDuplicate_ExactPatternSameType) {
    MemoryPersistence persistence;
    RuleStore store(persistence);
    store.replace_all(sample_rules(), "v1.1.0");

    auto dup = store.find_duplicate(
        make_rule("page_copy", RuleType::NoiseRemoval, R"(페이지\s*\d+)", "", 1));
    auto other_type = store.find_duplicate(
        make_rule("page_norm", RuleType::PostNormalize, R"(페이지\s*\d+)", "", 1));
    auto self = store.find_duplicate(
        make_rule("page", RuleType::NoiseRemoval, R"(페이지\s*\d+)", "", 1));

    ASSERT_TRUE(dup.has_value());
    EXPECT_EQ(dup->rule_id, "page");
    EXPECT_FALSE(other_type.has_value());
    EXPECT_FALSE(self.has_value());
}

TEST(RuleStoreTest, FindDuplicate_SimilarAboveThreshold) {
    MemoryPersistence persistence;
    RuleStore store(persistence, 0.5);
    store.replace_all({make_rule("hdr", RuleType::NoiseRemoval, "court header text", "", 10)},
                      "v1.1.0");

    auto similar = store.find_duplicate(
        make_rule("hdr2", RuleType::NoiseRemoval, "court header", "", 10));
    auto distinct = store.find_duplicate(
        make_rule("foot", RuleType::NoiseRemoval, "footer line", "", 10));

    EXPECT_TRUE(similar.has_value());
    EXPECT_FALSE(distinct.has_value());
}

TEST(RuleStoreTest, FindDuplicate_IgnoresDisabledRules) {
    MemoryPersistence persistence;
    RuleStore store(persistence);
    store.replace_all(sample_rules(), "v1.1.0");
    ASSERT_TRUE(store.disable("page"));

    auto dup = store.find_duplicate(
        make_rule("page_copy", RuleType::NoiseRemoval, R"(페이지\s*\d+)", "", 1));

    EXPECT_FALSE(dup.has_value());
}

TEST(RuleStoreTest, FindByPattern_EnabledOnly) {
    MemoryPersistence persistence;
    RuleStore store(persistence);
    store.replace_all(sample_rules(), "v1.1.0");

    EXPECT_TRUE(store.find_by_pattern(RuleType::PostNormalize, R"(\s{2,})").has_value());
    EXPECT_FALSE(store.find_by_pattern(RuleType::NoiseRemoval, R"(\s{2,})").has_value());
    store.disable("ws");
    EXPECT_FALSE(store.find_by_pattern(RuleType::PostNormalize, R"(\s{2,})").has_value());
}

TEST(RuleStoreTest, Disable_KeepsRuleAndReportsMissing) {
    MemoryPersistence persistence;
    RuleStore store(persistence);
    store.replace_all(sample_rules(), "v1.1.0");

    EXPECT_TRUE(store.disable("page"));
    EXPECT_FALSE(store.disable("missing"));

    ASSERT_TRUE(store.find("page").has_value());
    EXPECT_FALSE(store.find("page")->enabled);
    EXPECT_EQ(store.snapshot()->rules.size(), 2u);
    EXPECT_EQ(store.snapshot()->enabled_count(), 1u);
}

TEST(RuleStoreTest, RecordUsage_AccumulatesCounts) {
    MemoryPersistence persistence;
    RuleStore store(persistence);
    store.replace_all(sample_rules(), "v1.1.0");
    std::size_t saves = persistence.save_count();

    store.record_usage({{"page", 3}, {"unknown", 5}});
    store.record_usage({{"page", 2}});
    store.record_usage({});

    EXPECT_EQ(store.find("page")->usage_count, 5u);
    EXPECT_EQ(store.find("ws")->usage_count, 0u);
    EXPECT_EQ(persistence.save_count(), saves + 2);
}

}  // namespace lexrefine::store::test

namespace lexrefine::version::test {

using rule::make_rule;
using rule::RuleType;

TEST(VersionTest, ParseVersion_ValidAndInvalid) {
    SemVer v = parse_version("v1.12.3");

    EXPECT_EQ(v.major, 1);
    EXPECT_EQ(v.minor, 12);
    EXPECT_EQ(v.patch, 3);
    EXPECT_EQ(v.to_string(), "v1.12.3");
    EXPECT_THROW(parse_version("1.2.3"), std::invalid_argument);
    EXPECT_THROW(parse_version("v1.2"), std::invalid_argument);
    EXPECT_THROW(parse_version("v1.2.3-rc"), std::invalid_argument);
}

TEST(VersionTest, Bumped_ResetsLowerComponents) {
    SemVer v{1, 2, 3};

    EXPECT_EQ(v.bumped(Bump::Patch).to_string(), "v1.2.4");
    EXPECT_EQ(v.bumped(Bump::Minor).to_string(), "v1.3.0");
    EXPECT_EQ(v.bumped(Bump::Major).to_string(), "v2.0.0");
    EXPECT_TRUE(v < v.bumped(Bump::Patch));
}

TEST(VersionTest, ParseBump) {
    EXPECT_EQ(parse_bump("minor"), Bump::Minor);
    EXPECT_THROW(parse_bump("micro"), std::invalid_argument);
}

TEST(VersionManagerTest, IncrementAndPeek) {
    VersionManager versions;

    EXPECT_EQ(versions.peek_next(Bump::Minor), "v1.1.0");
    EXPECT_EQ(versions.current(), "v1.0.0");
    EXPECT_EQ(versions.increment_version(Bump::Minor), "v1.1.0");
    EXPECT_EQ(versions.increment_version(Bump::Patch), "v1.1.1");
    EXPECT_EQ(versions.current(), "v1.1.1");
}

TEST(VersionManagerTest, Tag_RecordsParentAndChecksum) {
    VersionManager versions;
    std::vector<rule::Rule> rules = {make_rule("a", RuleType::NoiseRemoval, "x", "", 1)};

    VersionRecord first = versions.tag(rules, "initial");
    VersionRecord second = versions.tag(rules, "no-op", Bump::Patch);

    EXPECT_EQ(first.version, "v1.1.0");
    EXPECT_EQ(first.parent_version, "v1.0.0");
    EXPECT_EQ(second.version, "v1.1.1");
    EXPECT_EQ(second.parent_version, "v1.1.0");
    EXPECT_EQ(first.checksum.size(), 16u);
    EXPECT_EQ(first.checksum, second.checksum);
    EXPECT_TRUE(VersionManager::verify(first));
    ASSERT_TRUE(versions.parent_of("v1.1.1").has_value());
    EXPECT_EQ(versions.parent_of("v1.1.1")->version, "v1.1.0");
    EXPECT_EQ(versions.history().size(), 2u);
}

TEST(VersionManagerTest, Checksum_IgnoresOrderAndUsage) {
    auto a = make_rule("a", RuleType::NoiseRemoval, "x", "", 1);
    auto b = make_rule("b", RuleType::PostNormalize, "y", " ", 2);
    auto a_used = a;
    a_used.usage_count = 99;

    EXPECT_EQ(checksum({a, b}), checksum({b, a}));
    EXPECT_EQ(checksum({a, b}), checksum({a_used, b}));

    auto a_changed = a;
    a_changed.pattern = "z";
    EXPECT_NE(checksum({a, b}), checksum({a_changed, b}));
}

TEST(VersionManagerTest, Verify_DetectsTampering) {
    VersionManager versions;
    VersionRecord record =
        versions.tag({make_rule("a", RuleType::NoiseRemoval, "x", "", 1)}, "initial");

    record.rules[0].replacement = "tampered";

    EXPECT_FALSE(VersionManager::verify(record));
}

TEST(VersionManagerTest, Restore_OnlyKnownVersions) {
    VersionManager versions;
    versions.tag({}, "one");
    versions.tag({}, "two");

    EXPECT_TRUE(versions.restore("v1.1.0"));
    EXPECT_EQ(versions.current(), "v1.1.0");
    EXPECT_FALSE(versions.restore("v9.0.0"));
    EXPECT_EQ(versions.current(), "v1.1.0");
}

TEST(VersionManagerTest, MarkStable_LatestStableWins) {
    VersionManager versions;
    versions.tag({}, "one");
    versions.tag({}, "two");
    versions.tag({}, "three");

    EXPECT_FALSE(versions.latest_stable().has_value());
    versions.mark_stable("v1.1.0", {{"quality", 0.9}});
    versions.mark_stable("v1.2.0", {{"quality", 0.95}});

    auto stable = versions.latest_stable();
    ASSERT_TRUE(stable.has_value());
    EXPECT_EQ(stable->version, "v1.2.0");
    EXPECT_DOUBLE_EQ(stable->performance_snapshot.at("quality"), 0.95);
}

TEST(VersionManagerTest, TagAfterRestore_NeverReusesVersion) {
    // Arrange
    VersionManager versions;
    std::vector<rule::Rule> rejected = {make_rule("bad", RuleType::NoiseRemoval, "머리글\\n.*", "", 1)};
    std::vector<rule::Rule> accepted = {make_rule("good", RuleType::NoiseRemoval, "머리글\\n", "", 1)};

    // Act
    VersionRecord failed = versions.tag(rejected, "candidate", Bump::Minor);
    ASSERT_TRUE(versions.restore("v1.0.0"));
    VersionRecord next = versions.tag(accepted, "candidate", Bump::Minor);
    versions.mark_stable(next.version, {{"quality", 0.9}});

    // Assert
    EXPECT_EQ(failed.version, "v1.1.0");
    EXPECT_EQ(next.version, "v1.2.0");
    EXPECT_EQ(next.parent_version, "v1.0.0");
    EXPECT_EQ(versions.highest(), "v1.2.0");
    EXPECT_EQ(versions.peek_next(Bump::Patch), "v1.2.1");

    auto history = versions.history();
    std::set<std::string> labels;
    for (const auto& r : history) {
        labels.insert(r.version);
    }
    EXPECT_EQ(labels.size(), history.size());

    EXPECT_FALSE(versions.find("v1.1.0")->is_stable);
    ASSERT_TRUE(versions.latest_stable().has_value());
    EXPECT_EQ(versions.latest_stable()->version, "v1.2.0");
    EXPECT_EQ(versions.latest_stable()->rules[0].rule_id, "good");
    EXPECT_EQ(versions.parent_of("v1.2.0")->version, "v1.0.0");
}

TEST(VersionManagerTest, RestoreOlder_IncrementContinuesFromHighest) {
    VersionManager versions;
    versions.tag({}, "one");
    versions.tag({}, "two");

    ASSERT_TRUE(versions.restore("v1.1.0"));

    EXPECT_EQ(versions.current(), "v1.1.0");
    EXPECT_EQ(versions.increment_version(Bump::Patch), "v1.2.1");
    EXPECT_EQ(versions.current(), "v1.2.1");
}

TEST(VersionManagerTest, Adopt_RegistersExistingVersion) {
    VersionManager versions;

    versions.adopt("v3.2.1", {make_rule("a", RuleType::NoiseRemoval, "x", "", 1)}, "loaded");

    EXPECT_EQ(versions.current(), "v3.2.1");
    ASSERT_TRUE(versions.find("v3.2.1").has_value());
    EXPECT_TRUE(versions.find("v3.2.1")->parent_version.empty());
    EXPECT_EQ(versions.tag({}, "next").version, "v3.3.0");
}

}  // namespace lexrefine::version::test
