// ==============================================================================
// test_config_gtest.cpp - Тесты загрузки YAML конфигурации
// ==============================================================================

#include <lexrefine/config.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>

namespace lexrefine::config::test {

namespace {

std::filesystem::path fixtures_path() {
    return std::filesystem::path(LEXREFINE_FIXTURES_DIR);
}

}  // namespace

TEST(ConfigTest, EmptyDocument_Defaults) {
    auto loaded = load_from_string("");

    ASSERT_TRUE(loaded) << loaded.error.format();
    const Config& c = loaded.config;
    EXPECT_FALSE(c.engine.fact_extraction_enabled);
    EXPECT_DOUBLE_EQ(c.patch.synthesis.threshold, 0.7);
    EXPECT_DOUBLE_EQ(c.orchestrator.auto_apply_threshold, 0.8);
    EXPECT_EQ(c.orchestrator.initial_batch_size, 50u);
    EXPECT_EQ(c.oscillation.max_changes, 2u);
    EXPECT_EQ(c.gates.performance_repeat, 1000u);
}

TEST(ConfigTest, LoadFixture_OverridesEverySection) {
    // Arrange
    auto path = fixtures_path() / "config.yml";

    // Act
    auto loaded = load(path);

    // Assert
    ASSERT_TRUE(loaded) << loaded.error.format();
    const Config& c = loaded.config;
    EXPECT_TRUE(c.engine.fact_extraction_enabled);
    EXPECT_DOUBLE_EQ(c.patch.synthesis.threshold, 0.6);
    EXPECT_DOUBLE_EQ(c.orchestrator.auto_apply_threshold, 0.9);
    EXPECT_EQ(c.oscillation.window, std::chrono::minutes(30));
    EXPECT_EQ(c.oscillation.cooldown, std::chrono::hours(12));
    EXPECT_EQ(c.oscillation.max_changes, 3u);
    EXPECT_DOUBLE_EQ(c.gates.min_nrr, 0.9);
    EXPECT_EQ(c.gates.performance_repeat, 10u);
    EXPECT_EQ(c.orchestrator.initial_batch_size, 4u);
    EXPECT_EQ(c.orchestrator.max_batch_size, 16u);
    EXPECT_EQ(c.orchestrator.max_concurrent_batch, 2u);
    EXPECT_EQ(c.orchestrator.stabilize_after, 2u);
    EXPECT_DOUBLE_EQ(c.orchestrator.dry_run.sample_fraction, 0.5);
    EXPECT_DOUBLE_EQ(c.orchestrator.dry_run.budget_usd, 100.0);
    EXPECT_EQ(c.orchestrator.checkpoint_path.string(), "/tmp/lexrefine_checkpoint.json");
    EXPECT_DOUBLE_EQ(c.orchestrator.rollback.degradation_ratio, 0.9);
}

TEST(ConfigTest, EvaluatorTimeout_SharedWithGates) {
    auto loaded = load(fixtures_path() / "config.yml");

    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.config.orchestrator.evaluator_timeout, std::chrono::milliseconds(500));
    EXPECT_EQ(loaded.config.gates.evaluator_timeout, std::chrono::milliseconds(500));
}

TEST(ConfigTest, OutOfRangeThreshold_Fails) {
    auto path = fixtures_path() / "bad_config.yml";

    auto loaded = load(path);

    EXPECT_FALSE(loaded);
    EXPECT_EQ(loaded.error.message, "patch.auto_apply_threshold must be within [0, 1]");
    EXPECT_EQ(loaded.error.format(),
              path.string() + ": patch.auto_apply_threshold must be within [0, 1]");
}

TEST(ConfigTest, MaxBatchBelowInitial_Fails) {
    auto loaded = load_from_string(
        "orchestrator:\n  initial_batch_size: 100\n  max_batch_size: 10\n");

    EXPECT_FALSE(loaded);
    EXPECT_EQ(loaded.error.message,
              "orchestrator.max_batch_size must not be less than initial_batch_size");
}

TEST(ConfigTest, ZeroOscillationWindow_Fails) {
    auto loaded = load_from_string("oscillation:\n  window_minutes: 0\n");

    EXPECT_FALSE(loaded);
    EXPECT_EQ(loaded.error.message, "oscillation.window_minutes must be positive");
}

TEST(ConfigTest, WrongValueType_Fails) {
    auto loaded = load_from_string("gates:\n  min_nrr: high\n", "inline.yml");

    EXPECT_FALSE(loaded);
    EXPECT_EQ(loaded.error.path, "inline.yml");
    EXPECT_FALSE(loaded.error.message.empty());
}

TEST(ConfigTest, NonMappingRoot_Fails) {
    auto loaded = load_from_string("- a\n- b\n");

    EXPECT_FALSE(loaded);
    EXPECT_EQ(loaded.error.message, "configuration must be a mapping");
}

TEST(ConfigTest, UnknownKeys_Ignored) {
    auto loaded = load_from_string("telemetry:\n  endpoint: x\npatch:\n  flavour: 1\n");

    EXPECT_TRUE(loaded) << loaded.error.format();
}

TEST(ConfigTest, MissingFile_Fails) {
    auto loaded = load(fixtures_path() / "absent.yml");

    EXPECT_FALSE(loaded);
    EXPECT_EQ(loaded.error.message, "config file does not exist");
}

TEST(ConfigTest, NonYamlExtension_Fails) {
    auto loaded = load(fixtures_path() / "corpus.jsonl");

    EXPECT_FALSE(loaded);
    EXPECT_EQ(loaded.error.message, "config must have a yaml file extension");
}

}  // namespace lexrefine::config::test
