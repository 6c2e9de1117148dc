// ==============================================================================
// test_oscillation_gtest.cpp - Тесты OscillationGuard на управляемых часах
// ==============================================================================

#include <lexrefine/oscillation.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <ctime>

namespace lexrefine::patch::test {

namespace {

/// Часы, которые двигает тест
struct ManualClock {
    TimePoint now = std::chrono::system_clock::from_time_t(1700000000);

    Clock clock() {
        return [this]() { return now; };
    }
};

OscillationOptions small_window() {
    OscillationOptions options;
    options.window = std::chrono::minutes(60);
    options.cooldown = std::chrono::hours(24);
    options.max_changes = 2;
    return options;
}

}  // namespace

TEST(OscillationTest, FreshArea_NotBlocked) {
    ManualClock clock;
    OscillationGuard guard(small_window(), clock.clock());

    EXPECT_FALSE(guard.check_oscillation("noise_removal"));
    EXPECT_FALSE(guard.is_frozen("noise_removal"));
    EXPECT_EQ(guard.recent_changes("noise_removal"), 0u);
}

TEST(OscillationTest, MaxChangesInWindow_Freezes) {
    ManualClock clock;
    OscillationGuard guard(small_window(), clock.clock());

    guard.track_change("noise_removal");
    EXPECT_FALSE(guard.check_oscillation("noise_removal"));
    clock.now += std::chrono::minutes(10);
    guard.track_change("noise_removal");

    EXPECT_EQ(guard.recent_changes("noise_removal"), 2u);
    EXPECT_TRUE(guard.check_oscillation("noise_removal"));
    EXPECT_TRUE(guard.is_frozen("noise_removal"));
}

TEST(OscillationTest, AreasAreIndependent) {
    ManualClock clock;
    OscillationGuard guard(small_window(), clock.clock());

    guard.track_change("noise_removal");
    guard.track_change("noise_removal");

    EXPECT_TRUE(guard.check_oscillation("noise_removal"));
    EXPECT_FALSE(guard.check_oscillation("post_normalize"));
}

TEST(OscillationTest, ChangesOutsideWindow_Expire) {
    ManualClock clock;
    OscillationGuard guard(small_window(), clock.clock());

    guard.track_change("legal_filtering");
    clock.now += std::chrono::minutes(61);
    guard.track_change("legal_filtering");

    EXPECT_EQ(guard.recent_changes("legal_filtering"), 1u);
    EXPECT_FALSE(guard.check_oscillation("legal_filtering"));
}

TEST(OscillationTest, Cooldown_ExpiresAfterPeriod) {
    ManualClock clock;
    OscillationGuard guard(small_window(), clock.clock());
    guard.track_change("noise_removal");
    guard.track_change("noise_removal");
    ASSERT_TRUE(guard.check_oscillation("noise_removal"));

    clock.now += std::chrono::hours(23);
    EXPECT_TRUE(guard.check_oscillation("noise_removal"));

    clock.now += std::chrono::hours(2);
    EXPECT_FALSE(guard.is_frozen("noise_removal"));
    // Старые изменения уже вне окна
    EXPECT_FALSE(guard.check_oscillation("noise_removal"));
}

TEST(OscillationTest, Unfreeze_ClearsFreezeAndWindow) {
    ManualClock clock;
    OscillationGuard guard(small_window(), clock.clock());
    guard.track_change("noise_removal");
    guard.track_change("noise_removal");
    ASSERT_TRUE(guard.check_oscillation("noise_removal"));

    guard.unfreeze("noise_removal");

    EXPECT_FALSE(guard.is_frozen("noise_removal"));
    EXPECT_EQ(guard.recent_changes("noise_removal"), 0u);
    EXPECT_FALSE(guard.check_oscillation("noise_removal"));
}

TEST(OscillationTest, Defaults) {
    OscillationGuard guard;

    EXPECT_EQ(guard.options().window, std::chrono::minutes(60));
    EXPECT_EQ(guard.options().cooldown, std::chrono::hours(24));
    EXPECT_EQ(guard.options().max_changes, 2u);
}

}  // namespace lexrefine::patch::test
