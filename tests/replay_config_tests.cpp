#include <gtest/gtest.h>

#include <chrono>
#include <type_traits>

#include "core/replay_config.hpp"

namespace {

TEST(ReplayConfigTest, DefaultValues) {
    const core::ReplayConfig config{};

    EXPECT_DOUBLE_EQ(config.initial_speed, 1.0);
    EXPECT_DOUBLE_EQ(config.step_epsilon_ms, 1.0);
    EXPECT_DOUBLE_EQ(config.nudge_ms, 500.0);
    EXPECT_EQ(config.frame_interval, std::chrono::milliseconds(16));

    ASSERT_EQ(config.speed_presets.size(), 4u);
    EXPECT_DOUBLE_EQ(config.speed_presets[0], 1.0);
    EXPECT_DOUBLE_EQ(config.speed_presets[1], 2.0);
    EXPECT_DOUBLE_EQ(config.speed_presets[2], 4.0);
    EXPECT_DOUBLE_EQ(config.speed_presets[3], 8.0);
}

TEST(ReplayConfigTest, IsTriviallyCopyable) {
    static_assert(std::is_trivially_copyable_v<core::ReplayConfig>,
                  "ReplayConfig must be trivially copyable");
}

TEST(ReplayConfigTest, DefaultReplayConfigFunction) {
    constexpr auto config = core::default_replay_config();

    EXPECT_DOUBLE_EQ(config.initial_speed, 1.0);
    EXPECT_DOUBLE_EQ(config.nudge_ms, 500.0);
    EXPECT_EQ(config.frame_interval.count(), 16);
}

// Presets are ascending so hosts can cycle through them
TEST(ReplayConfigTest, SpeedPresetsAscending) {
    const auto config = core::default_replay_config();
    for (std::size_t i = 1; i < config.speed_presets.size(); ++i) {
        EXPECT_GT(config.speed_presets[i], config.speed_presets[i - 1]);
    }
}

TEST(ReplayConfigTest, CustomValues) {
    core::ReplayConfig config{};
    config.initial_speed = 2.0;
    config.step_epsilon_ms = 0.5;
    config.nudge_ms = 1000.0;
    config.frame_interval = std::chrono::milliseconds(33);

    EXPECT_DOUBLE_EQ(config.initial_speed, 2.0);
    EXPECT_DOUBLE_EQ(config.step_epsilon_ms, 0.5);
    EXPECT_DOUBLE_EQ(config.nudge_ms, 1000.0);
    EXPECT_EQ(config.frame_interval, std::chrono::milliseconds(33));
}

} // namespace
