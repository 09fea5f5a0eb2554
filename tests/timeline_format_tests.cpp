#include <gtest/gtest.h>

#include <array>
#include <limits>

#include "api/timeline_format.hpp"

namespace {

TEST(TimelineFormatTest, PositionLabels) {
    EXPECT_EQ(api::format_position_ms(0.0), "0ms");
    EXPECT_EQ(api::format_position_ms(640.0), "640ms");
    EXPECT_EQ(api::format_position_ms(12'500.0), "12.5s");
    EXPECT_EQ(api::format_position_ms(65'000.0), "1:05");
    EXPECT_EQ(api::format_position_ms(119'600.0), "2:00");
}

TEST(TimelineFormatTest, PositionClampsInvalid) {
    EXPECT_EQ(api::format_position_ms(-5.0), "0ms");
    EXPECT_EQ(api::format_position_ms(std::numeric_limits<double>::quiet_NaN()), "0ms");
}

TEST(TimelineFormatTest, CostLabels) {
    EXPECT_EQ(api::format_cost(0.0), "<$0.001");
    EXPECT_EQ(api::format_cost(0.0004), "<$0.001");
    EXPECT_EQ(api::format_cost(0.0123), "$0.0123");
    EXPECT_EQ(api::format_cost(2.5), "$2.5000");
}

TEST(TimelineFormatTest, DurationLabels) {
    EXPECT_EQ(api::format_duration(std::nullopt), "-");
    EXPECT_EQ(api::format_duration(850), "850ms");
    EXPECT_EQ(api::format_duration(42'000), "42s");
    EXPECT_EQ(api::format_duration(185'000), "3m 5s");
    EXPECT_EQ(api::format_duration(120'000), "2m");
    EXPECT_EQ(api::format_duration(7'800'000), "2h 10m");
    EXPECT_EQ(api::format_duration(3'600'000), "1h");
}

TEST(TimelineFormatTest, SpeedLabels) {
    EXPECT_EQ(api::format_speed(1.0), "1x");
    EXPECT_EQ(api::format_speed(4.0), "4x");
    EXPECT_EQ(api::format_speed(1.5), "1.5x");
}

TEST(TimelineFormatTest, SpeedPresetList) {
    const std::array<double, 4> presets{1.0, 2.0, 4.0, 8.0};
    EXPECT_EQ(api::format_speed_presets(presets), "1x 2x 4x 8x");
    EXPECT_EQ(api::format_speed_presets({}), "");
}

} // namespace
