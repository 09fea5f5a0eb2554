#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <memory>
#include <string>

#include "api/replay_controller.hpp"
#include "core/timeline_data.hpp"
#include "harness/fake_clock.hpp"
#include "harness/timeline_builder.hpp"
#include "util/frame_loop.hpp"

namespace {

using api::ReplayController;

std::shared_ptr<const core::TimelineData> two_step_data() {
    test::TimelineBuilder b;
    b.step(0, 400, "read_file").step(400, 1000, "write_file").lines(5);
    return core::make_timeline_data(b.steps(), b.transcript(), 1000, 10.0);
}

class ReplayControllerTest : public ::testing::Test {
protected:
    void frame(int ms) {
        clock_.advance(std::chrono::milliseconds(ms));
        loop_.run_frame();
    }

    test::FakeSteadyClock clock_{};
    util::FrameLoop loop_{clock_};
    ReplayController ctl_{two_step_data(), loop_, clock_};
};

TEST_F(ReplayControllerTest, StartsAtZeroStopped) {
    const auto st = ctl_.state();
    EXPECT_DOUBLE_EQ(st.current_ms, 0.0);
    EXPECT_DOUBLE_EQ(st.total_ms, 1000.0);
    EXPECT_FALSE(st.is_playing);
    EXPECT_DOUBLE_EQ(st.speed, 1.0);
    EXPECT_EQ(st.tool_steps().size(), 2u);
    EXPECT_EQ(st.all_lines().size(), 5u);
    EXPECT_FALSE(st.fork_point.has_value());
}

TEST_F(ReplayControllerTest, ScrubClampsToRange) {
    ctl_.scrub_to(-100.0);
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 0.0);
    ctl_.scrub_to(1100.0);
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 1000.0);
}

TEST_F(ReplayControllerTest, ScrubIgnoresNaN) {
    ctl_.scrub_to(300.0);
    ctl_.scrub_to(std::numeric_limits<double>::quiet_NaN());
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 300.0);
}

TEST_F(ReplayControllerTest, ScrubIsIdempotent) {
    ctl_.scrub_to(250.0);
    const auto first = ctl_.state();
    ctl_.scrub_to(250.0);
    const auto second = ctl_.state();

    EXPECT_EQ(first.visible_lines, second.visible_lines);
    EXPECT_EQ(first.completed_steps, second.completed_steps);
    EXPECT_EQ(first.active_step, second.active_step);
    EXPECT_EQ(first.pending_steps, second.pending_steps);
    EXPECT_DOUBLE_EQ(first.accumulated_cost, second.accumulated_cost);
}

TEST_F(ReplayControllerTest, StateAtMidFirstStep) {
    ctl_.scrub_to(200.0);
    const auto st = ctl_.state();

    ASSERT_TRUE(st.active_step.has_value());
    EXPECT_EQ(st.active_step->step_index, 0);
    EXPECT_TRUE(st.completed_steps.empty());
    ASSERT_EQ(st.pending_steps.size(), 1u);
    EXPECT_EQ(st.pending_steps[0].step_index, 1);
    EXPECT_NEAR(st.accumulated_cost, 2.5, 1e-9);
    EXPECT_DOUBLE_EQ(st.total_cost, 10.0);
    // lines at 0 and 250 are not both visible yet; only line 0
    EXPECT_EQ(st.visible_lines.size(), 1u);
}

TEST_F(ReplayControllerTest, StateAtEnd) {
    ctl_.jump_to_end();
    const auto st = ctl_.state();

    EXPECT_EQ(st.completed_steps.size(), 2u);
    EXPECT_FALSE(st.active_step.has_value());
    EXPECT_TRUE(st.pending_steps.empty());
    EXPECT_DOUBLE_EQ(st.accumulated_cost, 10.0);
    EXPECT_EQ(st.visible_lines.size(), 5u);
}

TEST_F(ReplayControllerTest, StepForwardVisitsBoundaries) {
    EXPECT_TRUE(ctl_.step_forward());
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 400.0);
    EXPECT_TRUE(ctl_.step_forward());
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 1000.0);
    EXPECT_FALSE(ctl_.step_forward());
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 1000.0);
}

TEST_F(ReplayControllerTest, StepBackwardVisitsBoundaries) {
    ctl_.jump_to_end();
    EXPECT_TRUE(ctl_.step_backward());
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 400.0);
    EXPECT_TRUE(ctl_.step_backward());
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 0.0);
    EXPECT_FALSE(ctl_.step_backward());
}

// Within the epsilon of a boundary, stepping moves past it
TEST_F(ReplayControllerTest, StepSkipsBoundaryWithinEpsilon) {
    ctl_.scrub_to(399.5);
    EXPECT_TRUE(ctl_.step_forward());
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 1000.0);
}

TEST_F(ReplayControllerTest, StepBetweenBoundaries) {
    ctl_.scrub_to(700.0);
    EXPECT_TRUE(ctl_.step_backward());
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 400.0);
}

TEST_F(ReplayControllerTest, NudgeMovesByConfiguredAmount) {
    ctl_.nudge_forward();
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 500.0);
    ctl_.nudge_forward();
    ctl_.nudge_forward();
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 1000.0);
    ctl_.nudge_backward();
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 500.0);
}

TEST_F(ReplayControllerTest, PlaybackAdvancesPosition) {
    ctl_.play();
    EXPECT_TRUE(ctl_.is_playing());
    frame(100);
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 100.0);
    ASSERT_TRUE(ctl_.set_speed(2.0));
    frame(100);
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 300.0);
}

TEST_F(ReplayControllerTest, PlaybackFromNearEndStops) {
    ctl_.scrub_to(900.0);
    ctl_.play();
    for (int i = 0; i < 8; ++i) {
        frame(16);
    }
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 1000.0);
    EXPECT_FALSE(ctl_.is_playing());
}

// Scrubbing while playing keeps playback running from the new position
TEST_F(ReplayControllerTest, ScrubDuringPlaybackIsHonoured) {
    ctl_.play();
    frame(50);
    ctl_.scrub_to(800.0);
    EXPECT_TRUE(ctl_.is_playing());
    frame(50);
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 850.0);
}

TEST_F(ReplayControllerTest, JumpsStopPlayback) {
    ctl_.play();
    frame(100);
    ctl_.jump_to_start();
    EXPECT_FALSE(ctl_.is_playing());
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 0.0);
    EXPECT_EQ(loop_.pending(), 0u);

    ctl_.play();
    ctl_.jump_to_end();
    EXPECT_FALSE(ctl_.is_playing());
    EXPECT_DOUBLE_EQ(ctl_.current_ms(), 1000.0);
}

TEST_F(ReplayControllerTest, TogglePlay) {
    ctl_.toggle_play();
    EXPECT_TRUE(ctl_.state().is_playing);
    ctl_.toggle_play();
    EXPECT_FALSE(ctl_.state().is_playing);
}

TEST_F(ReplayControllerTest, InvalidSpeedKeepsCurrent) {
    ASSERT_TRUE(ctl_.set_speed(4.0));
    EXPECT_FALSE(ctl_.set_speed(0.0));
    EXPECT_DOUBLE_EQ(ctl_.speed(), 4.0);
}

TEST_F(ReplayControllerTest, CycleSpeedWalksPresets) {
    EXPECT_DOUBLE_EQ(ctl_.cycle_speed(), 2.0);
    EXPECT_DOUBLE_EQ(ctl_.cycle_speed(), 4.0);
    EXPECT_DOUBLE_EQ(ctl_.cycle_speed(), 8.0);
    EXPECT_DOUBLE_EQ(ctl_.cycle_speed(), 1.0);
    EXPECT_DOUBLE_EQ(ctl_.speed(), 1.0);
}

// An off-preset speed moves to the next preset above it
TEST_F(ReplayControllerTest, CycleSpeedFromCustomSpeed) {
    ASSERT_TRUE(ctl_.set_speed(3.0));
    EXPECT_DOUBLE_EQ(ctl_.cycle_speed(), 4.0);
    ASSERT_TRUE(ctl_.set_speed(16.0));
    EXPECT_DOUBLE_EQ(ctl_.cycle_speed(), 1.0);
}

TEST_F(ReplayControllerTest, ForkPointSetAndClear) {
    EXPECT_TRUE(ctl_.set_fork_point(1));
    EXPECT_EQ(ctl_.state().fork_point, std::optional<core::StepIndex>(1));
    EXPECT_TRUE(ctl_.set_fork_point(std::nullopt));
    EXPECT_FALSE(ctl_.fork_point().has_value());
}

TEST_F(ReplayControllerTest, ForkPointRejectsUnknownStep) {
    ASSERT_TRUE(ctl_.set_fork_point(0));
    EXPECT_FALSE(ctl_.set_fork_point(7));
    EXPECT_EQ(ctl_.fork_point(), std::optional<core::StepIndex>(0));
}

TEST_F(ReplayControllerTest, ToggleForkPoint) {
    EXPECT_TRUE(ctl_.toggle_fork_point(1));
    EXPECT_EQ(ctl_.fork_point(), std::optional<core::StepIndex>(1));
    EXPECT_TRUE(ctl_.toggle_fork_point(1));
    EXPECT_FALSE(ctl_.fork_point().has_value());
    EXPECT_TRUE(ctl_.toggle_fork_point(0));
    EXPECT_TRUE(ctl_.toggle_fork_point(1));
    EXPECT_EQ(ctl_.fork_point(), std::optional<core::StepIndex>(1));
}

// Snapshots are detached from the session
TEST_F(ReplayControllerTest, SnapshotSurvivesLaterScrub) {
    ctl_.scrub_to(200.0);
    const auto before = ctl_.state();
    ctl_.jump_to_end();
    EXPECT_DOUBLE_EQ(before.current_ms, 200.0);
    ASSERT_TRUE(before.active_step.has_value());
    EXPECT_EQ(before.active_step->tool_name, "read_file");
}

TEST_F(ReplayControllerTest, DestructionCancelsPlayback) {
    auto other = std::make_unique<ReplayController>(two_step_data(), loop_, clock_);
    other->play();
    EXPECT_EQ(loop_.pending(), 1u);
    other.reset();
    EXPECT_EQ(loop_.pending(), 0u);
}

TEST(ReplayControllerSharingTest, SessionsShareInputsButNotPosition) {
    test::FakeSteadyClock clock;
    util::FrameLoop loop(clock);
    const auto data = two_step_data();

    ReplayController a(data, loop, clock);
    ReplayController b(data, loop, clock);
    a.scrub_to(700.0);
    ASSERT_TRUE(b.set_fork_point(0));

    EXPECT_DOUBLE_EQ(b.current_ms(), 0.0);
    EXPECT_FALSE(a.fork_point().has_value());
    EXPECT_EQ(a.data().get(), b.data().get());
    EXPECT_EQ(a.state().data.get(), data.get());
}

TEST(ReplayControllerRawInputTest, NoStepsCostIsTimeProportional) {
    test::FakeSteadyClock clock;
    util::FrameLoop loop(clock);
    ReplayController ctl(std::nullopt, std::nullopt, 1000, 2.0, loop, clock);

    ctl.scrub_to(500.0);
    const auto st = ctl.state();
    EXPECT_DOUBLE_EQ(st.accumulated_cost, 1.0);
    EXPECT_TRUE(st.tool_steps().empty());
    EXPECT_TRUE(st.visible_lines.empty());
}

TEST(ReplayControllerRawInputTest, ParsesStepsAndTranscript) {
    test::FakeSteadyClock clock;
    util::FrameLoop loop(clock);
    test::TimelineBuilder b;
    b.step(0, 400).step(400, 1000).lines(5);
    const std::string json = b.steps_json();
    const std::string transcript = b.transcript();

    ReplayController ctl(json, transcript, 1000, 10.0, loop, clock);
    ctl.scrub_to(500.0);
    const auto st = ctl.state();

    EXPECT_EQ(st.tool_steps().size(), 2u);
    EXPECT_EQ(st.completed_steps.size(), 1u);
    ASSERT_TRUE(st.active_step.has_value());
    EXPECT_EQ(st.active_step->step_index, 1);
    EXPECT_EQ(st.visible_lines.size(), 3u);
}

TEST(ReplayControllerRawInputTest, MalformedStepsStillReplay) {
    test::FakeSteadyClock clock;
    util::FrameLoop loop(clock);
    ReplayController ctl(std::string_view("[{broken"), std::string_view("a\nb"), 1000, 1.0, loop, clock);

    EXPECT_TRUE(ctl.state().tool_steps().empty());
    EXPECT_TRUE(ctl.data()->parse_stats.malformed);
    ctl.scrub_to(1000.0);
    EXPECT_EQ(ctl.state().visible_lines.size(), 2u);
}

// With no duration every position collapses to 0
TEST(ReplayControllerRawInputTest, MissingDurationIsZeroLength) {
    test::FakeSteadyClock clock;
    util::FrameLoop loop(clock);
    ReplayController ctl(std::nullopt, std::string_view("only line"), std::nullopt, 0.5, loop, clock);

    ctl.scrub_to(300.0);
    EXPECT_DOUBLE_EQ(ctl.current_ms(), 0.0);
    EXPECT_FALSE(ctl.step_forward());
    EXPECT_FALSE(ctl.step_backward());
    EXPECT_TRUE(ctl.state().all_lines().empty());

    ctl.play();
    clock.advance(std::chrono::milliseconds(16));
    loop.run_frame();
    EXPECT_FALSE(ctl.is_playing());
}

TEST(ReplayControllerRawInputTest, NullDataBehavesAsEmpty) {
    test::FakeSteadyClock clock;
    util::FrameLoop loop(clock);
    ReplayController ctl(std::shared_ptr<const core::TimelineData>{}, loop, clock);

    EXPECT_DOUBLE_EQ(ctl.total_ms(), 0.0);
    EXPECT_EQ(ctl.boundaries().size(), 1u);
    EXPECT_FALSE(ctl.set_fork_point(0));
    const auto st = ctl.state();
    EXPECT_DOUBLE_EQ(st.accumulated_cost, 0.0);
}

} // namespace
