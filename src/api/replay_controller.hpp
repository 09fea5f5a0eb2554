#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "core/log_line.hpp"
#include "core/playback_scheduler.hpp"
#include "core/replay_config.hpp"
#include "core/timeline_data.hpp"
#include "core/tool_step.hpp"
#include "util/clock.hpp"
#include "util/frame_loop.hpp"

namespace api {

// Snapshot of one session at its current position. Derived lists are copies,
// so a snapshot stays valid after the session moves on; `data` keeps the
// shared inputs alive.
struct ReplayState {
    double current_ms{0.0};
    double total_ms{0.0};
    bool is_playing{false};
    double speed{1.0};

    std::shared_ptr<const core::TimelineData> data;  // all steps and lines

    std::vector<core::LogLine> visible_lines;
    std::vector<core::ToolCallStep> completed_steps;
    std::optional<core::ToolCallStep> active_step;
    std::vector<core::ToolCallStep> pending_steps;

    double accumulated_cost{0.0};
    double total_cost{0.0};
    std::optional<core::StepIndex> fork_point;

    [[nodiscard]] std::span<const core::ToolCallStep> tool_steps() const noexcept;
    [[nodiscard]] std::span<const core::LogLine> all_lines() const noexcept;
};

// One replay session over an immutable execution record.
//
// The scrub position is the single mutable source of truth; every value in
// state() is recomputed from it and the shared inputs on each call. Playback
// advances the same position through the frame source; scrubs, jumps and
// steps issued between frames are seen by the next frame.
//
// Destroying the controller cancels any pending frame.
class ReplayController {
public:
    ReplayController(std::shared_ptr<const core::TimelineData> data,
                     util::FrameSource& frames,
                     const util::SteadyClock& clock,
                     const core::ReplayConfig& cfg = core::default_replay_config());

    ReplayController(std::optional<std::string_view> tool_steps_json,
                     std::optional<std::string_view> transcript,
                     std::optional<std::int64_t> duration_ms,
                     double total_cost,
                     util::FrameSource& frames,
                     const util::SteadyClock& clock,
                     const core::ReplayConfig& cfg = core::default_replay_config());

    ReplayController(const ReplayController&) = delete;
    ReplayController& operator=(const ReplayController&) = delete;
    ReplayController(ReplayController&&) = delete;
    ReplayController& operator=(ReplayController&&) = delete;

    // Clamped to [0, total_ms]; NaN is ignored. Playback keeps running.
    void scrub_to(double ms) noexcept;
    void scrub_by(double delta_ms) noexcept;
    void nudge_forward() noexcept { scrub_by(cfg_.nudge_ms); }
    void nudge_backward() noexcept { scrub_by(-cfg_.nudge_ms); }

    void play();
    void pause() noexcept;
    void toggle_play();
    bool set_speed(double speed) noexcept;
    // Advances to the next configured speed preset above the current speed,
    // wrapping to the first. Returns the new speed.
    double cycle_speed() noexcept;

    // Reposition and stop playback.
    void jump_to_start() noexcept;
    void jump_to_end() noexcept;

    // Move to the next/previous step boundary; no-op when there is none.
    // Return whether the position moved.
    bool step_forward() noexcept;
    bool step_backward() noexcept;

    // Marks the step a re-run should continue from. Unknown indices are
    // rejected and leave the current fork point unchanged.
    bool set_fork_point(std::optional<core::StepIndex> step_index) noexcept;
    // Sets the fork point to `step_index`, or clears it if already set there.
    bool toggle_fork_point(core::StepIndex step_index) noexcept;

    [[nodiscard]] ReplayState state() const;

    [[nodiscard]] double current_ms() const noexcept { return current_ms_; }
    [[nodiscard]] double total_ms() const noexcept { return data_->total_ms; }
    [[nodiscard]] bool is_playing() const noexcept { return scheduler_.is_playing(); }
    [[nodiscard]] double speed() const noexcept { return scheduler_.speed(); }
    [[nodiscard]] std::optional<core::StepIndex> fork_point() const noexcept { return fork_point_; }
    [[nodiscard]] std::span<const double> boundaries() const noexcept { return data_->boundaries; }
    [[nodiscard]] const std::shared_ptr<const core::TimelineData>& data() const noexcept { return data_; }
    [[nodiscard]] const core::ReplayConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] const core::PlaybackScheduler& scheduler() const noexcept { return scheduler_; }

private:
    core::ReplayConfig cfg_;
    std::shared_ptr<const core::TimelineData> data_;
    double current_ms_{0.0};
    std::optional<core::StepIndex> fork_point_;
    core::PlaybackScheduler scheduler_;  // refers to current_ms_; declared after it
};

} // namespace api
