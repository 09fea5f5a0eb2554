#include "api/replay_controller.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "core/boundary_index.hpp"
#include "core/timeline_projector.hpp"
#include "util/log.hpp"

namespace api {
namespace {

std::shared_ptr<const core::TimelineData> or_empty(std::shared_ptr<const core::TimelineData> data) {
    if (data) {
        return data;
    }
    auto empty = std::make_shared<core::TimelineData>();
    empty->boundaries = {0.0};
    return empty;
}

} // namespace

std::span<const core::ToolCallStep> ReplayState::tool_steps() const noexcept {
    if (!data) {
        return {};
    }
    return data->steps;
}

std::span<const core::LogLine> ReplayState::all_lines() const noexcept {
    if (!data) {
        return {};
    }
    return data->lines;
}

ReplayController::ReplayController(std::shared_ptr<const core::TimelineData> data,
                                   util::FrameSource& frames,
                                   const util::SteadyClock& clock,
                                   const core::ReplayConfig& cfg)
    : cfg_(cfg)
    , data_(or_empty(std::move(data)))
    , scheduler_(frames, clock, current_ms_, data_->total_ms, cfg.initial_speed) {}

ReplayController::ReplayController(std::optional<std::string_view> tool_steps_json,
                                   std::optional<std::string_view> transcript,
                                   std::optional<std::int64_t> duration_ms,
                                   double total_cost,
                                   util::FrameSource& frames,
                                   const util::SteadyClock& clock,
                                   const core::ReplayConfig& cfg)
    : ReplayController(core::make_timeline_data(tool_steps_json, transcript, duration_ms, total_cost),
                       frames, clock, cfg) {}

void ReplayController::scrub_to(double ms) noexcept {
    if (std::isnan(ms)) {
        return;
    }
    current_ms_ = std::clamp(ms, 0.0, data_->total_ms);
}

void ReplayController::scrub_by(double delta_ms) noexcept {
    scrub_to(current_ms_ + delta_ms);
}

void ReplayController::play() {
    scheduler_.play();
}

void ReplayController::pause() noexcept {
    scheduler_.pause();
}

void ReplayController::toggle_play() {
    scheduler_.toggle();
}

bool ReplayController::set_speed(double speed) noexcept {
    return scheduler_.set_speed(speed);
}

double ReplayController::cycle_speed() noexcept {
    const double current = scheduler_.speed();
    double next = cfg_.speed_presets.front();
    for (const double preset : cfg_.speed_presets) {
        if (preset > current) {
            next = preset;
            break;
        }
    }
    if (!scheduler_.set_speed(next)) {
        return current;
    }
    return next;
}

void ReplayController::jump_to_start() noexcept {
    current_ms_ = 0.0;
    scheduler_.stop();
}

void ReplayController::jump_to_end() noexcept {
    current_ms_ = data_->total_ms;
    scheduler_.stop();
}

bool ReplayController::step_forward() noexcept {
    const auto next = core::next_boundary(data_->boundaries, current_ms_, cfg_.step_epsilon_ms);
    if (!next) {
        return false;
    }
    scrub_to(*next);
    return true;
}

bool ReplayController::step_backward() noexcept {
    const auto prev = core::previous_boundary(data_->boundaries, current_ms_, cfg_.step_epsilon_ms);
    if (!prev) {
        return false;
    }
    scrub_to(*prev);
    return true;
}

bool ReplayController::set_fork_point(std::optional<core::StepIndex> step_index) noexcept {
    if (step_index && data_->find_step(*step_index) == nullptr) {
        LOG_SLOW_WARN("replay: fork point %lld does not name a step", static_cast<long long>(*step_index));
        return false;
    }
    fork_point_ = step_index;
    return true;
}

bool ReplayController::toggle_fork_point(core::StepIndex step_index) noexcept {
    if (fork_point_ == step_index) {
        fork_point_.reset();
        return true;
    }
    return set_fork_point(step_index);
}

ReplayState ReplayController::state() const {
    const core::TimelineData& d = *data_;
    core::TimelineProjection proj = core::project(d.steps, d.lines, current_ms_, d.total_ms, d.total_cost);

    ReplayState st;
    st.current_ms = current_ms_;
    st.total_ms = d.total_ms;
    st.is_playing = scheduler_.is_playing();
    st.speed = scheduler_.speed();
    st.data = data_;
    st.visible_lines = std::move(proj.visible_lines);
    st.completed_steps = std::move(proj.completed_steps);
    st.pending_steps = std::move(proj.pending_steps);
    if (proj.active_step) {
        st.active_step = *proj.active_step;
    }
    st.accumulated_cost = proj.accumulated_cost;
    st.total_cost = d.total_cost;
    st.fork_point = fork_point_;
    return st;
}

} // namespace api
