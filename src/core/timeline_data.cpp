#include "core/timeline_data.hpp"

#include <cmath>
#include <utility>

#include "core/boundary_index.hpp"
#include "core/line_estimator.hpp"

namespace core {
namespace {

std::shared_ptr<const TimelineData> finish(std::vector<ToolCallStep> steps,
                                           const StepParseStats& stats,
                                           std::optional<std::string_view> transcript,
                                           std::optional<std::int64_t> duration_ms,
                                           double total_cost) {
    auto data = std::make_shared<TimelineData>();
    data->total_ms = (duration_ms && *duration_ms > 0) ? static_cast<double>(*duration_ms) : 0.0;
    data->total_cost = (std::isfinite(total_cost) && total_cost > 0.0) ? total_cost : 0.0;
    data->steps = std::move(steps);
    data->parse_stats = stats;
    data->lines = build_lines(transcript, data->total_ms);
    data->boundaries = build_boundaries(data->steps, data->total_ms);
    return data;
}

} // namespace

const ToolCallStep* TimelineData::find_step(StepIndex index) const noexcept {
    for (const auto& s : steps) {
        if (s.step_index == index) {
            return &s;
        }
    }
    return nullptr;
}

std::shared_ptr<const TimelineData> make_timeline_data(std::optional<std::string_view> tool_steps_json,
                                                       std::optional<std::string_view> transcript,
                                                       std::optional<std::int64_t> duration_ms,
                                                       double total_cost) {
    StepParseStats stats{};
    auto steps = parse_steps(tool_steps_json, &stats);
    return finish(std::move(steps), stats, transcript, duration_ms, total_cost);
}

std::shared_ptr<const TimelineData> make_timeline_data(std::vector<ToolCallStep> steps,
                                                       std::optional<std::string_view> transcript,
                                                       std::optional<std::int64_t> duration_ms,
                                                       double total_cost) {
    StepParseStats stats{};
    auto clean = sanitize_steps(std::move(steps), &stats);
    return finish(std::move(clean), stats, transcript, duration_ms, total_cost);
}

} // namespace core
