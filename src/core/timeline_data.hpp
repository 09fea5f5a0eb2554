#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "core/log_line.hpp"
#include "core/step_parser.hpp"
#include "core/tool_step.hpp"

namespace core {

// Immutable inputs of one replay: parsed steps, estimated lines, boundaries,
// duration and cost. Built once per execution record and shared read-only
// between any number of sessions.
struct TimelineData {
    std::vector<ToolCallStep> steps;
    std::vector<LogLine> lines;
    std::vector<double> boundaries;  // sorted, unique; always holds 0 and total_ms
    double total_ms{0.0};
    double total_cost{0.0};
    StepParseStats parse_stats{};

    [[nodiscard]] const ToolCallStep* find_step(StepIndex index) const noexcept;
};

// Absent duration counts as 0; negative or non-finite cost counts as 0.
std::shared_ptr<const TimelineData> make_timeline_data(std::optional<std::string_view> tool_steps_json,
                                                       std::optional<std::string_view> transcript,
                                                       std::optional<std::int64_t> duration_ms,
                                                       double total_cost);

std::shared_ptr<const TimelineData> make_timeline_data(std::vector<ToolCallStep> steps,
                                                       std::optional<std::string_view> transcript,
                                                       std::optional<std::int64_t> duration_ms,
                                                       double total_cost);

} // namespace core
