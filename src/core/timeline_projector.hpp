#pragma once

#include <span>
#include <vector>

#include "core/log_line.hpp"
#include "core/tool_step.hpp"

namespace core {

// Pure projections of the immutable timeline onto a scrub position. Every
// function is a fresh read of its arguments; nothing is cached between calls.

// Lines whose estimated timestamp is <= current_ms (inclusive).
std::vector<LogLine> visible_lines(std::span<const LogLine> lines, double current_ms);

// Steps with a known end at or before current_ms.
std::vector<ToolCallStep> completed_steps(std::span<const ToolCallStep> steps, double current_ms);

// First step in source order that has started and not yet ended. Overlapping
// steps may qualify together; only the first is reported.
[[nodiscard]] const ToolCallStep* active_step(std::span<const ToolCallStep> steps, double current_ms) noexcept;

// Steps that start after current_ms.
std::vector<ToolCallStep> pending_steps(std::span<const ToolCallStep> steps, double current_ms);

// Proportional estimate of spend up to current_ms, in [0, total_cost].
// Each step carries 1/n of the cost once completed; a running step adds the
// fraction of its own span already elapsed (span end falls back to total_ms
// for open steps, span length floored at 1 ms). Without steps the cost is
// spread evenly over time. Zero duration or cost yields 0. Non-decreasing in
// current_ms, overlapping steps included.
[[nodiscard]] double accumulated_cost(std::span<const ToolCallStep> steps,
                                      double current_ms,
                                      double total_ms,
                                      double total_cost) noexcept;

struct TimelineProjection {
    std::vector<LogLine> visible_lines;
    std::vector<ToolCallStep> completed_steps;
    std::vector<ToolCallStep> pending_steps;
    const ToolCallStep* active_step{nullptr};  // points into the projected step span
    double accumulated_cost{0.0};
};

TimelineProjection project(std::span<const ToolCallStep> steps,
                           std::span<const LogLine> lines,
                           double current_ms,
                           double total_ms,
                           double total_cost);

} // namespace core
