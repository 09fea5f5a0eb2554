#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "core/tool_step.hpp"

namespace api {

// What the re-run feature receives once the user commits a fork point. The
// engine only assembles it; resolving and executing the fork happens outside.
struct ForkRequest {
    core::StepIndex fork_step_index{0};
    std::vector<core::ToolCallStep> prior_steps;  // steps with step_index <= fork, source order
    std::string context;                          // prior tool results as prompt text
};

// Steps whose index is at or before the fork point.
std::vector<core::ToolCallStep> steps_up_to_fork(std::span<const core::ToolCallStep> steps,
                                                 core::StepIndex fork_step_index);

// "Continuing from step N. Previous tool results:\n" followed by one
// "[Tool: name]\nInput: ...\nOutput: ..." block per step, blank-line separated.
// Step numbers in the text are 1-based.
std::string format_fork_context(std::span<const core::ToolCallStep> prior_steps,
                                core::StepIndex fork_step_index);

// Empty when no fork point is set.
std::optional<ForkRequest> make_fork_request(std::span<const core::ToolCallStep> steps,
                                             std::optional<core::StepIndex> fork_point);

} // namespace api
