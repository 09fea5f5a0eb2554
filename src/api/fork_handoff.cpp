#include "api/fork_handoff.hpp"

#include <string>

namespace api {

std::vector<core::ToolCallStep> steps_up_to_fork(std::span<const core::ToolCallStep> steps,
                                                 core::StepIndex fork_step_index) {
    std::vector<core::ToolCallStep> out;
    for (const auto& s : steps) {
        if (s.step_index <= fork_step_index) {
            out.push_back(s);
        }
    }
    return out;
}

std::string format_fork_context(std::span<const core::ToolCallStep> prior_steps,
                                core::StepIndex fork_step_index) {
    std::string out = "Continuing from step " + std::to_string(fork_step_index + 1) +
                      ". Previous tool results:\n";
    bool first = true;
    for (const auto& s : prior_steps) {
        if (!first) {
            out += "\n\n";
        }
        first = false;
        out += "[Tool: ";
        out += s.tool_name;
        out += "]\nInput: ";
        out += s.input_preview;
        out += "\nOutput: ";
        out += s.output_preview;
    }
    return out;
}

std::optional<ForkRequest> make_fork_request(std::span<const core::ToolCallStep> steps,
                                             std::optional<core::StepIndex> fork_point) {
    if (!fork_point) {
        return std::nullopt;
    }
    ForkRequest req;
    req.fork_step_index = *fork_point;
    req.prior_steps = steps_up_to_fork(steps, *fork_point);
    req.context = format_fork_context(req.prior_steps, *fork_point);
    return req;
}

} // namespace api
