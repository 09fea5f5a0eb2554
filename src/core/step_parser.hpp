#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include "core/tool_step.hpp"

namespace core {

struct StepParseStats {
    std::size_t parsed{0};
    std::size_t skipped{0};      // elements dropped by validation
    bool malformed{false};       // document was not a JSON array of values
};

// Parses the tool-step log of an execution record. Fail-soft: absent input,
// invalid JSON or a non-array document yield an empty list. Array elements
// that are not objects, lack step_index/started_at_ms, end before they start,
// or repeat an earlier step_index are skipped individually. Source order is
// preserved.
std::vector<ToolCallStep> parse_steps(std::optional<std::string_view> raw,
                                      StepParseStats* stats = nullptr) noexcept;

// Applies the same element validation to steps that arrive already structured.
std::vector<ToolCallStep> sanitize_steps(std::vector<ToolCallStep> steps,
                                         StepParseStats* stats = nullptr) noexcept;

} // namespace core
