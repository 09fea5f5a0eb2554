#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace core {

using StepIndex = std::int64_t;

// One tool invocation of a completed execution. Times are exact offsets in
// milliseconds from execution start, as recorded by the execution engine.
struct ToolCallStep {
    StepIndex step_index{0};
    std::string tool_name;
    std::string input_preview;   // opaque display text
    std::string output_preview;  // opaque display text
    std::int64_t started_at_ms{0};
    std::optional<std::int64_t> ended_at_ms;  // absent: still open when the execution ended
    std::optional<std::int64_t> duration_ms;  // advisory only

    [[nodiscard]] bool is_closed() const noexcept { return ended_at_ms.has_value(); }

    friend bool operator==(const ToolCallStep&, const ToolCallStep&) = default;
};

} // namespace core
