#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "core/log_line.hpp"

namespace core {

// Splits a transcript on '\n' and spreads the lines evenly across
// [0, total_ms]: line i of n lands at (i / max(n - 1, 1)) * total_ms.
// Returns an empty list for an absent or empty transcript or when
// total_ms <= 0. A trailing newline yields a final empty line, matching the
// transcript's own line structure.
std::vector<LogLine> build_lines(std::optional<std::string_view> transcript, double total_ms);

// Estimated position of one line without building the whole list.
[[nodiscard]] EstimatedTimestamp estimate_line_timestamp(std::size_t line_index,
                                                         std::size_t line_count,
                                                         double total_ms) noexcept;

} // namespace core
