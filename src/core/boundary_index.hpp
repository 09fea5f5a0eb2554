#pragma once

#include <algorithm>
#include <iterator>
#include <optional>
#include <span>
#include <vector>

#include "core/tool_step.hpp"

namespace core {

// Sorted, de-duplicated time points used for discrete stepping: 0, total_ms,
// and every step start/end that lies inside [0, total_ms].
// Continuous scrubbing and playback never consult it.
std::vector<double> build_boundaries(std::span<const ToolCallStep> steps, double total_ms);

// Smallest boundary strictly greater than current_ms + epsilon_ms.
[[nodiscard]] inline std::optional<double> next_boundary(std::span<const double> boundaries,
                                                         double current_ms,
                                                         double epsilon_ms) noexcept {
    const auto it = std::upper_bound(boundaries.begin(), boundaries.end(), current_ms + epsilon_ms);
    if (it == boundaries.end()) {
        return std::nullopt;
    }
    return *it;
}

// Largest boundary strictly less than current_ms - epsilon_ms.
[[nodiscard]] inline std::optional<double> previous_boundary(std::span<const double> boundaries,
                                                             double current_ms,
                                                             double epsilon_ms) noexcept {
    const auto it = std::lower_bound(boundaries.begin(), boundaries.end(), current_ms - epsilon_ms);
    if (it == boundaries.begin()) {
        return std::nullopt;
    }
    return *std::prev(it);
}

} // namespace core
