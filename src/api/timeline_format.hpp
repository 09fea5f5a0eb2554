#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace api {

// Playhead label: "640ms", "12.5s", or "m:ss" from one minute up.
std::string format_position_ms(double ms);

// Cost label: "$0.0123", or "<$0.001" for anything smaller.
std::string format_cost(double cost);

// Step duration label: "-" when unknown, then "850ms", "42s", "3m 5s", "2h 10m".
std::string format_duration(std::optional<std::int64_t> ms);

// Speed preset label, e.g. "4x" or "1.5x".
std::string format_speed(double speed);

// Space-separated preset labels, e.g. "1x 2x 4x 8x".
std::string format_speed_presets(std::span<const double> presets);

} // namespace api
