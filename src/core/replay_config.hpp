#pragma once

#include <array>
#include <chrono>
#include <type_traits>

namespace core {

// Session tuning for the replay engine. All time values are in milliseconds.
struct ReplayConfig {
    // Speed multiplier a new session starts with
    double initial_speed{1.0};

    // Speed presets offered by hosts (1x, 2x, 4x, 8x)
    std::array<double, 4> speed_presets{1.0, 2.0, 4.0, 8.0};

    // Boundary stepping skips boundaries within this distance of the current
    // position so repeated steps never stall on the boundary just reached
    double step_epsilon_ms{1.0};

    // Coarse scrub increment used by keyboard-style nudges
    double nudge_ms{500.0};

    // Host frame cadence (~60 fps); only real-time hosts use it
    std::chrono::milliseconds frame_interval{16};
};

static_assert(std::is_trivially_copyable_v<ReplayConfig>, "ReplayConfig must be trivially copyable");

[[nodiscard]] inline constexpr ReplayConfig default_replay_config() noexcept {
    return ReplayConfig{};
}

} // namespace core
