#pragma once

#include <chrono>

namespace util {

// Thin clock abstraction so playback can be driven by a fake clock in tests.
class SteadyClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~SteadyClock() = default;
    virtual time_point now() const noexcept { return std::chrono::steady_clock::now(); }
};

// Fractional milliseconds between two instants; negative if `to` precedes `from`.
[[nodiscard]] inline double elapsed_ms(SteadyClock::time_point from, SteadyClock::time_point to) noexcept {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace util
