#pragma once

#include <chrono>
#include <cstdint>

#include "util/clock.hpp"

namespace test {

class FakeSteadyClock : public util::SteadyClock {
public:
    using time_point = util::SteadyClock::time_point;

    time_point now() const noexcept override { return now_; }
    void advance(std::chrono::milliseconds d) noexcept { now_ += d; }
    void advance_us(std::int64_t us) noexcept { now_ += std::chrono::microseconds(us); }

private:
    time_point now_{std::chrono::steady_clock::now()};
};

} // namespace test
