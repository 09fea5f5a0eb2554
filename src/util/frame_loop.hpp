#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

#include "util/clock.hpp"

namespace util {

using FrameHandle = std::uint64_t;
inline constexpr FrameHandle invalid_frame_handle = 0;

// Per-frame callback registration, the cooperative equivalent of an
// animation-frame request. A registration fires at most once, on the next
// frame after it was made. Single-threaded: callbacks run on the thread that
// drives the frames, the same thread that registers and cancels.
class FrameSource {
public:
    using time_point = SteadyClock::time_point;
    using FrameCallback = std::function<void(time_point)>;

    virtual ~FrameSource() = default;

    [[nodiscard]] virtual FrameHandle request_frame(FrameCallback cb) = 0;

    // Cancelling an unknown or already-fired handle is a no-op.
    virtual void cancel_frame(FrameHandle handle) noexcept = 0;
};

// FrameSource pumped explicitly by its host: a terminal loop calls run_frame()
// on its own cadence, tests call run_frame(t) with fabricated instants.
//
// Handles increase monotonically and are never reused. A frame fires only the
// registrations whose handle predates the frame, so callbacks that re-register
// from inside a frame wait for the next one, and a callback that cancels a
// later entry of the same frame prevents it from firing.
class FrameLoop final : public FrameSource {
public:
    struct Stats {
        std::uint64_t requested{0};
        std::uint64_t fired{0};
        std::uint64_t cancelled{0};
    };

    explicit FrameLoop(const SteadyClock& clock) noexcept : clock_(clock) {}

    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;

    [[nodiscard]] FrameHandle request_frame(FrameCallback cb) override;
    void cancel_frame(FrameHandle handle) noexcept override;

    // Runs one frame stamped with the clock's current time. Returns the
    // number of callbacks fired.
    std::size_t run_frame();
    std::size_t run_frame(time_point now);

    [[nodiscard]] std::size_t pending() const noexcept { return pending_.size(); }
    [[nodiscard]] bool is_pending(FrameHandle handle) const noexcept { return pending_.count(handle) != 0; }
    [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

private:
    const SteadyClock& clock_;
    std::map<FrameHandle, FrameCallback> pending_;
    FrameHandle next_handle_{1};
    Stats stats_{};
};

} // namespace util
