#pragma once

#include <cstdint>

#include "util/clock.hpp"
#include "util/frame_loop.hpp"

namespace core {

enum class PlaybackState : std::uint8_t { Stopped, Playing };

// Advances a replay position in real time, one frame at a time.
//
// Design:
// - The position is owned by the session; the scheduler holds a reference and
//   is the only automatic writer. Every frame reads the latest value, so a
//   scrub issued between frames is never overwritten by a stale frame.
// - Each frame advances by (now - last_tick) * speed. last_tick moves on every
//   frame whether or not the position changed.
// - Reaching total_ms clamps the position there and stops playback; the
//   caller may scrub back and play again.
// - At most one frame registration is outstanding. pause(), stop() and the
//   destructor cancel it, so no frame fires after playback was stopped.
//
// Thread safety: None. Frames, user actions and registration all run on the
// session's thread.
class PlaybackScheduler {
public:
    struct Stats {
        std::uint64_t frames{0};            // frames that advanced the position
        std::uint64_t passes_completed{0};  // playbacks that ran to total_ms
    };

    PlaybackScheduler(util::FrameSource& frames,
                      const util::SteadyClock& clock,
                      double& position_ms,
                      double total_ms,
                      double speed = 1.0) noexcept;
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&) = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;
    PlaybackScheduler(PlaybackScheduler&&) = delete;
    PlaybackScheduler& operator=(PlaybackScheduler&&) = delete;

    // Stopped -> Playing. Captures the reference instant. No-op when playing.
    void play();
    // Playing -> Stopped without touching the position.
    void pause() noexcept;
    void toggle();
    // Forces Stopped; used by jumps that reposition the playhead.
    void stop() noexcept { pause(); }

    // Takes effect on the next frame; last_tick is kept so the position does
    // not jump. Rejects non-finite or non-positive multipliers.
    [[nodiscard]] bool set_speed(double speed) noexcept;

    [[nodiscard]] PlaybackState state() const noexcept { return state_; }
    [[nodiscard]] bool is_playing() const noexcept { return state_ == PlaybackState::Playing; }
    [[nodiscard]] double speed() const noexcept { return speed_; }
    [[nodiscard]] double total_ms() const noexcept { return total_ms_; }
    [[nodiscard]] bool frame_pending() const noexcept { return frame_ != util::invalid_frame_handle; }
    [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

private:
    void schedule_next();
    void on_frame(util::SteadyClock::time_point now);

    util::FrameSource& frames_;
    const util::SteadyClock& clock_;
    double& position_ms_;
    double total_ms_{0.0};
    double speed_{1.0};
    PlaybackState state_{PlaybackState::Stopped};
    util::SteadyClock::time_point last_tick_{};
    util::FrameHandle frame_{util::invalid_frame_handle};
    Stats stats_{};
};

} // namespace core
