#include "core/playback_scheduler.hpp"

#include <algorithm>
#include <cmath>

#include "util/log.hpp"

namespace core {

PlaybackScheduler::PlaybackScheduler(util::FrameSource& frames,
                                     const util::SteadyClock& clock,
                                     double& position_ms,
                                     double total_ms,
                                     double speed) noexcept
    : frames_(frames)
    , clock_(clock)
    , position_ms_(position_ms)
    , total_ms_(total_ms > 0.0 ? total_ms : 0.0)
    , speed_((std::isfinite(speed) && speed > 0.0) ? speed : 1.0) {}

PlaybackScheduler::~PlaybackScheduler() {
    pause();
}

void PlaybackScheduler::play() {
    if (state_ == PlaybackState::Playing) {
        return;
    }
    state_ = PlaybackState::Playing;
    last_tick_ = clock_.now();
    LOG_SLOW_DEBUG("playback: start at %.1f/%.1f ms speed=%.2fx", position_ms_, total_ms_, speed_);
    schedule_next();
}

void PlaybackScheduler::pause() noexcept {
    if (frame_ != util::invalid_frame_handle) {
        frames_.cancel_frame(frame_);
        frame_ = util::invalid_frame_handle;
    }
    state_ = PlaybackState::Stopped;
}

void PlaybackScheduler::toggle() {
    if (state_ == PlaybackState::Playing) {
        pause();
    } else {
        play();
    }
}

bool PlaybackScheduler::set_speed(double speed) noexcept {
    if (!std::isfinite(speed) || speed <= 0.0) {
        LOG_SLOW_WARN("playback: ignoring invalid speed %f", speed);
        return false;
    }
    speed_ = speed;
    return true;
}

void PlaybackScheduler::schedule_next() {
    frame_ = frames_.request_frame([this](util::SteadyClock::time_point now) { on_frame(now); });
    if (frame_ == util::invalid_frame_handle) {
        LOG_SLOW_ERROR("playback: frame source refused registration, stopping");
        state_ = PlaybackState::Stopped;
    }
}

void PlaybackScheduler::on_frame(util::SteadyClock::time_point now) {
    frame_ = util::invalid_frame_handle;
    if (state_ != PlaybackState::Playing) {
        return;
    }

    // A clock that steps backwards contributes nothing rather than rewinding.
    const double delta = std::max(util::elapsed_ms(last_tick_, now), 0.0) * speed_;
    last_tick_ = now;
    ++stats_.frames;

    const double next = position_ms_ + delta;
    if (next >= total_ms_) {
        position_ms_ = total_ms_;
        state_ = PlaybackState::Stopped;
        ++stats_.passes_completed;
        LOG_SLOW_DEBUG("playback: reached end at %.1f ms", total_ms_);
        return;
    }
    position_ms_ = next;
    schedule_next();
}

} // namespace core
