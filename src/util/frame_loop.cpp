#include "util/frame_loop.hpp"

#include <utility>

namespace util {

FrameHandle FrameLoop::request_frame(FrameCallback cb) {
    if (!cb) {
        return invalid_frame_handle;
    }
    const FrameHandle handle = next_handle_++;
    pending_.emplace(handle, std::move(cb));
    ++stats_.requested;
    return handle;
}

void FrameLoop::cancel_frame(FrameHandle handle) noexcept {
    if (pending_.erase(handle) != 0) {
        ++stats_.cancelled;
    }
}

std::size_t FrameLoop::run_frame() {
    return run_frame(clock_.now());
}

std::size_t FrameLoop::run_frame(time_point now) {
    const FrameHandle limit = next_handle_;
    std::size_t fired = 0;
    while (!pending_.empty() && pending_.begin()->first < limit) {
        auto node = pending_.extract(pending_.begin());
        ++fired;
        ++stats_.fired;
        node.mapped()(now);
    }
    return fired;
}

} // namespace util
