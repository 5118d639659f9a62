#include "session/pending_frame_queue.hpp"
#include "system/logger.hpp"

namespace vani::session {

PendingFrameQueue::EnqueueResult PendingFrameQueue::enqueue(const AudioFrame& frame) {
    if (disabled_.load(std::memory_order_acquire)) {
        return EnqueueResult::Forward;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (disabled_.load(std::memory_order_relaxed)) {
        return EnqueueResult::Forward;
    }
    if (frames_.size() >= capacity_) {
        size_t dropped = ++dropped_;
        if (dropped == 1 || dropped % 100 == 0) {
            Logger::warning("PendingFrameQueue: capacity {} reached, {} frames dropped", capacity_, dropped);
        }
        return EnqueueResult::Overflow;
    }
    frames_.push_back(frame);
    return EnqueueResult::Queued;
}

size_t PendingFrameQueue::drainOnce(const Sink& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (disabled_.load(std::memory_order_relaxed)) {
        return 0;
    }

    size_t drained = frames_.size();
    for (const auto& frame : frames_) {
        sink(frame);
    }
    frames_.clear();
    disabled_.store(true, std::memory_order_release);

    Logger::debug("PendingFrameQueue: drained {} buffered frames", drained);
    return drained;
}

size_t PendingFrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

} // namespace vani::session
