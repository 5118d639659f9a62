#pragma once

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

#include "audio_types.hpp"

namespace vani::session {

/**
 * @brief Holds inbound device frames until the provider is ready
 *
 * Frames are kept in arrival order and drained exactly once. After the drain
 * the queue is disabled for good and enqueue() tells the caller to forward
 * directly. Bounded; frames beyond capacity are dropped and reported.
 */
class PendingFrameQueue {
public:
    enum class EnqueueResult {
        Queued,
        Forward,    // queue already drained, send the frame yourself
        Overflow
    };

    using Sink = std::function<void(const AudioFrame&)>;

    static constexpr size_t DEFAULT_CAPACITY = 1024;

    explicit PendingFrameQueue(size_t capacity = DEFAULT_CAPACITY) : capacity_(capacity) {}

    EnqueueResult enqueue(const AudioFrame& frame);

    /**
     * Pass every queued frame to sink in arrival order, then disable the
     * queue. Frames enqueued concurrently are either drained here or get
     * Forward, never both.
     * @return number of frames drained; 0 on every call after the first
     */
    size_t drainOnce(const Sink& sink);

    bool isDisabled() const { return disabled_.load(std::memory_order_acquire); }
    size_t size() const;
    size_t droppedFrames() const { return dropped_.load(); }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<AudioFrame> frames_;
    std::atomic<bool> disabled_{false};
    std::atomic<size_t> dropped_{0};
};

} // namespace vani::session
