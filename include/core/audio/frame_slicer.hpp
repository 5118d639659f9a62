#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vani::core::audio {

/// Split into frameBytes-sized frames; the final partial frame is zero-padded.
std::vector<std::vector<uint8_t>> sliceFrames(const uint8_t* data, size_t size, size_t frameBytes);

inline std::vector<std::vector<uint8_t>> sliceFrames(const std::vector<uint8_t>& buffer, size_t frameBytes) {
    return sliceFrames(buffer.data(), buffer.size(), frameBytes);
}

/**
 * @brief Accumulates streamed PCM and hands out whole frames
 *
 * Upstream providers deliver audio in arbitrary chunk sizes. The framer keeps
 * the remainder between chunks so frames stay contiguous within a turn; flush()
 * zero-pads whatever is left at the end of the turn.
 */
class StreamingFramer {
public:
    explicit StreamingFramer(size_t frameBytes) : frameBytes_(frameBytes) {}

    std::vector<std::vector<uint8_t>> append(const std::vector<uint8_t>& pcm);
    std::vector<std::vector<uint8_t>> flush();
    void reset() { pending_.clear(); }

    size_t pendingBytes() const { return pending_.size(); }
    size_t frameBytes() const { return frameBytes_; }

private:
    size_t frameBytes_;
    std::vector<uint8_t> pending_;
};

} // namespace vani::core::audio
