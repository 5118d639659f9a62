#include "core/audio/frame_slicer.hpp"

#include <algorithm>

namespace vani::core::audio {

std::vector<std::vector<uint8_t>> sliceFrames(const uint8_t* data, size_t size, size_t frameBytes) {
    std::vector<std::vector<uint8_t>> frames;
    if (frameBytes == 0 || size == 0) {
        return frames;
    }

    frames.reserve((size + frameBytes - 1) / frameBytes);
    for (size_t offset = 0; offset < size; offset += frameBytes) {
        size_t count = std::min(frameBytes, size - offset);
        std::vector<uint8_t> frame(frameBytes, 0);
        std::copy(data + offset, data + offset + count, frame.begin());
        frames.push_back(std::move(frame));
    }
    return frames;
}

std::vector<std::vector<uint8_t>> StreamingFramer::append(const std::vector<uint8_t>& pcm) {
    std::vector<std::vector<uint8_t>> frames;
    if (frameBytes_ == 0) {
        return frames;
    }

    pending_.insert(pending_.end(), pcm.begin(), pcm.end());

    size_t whole = pending_.size() / frameBytes_;
    frames.reserve(whole);
    for (size_t i = 0; i < whole; ++i) {
        auto begin = pending_.begin() + static_cast<std::ptrdiff_t>(i * frameBytes_);
        frames.emplace_back(begin, begin + static_cast<std::ptrdiff_t>(frameBytes_));
    }
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(whole * frameBytes_));
    return frames;
}

std::vector<std::vector<uint8_t>> StreamingFramer::flush() {
    auto frames = sliceFrames(pending_, frameBytes_);
    pending_.clear();
    return frames;
}

} // namespace vani::core::audio
