#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct OpusEncoder;

namespace vani::core::audio {

/**
 * @brief Stateful encoder for fixed-size linear PCM frames
 *
 * One instance is reused across consecutive frames of a stream so that
 * inter-frame prediction state is preserved.
 */
class FrameEncoder {
public:
    virtual ~FrameEncoder() = default;

    /// @return encoded packet, or nullopt when this frame failed to encode
    virtual std::optional<std::vector<uint8_t>> encode(const std::vector<uint8_t>& pcmFrame) = 0;
};

using FrameEncoderFactory = std::function<std::unique_ptr<FrameEncoder>()>;

/**
 * @brief libopus encoder for mono 16-bit frames
 */
class OpusFrameEncoder : public FrameEncoder {
public:
    struct Config {
        uint32_t sampleRate = 24000;
        uint16_t channels = 1;
        int32_t bitrate = 12000;
        int32_t complexity = 0;
        size_t maxPacketBytes = 4000;
    };

    explicit OpusFrameEncoder(const Config& config);
    ~OpusFrameEncoder() override;

    OpusFrameEncoder(const OpusFrameEncoder&) = delete;
    OpusFrameEncoder& operator=(const OpusFrameEncoder&) = delete;

    std::optional<std::vector<uint8_t>> encode(const std::vector<uint8_t>& pcmFrame) override;

    const std::string& getLastError() const { return lastError_; }

private:
    Config config_;
    ::OpusEncoder* encoder_ = nullptr;
    std::string lastError_;
};

} // namespace vani::core::audio
