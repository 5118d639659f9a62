#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#include "audio_types.hpp"
#include "core/audio/frame_encoder.hpp"

namespace vani::core::audio {

struct GainSettings {
    float gainDb = 0.0f;
    float ceiling = 1.0f;
};

/**
 * @brief Converts between provider audio and device audio
 *
 * Outbound: container parse -> companded decode -> downmix -> resample to the
 * device rate -> gain/limiter. Framing and encoding are separate steps so the
 * caller controls framing across chunk boundaries.
 *
 * Inbound: device PCM resampled to the rate a provider expects.
 *
 * All conversions are stateless; the encoder passed to encodeFrames() carries
 * the only state.
 */
class TranscodingPipeline {
public:
    struct Config {
        uint32_t outputSampleRate = audio_constants::DEVICE_OUTPUT_SAMPLE_RATE;
        size_t frameBytes = audio_constants::FRAME_SIZE_BYTES;
    };

    struct EncodeStats {
        size_t framesEncoded = 0;
        size_t framesSkipped = 0;
    };

    TranscodingPipeline();
    explicit TranscodingPipeline(const Config& config);

    /// @throws BridgeError(TranscodeFailure) if the input cannot be decoded at all
    std::vector<int16_t> toDevicePcm(const AudioFrame& input, const GainSettings& gain) const;
    std::vector<uint8_t> toDeviceBytes(const AudioFrame& input, const GainSettings& gain) const;

    AudioFrame toProviderFormat(const AudioFrame& deviceFrame, uint32_t targetRate) const;

    /// Encode each frame; frames that fail are skipped, counted and logged.
    std::vector<std::vector<uint8_t>> encodeFrames(const std::vector<std::vector<uint8_t>>& pcmFrames,
                                                   FrameEncoder& encoder,
                                                   EncodeStats* stats = nullptr) const;

    const Config& config() const { return config_; }
    size_t frameBytes() const { return config_.frameBytes; }

    /// Playback duration of one frame in milliseconds.
    uint32_t frameDurationMs() const;

    static uint64_t totalSkippedFrames();

private:
    Config config_;
    static std::atomic<uint64_t> s_skippedFrames;
};

} // namespace vani::core::audio
