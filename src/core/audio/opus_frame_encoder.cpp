#include "core/audio/frame_encoder.hpp"
#include "core/audio/pcm_dsp.hpp"
#include "system/errors.hpp"
#include "system/logger.hpp"

#include <opus/opus.h>

namespace vani::core::audio {

OpusFrameEncoder::OpusFrameEncoder(const Config& config) : config_(config) {
    int error = OPUS_OK;
    encoder_ = opus_encoder_create(static_cast<opus_int32>(config_.sampleRate), config_.channels,
                                   OPUS_APPLICATION_AUDIO, &error);
    if (!encoder_ || error != OPUS_OK) {
        throw BridgeError(ErrorCode::InvalidConfiguration,
                          "Failed to create Opus encoder: " + std::string(opus_strerror(error)));
    }

    if (opus_encoder_ctl(encoder_, OPUS_SET_BITRATE(config_.bitrate)) != OPUS_OK) {
        Logger::warning("OpusFrameEncoder: bitrate {} rejected, keeping default", config_.bitrate);
    }
    if (opus_encoder_ctl(encoder_, OPUS_SET_COMPLEXITY(config_.complexity)) != OPUS_OK) {
        Logger::warning("OpusFrameEncoder: complexity {} rejected, keeping default", config_.complexity);
    }
}

OpusFrameEncoder::~OpusFrameEncoder() {
    if (encoder_) {
        opus_encoder_destroy(encoder_);
        encoder_ = nullptr;
    }
}

std::optional<std::vector<uint8_t>> OpusFrameEncoder::encode(const std::vector<uint8_t>& pcmFrame) {
    auto samples = bytesToSamples(pcmFrame.data(), pcmFrame.size());
    int frameSize = static_cast<int>(samples.size() / config_.channels);

    std::vector<uint8_t> packet(config_.maxPacketBytes);
    opus_int32 written = opus_encode(encoder_, samples.data(), frameSize,
                                     packet.data(), static_cast<opus_int32>(packet.size()));
    if (written < 0) {
        lastError_ = opus_strerror(written);
        return std::nullopt;
    }

    packet.resize(static_cast<size_t>(written));
    return packet;
}

} // namespace vani::core::audio
