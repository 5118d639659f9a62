#include "core/audio/transcoding_pipeline.hpp"
#include "core/audio/g711_codec.hpp"
#include "core/audio/pcm_dsp.hpp"
#include "core/audio/wav_container.hpp"
#include "system/errors.hpp"
#include "system/logger.hpp"

namespace vani::core::audio {

std::atomic<uint64_t> TranscodingPipeline::s_skippedFrames{0};

TranscodingPipeline::TranscodingPipeline() : TranscodingPipeline(Config{}) {}

TranscodingPipeline::TranscodingPipeline(const Config& config) : config_(config) {}

std::vector<int16_t> TranscodingPipeline::toDevicePcm(const AudioFrame& input, const GainSettings& gain) const {
    const uint8_t* payload = input.data();
    size_t payloadSize = input.size();
    AudioEncoding encoding = input.format().encoding;
    uint32_t sampleRate = input.format().sampleRate;
    uint16_t channels = input.format().channels;

    if (encoding == AudioEncoding::WAV) {
        auto info = parseWavContainer(payload, payloadSize);
        if (!info) {
            throw BridgeError(ErrorCode::TranscodeFailure, "unreadable WAV container");
        }
        payload += info->dataOffset;
        payloadSize = info->dataSize;
        encoding = info->encoding;
        sampleRate = info->sampleRate;
        channels = info->channels;
    }

    std::vector<int16_t> samples;
    switch (encoding) {
        case AudioEncoding::PCM16:
            samples = bytesToSamples(payload, payloadSize);
            break;
        case AudioEncoding::MULAW:
        case AudioEncoding::ALAW:
            samples = decodeCompanded(payload, payloadSize, encoding);
            break;
        default:
            throw BridgeError(ErrorCode::TranscodeFailure,
                              "cannot transcode " + audioEncodingToString(encoding) + " input");
    }

    if (sampleRate == 0) {
        throw BridgeError(ErrorCode::TranscodeFailure, "input declares a zero sample rate");
    }

    samples = downmixToMono(samples, channels);
    samples = resampleLinear(samples, sampleRate, config_.outputSampleRate);
    if (gain.gainDb != 0.0f || gain.ceiling < 1.0f) {
        samples = applyGainLimiter(std::move(samples), gain.gainDb, gain.ceiling);
    }
    return samples;
}

std::vector<uint8_t> TranscodingPipeline::toDeviceBytes(const AudioFrame& input, const GainSettings& gain) const {
    return samplesToBytes(toDevicePcm(input, gain));
}

AudioFrame TranscodingPipeline::toProviderFormat(const AudioFrame& deviceFrame, uint32_t targetRate) const {
    const AudioFormat& format = deviceFrame.format();
    if (format.sampleRate == targetRate || format.encoding != AudioEncoding::PCM16) {
        return deviceFrame;
    }

    auto samples = bytesToSamples(deviceFrame.data(), deviceFrame.size());
    samples = downmixToMono(samples, format.channels);
    auto resampled = resampleLinear(samples, format.sampleRate, targetRate);

    AudioFormat target{AudioEncoding::PCM16, targetRate, 1};
    return AudioFrame(samplesToBytes(resampled), target);
}

std::vector<std::vector<uint8_t>> TranscodingPipeline::encodeFrames(
    const std::vector<std::vector<uint8_t>>& pcmFrames, FrameEncoder& encoder, EncodeStats* stats) const {
    std::vector<std::vector<uint8_t>> packets;
    packets.reserve(pcmFrames.size());

    for (size_t i = 0; i < pcmFrames.size(); ++i) {
        auto packet = encoder.encode(pcmFrames[i]);
        if (!packet) {
            s_skippedFrames.fetch_add(1);
            Logger::countFailure("transcode");
            Logger::warning("TranscodingPipeline: frame {} of {} failed to encode, skipping",
                            i + 1, pcmFrames.size());
            if (stats) {
                stats->framesSkipped++;
            }
            continue;
        }
        if (stats) {
            stats->framesEncoded++;
        }
        packets.push_back(std::move(*packet));
    }
    return packets;
}

uint32_t TranscodingPipeline::frameDurationMs() const {
    uint64_t samples = config_.frameBytes / audio_constants::BYTES_PER_SAMPLE;
    return static_cast<uint32_t>(samples * 1000 / config_.outputSampleRate);
}

uint64_t TranscodingPipeline::totalSkippedFrames() {
    return s_skippedFrames.load();
}

} // namespace vani::core::audio
