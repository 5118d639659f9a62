#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vani {

// Sample encodings that flow through the bridge
enum class AudioEncoding {
    PCM16,      // signed 16-bit little-endian linear PCM
    MULAW,      // G.711 mu-law, 8 bits per sample
    ALAW,       // G.711 A-law, 8 bits per sample
    WAV,        // RIFF/WAVE container, parameters taken from the header
    OPUS        // one opus packet per frame
};

struct AudioFormat {
    AudioEncoding encoding = AudioEncoding::PCM16;
    uint32_t sampleRate = 16000;
    uint16_t channels = 1;

    bool operator==(const AudioFormat& other) const {
        return encoding == other.encoding && sampleRate == other.sampleRate &&
               channels == other.channels;
    }
    bool operator!=(const AudioFormat& other) const { return !(*this == other); }
};

std::string audioEncodingToString(AudioEncoding encoding);

/**
 * @brief Immutable chunk of audio tagged with its format
 *
 * The payload is shared between copies and never mutated after construction;
 * processing stages build new frames.
 */
class AudioFrame {
public:
    AudioFrame() : data_(std::make_shared<const std::vector<uint8_t>>()) {}
    AudioFrame(std::vector<uint8_t> data, AudioFormat format)
        : data_(std::make_shared<const std::vector<uint8_t>>(std::move(data))), format_(format) {}

    const std::vector<uint8_t>& bytes() const { return *data_; }
    const uint8_t* data() const { return data_->data(); }
    size_t size() const { return data_->size(); }
    bool empty() const { return data_->empty(); }
    const AudioFormat& format() const { return format_; }

private:
    std::shared_ptr<const std::vector<uint8_t>> data_;
    AudioFormat format_;
};

namespace audio_constants {
constexpr uint32_t DEVICE_INPUT_SAMPLE_RATE = 16000;
constexpr uint32_t DEVICE_OUTPUT_SAMPLE_RATE = 24000;
constexpr uint16_t DEVICE_CHANNELS = 1;
constexpr uint32_t FRAME_DURATION_MS = 120;
constexpr size_t BYTES_PER_SAMPLE = 2;
// 24000 Hz * 120 ms * 2 bytes
constexpr size_t FRAME_SIZE_BYTES =
    DEVICE_OUTPUT_SAMPLE_RATE * FRAME_DURATION_MS / 1000 * BYTES_PER_SAMPLE;
} // namespace audio_constants

} // namespace vani
