#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "audio_types.hpp"

namespace vani::core::audio {

// RIFF/WAVE format tags understood by the pipeline
namespace wav_format_tag {
constexpr uint16_t PCM = 0x0001;
constexpr uint16_t IEEE_FLOAT = 0x0003;
constexpr uint16_t ALAW = 0x0006;
constexpr uint16_t MULAW = 0x0007;
constexpr uint16_t EXTENSIBLE = 0xFFFE;
} // namespace wav_format_tag

/**
 * Parameters and payload location of a WAV buffer.
 * The payload itself stays in the caller's buffer.
 */
struct WavInfo {
    uint16_t formatTag = 0;
    uint16_t channels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
    size_t dataOffset = 0;
    size_t dataSize = 0;

    /// Encoding the payload is decoded as. Unknown tags resolve to PCM16.
    AudioEncoding encoding = AudioEncoding::PCM16;
    bool tolerated = false;     // unknown tag, payload treated as raw PCM
};

/**
 * Parse the RIFF header and locate the "fmt " and "data" chunks.
 * @return nullopt when the buffer is not a RIFF/WAVE file or lacks a fmt chunk
 */
std::optional<WavInfo> parseWavContainer(const uint8_t* data, size_t size);

inline std::optional<WavInfo> parseWavContainer(const std::vector<uint8_t>& buffer) {
    return parseWavContainer(buffer.data(), buffer.size());
}

bool looksLikeWav(const uint8_t* data, size_t size);

} // namespace vani::core::audio
