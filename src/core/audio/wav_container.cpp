#include "core/audio/wav_container.hpp"
#include "system/logger.hpp"

#include <algorithm>
#include <cstring>

namespace vani::core::audio {

namespace {

uint16_t readLE16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

bool looksLikeWav(const uint8_t* data, size_t size) {
    return size >= 12 && std::memcmp(data, "RIFF", 4) == 0 && std::memcmp(data + 8, "WAVE", 4) == 0;
}

std::optional<WavInfo> parseWavContainer(const uint8_t* data, size_t size) {
    if (!looksLikeWav(data, size)) {
        Logger::warning("WavContainer: missing RIFF/WAVE signature ({} bytes)", size);
        return std::nullopt;
    }

    WavInfo info;
    bool haveFormat = false;
    bool haveData = false;
    size_t offset = 12;

    while (offset + 8 <= size) {
        const uint8_t* chunk = data + offset;
        uint32_t chunkSize = readLE32(chunk + 4);
        size_t body = offset + 8;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunkSize < 16 || body + 16 > size) {
                Logger::warning("WavContainer: truncated fmt chunk");
                return std::nullopt;
            }
            info.formatTag = readLE16(data + body);
            info.channels = readLE16(data + body + 2);
            info.sampleRate = readLE32(data + body + 4);
            info.bitsPerSample = readLE16(data + body + 14);

            // WAVE_FORMAT_EXTENSIBLE keeps the real tag in the sub-format GUID
            if (info.formatTag == wav_format_tag::EXTENSIBLE && chunkSize >= 40 && body + 26 <= size) {
                info.formatTag = readLE16(data + body + 24);
            }
            haveFormat = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            info.dataOffset = body;
            // Streaming encoders write 0 or 0xFFFFFFFF when the length is unknown
            size_t available = size - body;
            info.dataSize = (chunkSize == 0 || chunkSize > available) ? available : chunkSize;
            haveData = true;
            break;
        }

        // Chunks are word aligned
        size_t advance = 8 + static_cast<size_t>(chunkSize) + (chunkSize & 1u);
        if (advance > size - offset) {
            break;
        }
        offset += advance;
    }

    if (!haveFormat) {
        Logger::warning("WavContainer: no fmt chunk found");
        return std::nullopt;
    }
    if (!haveData) {
        info.dataOffset = std::min(offset, size);
        info.dataSize = size - info.dataOffset;
    }
    if (info.channels == 0) {
        info.channels = 1;
    }

    switch (info.formatTag) {
        case wav_format_tag::PCM:
            if (info.bitsPerSample == 16) {
                info.encoding = AudioEncoding::PCM16;
            } else {
                Logger::warning("WavContainer: {}-bit PCM not supported, treating payload as 16-bit PCM",
                                info.bitsPerSample);
                info.encoding = AudioEncoding::PCM16;
                info.tolerated = true;
            }
            break;
        case wav_format_tag::MULAW:
            info.encoding = AudioEncoding::MULAW;
            break;
        case wav_format_tag::ALAW:
            info.encoding = AudioEncoding::ALAW;
            break;
        default:
            Logger::warning("WavContainer: unsupported format tag {}, treating payload as raw PCM",
                            info.formatTag);
            info.encoding = AudioEncoding::PCM16;
            info.tolerated = true;
            break;
    }

    return info;
}

} // namespace vani::core::audio
