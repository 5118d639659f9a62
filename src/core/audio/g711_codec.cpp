#include "core/audio/g711_codec.hpp"
#include "system/errors.hpp"

namespace vani::core::audio {

namespace {
constexpr int MULAW_BIAS = 0x84;
constexpr uint8_t ALAW_TOGGLE = 0x55;
} // namespace

int16_t decodeMuLaw(uint8_t sample) {
    uint8_t u = static_cast<uint8_t>(~sample);
    int t = ((u & 0x0F) << 3) + MULAW_BIAS;
    t <<= (u & 0x70) >> 4;
    return static_cast<int16_t>((u & 0x80) ? (MULAW_BIAS - t) : (t - MULAW_BIAS));
}

int16_t decodeALaw(uint8_t sample) {
    uint8_t a = static_cast<uint8_t>(sample ^ ALAW_TOGGLE);
    int t = (a & 0x0F) << 4;
    int segment = (a & 0x70) >> 4;

    switch (segment) {
        case 0:
            t += 8;
            break;
        case 1:
            t += 0x108;
            break;
        default:
            t += 0x108;
            t <<= segment - 1;
            break;
    }
    return static_cast<int16_t>((a & 0x80) ? t : -t);
}

std::vector<int16_t> decodeCompanded(const uint8_t* data, size_t size, AudioEncoding encoding) {
    if (encoding != AudioEncoding::MULAW && encoding != AudioEncoding::ALAW) {
        throw BridgeError(ErrorCode::TranscodeFailure,
                          "decodeCompanded: unsupported encoding " + audioEncodingToString(encoding));
    }

    std::vector<int16_t> out(size);
    if (encoding == AudioEncoding::MULAW) {
        for (size_t i = 0; i < size; ++i) {
            out[i] = decodeMuLaw(data[i]);
        }
    } else {
        for (size_t i = 0; i < size; ++i) {
            out[i] = decodeALaw(data[i]);
        }
    }
    return out;
}

} // namespace vani::core::audio
