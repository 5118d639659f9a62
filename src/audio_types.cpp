#include "audio_types.hpp"

namespace vani {

std::string audioEncodingToString(AudioEncoding encoding) {
    switch (encoding) {
        case AudioEncoding::PCM16: return "pcm16";
        case AudioEncoding::MULAW: return "mulaw";
        case AudioEncoding::ALAW: return "alaw";
        case AudioEncoding::WAV: return "wav";
        case AudioEncoding::OPUS: return "opus";
    }
    return "unknown";
}

} // namespace vani
