#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "audio_types.hpp"

namespace vani::core::audio {

/**
 * ITU-T G.711 expansion to 16-bit linear PCM.
 * Arithmetic expansion, bit-exact with the reference tables
 * (mu-law 0xFF -> 0, 0x00 -> -32124; A-law 0xD5 -> 8, 0x2A -> -32256).
 */
int16_t decodeMuLaw(uint8_t sample);
int16_t decodeALaw(uint8_t sample);

/// Expand a companded buffer. encoding must be MULAW or ALAW.
std::vector<int16_t> decodeCompanded(const uint8_t* data, size_t size, AudioEncoding encoding);

} // namespace vani::core::audio
