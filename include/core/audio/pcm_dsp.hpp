#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vani::core::audio {

// Little-endian byte <-> sample conversion. A trailing odd byte is ignored.
std::vector<int16_t> bytesToSamples(const uint8_t* data, size_t size);
std::vector<uint8_t> samplesToBytes(const std::vector<int16_t>& samples);

/// Average interleaved channels down to mono.
std::vector<int16_t> downmixToMono(const std::vector<int16_t>& interleaved, uint16_t channels);

/**
 * Linear-interpolation resampler.
 *
 * Output sample i is taken at source position i * sourceRate / targetRate,
 * interpolating between the two neighbouring source samples. Output length is
 * round(input.size() * targetRate / sourceRate). Positions past the last
 * source sample hold the last sample.
 */
std::vector<int16_t> resampleLinear(const std::vector<int16_t>& input,
                                    uint32_t sourceRate, uint32_t targetRate);

size_t resampledLength(size_t inputLength, uint32_t sourceRate, uint32_t targetRate);

/**
 * Apply gainDb to every sample, then hard-limit to ceiling * full scale.
 * @param ceiling fraction of full scale in (0, 1]
 */
std::vector<int16_t> applyGainLimiter(std::vector<int16_t> samples, float gainDb, float ceiling);

} // namespace vani::core::audio
