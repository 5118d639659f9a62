#include "core/audio/pcm_dsp.hpp"

#include <algorithm>
#include <cmath>

namespace vani::core::audio {

std::vector<int16_t> bytesToSamples(const uint8_t* data, size_t size) {
    std::vector<int16_t> samples(size / 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<int16_t>(data[2 * i] | (data[2 * i + 1] << 8));
    }
    return samples;
}

std::vector<uint8_t> samplesToBytes(const std::vector<int16_t>& samples) {
    std::vector<uint8_t> bytes(samples.size() * 2);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint16_t value = static_cast<uint16_t>(samples[i]);
        bytes[2 * i] = static_cast<uint8_t>(value & 0xFF);
        bytes[2 * i + 1] = static_cast<uint8_t>(value >> 8);
    }
    return bytes;
}

std::vector<int16_t> downmixToMono(const std::vector<int16_t>& interleaved, uint16_t channels) {
    if (channels <= 1) {
        return interleaved;
    }

    size_t frames = interleaved.size() / channels;
    std::vector<int16_t> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        int32_t sum = 0;
        for (uint16_t ch = 0; ch < channels; ++ch) {
            sum += interleaved[f * channels + ch];
        }
        mono[f] = static_cast<int16_t>(sum / channels);
    }
    return mono;
}

size_t resampledLength(size_t inputLength, uint32_t sourceRate, uint32_t targetRate) {
    if (sourceRate == 0) {
        return 0;
    }
    uint64_t scaled = static_cast<uint64_t>(inputLength) * targetRate;
    return static_cast<size_t>((scaled + sourceRate / 2) / sourceRate);
}

std::vector<int16_t> resampleLinear(const std::vector<int16_t>& input,
                                    uint32_t sourceRate, uint32_t targetRate) {
    if (sourceRate == targetRate || input.empty() || sourceRate == 0 || targetRate == 0) {
        return input;
    }

    const size_t outLength = resampledLength(input.size(), sourceRate, targetRate);
    const size_t last = input.size() - 1;
    std::vector<int16_t> output(outLength);

    // Exact rational position: index + remainder / targetRate
    for (size_t i = 0; i < outLength; ++i) {
        uint64_t numerator = static_cast<uint64_t>(i) * sourceRate;
        size_t index = static_cast<size_t>(numerator / targetRate);
        uint64_t remainder = numerator % targetRate;

        if (index >= last) {
            output[i] = input[last];
            continue;
        }
        if (remainder == 0) {
            output[i] = input[index];
            continue;
        }

        double fraction = static_cast<double>(remainder) / targetRate;
        double a = input[index];
        double b = input[index + 1];
        output[i] = static_cast<int16_t>(std::lround(a + (b - a) * fraction));
    }
    return output;
}

std::vector<int16_t> applyGainLimiter(std::vector<int16_t> samples, float gainDb, float ceiling) {
    const double gain = std::pow(10.0, gainDb / 20.0);
    const double limit = std::clamp(static_cast<double>(ceiling), 0.0, 1.0) * 32767.0;

    for (auto& sample : samples) {
        double value = sample * gain;
        value = std::clamp(value, -limit, limit);
        sample = static_cast<int16_t>(std::lround(value));
    }
    return samples;
}

} // namespace vani::core::audio
