#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sample_converter {

// Clamps to [-1, 1] and scales by 32767.
std::vector<int16_t> FloatToPcm16(const float* input, size_t count);
std::vector<float> Pcm16ToFloat(const int16_t* input, size_t count);

// Linear interpolation resampler, good enough to feed the recognizer.
std::vector<float> Resample(const float* input, size_t inputSamples,
                            unsigned int inputRate, unsigned int outputRate);

} // namespace sample_converter
