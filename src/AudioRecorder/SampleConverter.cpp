#include "SampleConverter.hpp"

#include <algorithm>
#include <cmath>

namespace sample_converter {

std::vector<int16_t> FloatToPcm16(const float* input, size_t count) {
    std::vector<int16_t> output(count);
    for (size_t i = 0; i < count; ++i) {
        float sample = std::max(-1.0f, std::min(1.0f, input[i]));
        output[i] = static_cast<int16_t>(sample * 32767.0f);
    }
    return output;
}

std::vector<float> Pcm16ToFloat(const int16_t* input, size_t count) {
    const float scale = 1.0f / 32768.0f;
    std::vector<float> output(count);
    for (size_t i = 0; i < count; ++i) {
        output[i] = static_cast<float>(input[i]) * scale;
    }
    return output;
}

std::vector<float> Resample(const float* input, size_t inputSamples,
                            unsigned int inputRate, unsigned int outputRate) {
    if (inputSamples == 0) {
        return {};
    }
    if (inputRate == outputRate) {
        return std::vector<float>(input, input + inputSamples);
    }

    const double ratio = static_cast<double>(outputRate) / static_cast<double>(inputRate);
    const size_t outputSamples = static_cast<size_t>(std::round(inputSamples * ratio));
    std::vector<float> output(outputSamples);

    for (size_t i = 0; i < outputSamples; ++i) {
        const double srcIndex = i / ratio;
        const size_t srcIndex0 = static_cast<size_t>(srcIndex);
        if (srcIndex0 >= inputSamples - 1) {
            output[i] = input[inputSamples - 1];
            continue;
        }
        const double t = srcIndex - srcIndex0;
        output[i] = static_cast<float>(input[srcIndex0] * (1.0 - t) + input[srcIndex0 + 1] * t);
    }

    return output;
}

} // namespace sample_converter
