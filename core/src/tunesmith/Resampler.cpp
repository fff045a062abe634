#include "tunesmith/Resampler.h"

#include <algorithm>
#include <cmath>

namespace tunesmith::resampler {

bool isUnity(const double ratio) noexcept
{
    return std::abs(ratio - 1.0) < kUnityTolerance;
}

double clampRatio(const double ratio, Error* outError) noexcept
{
    if (!std::isfinite(ratio) || ratio <= 0.0) {
        reportError(outError, Error::kExtremePitchShift);
        return 1.0;
    }
    if (ratio < kMinRatio || ratio > kMaxRatio) {
        reportError(outError, Error::kExtremePitchShift);
        return std::clamp(ratio, kMinRatio, kMaxRatio);
    }
    return ratio;
}

float sampleAt(const float* input, const std::size_t length, const double position) noexcept
{
    if (length == 0 || position < 0.0 || !std::isfinite(position)) {
        return 0.0F;
    }
    const double floorPos = std::floor(position);
    if (floorPos >= static_cast<double>(length)) {
        return 0.0F;
    }
    const auto i = static_cast<std::size_t>(floorPos);
    const auto frac = static_cast<float>(position - floorPos);
    const float a = input[i];
    if (frac == 0.0F) {
        return a;
    }
    const float b = (i + 1 < length) ? input[i + 1] : 0.0F;
    return a + frac * (b - a);
}

void resample(const float* input, const std::size_t inputLength, const double ratio,
              float* output, const std::size_t outputLength) noexcept
{
    if (isUnity(ratio)) {
        const std::size_t copied = std::min(inputLength, outputLength);
        std::copy(input, input + copied, output);
        std::fill(output + copied, output + outputLength, 0.0F);
        return;
    }
    for (std::size_t j = 0; j < outputLength; ++j) {
        output[j] = sampleAt(input, inputLength, static_cast<double>(j) * ratio);
    }
}

std::vector<float> resample(const std::vector<float>& input, const double ratio,
                            const std::size_t outputLength)
{
    std::vector<float> output(outputLength, 0.0F);
    resample(input.data(), input.size(), ratio, output.data(), outputLength);
    return output;
}

}  // namespace tunesmith::resampler
