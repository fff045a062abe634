#pragma once

#include <cstddef>
#include <vector>

#include "tunesmith/Types.h"

namespace tunesmith::resampler {

// Playback ratios are limited to four octaves either way.
inline constexpr double kMinRatio = 0.0625;
inline constexpr double kMaxRatio = 16.0;

// Ratios closer to 1 than this are played back without interpolation.
inline constexpr double kUnityTolerance = 1.0e-4;

[[nodiscard]] bool isUnity(double ratio) noexcept;

// Clamps `ratio` into [kMinRatio, kMaxRatio]. When clamping was needed
// (or the ratio was not finite) kExtremePitchShift is reported and the
// clamped value returned; non-finite ratios become 1.
[[nodiscard]] double clampRatio(double ratio, Error* outError = nullptr) noexcept;

// Linear interpolation at fractional index `position`. Positions before
// the start or at/after the end read as silence; the last sample fades
// toward zero, so nothing past input[length - 1] is ever read.
[[nodiscard]] float sampleAt(const float* input, std::size_t length, double position) noexcept;

// Writes `outputLength` samples read at positions j * ratio. A ratio
// within kUnityTolerance of 1 copies the input sample for sample.
void resample(const float* input, std::size_t inputLength, double ratio, float* output,
              std::size_t outputLength) noexcept;

[[nodiscard]] std::vector<float> resample(const std::vector<float>& input, double ratio,
                                          std::size_t outputLength);

}  // namespace tunesmith::resampler
