#pragma once

#include <cstddef>
#include <vector>

namespace tunesmith::wsola {

inline constexpr double kDefaultWindowSeconds = 0.030;

// Waveform Similarity Overlap-Add time stretch of an interleaved buffer.
//
// Grains are Hann-windowed. The input hop is a quarter of the window
// and the output hop is the input hop times `factor`. Each grain is
// taken from within half a window of its nominal input position, at the
// offset whose waveform best matches the natural continuation of the
// previous grain over the region where the two overlap (correlation on
// the mono mix). The summed grains are divided by the summed window.
//
// Returns round(frames * factor) frames. `factor` must be positive.
[[nodiscard]] std::vector<float> timeStretch(const float* interleaved, std::size_t frames,
                                             int channels, int sampleRate, double factor,
                                             double windowSeconds = kDefaultWindowSeconds);

}  // namespace tunesmith::wsola
