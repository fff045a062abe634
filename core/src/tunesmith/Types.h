#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace tunesmith {

// Reference sample rate used when a component is not told otherwise.
inline constexpr int kDefaultSampleRate = 44100;

// Error taxonomy shared by every component. Factories report one of
// these through an optional `Error*` out-parameter; render-time code
// carries it inside RenderResult.
enum class Error {
    kInvalidParameter = 0,
    kInvalidWavetable,
    kCacheFull,
    kExtremePitchShift,
    kRenderAborted,
};

// Short human-readable name, suitable for log lines.
[[nodiscard]] const char* errorToString(Error error) noexcept;

// Number of frames covering `seconds` at `sampleRate`, rounded up.
// Products that land within float rounding noise of a whole frame
// count as that frame, so 1.1 s at 44.1 kHz is 48510 frames even
// though 1.1F is slightly above 1.1. The tolerance grows with the
// float error of the duration but is capped at a quarter frame, so a
// real fraction of a frame is never rounded away.
[[nodiscard]] inline std::size_t framesForDuration(const double seconds,
                                                   const int sampleRate) noexcept
{
    if (!(seconds > 0.0) || sampleRate <= 0) {
        return 0;
    }
    const double exact = seconds * static_cast<double>(sampleRate);
    const double nearest = std::round(exact);
    const double tolerance = std::min(1.0e-3 + exact * 2.5e-7, 0.25);
    if (std::abs(exact - nearest) <= tolerance) {
        return static_cast<std::size_t>(nearest);
    }
    return static_cast<std::size_t>(std::ceil(exact));
}

// Writes `error` into `outError` when the caller asked for it.
inline void reportError(Error* outError, Error error) noexcept
{
    if (outError != nullptr) {
        *outError = error;
    }
}

}  // namespace tunesmith
