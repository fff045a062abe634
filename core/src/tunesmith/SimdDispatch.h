#pragma once

#include <cstddef>
#include <optional>
#include <utility>

namespace tunesmith {

enum class SimdLevel {
    kScalar = 0,
    kSse,
    kNeon,
    kAvx2,
};

namespace simd {

// CPU features are detected once, on first use, through
// juce::SystemStats. AVX2 selects 8 lanes, SSE4.1 or NEON 4 lanes,
// anything else falls back to scalar code.
[[nodiscard]] SimdLevel detectedLevel() noexcept;

// Level used by the kernels: the detected one unless a test forced
// another through setLevelOverride(). Forcing a level wider than the
// CPU supports is ignored.
[[nodiscard]] SimdLevel activeLevel() noexcept;
void setLevelOverride(std::optional<SimdLevel> level) noexcept;

[[nodiscard]] int laneWidth(SimdLevel level) noexcept;
[[nodiscard]] const char* levelName(SimdLevel level) noexcept;

namespace detail {

template <int Lanes, typename Fn>
void processLanes(float* buffer, const std::size_t count, Fn& fn)
{
    std::size_t i = 0;
    if constexpr (Lanes > 1) {
        const std::size_t whole = count - count % static_cast<std::size_t>(Lanes);
        for (; i < whole; i += static_cast<std::size_t>(Lanes)) {
            float* lane = buffer + i;
            for (int k = 0; k < Lanes; ++k) {
                lane[k] = fn(lane[k]);
            }
        }
    }
    for (; i < count; ++i) {
        buffer[i] = fn(buffer[i]);
    }
}

}  // namespace detail

// Applies `fn(sample) -> sample` to every element in chunks of the
// active lane width, then a scalar remainder loop. The fixed-width
// inner loop is what lets the compiler vectorise `fn`.
template <typename Fn>
void process(float* buffer, const std::size_t count, Fn&& fn)
{
    switch (laneWidth(activeLevel())) {
        case 8:
            detail::processLanes<8>(buffer, count, fn);
            break;
        case 4:
            detail::processLanes<4>(buffer, count, fn);
            break;
        default:
            detail::processLanes<1>(buffer, count, fn);
            break;
    }
}

// Hand-written kernels for the hot loops of the renderer and mixer.
void multiply(float* dst, const float* src, std::size_t count) noexcept;             // dst *= src
void scale(float* dst, float gain, std::size_t count) noexcept;                      // dst *= gain
void multiplyAdd(float* dst, const float* src, float gain, std::size_t count) noexcept;  // dst += src * gain

}  // namespace simd

}  // namespace tunesmith
