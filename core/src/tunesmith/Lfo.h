#pragma once

#include <optional>

#include "tunesmith/Oscillator.h"
#include "tunesmith/Types.h"

namespace tunesmith {

// Low-frequency oscillator evaluated as a pure function of time since
// voice start. Rate is clamped to [0.01, 100] Hz, depth to [0, 1] and
// the phase offset is expressed in cycles.
//
// Sawtooth, square and triangle shapes are the plain geometric ones;
// they are sub-audio so band-limiting is unnecessary. Noise is a
// sample-and-hold value that changes once per cycle.
class Lfo {
public:
    Lfo() noexcept = default;
    Lfo(Waveform waveform, float rateHz, float depth, float phaseOffset = 0.0F) noexcept;

    // Raw waveform value in [-1, 1].
    [[nodiscard]] float rawAt(double seconds) const noexcept;

    // Depth-scaled value in [0, 1], centred on 0.5.
    [[nodiscard]] float valueAt(double seconds) const noexcept;

    // Depth-scaled value in [-1, 1], centred on 0.
    [[nodiscard]] float bipolarAt(double seconds) const noexcept;

    [[nodiscard]] Waveform waveform() const noexcept { return waveform_; }
    [[nodiscard]] float rate() const noexcept { return rate_; }
    [[nodiscard]] float depth() const noexcept { return depth_; }
    [[nodiscard]] float phaseOffset() const noexcept { return phaseOffset_; }

private:
    Waveform waveform_{Waveform::kSine};
    float rate_{1.0F};
    float depth_{1.0F};
    float phaseOffset_{0.0F};
};

enum class ModTarget {
    kFilterCutoff = 0,
    kFilterResonance,
    kVolume,
    kPitch,
    kPan,
};

// Routes one LFO to one voice parameter. `amount` in [0, 1] scales the
// modulation range of the target:
//   cutoff     +/- 48 semitones
//   resonance  +/- 0.5
//   volume     tremolo between (1 - amount) and 1
//   pitch      +/- 100 cents (returned as a frequency multiplier)
//   pan        +/- 1
// Pan routes are applied by the mixer, all others by the renderer.
struct ModRoute {
    Lfo lfo{};
    ModTarget target{ModTarget::kFilterCutoff};
    float amount{0.5F};

    [[nodiscard]] static std::optional<ModRoute> create(
        const Lfo& lfo, ModTarget target, float amount, Error* outError = nullptr);

    // Applies the route at `seconds` to a base parameter value.
    [[nodiscard]] float apply(float base, double seconds) const noexcept;
};

}  // namespace tunesmith
