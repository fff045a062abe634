#pragma once

#include <cstdint>

#include "tunesmith/Wavetable.h"

namespace tunesmith {

enum class Waveform {
    kSine = 0,
    kSawtooth,
    kSquare,
    kTriangle,
    kNoise,
    kCustom,
};

// Returns the band-limited preset table for a tonal waveform. Noise and
// custom waveforms have no preset and map to the sine table.
[[nodiscard]] const Wavetable& presetTableFor(Waveform waveform);

// Phase-accumulating wavetable oscillator. The phase is kept in double
// precision and advanced as phase = fract(phase + frequency / rate).
class Oscillator {
public:
    Oscillator(Wavetable table, double sampleRate) noexcept;

    // Returns the sample at the current phase, then advances the phase
    // for the given frequency.
    float next(double frequencyHz) noexcept;

    // Renders `numSamples` consecutive samples at a fixed frequency.
    void render(float* dst, int numSamples, double frequencyHz) noexcept;

    void reset(double phase = 0.0) noexcept;

    [[nodiscard]] double phase() const noexcept { return phase_; }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

private:
    Wavetable table_;
    double sampleRate_;
    double phase_{0.0};
};

// White noise in [-1, 1] from a xorshift32 generator. Seeded per voice
// so renders are reproducible; a zero seed is replaced by a fixed
// non-zero constant because xorshift never leaves the zero state.
class NoiseGenerator {
public:
    explicit NoiseGenerator(std::uint32_t seed = 0x12345678u) noexcept;

    float next() noexcept;
    void render(float* dst, int numSamples) noexcept;

private:
    std::uint32_t state_;
};

}  // namespace tunesmith
