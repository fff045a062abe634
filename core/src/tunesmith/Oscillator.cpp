#include "tunesmith/Oscillator.h"

#include <cmath>
#include <utility>

namespace tunesmith {

const Wavetable& presetTableFor(const Waveform waveform)
{
    switch (waveform) {
        case Waveform::kSawtooth:
            return Wavetable::sawBandlimited();
        case Waveform::kSquare:
            return Wavetable::squareBandlimited();
        case Waveform::kTriangle:
            return Wavetable::triangleBandlimited();
        case Waveform::kSine:
        case Waveform::kNoise:
        case Waveform::kCustom:
            break;
    }
    return Wavetable::sine();
}

Oscillator::Oscillator(Wavetable table, const double sampleRate) noexcept
    : table_(std::move(table)), sampleRate_(sampleRate)
{
}

float Oscillator::next(const double frequencyHz) noexcept
{
    const float value = table_.lookup(phase_);
    phase_ += frequencyHz / sampleRate_;
    phase_ -= std::floor(phase_);
    return value;
}

void Oscillator::render(float* dst, const int numSamples,
                        const double frequencyHz) noexcept
{
    const double increment = frequencyHz / sampleRate_;
    for (int i = 0; i < numSamples; ++i) {
        dst[i] = table_.lookup(phase_);
        phase_ += increment;
        phase_ -= std::floor(phase_);
    }
}

void Oscillator::reset(const double phase) noexcept
{
    phase_ = phase - std::floor(phase);
}

NoiseGenerator::NoiseGenerator(const std::uint32_t seed) noexcept
    : state_(seed != 0 ? seed : 0x12345678u)
{
}

float NoiseGenerator::next() noexcept
{
    std::uint32_t x = state_;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    state_ = x;
    // Map to [-1, 1].
    return static_cast<float>(x) * (2.0F / 4294967295.0F) - 1.0F;
}

void NoiseGenerator::render(float* dst, const int numSamples) noexcept
{
    for (int i = 0; i < numSamples; ++i) {
        dst[i] = next();
    }
}

}  // namespace tunesmith
