#include "tunesmith/Lfo.h"

#include <cmath>
#include <cstdint>

#include <juce_core/juce_core.h>

#include "tunesmith/Wavetable.h"

namespace tunesmith {

namespace {

// Deterministic value in [-1, 1] for a given cycle index.
float holdValueForCycle(const std::int64_t cycle) noexcept
{
    auto x = static_cast<std::uint32_t>(cycle) * 0x9E3779B9u + 0x12345678u;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    return static_cast<float>(x) * (2.0F / 4294967295.0F) - 1.0F;
}

}  // namespace

Lfo::Lfo(const Waveform waveform, const float rateHz, const float depth,
         const float phaseOffset) noexcept
    : waveform_(waveform),
      rate_(std::isfinite(rateHz) ? juce::jlimit(0.01F, 100.0F, rateHz) : 1.0F),
      depth_(std::isfinite(depth) ? juce::jlimit(0.0F, 1.0F, depth) : 0.0F),
      phaseOffset_(std::isfinite(phaseOffset) ? phaseOffset : 0.0F)
{
}

float Lfo::rawAt(const double seconds) const noexcept
{
    const double cycles = seconds * static_cast<double>(rate_) + static_cast<double>(phaseOffset_);
    const double phase = cycles - std::floor(cycles);

    switch (waveform_) {
        case Waveform::kSawtooth:
            return static_cast<float>(2.0 * phase - 1.0);
        case Waveform::kSquare:
            return phase < 0.5 ? 1.0F : -1.0F;
        case Waveform::kTriangle:
            return static_cast<float>(phase < 0.5 ? 4.0 * phase - 1.0 : 3.0 - 4.0 * phase);
        case Waveform::kNoise:
            return holdValueForCycle(static_cast<std::int64_t>(std::floor(cycles)));
        case Waveform::kSine:
        case Waveform::kCustom:
            break;
    }
    return Wavetable::sine().lookup(phase);
}

float Lfo::valueAt(const double seconds) const noexcept
{
    const float raw = rawAt(seconds);
    return (raw * 0.5F + 0.5F) * depth_ + 0.5F * (1.0F - depth_);
}

float Lfo::bipolarAt(const double seconds) const noexcept
{
    return rawAt(seconds) * depth_;
}

std::optional<ModRoute> ModRoute::create(const Lfo& lfo, const ModTarget target,
                                         const float amount, Error* outError)
{
    if (!std::isfinite(amount) || amount < 0.0F || amount > 1.0F) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    return ModRoute{lfo, target, amount};
}

float ModRoute::apply(const float base, const double seconds) const noexcept
{
    const float mod = lfo.bipolarAt(seconds);
    switch (target) {
        case ModTarget::kFilterCutoff:
            return base * std::exp2(mod * amount * 48.0F / 12.0F);
        case ModTarget::kFilterResonance:
            return juce::jlimit(0.0F, 0.99F, base + mod * amount * 0.5F);
        case ModTarget::kVolume:
            return base * (1.0F - amount * (1.0F - lfo.valueAt(seconds)));
        case ModTarget::kPitch:
            return base * std::exp2(mod * amount * 100.0F / 1200.0F);
        case ModTarget::kPan:
            return juce::jlimit(-1.0F, 1.0F, base + mod * amount);
    }
    return base;
}

}  // namespace tunesmith
