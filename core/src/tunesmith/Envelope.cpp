#include "tunesmith/Envelope.h"

#include <algorithm>
#include <cmath>

#include <juce_core/juce_core.h>

namespace tunesmith {

namespace {

float shapeProgress(const EnvelopeCurve curve, const double progress) noexcept
{
    const double p = juce::jlimit(0.0, 1.0, progress);
    switch (curve) {
        case EnvelopeCurve::kExponential: {
            static const double norm = 1.0 - std::exp(-4.0);
            return static_cast<float>((1.0 - std::exp(-4.0 * p)) / norm);
        }
        case EnvelopeCurve::kLogarithmic:
            return static_cast<float>(std::sqrt(p));
        case EnvelopeCurve::kLinear:
            break;
    }
    return static_cast<float>(p);
}

// Attack/decay/sustain level while the note is held.
float gateLevel(const Envelope& env, const double t) noexcept
{
    const auto attack = static_cast<double>(env.attack);
    const auto decay = static_cast<double>(env.decay);
    if (t < attack) {
        return shapeProgress(env.curve, t / attack);
    }
    if (t < attack + decay) {
        const float p = shapeProgress(env.curve, (t - attack) / decay);
        return 1.0F - (1.0F - env.sustain) * p;
    }
    return env.sustain;
}

bool validTime(const float value) noexcept
{
    return std::isfinite(value) && value >= 0.0F;
}

}  // namespace

std::optional<Envelope> Envelope::create(const float attack, const float decay,
                                         const float sustain, const float release,
                                         const EnvelopeCurve curve, Error* outError)
{
    if (!validTime(attack) || !validTime(decay) || !validTime(release) ||
        !std::isfinite(sustain) || sustain < 0.0F || sustain > 1.0F) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }

    Envelope env;
    env.attack = std::max(attack, kMinTime);
    env.decay = std::max(decay, kMinTime);
    env.sustain = sustain;
    env.release = std::max(release, kMinTime);
    env.curve = curve;
    return env;
}

Envelope Envelope::piano()
{
    return Envelope{0.005F, 0.2F, 0.3F, 0.3F, EnvelopeCurve::kLinear};
}

Envelope Envelope::organ()
{
    return Envelope{0.001F, 0.001F, 1.0F, 0.05F, EnvelopeCurve::kLinear};
}

Envelope Envelope::pad()
{
    return Envelope{0.5F, 0.3F, 0.8F, 0.8F, EnvelopeCurve::kLinear};
}

Envelope Envelope::pluck()
{
    return Envelope{0.001F, 0.05F, 0.2F, 0.1F, EnvelopeCurve::kLinear};
}

bool Envelope::isValid() const noexcept
{
    return std::isfinite(attack) && attack >= kMinTime &&
           std::isfinite(decay) && decay >= kMinTime &&
           std::isfinite(release) && release >= kMinTime &&
           std::isfinite(sustain) && sustain >= 0.0F && sustain <= 1.0F;
}

float Envelope::amplitudeAt(const double seconds, const double noteDuration) const noexcept
{
    if (seconds < 0.0) {
        return 0.0F;
    }
    if (seconds < noteDuration) {
        return gateLevel(*this, seconds);
    }

    const double sinceRelease = seconds - noteDuration;
    const auto releaseTime = static_cast<double>(release);
    if (sinceRelease >= releaseTime) {
        return 0.0F;
    }
    const float start = gateLevel(*this, std::max(noteDuration, 0.0));
    return start * (1.0F - shapeProgress(curve, sinceRelease / releaseTime));
}

std::optional<FilterEnvelope> FilterEnvelope::create(
    const Envelope& shape, const float base_cutoff, const float peak_cutoff,
    const float amount, Error* outError)
{
    if (!shape.isValid() || !std::isfinite(base_cutoff) || base_cutoff <= 0.0F ||
        !std::isfinite(peak_cutoff) || peak_cutoff <= 0.0F ||
        !std::isfinite(amount) || amount < 0.0F || amount > 1.0F) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    return FilterEnvelope{shape, base_cutoff, peak_cutoff, amount};
}

FilterEnvelope FilterEnvelope::pluck()
{
    return FilterEnvelope{Envelope{0.001F, 0.15F, 0.1F, 0.2F}, 300.0F, 4000.0F, 1.0F};
}

FilterEnvelope FilterEnvelope::pad()
{
    return FilterEnvelope{Envelope{0.8F, 0.5F, 0.7F, 1.0F}, 400.0F, 3000.0F, 0.8F};
}

FilterEnvelope FilterEnvelope::bass()
{
    return FilterEnvelope{Envelope{0.01F, 0.2F, 0.4F, 0.3F}, 100.0F, 800.0F, 1.0F};
}

float FilterEnvelope::cutoffAt(const double seconds, const double noteDuration) const noexcept
{
    if (amount == 0.0F) {
        return base_cutoff;
    }
    const double env = shape.amplitudeAt(seconds, noteDuration);
    const double lnBase = std::log(static_cast<double>(base_cutoff));
    const double lnPeak = std::log(static_cast<double>(peak_cutoff));
    const double cutoff = std::exp(lnBase + (lnPeak - lnBase) * env * static_cast<double>(amount));
    return static_cast<float>(juce::jlimit(20.0, 20000.0, cutoff));
}

}  // namespace tunesmith
