#include "tunesmith/Voice.h"

#include <algorithm>
#include <cmath>

namespace tunesmith {

namespace {

bool finiteIn(const float value, const float lo, const float hi) noexcept
{
    return std::isfinite(value) && value >= lo && value <= hi;
}

bool filterEnvelopeOk(const FilterEnvelope& env) noexcept
{
    return env.shape.isValid() && std::isfinite(env.base_cutoff) && env.base_cutoff > 0.0F &&
           std::isfinite(env.peak_cutoff) && env.peak_cutoff > 0.0F &&
           finiteIn(env.amount, 0.0F, 1.0F);
}

}  // namespace

bool VoiceDescriptor::validate(Error* outError) const
{
    const bool partialsOk = std::all_of(partials.begin(), partials.end(), [](const Partial& p) {
        return std::isfinite(p.ratio) && p.ratio > 0.0F && std::isfinite(p.amplitude) &&
               std::isfinite(p.phase);
    });
    const bool routesOk = std::all_of(mod_routes.begin(), mod_routes.end(), [](const ModRoute& r) {
        return finiteIn(r.amount, 0.0F, 1.0F);
    });
    const bool effectsOk =
        std::all_of(effects.effects().begin(), effects.effects().end(),
                    [](const Effect& e) { return isEffectValid(e) && !isSidechained(e); });

    const bool ok = std::isfinite(frequency) && frequency > 0.0F && std::isfinite(duration) &&
                    duration >= 0.0F && finiteIn(velocity, 0.0F, 1.0F) &&
                    finiteIn(pan, -1.0F, 1.0F) && finiteIn(pitch_bend_semitones, -48.0F, 48.0F) &&
                    envelope.isValid() && (!fm || fm->isValid()) && partialsOk && routesOk &&
                    effectsOk && (!filter_envelope || filterEnvelopeOk(*filter_envelope));
    if (!ok) {
        reportError(outError, Error::kInvalidParameter);
        return false;
    }
    if (waveform == Waveform::kCustom && !custom_wavetable) {
        reportError(outError, Error::kInvalidWavetable);
        return false;
    }
    return true;
}

double VoiceDescriptor::effectiveFrequency() const noexcept
{
    return static_cast<double>(frequency) *
           std::exp2(static_cast<double>(pitch_bend_semitones) / 12.0);
}

}  // namespace tunesmith
