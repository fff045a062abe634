#include "tunesmith/FmSynthesis.h"

#include <algorithm>
#include <cmath>

#include "tunesmith/Wavetable.h"

namespace tunesmith {

namespace {

FmParams preset(const float ratio, const float index, const Envelope& env,
                const float amount)
{
    FmParams params;
    params.mod_ratio = ratio;
    params.mod_index = index;
    params.index_envelope = env;
    params.index_envelope_amount = amount;
    return params;
}

}  // namespace

std::optional<FmParams> FmParams::create(const float mod_ratio, const float mod_index,
                                         Error* outError)
{
    return withIndexEnvelope(mod_ratio, mod_index, Envelope{}, 0.0F, outError);
}

std::optional<FmParams> FmParams::withIndexEnvelope(
    const float mod_ratio, const float mod_index, const Envelope& envelope,
    const float amount, Error* outError)
{
    if (!std::isfinite(mod_ratio) || mod_ratio <= 0.0F || !std::isfinite(mod_index) ||
        mod_index < 0.0F || !envelope.isValid() || !std::isfinite(amount) ||
        amount < 0.0F || amount > 1.0F) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    return preset(std::max(mod_ratio, 0.01F), mod_index, envelope, amount);
}

FmParams FmParams::electricPiano()
{
    return preset(1.0F, 2.5F, Envelope{0.001F, 0.8F, 0.2F, 0.5F}, 0.9F);
}

FmParams FmParams::bell()
{
    return preset(3.5F, 8.0F, Envelope{0.001F, 1.2F, 0.1F, 0.8F}, 0.95F);
}

FmParams FmParams::brass()
{
    return preset(1.0F, 5.0F, Envelope{0.05F, 0.2F, 0.8F, 0.3F}, 0.8F);
}

FmParams FmParams::bass()
{
    return preset(1.0F, 1.2F, Envelope{0.001F, 0.15F, 0.6F, 0.2F}, 0.7F);
}

FmParams FmParams::metallicPad()
{
    return preset(2.414F, 4.0F, Envelope{0.8F, 0.5F, 0.7F, 1.0F}, 0.6F);
}

FmParams FmParams::growl()
{
    return preset(0.5F, 6.0F, Envelope{0.001F, 0.3F, 0.5F, 0.2F}, 0.85F);
}

bool FmParams::isValid() const noexcept
{
    return std::isfinite(mod_ratio) && mod_ratio > 0.0F && std::isfinite(mod_index) &&
           mod_index >= 0.0F && index_envelope.isValid() &&
           std::isfinite(index_envelope_amount) && index_envelope_amount >= 0.0F &&
           index_envelope_amount <= 1.0F;
}

float FmParams::indexAt(const double seconds, const double noteDuration) const noexcept
{
    if (index_envelope_amount <= 0.0F) {
        return mod_index;
    }
    const float env = index_envelope.amplitudeAt(seconds, noteDuration);
    return mod_index * (1.0F - index_envelope_amount + env * index_envelope_amount);
}

float FmParams::sample(const double carrierHz, const double seconds,
                       const double noteDuration) const noexcept
{
    return sampleAtPhase(seconds * carrierHz, seconds * carrierHz * static_cast<double>(mod_ratio),
                         seconds, noteDuration);
}

float FmParams::sampleAtPhase(const double carrierPhase, const double modPhase,
                              const double seconds, const double noteDuration) const noexcept
{
    const Wavetable& sine = Wavetable::sine();
    if (mod_index == 0.0F) {
        return sine.lookup(carrierPhase);
    }

    const double mod = sine.lookup(modPhase);
    const double index = indexAt(seconds, noteDuration);
    return sine.lookup(carrierPhase + mod * index * modPhase);
}

float additiveSample(const std::vector<Partial>& partials, const double frequencyHz,
                     const double seconds) noexcept
{
    return additiveSampleAtPhase(partials, seconds * frequencyHz);
}

float additiveSampleAtPhase(const std::vector<Partial>& partials,
                            const double fundamentalPhase) noexcept
{
    if (partials.empty()) {
        return 0.0F;
    }
    const Wavetable& sine = Wavetable::sine();
    double sum = 0.0;
    for (const Partial& partial : partials) {
        const double phase = fundamentalPhase * static_cast<double>(partial.ratio) +
                             static_cast<double>(partial.phase);
        sum += static_cast<double>(sine.lookup(phase)) * static_cast<double>(partial.amplitude);
    }
    return static_cast<float>(sum / static_cast<double>(partials.size()));
}

}  // namespace tunesmith
