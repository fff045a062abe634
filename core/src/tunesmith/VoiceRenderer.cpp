#include "tunesmith/VoiceRenderer.h"

#include <algorithm>

#include "tunesmith/Oscillator.h"
#include "tunesmith/SimdDispatch.h"

namespace tunesmith {

namespace {

constexpr std::uint32_t kNoiseSeed = 0x12345678u;

bool hasRoute(const VoiceDescriptor& voice, const ModTarget target) noexcept
{
    return std::any_of(voice.mod_routes.begin(), voice.mod_routes.end(),
                       [target](const ModRoute& route) { return route.target == target; });
}

float applyRoutes(const VoiceDescriptor& voice, const ModTarget target, float value,
                  const double seconds) noexcept
{
    for (const ModRoute& route : voice.mod_routes) {
        if (route.target == target) {
            value = route.apply(value, seconds);
        }
    }
    return value;
}

}  // namespace

VoiceRenderer::VoiceRenderer(const int sampleRate) noexcept
    : sampleRate_(sampleRate > 0 ? sampleRate : kDefaultSampleRate)
{
}

std::size_t VoiceRenderer::renderLength(const VoiceDescriptor& voice) const noexcept
{
    return framesForDuration(voice.renderDuration(), sampleRate_);
}

std::vector<float> VoiceRenderer::render(const VoiceDescriptor& voice) const
{
    const std::size_t count = renderLength(voice);
    std::vector<float> out(count, 0.0F);
    if (count == 0) {
        return out;
    }

    renderSource(voice, out.data(), count);
    applyEnvelope(voice, out.data(), count);
    applyFilter(voice, out.data(), count);

    if (!voice.effects.empty()) {
        EffectChain chain = voice.effects;
        chain.prepare(static_cast<double>(sampleRate_));
        chain.processBlock(out.data(), static_cast<int>(count));
    }

    simd::scale(out.data(), voice.velocity, count);
    return out;
}

CachedSample VoiceRenderer::renderCached(const VoiceDescriptor& voice) const
{
    // Unpitched noise sounds the same at every frequency; a reference of 0
    // makes the mixer play it back at ratio 1.
    const bool pitched = voice.fm || !voice.partials.empty() || voice.waveform != Waveform::kNoise;
    return CachedSample::create(render(voice), sampleRate_, static_cast<double>(voice.duration),
                                pitched ? voice.effectiveFrequency() : 0.0);
}

void VoiceRenderer::renderSource(const VoiceDescriptor& voice, float* out,
                                 const std::size_t count) const
{
    const auto rate = static_cast<double>(sampleRate_);
    const double frequency = voice.effectiveFrequency();
    const auto noteDuration = static_cast<double>(voice.duration);
    const bool vibrato = hasRoute(voice, ModTarget::kPitch);

    const auto pitchAt = [&](const double t) {
        return vibrato ? static_cast<double>(applyRoutes(voice, ModTarget::kPitch,
                                                         static_cast<float>(frequency), t))
                       : frequency;
    };

    // With vibrato the phases are integrated from the instantaneous pitch;
    // otherwise they are evaluated in closed form from t.
    if (voice.fm) {
        const FmParams& fm = *voice.fm;
        if (!vibrato) {
            for (std::size_t i = 0; i < count; ++i) {
                const double t = static_cast<double>(i) / rate;
                out[i] = fm.sample(frequency, t, noteDuration);
            }
            return;
        }
        const auto modRatio = static_cast<double>(fm.mod_ratio);
        double carrierPhase = 0.0;
        double modPhase = 0.0;
        for (std::size_t i = 0; i < count; ++i) {
            const double t = static_cast<double>(i) / rate;
            out[i] = fm.sampleAtPhase(carrierPhase, modPhase, t, noteDuration);
            const double step = pitchAt(t) / rate;
            carrierPhase += step;
            modPhase += step * modRatio;
        }
        return;
    }

    if (!voice.partials.empty()) {
        if (!vibrato) {
            for (std::size_t i = 0; i < count; ++i) {
                const double t = static_cast<double>(i) / rate;
                out[i] = additiveSample(voice.partials, frequency, t);
            }
            return;
        }
        double phase = 0.0;
        for (std::size_t i = 0; i < count; ++i) {
            out[i] = additiveSampleAtPhase(voice.partials, phase);
            phase += pitchAt(static_cast<double>(i) / rate) / rate;
        }
        return;
    }

    if (voice.waveform == Waveform::kNoise) {
        NoiseGenerator noise(kNoiseSeed);
        noise.render(out, static_cast<int>(count));
        return;
    }

    const Wavetable& table = (voice.waveform == Waveform::kCustom && voice.custom_wavetable)
                                 ? *voice.custom_wavetable
                                 : presetTableFor(voice.waveform);
    Oscillator osc(table, rate);
    if (!vibrato) {
        osc.render(out, static_cast<int>(count), frequency);
        return;
    }
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = osc.next(pitchAt(static_cast<double>(i) / rate));
    }
}

void VoiceRenderer::applyEnvelope(const VoiceDescriptor& voice, float* out,
                                  const std::size_t count) const
{
    const auto rate = static_cast<double>(sampleRate_);
    const auto noteDuration = static_cast<double>(voice.duration);
    const bool tremolo = hasRoute(voice, ModTarget::kVolume);

    std::vector<float> gain(count);
    for (std::size_t i = 0; i < count; ++i) {
        const double t = static_cast<double>(i) / rate;
        float level = voice.envelope.amplitudeAt(t, noteDuration);
        if (tremolo) {
            level = applyRoutes(voice, ModTarget::kVolume, level, t);
        }
        gain[i] = level;
    }
    simd::multiply(out, gain.data(), count);
}

void VoiceRenderer::applyFilter(const VoiceDescriptor& voice, float* out,
                                const std::size_t count) const
{
    if (!voice.filter || voice.filter->type() == FilterType::kNone) {
        return;
    }

    Filter filter = *voice.filter;
    filter.reset();

    const auto rate = static_cast<double>(sampleRate_);
    const auto sampleRate = static_cast<float>(sampleRate_);
    const auto noteDuration = static_cast<double>(voice.duration);
    const float baseCutoff = filter.cutoff();
    const float baseResonance = filter.resonance();
    const bool sweepCutoff = voice.filter_envelope.has_value() ||
                             hasRoute(voice, ModTarget::kFilterCutoff);
    const bool sweepResonance = hasRoute(voice, ModTarget::kFilterResonance);

    for (std::size_t i = 0; i < count; ++i) {
        const double t = static_cast<double>(i) / rate;
        if (sweepCutoff) {
            float cutoff = voice.filter_envelope
                               ? voice.filter_envelope->cutoffAt(t, noteDuration)
                               : baseCutoff;
            cutoff = applyRoutes(voice, ModTarget::kFilterCutoff, cutoff, t);
            filter.setCutoff(cutoff);
        }
        if (sweepResonance) {
            filter.setResonance(applyRoutes(voice, ModTarget::kFilterResonance, baseResonance, t));
        }
        out[i] = filter.process(out[i], sampleRate);
    }
}

}  // namespace tunesmith
