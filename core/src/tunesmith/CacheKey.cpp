#include "tunesmith/CacheKey.h"

#include "tunesmith/Fingerprint.h"
#include "tunesmith/Voice.h"

namespace tunesmith {

namespace {

void addEnvelope(Fingerprint& fp, const Envelope& env)
{
    fp.addFloat(env.attack).addFloat(env.decay).addFloat(env.sustain).addFloat(env.release);
    fp.addInt(static_cast<std::int64_t>(env.curve));
}

void addLfo(Fingerprint& fp, const Lfo& lfo)
{
    fp.addInt(static_cast<std::int64_t>(lfo.waveform()));
    fp.addFloat(lfo.rate()).addFloat(lfo.depth()).addFloat(lfo.phaseOffset());
}

}  // namespace

CacheKey CacheKey::forVoice(const VoiceDescriptor& voice, const int sampleRate)
{
    Fingerprint fp;
    fp.addTag("voice").addInt(sampleRate);

    fp.addTag("source").addInt(static_cast<std::int64_t>(voice.waveform));
    if (voice.waveform == Waveform::kCustom && voice.custom_wavetable) {
        fp.addInt(static_cast<std::int64_t>(voice.custom_wavetable->contentId()));
    }

    fp.addTag("timing").addFloat(voice.duration).addFloat(voice.velocity);
    fp.addFloat(voice.pitch_bend_semitones);

    fp.addTag("envelope");
    addEnvelope(fp, voice.envelope);

    fp.addTag("filter").addBool(voice.filter.has_value());
    if (voice.filter) {
        fp.addInt(static_cast<std::int64_t>(voice.filter->type()));
        fp.addInt(static_cast<std::int64_t>(voice.filter->slope()));
        fp.addFloat(voice.filter->cutoff()).addFloat(voice.filter->resonance());
    }

    fp.addTag("filter-envelope").addBool(voice.filter_envelope.has_value());
    if (voice.filter_envelope) {
        addEnvelope(fp, voice.filter_envelope->shape);
        fp.addFloat(voice.filter_envelope->base_cutoff);
        fp.addFloat(voice.filter_envelope->peak_cutoff);
        fp.addFloat(voice.filter_envelope->amount);
    }

    fp.addTag("fm").addBool(voice.fm.has_value());
    if (voice.fm) {
        fp.addFloat(voice.fm->mod_ratio).addFloat(voice.fm->mod_index);
        addEnvelope(fp, voice.fm->index_envelope);
        fp.addFloat(voice.fm->index_envelope_amount);
    }

    fp.addTag("partials").addInt(static_cast<std::int64_t>(voice.partials.size()));
    for (const Partial& partial : voice.partials) {
        fp.addFloat(partial.ratio).addFloat(partial.amplitude).addFloat(partial.phase);
    }

    fp.addTag("routes");
    for (const ModRoute& route : voice.mod_routes) {
        if (route.target == ModTarget::kPan) {
            continue;
        }
        fp.addInt(static_cast<std::int64_t>(route.target)).addFloat(route.amount);
        addLfo(fp, route.lfo);
    }

    voice.effects.addTo(fp);
    return CacheKey{fp.value()};
}

}  // namespace tunesmith
