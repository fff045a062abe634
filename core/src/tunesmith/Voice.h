#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tunesmith/EffectChain.h"
#include "tunesmith/Envelope.h"
#include "tunesmith/Filter.h"
#include "tunesmith/FmSynthesis.h"
#include "tunesmith/Lfo.h"
#include "tunesmith/Oscillator.h"
#include "tunesmith/Spatial.h"
#include "tunesmith/Types.h"
#include "tunesmith/Wavetable.h"

namespace tunesmith {

// Everything needed to synthesise one note. Built by the composition
// layer and treated as immutable afterwards: the renderer copies the
// stateful parts (filter, effect chain) before running them.
//
// Source selection, in priority order: FM params, additive partials,
// then the waveform. A kCustom waveform requires custom_wavetable.
struct VoiceDescriptor {
    Waveform waveform{Waveform::kSine};
    std::optional<Wavetable> custom_wavetable;
    float frequency{440.0F};
    float duration{1.0F};
    Envelope envelope{};
    std::optional<Filter> filter;
    std::optional<FilterEnvelope> filter_envelope;
    std::optional<FmParams> fm;
    std::vector<Partial> partials;
    std::vector<ModRoute> mod_routes;
    EffectChain effects;
    float velocity{1.0F};
    float pan{0.0F};
    float pitch_bend_semitones{0.0F};

    // Checks ranges: frequency finite and > 0, duration finite and >= 0,
    // velocity in [0, 1], pan in [-1, 1], a well-formed envelope and FM
    // block, positive partial ratios, and a table for kCustom. A voice
    // chain may not hold a sidechained compressor.
    [[nodiscard]] bool validate(Error* outError = nullptr) const;

    // Oscillator frequency after pitch bend.
    [[nodiscard]] double effectiveFrequency() const noexcept;

    // Note duration plus release tail, in seconds.
    [[nodiscard]] double renderDuration() const noexcept
    {
        return envelope.totalDuration(static_cast<double>(duration));
    }
};

// One scheduled voice. Events with a spatial source are positioned by
// the mixer's spatializer; the others use the descriptor's pan. A
// non-empty `bus` routes the voice through that mixer bus instead of
// straight to the master.
struct Event {
    double start_time{0.0};
    VoiceDescriptor voice{};
    std::optional<SpatialSource> spatial;
    std::string bus;
};

}  // namespace tunesmith
