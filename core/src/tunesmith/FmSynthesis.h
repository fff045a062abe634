#pragma once

#include <optional>
#include <vector>

#include "tunesmith/Envelope.h"
#include "tunesmith/Types.h"

namespace tunesmith {

// Two-operator FM: one sine modulator on one sine carrier.
//
//   mod(t)    = sin(2*pi * t * carrier * mod_ratio)
//   sample(t) = sin(2*pi * t * (carrier + mod(t) * idx(t) * modFreq))
//
// idx(t) is the modulation index, optionally shaped by an ADSR:
//   idx(t) = mod_index * (1 - amount + env(t) * amount)
// With mod_index == 0 the output is a plain sine at the carrier.
struct FmParams {
    float mod_ratio{1.0F};
    float mod_index{0.0F};
    Envelope index_envelope{};
    float index_envelope_amount{0.0F};

    // mod_ratio must be > 0 (raised to at least 0.01), mod_index >= 0 and
    // the envelope amount within [0, 1].
    [[nodiscard]] static std::optional<FmParams> create(
        float mod_ratio, float mod_index, Error* outError = nullptr);
    [[nodiscard]] static std::optional<FmParams> withIndexEnvelope(
        float mod_ratio, float mod_index, const Envelope& envelope, float amount,
        Error* outError = nullptr);

    [[nodiscard]] static FmParams electricPiano();
    [[nodiscard]] static FmParams bell();
    [[nodiscard]] static FmParams brass();
    [[nodiscard]] static FmParams bass();
    [[nodiscard]] static FmParams metallicPad();
    [[nodiscard]] static FmParams growl();

    [[nodiscard]] bool isValid() const noexcept;

    [[nodiscard]] float indexAt(double seconds, double noteDuration) const noexcept;

    [[nodiscard]] float sample(double carrierHz, double seconds,
                               double noteDuration) const noexcept;

    // Same as sample() with the carrier and modulator phases (in cycles)
    // supplied by the caller. With a constant carrier the phases are
    // seconds * carrier and seconds * carrier * mod_ratio; a voice with
    // vibrato integrates them sample by sample instead.
    [[nodiscard]] float sampleAtPhase(double carrierPhase, double modPhase, double seconds,
                                      double noteDuration) const noexcept;
};

// One sinusoidal component of an additive voice.
struct Partial {
    float ratio{1.0F};       // multiple of the voice frequency, > 0
    float amplitude{1.0F};
    float phase{0.0F};       // offset in cycles
};

// Sum of the partials at `seconds`, divided by the partial count so the
// result stays within [-1, 1] when every amplitude is within [-1, 1].
[[nodiscard]] float additiveSample(const std::vector<Partial>& partials,
                                   double frequencyHz, double seconds) noexcept;

// additiveSample() with the fundamental's phase in cycles given directly.
[[nodiscard]] float additiveSampleAtPhase(const std::vector<Partial>& partials,
                                          double fundamentalPhase) noexcept;

}  // namespace tunesmith
