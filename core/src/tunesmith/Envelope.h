#pragma once

#include <optional>

#include "tunesmith/Types.h"

namespace tunesmith {

// Shape applied to the progress of each envelope segment.
enum class EnvelopeCurve {
    kLinear = 0,
    kExponential,   // 1 - e^(-4p), normalised to reach 1 at p = 1
    kLogarithmic,   // sqrt(p)
};

// ADSR amplitude envelope. Stateless: the level at time t depends only
// on the parameters and the note duration, so any sample of a voice can
// be evaluated independently.
//
// Attack, decay and release are in seconds and never shorter than
// kMinTime; sustain is a level in [0, 1]. When the note is released
// before the decay finishes, the release starts from whatever level the
// envelope had reached at note-off.
struct Envelope {
    static constexpr float kMinTime = 0.001F;

    float attack{0.01F};
    float decay{0.1F};
    float sustain{0.7F};
    float release{0.2F};
    EnvelopeCurve curve{EnvelopeCurve::kLinear};

    // Validating factory. Non-finite or negative times and a sustain
    // outside [0, 1] fail with kInvalidParameter; times below kMinTime
    // are raised to it.
    [[nodiscard]] static std::optional<Envelope> create(
        float attack, float decay, float sustain, float release,
        EnvelopeCurve curve = EnvelopeCurve::kLinear,
        Error* outError = nullptr);

    [[nodiscard]] static Envelope piano();
    [[nodiscard]] static Envelope organ();
    [[nodiscard]] static Envelope pad();
    [[nodiscard]] static Envelope pluck();

    [[nodiscard]] bool isValid() const noexcept;

    // Level in [0, 1] at `seconds` after note-on for a note held for
    // `noteDuration` seconds.
    [[nodiscard]] float amplitudeAt(double seconds, double noteDuration) const noexcept;

    // Note duration plus release tail.
    [[nodiscard]] double totalDuration(double noteDuration) const noexcept
    {
        return noteDuration + static_cast<double>(release);
    }
};

// Cutoff envelope for the voice filter. The ADSR drives an exponential
// sweep between base_cutoff and peak_cutoff, scaled by amount; the result
// is clamped to [20 Hz, 20 kHz]. With amount == 0 the base cutoff is
// returned untouched.
struct FilterEnvelope {
    Envelope shape{};
    float base_cutoff{500.0F};
    float peak_cutoff{5000.0F};
    float amount{1.0F};

    [[nodiscard]] static std::optional<FilterEnvelope> create(
        const Envelope& shape, float base_cutoff, float peak_cutoff, float amount,
        Error* outError = nullptr);

    [[nodiscard]] static FilterEnvelope pluck();
    [[nodiscard]] static FilterEnvelope pad();
    [[nodiscard]] static FilterEnvelope bass();

    [[nodiscard]] float cutoffAt(double seconds, double noteDuration) const noexcept;
};

}  // namespace tunesmith
