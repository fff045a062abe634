#pragma once

#include <cstddef>
#include <vector>

#include "tunesmith/Effects.h"
#include "tunesmith/Types.h"

namespace tunesmith {

class Fingerprint;

// Ordered list of effects applied left to right.
//
// A chain stored in a voice descriptor is a template: renderers copy
// it, prepare() the copy for the render sample rate and run it for one
// voice. Stereo processing (used by buses and the master) keeps a
// second set of effect states for the right channel; AutoPan is the
// only effect that couples the two channels.
class EffectChain {
public:
    EffectChain() = default;

    // Appends an effect. Returns false and reports kInvalidParameter when
    // its parameters are out of range.
    bool add(Effect effect, Error* outError = nullptr);

    [[nodiscard]] bool empty() const noexcept { return effects_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return effects_.size(); }
    [[nodiscard]] const std::vector<Effect>& effects() const noexcept { return effects_; }

    // Allocates and resets per-render state for mono processing.
    void prepare(double sampleRate);

    // Allocates and resets state for both channels.
    void prepareStereo(double sampleRate);

    void reset() noexcept;

    float process(float input) noexcept;
    void processBlock(float* samples, int numSamples) noexcept;
    void processStereo(float& left, float& right) noexcept;

    // Stereo processing where keyLevels[i] is the detector level for a
    // sidechained compressor at position i; a negative level makes it
    // detect its own input. Other effects ignore it.
    void processStereo(float& left, float& right, const float* keyLevels) noexcept;

    // Sum of the AutoPan offsets at `seconds`; the mixer applies it to a
    // voice's pan because a voice chain runs in mono.
    [[nodiscard]] bool hasAutoPan() const noexcept;
    [[nodiscard]] float panOffsetAt(double seconds) const noexcept;

    // AutoPan entries are left out: they act at mix time and do not
    // change the rendered mono buffer.
    void addTo(Fingerprint& fp) const;

private:
    std::vector<Effect> effects_;
    std::vector<Effect> rightEffects_;
    float sampleRate_{static_cast<float>(kDefaultSampleRate)};
};

}  // namespace tunesmith
