#pragma once

#include <cstddef>
#include <vector>

#include "tunesmith/SampleCache.h"
#include "tunesmith/Voice.h"

namespace tunesmith {

// Synthesises one voice descriptor into a mono buffer at the voice's own
// pitch. Rendering is pure: the descriptor is not modified and the same
// descriptor always yields the same samples.
//
// Stages, each over the whole buffer:
//   1. source (FM, additive partials, noise or wavetable oscillator)
//   2. amplitude envelope, with volume LFO routes folded in
//   3. filter, cutoff driven by the filter envelope and LFO routes
//   4. effect chain
//   5. velocity
// Pan is left to the mixer so cached buffers stay pan-agnostic.
class VoiceRenderer {
public:
    explicit VoiceRenderer(int sampleRate = kDefaultSampleRate) noexcept;

    [[nodiscard]] int sampleRate() const noexcept { return sampleRate_; }

    // ceil((duration + release) * sampleRate).
    [[nodiscard]] std::size_t renderLength(const VoiceDescriptor& voice) const noexcept;

    [[nodiscard]] std::vector<float> render(const VoiceDescriptor& voice) const;

    // render() wrapped with the metadata the cache needs. Noise voices get
    // reference_frequency 0: they are not resampled by pitch.
    [[nodiscard]] CachedSample renderCached(const VoiceDescriptor& voice) const;

private:
    void renderSource(const VoiceDescriptor& voice, float* out, std::size_t count) const;
    void applyEnvelope(const VoiceDescriptor& voice, float* out, std::size_t count) const;
    void applyFilter(const VoiceDescriptor& voice, float* out, std::size_t count) const;

    int sampleRate_;
};

}  // namespace tunesmith
