#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "tunesmith/SampleCache.h"
#include "tunesmith/Types.h"

namespace tunesmith {

// Immutable block of audio: interleaved frames of one or more channels
// at a fixed sample rate. The buffer is shared between copies; every
// transformation returns a new Sample.
class Sample {
public:
    static constexpr double kMaxPitchShiftSemitones = 24.0;
    static constexpr double kMinStretchFactor = 0.1;
    static constexpr double kMaxStretchFactor = 10.0;

    [[nodiscard]] static std::optional<Sample> fromMono(std::vector<float> samples, int sampleRate,
                                                        Error* outError = nullptr);

    // `samples.size()` must be a multiple of `channels`.
    [[nodiscard]] static std::optional<Sample> fromInterleaved(std::vector<float> samples,
                                                               int channels, int sampleRate,
                                                               Error* outError = nullptr);

    // Wraps a cached voice render without copying it.
    [[nodiscard]] static Sample fromCached(const CachedSample& cached);

    [[nodiscard]] int channels() const noexcept { return channels_; }
    [[nodiscard]] int sampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] std::size_t numFrames() const noexcept;
    [[nodiscard]] double duration() const noexcept;
    [[nodiscard]] const std::vector<float>& data() const noexcept { return *data_; }

    // Sample of `channel` at `frame`; 0 outside the buffer.
    [[nodiscard]] float at(std::size_t frame, int channel = 0) const noexcept;
    [[nodiscard]] std::vector<float> channel(int index) const;

    // Linear-interpolated conversion to another sample rate, keeping the
    // duration.
    [[nodiscard]] Sample resample(int newSampleRate) const;
    [[nodiscard]] Sample reverse() const;
    // Scales the peak to 1. Near-silent samples are returned unchanged.
    [[nodiscard]] Sample normalize() const;
    [[nodiscard]] Sample withGain(float gain) const;

    // Frames in [startSeconds, endSeconds).
    [[nodiscard]] std::optional<Sample> slice(double startSeconds, double endSeconds,
                                              Error* outError = nullptr) const;

    // Changes the duration by `factor` keeping the pitch (WSOLA).
    [[nodiscard]] std::optional<Sample> timeStretch(double factor, Error* outError = nullptr) const;

    // Changes the pitch keeping the duration: stretch by 2^(s/12), then
    // resample back to the original frame count. Fails with
    // kExtremePitchShift beyond +-24 semitones.
    [[nodiscard]] std::optional<Sample> pitchShift(double semitones,
                                                   Error* outError = nullptr) const;

private:
    Sample(std::shared_ptr<const std::vector<float>> data, int channels, int sampleRate);

    // Resamples every channel to `frames` frames, reading at j * ratio.
    [[nodiscard]] Sample resampledTo(std::size_t frames, double ratio, int sampleRate) const;

    std::shared_ptr<const std::vector<float>> data_;
    int channels_;
    int sampleRate_;
};

}  // namespace tunesmith
