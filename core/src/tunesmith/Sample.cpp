#include "tunesmith/Sample.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include "tunesmith/Resampler.h"
#include "tunesmith/Wsola.h"

namespace tunesmith {

Sample::Sample(std::shared_ptr<const std::vector<float>> data, const int channels,
               const int sampleRate)
    : data_(std::move(data)), channels_(channels), sampleRate_(sampleRate)
{
}

std::optional<Sample> Sample::fromMono(std::vector<float> samples, const int sampleRate,
                                       Error* outError)
{
    return fromInterleaved(std::move(samples), 1, sampleRate, outError);
}

std::optional<Sample> Sample::fromInterleaved(std::vector<float> samples, const int channels,
                                              const int sampleRate, Error* outError)
{
    if (channels <= 0 || sampleRate <= 0 ||
        samples.size() % static_cast<std::size_t>(channels) != 0) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    return Sample(std::make_shared<const std::vector<float>>(std::move(samples)), channels,
                  sampleRate);
}

Sample Sample::fromCached(const CachedSample& cached)
{
    auto data = cached.samples ? cached.samples : std::make_shared<const std::vector<float>>();
    return Sample(std::move(data), 1, cached.sample_rate);
}

std::size_t Sample::numFrames() const noexcept
{
    return data_->size() / static_cast<std::size_t>(channels_);
}

double Sample::duration() const noexcept
{
    return static_cast<double>(numFrames()) / static_cast<double>(sampleRate_);
}

float Sample::at(const std::size_t frame, const int channel) const noexcept
{
    if (channel < 0 || channel >= channels_ || frame >= numFrames()) {
        return 0.0F;
    }
    return (*data_)[frame * static_cast<std::size_t>(channels_) + static_cast<std::size_t>(channel)];
}

std::vector<float> Sample::channel(const int index) const
{
    std::vector<float> out;
    if (index < 0 || index >= channels_) {
        return out;
    }
    const std::size_t frames = numFrames();
    out.resize(frames);
    for (std::size_t frame = 0; frame < frames; ++frame) {
        out[frame] = (*data_)[frame * static_cast<std::size_t>(channels_) +
                              static_cast<std::size_t>(index)];
    }
    return out;
}

Sample Sample::resampledTo(const std::size_t frames, const double ratio,
                           const int sampleRate) const
{
    const auto count = static_cast<std::size_t>(channels_);
    std::vector<float> out(frames * count, 0.0F);
    for (int ch = 0; ch < channels_; ++ch) {
        const std::vector<float> resampled = resampler::resample(channel(ch), ratio, frames);
        for (std::size_t frame = 0; frame < frames; ++frame) {
            out[frame * count + static_cast<std::size_t>(ch)] = resampled[frame];
        }
    }
    return Sample(std::make_shared<const std::vector<float>>(std::move(out)), channels_,
                  sampleRate);
}

Sample Sample::resample(const int newSampleRate) const
{
    if (newSampleRate <= 0 || newSampleRate == sampleRate_) {
        return *this;
    }
    const double ratio = static_cast<double>(sampleRate_) / static_cast<double>(newSampleRate);
    const auto frames = static_cast<std::size_t>(
        std::llround(static_cast<double>(numFrames()) / ratio));
    return resampledTo(frames, ratio, newSampleRate);
}

Sample Sample::reverse() const
{
    const auto count = static_cast<std::size_t>(channels_);
    const std::size_t frames = numFrames();
    std::vector<float> out(data_->size());
    for (std::size_t frame = 0; frame < frames; ++frame) {
        const float* src = data_->data() + (frames - 1 - frame) * count;
        std::copy(src, src + count, out.begin() + static_cast<std::ptrdiff_t>(frame * count));
    }
    return Sample(std::make_shared<const std::vector<float>>(std::move(out)), channels_,
                  sampleRate_);
}

Sample Sample::normalize() const
{
    float peak = 0.0F;
    for (const float value : *data_) {
        peak = std::max(peak, std::abs(value));
    }
    if (peak < 1.0e-4F) {
        return *this;
    }
    return withGain(1.0F / peak);
}

Sample Sample::withGain(const float gain) const
{
    std::vector<float> out(*data_);
    for (float& value : out) {
        value *= gain;
    }
    return Sample(std::make_shared<const std::vector<float>>(std::move(out)), channels_,
                  sampleRate_);
}

std::optional<Sample> Sample::slice(const double startSeconds, const double endSeconds,
                                    Error* outError) const
{
    const double rate = static_cast<double>(sampleRate_);
    if (!std::isfinite(startSeconds) || !std::isfinite(endSeconds) || startSeconds < 0.0) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    const auto first = static_cast<std::size_t>(std::llround(startSeconds * rate));
    const auto last = static_cast<std::size_t>(std::llround(endSeconds * rate));
    if (first >= last || last > numFrames()) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    const auto count = static_cast<std::size_t>(channels_);
    std::vector<float> out(data_->begin() + static_cast<std::ptrdiff_t>(first * count),
                           data_->begin() + static_cast<std::ptrdiff_t>(last * count));
    return Sample(std::make_shared<const std::vector<float>>(std::move(out)), channels_,
                  sampleRate_);
}

std::optional<Sample> Sample::timeStretch(const double factor, Error* outError) const
{
    if (!std::isfinite(factor) || factor < kMinStretchFactor || factor > kMaxStretchFactor) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    std::vector<float> out =
        wsola::timeStretch(data_->data(), numFrames(), channels_, sampleRate_, factor);
    return Sample(std::make_shared<const std::vector<float>>(std::move(out)), channels_,
                  sampleRate_);
}

std::optional<Sample> Sample::pitchShift(const double semitones, Error* outError) const
{
    if (!std::isfinite(semitones)) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    if (std::abs(semitones) > kMaxPitchShiftSemitones) {
        reportError(outError, Error::kExtremePitchShift);
        return std::nullopt;
    }
    if (std::abs(semitones) < 1.0e-3) {
        return *this;
    }

    const double factor = std::exp2(semitones / 12.0);
    const std::optional<Sample> stretched = timeStretch(factor, outError);
    if (!stretched) {
        return std::nullopt;
    }
    const std::size_t frames = numFrames();
    if (frames == 0) {
        return *this;
    }
    const double ratio =
        static_cast<double>(stretched->numFrames()) / static_cast<double>(frames);
    return stretched->resampledTo(frames, ratio, sampleRate_);
}

}  // namespace tunesmith
