#include "tunesmith/Wsola.h"

#include <algorithm>
#include <cmath>

#include <juce_core/juce_core.h>

namespace tunesmith::wsola {

namespace {

std::vector<float> periodicHann(const std::size_t length)
{
    std::vector<float> window(length);
    const double step = 2.0 * juce::MathConstants<double>::pi / static_cast<double>(length);
    for (std::size_t i = 0; i < length; ++i) {
        window[i] = static_cast<float>(0.5 - 0.5 * std::cos(step * static_cast<double>(i)));
    }
    return window;
}

std::vector<float> monoMix(const float* interleaved, const std::size_t frames, const int channels)
{
    std::vector<float> mono(frames, 0.0F);
    const auto count = static_cast<std::size_t>(channels);
    const float scale = 1.0F / static_cast<float>(channels);
    for (std::size_t frame = 0; frame < frames; ++frame) {
        float sum = 0.0F;
        for (std::size_t ch = 0; ch < count; ++ch) {
            sum += interleaved[frame * count + ch];
        }
        mono[frame] = sum * scale;
    }
    return mono;
}

// Similarity of mono[candidate, candidate + length) to mono[target,
// target + length), normalised by the candidate's energy.
double similarity(const std::vector<float>& mono, const std::size_t target,
                  const std::size_t candidate, const std::size_t length)
{
    double cross = 0.0;
    double energy = 0.0;
    for (std::size_t i = 0; i < length; ++i) {
        const double a = mono[target + i];
        const double b = mono[candidate + i];
        cross += a * b;
        energy += b * b;
    }
    return energy > 1.0e-12 ? cross / std::sqrt(energy) : 0.0;
}

// Best input position within [nominal - radius, nominal + radius] for a
// grain whose first `overlap` frames should continue from `target`.
// Coarse search on every second offset, then the neighbours of the
// coarse winner.
std::size_t bestOffset(const std::vector<float>& mono, const std::size_t target,
                       const std::size_t nominal, const std::size_t radius,
                       const std::size_t overlap)
{
    const std::size_t frames = mono.size();
    if (overlap == 0 || target + overlap > frames) {
        return nominal;
    }
    const std::size_t lowest = nominal > radius ? nominal - radius : 0;
    const std::size_t highest = std::min(nominal + radius, frames - overlap);
    if (lowest > highest) {
        return std::min(nominal, frames - overlap);
    }

    std::size_t best = std::min(std::max(nominal, lowest), highest);
    double bestScore = similarity(mono, target, best, overlap);
    for (std::size_t candidate = lowest; candidate <= highest; candidate += 2) {
        const double score = similarity(mono, target, candidate, overlap);
        if (score > bestScore) {
            bestScore = score;
            best = candidate;
        }
    }

    const std::size_t coarse = best;
    const auto refine = [&](const std::size_t candidate) {
        const double score = similarity(mono, target, candidate, overlap);
        if (score > bestScore) {
            bestScore = score;
            best = candidate;
        }
    };
    if (coarse > lowest) {
        refine(coarse - 1);
    }
    if (coarse < highest) {
        refine(coarse + 1);
    }
    return best;
}

}  // namespace

std::vector<float> timeStretch(const float* interleaved, const std::size_t frames,
                               const int channels, const int sampleRate, const double factor,
                               const double windowSeconds)
{
    if (interleaved == nullptr || frames == 0 || channels <= 0 || sampleRate <= 0 ||
        !(factor > 0.0) || !std::isfinite(factor)) {
        return {};
    }
    const auto channelCount = static_cast<std::size_t>(channels);
    const auto outputFrames =
        static_cast<std::size_t>(std::llround(static_cast<double>(frames) * factor));
    std::vector<float> output(outputFrames * channelCount, 0.0F);
    if (outputFrames == 0) {
        return output;
    }

    if (std::abs(factor - 1.0) < 1.0e-9) {
        std::copy(interleaved, interleaved + frames * channelCount, output.begin());
        return output;
    }

    std::size_t window = static_cast<std::size_t>(
        std::max(16.0, std::round(windowSeconds * static_cast<double>(sampleRate))));
    window += window % 2;
    const std::size_t inputHop = window / 4;
    const double outputHop = static_cast<double>(inputHop) * factor;
    const std::size_t radius = window / 2;

    // Output hops wider than half a window would leave holes in the
    // overlap-add, so grains grow to twice the output hop.
    const std::size_t grain = std::max(window, static_cast<std::size_t>(std::ceil(outputHop)) * 2);
    const std::vector<float> hann = periodicHann(grain);
    const std::vector<float> mono =
        channels == 1 ? std::vector<float>(interleaved, interleaved + frames)
                      : monoMix(interleaved, frames, channels);

    std::vector<float> weight(outputFrames, 0.0F);
    std::size_t previousInput = 0;
    std::size_t previousOutput = 0;

    for (std::size_t k = 0;; ++k) {
        const auto outStart =
            static_cast<std::size_t>(std::llround(static_cast<double>(k) * outputHop));
        if (outStart >= outputFrames) {
            break;
        }
        const std::size_t nominal = k * inputHop;
        if (nominal >= frames) {
            break;
        }

        std::size_t inStart = 0;
        if (k > 0) {
            const std::size_t advance = outStart - previousOutput;
            const std::size_t overlap = grain > advance ? grain - advance : 0;
            const std::size_t target = previousInput + advance;
            const std::size_t usable =
                target < frames ? std::min(overlap, frames - target) : 0;
            inStart = bestOffset(mono, target, nominal, radius, usable);
        }

        const std::size_t length = std::min({grain, frames - inStart, outputFrames - outStart});
        for (std::size_t i = 0; i < length; ++i) {
            const float w = hann[i];
            const float* in = interleaved + (inStart + i) * channelCount;
            float* out = output.data() + (outStart + i) * channelCount;
            for (std::size_t ch = 0; ch < channelCount; ++ch) {
                out[ch] += in[ch] * w;
            }
            weight[outStart + i] += w;
        }

        previousInput = inStart;
        previousOutput = outStart;
    }

    for (std::size_t frame = 0; frame < outputFrames; ++frame) {
        float* out = output.data() + frame * channelCount;
        const float w = weight[frame];
        for (std::size_t ch = 0; ch < channelCount; ++ch) {
            out[ch] = w > 1.0e-9F ? out[ch] / w : 0.0F;
        }
    }
    return output;
}

}  // namespace tunesmith::wsola
