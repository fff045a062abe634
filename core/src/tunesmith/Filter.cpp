#include "tunesmith/Filter.h"

#include <cmath>

#include <juce_core/juce_core.h>

namespace tunesmith {

namespace {

constexpr float kSmoothing = 0.999F;
constexpr float kStateLimit = 10.0F;

bool stageIsFinite(const float a, const float b, const float c, const float d) noexcept
{
    return std::isfinite(a) && std::isfinite(b) && std::isfinite(c) && std::isfinite(d);
}

}  // namespace

Filter::Filter() noexcept = default;

Filter::Filter(const FilterType type, const float cutoffHz, const float resonance,
               const FilterSlope slope) noexcept
    : type_(type), slope_(slope)
{
    setCutoff(cutoffHz);
    setResonance(resonance);
    reset();
}

Filter Filter::lowPass(const float cutoffHz, const float resonance) noexcept
{
    return Filter(FilterType::kLowPass, cutoffHz, resonance);
}

Filter Filter::highPass(const float cutoffHz, const float resonance) noexcept
{
    return Filter(FilterType::kHighPass, cutoffHz, resonance);
}

Filter Filter::bandPass(const float cutoffHz, const float resonance) noexcept
{
    return Filter(FilterType::kBandPass, cutoffHz, resonance);
}

Filter Filter::notch(const float cutoffHz, const float resonance) noexcept
{
    return Filter(FilterType::kNotch, cutoffHz, resonance);
}

Filter Filter::allPass(const float cutoffHz, const float resonance) noexcept
{
    return Filter(FilterType::kAllPass, cutoffHz, resonance);
}

Filter Filter::moog(const float cutoffHz, const float resonance) noexcept
{
    return Filter(FilterType::kMoog, cutoffHz, resonance);
}

void Filter::setCutoff(const float cutoffHz) noexcept
{
    if (!std::isfinite(cutoffHz)) {
        return;
    }
    cutoff_ = juce::jlimit(kMinCutoff, kMaxCutoff, cutoffHz);
}

void Filter::setResonance(const float resonance) noexcept
{
    if (!std::isfinite(resonance)) {
        return;
    }
    resonance_ = juce::jlimit(0.0F, kMaxResonance, resonance);
}

void Filter::reset() noexcept
{
    stage1_ = SvfStage{};
    stage2_ = SvfStage{};
    ladder_.fill(0.0F);
    smoothCutoff_ = cutoff_;
    smoothResonance_ = resonance_;
}

bool Filter::isStateFinite() const noexcept
{
    if (!stageIsFinite(stage1_.low, stage1_.high, stage1_.band, stage1_.notch) ||
        !stageIsFinite(stage2_.low, stage2_.high, stage2_.band, stage2_.notch)) {
        return false;
    }
    for (const float v : ladder_) {
        if (!std::isfinite(v)) {
            return false;
        }
    }
    return std::isfinite(smoothCutoff_) && std::isfinite(smoothResonance_);
}

bool Filter::tickStage(SvfStage& stage, const float input, const float f,
                       const float q) noexcept
{
    stage.low += f * stage.band;
    stage.high = input - stage.low - q * stage.band;
    stage.band += f * stage.high;
    stage.notch = stage.high + stage.low;

    if (std::abs(stage.low) > kStateLimit ||
        !stageIsFinite(stage.low, stage.high, stage.band, stage.notch)) {
        stage = SvfStage{};
        return false;
    }
    return true;
}

float Filter::stageOutput(const SvfStage& stage, const float input) const noexcept
{
    switch (type_) {
        case FilterType::kLowPass:
            return stage.low;
        case FilterType::kHighPass:
            return stage.high;
        case FilterType::kBandPass:
            return stage.band;
        case FilterType::kNotch:
            return stage.notch;
        case FilterType::kAllPass:
            return stage.notch - stage.band;
        case FilterType::kMoog:
        case FilterType::kNone:
            break;
    }
    return input;
}

float Filter::process(const float input, const float sampleRate) noexcept
{
    if (type_ == FilterType::kNone) {
        return input;
    }

    smoothCutoff_ = smoothCutoff_ * kSmoothing + cutoff_ * (1.0F - kSmoothing);
    smoothResonance_ = smoothResonance_ * kSmoothing + resonance_ * (1.0F - kSmoothing);

    if (type_ == FilterType::kMoog) {
        return processMoog(input, sampleRate);
    }

    const float f = 2.0F * std::sin(juce::MathConstants<float>::pi * smoothCutoff_ / sampleRate);
    const float q = 1.0F - smoothResonance_;

    if (!tickStage(stage1_, input, f, q)) {
        return juce::jlimit(-2.0F, 2.0F, input);
    }
    float output = stageOutput(stage1_, input);

    if (slope_ == FilterSlope::k24dB) {
        if (!tickStage(stage2_, output, f, q)) {
            return juce::jlimit(-2.0F, 2.0F, input);
        }
        output = stageOutput(stage2_, output);
    }

    return juce::jlimit(-2.0F, 2.0F, output);
}

float Filter::processMoog(const float input, const float sampleRate) noexcept
{
    const float f = juce::jlimit(0.0F, 1.0F, smoothCutoff_ / sampleRate * 1.16F);
    const float k = smoothResonance_ * 3.96F;

    float stageInput = std::tanh(input - k * ladder_[3]);
    for (float& pole : ladder_) {
        pole = pole * (1.0F - f) + stageInput * f;
        stageInput = std::tanh(pole);
    }

    for (const float v : ladder_) {
        if (!std::isfinite(v)) {
            ladder_.fill(0.0F);
            return juce::jlimit(-2.0F, 2.0F, input);
        }
    }
    return juce::jlimit(-2.0F, 2.0F, stageInput);
}

}  // namespace tunesmith
