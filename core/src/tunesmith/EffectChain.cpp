#include "tunesmith/EffectChain.h"

#include <algorithm>
#include <cstdint>
#include <utility>

#include "tunesmith/Fingerprint.h"

namespace tunesmith {

bool EffectChain::add(Effect effect, Error* outError)
{
    if (!isEffectValid(effect)) {
        reportError(outError, Error::kInvalidParameter);
        return false;
    }
    effects_.push_back(std::move(effect));
    return true;
}

void EffectChain::prepare(const double sampleRate)
{
    sampleRate_ = static_cast<float>(sampleRate);
    rightEffects_.clear();
    for (Effect& effect : effects_) {
        prepareEffect(effect, sampleRate);
    }
}

void EffectChain::prepareStereo(const double sampleRate)
{
    prepare(sampleRate);
    rightEffects_ = effects_;
}

void EffectChain::reset() noexcept
{
    for (Effect& effect : effects_) {
        resetEffect(effect);
    }
    for (Effect& effect : rightEffects_) {
        resetEffect(effect);
    }
}

float EffectChain::process(float input) noexcept
{
    for (Effect& effect : effects_) {
        input = processEffect(effect, input, sampleRate_);
    }
    return input;
}

void EffectChain::processBlock(float* samples, const int numSamples) noexcept
{
    if (effects_.empty()) {
        return;
    }
    for (int i = 0; i < numSamples; ++i) {
        samples[i] = process(samples[i]);
    }
}

void EffectChain::processStereo(float& left, float& right) noexcept
{
    processStereo(left, right, nullptr);
}

void EffectChain::processStereo(float& left, float& right, const float* keyLevels) noexcept
{
    if (rightEffects_.size() != effects_.size()) {
        // Not prepared for stereo: run the mono chain on the mid signal.
        const float mid = process(0.5F * (left + right));
        left = mid;
        right = mid;
        return;
    }

    for (std::size_t i = 0; i < effects_.size(); ++i) {
        if (auto* pan = std::get_if<AutoPan>(&effects_[i])) {
            pan->processStereo(left, right, sampleRate_);
            continue;
        }
        if (keyLevels != nullptr && isSidechained(effects_[i]) && keyLevels[i] >= 0.0F) {
            const float key = keyLevels[i];
            left = std::get<Compressor>(effects_[i]).processKeyed(left, key, sampleRate_);
            right = std::get<Compressor>(rightEffects_[i]).processKeyed(right, key, sampleRate_);
            continue;
        }
        left = processEffect(effects_[i], left, sampleRate_);
        right = processEffect(rightEffects_[i], right, sampleRate_);
    }
}

bool EffectChain::hasAutoPan() const noexcept
{
    return std::any_of(effects_.begin(), effects_.end(), [](const Effect& effect) {
        return std::holds_alternative<AutoPan>(effect);
    });
}

float EffectChain::panOffsetAt(const double seconds) const noexcept
{
    float offset = 0.0F;
    for (const Effect& effect : effects_) {
        if (const auto* pan = std::get_if<AutoPan>(&effect)) {
            offset += pan->panAt(seconds);
        }
    }
    return offset;
}

void EffectChain::addTo(Fingerprint& fp) const
{
    const auto panners = std::count_if(effects_.begin(), effects_.end(), [](const Effect& effect) {
        return std::holds_alternative<AutoPan>(effect);
    });
    fp.addTag("chain").addInt(static_cast<std::int64_t>(effects_.size()) - panners);
    for (const Effect& effect : effects_) {
        if (!std::holds_alternative<AutoPan>(effect)) {
            addEffectFingerprint(fp, effect);
        }
    }
}

}  // namespace tunesmith
