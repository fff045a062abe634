#pragma once

#include <array>

namespace tunesmith {

enum class FilterType {
    kLowPass = 0,
    kHighPass,
    kBandPass,
    kNotch,
    kAllPass,
    kMoog,
    kNone,
};

enum class FilterSlope {
    k12dB = 0,
    k24dB,
};

// Per-voice multimode filter: a Chamberlin state-variable filter with
// an optional second stage for 24 dB/oct, plus a four-stage Moog-style
// ladder for FilterType::kMoog.
//
// Cutoff and resonance are set points. The filter follows them through
// a one-pole smoother (coefficient 0.999), so cutoff() and resonance()
// report the set point, not the value currently in use. reset() clears
// the state and snaps the smoother to the set point; call it when a
// voice starts.
class Filter {
public:
    static constexpr float kMinCutoff = 20.0F;
    static constexpr float kMaxCutoff = 20000.0F;
    static constexpr float kMaxResonance = 0.99F;

    // Bypass filter.
    Filter() noexcept;

    // Cutoff is clamped to [20, 20000] Hz and resonance to [0, 0.99].
    Filter(FilterType type, float cutoffHz, float resonance,
           FilterSlope slope = FilterSlope::k12dB) noexcept;

    [[nodiscard]] static Filter lowPass(float cutoffHz, float resonance) noexcept;
    [[nodiscard]] static Filter highPass(float cutoffHz, float resonance) noexcept;
    [[nodiscard]] static Filter bandPass(float cutoffHz, float resonance) noexcept;
    [[nodiscard]] static Filter notch(float cutoffHz, float resonance) noexcept;
    [[nodiscard]] static Filter allPass(float cutoffHz, float resonance) noexcept;
    [[nodiscard]] static Filter moog(float cutoffHz, float resonance) noexcept;

    float process(float input, float sampleRate) noexcept;

    void setCutoff(float cutoffHz) noexcept;
    void setResonance(float resonance) noexcept;

    [[nodiscard]] FilterType type() const noexcept { return type_; }
    [[nodiscard]] FilterSlope slope() const noexcept { return slope_; }
    [[nodiscard]] float cutoff() const noexcept { return cutoff_; }
    [[nodiscard]] float resonance() const noexcept { return resonance_; }

    void reset() noexcept;

    // True while every internal state variable is finite.
    [[nodiscard]] bool isStateFinite() const noexcept;

private:
    struct SvfStage {
        float low{0.0F};
        float high{0.0F};
        float band{0.0F};
        float notch{0.0F};
    };

    // Runs one SVF stage. Returns false (and zeroes the stage) when the
    // state blew up, in which case the caller passes the input through.
    bool tickStage(SvfStage& stage, float input, float f, float q) noexcept;
    [[nodiscard]] float stageOutput(const SvfStage& stage, float input) const noexcept;
    float processMoog(float input, float sampleRate) noexcept;

    FilterType type_{FilterType::kNone};
    FilterSlope slope_{FilterSlope::k12dB};
    float cutoff_{kMaxCutoff};
    float resonance_{0.0F};

    float smoothCutoff_{kMaxCutoff};
    float smoothResonance_{0.0F};

    SvfStage stage1_{};
    SvfStage stage2_{};
    std::array<float, 4> ladder_{};
};

}  // namespace tunesmith
