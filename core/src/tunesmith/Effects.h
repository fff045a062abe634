#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tunesmith {

class Fingerprint;

// --- Building blocks shared by the delay-based effects ---

// Circular mono delay line. read(d) returns the sample written `d`
// samples before the most recent push (d = 0 is the newest sample).
struct DelayLine {
    std::vector<float> buffer;
    std::size_t write{0};

    void allocate(std::size_t size);
    void clear() noexcept;
    void push(float sample) noexcept;
    [[nodiscard]] float read(std::size_t delay) const noexcept;
    [[nodiscard]] float readFractional(double delay) const noexcept;
    [[nodiscard]] bool empty() const noexcept { return buffer.empty(); }
};

// --- Effect parameter + state structs ---
//
// Every effect follows the same contract:
//   prepare(sampleRate)   allocates per-voice state and resets it
//   process(input, rate)  one sample in, one sample out
//   reset()               clears state without reallocating
//   isValid()             parameter validation
//   addTo(fingerprint)    hashes the audible parameters
// Parameters are plain public fields; state lives in the nested
// `state` member and is never shared between voices.

// Single-tap feedback delay. Feedback is limited to 0.99.
struct Delay {
    float time{0.25F};      // seconds
    float feedback{0.3F};
    float mix{0.3F};

    struct State {
        std::vector<float> buffer;
        std::size_t index{0};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Schroeder reverb: four parallel damped combs into two series
// allpasses. Comb lengths are 29.7/37.1/41.1/43.7 ms times
// (0.5 + room_size); allpass lengths are 5 and 1.7 ms.
struct Reverb {
    float room_size{0.5F};
    float damping{0.5F};
    float mix{0.3F};

    struct Comb {
        std::vector<float> buffer;
        std::size_t index{0};
        float store{0.0F};
    };
    struct AllPass {
        std::vector<float> buffer;
        std::size_t index{0};
    };
    struct State {
        std::array<Comb, 4> combs{};
        std::array<AllPass, 2> allpasses{};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Multi-voice chorus. Each voice reads a delay line swept by a sine
// LFO (voices spread evenly in phase) between 15 ms and 15 ms + depth
// * 10 ms; the averaged voices are mixed with the dry signal.
struct Chorus {
    float rate{0.8F};       // Hz
    float depth{0.5F};      // 0..1, 1 = 10 ms sweep
    float mix{0.5F};
    int voices{3};

    struct State {
        DelayLine line;
        std::uint64_t frame{0};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Cascade of first-order allpasses whose break frequency is swept by a
// sine LFO between 300 Hz and 300 * 2^(3 * depth) Hz, with feedback from
// the last stage to the input.
struct Phaser {
    float rate{0.5F};
    float depth{0.7F};
    float feedback{0.5F};
    int stages{4};          // 2..12
    float mix{0.5F};

    struct State {
        std::array<float, 12> z{};
        float last{0.0F};
        std::uint64_t frame{0};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Short modulated delay (1 ms to 1 ms + depth * 4 ms) with feedback.
struct Flanger {
    float rate{0.3F};
    float depth{0.7F};
    float feedback{0.5F};   // -0.95..0.95
    float mix{0.5F};

    struct State {
        DelayLine line;
        float last{0.0F};
        std::uint64_t frame{0};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Amplitude modulation between (1 - depth) and 1.
struct Tremolo {
    float rate{5.0F};
    float depth{0.5F};

    struct State {
        std::uint64_t frame{0};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Sine-driven stereo panner. On a stereo chain (a bus or the master)
// it applies complementary equal-power gains, unity at the centre, to
// the two channels. A mono voice chain passes the signal through and
// the mixer adds panAt() to the voice pan instead.
struct AutoPan {
    float rate{0.25F};
    float depth{0.8F};

    struct State {
        std::uint64_t frame{0};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void processStereo(float& left, float& right, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;

    // Pan offset in [-depth, depth] `seconds` after the effect started.
    [[nodiscard]] float panAt(double seconds) const noexcept;
};

// Quantises to `bits` and holds each value for `sample_rate_div`
// samples.
struct BitCrusher {
    int bits{8};                // 1..24
    int sample_rate_div{1};     // >= 1
    float mix{1.0F};

    struct State {
        float held{0.0F};
        int counter{0};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Multiplies the input by a sine carrier.
struct RingModulator {
    float carrier_hz{440.0F};
    float mix{0.5F};

    struct State {
        std::uint64_t frame{0};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Extra peaking band on top of the three fixed EQ bands.
struct EqBand {
    float frequency{1000.0F};
    float gain_db{0.0F};
    float q{1.0F};
};

// Three-band EQ (low shelf, mid peak, high shelf) plus optional peak
// bands. Coefficients come from juce::dsp::IIR::Coefficients and are
// recomputed in prepare() for the render sample rate; each biquad runs
// in transposed direct form II.
struct Eq {
    float low_gain_db{0.0F};
    float mid_gain_db{0.0F};
    float high_gain_db{0.0F};
    float low_freq{250.0F};
    float mid_freq{1000.0F};
    float high_freq{4000.0F};
    float mid_q{0.707F};
    std::vector<EqBand> bands;

    struct Biquad {
        std::array<float, 5> coefficients{1.0F, 0.0F, 0.0F, 0.0F, 0.0F};  // b0 b1 b2 a1 a2
        float s1{0.0F};
        float s2{0.0F};
    };
    struct State {
        std::vector<Biquad> biquads;
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Feed-forward compressor working in the linear domain. Above the
// threshold the target gain is (threshold / |x|)^(1 - 1/ratio); the
// applied gain moves toward it with the attack time constant when
// falling and the release time constant when rising.
//
// With `sidechain_bus` set the level is taken from that mixer bus
// instead of the input (see processKeyed); only bus chains may carry
// such a compressor.
struct Compressor {
    float threshold{0.5F};      // linear amplitude
    float ratio{4.0F};          // >= 1
    float attack{0.005F};       // seconds
    float release{0.1F};        // seconds
    float makeup_gain{1.0F};
    std::string sidechain_bus;

    struct State {
        float gain{1.0F};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    float processKeyed(float input, float keyLevel, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Hard ceiling: gain drops instantly to keep |output| <= threshold and
// recovers with the release time constant.
struct Limiter {
    float threshold{0.9F};
    float release{0.05F};

    struct State {
        float gain{1.0F};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Downward expander: below the threshold the signal is attenuated by
// 1 / ratio, with attack (opening) and release (closing) smoothing.
struct Gate {
    float threshold{0.05F};
    float ratio{10.0F};         // >= 1
    float attack{0.001F};
    float release{0.05F};

    struct State {
        float gain{1.0F};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// Soft tube-style saturation. `character` in [0, 1] adds even-order
// asymmetry.
struct Saturation {
    float drive{2.0F};          // >= 1
    float character{0.3F};
    float mix{1.0F};

    struct State {
        float dc_in{0.0F};
        float dc_out{0.0F};
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

// tanh waveshaper.
struct Distortion {
    float drive{4.0F};          // >= 1
    float mix{1.0F};

    struct State {
    } state{};

    void prepare(double sampleRate);
    float process(float input, float sampleRate) noexcept;
    void reset() noexcept;
    [[nodiscard]] bool isValid() const noexcept;
    void addTo(Fingerprint& fp) const;
};

using Effect = std::variant<Delay, Reverb, Chorus, Phaser, Flanger, Tremolo, AutoPan,
                            BitCrusher, RingModulator, Eq, Compressor, Limiter, Gate,
                            Saturation, Distortion>;

// Per-kind dispatch helpers over the Effect variant.
void prepareEffect(Effect& effect, double sampleRate);
float processEffect(Effect& effect, float input, float sampleRate) noexcept;
void resetEffect(Effect& effect) noexcept;
[[nodiscard]] bool isEffectValid(const Effect& effect) noexcept;
void addEffectFingerprint(Fingerprint& fp, const Effect& effect);
[[nodiscard]] const char* effectName(const Effect& effect) noexcept;

// True for a compressor keyed from another bus.
[[nodiscard]] bool isSidechained(const Effect& effect) noexcept;

}  // namespace tunesmith
