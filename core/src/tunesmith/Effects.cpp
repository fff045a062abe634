#include "tunesmith/Effects.h"

#include <algorithm>
#include <cmath>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_dsp/juce_dsp.h>

#include "tunesmith/Fingerprint.h"

namespace tunesmith {

namespace {

constexpr double kTwoPi = juce::MathConstants<double>::twoPi;

bool finiteIn(const float value, const float lo, const float hi) noexcept
{
    return std::isfinite(value) && value >= lo && value <= hi;
}

float mixDryWet(const float dry, const float wet, const float mix) noexcept
{
    return (1.0F - mix) * dry + mix * wet;
}

// sin(2*pi*(rate * t + offset)) with t = frame / sampleRate.
float lfoSine(const std::uint64_t frame, const float sampleRate, const float rate,
              const double offset = 0.0) noexcept
{
    const double t = static_cast<double>(frame) / static_cast<double>(sampleRate);
    return static_cast<float>(std::sin(kTwoPi * (static_cast<double>(rate) * t + offset)));
}

// One-pole smoothing coefficient for a time constant in seconds.
float timeCoefficient(const float seconds, const float sampleRate) noexcept
{
    const float samples = std::max(seconds, 1.0e-5F) * sampleRate;
    return std::exp(-1.0F / samples);
}

std::size_t samplesFor(const double seconds, const double sampleRate) noexcept
{
    return static_cast<std::size_t>(std::max(1.0, std::round(seconds * sampleRate)));
}

std::array<float, 5> toBiquad(const juce::dsp::IIR::Coefficients<float>::Ptr& coefficients)
{
    std::array<float, 5> out{1.0F, 0.0F, 0.0F, 0.0F, 0.0F};
    if (coefficients == nullptr || coefficients->getFilterOrder() != 2) {
        return out;
    }
    const float* raw = coefficients->getRawCoefficients();
    std::copy(raw, raw + 5, out.begin());
    return out;
}

}  // namespace

// --- DelayLine ---

void DelayLine::allocate(const std::size_t size)
{
    buffer.assign(std::max<std::size_t>(size, 2), 0.0F);
    write = 0;
}

void DelayLine::clear() noexcept
{
    std::fill(buffer.begin(), buffer.end(), 0.0F);
    write = 0;
}

void DelayLine::push(const float sample) noexcept
{
    write = (write + 1) % buffer.size();
    buffer[write] = sample;
}

float DelayLine::read(const std::size_t delay) const noexcept
{
    const std::size_t size = buffer.size();
    const std::size_t d = std::min(delay, size - 1);
    return buffer[(write + size - d) % size];
}

float DelayLine::readFractional(const double delay) const noexcept
{
    const double clamped = juce::jlimit(0.0, static_cast<double>(buffer.size() - 2), delay);
    const auto whole = static_cast<std::size_t>(clamped);
    const auto frac = static_cast<float>(clamped - static_cast<double>(whole));
    const float a = read(whole);
    const float b = read(whole + 1);
    return a + frac * (b - a);
}

// --- Delay ---

void Delay::prepare(const double sampleRate)
{
    state.buffer.assign(samplesFor(time, sampleRate), 0.0F);
    state.index = 0;
}

float Delay::process(const float input, const float /*sampleRate*/) noexcept
{
    if (state.buffer.empty()) {
        return input;
    }
    const float delayed = state.buffer[state.index];
    const float fb = juce::jlimit(0.0F, 0.99F, feedback);
    state.buffer[state.index] = input + fb * delayed;
    state.index = (state.index + 1) % state.buffer.size();
    return mixDryWet(input, delayed, mix);
}

void Delay::reset() noexcept
{
    std::fill(state.buffer.begin(), state.buffer.end(), 0.0F);
    state.index = 0;
}

bool Delay::isValid() const noexcept
{
    return finiteIn(time, 0.0001F, 10.0F) && finiteIn(feedback, 0.0F, 1.0F) &&
           finiteIn(mix, 0.0F, 1.0F);
}

void Delay::addTo(Fingerprint& fp) const
{
    fp.addTag("delay").addFloat(time).addFloat(feedback).addFloat(mix);
}

// --- Reverb ---

namespace {
constexpr std::array<double, 4> kCombMs{29.7, 37.1, 41.1, 43.7};
constexpr std::array<double, 2> kAllPassMs{5.0, 1.7};
constexpr float kAllPassGain = 0.5F;
}  // namespace

void Reverb::prepare(const double sampleRate)
{
    const double scale = 0.5 + static_cast<double>(juce::jlimit(0.0F, 1.0F, room_size));
    for (std::size_t i = 0; i < state.combs.size(); ++i) {
        state.combs[i].buffer.assign(samplesFor(kCombMs[i] * 0.001 * scale, sampleRate), 0.0F);
        state.combs[i].index = 0;
        state.combs[i].store = 0.0F;
    }
    for (std::size_t i = 0; i < state.allpasses.size(); ++i) {
        state.allpasses[i].buffer.assign(samplesFor(kAllPassMs[i] * 0.001, sampleRate), 0.0F);
        state.allpasses[i].index = 0;
    }
}

float Reverb::process(const float input, const float /*sampleRate*/) noexcept
{
    if (state.combs[0].buffer.empty()) {
        return input;
    }
    const float feedback = 0.7F + 0.28F * juce::jlimit(0.0F, 1.0F, room_size);
    const float damp = juce::jlimit(0.0F, 1.0F, damping);

    float wet = 0.0F;
    for (Comb& comb : state.combs) {
        const float out = comb.buffer[comb.index];
        comb.store = out * (1.0F - damp) + comb.store * damp;
        comb.buffer[comb.index] = input + comb.store * feedback;
        comb.index = (comb.index + 1) % comb.buffer.size();
        wet += out;
    }
    wet *= 0.25F;

    for (AllPass& ap : state.allpasses) {
        const float buffered = ap.buffer[ap.index];
        const float out = buffered - wet;
        ap.buffer[ap.index] = wet + buffered * kAllPassGain;
        ap.index = (ap.index + 1) % ap.buffer.size();
        wet = out;
    }
    return mixDryWet(input, wet, mix);
}

void Reverb::reset() noexcept
{
    for (Comb& comb : state.combs) {
        std::fill(comb.buffer.begin(), comb.buffer.end(), 0.0F);
        comb.index = 0;
        comb.store = 0.0F;
    }
    for (AllPass& ap : state.allpasses) {
        std::fill(ap.buffer.begin(), ap.buffer.end(), 0.0F);
        ap.index = 0;
    }
}

bool Reverb::isValid() const noexcept
{
    return finiteIn(room_size, 0.0F, 1.0F) && finiteIn(damping, 0.0F, 1.0F) &&
           finiteIn(mix, 0.0F, 1.0F);
}

void Reverb::addTo(Fingerprint& fp) const
{
    fp.addTag("reverb").addFloat(room_size).addFloat(damping).addFloat(mix);
}

// --- Chorus ---

void Chorus::prepare(const double sampleRate)
{
    state.line.allocate(samplesFor(0.05, sampleRate));
    state.frame = 0;
}

float Chorus::process(const float input, const float sampleRate) noexcept
{
    if (state.line.empty()) {
        return input;
    }
    state.line.push(input);

    const int count = std::max(voices, 1);
    const double baseDelay = 0.015 * static_cast<double>(sampleRate);
    const double sweep = static_cast<double>(juce::jlimit(0.0F, 1.0F, depth)) * 0.010 *
                         static_cast<double>(sampleRate);
    float wet = 0.0F;
    for (int v = 0; v < count; ++v) {
        const double offset = static_cast<double>(v) / static_cast<double>(count);
        const double lfo = 0.5 * (1.0 + lfoSine(state.frame, sampleRate, rate, offset));
        wet += state.line.readFractional(baseDelay + sweep * lfo);
    }
    wet /= static_cast<float>(count);
    ++state.frame;
    return mixDryWet(input, wet, mix);
}

void Chorus::reset() noexcept
{
    state.line.clear();
    state.frame = 0;
}

bool Chorus::isValid() const noexcept
{
    return finiteIn(rate, 0.0F, 20.0F) && finiteIn(depth, 0.0F, 1.0F) &&
           finiteIn(mix, 0.0F, 1.0F) && voices >= 1 && voices <= 8;
}

void Chorus::addTo(Fingerprint& fp) const
{
    fp.addTag("chorus").addFloat(rate).addFloat(depth).addFloat(mix).addInt(voices);
}

// --- Phaser ---

void Phaser::prepare(const double /*sampleRate*/)
{
    reset();
}

float Phaser::process(const float input, const float sampleRate) noexcept
{
    const double lfo = 0.5 * (1.0 + lfoSine(state.frame, sampleRate, rate));
    const double centre = 300.0 * std::exp2(lfo * static_cast<double>(depth) * 3.0);
    const double nyquistSafe = std::min(centre, 0.45 * static_cast<double>(sampleRate));
    const auto t = static_cast<float>(std::tan(juce::MathConstants<double>::pi * nyquistSafe /
                                               static_cast<double>(sampleRate)));
    const float a = (t - 1.0F) / (t + 1.0F);

    float x = input + juce::jlimit(-0.95F, 0.95F, feedback) * state.last;
    const int count = juce::jlimit(2, 12, stages);
    for (int i = 0; i < count; ++i) {
        float& z = state.z[static_cast<std::size_t>(i)];
        const float y = a * x + z;
        z = x - a * y;
        x = y;
    }
    state.last = std::isfinite(x) ? x : 0.0F;
    ++state.frame;
    return mixDryWet(input, x, mix);
}

void Phaser::reset() noexcept
{
    state.z.fill(0.0F);
    state.last = 0.0F;
    state.frame = 0;
}

bool Phaser::isValid() const noexcept
{
    return finiteIn(rate, 0.0F, 20.0F) && finiteIn(depth, 0.0F, 1.0F) &&
           finiteIn(feedback, -1.0F, 1.0F) && finiteIn(mix, 0.0F, 1.0F) &&
           stages >= 2 && stages <= 12;
}

void Phaser::addTo(Fingerprint& fp) const
{
    fp.addTag("phaser").addFloat(rate).addFloat(depth).addFloat(feedback).addInt(stages).addFloat(mix);
}

// --- Flanger ---

void Flanger::prepare(const double sampleRate)
{
    state.line.allocate(samplesFor(0.010, sampleRate));
    state.last = 0.0F;
    state.frame = 0;
}

float Flanger::process(const float input, const float sampleRate) noexcept
{
    if (state.line.empty()) {
        return input;
    }
    const float fb = juce::jlimit(-0.95F, 0.95F, feedback);
    state.line.push(input + fb * state.last);

    const double lfo = 0.5 * (1.0 + lfoSine(state.frame, sampleRate, rate));
    const double delayMs = 1.0 + static_cast<double>(juce::jlimit(0.0F, 1.0F, depth)) * 4.0 * lfo;
    const float delayed = state.line.readFractional(delayMs * 0.001 * static_cast<double>(sampleRate));
    state.last = delayed;
    ++state.frame;
    return mixDryWet(input, delayed, mix);
}

void Flanger::reset() noexcept
{
    state.line.clear();
    state.last = 0.0F;
    state.frame = 0;
}

bool Flanger::isValid() const noexcept
{
    return finiteIn(rate, 0.0F, 20.0F) && finiteIn(depth, 0.0F, 1.0F) &&
           finiteIn(feedback, -1.0F, 1.0F) && finiteIn(mix, 0.0F, 1.0F);
}

void Flanger::addTo(Fingerprint& fp) const
{
    fp.addTag("flanger").addFloat(rate).addFloat(depth).addFloat(feedback).addFloat(mix);
}

// --- Tremolo ---

void Tremolo::prepare(const double /*sampleRate*/)
{
    reset();
}

float Tremolo::process(const float input, const float sampleRate) noexcept
{
    const float lfo = lfoSine(state.frame, sampleRate, rate);
    ++state.frame;
    return input * (1.0F - depth * (0.5F - 0.5F * lfo));
}

void Tremolo::reset() noexcept
{
    state.frame = 0;
}

bool Tremolo::isValid() const noexcept
{
    return finiteIn(rate, 0.0F, 100.0F) && finiteIn(depth, 0.0F, 1.0F);
}

void Tremolo::addTo(Fingerprint& fp) const
{
    fp.addTag("tremolo").addFloat(rate).addFloat(depth);
}

// --- AutoPan ---

void AutoPan::prepare(const double /*sampleRate*/)
{
    reset();
}

float AutoPan::process(const float input, const float /*sampleRate*/) noexcept
{
    return input;
}

void AutoPan::processStereo(float& left, float& right, const float sampleRate) noexcept
{
    const float pan = depth * lfoSine(state.frame, sampleRate, rate);
    const float angle = (pan + 1.0F) * juce::MathConstants<float>::pi * 0.25F;
    left *= std::cos(angle) * juce::MathConstants<float>::sqrt2;
    right *= std::sin(angle) * juce::MathConstants<float>::sqrt2;
    ++state.frame;
}

void AutoPan::reset() noexcept
{
    state.frame = 0;
}

bool AutoPan::isValid() const noexcept
{
    return finiteIn(rate, 0.0F, 100.0F) && finiteIn(depth, 0.0F, 1.0F);
}

void AutoPan::addTo(Fingerprint& fp) const
{
    fp.addTag("autopan").addFloat(rate).addFloat(depth);
}

float AutoPan::panAt(const double seconds) const noexcept
{
    return depth * static_cast<float>(std::sin(kTwoPi * static_cast<double>(rate) * seconds));
}

// --- BitCrusher ---

void BitCrusher::prepare(const double /*sampleRate*/)
{
    reset();
}

float BitCrusher::process(const float input, const float /*sampleRate*/) noexcept
{
    if (state.counter == 0) {
        const float levels = std::exp2(static_cast<float>(juce::jlimit(1, 24, bits) - 1));
        state.held = std::round(input * levels) / levels;
    }
    state.counter = (state.counter + 1) % std::max(sample_rate_div, 1);
    return mixDryWet(input, state.held, mix);
}

void BitCrusher::reset() noexcept
{
    state.held = 0.0F;
    state.counter = 0;
}

bool BitCrusher::isValid() const noexcept
{
    return bits >= 1 && bits <= 24 && sample_rate_div >= 1 && finiteIn(mix, 0.0F, 1.0F);
}

void BitCrusher::addTo(Fingerprint& fp) const
{
    fp.addTag("bitcrusher").addInt(bits).addInt(sample_rate_div).addFloat(mix);
}

// --- RingModulator ---

void RingModulator::prepare(const double /*sampleRate*/)
{
    reset();
}

float RingModulator::process(const float input, const float sampleRate) noexcept
{
    const float carrier = lfoSine(state.frame, sampleRate, carrier_hz);
    ++state.frame;
    return mixDryWet(input, input * carrier, mix);
}

void RingModulator::reset() noexcept
{
    state.frame = 0;
}

bool RingModulator::isValid() const noexcept
{
    return finiteIn(carrier_hz, 0.0F, 20000.0F) && finiteIn(mix, 0.0F, 1.0F);
}

void RingModulator::addTo(Fingerprint& fp) const
{
    fp.addTag("ringmod").addFloat(carrier_hz).addFloat(mix);
}

// --- Eq ---

void Eq::prepare(const double sampleRate)
{
    using Coefficients = juce::dsp::IIR::Coefficients<float>;
    const auto limit = static_cast<float>(0.45 * sampleRate);
    const auto clampFreq = [limit](const float hz) { return juce::jlimit(10.0F, limit, hz); };

    state.biquads.clear();
    state.biquads.push_back({toBiquad(Coefficients::makeLowShelf(
        sampleRate, clampFreq(low_freq), 0.707F, juce::Decibels::decibelsToGain(low_gain_db)))});
    state.biquads.push_back({toBiquad(Coefficients::makePeakFilter(
        sampleRate, clampFreq(mid_freq), std::max(mid_q, 0.05F),
        juce::Decibels::decibelsToGain(mid_gain_db)))});
    state.biquads.push_back({toBiquad(Coefficients::makeHighShelf(
        sampleRate, clampFreq(high_freq), 0.707F, juce::Decibels::decibelsToGain(high_gain_db)))});
    for (const EqBand& band : bands) {
        state.biquads.push_back({toBiquad(Coefficients::makePeakFilter(
            sampleRate, clampFreq(band.frequency), std::max(band.q, 0.05F),
            juce::Decibels::decibelsToGain(band.gain_db)))});
    }
}

float Eq::process(const float input, const float /*sampleRate*/) noexcept
{
    float x = input;
    for (Biquad& bq : state.biquads) {
        const auto& c = bq.coefficients;
        const float y = c[0] * x + bq.s1;
        bq.s1 = c[1] * x - c[3] * y + bq.s2;
        bq.s2 = c[2] * x - c[4] * y;
        x = y;
    }
    return x;
}

void Eq::reset() noexcept
{
    for (Biquad& bq : state.biquads) {
        bq.s1 = 0.0F;
        bq.s2 = 0.0F;
    }
}

bool Eq::isValid() const noexcept
{
    const auto validBand = [](const float freq, const float gainDb, const float q) {
        return finiteIn(freq, 10.0F, 22000.0F) && finiteIn(gainDb, -48.0F, 48.0F) &&
               finiteIn(q, 0.01F, 100.0F);
    };
    if (!validBand(low_freq, low_gain_db, 0.707F) || !validBand(mid_freq, mid_gain_db, mid_q) ||
        !validBand(high_freq, high_gain_db, 0.707F)) {
        return false;
    }
    return std::all_of(bands.begin(), bands.end(), [&](const EqBand& band) {
        return validBand(band.frequency, band.gain_db, band.q);
    });
}

void Eq::addTo(Fingerprint& fp) const
{
    fp.addTag("eq").addFloat(low_gain_db).addFloat(mid_gain_db).addFloat(high_gain_db);
    fp.addFloat(low_freq).addFloat(mid_freq).addFloat(high_freq).addFloat(mid_q);
    fp.addInt(static_cast<std::int64_t>(bands.size()));
    for (const EqBand& band : bands) {
        fp.addFloat(band.frequency).addFloat(band.gain_db).addFloat(band.q);
    }
}

// --- Compressor ---

void Compressor::prepare(const double /*sampleRate*/)
{
    reset();
}

float Compressor::process(const float input, const float sampleRate) noexcept
{
    return processKeyed(input, std::abs(input), sampleRate);
}

float Compressor::processKeyed(const float input, const float keyLevel,
                               const float sampleRate) noexcept
{
    const float level = std::abs(keyLevel);
    float target = 1.0F;
    if (level > threshold && level > 0.0F) {
        target = std::pow(threshold / level, 1.0F - 1.0F / std::max(ratio, 1.0F));
    }
    const float coef = target < state.gain ? timeCoefficient(attack, sampleRate)
                                           : timeCoefficient(release, sampleRate);
    state.gain = target + coef * (state.gain - target);
    return input * state.gain * makeup_gain;
}

void Compressor::reset() noexcept
{
    state.gain = 1.0F;
}

bool Compressor::isValid() const noexcept
{
    return finiteIn(threshold, 1.0e-6F, 1.0F) && finiteIn(ratio, 1.0F, 1000.0F) &&
           finiteIn(attack, 0.0F, 5.0F) && finiteIn(release, 0.0F, 10.0F) &&
           finiteIn(makeup_gain, 0.0F, 16.0F);
}

void Compressor::addTo(Fingerprint& fp) const
{
    fp.addTag("compressor").addFloat(threshold).addFloat(ratio).addFloat(attack);
    fp.addFloat(release).addFloat(makeup_gain);
    if (!sidechain_bus.empty()) {
        fp.addTag("sidechain").addTag(sidechain_bus.c_str());
    }
}

// --- Limiter ---

void Limiter::prepare(const double /*sampleRate*/)
{
    reset();
}

float Limiter::process(const float input, const float sampleRate) noexcept
{
    const float level = std::abs(input);
    const float target = level > threshold ? threshold / level : 1.0F;
    if (target < state.gain) {
        state.gain = target;
    } else {
        const float coef = timeCoefficient(release, sampleRate);
        state.gain = target + coef * (state.gain - target);
    }
    const float output = input * state.gain;
    return juce::jlimit(-threshold, threshold, output);
}

void Limiter::reset() noexcept
{
    state.gain = 1.0F;
}

bool Limiter::isValid() const noexcept
{
    return finiteIn(threshold, 1.0e-6F, 1.0F) && finiteIn(release, 0.0F, 10.0F);
}

void Limiter::addTo(Fingerprint& fp) const
{
    fp.addTag("limiter").addFloat(threshold).addFloat(release);
}

// --- Gate ---

void Gate::prepare(const double /*sampleRate*/)
{
    reset();
}

float Gate::process(const float input, const float sampleRate) noexcept
{
    const float target = std::abs(input) < threshold ? 1.0F / std::max(ratio, 1.0F) : 1.0F;
    const float coef = target > state.gain ? timeCoefficient(attack, sampleRate)
                                           : timeCoefficient(release, sampleRate);
    state.gain = target + coef * (state.gain - target);
    return input * state.gain;
}

void Gate::reset() noexcept
{
    state.gain = 1.0F;
}

bool Gate::isValid() const noexcept
{
    return finiteIn(threshold, 0.0F, 1.0F) && finiteIn(ratio, 1.0F, 1.0e6F) &&
           finiteIn(attack, 0.0F, 5.0F) && finiteIn(release, 0.0F, 10.0F);
}

void Gate::addTo(Fingerprint& fp) const
{
    fp.addTag("gate").addFloat(threshold).addFloat(ratio).addFloat(attack).addFloat(release);
}

// --- Saturation ---

void Saturation::prepare(const double /*sampleRate*/)
{
    reset();
}

float Saturation::process(const float input, const float /*sampleRate*/) noexcept
{
    const float d = std::max(drive, 1.0F);
    const float x = input * d;
    const float bias = 0.2F * juce::jlimit(0.0F, 1.0F, character);
    // The bias term adds even harmonics; the one-pole high-pass removes
    // the DC it introduces.
    const float shaped = (std::tanh(x + bias) - std::tanh(bias)) / std::tanh(d);
    const float blocked = shaped - state.dc_in + 0.995F * state.dc_out;
    state.dc_in = shaped;
    state.dc_out = blocked;
    return mixDryWet(input, blocked, mix);
}

void Saturation::reset() noexcept
{
    state.dc_in = 0.0F;
    state.dc_out = 0.0F;
}

bool Saturation::isValid() const noexcept
{
    return finiteIn(drive, 1.0F, 100.0F) && finiteIn(character, 0.0F, 1.0F) &&
           finiteIn(mix, 0.0F, 1.0F);
}

void Saturation::addTo(Fingerprint& fp) const
{
    fp.addTag("saturation").addFloat(drive).addFloat(character).addFloat(mix);
}

// --- Distortion ---

void Distortion::prepare(const double /*sampleRate*/) {}

float Distortion::process(const float input, const float /*sampleRate*/) noexcept
{
    return mixDryWet(input, std::tanh(input * std::max(drive, 1.0F)), mix);
}

void Distortion::reset() noexcept {}

bool Distortion::isValid() const noexcept
{
    return finiteIn(drive, 1.0F, 100.0F) && finiteIn(mix, 0.0F, 1.0F);
}

void Distortion::addTo(Fingerprint& fp) const
{
    fp.addTag("distortion").addFloat(drive).addFloat(mix);
}

// --- Variant dispatch ---

void prepareEffect(Effect& effect, const double sampleRate)
{
    std::visit([sampleRate](auto& fx) { fx.prepare(sampleRate); }, effect);
}

float processEffect(Effect& effect, const float input, const float sampleRate) noexcept
{
    return std::visit([input, sampleRate](auto& fx) { return fx.process(input, sampleRate); },
                      effect);
}

void resetEffect(Effect& effect) noexcept
{
    std::visit([](auto& fx) { fx.reset(); }, effect);
}

bool isEffectValid(const Effect& effect) noexcept
{
    return std::visit([](const auto& fx) { return fx.isValid(); }, effect);
}

void addEffectFingerprint(Fingerprint& fp, const Effect& effect)
{
    std::visit([&fp](const auto& fx) { fx.addTo(fp); }, effect);
}

const char* effectName(const Effect& effect) noexcept
{
    static constexpr const char* kNames[] = {
        "delay",  "reverb",  "chorus",     "phaser",     "flanger",
        "tremolo", "autopan", "bitcrusher", "ringmod",    "eq",
        "compressor", "limiter", "gate",    "saturation", "distortion",
    };
    return kNames[effect.index()];
}

bool isSidechained(const Effect& effect) noexcept
{
    const auto* compressor = std::get_if<Compressor>(&effect);
    return compressor != nullptr && !compressor->sidechain_bus.empty();
}

}  // namespace tunesmith
