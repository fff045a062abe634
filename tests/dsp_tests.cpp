#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <limits>
#include <vector>

#include "tunesmith/Envelope.h"
#include "tunesmith/Filter.h"
#include "tunesmith/FmSynthesis.h"
#include "tunesmith/Lfo.h"
#include "tunesmith/Oscillator.h"
#include "tunesmith/Types.h"
#include "tunesmith/VoiceRenderer.h"
#include "tunesmith/Wavetable.h"

// Oscillator, envelope, filter, FM/additive, LFO and voice renderer
// checks. Runs as a normal binary under CTest.

using tunesmith::Envelope;
using tunesmith::EnvelopeCurve;
using tunesmith::Error;
using tunesmith::Filter;
using tunesmith::FilterEnvelope;
using tunesmith::FilterSlope;
using tunesmith::FilterType;
using tunesmith::FmParams;
using tunesmith::Lfo;
using tunesmith::ModRoute;
using tunesmith::ModTarget;
using tunesmith::NoiseGenerator;
using tunesmith::Oscillator;
using tunesmith::Partial;
using tunesmith::VoiceDescriptor;
using tunesmith::VoiceRenderer;
using tunesmith::Waveform;
using tunesmith::Wavetable;
using tunesmith::framesForDuration;

namespace {

constexpr float kRate = 44100.0F;
constexpr double kPi = 3.14159265358979323846;

bool near(const double a, const double b, const double tolerance)
{
    return std::abs(a - b) <= tolerance;
}

float peakOf(const Wavetable& table)
{
    float peak = 0.0F;
    for (std::size_t i = 0; i < table.size(); ++i) {
        peak = std::max(peak, std::abs(table.data()[i]));
    }
    return peak;
}

std::vector<float> sineBuffer(const double frequency, const std::size_t count)
{
    std::vector<float> out(count);
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = static_cast<float>(
            std::sin(2.0 * kPi * frequency * static_cast<double>(i) / kRate));
    }
    return out;
}

double rms(const std::vector<float>& samples, const std::size_t from, const std::size_t to)
{
    double sum = 0.0;
    for (std::size_t i = from; i < to; ++i) {
        sum += static_cast<double>(samples[i]) * static_cast<double>(samples[i]);
    }
    return std::sqrt(sum / static_cast<double>(to - from));
}

std::vector<float> runFilter(Filter filter, const std::vector<float>& input)
{
    std::vector<float> out(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        out[i] = filter.process(input[i], kRate);
    }
    return out;
}

int risingZeroCrossings(const std::vector<float>& samples)
{
    int count = 0;
    for (std::size_t i = 1; i < samples.size(); ++i) {
        if (samples[i - 1] < 0.0F && samples[i] >= 0.0F) {
            ++count;
        }
    }
    return count;
}

void testWavetables()
{
    const Wavetable& sine = Wavetable::sine();
    assert(sine.size() == Wavetable::kDefaultSize);
    assert(near(sine.lookup(0.0), 0.0, 1e-5));
    assert(near(sine.lookup(0.25), 1.0, 1e-4));
    assert(near(sine.lookup(0.75), -1.0, 1e-4));

    // Phases wrap in both directions.
    assert(near(sine.lookup(1.25), sine.lookup(0.25), 1e-5));
    assert(near(sine.lookup(-0.75), sine.lookup(0.25), 1e-5));

    // Band-limited presets are peak-normalised.
    assert(near(peakOf(Wavetable::sawBandlimited()), 1.0, 1e-4));
    assert(near(peakOf(Wavetable::squareBandlimited()), 1.0, 1e-4));
    assert(near(peakOf(Wavetable::triangleBandlimited()), 1.0, 1e-4));
    assert(near(peakOf(Wavetable::pwm(0.25F)), 1.0, 1e-4));

    // Preset accessors hand out the same process-wide table.
    assert(&Wavetable::sine() == &sine);

    Error error = Error::kInvalidParameter;
    assert(!Wavetable::fromSamples({}, &error));
    assert(error == Error::kInvalidWavetable);
    error = Error::kInvalidParameter;
    assert(!Wavetable::fromSamples({0.0F, std::numeric_limits<float>::quiet_NaN()}, &error));
    assert(error == Error::kInvalidWavetable);
    assert(!Wavetable::fromHarmonics(1024, {{0, 1.0F}}));
    assert(!Wavetable::fromFn(0, [](float) { return 0.0F; }));

    // A single first harmonic is a sine.
    const auto harmonic = Wavetable::fromHarmonics(2048, {{1, 0.5F}});
    assert(harmonic);
    for (double phase = 0.0; phase < 1.0; phase += 0.01) {
        assert(near(harmonic->lookup(phase), sine.lookup(phase), 1e-4));
    }

    const auto ramp = Wavetable::fromFn(4, [](const float phase) { return phase; });
    assert(ramp && ramp->size() == 4);
    assert(near(ramp->lookup(0.125), 0.125, 1e-6));  // halfway between 0 and 0.25

    // Content ids follow the samples, not the object.
    const auto a = Wavetable::fromSamples({0.0F, 1.0F, 0.0F, -1.0F});
    const auto b = Wavetable::fromSamples({0.0F, 1.0F, 0.0F, -1.0F});
    const auto c = Wavetable::fromSamples({0.0F, 0.5F, 0.0F, -0.5F});
    assert(a && b && c);
    assert(a->contentId() == b->contentId());
    assert(a->contentId() != c->contentId());
    assert(sine.contentId() != Wavetable::sawBandlimited().contentId());
}

void testOscillators()
{
    // 441 Hz at 44.1 kHz is exactly 100 samples per cycle.
    Oscillator osc(Wavetable::sine(), kRate);
    std::vector<float> buffer(44100);
    osc.render(buffer.data(), static_cast<int>(buffer.size()), 441.0);
    const int crossings = risingZeroCrossings(buffer);
    assert(crossings >= 440 && crossings <= 441);
    assert(near(osc.phase(), 0.0, 1e-6) || near(osc.phase(), 1.0, 1e-6));

    osc.reset(0.25);
    assert(near(osc.next(441.0), 1.0, 1e-4));
    assert(near(osc.phase(), 0.26, 1e-9));

    NoiseGenerator first(7);
    NoiseGenerator second(7);
    NoiseGenerator zeroSeed(0);
    bool moved = false;
    for (int i = 0; i < 1000; ++i) {
        const float value = first.next();
        assert(value == second.next());
        assert(value >= -1.0F && value <= 1.0F);
        moved = moved || zeroSeed.next() != 0.0F;
    }
    assert(moved);

    assert(&tunesmith::presetTableFor(Waveform::kSawtooth) == &Wavetable::sawBandlimited());
    assert(&tunesmith::presetTableFor(Waveform::kNoise) == &Wavetable::sine());
}

void testEnvelopes()
{
    Error error = Error::kCacheFull;
    assert(!Envelope::create(-1.0F, 0.1F, 0.5F, 0.1F, EnvelopeCurve::kLinear, &error));
    assert(error == Error::kInvalidParameter);
    assert(!Envelope::create(0.1F, 0.1F, 1.5F, 0.1F));
    assert(!Envelope::create(0.1F, std::numeric_limits<float>::infinity(), 0.5F, 0.1F));

    const auto clamped = Envelope::create(0.0F, 0.0F, 0.5F, 0.0F);
    assert(clamped && clamped->isValid());
    assert(clamped->attack == Envelope::kMinTime);
    assert(clamped->release == Envelope::kMinTime);

    const auto env = Envelope::create(0.01F, 0.1F, 0.8F, 0.1F);
    assert(env);
    assert(near(env->amplitudeAt(-0.5, 1.0), 0.0, 1e-9));
    assert(near(env->amplitudeAt(0.0, 1.0), 0.0, 1e-6));
    assert(near(env->amplitudeAt(0.005, 1.0), 0.5, 1e-3));
    assert(near(env->amplitudeAt(0.06, 1.0), 0.9, 1e-3));
    assert(near(env->amplitudeAt(0.5, 1.0), 0.8, 1e-6));
    assert(near(env->amplitudeAt(1.05, 1.0), 0.4, 1e-3));
    assert(near(env->amplitudeAt(1.2, 1.0), 0.0, 1e-9));
    assert(near(env->totalDuration(1.0), 1.1, 1e-6));

    // Released during the attack: the release starts from the level
    // reached at note-off.
    assert(near(env->amplitudeAt(0.005, 0.005), 0.5, 1e-3));
    assert(near(env->amplitudeAt(0.055, 0.005), 0.25, 1e-3));

    // Shaped curves still reach the peak at the end of the attack and
    // rise monotonically.
    for (const EnvelopeCurve curve : {EnvelopeCurve::kExponential, EnvelopeCurve::kLogarithmic}) {
        const auto shaped = Envelope::create(0.1F, 0.1F, 0.5F, 0.1F, curve);
        assert(shaped);
        assert(near(shaped->amplitudeAt(0.0999999, 10.0), 1.0, 1e-3));
        float previous = -1.0F;
        for (double t = 0.0; t < 0.1; t += 0.005) {
            const float level = shaped->amplitudeAt(t, 10.0);
            assert(level >= previous);
            previous = level;
        }
        // Exponential and logarithmic attacks rise faster than linear.
        assert(shaped->amplitudeAt(0.05, 10.0) > 0.5F);
    }

    for (const Envelope& preset :
         {Envelope::piano(), Envelope::organ(), Envelope::pad(), Envelope::pluck()}) {
        assert(preset.isValid());
    }

    const auto sweep = FilterEnvelope::create(Envelope{0.1F, 0.1F, 0.5F, 0.1F}, 200.0F, 3200.0F, 1.0F);
    assert(sweep);
    assert(near(sweep->cutoffAt(0.0, 1.0), 200.0, 0.5));
    assert(near(sweep->cutoffAt(0.1, 1.0), 3200.0, 5.0));
    // Half the envelope is half the sweep in octaves: 200 * 2^(4 * 0.5).
    assert(near(sweep->cutoffAt(0.5, 1.0), 800.0, 2.0));
    const auto flat = FilterEnvelope::create(Envelope{}, 300.0F, 3000.0F, 0.0F);
    assert(flat && flat->cutoffAt(0.3, 1.0) == 300.0F);
    assert(!FilterEnvelope::create(Envelope{}, -5.0F, 3000.0F, 0.5F));
    assert(FilterEnvelope::pluck().shape.isValid());
    assert(FilterEnvelope::bass().cutoffAt(5.0, 1.0) >= 20.0F);
}

void testFilters()
{
    const std::vector<float> low = sineBuffer(100.0, 22050);
    const std::vector<float> high = sineBuffer(5000.0, 22050);
    const double lowRms = rms(low, 11025, 22050);
    const double highRms = rms(high, 11025, 22050);

    const std::vector<float> lowPassed = runFilter(Filter::lowPass(500.0F, 0.0F), high);
    assert(rms(lowPassed, 11025, 22050) < 0.1 * highRms);
    const std::vector<float> kept = runFilter(Filter::lowPass(5000.0F, 0.0F), low);
    assert(near(rms(kept, 11025, 22050), lowRms, 0.1 * lowRms));

    const std::vector<float> highPassed = runFilter(Filter::highPass(5000.0F, 0.0F), low);
    assert(rms(highPassed, 11025, 22050) < 0.1 * lowRms);

    // 24 dB/oct attenuates further than 12 dB/oct.
    const std::vector<float> steep =
        runFilter(Filter(FilterType::kLowPass, 1000.0F, 0.0F, FilterSlope::k24dB), high);
    const std::vector<float> gentle = runFilter(Filter(FilterType::kLowPass, 1000.0F, 0.0F), high);
    assert(rms(steep, 11025, 22050) < rms(gentle, 11025, 22050));

    const std::vector<float> moog = runFilter(Filter::moog(500.0F, 0.3F), high);
    assert(rms(moog, 11025, 22050) < 0.1 * highRms);

    // Bypass passes samples through untouched.
    Filter bypass;
    assert(bypass.type() == FilterType::kNone);
    assert(bypass.process(0.3F, kRate) == 0.3F);

    // Parameters are clamped and reported as set points.
    Filter clamped = Filter::bandPass(5.0F, 3.0F);
    assert(clamped.cutoff() == Filter::kMinCutoff);
    assert(clamped.resonance() == Filter::kMaxResonance);
    clamped.setCutoff(1234.0F);
    assert(clamped.cutoff() == 1234.0F);
    clamped.setCutoff(std::numeric_limits<float>::quiet_NaN());
    assert(clamped.cutoff() == 1234.0F);

    // Absurd input never leaves non-finite state behind, and the filter
    // produces finite output on the very next sample.
    for (const FilterType type : {FilterType::kLowPass, FilterType::kNotch, FilterType::kAllPass,
                                  FilterType::kMoog}) {
        Filter filter(type, 2000.0F, 0.95F, FilterSlope::k24dB);
        const float blasts[] = {1.0e30F, -1.0e30F, std::numeric_limits<float>::infinity(),
                                std::numeric_limits<float>::quiet_NaN(), 1.0e30F};
        for (const float blast : blasts) {
            static_cast<void>(filter.process(blast, kRate));
            assert(filter.isStateFinite());
            const float next = filter.process(0.5F, kRate);
            assert(std::isfinite(next));
            assert(filter.isStateFinite());
        }
    }
}

void testFmAndAdditive()
{
    Error error = Error::kCacheFull;
    assert(!FmParams::create(0.0F, 1.0F, &error));
    assert(error == Error::kInvalidParameter);
    assert(!FmParams::create(1.0F, -1.0F));
    assert(!FmParams::withIndexEnvelope(1.0F, 1.0F, Envelope{}, 1.5F));

    // Zero index is a plain sine at the carrier.
    const auto plain = FmParams::create(2.0F, 0.0F);
    assert(plain);
    for (double t = 0.0; t < 0.01; t += 0.0003) {
        const double expected = std::sin(2.0 * kPi * 440.0 * t);
        assert(near(plain->sample(440.0, t, 1.0), expected, 1e-3));
    }

    const auto constant = FmParams::create(1.0F, 3.0F);
    assert(constant && constant->indexAt(0.5, 1.0) == 3.0F);

    const auto shaped = FmParams::withIndexEnvelope(1.0F, 4.0F, Envelope{0.1F, 0.1F, 0.5F, 0.1F}, 1.0F);
    assert(shaped);
    assert(near(shaped->indexAt(0.0, 1.0), 0.0, 1e-6));
    assert(near(shaped->indexAt(0.1, 1.0), 4.0, 1e-2));
    assert(near(shaped->indexAt(0.5, 1.0), 2.0, 1e-6));

    for (const FmParams& preset : {FmParams::electricPiano(), FmParams::bell(), FmParams::brass(),
                                   FmParams::bass(), FmParams::metallicPad(), FmParams::growl()}) {
        assert(preset.isValid());
        for (double t = 0.0; t < 0.05; t += 0.001) {
            const float value = preset.sample(220.0, t, 1.0);
            assert(value >= -1.0001F && value <= 1.0001F);
        }
    }

    assert(tunesmith::additiveSample({}, 440.0, 0.1) == 0.0F);
    const std::vector<Partial> single{{1.0F, 1.0F, 0.0F}};
    const std::vector<Partial> pair{{1.0F, 1.0F, 0.0F}, {2.0F, 1.0F, 0.0F}};
    for (double t = 0.0; t < 0.01; t += 0.0007) {
        const double fundamental = std::sin(2.0 * kPi * 440.0 * t);
        const double octave = std::sin(2.0 * kPi * 880.0 * t);
        assert(near(tunesmith::additiveSample(single, 440.0, t), fundamental, 1e-3));
        assert(near(tunesmith::additiveSample(pair, 440.0, t), (fundamental + octave) * 0.5, 1e-3));
    }
}

void testLfos()
{
    const Lfo fast(Waveform::kSine, 1000.0F, 2.0F);
    assert(fast.rate() == 100.0F);
    assert(fast.depth() == 1.0F);
    assert(Lfo(Waveform::kSine, 0.0F, 0.5F).rate() == 0.01F);

    const Lfo square(Waveform::kSquare, 2.0F, 1.0F);
    assert(square.rawAt(0.0) == 1.0F);
    assert(square.rawAt(0.3) == -1.0F);
    assert(square.valueAt(0.0) == 1.0F);
    assert(square.valueAt(0.3) == 0.0F);

    const Lfo silent(Waveform::kTriangle, 3.0F, 0.0F);
    assert(silent.valueAt(0.17) == 0.5F);
    assert(silent.bipolarAt(0.17) == 0.0F);

    // Phase offsets are in cycles.
    const Lfo shifted(Waveform::kSawtooth, 1.0F, 1.0F, 0.5F);
    assert(near(shifted.rawAt(0.0), 0.0, 1e-6));

    // Sample-and-hold noise stays constant within a cycle.
    const Lfo held(Waveform::kNoise, 4.0F, 1.0F);
    assert(held.rawAt(0.01) == held.rawAt(0.2));
    assert(held.rawAt(0.3) >= -1.0F && held.rawAt(0.3) <= 1.0F);

    Error error = Error::kCacheFull;
    assert(!ModRoute::create(Lfo{}, ModTarget::kVolume, 1.5F, &error));
    assert(error == Error::kInvalidParameter);

    const auto tremolo = ModRoute::create(Lfo(Waveform::kSine, 5.0F, 1.0F), ModTarget::kVolume, 1.0F);
    const auto vibrato = ModRoute::create(Lfo(Waveform::kSine, 5.0F, 1.0F), ModTarget::kPitch, 1.0F);
    const auto wah = ModRoute::create(Lfo(Waveform::kSquare, 1.0F, 1.0F), ModTarget::kFilterCutoff, 0.5F);
    assert(tremolo && vibrato && wah);
    const double semitone = std::exp2(1.0 / 12.0);
    for (double t = 0.0; t < 1.0; t += 0.013) {
        const float gain = tremolo->apply(1.0F, t);
        assert(gain >= -1e-6F && gain <= 1.0F + 1e-6F);
        const float pitch = vibrato->apply(440.0F, t);
        assert(pitch >= 440.0 / semitone - 1e-3 && pitch <= 440.0 * semitone + 1e-3);
    }
    // Square LFO at full depth: +/- 24 semitones for amount 0.5.
    assert(near(wah->apply(1000.0F, 0.1), 4000.0, 1.0));
    assert(near(wah->apply(1000.0F, 0.6), 250.0, 0.1));
}

void testVoiceRenderer()
{
    const VoiceRenderer renderer(44100);

    VoiceDescriptor voice;
    voice.frequency = 440.0F;
    voice.duration = 1.0F;
    voice.envelope = *Envelope::create(0.01F, 0.1F, 0.8F, 0.1F);
    assert(voice.validate());
    assert(renderer.renderLength(voice) == 48510);

    const std::vector<float> first = renderer.render(voice);
    const std::vector<float> second = renderer.render(voice);
    assert(first.size() == 48510);
    assert(first == second);
    assert(near(first.back(), 0.0, 1e-3));

    VoiceDescriptor quiet = voice;
    quiet.velocity = 0.5F;
    const std::vector<float> half = renderer.render(quiet);
    for (std::size_t i = 0; i < first.size(); i += 97) {
        assert(half[i] == first[i] * 0.5F);
    }

    VoiceDescriptor rich = voice;
    rich.waveform = Waveform::kSawtooth;
    rich.filter = Filter::lowPass(800.0F, 0.4F);
    rich.filter_envelope = FilterEnvelope::pluck();
    rich.mod_routes.push_back(*ModRoute::create(Lfo(Waveform::kSine, 6.0F, 1.0F), ModTarget::kPitch, 0.3F));
    rich.mod_routes.push_back(*ModRoute::create(Lfo(Waveform::kTriangle, 2.0F, 1.0F), ModTarget::kVolume, 0.5F));
    assert(rich.validate());
    const std::vector<float> filtered = renderer.render(rich);
    assert(filtered == renderer.render(rich));
    for (const float sample : filtered) {
        assert(std::isfinite(sample));
    }

    VoiceDescriptor noise = voice;
    noise.waveform = Waveform::kNoise;
    assert(renderer.render(noise) == renderer.render(noise));

    VoiceDescriptor fm = voice;
    fm.fm = FmParams::bell();
    assert(renderer.render(fm) != first);

    // Zero duration still renders the release tail.
    VoiceDescriptor blip = voice;
    blip.duration = 0.0F;
    assert(renderer.renderLength(blip) == 4410);

    // Cached renders carry the pitch they were synthesised at.
    VoiceDescriptor bent = voice;
    bent.pitch_bend_semitones = 12.0F;
    assert(near(bent.effectiveFrequency(), 880.0, 1e-6));
    const auto cached = renderer.renderCached(bent);
    assert(near(cached.reference_frequency, 880.0, 1e-6));
    assert(cached.length() == 48510);
    assert(cached.byte_size == 48510 * sizeof(float));

    Error error = Error::kCacheFull;
    VoiceDescriptor broken = voice;
    broken.frequency = -5.0F;
    assert(!broken.validate(&error));
    assert(error == Error::kInvalidParameter);
    VoiceDescriptor custom = voice;
    custom.waveform = Waveform::kCustom;
    assert(!custom.validate(&error));
    assert(error == Error::kInvalidWavetable);
    custom.custom_wavetable = Wavetable::pwm(0.3F);
    assert(custom.validate());
    assert(renderer.render(custom).size() == 48510);
}

// Frequencies from successive rising zero crossings in [from, to),
// with each crossing position interpolated between samples.
std::vector<double> crossingFrequencies(const std::vector<float>& samples, const std::size_t from,
                                        const std::size_t to)
{
    std::vector<double> crossings;
    for (std::size_t i = std::max<std::size_t>(from, 1); i < to && i < samples.size(); ++i) {
        const float a = samples[i - 1];
        const float b = samples[i];
        if (a < 0.0F && b >= 0.0F) {
            crossings.push_back(static_cast<double>(i - 1) + static_cast<double>(a / (a - b)));
        }
    }
    std::vector<double> frequencies;
    for (std::size_t i = 1; i < crossings.size(); ++i) {
        frequencies.push_back(static_cast<double>(kRate) / (crossings[i] - crossings[i - 1]));
    }
    return frequencies;
}

// A +/-1 semitone vibrato has to stay within a semitone of the note
// however long the note runs.
void testVibratoOnFmAndAdditive()
{
    const VoiceRenderer renderer(kRate);
    const auto vibrato = ModRoute::create(Lfo(Waveform::kSine, 5.0F, 1.0F), ModTarget::kPitch, 1.0F);
    assert(vibrato);

    VoiceDescriptor fm;
    fm.frequency = 440.0F;
    fm.duration = 4.0F;
    fm.envelope = Envelope{0.001F, 0.001F, 1.0F, 0.01F};
    fm.fm = FmParams::create(1.0F, 0.0F);
    assert(fm.fm);
    fm.mod_routes.push_back(*vibrato);

    VoiceDescriptor additive = fm;
    additive.fm.reset();
    additive.partials = {Partial{1.0F, 1.0F, 0.0F}};

    const double low = 440.0 * std::pow(2.0, -1.0 / 12.0) * 0.98;
    const double high = 440.0 * std::pow(2.0, 1.0 / 12.0) * 1.02;
    for (const VoiceDescriptor* voice : {&fm, &additive}) {
        const std::vector<float> out = renderer.render(*voice);
        const std::vector<double> frequencies = crossingFrequencies(
            out, static_cast<std::size_t>(3.0F * kRate), static_cast<std::size_t>(3.2F * kRate));
        assert(frequencies.size() > 70);
        double lowest = frequencies.front();
        double highest = frequencies.front();
        for (const double f : frequencies) {
            assert(f >= low && f <= high);
            lowest = std::min(lowest, f);
            highest = std::max(highest, f);
        }
        // One full vibrato cycle is covered, so both extremes show up.
        assert(lowest < 425.0 && highest > 455.0);
    }
}

void testFrameCounts()
{
    assert(framesForDuration(1.0, 44100) == 44100);
    assert(framesForDuration(0.5 + 1.0e-9, 44100) == 22050);
    assert(framesForDuration(static_cast<double>(1.1F), 44100) == 48510);
    // Durations a third of a frame past a whole frame count round up at
    // any length.
    assert(framesForDuration(50.0 + 0.3 / 44100.0, 44100) == 2205001);
    assert(framesForDuration(120.0 + 0.3 / 44100.0, 44100) == 5292001);
    assert(framesForDuration(120.0, 44100) == 5292000);
}

}  // namespace

int main()
{
    testWavetables();
    testOscillators();
    testEnvelopes();
    testFilters();
    testFmAndAdditive();
    testLfos();
    testVoiceRenderer();
    testVibratoOnFmAndAdditive();
    testFrameCounts();

    std::cout << "dsp_tests: OK" << std::endl;
    return 0;
}
