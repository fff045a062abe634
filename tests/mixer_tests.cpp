#undef NDEBUG
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <memory>
#include <vector>

#include "tunesmith/Effects.h"
#include "tunesmith/Mixer.h"
#include "tunesmith/VoiceRenderer.h"

// End-to-end rendering: scheduling, caching, spatial placement,
// streaming and cancellation.

using tunesmith::AttenuationModel;
using tunesmith::AutoPan;
using tunesmith::Bus;
using tunesmith::CacheStats;
using tunesmith::Compressor;
using tunesmith::EffectChain;
using tunesmith::Envelope;
using tunesmith::Error;
using tunesmith::Event;
using tunesmith::Lfo;
using tunesmith::Limiter;
using tunesmith::Mixer;
using tunesmith::MixerConfig;
using tunesmith::ModRoute;
using tunesmith::ModTarget;
using tunesmith::RenderResult;
using tunesmith::RenderStream;
using tunesmith::Reverb;
using tunesmith::SpatialParams;
using tunesmith::SpatialSource;
using tunesmith::VoiceDescriptor;
using tunesmith::VoiceRenderer;
using tunesmith::Waveform;

namespace {

constexpr int kRate = 44100;

bool near(const double a, const double b, const double tolerance)
{
    return std::abs(a - b) <= tolerance;
}

VoiceDescriptor sineVoice(const float frequency, const float duration,
                          const Envelope& envelope = Envelope{0.01F, 0.1F, 0.8F, 0.1F})
{
    VoiceDescriptor voice;
    voice.waveform = Waveform::kSine;
    voice.frequency = frequency;
    voice.duration = duration;
    voice.envelope = envelope;
    return voice;
}

Event eventAt(const double start, VoiceDescriptor voice)
{
    Event event;
    event.start_time = start;
    event.voice = std::move(voice);
    return event;
}

std::size_t frameAt(const double seconds)
{
    return static_cast<std::size_t>(std::llround(seconds * kRate));
}

double channelRms(const std::vector<float>& stereo, const int channel, const std::size_t from,
                  const std::size_t to)
{
    double sum = 0.0;
    for (std::size_t frame = from; frame < to; ++frame) {
        const double value = stereo[frame * 2 + static_cast<std::size_t>(channel)];
        sum += value * value;
    }
    return std::sqrt(sum / static_cast<double>(to - from));
}

float channelPeak(const std::vector<float>& stereo, const int channel, const std::size_t from,
                  const std::size_t to)
{
    float peak = 0.0F;
    for (std::size_t frame = from; frame < to; ++frame) {
        peak = std::max(peak, std::abs(stereo[frame * 2 + static_cast<std::size_t>(channel)]));
    }
    return peak;
}

int risingCrossings(const std::vector<float>& stereo, const std::size_t from, const std::size_t to)
{
    int count = 0;
    for (std::size_t frame = from + 1; frame < to; ++frame) {
        const float previous = stereo[(frame - 1) * 2] + stereo[(frame - 1) * 2 + 1];
        const float current = stereo[frame * 2] + stereo[frame * 2 + 1];
        if (previous < 0.0F && current >= 0.0F) {
            ++count;
        }
    }
    return count;
}

void fillComposition(Mixer& mixer)
{
    assert(mixer.addEvent(eventAt(0.0, sineVoice(440.0F, 0.5F))));
    assert(mixer.addEvent(eventAt(0.25, sineVoice(660.0F, 0.5F))));

    VoiceDescriptor pad = sineVoice(220.0F, 0.8F, Envelope::pad());
    pad.waveform = Waveform::kSawtooth;
    pad.mod_routes.push_back(ModRoute{Lfo(Waveform::kSine, 3.0F, 1.0F), ModTarget::kPan, 0.8F});
    assert(mixer.addEvent(eventAt(0.1, pad)));

    Event flyBy = eventAt(0.4, sineVoice(330.0F, 0.6F));
    flyBy.spatial = SpatialSource{{-5.0F, 0.0F, 2.0F}, {12.0F, 0.0F, 0.0F}};
    assert(mixer.addEvent(flyBy));

    // Too short to cache.
    assert(mixer.addEvent(eventAt(0.05, sineVoice(880.0F, 0.05F))));
}

void testSingleSineNote()
{
    Mixer mixer(kRate);
    assert(mixer.addEvent(eventAt(0.0, sineVoice(440.0F, 1.0F))));
    assert(near(mixer.totalDuration(), 1.1, 1e-6));

    const RenderResult result = mixer.render();
    assert(!result.error);
    assert(result.samples.size() == 97020);
    assert(near(result.rendered_seconds, 1.1, 1e-9));

    const double expected = 0.8 / std::sqrt(2.0);
    for (int channel = 0; channel < 2; ++channel) {
        const double level = channelRms(result.samples, channel, frameAt(0.02), frameAt(0.9));
        assert(std::abs(level - expected) < expected * 0.05);
    }
    for (const float sample : result.samples) {
        assert(std::isfinite(sample) && std::abs(sample) < 1.0F);
    }
}

void testCacheHit()
{
    Mixer mixer(kRate);
    const VoiceDescriptor voice = sineVoice(440.0F, 1.0F);
    assert(mixer.addEvent(eventAt(0.0, voice)));
    assert(mixer.addEvent(eventAt(2.0, voice)));
    const RenderResult first = mixer.render();
    assert(!first.error);

    mixer.clear();
    assert(mixer.eventCount() == 0);
    assert(mixer.cacheStats()->hits == 0 && mixer.cacheStats()->entries == 0);

    assert(mixer.addEvent(eventAt(0.0, voice)));
    assert(mixer.addEvent(eventAt(2.0, voice)));
    const RenderResult second = mixer.render();
    const CacheStats stats = *mixer.cacheStats();
    assert(stats.hits == 1);
    assert(stats.misses == 1);
    assert(stats.entries == 1);

    assert(second.samples == first.samples);
    const std::size_t length = frameAt(1.1);
    const std::size_t offset = frameAt(2.0) * 2;
    for (std::size_t i = 0; i < length * 2; ++i) {
        assert(second.samples[i] == second.samples[offset + i]);
    }
}

void testPitchShiftedReuse()
{
    Mixer mixer(kRate);
    const VoiceDescriptor low = sineVoice(440.0F, 0.5F, Envelope{});
    VoiceDescriptor high = low;
    high.frequency = 880.0F;
    assert(mixer.addEvent(eventAt(0.0, low)));
    assert(mixer.addEvent(eventAt(0.5, high)));

    const RenderResult result = mixer.render();
    assert(!result.error);
    assert(mixer.cacheStats()->entries == 1);
    assert(mixer.cacheStats()->misses == 1);

    // The 880 Hz note reads the 440 Hz render at twice the speed. Compare
    // once the first note's release has ended.
    const std::vector<float> reference = VoiceRenderer(kRate).render(low);
    const std::size_t start = frameAt(0.5);
    const std::size_t firstEnd = frameAt(0.7);
    for (std::size_t frame = 0; frame < start; ++frame) {
        // Skip the attack peak, which the soft clipper reshapes.
        if (std::abs(reference[frame]) < 0.85F) {
            assert(near(result.samples[frame * 2], reference[frame], 1e-5));
        }
    }
    for (std::size_t frame = firstEnd; frame < frameAt(1.2); ++frame) {
        const std::size_t read = (frame - start) * 2;
        const float expected = read < reference.size() ? reference[read] : 0.0F;
        assert(near(result.samples[frame * 2], expected, 1e-5));
        assert(near(result.samples[frame * 2 + 1], expected, 1e-5));
    }
}

void testSpatialFade()
{
    Mixer mixer(kRate);
    assert(mixer.setSpatialParams(
        *SpatialParams::create(AttenuationModel::kInverseSquare, 1.0F, 100.0F, 1.0F)));

    Event event = eventAt(0.0, sineVoice(440.0F, 3.0F, Envelope{0.001F, 0.001F, 1.0F, 0.1F}));
    event.spatial = SpatialSource{{0.0F, 0.0F, 1.0F}, {0.0F, 0.0F, 49.0F / 3.0F}};
    assert(mixer.addEvent(event));

    const RenderResult result = mixer.render();
    assert(!result.error);
    for (int channel = 0; channel < 2; ++channel) {
        const float loud = channelPeak(result.samples, channel, 0, 256);
        assert(loud > 0.8F && loud < 1.0F);
        const float faded = channelPeak(result.samples, channel, frameAt(2.95), frameAt(3.0));
        assert(faded > 3.5e-4F && faded < 4.5e-4F);
    }

    // Out of range sources are silent.
    Mixer far(kRate);
    Event distant = eventAt(0.0, sineVoice(440.0F, 0.5F));
    distant.spatial = SpatialSource{{0.0F, 0.0F, 150.0F}, {}};
    assert(far.addEvent(distant));
    const RenderResult silent = far.render();
    for (const float sample : silent.samples) {
        assert(sample == 0.0F);
    }
}

void testDopplerPitch()
{
    Mixer mixer(kRate);
    SpatialParams params;
    params.attenuation_model = AttenuationModel::kNone;
    assert(mixer.setSpatialParams(params));

    Event event = eventAt(0.0, sineVoice(440.0F, 3.3F, Envelope{0.001F, 0.001F, 1.0F, 0.05F}));
    event.spatial = SpatialSource{{-50.0F, 0.0F, 5.0F}, {30.0F, 0.0F, 0.0F}};
    assert(mixer.addEvent(event));
    const RenderResult result = mixer.render();
    assert(!result.error);

    // Approaching (x from -35 to -20) versus receding (x from 19 to 34).
    const int approaching = risingCrossings(result.samples, frameAt(0.5), frameAt(1.0));
    const int receding = risingCrossings(result.samples, frameAt(2.3), frameAt(2.8));
    assert(approaching > 229);
    assert(receding < 211);

    // The same source with doppler disabled keeps its pitch.
    Mixer flat(kRate);
    params.doppler_enabled = false;
    assert(flat.setSpatialParams(params));
    assert(flat.addEvent(event));
    const RenderResult steady = flat.render();
    const int unshifted = risingCrossings(steady.samples, frameAt(0.5), frameAt(1.0));
    assert(unshifted >= 219 && unshifted <= 221);
}

void testPanning()
{
    Mixer mixer(kRate);
    VoiceDescriptor left = sineVoice(440.0F, 0.5F);
    left.pan = -1.0F;
    assert(mixer.addEvent(eventAt(0.0, left)));
    const RenderResult result = mixer.render();
    const std::size_t frames = result.samples.size() / 2;
    assert(channelPeak(result.samples, 1, 0, frames) == 0.0F);
    // Hard left carries the full power of a centred pair.
    assert(channelPeak(result.samples, 0, 0, frames) > 0.9F);

    Mixer routed(kRate);
    VoiceDescriptor swirling = sineVoice(440.0F, 1.0F);
    swirling.mod_routes.push_back(ModRoute{Lfo(Waveform::kSine, 2.0F, 1.0F), ModTarget::kPan, 1.0F});
    assert(routed.addEvent(eventAt(0.0, swirling)));
    const RenderResult moving = routed.render();
    // Quarter of a 2 Hz cycle in: panned right. Three quarters: left.
    const double rightward = channelRms(moving.samples, 1, frameAt(0.1), frameAt(0.15)) /
                             channelRms(moving.samples, 0, frameAt(0.1), frameAt(0.15));
    const double leftward = channelRms(moving.samples, 1, frameAt(0.35), frameAt(0.4)) /
                            channelRms(moving.samples, 0, frameAt(0.35), frameAt(0.4));
    assert(rightward > 2.0);
    assert(leftward < 0.5);
}

void testStreamMatchesRender()
{
    MixerConfig config;
    config.sample_rate = kRate;
    config.worker_threads = 3;
    Mixer mixer(config);
    fillComposition(mixer);
    EffectChain master;
    assert(master.add(Reverb{0.4F, 0.5F, 0.25F}));
    mixer.setMasterEffects(master);

    const RenderResult rendered = mixer.render();
    assert(!rendered.error);

    const std::unique_ptr<RenderStream> stream = mixer.stream();
    assert(stream->totalFrames() * 2 == rendered.samples.size());
    std::vector<float> streamed;
    std::vector<float> chunk;
    const int sizes[] = {333, 1, 777, 512, 64, 2049};
    for (std::size_t call = 0; !stream->finished(); ++call) {
        const int frames = sizes[call % 6];
        chunk.assign(static_cast<std::size_t>(frames) * 2, 0.0F);
        const int written = stream->next(chunk.data(), frames);
        assert(written <= frames);
        streamed.insert(streamed.end(), chunk.begin(), chunk.begin() + written * 2);
    }
    assert(!stream->error());
    assert(stream->framesDelivered() == stream->totalFrames());
    assert(streamed == rendered.samples);
    float scratch[8] = {};
    assert(stream->next(scratch, 4) == 0);

    // Thread count, cache and sample order do not change the output.
    MixerConfig serial = config;
    serial.worker_threads = 1;
    serial.cache_enabled = false;
    Mixer single(serial);
    fillComposition(single);
    single.setMasterEffects(master);
    assert(!single.isCacheEnabled());
    assert(!single.cacheStats());
    assert(single.render().samples == rendered.samples);
}

void testStop()
{
    Mixer mixer(kRate);
    assert(mixer.addEvent(eventAt(0.0, sineVoice(440.0F, 1.0F))));

    mixer.stop();
    assert(mixer.stopRequested());
    const RenderResult aborted = mixer.render();
    assert(aborted.error == Error::kRenderAborted);
    assert(aborted.rendered_seconds == 0.0);
    assert(aborted.samples.size() == 97020);
    for (const float sample : aborted.samples) {
        assert(sample == 0.0F);
    }
    // The request is consumed by the render that honoured it.
    assert(!mixer.stopRequested());
    assert(!mixer.render().error);

    const std::unique_ptr<RenderStream> stream = mixer.stream();
    std::vector<float> buffer(2048 * 2);
    assert(stream->next(buffer.data(), 1000) == 1000);
    mixer.stop();
    // The block already rendered is still delivered.
    assert(stream->next(buffer.data(), 1000) == 24);
    assert(stream->next(buffer.data(), 1000) == 0);
    assert(stream->finished());
    assert(stream->error() == Error::kRenderAborted);
    assert(stream->framesDelivered() == 1024);
}

void testSchedulingAndCache()
{
    Mixer mixer(kRate);
    Error error = Error::kCacheFull;
    assert(!mixer.addEvent(eventAt(-1.0, sineVoice(440.0F, 1.0F)), &error));
    assert(error == Error::kInvalidParameter);
    assert(!mixer.addEvent(eventAt(std::nan(""), sineVoice(440.0F, 1.0F))));
    error = Error::kCacheFull;
    assert(!mixer.addEvent(eventAt(0.0, sineVoice(0.0F, 1.0F)), &error));
    assert(error == Error::kInvalidParameter);
    assert(mixer.eventCount() == 0);

    const RenderResult empty = mixer.render();
    assert(empty.samples.empty() && !empty.error && empty.rendered_seconds == 0.0);

    assert(mixer.addEvent(eventAt(2.0, sineVoice(330.0F, 0.5F, Envelope{0.01F, 0.1F, 0.7F, 0.1F}))));
    assert(mixer.addEvent(eventAt(0.0, sineVoice(440.0F, 1.0F, Envelope{0.01F, 0.1F, 0.7F, 0.2F}))));
    assert(mixer.addEvent(eventAt(1.5, sineVoice(550.0F, 0.05F))));
    assert(near(mixer.totalDuration(), 2.6, 1e-6));

    // Prerendering fills the cache so the render only hits.
    mixer.prerender();
    const CacheStats warmed = *mixer.cacheStats();
    assert(warmed.entries == 2);
    assert(warmed.misses == 2);
    const RenderResult result = mixer.render();
    assert(!result.error);
    assert(result.samples.size() == tunesmith::framesForDuration(2.6, kRate) * 2);
    const CacheStats after = *mixer.cacheStats();
    assert(after.misses == 2);
    assert(after.hits == warmed.hits + 2);
    assert(after.skipped == warmed.skipped + 1);
    // The uncached short note still sounds.
    assert(channelPeak(result.samples, 0, frameAt(1.5), frameAt(1.55)) > 0.1F);
    assert(channelPeak(result.samples, 0, frameAt(1.7), frameAt(2.0)) == 0.0F);

    // Rendering at another rate resizes the output.
    assert(mixer.render(22050).samples.size() == tunesmith::framesForDuration(2.6, 22050) * 2);

    mixer.clearCache();
    assert(mixer.cacheStats()->entries == 0);
    mixer.disableCache();
    mixer.prerender();
    assert(!mixer.render().error);
    mixer.enableCache();
    assert(mixer.isCacheEnabled() && mixer.cacheStats()->entries == 0);
}

void testMasterBus()
{
    Mixer loud(kRate);
    for (int i = 0; i < 5; ++i) {
        assert(loud.addEvent(eventAt(0.0, sineVoice(440.0F, 0.5F))));
    }
    const RenderResult clipped = loud.render();
    assert(channelPeak(clipped.samples, 0, 0, clipped.samples.size() / 2) <= 1.0F);
    assert(channelPeak(clipped.samples, 0, 0, clipped.samples.size() / 2) > 0.9F);

    MixerConfig config;
    config.sample_rate = kRate;
    Mixer full(config);
    assert(full.addEvent(eventAt(0.0, sineVoice(440.0F, 0.5F))));
    config.master_gain = 0.5F;
    Mixer half(config);
    assert(half.addEvent(eventAt(0.0, sineVoice(440.0F, 0.5F))));
    const RenderResult a = full.render();
    const RenderResult b = half.render();
    assert(a.samples.size() == b.samples.size());
    for (std::size_t i = 0; i < a.samples.size(); ++i) {
        if (std::abs(a.samples[i]) < 0.85F) {
            assert(near(b.samples[i], a.samples[i] * 0.5F, 1e-6));
        }
    }

    half.setMasterGain(-1.0F);
    assert(half.config().master_gain == 0.5F);
    half.setMasterGain(0.0F);
    for (const float sample : half.render().samples) {
        assert(sample == 0.0F);
    }
}

void testNoiseIgnoresPitch()
{
    MixerConfig config;
    config.sample_rate = kRate;
    config.worker_threads = 1;
    Mixer cached(config);
    config.cache_enabled = false;
    Mixer uncached(config);

    VoiceDescriptor hiss = sineVoice(440.0F, 0.5F);
    hiss.waveform = Waveform::kNoise;
    VoiceDescriptor higher = hiss;
    higher.frequency = 880.0F;
    for (Mixer* mixer : {&cached, &uncached}) {
        assert(mixer->addEvent(eventAt(0.0, hiss)));
        assert(mixer->addEvent(eventAt(1.0, higher)));
    }

    const RenderResult a = cached.render();
    const RenderResult b = uncached.render();
    assert(!a.error && !b.error);
    assert(a.samples == b.samples);
    const CacheStats stats = *cached.cacheStats();
    assert(stats.entries == 1);
    assert(stats.hits == 1);

    // The second note plays the shared buffer at its recorded speed.
    const std::size_t offset = frameAt(1.0) * 2;
    for (std::size_t i = 0; i < frameAt(0.6) * 2; ++i) {
        assert(a.samples[offset + i] == a.samples[i]);
    }
}

void testVoiceAutoPan()
{
    Mixer mixer(kRate);
    VoiceDescriptor swept = sineVoice(440.0F, 1.0F);
    assert(swept.effects.add(AutoPan{1.0F, 1.0F}));
    assert(mixer.addEvent(eventAt(0.0, swept)));
    const RenderResult result = mixer.render();
    assert(!result.error);

    // 1 Hz full-depth sweep: hard right a quarter second in, hard left
    // at three quarters.
    assert(channelRms(result.samples, 0, frameAt(0.24), frameAt(0.26)) < 0.01);
    assert(channelRms(result.samples, 1, frameAt(0.24), frameAt(0.26)) > 0.5);
    assert(channelRms(result.samples, 0, frameAt(0.74), frameAt(0.76)) > 0.5);
    assert(channelRms(result.samples, 1, frameAt(0.74), frameAt(0.76)) < 0.01);
}

Event onBus(const double start, VoiceDescriptor voice, const char* bus)
{
    Event event = eventAt(start, std::move(voice));
    event.bus = bus;
    return event;
}

Bus namedBus(const char* name, const float volume = 1.0F, const float pan = 0.0F)
{
    Bus bus;
    bus.name = name;
    bus.volume = volume;
    bus.pan = pan;
    return bus;
}

void testBuses()
{
    Mixer direct(kRate);
    assert(direct.addEvent(eventAt(0.0, sineVoice(440.0F, 0.5F))));
    const RenderResult reference = direct.render();

    Mixer mixer(kRate);
    Error error{};
    assert(!mixer.addEvent(onBus(0.0, sineVoice(440.0F, 0.5F), "drums"), &error));
    assert(error == Error::kInvalidParameter);
    assert(!mixer.setBus(namedBus("drums", 2.5F)));
    assert(!mixer.setBus(namedBus("drums", 1.0F, 1.5F)));
    assert(!mixer.setBus(namedBus("")));
    assert(mixer.busCount() == 0);

    assert(mixer.setBus(namedBus("drums", 0.5F)));
    assert(mixer.findBus("drums") != nullptr);
    assert(mixer.addEvent(onBus(0.0, sineVoice(440.0F, 0.5F), "drums")));
    const RenderResult half = mixer.render();
    assert(half.samples.size() == reference.samples.size());
    for (std::size_t i = 0; i < half.samples.size(); ++i) {
        if (std::abs(reference.samples[i]) < 0.85F) {
            assert(near(half.samples[i], reference.samples[i] * 0.5F, 1e-6));
        }
    }

    // Replacing the bus by name keeps its events routed to it.
    assert(mixer.setBus(namedBus("drums", 1.0F, 1.0F)));
    assert(mixer.busCount() == 1);
    const RenderResult right = mixer.render();
    const std::size_t frames = right.samples.size() / 2;
    assert(channelPeak(right.samples, 0, 0, frames) == 0.0F);
    assert(channelPeak(right.samples, 1, 0, frames) > 0.7F);

    assert(mixer.setBusMuted("drums", true));
    assert(!mixer.setBusMuted("strings", true));
    for (const float sample : mixer.render().samples) {
        assert(sample == 0.0F);
    }

    // Bus effects run on the bus sum.
    Bus limited = namedBus("limited");
    assert(limited.effects.add(Limiter{0.2F, 0.05F}));
    Mixer squashed(kRate);
    assert(squashed.setBus(limited));
    assert(squashed.addEvent(onBus(0.0, sineVoice(440.0F, 0.5F), "limited")));
    assert(squashed.addEvent(onBus(0.0, sineVoice(660.0F, 0.5F), "limited")));
    for (const float sample : squashed.render().samples) {
        assert(std::abs(sample) <= 0.2F + 1e-6F);
    }
}

void testSolo()
{
    Mixer alone(kRate);
    assert(alone.addEvent(eventAt(0.0, sineVoice(440.0F, 0.5F))));
    const RenderResult reference = alone.render();

    Mixer mixer(kRate);
    assert(mixer.setBus(namedBus("lead")));
    assert(mixer.setBus(namedBus("bass")));
    assert(mixer.addEvent(onBus(0.0, sineVoice(440.0F, 0.5F), "lead")));
    assert(mixer.addEvent(onBus(0.0, sineVoice(110.0F, 0.5F), "bass")));
    assert(mixer.addEvent(eventAt(0.0, sineVoice(880.0F, 0.5F))));
    assert(mixer.setBusSoloed("lead", true));

    // Only the soloed bus is heard; unrouted events drop out too.
    const RenderResult soloed = mixer.render();
    assert(soloed.samples.size() == reference.samples.size());
    for (std::size_t i = 0; i < soloed.samples.size(); ++i) {
        assert(near(soloed.samples[i], reference.samples[i], 1e-6));
    }
}

void testSidechainDucking()
{
    // A muted kick bus keys a compressor on the pad bus.
    const auto renderPad = [](const char* keySource) {
        Mixer mixer(kRate);
        Bus kick = namedBus("kick");
        kick.muted = true;
        assert(mixer.setBus(kick));

        Bus pad = namedBus("pad");
        assert(pad.effects.add(Compressor{0.1F, 10.0F, 0.001F, 0.1F, 1.0F, keySource}));
        assert(mixer.setBus(pad));

        VoiceDescriptor thump = sineVoice(100.0F, 0.5F, Envelope{0.001F, 0.01F, 1.0F, 0.01F});
        thump.waveform = Waveform::kSquare;
        assert(mixer.addEvent(onBus(0.0, thump, "kick")));
        assert(mixer.addEvent(onBus(0.0, sineVoice(440.0F, 1.0F), "pad")));
        const RenderResult result = mixer.render();
        assert(!result.error);
        return result;
    };

    const RenderResult keyed = renderPad("kick");
    const double during = channelRms(keyed.samples, 0, frameAt(0.2), frameAt(0.4));
    const double after = channelRms(keyed.samples, 0, frameAt(0.8), frameAt(0.9));
    assert(during > 0.0);
    assert(during < 0.4 * after);

    // A missing source leaves the compressor on its own level, which
    // does not change while the kick plays.
    const RenderResult unkeyed = renderPad("ghost");
    const double early = channelRms(unkeyed.samples, 0, frameAt(0.2), frameAt(0.4));
    const double late = channelRms(unkeyed.samples, 0, frameAt(0.7), frameAt(0.9));
    assert(near(early / late, 1.0, 0.1));

    Mixer mixer(kRate);
    Bus selfKeyed = namedBus("loop");
    assert(selfKeyed.effects.add(Compressor{0.1F, 10.0F, 0.001F, 0.1F, 1.0F, "loop"}));
    Error error{};
    assert(!mixer.setBus(selfKeyed, &error));
    assert(error == Error::kInvalidParameter);

    // Voice chains cannot carry a keyed compressor.
    VoiceDescriptor voice = sineVoice(440.0F, 0.5F);
    assert(voice.effects.add(Compressor{0.1F, 10.0F, 0.001F, 0.1F, 1.0F, "kick"}));
    assert(!voice.validate());
}

}  // namespace

int main()
{
    testSingleSineNote();
    testCacheHit();
    testPitchShiftedReuse();
    testSpatialFade();
    testDopplerPitch();
    testPanning();
    testStreamMatchesRender();
    testStop();
    testSchedulingAndCache();
    testMasterBus();
    testNoiseIgnoresPitch();
    testVoiceAutoPan();
    testBuses();
    testSolo();
    testSidechainDucking();

    std::cout << "mixer_tests: OK" << std::endl;
    return 0;
}
