// tunesmith-render: renders a built-in demo composition to a WAV file.
// The composition exercises wavetable, FM and additive voices, effect
// chains, LFO routing, submix buses with a sidechained pad and a
// spatial fly-by.

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include <juce_audio_formats/juce_audio_formats.h>
#include <juce_core/juce_core.h>

#include "tunesmith/Effects.h"
#include "tunesmith/Mixer.h"

namespace {

using tunesmith::Envelope;
using tunesmith::Event;
using tunesmith::FilterEnvelope;
using tunesmith::VoiceDescriptor;
using tunesmith::Waveform;

constexpr float kArpeggio[] = {220.0F, 261.63F, 329.63F, 392.0F, 440.0F, 392.0F, 329.63F, 261.63F};

VoiceDescriptor pluckVoice(const float frequency)
{
    VoiceDescriptor voice;
    voice.waveform = Waveform::kSawtooth;
    voice.frequency = frequency;
    voice.duration = 0.2F;
    voice.envelope = Envelope::pluck();
    voice.filter = tunesmith::Filter::lowPass(1200.0F, 0.4F);
    voice.filter_envelope = FilterEnvelope::pluck();
    voice.velocity = 0.7F;
    return voice;
}

std::optional<VoiceDescriptor> bellVoice(const float frequency)
{
    VoiceDescriptor voice;
    voice.frequency = frequency;
    voice.duration = 1.5F;
    voice.envelope = Envelope::piano();
    voice.fm = tunesmith::FmParams::bell();
    voice.velocity = 0.5F;
    if (!voice.effects.add(tunesmith::Delay{0.3F, 0.35F, 0.3F})) {
        return std::nullopt;
    }
    return voice;
}

std::optional<VoiceDescriptor> padVoice(const float frequency, const float duration)
{
    VoiceDescriptor voice;
    voice.frequency = frequency;
    voice.duration = duration;
    voice.envelope = Envelope::pad();
    voice.partials = {{1.0F, 1.0F, 0.0F}, {2.0F, 0.5F, 0.0F}, {3.0F, 0.25F, 0.0F}};
    voice.mod_routes.push_back(
        tunesmith::ModRoute{tunesmith::Lfo(Waveform::kSine, 0.25F, 1.0F), tunesmith::ModTarget::kPan, 0.6F});
    if (!voice.effects.add(tunesmith::Chorus{0.8F, 0.5F, 0.4F, 3})) {
        return std::nullopt;
    }
    voice.velocity = 0.35F;
    return voice;
}

// Plucks go to the "keys" bus; the "pad" bus ducks under them.
bool buildBuses(tunesmith::Mixer& mixer)
{
    tunesmith::Bus keys;
    keys.name = "keys";
    keys.volume = 0.9F;
    if (!mixer.setBus(keys)) {
        return false;
    }

    tunesmith::Bus pad;
    pad.name = "pad";
    pad.volume = 1.2F;
    if (!pad.effects.add(tunesmith::Compressor{0.2F, 4.0F, 0.005F, 0.15F, 1.0F, "keys"})) {
        return false;
    }
    return mixer.setBus(pad);
}

// Builds the demo into `mixer`, scaled to roughly `seconds`.
bool buildComposition(tunesmith::Mixer& mixer, const double seconds)
{
    if (!buildBuses(mixer)) {
        return false;
    }
    const int bars = std::max(1, static_cast<int>(seconds / 2.0));
    for (int bar = 0; bar < bars; ++bar) {
        const double barStart = bar * 2.0;
        for (int step = 0; step < 8; ++step) {
            Event note;
            note.start_time = barStart + step * 0.25;
            note.voice = pluckVoice(kArpeggio[step]);
            note.voice.pan = step % 2 == 0 ? -0.4F : 0.4F;
            note.bus = "keys";
            if (!mixer.addEvent(note)) {
                return false;
            }
        }
        const std::optional<VoiceDescriptor> padSound = padVoice(110.0F, 1.8F);
        if (!padSound) {
            return false;
        }
        Event pad;
        pad.start_time = barStart;
        pad.voice = *padSound;
        pad.bus = "pad";
        if (!mixer.addEvent(pad)) {
            return false;
        }
        if (bar % 2 == 1) {
            const std::optional<VoiceDescriptor> bellSound = bellVoice(880.0F);
            if (!bellSound) {
                return false;
            }
            Event bell;
            bell.start_time = barStart + 1.0;
            bell.voice = *bellSound;
            if (!mixer.addEvent(bell)) {
                return false;
            }
        }
    }

    Event flyBy;
    flyBy.start_time = 0.0;
    flyBy.voice.waveform = Waveform::kSquare;
    flyBy.voice.frequency = 330.0F;
    flyBy.voice.duration = static_cast<float>(bars * 2.0);
    flyBy.voice.envelope = Envelope::organ();
    flyBy.voice.velocity = 0.3F;
    const float speed = 40.0F / static_cast<float>(bars * 2.0);
    flyBy.spatial = tunesmith::SpatialSource{{-20.0F, 0.0F, 4.0F}, {speed, 0.0F, 0.0F}};
    return mixer.addEvent(flyBy);
}

bool writeWav(tunesmith::RenderStream& stream, const juce::File& file, const int sampleRate)
{
    file.deleteFile();
    auto output = std::make_unique<juce::FileOutputStream>(file);
    if (!output->openedOk()) {
        std::cerr << "[tunesmith-render] Cannot open " << file.getFullPathName() << std::endl;
        return false;
    }

    juce::WavAudioFormat format;
    std::unique_ptr<juce::AudioFormatWriter> writer(
        format.createWriterFor(output.get(), static_cast<double>(sampleRate), 2, 32, {}, 0));
    if (writer == nullptr) {
        std::cerr << "[tunesmith-render] Cannot create a WAV writer" << std::endl;
        return false;
    }
    output.release();  // owned by the writer from here on

    constexpr int kChunkFrames = 4096;
    std::vector<float> interleaved(kChunkFrames * 2);
    juce::AudioBuffer<float> planar(2, kChunkFrames);
    for (;;) {
        const int frames = stream.next(interleaved.data(), kChunkFrames);
        if (frames == 0) {
            break;
        }
        for (int i = 0; i < frames; ++i) {
            planar.setSample(0, i, interleaved[static_cast<std::size_t>(i) * 2]);
            planar.setSample(1, i, interleaved[static_cast<std::size_t>(i) * 2 + 1]);
        }
        if (!writer->writeFromAudioSampleBuffer(planar, 0, frames)) {
            std::cerr << "[tunesmith-render] Write failed" << std::endl;
            return false;
        }
    }
    return true;
}

}  // namespace

int main(int argc, char** argv)
{
    argparse::ArgumentParser program("tunesmith-render", "0.1.0");
    program.add_description("tunesmith-render: renders the demo composition to a WAV file.");
    program.add_argument("-o", "--output")
        .help("Output WAV path.")
        .default_value(std::string{"tunesmith-demo.wav"});
    program.add_argument("-r", "--sample-rate")
        .help("Output sample rate in Hz.")
        .scan<'i', int>()
        .default_value(44100);
    program.add_argument("-d", "--duration")
        .help("Approximate length of the composition in seconds.")
        .scan<'g', double>()
        .default_value(8.0);
    program.add_argument("-t", "--threads")
        .help("Worker threads for voice synthesis (0 = hardware threads - 1).")
        .scan<'i', int>()
        .default_value(0);
    program.add_argument("-b", "--block-size")
        .help("Mixer block size in frames.")
        .scan<'i', int>()
        .default_value(512);
    program.add_argument("--cache-mb")
        .help("Sample cache size limit in MiB.")
        .scan<'i', int>()
        .default_value(500);
    program.add_argument("--no-cache")
        .help("Render every voice without the sample cache.")
        .flag();
    program.add_argument("--stats")
        .help("Print cache statistics after rendering.")
        .flag();

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    const int sampleRate = program.get<int>("--sample-rate");
    const double seconds = program.get<double>("--duration");
    const int cacheMb = program.get<int>("--cache-mb");
    if (sampleRate <= 0 || !(seconds > 0.0) || cacheMb <= 0) {
        std::cerr << "[tunesmith-render] --sample-rate, --duration and --cache-mb must be positive"
                  << std::endl;
        return 1;
    }

    tunesmith::MixerConfig config;
    config.sample_rate = sampleRate;
    config.block_size = program.get<int>("--block-size");
    config.worker_threads = program.get<int>("--threads");
    config.cache_enabled = !program.get<bool>("--no-cache");
    config.cache_policy.max_size_bytes = static_cast<std::size_t>(cacheMb) * 1024 * 1024;

    tunesmith::Mixer mixer(config);
    tunesmith::EffectChain master;
    tunesmith::Error effectError{};
    if (!master.add(tunesmith::Reverb{0.6F, 0.4F, 0.2F}, &effectError) ||
        !master.add(tunesmith::Limiter{0.95F, 0.05F}, &effectError)) {
        std::cerr << "[tunesmith-render] Invalid master effect: "
                  << tunesmith::errorToString(effectError) << std::endl;
        return 1;
    }
    mixer.setMasterEffects(master);

    if (!buildComposition(mixer, seconds)) {
        std::cerr << "[tunesmith-render] Invalid demo event" << std::endl;
        return 1;
    }

    const juce::File file = juce::File::getCurrentWorkingDirectory().getChildFile(
        juce::String(program.get<std::string>("--output")));
    const std::unique_ptr<tunesmith::RenderStream> stream = mixer.stream();
    if (!writeWav(*stream, file, sampleRate)) {
        return 1;
    }
    if (const auto error = stream->error()) {
        std::cerr << "[tunesmith-render] Render stopped: " << tunesmith::errorToString(*error)
                  << std::endl;
        return 1;
    }

    std::cout << "Wrote " << stream->framesDelivered() << " frames ("
              << mixer.totalDuration() << "s) to " << file.getFullPathName() << std::endl;
    if (program.get<bool>("--stats")) {
        if (const auto stats = mixer.cacheStats()) {
            std::cout << "cache: hits=" << stats->hits << " misses=" << stats->misses
                      << " evictions=" << stats->evictions << " skipped=" << stats->skipped
                      << " entries=" << stats->entries << " bytes=" << stats->size_bytes
                      << " hit-rate=" << stats->hitRate() << std::endl;
        } else {
            std::cout << "cache: disabled" << std::endl;
        }
    }
    return 0;
}
