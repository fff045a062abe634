#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tunesmith/EffectChain.h"
#include "tunesmith/SampleCache.h"
#include "tunesmith/Spatial.h"
#include "tunesmith/Types.h"
#include "tunesmith/Voice.h"

namespace juce {
class ThreadPool;
}  // namespace juce

namespace tunesmith {

struct MixerConfig {
    int sample_rate{kDefaultSampleRate};

    // Output is produced in blocks of this many frames. Spatial gains,
    // doppler and pan routes are evaluated at block boundaries and the
    // stop flag is polled once per block.
    int block_size{512};

    // 0 = hardware threads - 1 (at least 1). With 1 thread cache misses
    // are rendered on the calling thread.
    int worker_threads{0};

    bool cache_enabled{true};
    CachePolicy cache_policy{};

    float master_gain{1.0F};
    float soft_clip_knee{0.9F};
};

// A submix. Events routed to a bus are summed into its stereo buffer,
// which runs through `effects`, then `pan` and `volume`, before joining
// the master. Bus pan is a balance control: the far channel drops
// linearly to silence at full pan while the near one stays at unity.
//
// Muted buses, and unsoloed ones while any bus is soloed, are still
// mixed so that they can key a sidechain, but never reach the master.
// Soloing also silences events that have no bus.
struct Bus {
    std::string name;
    EffectChain effects;
    float volume{1.0F};     // [0, 2]
    float pan{0.0F};        // [-1, 1]
    bool muted{false};
    bool soloed{false};

    [[nodiscard]] bool isValid() const noexcept;
};

struct RenderResult {
    std::vector<float> samples;     // interleaved stereo
    std::optional<Error> error;     // kRenderAborted when cut short
    double rendered_seconds{0.0};   // length of the valid prefix
};

// Pull-based render: each next() call yields the following chunk of
// interleaved stereo frames. Output is identical to Mixer::render() for
// the same events and settings, whatever chunk sizes are requested.
// A stream must not outlive the Mixer that created it.
class RenderStream {
public:
    ~RenderStream();

    RenderStream(const RenderStream&) = delete;
    RenderStream& operator=(const RenderStream&) = delete;

    // Writes up to `frames` frames (2 * frames floats) to `dst` and
    // returns how many were written. Returns 0 once the composition has
    // ended or the render was stopped.
    int next(float* dst, int frames);

    [[nodiscard]] bool finished() const noexcept;
    [[nodiscard]] std::size_t totalFrames() const noexcept;
    [[nodiscard]] std::size_t framesDelivered() const noexcept;
    [[nodiscard]] std::optional<Error> error() const noexcept;

private:
    friend class Mixer;
    class Session;

    explicit RenderStream(std::unique_ptr<Session> session);

    std::unique_ptr<Session> session_;
};

// Schedules voice events and mixes them into an interleaved stereo
// buffer.
//
// Events are rendered in start-time order (ties keep insertion order).
// Each event's mono buffer comes from the sample cache when possible;
// misses are synthesised once per fingerprint, on a juce::ThreadPool
// when more than one worker is configured. The buffer is resampled to
// the event's pitch (and doppler), positioned by the spatializer or the
// event pan, summed, run through the master chain and soft-clipped.
//
// Pan gains follow the equal-power law scaled by sqrt(2), so a centred
// voice reaches both channels at unity. Events naming a bus are summed
// through it first (see Bus).
class Mixer {
public:
    explicit Mixer(int sampleRate = kDefaultSampleRate);
    explicit Mixer(const MixerConfig& config);
    ~Mixer();

    Mixer(const Mixer&) = delete;
    Mixer& operator=(const Mixer&) = delete;

    // Adds an event. Returns false and reports the error when the start
    // time is negative or not finite, the voice does not validate, or
    // the event names a bus that has not been set.
    bool addEvent(Event event, Error* outError = nullptr);

    // Adds a bus, or replaces the one with the same name. Returns false
    // and reports kInvalidParameter when the bus does not validate or
    // one of its compressors is keyed from the bus itself. A sidechain
    // naming a bus that is missing at render time detects its own input.
    bool setBus(Bus bus, Error* outError = nullptr);
    [[nodiscard]] const Bus* findBus(const std::string& name) const noexcept;
    [[nodiscard]] std::size_t busCount() const noexcept { return buses_.size(); }
    bool setBusMuted(const std::string& name, bool muted);
    bool setBusSoloed(const std::string& name, bool soloed);

    // Drops every event and clears the cache together with its stats.
    void clear();
    void clearCache();

    [[nodiscard]] std::size_t eventCount() const noexcept { return events_.size(); }
    [[nodiscard]] int sampleRate() const noexcept { return config_.sample_rate; }
    [[nodiscard]] const MixerConfig& config() const noexcept { return config_; }

    void enableCache();
    void enableCache(const CachePolicy& policy);
    void disableCache();
    [[nodiscard]] bool isCacheEnabled() const noexcept { return cache_ != nullptr; }
    [[nodiscard]] std::optional<CacheStats> cacheStats() const;
    [[nodiscard]] std::shared_ptr<SampleCache> cache() const noexcept { return cache_; }

    void setListener(const ListenerConfig& listener);
    [[nodiscard]] const ListenerConfig& listener() const noexcept { return listener_; }

    bool setSpatialParams(const SpatialParams& params, Error* outError = nullptr);
    [[nodiscard]] const SpatialParams& spatialParams() const noexcept { return spatialParams_; }

    void setMasterEffects(EffectChain chain);
    void setMasterGain(float gain);

    // Latest end time (start + duration + release) over all events.
    [[nodiscard]] double totalDuration() const noexcept;

    // Blocking render at the configured (or given) sample rate.
    [[nodiscard]] RenderResult render();
    [[nodiscard]] RenderResult render(int sampleRate);

    // Renders every cacheable voice into the cache without mixing.
    void prerender();

    [[nodiscard]] std::unique_ptr<RenderStream> stream();
    [[nodiscard]] std::unique_ptr<RenderStream> stream(int sampleRate);

    // Asks the current (or next) render to stop at the next block
    // boundary. The request is consumed by the render that honours it.
    void stop() noexcept;
    [[nodiscard]] bool stopRequested() const noexcept;

private:
    [[nodiscard]] std::unique_ptr<RenderStream::Session> makeSession(int sampleRate);
    [[nodiscard]] juce::ThreadPool* workerPool();

    MixerConfig config_;
    std::vector<Event> events_;
    std::vector<Bus> buses_;
    std::shared_ptr<SampleCache> cache_;
    ListenerConfig listener_{};
    SpatialParams spatialParams_{};
    EffectChain masterEffects_;
    std::shared_ptr<std::atomic<bool>> stopFlag_;

    std::mutex poolMutex_;
    std::unique_ptr<juce::ThreadPool> pool_;
};

}  // namespace tunesmith
