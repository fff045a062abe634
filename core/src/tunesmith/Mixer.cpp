#include "tunesmith/Mixer.h"

#include <algorithm>
#include <cmath>
#include <functional>
#include <future>
#include <string>
#include <utility>
#include <variant>

#include <juce_audio_basics/juce_audio_basics.h>
#include <juce_core/juce_core.h>

#include "tunesmith/CacheKey.h"
#include "tunesmith/Resampler.h"
#include "tunesmith/SimdDispatch.h"
#include "tunesmith/VoiceRenderer.h"

namespace tunesmith {

namespace {

// Equal-power gains are cos/sin of (pan + 1) * pi / 4, which leaves a
// centred voice at 1/sqrt(2) per channel. The mixer scales them back up
// so a centred voice plays at unity on both channels.
constexpr float kCentreCompensation = juce::MathConstants<float>::sqrt2;

void logLine(const juce::String& message)
{
    juce::Logger::writeToLog(juce::String("[tunesmith] ") + message);
}

int resolveWorkerThreads(const int requested)
{
    if (requested > 0) {
        return requested;
    }
    return std::max(1, juce::SystemStats::getNumCpus() - 1);
}

// Per-render log state. Shared with worker jobs, which may outlive the
// session that created them.
struct RenderLog {
    std::atomic<bool> cacheFullLogged{false};
    std::atomic<bool> ratioClampLogged{false};

    void cacheFull(const double noteSeconds)
    {
        if (!cacheFullLogged.exchange(true)) {
            logLine("cache full, voice of " + juce::String(noteSeconds, 3) +
                    "s rendered without caching");
        }
    }

    void ratioClamped(const double requested, const double applied)
    {
        if (!ratioClampLogged.exchange(true)) {
            logLine("playback ratio " + juce::String(requested, 4) + " clamped to " +
                    juce::String(applied, 4));
        }
    }
};

// How the samples for one event will arrive: a future that is ready
// immediately (cache hit), filled by another render or a worker job, or
// filled by `deferred` on the mixing thread.
struct SampleRequest {
    SampleCache::SampleFuture future;
    std::function<void()> deferred;
};

SampleCache::SampleFuture readyFuture(const CachedSample& sample)
{
    std::promise<CachedSample> promise;
    promise.set_value(sample);
    return promise.get_future().share();
}

SampleRequest requestSample(const VoiceDescriptor& voice, const int sampleRate,
                            const std::shared_ptr<SampleCache>& cache, juce::ThreadPool* pool,
                            const std::shared_ptr<RenderLog>& log)
{
    SampleRequest request;

    if (cache != nullptr && cache->isCacheable(static_cast<double>(voice.duration))) {
        const CacheKey key = CacheKey::forVoice(voice, sampleRate);
        SampleCache::Lookup lookup = cache->acquire(key);
        if (lookup.kind == SampleCache::Lookup::Kind::kHit) {
            request.future = readyFuture(lookup.sample);
            return request;
        }
        request.future = lookup.future;
        if (lookup.kind == SampleCache::Lookup::Kind::kPending) {
            return request;
        }

        auto job = [cache, key, voice, sampleRate, log]() {
            try {
                const CachedSample sample = VoiceRenderer(sampleRate).renderCached(voice);
                Error error{};
                if (!cache->complete(key, sample, &error) && error == Error::kCacheFull) {
                    log->cacheFull(static_cast<double>(voice.duration));
                }
            } catch (...) {
                cache->abandon(key, std::current_exception());
            }
        };
        // Reserved keys are always rendered before planning returns or on
        // the pool, never lazily: another render may be waiting on them.
        if (pool != nullptr) {
            pool->addJob(std::move(job));
        } else {
            job();
        }
        return request;
    }

    if (cache != nullptr) {
        cache->noteSkipped();
    }

    auto promise = std::make_shared<std::promise<CachedSample>>();
    request.future = promise->get_future().share();
    auto job = [promise, voice, sampleRate]() {
        try {
            promise->set_value(VoiceRenderer(sampleRate).renderCached(voice));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };
    if (pool != nullptr) {
        pool->addJob(std::move(job));
    } else {
        request.deferred = std::move(job);
    }
    return request;
}

struct SoftClip {
    float knee;

    float operator()(const float x) const noexcept
    {
        const float magnitude = std::abs(x);
        if (magnitude <= knee) {
            return x;
        }
        const float span = 1.0F - knee;
        const float shaped = knee + span * std::tanh((magnitude - knee) / span);
        return x < 0.0F ? -shaped : shaped;
    }
};

struct StereoGains {
    float left{0.0F};
    float right{0.0F};
};

StereoGains panGains(const float pan)
{
    StereoGains gains;
    spatial::equalPowerGains(pan, 1.0F, gains.left, gains.right);
    gains.left *= kCentreCompensation;
    gains.right *= kCentreCompensation;
    return gains;
}

// Balance law for bus pan: the far channel fades out, the near one
// stays at unity.
StereoGains balanceGains(const float pan)
{
    return {pan <= 0.0F ? 1.0F : 1.0F - pan, pan >= 0.0F ? 1.0F : 1.0F + pan};
}

std::vector<Event> sortedByStart(const std::vector<Event>& events)
{
    std::vector<Event> sorted = events;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Event& a, const Event& b) {
        return a.start_time < b.start_time;
    });
    return sorted;
}

}  // namespace

// --- Render session ---------------------------------------------------

class RenderStream::Session {
public:
    struct Settings {
        int sample_rate{kDefaultSampleRate};
        int block_size{512};
        float master_gain{1.0F};
        float soft_clip_knee{0.9F};
        ListenerConfig listener{};
        SpatialParams spatial{};
        EffectChain master_effects;
        std::vector<Bus> buses;
    };

    struct Plan {
        Event event;
        std::size_t start_frame{0};
        std::size_t length_frames{0};
        SampleRequest request;

        CachedSample sample{};
        double base_ratio{1.0};
        double constant_ratio{1.0};
        double read_position{0.0};
        bool variable_ratio{false};
        bool moving_pan{false};     // pan routes or AutoPan in the voice chain
        StereoGains fixed_gains{};
        int bus{-1};                // index into the session buses, -1 = master
    };

    Session(Settings settings, std::vector<Plan> plans, std::size_t totalFrames,
            std::shared_ptr<std::atomic<bool>> stopFlag, std::shared_ptr<SampleCache> cache,
            std::shared_ptr<RenderLog> log)
        : settings_(std::move(settings)),
          plans_(std::move(plans)),
          totalFrames_(totalFrames),
          stopFlag_(std::move(stopFlag)),
          cache_(std::move(cache)),
          log_(std::move(log))
    {
        masterActive_ = !settings_.master_effects.empty();
        if (masterActive_) {
            settings_.master_effects.prepareStereo(static_cast<double>(settings_.sample_rate));
        }
        left_.assign(static_cast<std::size_t>(settings_.block_size), 0.0F);
        right_.assign(static_cast<std::size_t>(settings_.block_size), 0.0F);
        prepareBuses();
        finished_ = totalFrames_ == 0;
    }

    int next(float* dst, const int frames)
    {
        if (dst == nullptr || frames <= 0) {
            return 0;
        }
        int written = 0;
        while (written < frames) {
            if (blockRead_ == blockFrames_) {
                if (!renderBlock()) {
                    break;
                }
            }
            const std::size_t available = blockFrames_ - blockRead_;
            const std::size_t wanted = static_cast<std::size_t>(frames - written);
            const std::size_t count = std::min(available, wanted);
            float* out = dst + static_cast<std::size_t>(written) * 2;
            for (std::size_t i = 0; i < count; ++i) {
                out[i * 2] = left_[blockRead_ + i];
                out[i * 2 + 1] = right_[blockRead_ + i];
            }
            blockRead_ += count;
            delivered_ += count;
            written += static_cast<int>(count);
        }
        return written;
    }

    [[nodiscard]] bool finished() const noexcept
    {
        return finished_ && blockRead_ == blockFrames_;
    }
    [[nodiscard]] std::size_t totalFrames() const noexcept { return totalFrames_; }
    [[nodiscard]] std::size_t framesDelivered() const noexcept { return delivered_; }
    [[nodiscard]] std::optional<Error> error() const noexcept { return error_; }
    [[nodiscard]] int sampleRate() const noexcept { return settings_.sample_rate; }

private:
    struct BusState {
        Bus bus;
        std::vector<float> left;
        std::vector<float> right;
        std::vector<float> key;         // sqrt((l^2 + r^2) / 2) before effects
        std::vector<int> keySources;    // per effect: source bus index, -1 = none
        std::vector<float> keyScratch;
        bool keyed{false};
        bool audible{true};
        StereoGains gains{};
    };

    void prepareBuses()
    {
        const auto rate = static_cast<double>(settings_.sample_rate);
        const auto size = static_cast<std::size_t>(settings_.block_size);
        soloActive_ = std::any_of(settings_.buses.begin(), settings_.buses.end(),
                                  [](const Bus& bus) { return bus.soloed; });

        buses_.resize(settings_.buses.size());
        for (std::size_t b = 0; b < buses_.size(); ++b) {
            buses_[b].bus = std::move(settings_.buses[b]);
        }
        settings_.buses.clear();

        for (BusState& state : buses_) {
            state.bus.effects.prepareStereo(rate);
            state.left.assign(size, 0.0F);
            state.right.assign(size, 0.0F);
            state.key.assign(size, 0.0F);
            state.audible = !state.bus.muted && (!soloActive_ || state.bus.soloed);
            const StereoGains balance = balanceGains(state.bus.pan);
            state.gains = {balance.left * state.bus.volume, balance.right * state.bus.volume};

            const std::vector<Effect>& effects = state.bus.effects.effects();
            state.keySources.assign(effects.size(), -1);
            state.keyScratch.assign(effects.size(), -1.0F);
            for (std::size_t i = 0; i < effects.size(); ++i) {
                if (!isSidechained(effects[i])) {
                    continue;
                }
                const std::string& source = std::get<Compressor>(effects[i]).sidechain_bus;
                state.keySources[i] = busIndex(source);
                state.keyed = true;
                if (state.keySources[i] < 0) {
                    logLine("sidechain source '" + juce::String(source) + "' of bus '" +
                            juce::String(state.bus.name) + "' not found, compressor keys itself");
                }
            }
        }
    }

    [[nodiscard]] int busIndex(const std::string& name) const noexcept
    {
        for (std::size_t b = 0; b < buses_.size(); ++b) {
            if (buses_[b].bus.name == name) {
                return static_cast<int>(b);
            }
        }
        return -1;
    }

    // Runs every bus over the block and sums the audible ones into
    // left_/right_. Keys are measured on all buses before any effect
    // runs, so the order of buses does not matter.
    void mixBuses(const std::size_t frames)
    {
        for (BusState& state : buses_) {
            for (std::size_t i = 0; i < frames; ++i) {
                const float l = state.left[i];
                const float r = state.right[i];
                state.key[i] = std::sqrt(0.5F * (l * l + r * r));
            }
        }
        for (BusState& state : buses_) {
            if (!state.bus.effects.empty()) {
                for (std::size_t i = 0; i < frames; ++i) {
                    if (state.keyed) {
                        for (std::size_t e = 0; e < state.keySources.size(); ++e) {
                            const int source = state.keySources[e];
                            state.keyScratch[e] =
                                source >= 0 ? buses_[static_cast<std::size_t>(source)].key[i]
                                            : -1.0F;
                        }
                    }
                    state.bus.effects.processStereo(
                        state.left[i], state.right[i],
                        state.keyed ? state.keyScratch.data() : nullptr);
                }
            }
            if (!state.audible) {
                continue;
            }
            juce::FloatVectorOperations::addWithMultiply(left_.data(), state.left.data(),
                                                         state.gains.left, static_cast<int>(frames));
            juce::FloatVectorOperations::addWithMultiply(right_.data(), state.right.data(),
                                                         state.gains.right, static_cast<int>(frames));
        }
    }

    // Renders the next block into left_/right_. Returns false when there
    // is nothing left to deliver.
    bool renderBlock()
    {
        blockStart_ += blockFrames_;
        blockFrames_ = 0;
        blockRead_ = 0;
        if (finished_) {
            return false;
        }
        if (blockStart_ >= totalFrames_) {
            finish();
            return false;
        }

        if (stopFlag_->exchange(false)) {
            error_ = Error::kRenderAborted;
            logLine("render aborted by stop request at " +
                    juce::String(seconds(blockStart_), 3) + "s");
            finish();
            return false;
        }

        const std::size_t frames =
            std::min(static_cast<std::size_t>(settings_.block_size), totalFrames_ - blockStart_);
        std::fill(left_.begin(), left_.end(), 0.0F);
        std::fill(right_.begin(), right_.end(), 0.0F);
        for (BusState& state : buses_) {
            std::fill(state.left.begin(), state.left.end(), 0.0F);
            std::fill(state.right.begin(), state.right.end(), 0.0F);
        }

        activatePlans(blockStart_ + frames);
        for (const std::size_t index : active_) {
            mixPlan(plans_[index], frames);
        }
        retirePlans(blockStart_ + frames);
        mixBuses(frames);

        if (masterActive_) {
            for (std::size_t i = 0; i < frames; ++i) {
                settings_.master_effects.processStereo(left_[i], right_[i]);
            }
        }
        if (settings_.master_gain != 1.0F) {
            juce::FloatVectorOperations::multiply(left_.data(), settings_.master_gain,
                                                  static_cast<int>(frames));
            juce::FloatVectorOperations::multiply(right_.data(), settings_.master_gain,
                                                  static_cast<int>(frames));
        }

        std::size_t valid = frames;
        for (std::size_t i = 0; i < frames; ++i) {
            if (!std::isfinite(left_[i]) || !std::isfinite(right_[i])) {
                valid = i;
                break;
            }
        }

        const SoftClip clip{settings_.soft_clip_knee};
        simd::process(left_.data(), valid, clip);
        simd::process(right_.data(), valid, clip);

        blockFrames_ = valid;
        if (valid < frames) {
            error_ = Error::kRenderAborted;
            logLine("non-finite sample in the mix at " +
                    juce::String(seconds(blockStart_ + valid), 3) + "s, render aborted");
            finish();
        }
        return valid > 0;
    }

    void activatePlans(const std::size_t blockEnd)
    {
        while (nextPlan_ < plans_.size() && plans_[nextPlan_].start_frame < blockEnd) {
            Plan& plan = plans_[nextPlan_];
            if (plan.request.deferred) {
                auto work = std::move(plan.request.deferred);
                plan.request.deferred = nullptr;
                work();
            }
            plan.sample = plan.request.future.get();
            plan.request.future = {};

            const double reference = plan.sample.reference_frequency;
            plan.base_ratio = reference > 0.0 ? plan.event.voice.effectiveFrequency() / reference : 1.0;
            plan.constant_ratio = clampRatio(plan.base_ratio);
            plan.variable_ratio = plan.event.spatial.has_value() && settings_.spatial.doppler_enabled;
            plan.moving_pan =
                plan.event.voice.effects.hasAutoPan() ||
                std::any_of(plan.event.voice.mod_routes.begin(), plan.event.voice.mod_routes.end(),
                            [](const ModRoute& route) { return route.target == ModTarget::kPan; });
            plan.fixed_gains = panGains(plan.event.voice.pan);
            plan.bus = plan.event.bus.empty() ? -1 : busIndex(plan.event.bus);

            active_.push_back(nextPlan_);
            ++nextPlan_;
        }
    }

    void retirePlans(const std::size_t blockEnd)
    {
        active_.erase(std::remove_if(active_.begin(), active_.end(),
                                     [this, blockEnd](const std::size_t index) {
                                         Plan& plan = plans_[index];
                                         if (plan.start_frame + plan.length_frames > blockEnd) {
                                             return false;
                                         }
                                         plan.sample = {};
                                         return true;
                                     }),
                      active_.end());
    }

    [[nodiscard]] StereoGains gainsAt(const Plan& plan, const double localSeconds,
                                      float* pitchShift) const
    {
        if (plan.event.spatial) {
            const SpatialSource& source = *plan.event.spatial;
            const SpatialResult result =
                spatial::compute(source.positionAt(localSeconds), source.velocity,
                                 settings_.listener, settings_.spatial);
            if (pitchShift != nullptr) {
                *pitchShift = result.pitch_shift;
            }
            return {result.gain_left * kCentreCompensation,
                    result.gain_right * kCentreCompensation};
        }
        if (!plan.moving_pan) {
            return plan.fixed_gains;
        }
        float pan = plan.event.voice.pan;
        for (const ModRoute& route : plan.event.voice.mod_routes) {
            if (route.target == ModTarget::kPan) {
                pan = route.apply(pan, localSeconds);
            }
        }
        pan += plan.event.voice.effects.panOffsetAt(localSeconds);
        return panGains(juce::jlimit(-1.0F, 1.0F, pan));
    }

    void mixPlan(Plan& plan, const std::size_t frames)
    {
        const std::size_t blockEnd = blockStart_ + frames;
        const std::size_t from = std::max(blockStart_, plan.start_frame);
        const std::size_t to = std::min(blockEnd, plan.start_frame + plan.length_frames);
        if (from >= to || plan.sample.length() == 0) {
            return;
        }
        if (plan.bus < 0 && soloActive_) {
            return;
        }
        std::vector<float>& targetLeft =
            plan.bus < 0 ? left_ : buses_[static_cast<std::size_t>(plan.bus)].left;
        std::vector<float>& targetRight =
            plan.bus < 0 ? right_ : buses_[static_cast<std::size_t>(plan.bus)].right;

        const auto rate = static_cast<double>(settings_.sample_rate);
        const double localStart =
            (static_cast<double>(blockStart_) - static_cast<double>(plan.start_frame)) / rate;
        const double localEnd =
            (static_cast<double>(blockEnd) - static_cast<double>(plan.start_frame)) / rate;

        float pitchShift = 1.0F;
        const StereoGains startGains = gainsAt(plan, localStart, &pitchShift);
        const StereoGains endGains = gainsAt(plan, localEnd, nullptr);

        double ratio = plan.constant_ratio;
        if (plan.variable_ratio) {
            ratio = clampRatio(plan.base_ratio * static_cast<double>(pitchShift));
        }

        const float* source = plan.sample.data();
        const std::size_t sourceLength = plan.sample.length();
        const std::size_t firstLocal = from - plan.start_frame;
        const std::size_t offset = from - blockStart_;
        const std::size_t count = to - from;

        const bool steadyGains =
            startGains.left == endGains.left && startGains.right == endGains.right;
        if (steadyGains && !plan.variable_ratio && resampler::isUnity(ratio)) {
            if (firstLocal >= sourceLength) {
                return;
            }
            const auto copy = static_cast<int>(std::min(count, sourceLength - firstLocal));
            juce::FloatVectorOperations::addWithMultiply(targetLeft.data() + offset,
                                                         source + firstLocal, startGains.left, copy);
            juce::FloatVectorOperations::addWithMultiply(targetRight.data() + offset,
                                                         source + firstLocal, startGains.right, copy);
            return;
        }

        const bool unity = resampler::isUnity(ratio);
        const auto span = static_cast<float>(frames);
        for (std::size_t i = 0; i < count; ++i) {
            const std::size_t local = firstLocal + i;
            float value = 0.0F;
            if (plan.variable_ratio) {
                value = resampler::sampleAt(source, sourceLength, plan.read_position);
                plan.read_position += ratio;
            } else if (unity) {
                value = local < sourceLength ? source[local] : 0.0F;
            } else {
                value = resampler::sampleAt(source, sourceLength,
                                            static_cast<double>(local) * ratio);
            }
            const float w = static_cast<float>(offset + i) / span;
            const float gainLeft = startGains.left + (endGains.left - startGains.left) * w;
            const float gainRight = startGains.right + (endGains.right - startGains.right) * w;
            targetLeft[offset + i] += value * gainLeft;
            targetRight[offset + i] += value * gainRight;
        }
    }

    double clampRatio(const double requested)
    {
        Error error{};
        const double applied = resampler::clampRatio(requested, &error);
        if (applied != requested) {
            log_->ratioClamped(requested, applied);
        }
        return applied;
    }

    void finish()
    {
        if (finished_) {
            return;
        }
        finished_ = true;
        active_.clear();
        juce::String summary = "render finished: " + juce::String(static_cast<juce::int64>(
                                                         std::min(blockStart_ + blockFrames_, totalFrames_))) +
                               " of " + juce::String(static_cast<juce::int64>(totalFrames_)) +
                               " frames";
        if (cache_ != nullptr) {
            const CacheStats stats = cache_->stats();
            summary += ", cache hits=" + juce::String(static_cast<juce::int64>(stats.hits)) +
                       " misses=" + juce::String(static_cast<juce::int64>(stats.misses)) +
                       " entries=" + juce::String(static_cast<juce::int64>(stats.entries));
        }
        logLine(summary);
    }

    [[nodiscard]] double seconds(const std::size_t frame) const noexcept
    {
        return static_cast<double>(frame) / static_cast<double>(settings_.sample_rate);
    }

    Settings settings_;
    std::vector<Plan> plans_;
    std::size_t totalFrames_;
    std::shared_ptr<std::atomic<bool>> stopFlag_;
    std::shared_ptr<SampleCache> cache_;
    std::shared_ptr<RenderLog> log_;

    bool masterActive_{false};
    bool soloActive_{false};
    std::vector<float> left_;
    std::vector<float> right_;
    std::vector<BusState> buses_;
    std::vector<std::size_t> active_;
    std::size_t nextPlan_{0};

    std::size_t blockStart_{0};   // first frame of the current block
    std::size_t blockFrames_{0};  // valid frames in the current block
    std::size_t blockRead_{0};    // frames of the current block already delivered
    std::size_t delivered_{0};
    std::optional<Error> error_;
    bool finished_{false};
};

// --- RenderStream -------------------------------------------------------

RenderStream::RenderStream(std::unique_ptr<Session> session) : session_(std::move(session)) {}

RenderStream::~RenderStream() = default;

int RenderStream::next(float* dst, const int frames)
{
    return session_->next(dst, frames);
}

bool RenderStream::finished() const noexcept
{
    return session_->finished();
}

std::size_t RenderStream::totalFrames() const noexcept
{
    return session_->totalFrames();
}

std::size_t RenderStream::framesDelivered() const noexcept
{
    return session_->framesDelivered();
}

std::optional<Error> RenderStream::error() const noexcept
{
    return session_->error();
}

// --- Bus ------------------------------------------------------------------

bool Bus::isValid() const noexcept
{
    const std::vector<Effect>& chain = effects.effects();
    return !name.empty() && std::isfinite(volume) && volume >= 0.0F && volume <= 2.0F &&
           std::isfinite(pan) && pan >= -1.0F && pan <= 1.0F &&
           std::all_of(chain.begin(), chain.end(),
                       [](const Effect& effect) { return isEffectValid(effect); });
}

// --- Mixer ----------------------------------------------------------------

Mixer::Mixer(const int sampleRate) : Mixer(MixerConfig{sampleRate}) {}

Mixer::Mixer(const MixerConfig& config)
    : config_(config), stopFlag_(std::make_shared<std::atomic<bool>>(false))
{
    if (config_.sample_rate <= 0) {
        config_.sample_rate = kDefaultSampleRate;
    }
    if (config_.block_size <= 0) {
        config_.block_size = 512;
    }
    if (!std::isfinite(config_.master_gain) || config_.master_gain < 0.0F) {
        config_.master_gain = 1.0F;
    }
    config_.soft_clip_knee = std::isfinite(config_.soft_clip_knee)
                                 ? juce::jlimit(0.0F, 0.99F, config_.soft_clip_knee)
                                 : 0.9F;
    if (config_.cache_enabled) {
        cache_ = std::make_shared<SampleCache>(config_.cache_policy);
    }
}

Mixer::~Mixer()
{
    if (pool_ != nullptr) {
        // Queued renders must complete: the cache may outlive the mixer
        // and would otherwise keep their keys reserved.
        while (pool_->getNumJobs() > 0) {
            juce::Thread::sleep(1);
        }
    }
}

bool Mixer::addEvent(Event event, Error* outError)
{
    if (!std::isfinite(event.start_time) || event.start_time < 0.0) {
        reportError(outError, Error::kInvalidParameter);
        return false;
    }
    if (!event.voice.validate(outError)) {
        return false;
    }
    if (!event.bus.empty() && findBus(event.bus) == nullptr) {
        reportError(outError, Error::kInvalidParameter);
        return false;
    }
    events_.push_back(std::move(event));
    return true;
}

bool Mixer::setBus(Bus bus, Error* outError)
{
    const std::vector<Effect>& effects = bus.effects.effects();
    const bool keysItself = std::any_of(effects.begin(), effects.end(), [&bus](const Effect& e) {
        return isSidechained(e) && std::get<Compressor>(e).sidechain_bus == bus.name;
    });
    if (!bus.isValid() || keysItself) {
        reportError(outError, Error::kInvalidParameter);
        return false;
    }
    for (Bus& existing : buses_) {
        if (existing.name == bus.name) {
            existing = std::move(bus);
            return true;
        }
    }
    buses_.push_back(std::move(bus));
    return true;
}

const Bus* Mixer::findBus(const std::string& name) const noexcept
{
    for (const Bus& bus : buses_) {
        if (bus.name == name) {
            return &bus;
        }
    }
    return nullptr;
}

bool Mixer::setBusMuted(const std::string& name, const bool muted)
{
    for (Bus& bus : buses_) {
        if (bus.name == name) {
            bus.muted = muted;
            return true;
        }
    }
    return false;
}

bool Mixer::setBusSoloed(const std::string& name, const bool soloed)
{
    for (Bus& bus : buses_) {
        if (bus.name == name) {
            bus.soloed = soloed;
            return true;
        }
    }
    return false;
}

void Mixer::clear()
{
    events_.clear();
    if (cache_ != nullptr) {
        cache_->clear();
        cache_->resetStats();
    }
}

void Mixer::clearCache()
{
    if (cache_ != nullptr) {
        cache_->clear();
    }
}

void Mixer::enableCache()
{
    enableCache(config_.cache_policy);
}

void Mixer::enableCache(const CachePolicy& policy)
{
    config_.cache_enabled = true;
    config_.cache_policy = policy;
    cache_ = std::make_shared<SampleCache>(policy);
}

void Mixer::disableCache()
{
    config_.cache_enabled = false;
    cache_.reset();
}

std::optional<CacheStats> Mixer::cacheStats() const
{
    if (cache_ == nullptr) {
        return std::nullopt;
    }
    return cache_->stats();
}

void Mixer::setListener(const ListenerConfig& listener)
{
    listener_ = listener;
}

bool Mixer::setSpatialParams(const SpatialParams& params, Error* outError)
{
    if (!params.isValid()) {
        reportError(outError, Error::kInvalidParameter);
        return false;
    }
    spatialParams_ = params;
    return true;
}

void Mixer::setMasterEffects(EffectChain chain)
{
    masterEffects_ = std::move(chain);
}

void Mixer::setMasterGain(const float gain)
{
    if (std::isfinite(gain) && gain >= 0.0F) {
        config_.master_gain = gain;
    }
}

double Mixer::totalDuration() const noexcept
{
    double total = 0.0;
    for (const Event& event : events_) {
        total = std::max(total, event.start_time + event.voice.renderDuration());
    }
    return total;
}

RenderResult Mixer::render()
{
    return render(config_.sample_rate);
}

RenderResult Mixer::render(const int sampleRate)
{
    std::unique_ptr<RenderStream::Session> session = makeSession(sampleRate);

    RenderResult result;
    result.samples.assign(session->totalFrames() * 2, 0.0F);

    float* out = result.samples.data();
    std::size_t remaining = session->totalFrames();
    while (remaining > 0) {
        const int chunk = static_cast<int>(std::min<std::size_t>(remaining, 1u << 20));
        const int written = session->next(out, chunk);
        if (written == 0) {
            break;
        }
        out += static_cast<std::size_t>(written) * 2;
        remaining -= static_cast<std::size_t>(written);
    }

    result.error = session->error();
    result.rendered_seconds = static_cast<double>(session->framesDelivered()) /
                              static_cast<double>(session->sampleRate());
    return result;
}

void Mixer::prerender()
{
    if (cache_ == nullptr) {
        logLine("prerender skipped, cache disabled");
        return;
    }
    const int rate = config_.sample_rate;
    auto log = std::make_shared<RenderLog>();
    juce::ThreadPool* pool = events_.empty() ? nullptr : workerPool();

    std::vector<SampleCache::SampleFuture> waits;
    for (const Event& event : sortedByStart(events_)) {
        if (!cache_->isCacheable(static_cast<double>(event.voice.duration))) {
            continue;
        }
        waits.push_back(requestSample(event.voice, rate, cache_, pool, log).future);
    }
    for (const SampleCache::SampleFuture& future : waits) {
        future.wait();
    }
    logLine("prerendered " + juce::String(static_cast<int>(waits.size())) + " voices, " +
            juce::String(static_cast<juce::int64>(cache_->entryCount())) + " cached");
}

std::unique_ptr<RenderStream> Mixer::stream()
{
    return stream(config_.sample_rate);
}

std::unique_ptr<RenderStream> Mixer::stream(const int sampleRate)
{
    return std::unique_ptr<RenderStream>(new RenderStream(makeSession(sampleRate)));
}

void Mixer::stop() noexcept
{
    stopFlag_->store(true);
}

bool Mixer::stopRequested() const noexcept
{
    return stopFlag_->load();
}

std::unique_ptr<RenderStream::Session> Mixer::makeSession(const int sampleRate)
{
    const int rate = sampleRate > 0 ? sampleRate : config_.sample_rate;
    const double duration = totalDuration();
    const std::size_t totalFrames = framesForDuration(duration, rate);

    logLine("render start: " + juce::String(static_cast<int>(events_.size())) + " events, " +
            juce::String(duration, 3) + "s at " + juce::String(rate) + " Hz");

    auto log = std::make_shared<RenderLog>();
    juce::ThreadPool* pool = events_.empty() ? nullptr : workerPool();

    std::vector<RenderStream::Session::Plan> plans;
    plans.reserve(events_.size());
    for (Event& event : sortedByStart(events_)) {
        RenderStream::Session::Plan plan;
        plan.start_frame = static_cast<std::size_t>(
            std::llround(event.start_time * static_cast<double>(rate)));
        plan.length_frames = framesForDuration(event.voice.renderDuration(), rate);
        if (plan.start_frame >= totalFrames || plan.length_frames == 0) {
            continue;
        }
        plan.length_frames = std::min(plan.length_frames, totalFrames - plan.start_frame);
        plan.request = requestSample(event.voice, rate, cache_, pool, log);
        plan.event = std::move(event);
        plans.push_back(std::move(plan));
    }

    RenderStream::Session::Settings settings;
    settings.sample_rate = rate;
    settings.block_size = config_.block_size;
    settings.master_gain = config_.master_gain;
    settings.soft_clip_knee = config_.soft_clip_knee;
    settings.listener = listener_;
    settings.spatial = spatialParams_;
    settings.master_effects = masterEffects_;
    settings.buses = buses_;

    return std::make_unique<RenderStream::Session>(std::move(settings), std::move(plans),
                                                   totalFrames, stopFlag_, cache_, log);
}

juce::ThreadPool* Mixer::workerPool()
{
    const int threads = resolveWorkerThreads(config_.worker_threads);
    if (threads <= 1) {
        return nullptr;
    }
    const std::lock_guard<std::mutex> lock(poolMutex_);
    if (pool_ == nullptr) {
        pool_ = std::make_unique<juce::ThreadPool>(threads);
        logLine("worker pool started with " + juce::String(threads) + " threads");
    }
    return pool_.get();
}

}  // namespace tunesmith
