#pragma once

#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "tunesmith/CacheKey.h"
#include "tunesmith/Types.h"

namespace tunesmith {

// Pre-rendered mono voice. The sample buffer is shared and immutable,
// so a CachedSample can be copied freely and played back without
// holding the cache lock.
struct CachedSample {
    std::shared_ptr<const std::vector<float>> samples;
    int sample_rate{kDefaultSampleRate};
    double duration_seconds{0.0};     // note duration (release tail excluded)
    double reference_frequency{0.0};  // oscillator frequency at synthesis
    std::size_t byte_size{0};         // samples->size() * sizeof(float)

    [[nodiscard]] static CachedSample create(std::vector<float> samples, int sampleRate,
                                             double durationSeconds,
                                             double referenceFrequency);

    [[nodiscard]] std::size_t length() const noexcept { return samples ? samples->size() : 0; }
    [[nodiscard]] const float* data() const noexcept { return samples ? samples->data() : nullptr; }
};

struct CachePolicy {
    static constexpr std::size_t kDefaultMaxSizeBytes = std::size_t{500} * 1024 * 1024;

    std::size_t max_size_bytes{kDefaultMaxSizeBytes};
    double min_cacheable_duration{0.1};
};

struct CacheStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
    std::uint64_t insertions{0};
    std::uint64_t skipped{0};   // too short or too large to cache
    std::size_t entries{0};
    std::size_t size_bytes{0};

    // hits / (hits + misses), 0 when nothing was looked up yet.
    [[nodiscard]] double hitRate() const noexcept;
};

// Fingerprint-keyed LRU store of rendered voices.
//
// One mutex guards the map, the recency list, the size counter and the
// statistics. Besides plain get/insert the cache offers single-flight
// lookups (acquire/complete): the first caller that misses a key
// reserves it and must render the voice, while later callers receive a
// future for that same render. Every key is therefore synthesised at
// most once while a render is in flight.
class SampleCache {
public:
    using SampleFuture = std::shared_future<CachedSample>;

    struct Lookup {
        enum class Kind {
            kHit,        // `sample` is valid
            kPending,    // another caller is rendering; wait on `future`
            kReserved,   // caller must render and then call complete()
        };
        Kind kind{Kind::kHit};
        CachedSample sample{};
        SampleFuture future{};
    };

    explicit SampleCache(CachePolicy policy = {});

    SampleCache(const SampleCache&) = delete;
    SampleCache& operator=(const SampleCache&) = delete;

    // Policy setters; shrinking the size limit evicts immediately.
    SampleCache& withMaxSize(std::size_t maxSizeBytes);
    SampleCache& withMinDuration(double seconds);
    [[nodiscard]] CachePolicy policy() const;

    // True when a voice of this note duration may be stored.
    [[nodiscard]] bool isCacheable(double durationSeconds) const;

    // Returns the entry and marks it most recently used. Counts a hit or
    // a miss.
    [[nodiscard]] std::optional<CachedSample> get(const CacheKey& key);

    // Stores `sample`, replacing any entry with the same key and
    // evicting least recently used entries until it fits. Returns false
    // without storing when the sample is shorter than the minimum
    // duration, or with kCacheFull when it is larger than the whole
    // cache; both count as skipped.
    bool insert(const CacheKey& key, CachedSample sample, Error* outError = nullptr);

    // Presence check without touching recency or statistics.
    [[nodiscard]] bool contains(const CacheKey& key) const;

    // Single-flight lookup. A hit or an in-flight render counts as a
    // hit; a reservation counts as a miss.
    [[nodiscard]] Lookup acquire(const CacheKey& key);

    // Publishes the render for a reserved key: inserts it (subject to
    // the same rules as insert()) and wakes every waiter. Waiters get
    // the sample even when it could not be stored.
    bool complete(const CacheKey& key, const CachedSample& sample, Error* outError = nullptr);

    // Releases a reservation whose render failed; waiters rethrow
    // `error` from their future.
    void abandon(const CacheKey& key, std::exception_ptr error);

    // Counts a voice that bypassed the cache.
    void noteSkipped();

    // Drops every entry. Statistics are kept; see resetStats().
    void clear();
    void resetStats();

    [[nodiscard]] CacheStats stats() const;
    [[nodiscard]] std::size_t sizeBytes() const;
    [[nodiscard]] std::size_t entryCount() const;

private:
    struct Entry {
        CachedSample sample;
        std::list<CacheKey>::iterator position;
    };

    struct Flight {
        std::shared_ptr<std::promise<CachedSample>> promise;
        SampleFuture future;
    };

    bool insertLocked(const CacheKey& key, CachedSample sample, Error* outError);
    void removeLocked(const CacheKey& key);
    void evictToFitLocked(std::size_t incomingBytes);
    void touchLocked(Entry& entry);

    mutable std::mutex mutex_;
    CachePolicy policy_;
    std::unordered_map<CacheKey, Entry> entries_;
    std::list<CacheKey> recency_;  // front = least recently used
    std::unordered_map<CacheKey, Flight> inFlight_;
    std::size_t sizeBytes_{0};
    CacheStats stats_{};
};

}  // namespace tunesmith
