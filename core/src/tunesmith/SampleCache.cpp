#include "tunesmith/SampleCache.h"

#include <iterator>
#include <utility>

namespace tunesmith {

CachedSample CachedSample::create(std::vector<float> samples, const int sampleRate,
                                  const double durationSeconds,
                                  const double referenceFrequency)
{
    CachedSample sample;
    sample.byte_size = samples.size() * sizeof(float);
    sample.samples = std::make_shared<const std::vector<float>>(std::move(samples));
    sample.sample_rate = sampleRate;
    sample.duration_seconds = durationSeconds;
    sample.reference_frequency = referenceFrequency;
    return sample;
}

double CacheStats::hitRate() const noexcept
{
    const std::uint64_t lookups = hits + misses;
    return lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
}

SampleCache::SampleCache(CachePolicy policy) : policy_(policy) {}

SampleCache& SampleCache::withMaxSize(const std::size_t maxSizeBytes)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    policy_.max_size_bytes = maxSizeBytes;
    evictToFitLocked(0);
    return *this;
}

SampleCache& SampleCache::withMinDuration(const double seconds)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    policy_.min_cacheable_duration = seconds;
    return *this;
}

CachePolicy SampleCache::policy() const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return policy_;
}

bool SampleCache::isCacheable(const double durationSeconds) const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return durationSeconds >= policy_.min_cacheable_duration;
}

std::optional<CachedSample> SampleCache::get(const CacheKey& key)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++stats_.misses;
        return std::nullopt;
    }
    ++stats_.hits;
    touchLocked(it->second);
    return it->second.sample;
}

bool SampleCache::insert(const CacheKey& key, CachedSample sample, Error* outError)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return insertLocked(key, std::move(sample), outError);
}

bool SampleCache::contains(const CacheKey& key) const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(key) != entries_.end();
}

SampleCache::Lookup SampleCache::acquire(const CacheKey& key)
{
    const std::lock_guard<std::mutex> lock(mutex_);
    Lookup lookup;

    const auto it = entries_.find(key);
    if (it != entries_.end()) {
        ++stats_.hits;
        touchLocked(it->second);
        lookup.kind = Lookup::Kind::kHit;
        lookup.sample = it->second.sample;
        return lookup;
    }

    const auto flight = inFlight_.find(key);
    if (flight != inFlight_.end()) {
        ++stats_.hits;
        lookup.kind = Lookup::Kind::kPending;
        lookup.future = flight->second.future;
        return lookup;
    }

    ++stats_.misses;
    Flight reserved;
    reserved.promise = std::make_shared<std::promise<CachedSample>>();
    reserved.future = reserved.promise->get_future().share();
    lookup.kind = Lookup::Kind::kReserved;
    lookup.future = reserved.future;
    inFlight_.emplace(key, std::move(reserved));
    return lookup;
}

bool SampleCache::complete(const CacheKey& key, const CachedSample& sample, Error* outError)
{
    std::shared_ptr<std::promise<CachedSample>> promise;
    bool stored = false;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        stored = insertLocked(key, sample, outError);
        const auto flight = inFlight_.find(key);
        if (flight != inFlight_.end()) {
            promise = std::move(flight->second.promise);
            inFlight_.erase(flight);
        }
    }
    if (promise != nullptr) {
        promise->set_value(sample);
    }
    return stored;
}

void SampleCache::abandon(const CacheKey& key, std::exception_ptr error)
{
    std::shared_ptr<std::promise<CachedSample>> promise;
    {
        const std::lock_guard<std::mutex> lock(mutex_);
        const auto flight = inFlight_.find(key);
        if (flight == inFlight_.end()) {
            return;
        }
        promise = std::move(flight->second.promise);
        inFlight_.erase(flight);
    }
    promise->set_exception(std::move(error));
}

void SampleCache::noteSkipped()
{
    const std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.skipped;
}

void SampleCache::clear()
{
    const std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    recency_.clear();
    sizeBytes_ = 0;
}

void SampleCache::resetStats()
{
    const std::lock_guard<std::mutex> lock(mutex_);
    stats_ = CacheStats{};
}

CacheStats SampleCache::stats() const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    CacheStats out = stats_;
    out.entries = entries_.size();
    out.size_bytes = sizeBytes_;
    return out;
}

std::size_t SampleCache::sizeBytes() const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return sizeBytes_;
}

std::size_t SampleCache::entryCount() const
{
    const std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool SampleCache::insertLocked(const CacheKey& key, CachedSample sample, Error* outError)
{
    if (sample.duration_seconds < policy_.min_cacheable_duration) {
        ++stats_.skipped;
        return false;
    }
    if (sample.byte_size > policy_.max_size_bytes) {
        ++stats_.skipped;
        reportError(outError, Error::kCacheFull);
        return false;
    }

    removeLocked(key);
    evictToFitLocked(sample.byte_size);

    sizeBytes_ += sample.byte_size;
    recency_.push_back(key);
    entries_.emplace(key, Entry{std::move(sample), std::prev(recency_.end())});
    ++stats_.insertions;
    return true;
}

void SampleCache::removeLocked(const CacheKey& key)
{
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    sizeBytes_ -= it->second.sample.byte_size;
    recency_.erase(it->second.position);
    entries_.erase(it);
}

void SampleCache::evictToFitLocked(const std::size_t incomingBytes)
{
    // Bounded by the number of resident entries.
    while (!recency_.empty() && sizeBytes_ + incomingBytes > policy_.max_size_bytes) {
        const CacheKey oldest = recency_.front();
        removeLocked(oldest);
        ++stats_.evictions;
    }
}

void SampleCache::touchLocked(Entry& entry)
{
    recency_.splice(recency_.end(), recency_, entry.position);
}

}  // namespace tunesmith
