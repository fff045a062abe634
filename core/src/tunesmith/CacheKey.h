#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace tunesmith {

struct VoiceDescriptor;

// 64-bit fingerprint of every audible voice parameter except the
// frequency and the pan. Frequency is left out so notes that differ only
// in pitch share one cached buffer (played back resampled); pan and pan
// routes are applied at mix time.
struct CacheKey {
    std::uint64_t value{0};

    [[nodiscard]] static CacheKey forVoice(const VoiceDescriptor& voice, int sampleRate);

    friend bool operator==(const CacheKey& a, const CacheKey& b) noexcept { return a.value == b.value; }
    friend bool operator!=(const CacheKey& a, const CacheKey& b) noexcept { return a.value != b.value; }
};

}  // namespace tunesmith

namespace std {

template <>
struct hash<tunesmith::CacheKey> {
    std::size_t operator()(const tunesmith::CacheKey& key) const noexcept
    {
        return static_cast<std::size_t>(key.value);
    }
};

}  // namespace std
