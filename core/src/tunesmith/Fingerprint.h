#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace tunesmith {

// Incremental 64-bit FNV-1a hasher used for cache keys and wavetable
// content ids. Floats are quantised before hashing so that descriptors
// which differ only by rounding noise produce the same fingerprint.
class Fingerprint {
public:
    // Float parameters are rounded to multiples of this quantum.
    static constexpr double kQuantum = 1.0e-5;

    Fingerprint& addBytes(const void* data, std::size_t size) noexcept
    {
        const auto* bytes = static_cast<const unsigned char*>(data);
        for (std::size_t i = 0; i < size; ++i) {
            state_ ^= static_cast<std::uint64_t>(bytes[i]);
            state_ *= kPrime;
        }
        return *this;
    }

    Fingerprint& addInt(const std::int64_t value) noexcept
    {
        return addBytes(&value, sizeof(value));
    }

    Fingerprint& addTag(const char* tag) noexcept
    {
        return addBytes(tag, std::strlen(tag));
    }

    Fingerprint& addBool(const bool value) noexcept
    {
        return addInt(value ? 1 : 0);
    }

    // Non-finite values hash to fixed sentinels; validation rejects
    // them long before they reach a cache key.
    Fingerprint& addFloat(const double value) noexcept
    {
        if (!std::isfinite(value)) {
            return addInt(std::isnan(value) ? INT64_MIN : (value > 0 ? INT64_MAX : INT64_MIN + 1));
        }
        return addInt(static_cast<std::int64_t>(std::llround(value / kQuantum)));
    }

    [[nodiscard]] std::uint64_t value() const noexcept { return state_; }

private:
    static constexpr std::uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
    static constexpr std::uint64_t kPrime = 0x100000001b3ULL;

    std::uint64_t state_{kOffsetBasis};
};

}  // namespace tunesmith
