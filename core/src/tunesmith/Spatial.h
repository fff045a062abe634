#pragma once

#include <optional>

#include "tunesmith/Types.h"

namespace tunesmith {

struct Vec3 {
    float x{0.0F};
    float y{0.0F};
    float z{0.0F};

    [[nodiscard]] Vec3 operator+(const Vec3& o) const noexcept { return {x + o.x, y + o.y, z + o.z}; }
    [[nodiscard]] Vec3 operator-(const Vec3& o) const noexcept { return {x - o.x, y - o.y, z - o.z}; }
    [[nodiscard]] Vec3 operator*(const float s) const noexcept { return {x * s, y * s, z * s}; }

    [[nodiscard]] float dot(const Vec3& o) const noexcept { return x * o.x + y * o.y + z * o.z; }
    [[nodiscard]] Vec3 cross(const Vec3& o) const noexcept
    {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }
    [[nodiscard]] float length() const noexcept;
    [[nodiscard]] Vec3 normalized() const noexcept;
};

struct ListenerConfig {
    Vec3 position{};
    Vec3 forward{0.0F, 0.0F, 1.0F};
    Vec3 up{0.0F, 1.0F, 0.0F};
    Vec3 velocity{};

    // Normalises forward and up. Fails with kInvalidParameter when either
    // is degenerate or they are parallel.
    [[nodiscard]] static std::optional<ListenerConfig> create(
        const Vec3& position, const Vec3& forward, const Vec3& up,
        const Vec3& velocity = {}, Error* outError = nullptr);

    [[nodiscard]] Vec3 right() const noexcept { return forward.cross(up); }
};

enum class AttenuationModel {
    kNone = 0,
    kLinear,
    kInverse,
    kInverseSquare,
    kExponential,
};

struct SpatialParams {
    AttenuationModel attenuation_model{AttenuationModel::kInverseSquare};
    float ref_distance{1.0F};
    float max_distance{100.0F};
    float rolloff{1.0F};
    float speed_of_sound{343.0F};
    bool doppler_enabled{true};
    float doppler_factor{1.0F};

    [[nodiscard]] static std::optional<SpatialParams> create(
        AttenuationModel model, float refDistance, float maxDistance, float rolloff,
        float speedOfSound = 343.0F, bool dopplerEnabled = true, float dopplerFactor = 1.0F,
        Error* outError = nullptr);

    [[nodiscard]] bool isValid() const noexcept;
};

// Position and velocity of a sound source. The position moves linearly
// with the velocity from the moment the event starts.
struct SpatialSource {
    Vec3 position{};
    Vec3 velocity{};

    [[nodiscard]] Vec3 positionAt(double secondsSinceStart) const noexcept
    {
        return position + velocity * static_cast<float>(secondsSinceStart);
    }
};

struct SpatialResult {
    float volume{1.0F};
    float pan{0.0F};          // -1 (left) .. 1 (right)
    float pitch_shift{1.0F};  // doppler multiplier, [0.5, 2]
    float gain_left{0.0F};
    float gain_right{0.0F};
};

// Maps source/listener geometry to gain, pan and doppler pitch.
namespace spatial {

// Distance attenuation. Returns 0 at or beyond max_distance.
[[nodiscard]] float attenuation(float distance, const SpatialParams& params) noexcept;

// Signed horizontal angle between the listener's forward vector and the
// direction to the source, both projected on the XZ plane. Positive
// angles are to the listener's right. 0 when the source is (almost)
// directly above, below or on the listener.
[[nodiscard]] float azimuth(const Vec3& toSource, const Vec3& forward) noexcept;

// Doppler pitch multiplier clamped to [0.5, 2].
[[nodiscard]] float dopplerShift(const Vec3& toSource, const Vec3& sourceVelocity,
                                 const Vec3& listenerVelocity,
                                 const SpatialParams& params) noexcept;

// Full computation for a source position and velocity.
[[nodiscard]] SpatialResult compute(const Vec3& sourcePosition, const Vec3& sourceVelocity,
                                    const ListenerConfig& listener,
                                    const SpatialParams& params) noexcept;

// Equal-power pan gains for pan in [-1, 1]: cos / sin of (pan+1)*pi/4.
void equalPowerGains(float pan, float volume, float& left, float& right) noexcept;

}  // namespace spatial

}  // namespace tunesmith
