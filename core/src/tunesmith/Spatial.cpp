#include "tunesmith/Spatial.h"

#include <algorithm>
#include <cmath>

#include <juce_core/juce_core.h>

namespace tunesmith {

namespace {

constexpr float kMinDistance = 0.001F;

bool isFinite(const Vec3& v) noexcept
{
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

}  // namespace

float Vec3::length() const noexcept
{
    return std::sqrt(x * x + y * y + z * z);
}

Vec3 Vec3::normalized() const noexcept
{
    const float len = length();
    if (len <= 0.0F) {
        return {};
    }
    return *this * (1.0F / len);
}

std::optional<ListenerConfig> ListenerConfig::create(const Vec3& position, const Vec3& forward,
                                                     const Vec3& up, const Vec3& velocity,
                                                     Error* outError)
{
    if (!isFinite(position) || !isFinite(forward) || !isFinite(up) || !isFinite(velocity) ||
        forward.length() < kMinDistance || up.length() < kMinDistance) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    ListenerConfig config{position, forward.normalized(), up.normalized(), velocity};
    if (config.right().length() < kMinDistance) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    return config;
}

std::optional<SpatialParams> SpatialParams::create(
    const AttenuationModel model, const float refDistance, const float maxDistance,
    const float rolloff, const float speedOfSound, const bool dopplerEnabled,
    const float dopplerFactor, Error* outError)
{
    SpatialParams params{model,        refDistance,    maxDistance,  rolloff,
                         speedOfSound, dopplerEnabled, dopplerFactor};
    if (!params.isValid()) {
        reportError(outError, Error::kInvalidParameter);
        return std::nullopt;
    }
    return params;
}

bool SpatialParams::isValid() const noexcept
{
    return std::isfinite(ref_distance) && ref_distance > 0.0F && std::isfinite(max_distance) &&
           max_distance > ref_distance && std::isfinite(rolloff) && rolloff >= 0.0F &&
           std::isfinite(speed_of_sound) && speed_of_sound > 0.0F &&
           std::isfinite(doppler_factor) && doppler_factor >= 0.0F;
}

namespace spatial {

float attenuation(const float distance, const SpatialParams& params) noexcept
{
    if (distance >= params.max_distance) {
        return 0.0F;
    }
    const float ref = params.ref_distance;
    switch (params.attenuation_model) {
        case AttenuationModel::kNone:
            return 1.0F;
        case AttenuationModel::kLinear: {
            if (distance <= ref) {
                return 1.0F;
            }
            const float span = params.max_distance - ref;
            return juce::jlimit(0.0F, 1.0F, 1.0F - params.rolloff * (distance - ref) / span);
        }
        case AttenuationModel::kInverse: {
            const float d = std::max(distance, ref);
            return ref / (ref + params.rolloff * (d - ref));
        }
        case AttenuationModel::kInverseSquare: {
            if (distance < ref) {
                return 1.0F;
            }
            const float r = ref / distance;
            return r * r;
        }
        case AttenuationModel::kExponential:
            if (distance < ref) {
                return 1.0F;
            }
            return std::pow(distance / ref, -params.rolloff);
    }
    return 1.0F;
}

float azimuth(const Vec3& toSource, const Vec3& forward) noexcept
{
    const Vec3 flatSource{toSource.x, 0.0F, toSource.z};
    const Vec3 flatForward{forward.x, 0.0F, forward.z};
    if (flatSource.length() < kMinDistance || flatForward.length() < kMinDistance) {
        return 0.0F;
    }
    const Vec3 s = flatSource.normalized();
    const Vec3 f = flatForward.normalized();
    return std::atan2(f.cross(s).y, f.dot(s));
}

float dopplerShift(const Vec3& toSource, const Vec3& sourceVelocity,
                   const Vec3& listenerVelocity, const SpatialParams& params) noexcept
{
    const float distance = toSource.length();
    if (!params.doppler_enabled || distance < kMinDistance) {
        return 1.0F;
    }
    const Vec3 u = toSource * (1.0F / distance);
    const float vs = sourceVelocity.dot(u);
    const float vl = listenerVelocity.dot(u);
    const float c = params.speed_of_sound;
    const float shift = (c - (vs - vl) * params.doppler_factor) / c;
    if (!std::isfinite(shift)) {
        return 1.0F;
    }
    return juce::jlimit(0.5F, 2.0F, shift);
}

void equalPowerGains(const float pan, const float volume, float& left, float& right) noexcept
{
    const float angle = (juce::jlimit(-1.0F, 1.0F, pan) + 1.0F) *
                        juce::MathConstants<float>::pi * 0.25F;
    left = volume * std::cos(angle);
    right = volume * std::sin(angle);
}

SpatialResult compute(const Vec3& sourcePosition, const Vec3& sourceVelocity,
                      const ListenerConfig& listener, const SpatialParams& params) noexcept
{
    SpatialResult result;
    const Vec3 toSource = sourcePosition - listener.position;
    result.volume = attenuation(toSource.length(), params);

    const float halfPi = juce::MathConstants<float>::halfPi;
    const float theta = azimuth(toSource, listener.forward);
    result.pan = juce::jlimit(-halfPi, halfPi, theta) / halfPi;

    result.pitch_shift = dopplerShift(toSource, sourceVelocity, listener.velocity, params);
    equalPowerGains(result.pan, result.volume, result.gain_left, result.gain_right);
    return result;
}

}  // namespace spatial

}  // namespace tunesmith
