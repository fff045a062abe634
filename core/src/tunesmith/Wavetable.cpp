#include "tunesmith/Wavetable.h"

#include <algorithm>
#include <cmath>

#include <juce_core/juce_core.h>

#include "tunesmith/Fingerprint.h"

namespace tunesmith {

namespace {

constexpr double kTwoPi = juce::MathConstants<double>::twoPi;

// Sums sin(2*pi*n*phase) * amplitude over the given harmonics and
// scales the result so that its absolute peak is 1.
std::vector<float> additiveTable(
    const std::size_t size, const std::vector<std::pair<int, float>>& harmonics)
{
    std::vector<double> acc(size, 0.0);
    for (const auto& [number, amplitude] : harmonics) {
        for (std::size_t i = 0; i < size; ++i) {
            const double phase = static_cast<double>(i) / static_cast<double>(size);
            acc[i] += static_cast<double>(amplitude) *
                      std::sin(kTwoPi * static_cast<double>(number) * phase);
        }
    }

    double peak = 0.0;
    for (const double v : acc) {
        peak = std::max(peak, std::abs(v));
    }

    std::vector<float> out(size, 0.0F);
    const double scale = peak > 0.0 ? 1.0 / peak : 0.0;
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<float>(acc[i] * scale);
    }
    return out;
}

}  // namespace

Wavetable::Wavetable(std::vector<float> samples)
{
    Fingerprint hash;
    hash.addTag("wavetable");
    hash.addBytes(samples.data(), samples.size() * sizeof(float));
    contentId_ = hash.value();
    table_ = std::make_shared<const std::vector<float>>(std::move(samples));
}

std::optional<Wavetable> Wavetable::fromSamples(std::vector<float> samples,
                                                Error* outError)
{
    if (samples.empty()) {
        reportError(outError, Error::kInvalidWavetable);
        return std::nullopt;
    }
    for (const float v : samples) {
        if (!std::isfinite(v)) {
            reportError(outError, Error::kInvalidWavetable);
            return std::nullopt;
        }
    }
    return Wavetable(std::move(samples));
}

std::optional<Wavetable> Wavetable::fromFn(
    const std::size_t size, const std::function<float(float)>& fn,
    Error* outError)
{
    if (size == 0 || !fn) {
        reportError(outError, Error::kInvalidWavetable);
        return std::nullopt;
    }
    std::vector<float> samples(size);
    for (std::size_t i = 0; i < size; ++i) {
        samples[i] = fn(static_cast<float>(i) / static_cast<float>(size));
    }
    return fromSamples(std::move(samples), outError);
}

std::optional<Wavetable> Wavetable::fromHarmonics(
    const std::size_t size, const std::vector<std::pair<int, float>>& harmonics,
    Error* outError)
{
    if (size == 0 || harmonics.empty()) {
        reportError(outError, Error::kInvalidWavetable);
        return std::nullopt;
    }
    for (const auto& [number, amplitude] : harmonics) {
        if (number < 1 || !std::isfinite(amplitude)) {
            reportError(outError, Error::kInvalidWavetable);
            return std::nullopt;
        }
    }
    return fromSamples(additiveTable(size, harmonics), outError);
}

Wavetable Wavetable::pwm(const float dutyCycle, const std::size_t size)
{
    const double duty = juce::jlimit(0.01, 0.99, static_cast<double>(dutyCycle));
    const std::size_t n = std::max<std::size_t>(size, 1);

    // pulse(p) = saw(p) - saw(p - duty), both built from 31 harmonics.
    std::vector<double> acc(n, 0.0);
    for (int h = 1; h <= 31; ++h) {
        const double k = static_cast<double>(h);
        for (std::size_t i = 0; i < n; ++i) {
            const double phase = static_cast<double>(i) / static_cast<double>(n);
            acc[i] += (std::sin(kTwoPi * k * phase) -
                       std::sin(kTwoPi * k * (phase - duty))) / k;
        }
    }

    double peak = 0.0;
    for (const double v : acc) {
        peak = std::max(peak, std::abs(v));
    }
    std::vector<float> samples(n);
    for (std::size_t i = 0; i < n; ++i) {
        samples[i] = static_cast<float>(peak > 0.0 ? acc[i] / peak : 0.0);
    }
    return Wavetable(std::move(samples));
}

const Wavetable& Wavetable::sine()
{
    static const Wavetable table = [] {
        std::vector<float> samples(kDefaultSize);
        for (std::size_t i = 0; i < kDefaultSize; ++i) {
            samples[i] = static_cast<float>(
                std::sin(kTwoPi * static_cast<double>(i) / static_cast<double>(kDefaultSize)));
        }
        return Wavetable(std::move(samples));
    }();
    return table;
}

const Wavetable& Wavetable::sawBandlimited()
{
    static const Wavetable table = [] {
        std::vector<std::pair<int, float>> harmonics;
        for (int n = 1; n <= 31; ++n) {
            harmonics.emplace_back(n, 1.0F / static_cast<float>(n));
        }
        return Wavetable(additiveTable(kDefaultSize, harmonics));
    }();
    return table;
}

const Wavetable& Wavetable::squareBandlimited()
{
    static const Wavetable table = [] {
        std::vector<std::pair<int, float>> harmonics;
        for (int k = 0; k < 16; ++k) {
            const int n = 2 * k + 1;
            harmonics.emplace_back(n, 1.0F / static_cast<float>(n));
        }
        return Wavetable(additiveTable(kDefaultSize, harmonics));
    }();
    return table;
}

const Wavetable& Wavetable::triangleBandlimited()
{
    static const Wavetable table = [] {
        std::vector<std::pair<int, float>> harmonics;
        for (int k = 0; k < 16; ++k) {
            const int n = 2 * k + 1;
            const float sign = (k % 2 == 0) ? 1.0F : -1.0F;
            harmonics.emplace_back(n, sign / static_cast<float>(n * n));
        }
        return Wavetable(additiveTable(kDefaultSize, harmonics));
    }();
    return table;
}

float Wavetable::lookup(const double phase) const noexcept
{
    const std::vector<float>& table = *table_;
    const std::size_t n = table.size();

    const double wrapped = phase - std::floor(phase);
    const double x = wrapped * static_cast<double>(n);
    auto i = static_cast<std::size_t>(x);
    const auto f = static_cast<float>(x - static_cast<double>(i));
    if (i >= n) {
        i = 0;
    }
    const std::size_t next = (i + 1 == n) ? 0 : i + 1;
    return table[i] + f * (table[next] - table[i]);
}

}  // namespace tunesmith
