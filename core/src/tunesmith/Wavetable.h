#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "tunesmith/Types.h"

namespace tunesmith {

// Immutable single-cycle waveform table. Copies share the underlying
// sample storage, so passing a Wavetable by value is cheap and the
// preset tables can be handed out to any number of render threads.
//
// Lookup uses linear interpolation between neighbouring entries and
// wraps around the end of the cycle.
class Wavetable {
public:
    static constexpr std::size_t kDefaultSize = 2048;

    // Builds a table from raw samples. Fails with kInvalidWavetable when
    // the table is empty or holds non-finite values.
    [[nodiscard]] static std::optional<Wavetable> fromSamples(
        std::vector<float> samples, Error* outError = nullptr);

    // Samples `fn(phase)` at `size` evenly spaced phases in [0, 1).
    [[nodiscard]] static std::optional<Wavetable> fromFn(
        std::size_t size, const std::function<float(float)>& fn,
        Error* outError = nullptr);

    // Additive construction from (harmonic number, amplitude) pairs; the
    // result is peak-normalised. Harmonic numbers must be >= 1.
    [[nodiscard]] static std::optional<Wavetable> fromHarmonics(
        std::size_t size, const std::vector<std::pair<int, float>>& harmonics,
        Error* outError = nullptr);

    // Band-limited pulse with the given duty cycle (clamped to
    // [0.01, 0.99]), built as the difference of two band-limited saws.
    [[nodiscard]] static Wavetable pwm(float dutyCycle,
                                       std::size_t size = kDefaultSize);

    // Process-wide preset tables, created on first access.
    [[nodiscard]] static const Wavetable& sine();
    [[nodiscard]] static const Wavetable& sawBandlimited();
    [[nodiscard]] static const Wavetable& squareBandlimited();
    [[nodiscard]] static const Wavetable& triangleBandlimited();

    // Interpolated value at `phase`. Phases outside [0, 1) are wrapped.
    [[nodiscard]] float lookup(double phase) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return table_->size(); }
    [[nodiscard]] const float* data() const noexcept { return table_->data(); }

    // Content hash of the table, used when a custom table takes part in
    // a voice fingerprint.
    [[nodiscard]] std::uint64_t contentId() const noexcept { return contentId_; }

private:
    explicit Wavetable(std::vector<float> samples);

    std::shared_ptr<const std::vector<float>> table_;
    std::uint64_t contentId_{0};
};

}  // namespace tunesmith
