// ==============================================================================
// Layer 1: DSP Primitive - Onset Ramp
// ==============================================================================
// Short linear fade-in applied right after a voice is (re)triggered.
//
// The duration follows the note's fundamental: it covers at least two
// periods of the fundamental and at least the settling time constant of the
// DC blocker that follows it in the voice chain. Low notes therefore get a
// longer ramp, which is what suppresses the low-frequency onset thump.
//
// Dependencies:
//   - Layer 1: dc_blocker.h (cutoff selection and time constant)
// ==============================================================================

#pragma once

#include <acordes/dsp/primitives/dc_blocker.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Acordes {
namespace DSP {

inline constexpr float kMinOnsetRampSeconds = 0.002f;
inline constexpr float kMaxOnsetRampSeconds = 0.050f;

/// @brief Onset ramp length in seconds for a fundamental frequency.
///
/// clamp(max(2 / f0, tau_dc), 2 ms, 50 ms), with tau_dc the time constant of
/// the DC blocker pole chosen for f0.
[[nodiscard]] inline float onsetRampSecondsForFundamental(float fundamentalHz) noexcept {
    const float f0 = std::max(fundamentalHz, 1.0f);
    const float twoPeriods = 2.0f / f0;
    const float tau = dcBlockerTimeConstant(dcBlockerCutoffForFundamental(f0));
    return std::clamp(std::max(twoPeriods, tau), kMinOnsetRampSeconds, kMaxOnsetRampSeconds);
}

/// @brief Linear 0 -> 1 fade-in over a configurable number of samples.
///
/// After the ramp completes the gain is exactly 1 and processBlock() is a
/// no-op, so a settled voice pays nothing for it.
class OnsetRamp {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = (sampleRate > 0.0) ? sampleRate : 48000.0;
        reset();
    }

    /// @brief Finish any ramp in progress (gain 1, no attenuation).
    void reset() noexcept {
        length_ = 0;
        position_ = 0;
    }

    /// @brief Start a new ramp sized for the given fundamental.
    void trigger(float fundamentalHz) noexcept {
        const double seconds = static_cast<double>(onsetRampSecondsForFundamental(fundamentalHz));
        length_ = std::max<size_t>(1, static_cast<size_t>(std::round(seconds * sampleRate_)));
        position_ = 0;
    }

    /// @brief Multiply the block by the ramp gain in place.
    void processBlock(float* buffer, size_t numSamples) noexcept {
        if (position_ >= length_) {
            return;
        }
        const float inv = 1.0f / static_cast<float>(length_);
        const size_t n = std::min(numSamples, length_ - position_);
        for (size_t i = 0; i < n; ++i) {
            buffer[i] *= static_cast<float>(position_ + i) * inv;
        }
        position_ += n;
    }

    [[nodiscard]] bool isRamping() const noexcept { return position_ < length_; }
    [[nodiscard]] size_t getLengthSamples() const noexcept { return length_; }
    [[nodiscard]] size_t getRemainingSamples() const noexcept {
        return (position_ < length_) ? (length_ - position_) : 0;
    }

private:
    double sampleRate_ = 48000.0;
    size_t length_ = 0;
    size_t position_ = 0;
};

} // namespace DSP
} // namespace Acordes
