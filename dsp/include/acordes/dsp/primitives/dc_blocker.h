// ==============================================================================
// Layer 1: DSP Primitive - DC Blocker
// ==============================================================================
// First-order DC blocking filter with a retunable pole.
//
//   - ~3 ops/sample
//   - Rolloff: -6dB/octave below the cutoff
//   - Time constant: tau = 1 / (2*pi*cutoff)
//
// The voice pipeline retunes the pole per note: a lower cutoff for bass
// fundamentals (more aggressive averaging, so the pole does not eat the
// fundamental) and the standard cutoff for mid/high notes.
//
// Dependencies:
//   - Layer 0: db_utils.h (flushDenormal), math_constants.h (kTwoPi)
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Acordes {
namespace DSP {

/// Standard DC blocker cutoff for mid/high fundamentals
inline constexpr float kDCBlockerStandardCutoffHz = 20.0f;

/// DC blocker cutoff used for low fundamentals
inline constexpr float kDCBlockerLowCutoffHz = 8.0f;

/// Fundamentals below this use the low cutoff
inline constexpr float kDCBlockerLowNoteThresholdHz = 150.0f;

/// @brief Select the DC blocker cutoff for a given fundamental frequency.
[[nodiscard]] constexpr float dcBlockerCutoffForFundamental(float fundamentalHz) noexcept {
    return (fundamentalHz < kDCBlockerLowNoteThresholdHz) ? kDCBlockerLowCutoffHz
                                                          : kDCBlockerStandardCutoffHz;
}

/// @brief Settling time constant (seconds) of a one-pole highpass at cutoffHz.
[[nodiscard]] inline float dcBlockerTimeConstant(float cutoffHz) noexcept {
    return 1.0f / (kTwoPi * std::max(cutoffHz, 0.1f));
}

/// @brief Lightweight 1st-order DC blocking filter for audio signals.
///
/// Transfer function: H(z) = (1 - z^-1) / (1 - R*z^-1)
/// Difference equation: y[n] = x[n] - x[n-1] + R * y[n-1]
///
/// Trivially copyable, so a voice can snapshot its filter state into a
/// crossfade tail.
///
/// @par Usage Example
/// @code
/// DCBlocker blocker;
/// blocker.prepare(48000.0, 20.0f);
/// float output = blocker.process(input);
/// blocker.processBlock(buffer, numSamples);
/// @endcode
class DCBlocker {
public:
    DCBlocker() noexcept = default;

    /// @brief Configure the filter for processing.
    ///
    /// R = exp(-2*pi*cutoffHz/sampleRate)
    ///
    /// @param sampleRate Sample rate in Hz (clamped to >= 1000)
    /// @param cutoffHz Cutoff frequency in Hz (clamped to [1, sampleRate/4])
    void prepare(double sampleRate, float cutoffHz = kDCBlockerStandardCutoffHz) noexcept {
        sampleRate_ = std::max(sampleRate, 1000.0);
        prepared_ = true;
        setCutoff(cutoffHz);
        reset();
    }

    /// @brief Clear filter state. Coefficient is preserved.
    void reset() noexcept {
        x1_ = 0.0f;
        y1_ = 0.0f;
    }

    /// @brief Change the cutoff without clearing state.
    void setCutoff(float cutoffHz) noexcept {
        if (detail::isNaN(cutoffHz) || detail::isInf(cutoffHz)) return;
        const float maxCutoff = static_cast<float>(sampleRate_) / 4.0f;
        cutoffHz_ = std::clamp(cutoffHz, 1.0f, maxCutoff);
        const float R = std::exp(-kTwoPi * cutoffHz_ / static_cast<float>(sampleRate_));
        R_ = std::clamp(R, 0.9f, 0.9999f);
    }

    /// @brief Process a single sample. Passes input through when unprepared.
    [[nodiscard]] float process(float x) noexcept {
        if (!prepared_) {
            return x;
        }
        if (!detail::isFiniteBits(x)) {
            reset();
            return 0.0f;
        }
        float y = x - x1_ + R_ * y1_;
        y = detail::flushDenormal(y);
        x1_ = x;
        y1_ = y;
        return y;
    }

    void processBlock(float* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    [[nodiscard]] float getCutoff() const noexcept { return cutoffHz_; }
    [[nodiscard]] float getPole() const noexcept { return R_; }

private:
    float R_ = 0.0f;
    float x1_ = 0.0f;
    float y1_ = 0.0f;
    bool prepared_ = false;
    double sampleRate_ = 48000.0;
    float cutoffHz_ = kDCBlockerStandardCutoffHz;
};

} // namespace DSP
} // namespace Acordes
