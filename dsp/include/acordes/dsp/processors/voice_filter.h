// ==============================================================================
// Layer 2: DSP Processor - Voice Filter
// ==============================================================================
// Two cascaded biquad stages per voice: a high-pass stage followed by a
// resonant low-pass stage. Resonance is a normalized 0..0.95 control mapped
// onto Q; the cap keeps the low-pass clear of self-oscillation.
//
// State persists across blocks; reset() is called on voice steal only.
//
// Dependencies:
//   - Layer 1: biquad.h
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/primitives/biquad.h>

#include <algorithm>
#include <cstddef>

namespace Acordes {
namespace DSP {

inline constexpr float kMinCutoffHz = 20.0f;
inline constexpr float kMaxCutoffHz = 20000.0f;
inline constexpr float kMaxResonance = 0.95f;
inline constexpr float kMaxResonanceQ = 12.0f;

/// High-pass cutoffs below this disable the high-pass stage.
inline constexpr float kHighPassOffBelowHz = 20.0f;
inline constexpr float kMaxHighPassHz = 5000.0f;

/// @brief Map normalized resonance [0, 0.95] onto a biquad Q.
///
/// Q = 0.707 + r^2 * (12 - 0.707). Squared so that the lower half of the
/// control stays gentle.
[[nodiscard]] inline float resonanceToQ(float resonance) noexcept {
    const float r = std::clamp(resonance, 0.0f, kMaxResonance);
    return kButterworthQ + r * r * (kMaxResonanceQ - kButterworthQ);
}

/// @brief High-pass then low-pass voice filter.
class VoiceFilter {
public:
    void prepare(double sampleRate) noexcept {
        sampleRate_ = static_cast<float>(sampleRate);
        updateCoefficients();
        reset();
    }

    void reset() noexcept {
        highPass_.reset();
        lowPass_.reset();
    }

    /// @brief Set all filter settings at once; coefficients recomputed only
    /// when something changed.
    /// @param cutoffHz Low-pass cutoff, clamped to [20, 20000]
    /// @param resonance Normalized resonance, clamped to [0, 0.95]
    /// @param highPassHz High-pass cutoff; below 20 Hz the stage is bypassed
    void setParameters(float cutoffHz, float resonance, float highPassHz) noexcept {
        if (!detail::isFiniteBits(cutoffHz) || !detail::isFiniteBits(resonance) ||
            !detail::isFiniteBits(highPassHz)) {
            return;
        }
        cutoffHz = std::clamp(cutoffHz, kMinCutoffHz, kMaxCutoffHz);
        resonance = std::clamp(resonance, 0.0f, kMaxResonance);
        highPassHz = std::clamp(highPassHz, 0.0f, kMaxHighPassHz);
        if (cutoffHz == cutoffHz_ && resonance == resonance_ && highPassHz == highPassHz_) {
            return;
        }
        cutoffHz_ = cutoffHz;
        resonance_ = resonance;
        highPassHz_ = highPassHz;
        updateCoefficients();
    }

    void processBlock(float* buffer, size_t numSamples) noexcept {
        if (highPassEnabled()) {
            highPass_.processBlock(buffer, numSamples);
        }
        lowPass_.processBlock(buffer, numSamples);
    }

    [[nodiscard]] float getCutoff() const noexcept { return cutoffHz_; }
    [[nodiscard]] float getResonance() const noexcept { return resonance_; }
    [[nodiscard]] float getHighPassCutoff() const noexcept { return highPassHz_; }
    [[nodiscard]] bool highPassEnabled() const noexcept { return highPassHz_ >= kHighPassOffBelowHz; }
    [[nodiscard]] const Biquad& lowPassStage() const noexcept { return lowPass_; }

private:
    void updateCoefficients() noexcept {
        lowPass_.configure(FilterType::Lowpass, cutoffHz_, resonanceToQ(resonance_), sampleRate_);
        if (highPassEnabled()) {
            highPass_.configure(FilterType::Highpass, highPassHz_, kButterworthQ, sampleRate_);
        }
    }

    Biquad highPass_;
    Biquad lowPass_;
    float sampleRate_ = 48000.0f;
    float cutoffHz_ = 2000.0f;
    float resonance_ = 0.3f;
    float highPassHz_ = 0.0f;
};

} // namespace DSP
} // namespace Acordes
