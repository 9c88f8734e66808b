// ==============================================================================
// Layer 4: User Feature - Chorus
// ==============================================================================
// Multi-tap modulated-delay chorus on the stereo master bus.
//
// One delay line per channel is written once per sample with the dry mix.
// 1-4 taps read from it, each sweeping its delay with the same sine LFO at an
// evenly spaced phase offset (2*pi / taps). The right channel runs a quarter
// cycle ahead of the left for width. Taps are averaged, then blended:
//   out = (1 - mix) * dry + mix * wet
//
// At mix == 0 the stage is a complete bypass: no reads, no writes. The lines
// are cleared when the stage comes back so no stale audio replays.
//
// Dependencies:
//   - Layer 1: delay_line.h
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/core/math_constants.h>
#include <acordes/dsp/primitives/delay_line.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>

namespace Acordes {
namespace DSP {

inline constexpr float kChorusBaseDelayMs = 12.0f;
inline constexpr float kChorusMaxSweepMs = 6.0f;
inline constexpr float kMinChorusRateHz = 0.05f;
inline constexpr float kMaxChorusRateHz = 5.0f;
inline constexpr int kMinChorusVoices = 1;
inline constexpr int kMaxChorusVoices = 4;

/// @brief Stereo multi-tap chorus.
///
/// @code
/// Chorus chorus;
/// chorus.prepare(48000.0);
/// chorus.setMix(0.5f);
/// chorus.setVoices(4);
/// chorus.processBlock(left, right, numSamples);
/// @endcode
class Chorus {
public:
    /// @note Allocates the delay lines.
    void prepare(double sampleRate) noexcept {
        sampleRate_ = (sampleRate > 0.0) ? sampleRate : 48000.0;
        const float maxSeconds = (kChorusBaseDelayMs + kChorusMaxSweepMs) * 0.001f + 0.002f;
        delayL_.prepare(sampleRate_, maxSeconds);
        delayR_.prepare(sampleRate_, maxSeconds);
        reset();
    }

    void reset() noexcept {
        delayL_.reset();
        delayR_.reset();
        phase_ = 0.0;
        wasBypassed_ = false;
    }

    void setRate(float hz) noexcept {
        if (!detail::isFiniteBits(hz)) return;
        rateHz_ = std::clamp(hz, kMinChorusRateHz, kMaxChorusRateHz);
    }

    void setDepth(float depth) noexcept {
        if (!detail::isFiniteBits(depth)) return;
        depth_ = std::clamp(depth, 0.0f, 1.0f);
    }

    void setMix(float mix) noexcept {
        if (!detail::isFiniteBits(mix)) return;
        mix_ = std::clamp(mix, 0.0f, 1.0f);
    }

    void setVoices(int voices) noexcept {
        voices_ = std::clamp(voices, kMinChorusVoices, kMaxChorusVoices);
    }

    [[nodiscard]] bool isBypassed() const noexcept { return mix_ <= 0.0f; }

    /// @brief Process the stereo bus in place.
    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        if (isBypassed()) {
            wasBypassed_ = true;
            return;
        }
        if (wasBypassed_) {
            delayL_.reset();
            delayR_.reset();
            wasBypassed_ = false;
        }

        const float samplesPerMs = static_cast<float>(sampleRate_) * 0.001f;
        const float baseDelay = kChorusBaseDelayMs * samplesPerMs;
        const float sweep = kChorusMaxSweepMs * depth_ * samplesPerMs;
        const double increment = kTwoPiD * static_cast<double>(rateHz_) / sampleRate_;
        const double tapSpacing = kTwoPiD / static_cast<double>(voices_);
        const float invVoices = 1.0f / static_cast<float>(voices_);
        const float dryGain = 1.0f - mix_;

        std::array<float, kMaxChorusVoices> tapOffsets{};
        for (int t = 0; t < voices_; ++t) {
            tapOffsets[static_cast<size_t>(t)] = static_cast<float>(tapSpacing * t);
        }

        for (size_t i = 0; i < numSamples; ++i) {
            const float dryL = left[i];
            const float dryR = right[i];
            delayL_.write(dryL);
            delayR_.write(dryR);

            const float phase = static_cast<float>(phase_);
            float wetL = 0.0f;
            float wetR = 0.0f;
            for (int t = 0; t < voices_; ++t) {
                const float tapPhase = phase + tapOffsets[static_cast<size_t>(t)];
                wetL += delayL_.readLinear(baseDelay + sweep * std::sin(tapPhase));
                wetR += delayR_.readLinear(baseDelay + sweep * std::sin(tapPhase + kHalfPi));
            }

            left[i] = dryGain * dryL + mix_ * wetL * invVoices;
            right[i] = dryGain * dryR + mix_ * wetR * invVoices;

            phase_ += increment;
            if (phase_ >= kTwoPiD) {
                phase_ -= kTwoPiD;
            }
        }
    }

    [[nodiscard]] int getVoices() const noexcept { return voices_; }
    [[nodiscard]] float getMix() const noexcept { return mix_; }

private:
    DelayLine delayL_;
    DelayLine delayR_;
    double sampleRate_ = 48000.0;
    double phase_ = 0.0;
    float rateHz_ = 0.8f;
    float depth_ = 0.5f;
    float mix_ = 0.0f;
    int voices_ = 2;
    bool wasBypassed_ = false;
};

} // namespace DSP
} // namespace Acordes
