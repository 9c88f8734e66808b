// ==============================================================================
// Layer 4: User Feature - Feedback Delay
// ==============================================================================
// Stereo feedback echo on the master bus. One delay line per channel:
//   wet   = line.read(delayTime)
//   line <- dry + feedback * wet
//   out   = (1 - mix) * dry + mix * wet
//
// Feedback is capped at 0.95 so the loop always decays. Delay time changes
// glide through a one-pole smoother and a fractional read, so moving the
// time control does not click. mix == 0 bypasses the stage entirely.
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/primitives/delay_line.h>

#include <algorithm>
#include <cmath>
#include <cstddef>

namespace Acordes {
namespace DSP {

inline constexpr float kMinDelayTimeSeconds = 0.01f;
inline constexpr float kMaxDelayTimeSeconds = 2.0f;
inline constexpr float kMaxDelayFeedback = 0.95f;

/// Smoothing time constant for delay time changes.
inline constexpr float kDelayTimeSmoothingMs = 50.0f;

class FeedbackDelay {
public:
    /// @note Allocates two seconds of delay per channel.
    void prepare(double sampleRate) noexcept {
        sampleRate_ = (sampleRate > 0.0) ? sampleRate : 48000.0;
        delayL_.prepare(sampleRate_, kMaxDelayTimeSeconds + 0.01f);
        delayR_.prepare(sampleRate_, kMaxDelayTimeSeconds + 0.01f);
        smoothingCoeff_ = 1.0f - std::exp(-1.0f / (kDelayTimeSmoothingMs * 0.001f *
                                                   static_cast<float>(sampleRate_)));
        reset();
    }

    /// @brief Clear the lines and snap the delay time to its target.
    void reset() noexcept {
        delayL_.reset();
        delayR_.reset();
        currentDelaySamples_ = targetDelaySamples();
        wasBypassed_ = false;
    }

    void setDelayTime(float seconds) noexcept {
        if (!detail::isFiniteBits(seconds)) return;
        delaySeconds_ = std::clamp(seconds, kMinDelayTimeSeconds, kMaxDelayTimeSeconds);
    }

    void setFeedback(float feedback) noexcept {
        if (!detail::isFiniteBits(feedback)) return;
        feedback_ = std::clamp(feedback, 0.0f, kMaxDelayFeedback);
    }

    void setMix(float mix) noexcept {
        if (!detail::isFiniteBits(mix)) return;
        mix_ = std::clamp(mix, 0.0f, 1.0f);
    }

    [[nodiscard]] bool isBypassed() const noexcept { return mix_ <= 0.0f; }

    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        if (isBypassed()) {
            wasBypassed_ = true;
            return;
        }
        if (wasBypassed_) {
            reset();
        }

        const float target = targetDelaySamples();
        const float dryGain = 1.0f - mix_;
        for (size_t i = 0; i < numSamples; ++i) {
            currentDelaySamples_ += smoothingCoeff_ * (target - currentDelaySamples_);

            const float dryL = left[i];
            const float dryR = right[i];
            // The line already holds this sample's predecessor, so the read
            // distance is one less than the delay
            const float wetL = delayL_.readLinear(currentDelaySamples_ - 1.0f);
            const float wetR = delayR_.readLinear(currentDelaySamples_ - 1.0f);

            delayL_.write(detail::flushDenormal(dryL + feedback_ * wetL));
            delayR_.write(detail::flushDenormal(dryR + feedback_ * wetR));

            left[i] = dryGain * dryL + mix_ * wetL;
            right[i] = dryGain * dryR + mix_ * wetR;
        }
    }

    [[nodiscard]] float getFeedback() const noexcept { return feedback_; }
    [[nodiscard]] float getMix() const noexcept { return mix_; }
    [[nodiscard]] float getCurrentDelaySamples() const noexcept { return currentDelaySamples_; }

private:
    [[nodiscard]] float targetDelaySamples() const noexcept {
        return delaySeconds_ * static_cast<float>(sampleRate_);
    }

    DelayLine delayL_;
    DelayLine delayR_;
    double sampleRate_ = 48000.0;
    float smoothingCoeff_ = 0.0f;
    float currentDelaySamples_ = 16800.0f;
    float delaySeconds_ = 0.35f;
    float feedback_ = 0.35f;
    float mix_ = 0.0f;
    bool wasBypassed_ = false;
};

} // namespace DSP
} // namespace Acordes
