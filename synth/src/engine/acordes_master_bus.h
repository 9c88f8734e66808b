// ==============================================================================
// Acordes Engine - Master Bus
// ==============================================================================
// Post-mix stereo chain, fixed order:
//   Voice Sum -> Chorus -> Delay -> Gate (anti-click ramp / mute)
//   -> Soft Clip -> Master Volume -> NaN/Inf flush -> Output
//
// The gate ramps linearly over kGateRampSamples whenever it opens or
// closes, so muting, backend recovery and the first note after a mute never
// step the output. Master volume changes ramp across one buffer.
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/core/sigmoid.h>
#include <acordes/dsp/effects/chorus.h>
#include <acordes/dsp/effects/feedback_delay.h>

#include <algorithm>
#include <cstddef>

namespace Acordes::DSP {

/// Length of the output gate fade.
inline constexpr size_t kGateRampSamples = 64;

class AcordesMasterBus {
public:
    /// @note Allocates the effect delay lines.
    void prepare(double sampleRate) noexcept {
        chorus_.prepare(sampleRate);
        delay_.prepare(sampleRate);
        reset();
    }

    void reset() noexcept {
        chorus_.reset();
        delay_.reset();
        gateOpen_ = true;
        gateGain_ = 1.0f;
        flushOnClose_ = false;
        volume_ = targetVolume_;
    }

    // =========================================================================
    // Effects
    // =========================================================================

    void setChorus(float rateHz, float depth, float mix, int voices) noexcept {
        chorus_.setRate(rateHz);
        chorus_.setDepth(depth);
        chorus_.setMix(mix);
        chorus_.setVoices(voices);
    }

    void setDelay(float seconds, float feedback, float mix) noexcept {
        delay_.setDelayTime(seconds);
        delay_.setFeedback(feedback);
        delay_.setMix(mix);
    }

    /// @brief Clear chorus and delay lines so no echo outlives a stop.
    void flushEffects() noexcept {
        chorus_.reset();
        delay_.reset();
    }

    // =========================================================================
    // Gate and volume
    // =========================================================================

    /// @brief Ramp back to unity. Cancels a flush requested by a close whose
    /// ramp has not reached zero yet.
    void openGate() noexcept {
        gateOpen_ = true;
        flushOnClose_ = false;
    }

    /// @brief Ramp the output to silence. With flushWhenClosed the effect
    /// lines are cleared once the ramp reaches zero.
    void closeGate(bool flushWhenClosed) noexcept {
        gateOpen_ = false;
        flushOnClose_ = flushOnClose_ || flushWhenClosed;
    }

    void setMasterVolume(float volume) noexcept {
        if (!detail::isFiniteBits(volume)) return;
        targetVolume_ = std::clamp(volume, 0.0f, 1.0f);
    }

    [[nodiscard]] bool isGateOpen() const noexcept { return gateOpen_; }
    [[nodiscard]] float getGateGain() const noexcept { return gateGain_; }
    [[nodiscard]] float getMasterVolume() const noexcept { return volume_; }
    [[nodiscard]] const Chorus& chorus() const noexcept { return chorus_; }
    [[nodiscard]] const FeedbackDelay& delay() const noexcept { return delay_; }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Run the chain over the mixed stereo buffer in place.
    /// @param gateForcedClosed Close the gate for this buffer regardless of
    ///        its own state (backend disconnected)
    void process(float* left, float* right, size_t numSamples,
                 bool gateForcedClosed = false) noexcept {
        chorus_.processBlock(left, right, numSamples);
        delay_.processBlock(left, right, numSamples);

        const float gateTarget = (gateOpen_ && !gateForcedClosed) ? 1.0f : 0.0f;
        constexpr float kGateStep = 1.0f / static_cast<float>(kGateRampSamples);

        const float volumeStart = volume_;
        const float volumeStep = (numSamples > 0)
            ? (targetVolume_ - volumeStart) / static_cast<float>(numSamples)
            : 0.0f;

        for (size_t i = 0; i < numSamples; ++i) {
            if (gateGain_ < gateTarget) {
                gateGain_ = std::min(gateTarget, gateGain_ + kGateStep);
            } else if (gateGain_ > gateTarget) {
                gateGain_ = std::max(gateTarget, gateGain_ - kGateStep);
            }

            const float volume = volumeStart + volumeStep * static_cast<float>(i + 1);
            left[i] = flush(Sigmoid::tanh(left[i] * gateGain_) * volume);
            right[i] = flush(Sigmoid::tanh(right[i] * gateGain_) * volume);
        }
        volume_ = targetVolume_;

        if (flushOnClose_ && gateGain_ <= 0.0f) {
            flushEffects();
            flushOnClose_ = false;
        }
    }

private:
    [[nodiscard]] static float flush(float x) noexcept {
        return detail::isFiniteBits(x) ? x : 0.0f;
    }

    Chorus chorus_;
    FeedbackDelay delay_;
    float gateGain_ = 1.0f;
    float volume_ = 0.75f;
    float targetVolume_ = 0.75f;
    bool gateOpen_ = true;
    bool flushOnClose_ = false;
};

} // namespace Acordes::DSP
