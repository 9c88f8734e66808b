// ==============================================================================
// Layer 1: DSP Primitive - ADSR Envelope Generator
// ==============================================================================
// Five-state linear ADSR envelope driven by elapsed time.
//
// The envelope is rendered a whole block at a time: each call walks the
// block in contiguous segments (one per stage touched) and fills every
// segment with a closed-form ramp start + slope * elapsed. There is no
// per-sample stage branching, and the level at any sample is a function of
// the elapsed time in the stage, so block size has no effect on the curve.
//
// Retrigger starts the attack from the current level. Release always
// decays from the level the envelope had when the gate closed.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <acordes/dsp/core/db_utils.h>

namespace Acordes {
namespace DSP {

// =============================================================================
// Compiler Compatibility Macros
// =============================================================================

#ifndef ACORDES_NOINLINE
#if defined(_MSC_VER)
#define ACORDES_NOINLINE __declspec(noinline)
#elif defined(__GNUC__) || defined(__clang__)
#define ACORDES_NOINLINE __attribute__((noinline))
#else
#define ACORDES_NOINLINE
#endif
#endif

// =============================================================================
// Constants
// =============================================================================

inline constexpr float kEnvelopeIdleThreshold = 1e-4f;
inline constexpr float kMinEnvelopeTimeSeconds = 0.001f;
inline constexpr float kMaxEnvelopeTimeSeconds = 5.0f;

// =============================================================================
// Enumerations
// =============================================================================

enum class ADSRStage : uint8_t {
    Idle = 0,
    Attack,
    Decay,
    Sustain,
    Release
};

// =============================================================================
// ADSREnvelope Class
// =============================================================================

class ADSREnvelope {
public:
    ADSREnvelope() noexcept = default;

    // =========================================================================
    // Initialization
    // =========================================================================

    void prepare(double sampleRate) noexcept {
        if (sampleRate <= 0.0) return;
        sampleRate_ = sampleRate;
        recalcStageLengths();
    }

    void reset() noexcept {
        output_ = 0.0f;
        stage_ = ADSRStage::Idle;
        stagePos_ = 0;
        segmentStart_ = 0.0f;
    }

    // =========================================================================
    // Gate Control
    // =========================================================================

    /// @brief Open the gate at the given peak level.
    ///
    /// Starts the attack from the current output, so a retrigger never passes
    /// through zero. If the envelope is already at or above the new peak the
    /// attack is skipped and the decay starts from the current level.
    void gateOn(float peakLevel) noexcept {
        if (detail::isNaN(peakLevel)) return;
        peakLevel_ = std::clamp(peakLevel, 0.0f, 1.0f);
        segmentStart_ = output_;
        stagePos_ = 0;
        stage_ = (output_ >= peakLevel_) ? ADSRStage::Decay : ADSRStage::Attack;
    }

    /// @brief Close the gate. Release ramps from the current level to zero.
    void gateOff() noexcept {
        if (stage_ == ADSRStage::Idle || stage_ == ADSRStage::Release) {
            return;
        }
        segmentStart_ = output_;
        stagePos_ = 0;
        stage_ = ADSRStage::Release;
    }

    // =========================================================================
    // Parameter Setters (seconds / normalized level)
    // =========================================================================

    ACORDES_NOINLINE void setAttack(float seconds) noexcept {
        if (detail::isNaN(seconds)) return;
        attackSeconds_ = std::clamp(seconds, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds);
        recalcStageLengths();
    }

    ACORDES_NOINLINE void setDecay(float seconds) noexcept {
        if (detail::isNaN(seconds)) return;
        decaySeconds_ = std::clamp(seconds, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds);
        recalcStageLengths();
    }

    ACORDES_NOINLINE void setSustain(float level) noexcept {
        if (detail::isNaN(level)) return;
        sustainLevel_ = std::clamp(level, 0.0f, 1.0f);
    }

    ACORDES_NOINLINE void setRelease(float seconds) noexcept {
        if (detail::isNaN(seconds)) return;
        releaseSeconds_ = std::clamp(seconds, kMinEnvelopeTimeSeconds, kMaxEnvelopeTimeSeconds);
        recalcStageLengths();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Render numSamples of envelope into output.
    void processBlock(float* output, size_t numSamples) noexcept {
        size_t i = 0;
        while (i < numSamples) {
            const size_t remaining = numSamples - i;
            switch (stage_) {
                case ADSRStage::Idle:
                    std::fill(output + i, output + numSamples, 0.0f);
                    output_ = 0.0f;
                    i = numSamples;
                    break;

                case ADSRStage::Attack:
                    i += fillRamp(output + i, remaining, attackSamples_, peakLevel_);
                    if (stagePos_ >= attackSamples_) {
                        output_ = peakLevel_;
                        segmentStart_ = peakLevel_;
                        stagePos_ = 0;
                        stage_ = ADSRStage::Decay;
                    }
                    break;

                case ADSRStage::Decay:
                    i += fillRamp(output + i, remaining, decaySamples_, sustainTarget());
                    if (stagePos_ >= decaySamples_) {
                        output_ = sustainTarget();
                        stagePos_ = 0;
                        stage_ = ADSRStage::Sustain;
                    }
                    break;

                case ADSRStage::Sustain:
                    output_ = sustainTarget();
                    std::fill(output + i, output + numSamples, output_);
                    i = numSamples;
                    break;

                case ADSRStage::Release:
                    i += fillRamp(output + i, remaining, releaseSamples_, 0.0f);
                    if (stagePos_ >= releaseSamples_ || output_ < kEnvelopeIdleThreshold) {
                        // Remaining samples of this segment already ramped to ~0
                        output_ = 0.0f;
                        stagePos_ = 0;
                        stage_ = ADSRStage::Idle;
                    }
                    break;
            }
        }
    }

    // =========================================================================
    // State Queries
    // =========================================================================

    [[nodiscard]] ADSRStage getStage() const noexcept { return stage_; }
    [[nodiscard]] bool isActive() const noexcept { return stage_ != ADSRStage::Idle; }
    [[nodiscard]] bool isReleasing() const noexcept { return stage_ == ADSRStage::Release; }
    [[nodiscard]] float getOutput() const noexcept { return output_; }
    [[nodiscard]] float getPeakLevel() const noexcept { return peakLevel_; }

    /// @brief Samples elapsed since the current stage began.
    [[nodiscard]] size_t getStageElapsedSamples() const noexcept { return stagePos_; }

    [[nodiscard]] size_t getReleaseSamples() const noexcept { return releaseSamples_; }

private:
    [[nodiscard]] float sustainTarget() const noexcept {
        return sustainLevel_ * peakLevel_;
    }

    /// Fill up to `count` samples of a linear segment from segmentStart_ to
    /// `target` lasting `length` samples, starting at stagePos_.
    /// @return number of samples written
    size_t fillRamp(float* out, size_t count, size_t length, float target) noexcept {
        const size_t left = (stagePos_ < length) ? (length - stagePos_) : 0;
        const size_t n = std::min(count, left);
        const float slope = (target - segmentStart_) / static_cast<float>(length);
        for (size_t k = 0; k < n; ++k) {
            out[k] = segmentStart_ + slope * static_cast<float>(stagePos_ + k + 1);
        }
        stagePos_ += n;
        if (n > 0) {
            output_ = out[n - 1];
        }
        return n;
    }

    static size_t secondsToSamples(float seconds, double sampleRate) noexcept {
        const double samples = std::round(static_cast<double>(seconds) * sampleRate);
        return std::max<size_t>(1, static_cast<size_t>(samples));
    }

    void recalcStageLengths() noexcept {
        attackSamples_ = secondsToSamples(attackSeconds_, sampleRate_);
        decaySamples_ = secondsToSamples(decaySeconds_, sampleRate_);
        releaseSamples_ = secondsToSamples(releaseSeconds_, sampleRate_);
        // A shortened stage must not strand the position beyond its end
        if (stage_ == ADSRStage::Attack) stagePos_ = std::min(stagePos_, attackSamples_);
        if (stage_ == ADSRStage::Decay) stagePos_ = std::min(stagePos_, decaySamples_);
        if (stage_ == ADSRStage::Release) stagePos_ = std::min(stagePos_, releaseSamples_);
    }

    double sampleRate_ = 48000.0;

    float attackSeconds_ = 0.01f;
    float decaySeconds_ = 0.2f;
    float sustainLevel_ = 0.7f;
    float releaseSeconds_ = 0.05f;

    size_t attackSamples_ = 480;
    size_t decaySamples_ = 9600;
    size_t releaseSamples_ = 2400;

    float peakLevel_ = 1.0f;
    float segmentStart_ = 0.0f;
    float output_ = 0.0f;
    size_t stagePos_ = 0;
    ADSRStage stage_ = ADSRStage::Idle;
};

} // namespace DSP
} // namespace Acordes
