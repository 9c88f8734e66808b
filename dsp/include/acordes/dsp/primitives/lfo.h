// ==============================================================================
// Layer 1: DSP Primitive - Control-Rate LFO
// ==============================================================================
// Low Frequency Oscillator evaluated once per audio block.
//
// The phase accumulator lives in radians and advances by
// 2*pi*rate*blockSize/sampleRate per tick, wrapped into [0, 2*pi). The
// effective rate is limited so that one tick never advances more than pi;
// that keeps "new phase < previous phase" an exact wrap detector, which the
// sample-and-hold shape relies on.
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/core/math_constants.h>
#include <acordes/dsp/core/random.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Acordes {
namespace DSP {

/// @brief Available LFO waveform shapes.
enum class Waveform : uint8_t {
    Sine = 0,       ///< sin(phase)
    Triangle,       ///< Symmetric ramp, -1 at phase 0, +1 at phase pi
    Square,         ///< +1 below pi, -1 from pi
    SampleHold      ///< New random value each time the phase wraps
};

inline constexpr float kMinLFORateHz = 0.05f;
inline constexpr float kMaxLFORateHz = 20.0f;

/// @brief Block-rate LFO with selectable waveform.
///
/// @code
/// LFO lfo;
/// lfo.prepare(48000.0);
/// lfo.setWaveform(Waveform::Triangle);
/// lfo.setFrequency(2.0f);
/// float value = lfo.tick(1024);   // once per render block
/// @endcode
class LFO {
public:
    explicit LFO(uint32_t seed = 0x5EED1F0u) noexcept
        : rng_(seed) {}

    void prepare(double sampleRate) noexcept {
        sampleRate_ = (sampleRate > 0.0) ? sampleRate : 48000.0;
        reset();
    }

    /// @brief Reset phase to 0 and draw a fresh sample-and-hold value.
    void reset() noexcept {
        phase_ = 0.0;
        holdValue_ = rng_.nextFloat();
        value_ = evaluate(phase_);
    }

    void setWaveform(Waveform waveform) noexcept { waveform_ = waveform; }

    /// @brief Set rate in Hz, clamped to [kMinLFORateHz, kMaxLFORateHz].
    void setFrequency(float hz) noexcept {
        if (detail::isNaN(hz) || detail::isInf(hz)) return;
        frequency_ = std::clamp(hz, kMinLFORateHz, kMaxLFORateHz);
    }

    /// @brief Advance the phase by one block and return the new control value.
    /// @param numSamples Length of the block this tick stands for
    [[nodiscard]] float tick(size_t numSamples) noexcept {
        const double previous = phase_;
        phase_ += phaseIncrement(numSamples);
        if (phase_ >= kTwoPiD) {
            phase_ -= kTwoPiD;
        }
        if (phase_ < previous) {
            holdValue_ = rng_.nextFloat();
        }
        value_ = evaluate(phase_);
        return value_;
    }

    /// @brief Phase increment (radians) one tick of numSamples would apply.
    ///
    /// Limited to strictly less than pi; very long blocks slow the LFO
    /// instead of making the wrap ambiguous.
    [[nodiscard]] double phaseIncrement(size_t numSamples) const noexcept {
        const double increment = kTwoPiD * static_cast<double>(frequency_) *
                                 static_cast<double>(numSamples) / sampleRate_;
        constexpr double kMaxIncrement = 0.99 * (kTwoPiD * 0.5);
        return std::min(increment, kMaxIncrement);
    }

    [[nodiscard]] float getValue() const noexcept { return value_; }
    [[nodiscard]] double getPhase() const noexcept { return phase_; }
    [[nodiscard]] float getFrequency() const noexcept { return frequency_; }
    [[nodiscard]] Waveform getWaveform() const noexcept { return waveform_; }

private:
    [[nodiscard]] float evaluate(double phase) const noexcept {
        switch (waveform_) {
            case Waveform::Sine:
                return static_cast<float>(std::sin(phase));
            case Waveform::Triangle: {
                const double t = phase / kTwoPiD;
                return static_cast<float>((t < 0.5) ? (4.0 * t - 1.0) : (3.0 - 4.0 * t));
            }
            case Waveform::Square:
                return (phase < kTwoPiD * 0.5) ? 1.0f : -1.0f;
            case Waveform::SampleHold:
                return holdValue_;
        }
        return 0.0f;
    }

    Xorshift32 rng_;
    double sampleRate_ = 48000.0;
    double phase_ = 0.0;
    float frequency_ = 2.0f;
    float holdValue_ = 0.0f;
    float value_ = 0.0f;
    Waveform waveform_ = Waveform::Sine;
};

} // namespace DSP
} // namespace Acordes
