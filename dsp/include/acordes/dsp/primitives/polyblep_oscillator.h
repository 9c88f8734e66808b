// ==============================================================================
// Layer 1: DSP Primitive - PolyBLEP Oscillator
// ==============================================================================
// Band-limited audio-rate oscillator using polynomial band-limited step
// (PolyBLEP) correction. Supports sine, square, sawtooth and triangle, plus
// white and pink noise so that every voice waveform comes from one source.
//
// Phase persists across blocks. Only resetPhase() moves it.
//
// Dependencies:
//   - Layer 0: polyblep.h, math_constants.h, db_utils.h, random.h
//   - Layer 1: pink_noise_filter.h
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/core/math_constants.h>
#include <acordes/dsp/core/polyblep.h>
#include <acordes/dsp/core/random.h>
#include <acordes/dsp/primitives/pink_noise_filter.h>

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Acordes {
namespace DSP {

/// @brief Oscillator waveforms. Values are sequential, usable as indices.
enum class OscWaveform : uint8_t {
    Sine = 0,       ///< Pure sine wave (no correction needed)
    Square,         ///< PolyBLEP at both edges
    Sawtooth,       ///< PolyBLEP at the wrap
    Triangle,       ///< Leaky-integrated PolyBLEP square
    WhiteNoise,     ///< Xorshift32, flat spectrum
    PinkNoise       ///< White noise through Paul Kellet's filter
};

inline constexpr size_t kOscWaveformCount = 6;

/// @brief Loudness compensation per waveform.
///
/// Brings the perceived level of each waveform close to the others so that
/// switching waveform does not jump in volume.
[[nodiscard]] constexpr float waveformCompensationGain(OscWaveform waveform) noexcept {
    switch (waveform) {
        case OscWaveform::Sine:       return 1.4f;
        case OscWaveform::Square:     return 0.8f;
        case OscWaveform::Sawtooth:   return 1.7f;
        case OscWaveform::Triangle:   return 1.7f;
        case OscWaveform::WhiteNoise: return 0.7f;
        case OscWaveform::PinkNoise:  return 1.2f;
    }
    return 1.0f;
}

/// @brief Anti-aliased audio-rate oscillator.
///
/// @par Thread Safety
/// Single-threaded model. No internal synchronization.
///
/// @par Usage
/// @code
/// PolyBlepOscillator osc;
/// osc.prepare(48000.0);
/// osc.setFrequency(440.0f);
/// osc.setWaveform(OscWaveform::Sawtooth);
/// osc.processBlock(buffer, numSamples);
/// @endcode
class PolyBlepOscillator {
public:
    explicit PolyBlepOscillator(uint32_t noiseSeed = 1) noexcept
        : rng_(noiseSeed) {}

    /// @brief Initialize for the given sample rate. Resets all state.
    inline void prepare(double sampleRate) noexcept {
        sampleRate_ = static_cast<float>(sampleRate);
        phase_ = 0.0;
        integrator_ = 0.0f;
        pink_.reset();
        updatePhaseIncrement();
    }

    /// @brief Reset phase, integrator and noise colouring.
    /// Preserves frequency, waveform and sample rate.
    inline void reset() noexcept {
        phase_ = 0.0;
        integrator_ = 0.0f;
        pink_.reset();
    }

    /// @brief Set the frequency in Hz, clamped to [0, sampleRate/2).
    inline void setFrequency(float hz) noexcept {
        if (detail::isNaN(hz) || detail::isInf(hz)) {
            hz = 0.0f;
        }
        const float nyquist = sampleRate_ * 0.5f;
        frequency_ = (hz < 0.0f) ? 0.0f : ((hz >= nyquist) ? (nyquist - 0.001f) : hz);
        updatePhaseIncrement();
    }

    /// @brief Select the waveform. Phase is kept for continuity; the
    /// triangle integrator is cleared when entering or leaving Triangle.
    inline void setWaveform(OscWaveform waveform) noexcept {
        if (waveform_ == OscWaveform::Triangle || waveform == OscWaveform::Triangle) {
            integrator_ = 0.0f;
        }
        waveform_ = waveform;
    }

    /// @brief Generate one sample, nominally in [-1, 1].
    [[nodiscard]] inline float process() noexcept {
        const float t = static_cast<float>(phase_);
        float output = 0.0f;

        switch (waveform_) {
            case OscWaveform::Sine:
                output = std::sin(kTwoPi * t);
                break;

            case OscWaveform::Sawtooth:
                output = 2.0f * t - 1.0f;
                output -= polyBlep(t, dt_);
                break;

            case OscWaveform::Square:
                output = squareSample(t);
                break;

            case OscWaveform::Triangle: {
                // Integrate the band-limited square; leak keeps DC bounded
                const float square = squareSample(t);
                float leak = 1.0f - 4.0f * dt_;
                leak = (leak < 0.0f) ? 0.0f : leak;
                constexpr float kAntiDenormal = 1e-18f;
                integrator_ = leak * integrator_ + 4.0f * dt_ * square + kAntiDenormal;
                output = integrator_;
                break;
            }

            case OscWaveform::WhiteNoise:
                output = rng_.nextFloat();
                break;

            case OscWaveform::PinkNoise:
                output = pink_.process(rng_.nextFloat());
                break;
        }

        phase_ += static_cast<double>(dt_);
        if (phase_ >= 1.0) {
            phase_ -= 1.0;
        }

        return sanitize(output);
    }

    inline void processBlock(float* output, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            output[i] = process();
        }
    }

    /// @brief Current phase in [0, 1).
    [[nodiscard]] inline double phase() const noexcept { return phase_; }

    /// @brief Force the phase to a position, wrapped into [0, 1).
    inline void resetPhase(double newPhase = 0.0) noexcept {
        phase_ = newPhase - std::floor(newPhase);
    }

    [[nodiscard]] inline float getFrequency() const noexcept { return frequency_; }
    [[nodiscard]] inline OscWaveform getWaveform() const noexcept { return waveform_; }

private:
    [[nodiscard]] inline float squareSample(float t) const noexcept {
        float square = (t < 0.5f) ? 1.0f : -1.0f;
        square += polyBlep(t, dt_);
        float tHalf = t + 0.5f;
        if (tHalf >= 1.0f) tHalf -= 1.0f;
        square -= polyBlep(tHalf, dt_);
        return square;
    }

    inline void updatePhaseIncrement() noexcept {
        dt_ = (sampleRate_ > 0.0f) ? (frequency_ / sampleRate_) : 0.0f;
    }

    /// NaN -> 0, clamp to [-2, 2].
    [[nodiscard]] static inline float sanitize(float x) noexcept {
        x = detail::isNaN(x) ? 0.0f : x;
        x = (x < -2.0f) ? -2.0f : x;
        x = (x > 2.0f) ? 2.0f : x;
        return x;
    }

    double phase_ = 0.0;
    float dt_ = 0.0f;
    float sampleRate_ = 48000.0f;
    float frequency_ = 440.0f;
    float integrator_ = 0.0f;
    OscWaveform waveform_ = OscWaveform::Sine;
    Xorshift32 rng_;
    PinkNoiseFilter pink_;
};

} // namespace DSP
} // namespace Acordes
