// ==============================================================================
// Layer 1: DSP Primitive - Biquad Filter
// ==============================================================================
// Transposed Direct Form II biquad filter for audio signal processing.
// Supports the lowpass and highpass responses used by the voice filter.
//
// Formulas: Robert Bristow-Johnson's Audio EQ Cookbook
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/core/math_constants.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Acordes {
namespace DSP {

// =============================================================================
// Constants
// =============================================================================

/// Minimum filter frequency in Hz
inline constexpr float kMinFilterFrequency = 1.0f;

/// Minimum Q value (very wide bandwidth)
inline constexpr float kMinQ = 0.1f;

/// Maximum Q value (near self-oscillation)
inline constexpr float kMaxQ = 30.0f;

/// Butterworth Q (maximally flat passband)
inline constexpr float kButterworthQ = 0.7071067811865476f;

/// @brief Supported filter response types.
enum class FilterType : uint8_t {
    Lowpass,      ///< 12 dB/oct lowpass, -3dB at cutoff for Butterworth Q
    Highpass      ///< 12 dB/oct highpass, -3dB at cutoff for Butterworth Q
};

/// @brief Normalized biquad filter coefficients (a0 = 1 implied).
struct BiquadCoefficients {
    float b0 = 1.0f;
    float b1 = 0.0f;
    float b2 = 0.0f;
    float a1 = 0.0f;
    float a2 = 0.0f;

    /// Calculate coefficients for given parameters
    /// @param type Filter response type
    /// @param frequency Cutoff frequency in Hz (clamped below Nyquist)
    /// @param Q Quality factor (clamped to [kMinQ, kMaxQ])
    /// @param sampleRate Sample rate in Hz
    [[nodiscard]] static BiquadCoefficients calculate(
        FilterType type,
        float frequency,
        float Q,
        float sampleRate
    ) noexcept {
        if (sampleRate <= 0.0f) {
            return BiquadCoefficients{};
        }

        const float maxFrequency = sampleRate * 0.495f;
        frequency = std::clamp(frequency, kMinFilterFrequency, maxFrequency);
        Q = std::clamp(Q, kMinQ, kMaxQ);

        const float omega = kTwoPi * frequency / sampleRate;
        const float sinOmega = std::sin(omega);
        const float cosOmega = std::cos(omega);
        const float alpha = sinOmega / (2.0f * Q);

        float b0 = 0.0f, b1 = 0.0f, b2 = 0.0f;
        switch (type) {
            case FilterType::Lowpass:
                b0 = (1.0f - cosOmega) / 2.0f;
                b1 = 1.0f - cosOmega;
                b2 = b0;
                break;
            case FilterType::Highpass:
                b0 = (1.0f + cosOmega) / 2.0f;
                b1 = -(1.0f + cosOmega);
                b2 = b0;
                break;
        }
        const float a0 = 1.0f + alpha;
        const float a1 = -2.0f * cosOmega;
        const float a2 = 1.0f - alpha;

        BiquadCoefficients result;
        result.b0 = b0 / a0;
        result.b1 = b1 / a0;
        result.b2 = b2 / a0;
        result.a1 = a1 / a0;
        result.a2 = a2 / a0;
        return result;
    }

    /// Check if coefficients represent a stable filter (Jury criterion)
    [[nodiscard]] bool isStable() const noexcept {
        constexpr float epsilon = 1e-6f;
        return std::abs(a2) < 1.0f + epsilon &&
               std::abs(a1) < 1.0f + a2 + epsilon;
    }
};

/// @brief Transposed Direct Form II biquad filter.
///
/// @code
/// y[n] = b0*x[n] + z1[n-1]
/// z1[n] = b1*x[n] - a1*y[n] + z2[n-1]
/// z2[n] = b2*x[n] - a2*y[n]
/// @endcode
class Biquad {
public:
    Biquad() noexcept = default;

    void setCoefficients(const BiquadCoefficients& coeffs) noexcept {
        coeffs_ = coeffs;
    }

    /// Configure for specific filter type (calculates coefficients)
    void configure(FilterType type, float frequency, float Q, float sampleRate) noexcept {
        coeffs_ = BiquadCoefficients::calculate(type, frequency, Q, sampleRate);
    }

    [[nodiscard]] const BiquadCoefficients& coefficients() const noexcept {
        return coeffs_;
    }

    /// Process single sample using TDF2
    [[nodiscard]] float process(float input) noexcept {
        if (!detail::isFiniteBits(input)) {
            reset();
            return 0.0f;
        }

        const float output = coeffs_.b0 * input + z1_;
        z1_ = coeffs_.b1 * input - coeffs_.a1 * output + z2_;
        z2_ = coeffs_.b2 * input - coeffs_.a2 * output;

        z1_ = detail::flushDenormal(z1_);
        z2_ = detail::flushDenormal(z2_);

        return output;
    }

    /// Process buffer of samples in-place
    void processBlock(float* buffer, size_t numSamples) noexcept {
        for (size_t i = 0; i < numSamples; ++i) {
            buffer[i] = process(buffer[i]);
        }
    }

    /// Clear filter state (call when restarting to prevent spectral bleed)
    void reset() noexcept {
        z1_ = 0.0f;
        z2_ = 0.0f;
    }

    [[nodiscard]] float getZ1() const noexcept { return z1_; }
    [[nodiscard]] float getZ2() const noexcept { return z2_; }

private:
    BiquadCoefficients coeffs_;
    float z1_ = 0.0f;
    float z2_ = 0.0f;
};

} // namespace DSP
} // namespace Acordes
