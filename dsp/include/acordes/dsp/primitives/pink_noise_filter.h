// ==============================================================================
// Layer 1: DSP Primitive - Pink Noise Filter
// ==============================================================================
// Paul Kellet's filter for converting white noise to pink noise
// (-3dB/octave). Accuracy +/- 0.05dB from 9.2Hz to Nyquist at 44.1kHz.
//
// Reference: https://www.firstpr.com.au/dsp/pink-noise/
// ==============================================================================

#pragma once

namespace Acordes {
namespace DSP {

/// @brief Paul Kellet's 7-state pink noise filter.
///
/// @code
/// PinkNoiseFilter filter;
/// Xorshift32 rng(12345);
/// float pink = filter.process(rng.nextFloat());
/// @endcode
class PinkNoiseFilter {
public:
    /// @brief Process one white noise sample.
    /// @return Pink noise sample bounded to [-1, 1]
    [[nodiscard]] float process(float white) noexcept {
        b0_ = 0.99886f * b0_ + white * 0.0555179f;
        b1_ = 0.99332f * b1_ + white * 0.0750759f;
        b2_ = 0.96900f * b2_ + white * 0.1538520f;
        b3_ = 0.86650f * b3_ + white * 0.3104856f;
        b4_ = 0.55000f * b4_ + white * 0.5329522f;
        b5_ = -0.7616f * b5_ - white * 0.0168980f;
        const float pink = b0_ + b1_ + b2_ + b3_ + b4_ + b5_ + b6_ + white * 0.5362f;
        b6_ = white * 0.115926f;

        // Filter peak gain is ~5, so 0.2 keeps the output in range
        const float normalized = pink * 0.2f;
        return (normalized > 1.0f) ? 1.0f : ((normalized < -1.0f) ? -1.0f : normalized);
    }

    void reset() noexcept {
        b0_ = b1_ = b2_ = b3_ = b4_ = b5_ = b6_ = 0.0f;
    }

private:
    float b0_ = 0.0f;
    float b1_ = 0.0f;
    float b2_ = 0.0f;
    float b3_ = 0.0f;
    float b4_ = 0.0f;
    float b5_ = 0.0f;
    float b6_ = 0.0f;
};

} // namespace DSP
} // namespace Acordes
