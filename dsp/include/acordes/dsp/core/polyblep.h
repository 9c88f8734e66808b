// ==============================================================================
// Layer 0: Core Utility - PolyBLEP Correction
// ==============================================================================
// Polynomial band-limited step (BLEP) correction for anti-aliased waveform
// generation. Pure mathematical function with no state.
//
// Usage:
//   float saw = 2.0f * t - 1.0f;   // naive sawtooth
//   saw -= polyBlep(t, dt);        // subtract BLEP correction at wrap
//
// Precondition: 0 < dt < 0.5 (below Nyquist).
//
// Reference: Valimaki & Pekonen, "Perceptually informed synthesis of
// bandlimited classical waveforms using integrated polynomial
// interpolation" (2012)
// ==============================================================================

#pragma once

namespace Acordes {
namespace DSP {

/// @brief 2-point polynomial band-limited step correction.
///
/// @param t Normalized phase position [0, 1)
/// @param dt Normalized phase increment (frequency / sampleRate)
/// @return Correction for a unit-2 step (-1 -> +1) to subtract from naive
///         output. Returns 0.0f outside [0, dt) and (1-dt, 1).
[[nodiscard]] constexpr float polyBlep(float t, float dt) noexcept {
    if (dt <= 0.0f) {
        return 0.0f;
    }
    // Just past the discontinuity
    if (t < dt) {
        const float x = t / dt;
        return x + x - x * x - 1.0f;
    }
    // Approaching the discontinuity
    if (t > 1.0f - dt) {
        const float x = (t - 1.0f) / dt;
        return x * x + x + x + 1.0f;
    }
    return 0.0f;
}

} // namespace DSP
} // namespace Acordes
