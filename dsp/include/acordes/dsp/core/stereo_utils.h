// Layer 0: Core Utilities - Stereo Utilities
//
// Pan law helpers shared by the voice pipeline and the effect taps.

#pragma once

#include <acordes/dsp/core/math_constants.h>

#include <cmath>

namespace Acordes {
namespace DSP {

/// @brief Stereo gain pair produced by a pan law.
struct StereoGains {
    float left = kInvSqrt2;
    float right = kInvSqrt2;
};

/// @brief Equal-power pan law.
///
/// Maps pan in [-1, +1] (hard left .. hard right) onto a quarter circle:
///   left  = cos(position * pi/2)
///   right = sin(position * pi/2)
/// with position = (pan + 1) / 2. Centre yields 1/sqrt(2) on both sides,
/// so perceived loudness is constant across the stereo field.
///
/// @note Input is clamped to [-1, 1].
///
/// @par Example
/// @code
/// auto g = equalPowerPan(0.0f);   // g.left == g.right ~= 0.7071
/// auto h = equalPowerPan(-1.0f);  // h.left == 1, h.right == 0
/// @endcode
[[nodiscard]] inline StereoGains equalPowerPan(float pan) noexcept {
    const float clamped = (pan < -1.0f) ? -1.0f : ((pan > 1.0f) ? 1.0f : pan);
    const float position = (clamped + 1.0f) * 0.5f;
    return {std::cos(position * kHalfPi), std::sin(position * kHalfPi)};
}

} // namespace DSP
} // namespace Acordes
