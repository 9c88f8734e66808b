// ==============================================================================
// Layer 0: Core Utility - Math Constants
// ==============================================================================
// Centralized mathematical constants for DSP calculations.
// All DSP components import these constants instead of defining locally.
//
// Constants are inline constexpr so there is a single definition across all
// translation units.
// ==============================================================================

#pragma once

namespace Acordes {
namespace DSP {

/// Pi constant for DSP calculations
inline constexpr float kPi = 3.14159265358979323846f;

/// Two times Pi (full circle in radians)
/// Used for angular frequency calculations: omega = kTwoPi * f / fs
inline constexpr float kTwoPi = 2.0f * kPi;

/// Half Pi (quarter circle in radians)
inline constexpr float kHalfPi = kPi / 2.0f;

/// Double precision two Pi, for phase accumulators that must not drift
inline constexpr double kTwoPiD = 6.28318530717958647692;

/// 1 / sqrt(2), equal-power centre gain and Butterworth Q
inline constexpr float kInvSqrt2 = 0.7071067811865476f;

} // namespace DSP
} // namespace Acordes
