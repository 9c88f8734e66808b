// ==============================================================================
// Layer 0: Core Utility - Sigmoid Transfer Functions
// ==============================================================================
// Soft-clipping transfer functions for the master bus output stage.
//
// Real-time safe: noexcept, no allocations.
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>

#include <limits>

namespace Acordes {
namespace DSP {
namespace Sigmoid {

/// @brief Fast hyperbolic tangent using a Pade (5,4) approximant.
///
/// tanh(x) ~= x * (945 + 105*x^2 + x^4) / (945 + 420*x^2 + 15*x^4)
/// Maximum error below 0.05% for |x| < 3.5; saturates to +/-1 beyond.
///
/// @param x Input value (unbounded)
/// @return Saturated output in range [-1, 1]
/// @note NaN propagates, +/-Inf returns +/-1
///
/// @code
/// float y = Sigmoid::tanh(0.5f);  // ~0.462
/// float z = Sigmoid::tanh(3.0f);  // ~0.995
/// @endcode
[[nodiscard]] constexpr float tanh(float x) noexcept {
    if (detail::isNaN(x)) {
        return std::numeric_limits<float>::quiet_NaN();
    }
    if (x >= 3.5f) {
        return 1.0f;
    }
    if (x <= -3.5f) {
        return -1.0f;
    }
    const float x2 = x * x;
    const float x4 = x2 * x2;
    return x * (945.0f + 105.0f * x2 + x4) / (945.0f + 420.0f * x2 + 15.0f * x4);
}

/// @brief Hard clip to [-threshold, threshold].
[[nodiscard]] constexpr float hardClip(float x, float threshold = 1.0f) noexcept {
    return (x > threshold) ? threshold : ((x < -threshold) ? -threshold : x);
}

} // namespace Sigmoid
} // namespace DSP
} // namespace Acordes
