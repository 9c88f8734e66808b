// ==============================================================================
// Layer 0: Core Utilities
// db_utils.h - Float Sanitization
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
//
// The NaN/Inf checks inspect the IEEE 754 bit pattern so they keep working
// when a consumer enables -ffast-math (std::isnan may be optimized out).
// ==============================================================================

#pragma once

#include <bit>
#include <cstdint>

namespace Acordes {
namespace DSP {

/// Magnitudes below this are flushed to zero in recursive filter state.
inline constexpr float kDenormalThreshold = 1e-15f;

namespace detail {

/// NaN: exponent all ones AND mantissa non-zero.
[[nodiscard]] constexpr bool isNaN(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return ((bits & 0x7F800000u) == 0x7F800000u) && ((bits & 0x007FFFFFu) != 0);
}

/// Inf: exponent all ones AND mantissa zero.
[[nodiscard]] constexpr bool isInf(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7FFFFFFFu) == 0x7F800000u;
}

/// Neither NaN nor Inf.
[[nodiscard]] constexpr bool isFiniteBits(float x) noexcept {
    const auto bits = std::bit_cast<std::uint32_t>(x);
    return (bits & 0x7F800000u) != 0x7F800000u;
}

/// Double precision counterpart, used by the parameter layer.
[[nodiscard]] constexpr bool isFiniteBits(double x) noexcept {
    const auto bits = std::bit_cast<std::uint64_t>(x);
    return (bits & 0x7FF0000000000000ull) != 0x7FF0000000000000ull;
}

/// Flush tiny values to zero to avoid denormal CPU spikes in feedback paths.
[[nodiscard]] constexpr float flushDenormal(float x) noexcept {
    return (x > -kDenormalThreshold && x < kDenormalThreshold) ? 0.0f : x;
}

} // namespace detail
} // namespace DSP
} // namespace Acordes
