// ==============================================================================
// Layer 0: Core Utilities
// random.h - Fast Pseudo-Random Number Generation
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// ==============================================================================

#pragma once

#include <cstdint>

namespace Acordes {
namespace DSP {

/// Fast 32-bit pseudo-random number generator (Marsaglia xorshift 13/17/5).
///
/// Period 2^32-1. Used for white noise, the sample-and-hold LFO shape and
/// random arpeggiator steps.
///
/// @note NOT cryptographically secure - for audio/DSP use only
class Xorshift32 {
public:
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// @return Random float in range [-1.0, 1.0]
    [[nodiscard]] constexpr float nextFloat() noexcept {
        return static_cast<float>(next()) * kToFloat * 2.0f - 1.0f;
    }

    /// @return Random float in range [0.0, 1.0]
    [[nodiscard]] constexpr float nextUnipolar() noexcept {
        return static_cast<float>(next()) * kToFloat;
    }

    /// @return Uniform index in [0, count). count == 0 returns 0.
    [[nodiscard]] constexpr uint32_t nextIndex(uint32_t count) noexcept {
        if (count == 0) return 0;
        return next() % count;
    }

    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    /// 0 would make the generator output only zeros
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    /// 1.0 / (2^32 - 1)
    static constexpr float kToFloat = 2.3283064370807974e-10f;

    uint32_t state_;
};

} // namespace DSP
} // namespace Acordes
