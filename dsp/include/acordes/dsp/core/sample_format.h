// ==============================================================================
// Layer 0: Core Utility - Sample Format Conversion
// ==============================================================================
// Conversion from the engine's planar float buffers to the interleaved
// 16-bit frames expected by most platform audio backends.
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Acordes {
namespace DSP {

/// Full-scale magnitude of a symmetric 16-bit sample.
inline constexpr float kInt16FullScale = 32767.0f;

/// @brief Convert one float sample to a symmetric int16.
///
/// Scales by 32767 and clips to [-32767, 32767]. NaN/Inf map to 0.
/// Rounds to nearest so that small signals are not biased toward zero.
[[nodiscard]] inline int16_t floatToInt16(float sample) noexcept {
    if (!detail::isFiniteBits(sample)) {
        return 0;
    }
    float scaled = sample * kInt16FullScale;
    scaled = (scaled > kInt16FullScale) ? kInt16FullScale
           : ((scaled < -kInt16FullScale) ? -kInt16FullScale : scaled);
    return static_cast<int16_t>(std::lrint(scaled));
}

/// @brief Interleave a planar stereo pair into L/R int16 frames.
/// @param interleaved Destination, must hold 2 * numFrames values
inline void interleaveToInt16(const float* left, const float* right,
                              int16_t* interleaved, size_t numFrames) noexcept {
    for (size_t i = 0; i < numFrames; ++i) {
        interleaved[2 * i] = floatToInt16(left[i]);
        interleaved[2 * i + 1] = floatToInt16(right[i]);
    }
}

} // namespace DSP
} // namespace Acordes
