// ==============================================================================
// Layer 0: Core Utilities
// pitch_utils.h - Pitch Ratio Conversions
// ==============================================================================

#pragma once

#include <cmath>

namespace Acordes {
namespace DSP {

/// Convert octaves to frequency ratio (+1 = 2.0, -1 = 0.5)
[[nodiscard]] inline float octavesToRatio(float octaves) noexcept {
    return std::exp2(octaves);
}

} // namespace DSP
} // namespace Acordes
