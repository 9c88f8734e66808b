// ==============================================================================
// Layer 0: Core Utility - BlockContext
// ==============================================================================
// Per-block processing context for tempo-aware DSP components.
//
// Real-time safe: no allocation, noexcept, value semantics.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cstddef>

namespace Acordes {
namespace DSP {

/// @brief Minimum tempo in BPM (prevents division issues).
inline constexpr double kMinTempoBPM = 20.0;

/// @brief Maximum tempo in BPM (reasonable musical limit).
inline constexpr double kMaxTempoBPM = 300.0;

/// @brief Per-block processing context for DSP components.
///
/// The engine fills one of these per render call from its single tempo cell.
/// Durations are kept fractional so that sequencers can carry the remainder
/// from block to block instead of rounding each step.
///
/// @code
/// BlockContext ctx;
/// ctx.sampleRate = 48000.0;
/// ctx.tempoBPM = 120.0;
/// double quarter = ctx.samplesPerBeat();   // 24000.0
/// double sixteenth = ctx.beatFractionToSamples(0.25);  // 6000.0
/// @endcode
struct BlockContext {
    double sampleRate = 48000.0;      ///< Sample rate in Hz
    size_t blockSize = 1024;          ///< Block size in samples
    double tempoBPM = 120.0;          ///< Tempo in beats per minute

    /// @brief Duration of one beat (quarter note) in samples.
    /// @note Tempo is clamped to [kMinTempoBPM, kMaxTempoBPM].
    [[nodiscard]] constexpr double samplesPerBeat() const noexcept {
        if (sampleRate <= 0.0) {
            return 0.0;
        }
        const double clampedTempo = std::clamp(tempoBPM, kMinTempoBPM, kMaxTempoBPM);
        return (60.0 / clampedTempo) * sampleRate;
    }

    /// @brief Duration of a fraction of a beat in samples (fractional).
    [[nodiscard]] constexpr double beatFractionToSamples(double beats) const noexcept {
        return samplesPerBeat() * beats;
    }
};

} // namespace DSP
} // namespace Acordes
