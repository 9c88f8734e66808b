// ==============================================================================
// Layer 2: DSP Processor - Modulation Bus
// ==============================================================================
// One shared LFO, ticked once per render block, whose control value is
// scaled into per-target offsets that every voice reads for that block.
//
// Target scaling at depth 1:
//   Pitch      +/- 2 semitones
//   Filter     +/- 2 octaves of cutoff
//   Amplitude  gain from 1 down to 1 - depth (tremolo below unity only)
//   Pan        +/- 0.5 of the pan range
//
// Dependencies:
//   - Layer 1: lfo.h
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/primitives/lfo.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace Acordes {
namespace DSP {

/// @brief Which part of the voice pipeline the LFO modulates.
enum class LfoTarget : uint8_t {
    Pitch = 0,
    Filter,
    Amplitude,
    Pan,
    All
};

inline constexpr float kLfoPitchRangeSemitones = 2.0f;
inline constexpr float kLfoFilterRangeOctaves = 2.0f;
inline constexpr float kLfoPanRange = 0.5f;

/// @brief Per-block modulation consumed by every voice.
struct ModulationOffsets {
    float pitchSemitones = 0.0f;
    float filterOctaves = 0.0f;
    float amplitudeGain = 1.0f;
    float panOffset = 0.0f;
};

/// @brief Shared LFO plus target routing.
///
/// Depth is the sum of the LFO depth parameter and the mod wheel, clamped
/// to 1.
class ModulationBus {
public:
    void prepare(double sampleRate) noexcept {
        lfo_.prepare(sampleRate);
        offsets_ = {};
    }

    void reset() noexcept {
        lfo_.reset();
        offsets_ = {};
    }

    void setWaveform(Waveform waveform) noexcept { lfo_.setWaveform(waveform); }
    void setRate(float hz) noexcept { lfo_.setFrequency(hz); }
    void setTarget(LfoTarget target) noexcept { target_ = target; }

    void setDepth(float depth) noexcept {
        if (detail::isNaN(depth)) return;
        depth_ = std::clamp(depth, 0.0f, 1.0f);
    }

    void setModWheel(float amount) noexcept {
        if (detail::isNaN(amount)) return;
        modWheel_ = std::clamp(amount, 0.0f, 1.0f);
    }

    /// @brief Tick the LFO once for a block and recompute the offsets.
    const ModulationOffsets& tick(size_t numSamples) noexcept {
        const float value = lfo_.tick(numSamples);
        const float depth = effectiveDepth();
        offsets_ = {};
        if (depth <= 0.0f) {
            return offsets_;
        }

        const bool all = (target_ == LfoTarget::All);
        if (all || target_ == LfoTarget::Pitch) {
            offsets_.pitchSemitones = value * depth * kLfoPitchRangeSemitones;
        }
        if (all || target_ == LfoTarget::Filter) {
            offsets_.filterOctaves = value * depth * kLfoFilterRangeOctaves;
        }
        if (all || target_ == LfoTarget::Amplitude) {
            offsets_.amplitudeGain = 1.0f - depth * 0.5f * (1.0f - value);
        }
        if (all || target_ == LfoTarget::Pan) {
            offsets_.panOffset = value * depth * kLfoPanRange;
        }
        return offsets_;
    }

    [[nodiscard]] float effectiveDepth() const noexcept {
        return std::min(depth_ + modWheel_, 1.0f);
    }

    [[nodiscard]] const ModulationOffsets& offsets() const noexcept { return offsets_; }
    [[nodiscard]] const LFO& lfo() const noexcept { return lfo_; }
    [[nodiscard]] LfoTarget target() const noexcept { return target_; }

private:
    LFO lfo_;
    ModulationOffsets offsets_;
    LfoTarget target_ = LfoTarget::Pitch;
    float depth_ = 0.0f;
    float modWheel_ = 0.0f;
};

} // namespace DSP
} // namespace Acordes
