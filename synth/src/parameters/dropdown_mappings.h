#pragma once

// ==============================================================================
// Acordes Choice Mappings
// ==============================================================================
// Name tables for the enumerated parameters, indexed by enum value. Used by
// the ParamUpdate handlers to accept either a name or an index.
// ==============================================================================

#include <acordes/dsp/primitives/held_note_buffer.h>
#include <acordes/dsp/primitives/lfo.h>
#include <acordes/dsp/primitives/polyblep_oscillator.h>
#include <acordes/dsp/processors/modulation_bus.h>

#include <array>
#include <string_view>

namespace Acordes {

// =============================================================================
// Oscillator waveform (6 entries)
// =============================================================================

inline constexpr std::array<std::string_view, DSP::kOscWaveformCount> kWaveformNames = {
    "sine", "square", "sawtooth", "triangle", "noise_white", "noise_pink",
};

// =============================================================================
// LFO shape (4 entries)
// =============================================================================

inline constexpr std::array<std::string_view, 4> kLfoShapeNames = {
    "sine", "triangle", "square", "sample_hold",
};

// =============================================================================
// LFO target (5 entries)
// =============================================================================

inline constexpr std::array<std::string_view, 5> kLfoTargetNames = {
    "pitch", "filter", "amplitude", "pan", "all",
};

// =============================================================================
// Arpeggiator
// =============================================================================

inline constexpr std::array<std::string_view, 4> kArpModeNames = {
    "up", "down", "up_down", "random",
};

/// Index + 1 is the number of steps per beat.
inline constexpr std::array<std::string_view, 4> kArpDivisionNames = {
    "1/4", "1/8", "1/8t", "1/16",
};

} // namespace Acordes
