// ==============================================================================
// Layer 0: Core Utilities
// midi_utils.h - MIDI Note and Velocity Conversion Functions
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Acordes {
namespace DSP {

// ==============================================================================
// Constants
// ==============================================================================

/// Standard A4 reference frequency in Hz
inline constexpr float kA4FrequencyHz = 440.0f;

/// MIDI note number for A4
inline constexpr int kA4MidiNote = 69;

inline constexpr int kMinMidiNote = 0;
inline constexpr int kMaxMidiNote = 127;

/// Upper end of the float velocity scale carried by note commands
inline constexpr float kMaxMidiVelocity = 127.0f;

// ==============================================================================
// Functions
// ==============================================================================

/// @brief Check whether an incoming note number addresses a real MIDI key.
[[nodiscard]] constexpr bool isValidMidiNote(int note) noexcept {
    return note >= kMinMidiNote && note <= kMaxMidiNote;
}

/// Convert a (possibly fractional) MIDI note number to frequency, 12-TET.
///
/// frequency = a4Frequency * 2^((midiNote - 69) / 12)
///
/// Fractional input carries pitch bend, octave transpose and LFO vibrato.
///
/// @example midiNoteToFrequency(69.0f) -> 440.0 Hz  (A4)
/// @example midiNoteToFrequency(60.0f) -> 261.63 Hz (C4)
[[nodiscard]] inline float midiNoteToFrequency(
    float midiNote,
    float a4Frequency = kA4FrequencyHz
) noexcept {
    return a4Frequency * std::exp2((midiNote - static_cast<float>(kA4MidiNote)) / 12.0f);
}

/// Map a note command velocity (0-127, fractional allowed) to a gain.
///
/// Square-root (soft) curve: sqrt(velocity / 127). Soft playing stays
/// audible while full velocity still reaches 1.0.
///
/// @example mapVelocity(127.0f) -> 1.0
/// @example mapVelocity(64.0f)  -> ~0.710
/// @example mapVelocity(0.0f)   -> 0.0
[[nodiscard]] inline float mapVelocity(float velocity) noexcept {
    if (!(velocity > 0.0f)) {
        return 0.0f;  // also catches NaN
    }
    const float normalized = std::min(velocity, kMaxMidiVelocity) / kMaxMidiVelocity;
    return std::sqrt(normalized);
}

} // namespace DSP
} // namespace Acordes
