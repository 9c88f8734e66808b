// ==============================================================================
// Acordes Engine - Commands
// ==============================================================================
// The closed set of messages a producer (keyboard, MIDI input, preset loader,
// step sequencer) can send to the render thread. Values are immutable once
// enqueued.
// ==============================================================================

#pragma once

#include "parameters/param_value.h"

#include <initializer_list>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Acordes {

/// Velocity is on the 0-127 scale; fractional values are allowed.
struct NoteOnCommand {
    int note{60};
    float velocity{100.0f};
};

struct NoteOffCommand {
    int note{60};
    float velocity{0.0f};
};

/// A batch of parameter changes applied together, in order.
struct ParamUpdateCommand {
    std::vector<std::pair<std::string, ParamValue>> params;
};

/// Silence every voice immediately, without release tails.
struct AllNotesOffCommand {};

/// Release all voices and close the output gate until the next NoteOn.
struct MuteGateCommand {};

using Command = std::variant<NoteOnCommand, NoteOffCommand, ParamUpdateCommand,
                             AllNotesOffCommand, MuteGateCommand>;

/// @code
/// queue.enqueue(makeParamUpdate({{"cutoff", 400.0}, {"waveform", "sawtooth"}}));
/// @endcode
inline Command makeParamUpdate(
    std::initializer_list<std::pair<std::string, ParamValue>> params) {
    return ParamUpdateCommand{std::vector<std::pair<std::string, ParamValue>>(params)};
}

} // namespace Acordes
