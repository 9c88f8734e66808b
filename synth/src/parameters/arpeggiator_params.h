#pragma once

// ==============================================================================
// Arpeggiator Parameters (arp_*)
// ==============================================================================

#include "param_value.h"
#include "dropdown_mappings.h"
#include <acordes/dsp/primitives/held_note_buffer.h>
#include <acordes/dsp/processors/arpeggiator_core.h>

namespace Acordes {

struct ArpeggiatorParams {
    bool enabled{false};
    DSP::ArpMode mode{DSP::ArpMode::Up};
    float gate{0.5f};            // fraction of a step, 0.05-1
    int octaveRange{1};          // 1-4
    int stepsPerBeat{4};         // 1/16 by default
};

inline bool handleArpParamChange(ArpeggiatorParams& params, std::string_view key,
                                 const ParamValue& value) {
    if (key == "arp_enabled") return assignIf(params.enabled, toBool(value));
    if (key == "arp_mode") {
        const auto index = toChoice(value, kArpModeNames);
        if (!index) return false;
        params.mode = static_cast<DSP::ArpMode>(*index);
        return true;
    }
    if (key == "arp_gate") {
        return assignIf(params.gate, toClampedFloat(value, DSP::kMinArpGate, DSP::kMaxArpGate));
    }
    if (key == "arp_range") {
        return assignIf(params.octaveRange,
                        toClampedInt(value, DSP::kMinArpOctaves, DSP::kMaxArpOctaves));
    }
    if (key == "arp_division") {
        const auto index = toChoice(value, kArpDivisionNames);
        if (!index) return false;
        params.stepsPerBeat = *index + 1;
        return true;
    }
    return false;
}

} // namespace Acordes
