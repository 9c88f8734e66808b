#pragma once

// ==============================================================================
// LFO Parameters (lfo_*, mod_wheel)
// ==============================================================================

#include "param_value.h"
#include "dropdown_mappings.h"
#include <acordes/dsp/primitives/lfo.h>
#include <acordes/dsp/processors/modulation_bus.h>

namespace Acordes {

struct LfoParams {
    DSP::Waveform shape{DSP::Waveform::Sine};
    DSP::LfoTarget target{DSP::LfoTarget::Pitch};
    float rateHz{2.0f};      // 0.05-20 Hz
    float depth{0.0f};       // 0-1
    float modWheel{0.0f};    // 0-1, added to depth
};

inline bool handleLfoParamChange(LfoParams& params, std::string_view key,
                                 const ParamValue& value) {
    if (key == "lfo_shape") {
        const auto index = toChoice(value, kLfoShapeNames);
        if (!index) return false;
        params.shape = static_cast<DSP::Waveform>(*index);
        return true;
    }
    if (key == "lfo_target") {
        const auto index = toChoice(value, kLfoTargetNames);
        if (!index) return false;
        params.target = static_cast<DSP::LfoTarget>(*index);
        return true;
    }
    if (key == "lfo_rate") {
        return assignIf(params.rateHz,
                        toClampedFloat(value, DSP::kMinLFORateHz, DSP::kMaxLFORateHz));
    }
    if (key == "lfo_depth") return assignIf(params.depth, toClampedFloat(value, 0.0f, 1.0f));
    if (key == "mod_wheel") return assignIf(params.modWheel, toClampedFloat(value, 0.0f, 1.0f));
    return false;
}

} // namespace Acordes
