#pragma once

// ==============================================================================
// Filter Parameters (cutoff, resonance, hp_cutoff)
// ==============================================================================

#include "param_value.h"
#include <acordes/dsp/processors/voice_filter.h>

namespace Acordes {

struct FilterParams {
    float cutoffHz{2000.0f};      // 20-20000 Hz
    float resonance{0.3f};        // 0-0.95
    float highPassHz{0.0f};       // 0-5000 Hz, < 20 = off
};

inline bool handleFilterParamChange(FilterParams& params, std::string_view key,
                                    const ParamValue& value) {
    if (key == "cutoff") {
        return assignIf(params.cutoffHz,
                        toClampedFloat(value, DSP::kMinCutoffHz, DSP::kMaxCutoffHz));
    }
    if (key == "resonance") {
        return assignIf(params.resonance, toClampedFloat(value, 0.0f, DSP::kMaxResonance));
    }
    if (key == "hp_cutoff") {
        return assignIf(params.highPassHz, toClampedFloat(value, 0.0f, DSP::kMaxHighPassHz));
    }
    return false;
}

} // namespace Acordes
