#pragma once

// ==============================================================================
// Chorus Parameters (chorus_*)
// ==============================================================================

#include "param_value.h"
#include <acordes/dsp/effects/chorus.h>

namespace Acordes {

struct ChorusParams {
    float rateHz{0.8f};    // 0.05-5 Hz
    float depth{0.5f};     // 0-1
    float mix{0.0f};       // 0-1, 0 = bypass
    int voices{2};         // 1-4 taps
};

inline bool handleChorusParamChange(ChorusParams& params, std::string_view key,
                                    const ParamValue& value) {
    if (key == "chorus_rate") {
        return assignIf(params.rateHz,
                        toClampedFloat(value, DSP::kMinChorusRateHz, DSP::kMaxChorusRateHz));
    }
    if (key == "chorus_depth") return assignIf(params.depth, toClampedFloat(value, 0.0f, 1.0f));
    if (key == "chorus_mix") return assignIf(params.mix, toClampedFloat(value, 0.0f, 1.0f));
    if (key == "chorus_voices") {
        return assignIf(params.voices,
                        toClampedInt(value, DSP::kMinChorusVoices, DSP::kMaxChorusVoices));
    }
    return false;
}

} // namespace Acordes
