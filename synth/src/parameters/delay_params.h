#pragma once

// ==============================================================================
// Delay Parameters (delay_*)
// ==============================================================================

#include "param_value.h"
#include <acordes/dsp/effects/feedback_delay.h>

namespace Acordes {

struct DelayParams {
    float timeSeconds{0.35f};   // 0.01-2 s
    float feedback{0.35f};      // 0-0.95
    float mix{0.0f};            // 0-1, 0 = bypass
};

inline bool handleDelayParamChange(DelayParams& params, std::string_view key,
                                   const ParamValue& value) {
    if (key == "delay_time") {
        return assignIf(params.timeSeconds, toClampedFloat(value, DSP::kMinDelayTimeSeconds,
                                                           DSP::kMaxDelayTimeSeconds));
    }
    if (key == "delay_feedback") {
        return assignIf(params.feedback, toClampedFloat(value, 0.0f, DSP::kMaxDelayFeedback));
    }
    if (key == "delay_mix") return assignIf(params.mix, toClampedFloat(value, 0.0f, 1.0f));
    return false;
}

} // namespace Acordes
