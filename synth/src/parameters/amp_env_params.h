#pragma once

// ==============================================================================
// Amplitude Envelope Parameters (attack, decay, sustain, release, intensity)
// ==============================================================================

#include "param_value.h"
#include <acordes/dsp/primitives/adsr_envelope.h>

namespace Acordes {

struct AmpEnvParams {
    float attack{0.01f};     // seconds
    float decay{0.2f};       // seconds
    float sustain{0.7f};     // 0-1
    float release{0.05f};    // seconds
    float intensity{0.8f};   // envelope peak, 0-1
};

inline std::optional<float> envTimeFromValue(const ParamValue& value) {
    return toClampedFloat(value, DSP::kMinEnvelopeTimeSeconds, DSP::kMaxEnvelopeTimeSeconds);
}

inline bool handleAmpEnvParamChange(AmpEnvParams& params, std::string_view key,
                                    const ParamValue& value) {
    if (key == "attack") return assignIf(params.attack, envTimeFromValue(value));
    if (key == "decay") return assignIf(params.decay, envTimeFromValue(value));
    if (key == "sustain") return assignIf(params.sustain, toClampedFloat(value, 0.0f, 1.0f));
    if (key == "release") return assignIf(params.release, envTimeFromValue(value));
    if (key == "intensity") return assignIf(params.intensity, toClampedFloat(value, 0.0f, 1.0f));
    return false;
}

} // namespace Acordes
