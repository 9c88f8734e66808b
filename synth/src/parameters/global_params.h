#pragma once

// ==============================================================================
// Global Parameters (bpm, master_volume, pitch_bend, pan_spread)
// ==============================================================================

#include "param_value.h"
#include <acordes/dsp/core/block_context.h>

namespace Acordes {

inline constexpr float kMaxPitchBendSemitones = 2.0f;

struct GlobalParams {
    double bpm{120.0};           // shared tempo cell, 20-300
    float masterVolume{0.75f};   // 0-1
    float pitchBend{0.0f};       // -2..+2 semitones (target, smoothed per block)
    float panSpread{0.0f};       // 0-1
};

inline bool handleGlobalParamChange(GlobalParams& params, std::string_view key,
                                    const ParamValue& value) {
    if (key == "bpm") {
        const auto number = toNumber(value);
        if (!number) return false;
        params.bpm = std::clamp(*number, DSP::kMinTempoBPM, DSP::kMaxTempoBPM);
        return true;
    }
    if (key == "master_volume") {
        return assignIf(params.masterVolume, toClampedFloat(value, 0.0f, 1.0f));
    }
    if (key == "pitch_bend") {
        return assignIf(params.pitchBend,
                        toClampedFloat(value, -kMaxPitchBendSemitones, kMaxPitchBendSemitones));
    }
    if (key == "pan_spread") return assignIf(params.panSpread, toClampedFloat(value, 0.0f, 1.0f));
    return false;
}

} // namespace Acordes
