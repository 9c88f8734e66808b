#pragma once

// ==============================================================================
// Oscillator Parameters (waveform, octave, waveform_compensation)
// ==============================================================================

#include "param_value.h"
#include "dropdown_mappings.h"
#include <acordes/dsp/primitives/polyblep_oscillator.h>
#include <acordes/dsp/systems/synth_voice.h>

namespace Acordes {

struct OscParams {
    DSP::OscWaveform waveform{DSP::OscWaveform::Sine};
    int octave{0};                      // -2..+2 (32' .. 2')
    bool waveformCompensation{true};
};

inline bool handleOscParamChange(OscParams& params, std::string_view key,
                                 const ParamValue& value) {
    if (key == "waveform") {
        const auto index = toChoice(value, kWaveformNames);
        if (!index) return false;
        params.waveform = static_cast<DSP::OscWaveform>(*index);
        return true;
    }
    if (key == "octave") {
        return assignIf(params.octave,
                        toClampedInt(value, DSP::kMinOctaveShift, DSP::kMaxOctaveShift));
    }
    if (key == "waveform_compensation") {
        return assignIf(params.waveformCompensation, toBool(value));
    }
    return false;
}

} // namespace Acordes
