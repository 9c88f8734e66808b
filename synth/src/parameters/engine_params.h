#pragma once

// ==============================================================================
// EngineParameters
// ==============================================================================
// The complete parameter snapshot of the engine, one struct per concern.
// Owned and mutated by the render thread only, by applying ParamUpdate
// commands key by key.
// ==============================================================================

#include "amp_env_params.h"
#include "arpeggiator_params.h"
#include "chorus_params.h"
#include "delay_params.h"
#include "filter_params.h"
#include "global_params.h"
#include "lfo_params.h"
#include "osc_params.h"
#include "param_value.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Acordes {

struct EngineParameters {
    OscParams osc;
    FilterParams filter;
    AmpEnvParams ampEnv;
    LfoParams lfo;
    ChorusParams chorus;
    DelayParams delay;
    ArpeggiatorParams arp;
    GlobalParams global;
};

/// @brief Apply one key to the snapshot.
/// @return false when the key is unknown or the value unusable; the
///         snapshot is then unchanged.
inline bool applyParamChange(EngineParameters& params, std::string_view key,
                             const ParamValue& value) {
    return handleOscParamChange(params.osc, key, value) ||
           handleFilterParamChange(params.filter, key, value) ||
           handleAmpEnvParamChange(params.ampEnv, key, value) ||
           handleLfoParamChange(params.lfo, key, value) ||
           handleChorusParamChange(params.chorus, key, value) ||
           handleDelayParamChange(params.delay, key, value) ||
           handleArpParamChange(params.arp, key, value) ||
           handleGlobalParamChange(params.global, key, value);
}

} // namespace Acordes
