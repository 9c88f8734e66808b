// ==============================================================================
// Unit Test: EngineParameters key handling
// ==============================================================================
// Every ParamUpdate key, its clamping, and the rejection of unknown keys and
// unusable values.
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "parameters/engine_params.h"

#include <limits>
#include <string>

using Catch::Approx;
using namespace Acordes;

namespace {

bool apply(EngineParameters& params, const char* key, ParamValue value) {
    return applyParamChange(params, key, value);
}

ParamValue name(const char* text) { return ParamValue{std::string(text)}; }

} // namespace

TEST_CASE("EngineParameters defaults", "[params][engine_params]") {
    EngineParameters params;
    CHECK(params.osc.waveform == DSP::OscWaveform::Sine);
    CHECK(params.filter.cutoffHz == 2000.0f);
    CHECK(params.ampEnv.sustain == Approx(0.7f));
    CHECK(params.global.bpm == 120.0);
    CHECK(params.global.masterVolume == Approx(0.75f));
    CHECK(params.chorus.mix == 0.0f);
    CHECK(params.delay.mix == 0.0f);
    CHECK_FALSE(params.arp.enabled);
}

TEST_CASE("Oscillator keys", "[params][engine_params]") {
    EngineParameters params;
    CHECK(apply(params, "waveform", name("noise_white")));
    CHECK(params.osc.waveform == DSP::OscWaveform::WhiteNoise);
    CHECK(apply(params, "octave", 7.0));
    CHECK(params.osc.octave == 2);
    CHECK(apply(params, "octave", -1.0));
    CHECK(params.osc.octave == -1);
    CHECK(apply(params, "waveform_compensation", name("off")));
    CHECK_FALSE(params.osc.waveformCompensation);
}

TEST_CASE("Filter keys clamp into range", "[params][engine_params]") {
    EngineParameters params;
    CHECK(apply(params, "cutoff", 400.0));
    CHECK(params.filter.cutoffHz == 400.0f);
    CHECK(apply(params, "cutoff", 99999.0));
    CHECK(params.filter.cutoffHz == DSP::kMaxCutoffHz);
    CHECK(apply(params, "cutoff", 1.0));
    CHECK(params.filter.cutoffHz == DSP::kMinCutoffHz);
    CHECK(apply(params, "resonance", 1.0));
    CHECK(params.filter.resonance == DSP::kMaxResonance);
    CHECK(apply(params, "hp_cutoff", 120.0));
    CHECK(params.filter.highPassHz == 120.0f);
}

TEST_CASE("Envelope keys", "[params][engine_params]") {
    EngineParameters params;
    CHECK(apply(params, "attack", 0.0));
    CHECK(params.ampEnv.attack == DSP::kMinEnvelopeTimeSeconds);
    CHECK(apply(params, "release", 60.0));
    CHECK(params.ampEnv.release == DSP::kMaxEnvelopeTimeSeconds);
    CHECK(apply(params, "decay", 0.5));
    CHECK(params.ampEnv.decay == Approx(0.5f));
    CHECK(apply(params, "sustain", 2.0));
    CHECK(params.ampEnv.sustain == 1.0f);
    CHECK(apply(params, "intensity", 0.4));
    CHECK(params.ampEnv.intensity == Approx(0.4f));
}

TEST_CASE("LFO keys", "[params][engine_params]") {
    EngineParameters params;
    CHECK(apply(params, "lfo_shape", name("sample_hold")));
    CHECK(params.lfo.shape == DSP::Waveform::SampleHold);
    CHECK(apply(params, "lfo_target", name("filter")));
    CHECK(params.lfo.target == DSP::LfoTarget::Filter);
    CHECK(apply(params, "lfo_rate", 100.0));
    CHECK(params.lfo.rateHz == DSP::kMaxLFORateHz);
    CHECK(apply(params, "lfo_depth", 0.5));
    CHECK(apply(params, "mod_wheel", -1.0));
    CHECK(params.lfo.modWheel == 0.0f);
}

TEST_CASE("Effect keys", "[params][engine_params]") {
    EngineParameters params;
    CHECK(apply(params, "chorus_voices", 9.0));
    CHECK(params.chorus.voices == DSP::kMaxChorusVoices);
    CHECK(apply(params, "chorus_mix", 0.3));
    CHECK(apply(params, "chorus_rate", 0.0));
    CHECK(params.chorus.rateHz == DSP::kMinChorusRateHz);
    CHECK(apply(params, "chorus_depth", 0.9));

    CHECK(apply(params, "delay_time", 5.0));
    CHECK(params.delay.timeSeconds == DSP::kMaxDelayTimeSeconds);
    CHECK(apply(params, "delay_feedback", 1.5));
    CHECK(params.delay.feedback == DSP::kMaxDelayFeedback);
    CHECK(apply(params, "delay_mix", 0.5));
    CHECK(params.delay.mix == Approx(0.5f));
}

TEST_CASE("Arpeggiator keys", "[params][engine_params]") {
    EngineParameters params;
    CHECK(apply(params, "arp_enabled", 1.0));
    CHECK(params.arp.enabled);
    CHECK(apply(params, "arp_mode", name("up_down")));
    CHECK(params.arp.mode == DSP::ArpMode::UpDown);
    CHECK(apply(params, "arp_division", name("1/8")));
    CHECK(params.arp.stepsPerBeat == 2);
    CHECK(apply(params, "arp_range", 9.0));
    CHECK(params.arp.octaveRange == DSP::kMaxArpOctaves);
    CHECK(apply(params, "arp_gate", 0.0));
    CHECK(params.arp.gate == DSP::kMinArpGate);
}

TEST_CASE("Global keys", "[params][engine_params]") {
    EngineParameters params;
    CHECK(apply(params, "bpm", 500.0));
    CHECK(params.global.bpm == DSP::kMaxTempoBPM);
    CHECK(apply(params, "bpm", 93.5));
    CHECK(params.global.bpm == 93.5);
    CHECK(apply(params, "master_volume", 1.2));
    CHECK(params.global.masterVolume == 1.0f);
    CHECK(apply(params, "pitch_bend", -7.0));
    CHECK(params.global.pitchBend == -kMaxPitchBendSemitones);
    CHECK(apply(params, "pan_spread", 0.6));
    CHECK(params.global.panSpread == Approx(0.6f));
}

TEST_CASE("Unknown keys and unusable values leave parameters unchanged",
          "[params][engine_params]") {
    EngineParameters params;
    const EngineParameters before = params;

    CHECK_FALSE(apply(params, "flanger_mix", 0.5));
    CHECK_FALSE(apply(params, "Cutoff", 400.0));
    CHECK_FALSE(apply(params, "cutoff", name("bright")));
    CHECK_FALSE(apply(params, "waveform", name("supersaw")));
    CHECK_FALSE(apply(params, "arp_enabled", name("perhaps")));
    CHECK_FALSE(apply(params, "bpm", std::numeric_limits<double>::quiet_NaN()));

    CHECK(params.filter.cutoffHz == before.filter.cutoffHz);
    CHECK(params.osc.waveform == before.osc.waveform);
    CHECK(params.arp.enabled == before.arp.enabled);
    CHECK(params.global.bpm == before.global.bpm);
}
