// ==============================================================================
// Layer 3: DSP System - Synth Voice
// ==============================================================================
// One polyphonic voice: the complete per-voice pipeline.
//
// Signal flow (fixed order, once per block):
//   Oscillator -> Voice Filter (HP -> LP) -> ADSR -> Onset Ramp
//   -> DC Blocker -> Gain -> Equal-power Pan -> stereo mix (accumulate)
//
// When a sounding voice is retriggered or stolen, a snapshot of the whole
// pipeline keeps rendering the old note as a "tail" that fades out linearly
// while the new trigger fades in through its onset ramp. The first sample
// after a trigger therefore continues the previous one.
//   Steal:     tail fades over kStealCrossfadeSamples
//   Retrigger: tail fades over the onset ramp length; old and new signal are
//              the same waveform, so the level holds steady through it.
//              The new signal restarts the DC blocker from zero state.
//
// Up to kMaxVoiceTails fades run at once, so a trigger that lands inside a
// running fade leaves that fade intact. When every slot is busy, the tail
// with the lowest fade gain is replaced.
//
// Dependencies:
//   - Layer 0: midi_utils.h, pitch_utils.h, stereo_utils.h
//   - Layer 1: polyblep_oscillator.h, adsr_envelope.h, onset_ramp.h,
//              dc_blocker.h
//   - Layer 2: voice_filter.h, modulation_bus.h
// ==============================================================================

#pragma once

#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/core/midi_utils.h>
#include <acordes/dsp/core/pitch_utils.h>
#include <acordes/dsp/core/stereo_utils.h>
#include <acordes/dsp/primitives/adsr_envelope.h>
#include <acordes/dsp/primitives/dc_blocker.h>
#include <acordes/dsp/primitives/onset_ramp.h>
#include <acordes/dsp/primitives/polyblep_oscillator.h>
#include <acordes/dsp/processors/modulation_bus.h>
#include <acordes/dsp/processors/voice_filter.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Acordes::DSP {

/// Length of the fade-out applied to the old signal on steal or retrigger.
inline constexpr size_t kStealCrossfadeSamples = 48;

/// Crossfade tails a voice can render at the same time.
inline constexpr size_t kMaxVoiceTails = 2;

inline constexpr int kMinOctaveShift = -2;
inline constexpr int kMaxOctaveShift = 2;

/// @brief Per-block settings shared by all voices.
struct VoiceParams {
    OscWaveform waveform = OscWaveform::Sine;
    bool waveformCompensation = true;
    int octave = 0;
    float cutoffHz = 2000.0f;
    float resonance = 0.3f;
    float highPassHz = 0.0f;
    float attack = 0.01f;
    float decay = 0.2f;
    float sustain = 0.7f;
    float release = 0.05f;
    float intensity = 0.8f;
};

/// @brief Complete per-voice pipeline with crossfaded retrigger and steal.
///
/// @par Real-Time Safety
/// prepare() allocates scratch buffers; everything else is real-time safe.
class SynthVoice {
public:
    explicit SynthVoice(uint32_t noiseSeed = 1) noexcept {
        core_.oscillator = PolyBlepOscillator(noiseSeed);
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    void prepare(double sampleRate, size_t maxBlockSize) {
        core_.prepare(sampleRate);
        for (auto& tail : tails_) {
            tail.core.prepare(sampleRate);
        }
        maxBlockSize_ = std::max<size_t>(maxBlockSize, 1);
        voiceBuffer_.assign(maxBlockSize_, 0.0f);
        envBuffer_.assign(maxBlockSize_, 0.0f);
        tailBuffer_.assign(maxBlockSize_, 0.0f);
        applyParams(core_, params_);
        reset();
    }

    /// @brief Force the voice silent immediately. All DSP state is zeroed.
    void reset() noexcept {
        core_.reset();
        for (auto& tail : tails_) {
            tail.core.reset();
            tail.remaining = 0;
        }
        samplesSinceTrigger_ = 0;
        note_ = -1;
    }

    // =========================================================================
    // Parameters
    // =========================================================================

    /// @brief Update the shared settings. Takes effect from the next block.
    void setParams(const VoiceParams& params) noexcept {
        params_ = params;
        params_.octave = std::clamp(params_.octave, kMinOctaveShift, kMaxOctaveShift);
        applyParams(core_, params_);
    }

    /// @brief Fixed stereo position of this voice in [-1, 1].
    void setPan(float pan) noexcept {
        if (detail::isNaN(pan)) return;
        pan_ = std::clamp(pan, -1.0f, 1.0f);
    }

    // =========================================================================
    // Note control
    // =========================================================================

    /// @brief Start a note on an idle voice.
    void noteOn(int note, float velocity) noexcept {
        core_.reset();
        for (auto& tail : tails_) {
            tail.remaining = 0;
        }
        trigger(note, velocity);
    }

    /// @brief Restart the note this voice is already playing, in place.
    /// Oscillator phase and filter state carry over; the envelope attacks
    /// from its current level. The DC blocker restarts from zero so the new
    /// signal enters through the onset ramp without a carried-over offset.
    void retrigger(int note, float velocity) noexcept {
        Tail* tail = startTail();
        trigger(note, velocity);
        core_.dcBlocker.reset();
        if (tail != nullptr) {
            startFade(*tail, core_.onset.getLengthSamples());
        }
    }

    /// @brief Hand the voice to a new note. The old note fades out as a tail;
    /// the new one starts from clean filter, DC blocker and phase state.
    void steal(int note, float velocity) noexcept {
        Tail* tail = startTail();
        core_.reset();
        trigger(note, velocity);
        if (tail != nullptr) {
            startFade(*tail, kStealCrossfadeSamples);
        }
    }

    void noteOff() noexcept { core_.envelope.gateOff(); }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Render a block and add it into the stereo mix.
    /// @param mixLeft  Left accumulation buffer
    /// @param mixRight Right accumulation buffer
    /// @param numSamples Samples to render
    /// @param mod Modulation for this block
    /// @param pitchBendSemitones Smoothed pitch bend
    void processBlock(float* mixLeft, float* mixRight, size_t numSamples,
                      const ModulationOffsets& mod, float pitchBendSemitones) noexcept {
        if (!isActive()) {
            return;
        }

        updateModulatedSettings(mod, pitchBendSemitones);
        const StereoGains gains = equalPowerPan(pan_ + mod.panOffset);

        size_t done = 0;
        while (done < numSamples) {
            const size_t n = std::min(numSamples - done, maxBlockSize_);
            renderCore(core_, voiceBuffer_.data(), n, mod.amplitudeGain);

            for (auto& tail : tails_) {
                if (tail.remaining == 0) continue;
                renderCore(tail.core, tailBuffer_.data(), n, mod.amplitudeGain);
                const size_t fade = std::min(n, tail.remaining);
                const float invFade = 1.0f / static_cast<float>(tail.length);
                for (size_t i = 0; i < fade; ++i) {
                    const float gain = static_cast<float>(tail.remaining - i) * invFade;
                    voiceBuffer_[i] += tailBuffer_[i] * gain;
                }
                tail.remaining -= fade;
            }
            samplesSinceTrigger_ += n;

            float* outL = mixLeft + done;
            float* outR = mixRight + done;
            for (size_t i = 0; i < n; ++i) {
                outL[i] += voiceBuffer_[i] * gains.left;
                outR[i] += voiceBuffer_[i] * gains.right;
            }
            done += n;
        }

        if (!core_.envelope.isActive() && !isCrossfading()) {
            note_ = -1;
        }
    }

    // =========================================================================
    // Queries
    // =========================================================================

    /// @brief True while the envelope or a crossfade tail is still sounding.
    [[nodiscard]] bool isActive() const noexcept {
        return core_.envelope.isActive() || isCrossfading();
    }

    [[nodiscard]] bool isReleasing() const noexcept { return core_.envelope.isReleasing(); }
    [[nodiscard]] bool isCrossfading() const noexcept { return getTailCount() > 0; }

    /// @brief Number of crossfade tails still fading out.
    [[nodiscard]] size_t getTailCount() const noexcept {
        return static_cast<size_t>(std::count_if(tails_.begin(), tails_.end(),
            [](const Tail& tail) { return tail.remaining > 0; }));
    }
    [[nodiscard]] int getNote() const noexcept { return note_; }
    [[nodiscard]] float getPan() const noexcept { return pan_; }

    /// @brief Low-pass cutoff currently applied, including LFO filter modulation.
    [[nodiscard]] float getFilterCutoff() const noexcept { return core_.filter.getCutoff(); }

    [[nodiscard]] const ADSREnvelope& getEnvelope() const noexcept { return core_.envelope; }
    [[nodiscard]] const OnsetRamp& getOnsetRamp() const noexcept { return core_.onset; }
    [[nodiscard]] const DCBlocker& getDCBlocker() const noexcept { return core_.dcBlocker; }
    [[nodiscard]] const PolyBlepOscillator& getOscillator() const noexcept { return core_.oscillator; }
    [[nodiscard]] const VoiceFilter& getFilter() const noexcept { return core_.filter; }
    [[nodiscard]] const VoiceParams& getParams() const noexcept { return params_; }

private:
    /// Everything that renders one note. Copyable so that a sounding note can
    /// be detached into the tail.
    struct VoiceCore {
        PolyBlepOscillator oscillator;
        VoiceFilter filter;
        ADSREnvelope envelope;
        OnsetRamp onset;
        DCBlocker dcBlocker;
        float gain = 1.0f;
        float noteNumber = 69.0f;

        void prepare(double sampleRate) noexcept {
            oscillator.prepare(sampleRate);
            filter.prepare(sampleRate);
            envelope.prepare(sampleRate);
            onset.prepare(sampleRate);
            dcBlocker.prepare(sampleRate);
        }

        void reset() noexcept {
            oscillator.reset();
            filter.reset();
            envelope.reset();
            onset.reset();
            dcBlocker.reset();
        }
    };

    struct Tail {
        VoiceCore core;
        size_t length = kStealCrossfadeSamples;
        size_t remaining = 0;

        [[nodiscard]] float fadeGain() const noexcept {
            return static_cast<float>(remaining) / static_cast<float>(length);
        }
    };

    static void applyParams(VoiceCore& core, const VoiceParams& params) noexcept {
        core.oscillator.setWaveform(params.waveform);
        core.envelope.setAttack(params.attack);
        core.envelope.setDecay(params.decay);
        core.envelope.setSustain(params.sustain);
        core.envelope.setRelease(params.release);
        core.gain = params.waveformCompensation ? waveformCompensationGain(params.waveform) : 1.0f;
    }

    /// Detach the sounding note into a tail slot. Returns nullptr when there
    /// is nothing audible to keep: an idle envelope, or a trigger that has
    /// not rendered a sample yet (its onset ramp is still at zero).
    Tail* startTail() noexcept {
        if (!core_.envelope.isActive() || samplesSinceTrigger_ == 0) {
            return nullptr;
        }
        Tail* slot = &tails_[0];
        for (auto& tail : tails_) {
            if (tail.remaining == 0) {
                slot = &tail;
                break;
            }
            if (tail.fadeGain() < slot->fadeGain()) {
                slot = &tail;
            }
        }
        slot->core = core_;
        return slot;
    }

    static void startFade(Tail& tail, size_t length) noexcept {
        tail.length = std::max<size_t>(length, 1);
        tail.remaining = tail.length;
    }

    void trigger(int note, float velocity) noexcept {
        note_ = note;
        samplesSinceTrigger_ = 0;
        const float f0 = midiNoteToFrequency(static_cast<float>(note + params_.octave * 12));
        core_.noteNumber = static_cast<float>(note);
        core_.oscillator.setFrequency(f0);
        core_.dcBlocker.setCutoff(dcBlockerCutoffForFundamental(f0));
        core_.onset.trigger(f0);
        core_.envelope.gateOn(params_.intensity * mapVelocity(velocity));
    }

    void updateModulatedSettings(const ModulationOffsets& mod, float bendSemitones) noexcept {
        const float pitch = core_.noteNumber + static_cast<float>(params_.octave * 12) +
                            bendSemitones + mod.pitchSemitones;
        core_.oscillator.setFrequency(midiNoteToFrequency(pitch));
        core_.filter.setParameters(params_.cutoffHz * octavesToRatio(mod.filterOctaves),
                                   params_.resonance, params_.highPassHz);
    }

    /// Oscillator, filter, envelope, onset ramp, DC blocker, gain.
    void renderCore(VoiceCore& core, float* out, size_t n, float amplitude) noexcept {
        core.oscillator.processBlock(out, n);
        core.filter.processBlock(out, n);
        core.envelope.processBlock(envBuffer_.data(), n);
        for (size_t i = 0; i < n; ++i) {
            out[i] *= envBuffer_[i];
        }
        core.onset.processBlock(out, n);
        core.dcBlocker.processBlock(out, n);
        const float gain = core.gain * amplitude;
        for (size_t i = 0; i < n; ++i) {
            out[i] *= gain;
        }
    }

    VoiceCore core_;
    std::array<Tail, kMaxVoiceTails> tails_{};
    VoiceParams params_;

    std::vector<float> voiceBuffer_;
    std::vector<float> envBuffer_;
    std::vector<float> tailBuffer_;

    size_t maxBlockSize_ = 1;
    size_t samplesSinceTrigger_ = 0;
    float pan_ = 0.0f;
    int note_ = -1;
};

} // namespace Acordes::DSP
