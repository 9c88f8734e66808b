// ==============================================================================
// Acordes Engine - Render Driver
// ==============================================================================
// Complete polyphonic engine: eight SynthVoices behind a VoiceAllocator, one
// shared ModulationBus, the ArpeggiatorCore and the master bus, fed by an
// MPSC command queue.
//
// Per buffer, in this order and no other:
//   1. Drain commands (all of them, FIFO, applied before any sample)
//   2. Tick the LFO; smooth pitch bend
//   3. Tick the arpeggiator
//   4. Render voices into the stereo mix, split at arpeggiator event offsets
//   5. Chorus
//   6. Delay
//   7. Anti-click gate / mute gate
//   8. Soft clip
//   9. Master volume
//  10. Emit (float planar or interleaved int16)
//
// Threading: enqueue(), noteOn(), noteOff(),
// reportBackendEvent() and getPublishedTempo() are safe from any thread.
// Everything else belongs to the render thread.
// ==============================================================================

#pragma once

// Layer 0
#include <acordes/dsp/core/block_context.h>
#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/core/midi_utils.h>
#include <acordes/dsp/core/sample_format.h>

// Layer 2
#include <acordes/dsp/processors/arpeggiator_core.h>
#include <acordes/dsp/processors/modulation_bus.h>

// Layer 3
#include <acordes/dsp/systems/synth_voice.h>
#include <acordes/dsp/systems/voice_allocator.h>

// Engine components (co-located)
#include "acordes_master_bus.h"
#include "command.h"
#include "command_queue.h"
#include "engine_log.h"
#include "parameters/engine_params.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <variant>
#include <vector>

namespace Acordes::DSP {

/// @brief Audio backend conditions reported by the output layer.
enum class BackendEvent : uint8_t {
    Underrun,
    Disconnected,
    Recovered
};

inline constexpr float kPitchBendSmoothing = 0.85f;
inline constexpr float kPitchBendSnapThreshold = 1e-4f;
inline constexpr float kMixNormalizationSmoothing = 0.005f;

/// @brief Real-time polyphonic synthesis engine.
///
/// @par Usage
/// @code
/// AcordesEngine engine;
/// engine.prepare(48000.0, 1024);
/// engine.enqueue(makeParamUpdate({{"cutoff", 400.0}}));   // any thread
/// engine.noteOn(36, 100.0f);                             // any thread
/// engine.processBlock(left, right, 1024);                // render thread
/// @endcode
class AcordesEngine {
public:
    static constexpr size_t kNumVoices = VoiceAllocator::kNumVoices;
    static constexpr size_t kMaxArpEventsPerBlock = 64;

    AcordesEngine() noexcept {
        for (size_t i = 0; i < kNumVoices; ++i) {
            voices_[i] = SynthVoice(0x9E3779B9u * static_cast<uint32_t>(i + 1));
        }
        heldVelocity_.fill(0.0f);
    }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Allocate buffers and prepare every component. Not real-time safe.
    void prepare(double sampleRate, size_t maxBlockSize) {
        sampleRate_ = (sampleRate > 0.0) ? sampleRate : 48000.0;
        maxBlockSize_ = std::max<size_t>(maxBlockSize, 1);

        for (auto& voice : voices_) {
            voice.prepare(sampleRate_, maxBlockSize_);
        }
        modulation_.prepare(sampleRate_);
        arp_.prepare(sampleRate_);
        bus_.prepare(sampleRate_);

        mixL_.assign(maxBlockSize_, 0.0f);
        mixR_.assign(maxBlockSize_, 0.0f);

        prepared_ = true;
        reset();
#if ACORDES_ENGINE_DEBUG
        logEngine("prepare: %.0f Hz, %zu samples, %zu voices",
                  sampleRate_, maxBlockSize_, kNumVoices);
#endif
    }

    /// @brief Silence everything and re-apply the current parameters.
    void reset() noexcept {
        for (auto& voice : voices_) {
            voice.reset();
        }
        allocator_.reset();
        heldVelocity_.fill(0.0f);
        modulation_.reset();
        arp_.clearNotes();
        arp_.reset();
        bus_.reset();
        currentBend_ = params_.global.pitchBend;
        mixGain_ = 1.0f;
        syncParameters();
    }

    // =========================================================================
    // Producer side (any thread)
    // =========================================================================

    /// @brief Queue a command for the next buffer. Never blocks.
    bool enqueue(Command command) noexcept { return queue_.enqueue(std::move(command)); }

    bool noteOn(int note, float velocity) noexcept {
        return enqueue(NoteOnCommand{note, velocity});
    }

    bool noteOff(int note) noexcept { return enqueue(NoteOffCommand{note, 0.0f}); }

    /// @brief Report a backend condition. Safe from the backend's thread.
    void reportBackendEvent(BackendEvent event) noexcept {
        switch (event) {
            case BackendEvent::Underrun:
                underrunCount_.fetch_add(1, std::memory_order_relaxed);
                break;
            case BackendEvent::Disconnected:
                backendConnected_.store(false, std::memory_order_release);
                break;
            case BackendEvent::Recovered:
                backendConnected_.store(true, std::memory_order_release);
                break;
        }
#if ACORDES_ENGINE_DEBUG
        logEngine("backend event %d", static_cast<int>(event));
#endif
    }

    /// @brief Tempo as last published by the render thread.
    [[nodiscard]] double getPublishedTempo() const noexcept {
        return publishedTempo_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t getUnderrunCount() const noexcept {
        return underrunCount_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool isBackendConnected() const noexcept {
        return backendConnected_.load(std::memory_order_acquire);
    }

    [[nodiscard]] uint64_t droppedCommandCount() const noexcept {
        return queue_.droppedCount();
    }

    // =========================================================================
    // Direct apply
    // =========================================================================

    /// @brief Apply a command immediately, bypassing the queue.
    ///
    /// @warning Test-only. This mutates render-thread state from the calling
    /// thread; it is unsafe whenever processBlock() may run concurrently.
    void applyCommandDirect(const Command& command) noexcept { applyCommand(command); }

    // =========================================================================
    // Processing (render thread)
    // =========================================================================

    /// @brief Render one buffer of planar stereo float audio.
    void processBlock(float* left, float* right, size_t numSamples) noexcept {
        if (!prepared_) {
            std::fill(left, left + numSamples, 0.0f);
            std::fill(right, right + numSamples, 0.0f);
            return;
        }

        drainCommands();

        size_t done = 0;
        while (done < numSamples) {
            const size_t n = std::min(numSamples - done, maxBlockSize_);
            renderChunk(left + done, right + done, n);
            done += n;
        }
    }

    /// @brief Render one buffer as interleaved L/R int16 frames.
    /// @param interleaved Destination for 2 * numFrames samples
    void processBlockInterleaved(int16_t* interleaved, size_t numFrames) noexcept {
        if (!prepared_) {
            std::fill(interleaved, interleaved + 2 * numFrames, int16_t{0});
            return;
        }

        drainCommands();

        size_t done = 0;
        while (done < numFrames) {
            const size_t n = std::min(numFrames - done, maxBlockSize_);
            renderChunk(mixL_.data(), mixR_.data(), n);
            interleaveToInt16(mixL_.data(), mixR_.data(), interleaved + 2 * done, n);
            done += n;
        }
    }

    // =========================================================================
    // State queries (render thread / tests)
    // =========================================================================

    [[nodiscard]] size_t getActiveVoiceCount() const noexcept {
        return allocator_.getActiveVoiceCount();
    }

    [[nodiscard]] VoiceState getVoiceState(size_t index) const noexcept {
        return allocator_.getVoiceState(index);
    }

    [[nodiscard]] int getVoiceNote(size_t index) const noexcept {
        return allocator_.getVoiceNote(index);
    }

    [[nodiscard]] const SynthVoice& getVoice(size_t index) const noexcept {
        return voices_[std::min(index, kNumVoices - 1)];
    }

    [[nodiscard]] const ::Acordes::EngineParameters& getParameters() const noexcept {
        return params_;
    }

    [[nodiscard]] const ArpeggiatorCore& getArpeggiator() const noexcept { return arp_; }
    [[nodiscard]] const ModulationBus& getModulation() const noexcept { return modulation_; }
    [[nodiscard]] const AcordesMasterBus& getMasterBus() const noexcept { return bus_; }
    [[nodiscard]] float getPitchBend() const noexcept { return currentBend_; }
    [[nodiscard]] double getSampleRate() const noexcept { return sampleRate_; }

private:
    // =========================================================================
    // Command handling
    // =========================================================================

    void drainCommands() noexcept {
        queue_.drain([this](const Command& command) { applyCommand(command); });
        publishedTempo_.store(params_.global.bpm, std::memory_order_release);
    }

    void applyCommand(const Command& command) noexcept {
        std::visit([this](const auto& cmd) {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, NoteOnCommand>) {
                handleNoteOn(cmd.note, cmd.velocity);
            } else if constexpr (std::is_same_v<T, NoteOffCommand>) {
                handleNoteOff(cmd.note);
            } else if constexpr (std::is_same_v<T, ParamUpdateCommand>) {
                handleParamUpdate(cmd);
            } else if constexpr (std::is_same_v<T, AllNotesOffCommand>) {
                handleAllNotesOff();
            } else if constexpr (std::is_same_v<T, MuteGateCommand>) {
                handleMuteGate();
            }
        }, command);
    }

    void handleNoteOn(int note, float velocity) noexcept {
        if (!isValidMidiNote(note) || detail::isNaN(velocity)) {
            return;
        }
        if (velocity <= 0.0f) {
            handleNoteOff(note);
            return;
        }
        velocity = std::min(velocity, kMaxMidiVelocity);
        allocator_.setKeyHeld(note, true);
        heldVelocity_[static_cast<size_t>(note)] = velocity;
        bus_.openGate();

        if (arp_.isEnabled()) {
            arp_.noteOn(static_cast<uint8_t>(note), velocity);
        } else {
            startNote(note, velocity);
        }
    }

    void handleNoteOff(int note) noexcept {
        if (!isValidMidiNote(note)) {
            return;
        }
        allocator_.setKeyHeld(note, false);
        if (arp_.isEnabled()) {
            arp_.noteOff(static_cast<uint8_t>(note));
        } else {
            releaseNote(note);
        }
    }

    void handleParamUpdate(const ParamUpdateCommand& update) noexcept {
        for (const auto& [key, value] : update.params) {
            const bool applied = ::Acordes::applyParamChange(params_, key, value);
#if ACORDES_ENGINE_DEBUG
            if (!applied) {
                logEngine("ignored parameter '%s'", key.c_str());
            }
#else
            (void)applied;
#endif
        }
        syncParameters();
    }

    /// Immediate silence: no release tails, no echoes, no arpeggio.
    void handleAllNotesOff() noexcept {
        for (auto& voice : voices_) {
            voice.reset();
        }
        allocator_.reset();
        arp_.clearNotes();
        arp_.reset();
        bus_.flushEffects();
        mixGain_ = 1.0f;
    }

    void handleMuteGate() noexcept {
        for (const auto& event : allocator_.releaseAll()) {
            voices_[event.voiceIndex].noteOff();
        }
        allocator_.clearHeldKeys();
        arp_.clearNotes();
        bus_.closeGate(true);
    }

    // =========================================================================
    // Note dispatch
    // =========================================================================

    void startNote(int note, float velocity) noexcept {
        for (const auto& event : allocator_.noteOn(note, velocity)) {
            auto& voice = voices_[event.voiceIndex];
            switch (event.type) {
                case VoiceEvent::Type::NoteOn:
                    voice.noteOn(event.note, event.velocity);
                    break;
                case VoiceEvent::Type::Retrigger:
                    voice.retrigger(event.note, event.velocity);
                    break;
                case VoiceEvent::Type::Steal:
                    voice.steal(event.note, event.velocity);
                    break;
                case VoiceEvent::Type::NoteOff:
                    voice.noteOff();
                    break;
            }
        }
    }

    void releaseNote(int note) noexcept {
        for (const auto& event : allocator_.noteOff(note)) {
            voices_[event.voiceIndex].noteOff();
        }
    }

    // =========================================================================
    // Parameter propagation
    // =========================================================================

    /// Push the parameter snapshot into every component.
    void syncParameters() noexcept {
        const auto& p = params_;

        VoiceParams voiceParams;
        voiceParams.waveform = p.osc.waveform;
        voiceParams.waveformCompensation = p.osc.waveformCompensation;
        voiceParams.octave = p.osc.octave;
        voiceParams.cutoffHz = p.filter.cutoffHz;
        voiceParams.resonance = p.filter.resonance;
        voiceParams.highPassHz = p.filter.highPassHz;
        voiceParams.attack = p.ampEnv.attack;
        voiceParams.decay = p.ampEnv.decay;
        voiceParams.sustain = p.ampEnv.sustain;
        voiceParams.release = p.ampEnv.release;
        voiceParams.intensity = p.ampEnv.intensity;

        for (size_t i = 0; i < kNumVoices; ++i) {
            voices_[i].setParams(voiceParams);
            const float position = static_cast<float>(i) / static_cast<float>(kNumVoices - 1);
            voices_[i].setPan(p.global.panSpread * (2.0f * position - 1.0f));
        }

        modulation_.setWaveform(p.lfo.shape);
        modulation_.setTarget(p.lfo.target);
        modulation_.setRate(p.lfo.rateHz);
        modulation_.setDepth(p.lfo.depth);
        modulation_.setModWheel(p.lfo.modWheel);

        arp_.setMode(p.arp.mode);
        arp_.setOctaveRange(p.arp.octaveRange);
        arp_.setGate(p.arp.gate);
        arp_.setStepsPerBeat(p.arp.stepsPerBeat);
        if (p.arp.enabled != arp_.isEnabled()) {
            setArpEnabled(p.arp.enabled);
        }

        bus_.setChorus(p.chorus.rateHz, p.chorus.depth, p.chorus.mix, p.chorus.voices);
        bus_.setDelay(p.delay.timeSeconds, p.delay.feedback, p.delay.mix);
        bus_.setMasterVolume(p.global.masterVolume);
    }

    /// Keys already down move into the arpeggiator when it is switched on.
    void setArpEnabled(bool enabled) noexcept {
        if (enabled) {
            for (int note = kMinMidiNote; note <= kMaxMidiNote; ++note) {
                if (allocator_.isKeyHeld(note)) {
                    releaseNote(note);
                    arp_.noteOn(static_cast<uint8_t>(note),
                                heldVelocity_[static_cast<size_t>(note)]);
                }
            }
            arp_.setEnabled(true);
        } else {
            arp_.clearNotes();
            arp_.setEnabled(false);
        }
    }

    // =========================================================================
    // Rendering
    // =========================================================================

    void renderChunk(float* left, float* right, size_t numSamples) noexcept {
        std::fill(left, left + numSamples, 0.0f);
        std::fill(right, right + numSamples, 0.0f);

        // LFO and pitch bend, once per buffer
        const ModulationOffsets mod = modulation_.tick(numSamples);
        const float bendTarget = params_.global.pitchBend;
        currentBend_ = bendTarget + (currentBend_ - bendTarget) * kPitchBendSmoothing;
        if (std::abs(currentBend_ - bendTarget) < kPitchBendSnapThreshold) {
            currentBend_ = bendTarget;
        }

        // Arpeggiator
        BlockContext ctx;
        ctx.sampleRate = sampleRate_;
        ctx.blockSize = numSamples;
        ctx.tempoBPM = params_.global.bpm;
        const size_t eventCount = arp_.processBlock(ctx, arpEvents_);

        // Voices, split at arpeggiator events
        size_t pos = 0;
        for (size_t e = 0; e < eventCount; ++e) {
            const ArpEvent& event = arpEvents_[e];
            const size_t offset = std::min(static_cast<size_t>(event.sampleOffset), numSamples);
            if (offset > pos) {
                renderVoices(left + pos, right + pos, offset - pos, mod);
                pos = offset;
            }
            if (event.type == ArpEvent::Type::NoteOn) {
                startNote(event.note, event.velocity);
            } else {
                releaseNote(event.note);
            }
        }
        if (pos < numSamples) {
            renderVoices(left + pos, right + pos, numSamples - pos, mod);
        }

        // Master bus
        const bool disconnected = !backendConnected_.load(std::memory_order_acquire);
        bus_.process(left, right, numSamples, disconnected);
    }

    void renderVoices(float* left, float* right, size_t numSamples,
                      const ModulationOffsets& mod) noexcept {
        size_t sounding = 0;
        for (auto& voice : voices_) {
            if (voice.isActive()) {
                voice.processBlock(left, right, numSamples, mod, currentBend_);
                ++sounding;
            }
        }

        // 1/sqrt(N) so that chords do not pile into the soft clipper
        const float target = 1.0f / std::sqrt(static_cast<float>(std::max<size_t>(sounding, 1)));
        for (size_t i = 0; i < numSamples; ++i) {
            mixGain_ += (target - mixGain_) * kMixNormalizationSmoothing;
            left[i] *= mixGain_;
            right[i] *= mixGain_;
        }

        for (size_t i = 0; i < kNumVoices; ++i) {
            if (allocator_.getVoiceState(i) != VoiceState::Idle && !voices_[i].isActive()) {
                allocator_.voiceFinished(i);
            }
        }
    }

    // =========================================================================
    // State
    // =========================================================================

    ::Acordes::MpscQueue<Command> queue_;
    ::Acordes::EngineParameters params_;

    std::array<SynthVoice, kNumVoices> voices_;
    VoiceAllocator allocator_;
    ModulationBus modulation_;
    ArpeggiatorCore arp_;
    AcordesMasterBus bus_;

    std::array<ArpEvent, kMaxArpEventsPerBlock> arpEvents_{};
    std::array<float, 128> heldVelocity_{};
    std::vector<float> mixL_;
    std::vector<float> mixR_;

    double sampleRate_ = 48000.0;
    size_t maxBlockSize_ = 1024;
    float currentBend_ = 0.0f;
    float mixGain_ = 1.0f;
    bool prepared_ = false;

    std::atomic<double> publishedTempo_{120.0};
    std::atomic<uint64_t> underrunCount_{0};
    std::atomic<bool> backendConnected_{true};
};

} // namespace Acordes::DSP
