// ==============================================================================
// Layer 2: DSP Processor - Arpeggiator Core
// ==============================================================================
// Sample-accurate step sequencer over the set of held keys. Runs inside the
// render loop; each processBlock() call consumes one block of sample time
// and returns the NoteOn/NoteOff events that fall inside it, with their
// offsets from the start of the block.
//
// Timing uses two fractional sample counters (step and gate). A step fires
// at the first whole sample at or after its nominal time; the step length is
// then subtracted from the counter rather than the counter being zeroed, so
// the fractional remainder carries into the next step and the timing error
// never exceeds one sample no matter how many steps have run.
//
// Dependencies:
//   - Layer 0: block_context.h
//   - Layer 1: held_note_buffer.h
// ==============================================================================

#pragma once

#include <acordes/dsp/core/block_context.h>
#include <acordes/dsp/core/db_utils.h>
#include <acordes/dsp/core/midi_utils.h>
#include <acordes/dsp/primitives/held_note_buffer.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>

namespace Acordes::DSP {

// =============================================================================
// ArpEvent
// =============================================================================

/// @brief A note event emitted by the arpeggiator for the current block.
struct ArpEvent {
    enum class Type : uint8_t { NoteOn, NoteOff };

    Type type{Type::NoteOn};
    uint8_t note{0};
    float velocity{0.0f};        ///< 0-127 scale, as carried by note commands
    int32_t sampleOffset{0};     ///< Offset from the start of the block
};

inline constexpr float kMinArpGate = 0.05f;
inline constexpr float kMaxArpGate = 1.0f;
inline constexpr int kMinArpStepsPerBeat = 1;
inline constexpr int kMaxArpStepsPerBeat = 4;

// =============================================================================
// ArpeggiatorCore
// =============================================================================

/// @brief Tempo-synced arpeggiator clock and note generator.
///
/// @par Usage
/// @code
/// ArpeggiatorCore arp;
/// arp.prepare(48000.0);
/// arp.setEnabled(true);
/// arp.noteOn(60, 100.0f);
/// std::array<ArpEvent, 32> events;
/// size_t count = arp.processBlock(ctx, events);
/// @endcode
class ArpeggiatorCore {
public:
    ArpeggiatorCore() noexcept = default;

    /// @brief Timing comes from the BlockContext of each block; prepare only
    /// returns the clock to its stopped state.
    void prepare(double /*sampleRate*/) noexcept {
        reset();
    }

    /// @brief Stop the clock and forget the sounding note.
    /// Held notes and configuration are preserved.
    void reset() noexcept {
        stepCounter_ = 0.0;
        gateCounter_ = 0.0;
        soundingNote_ = -1;
        running_ = false;
        startPending_ = !held_.empty();
        pendingOffNote_ = -1;
        sequence_.restart();
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// @brief Enable or disable. Disabling releases the sounding note on the
    /// next processBlock(); enabling with keys held starts from the pattern
    /// start.
    void setEnabled(bool enabled) noexcept {
        if (enabled == enabled_) return;
        enabled_ = enabled;
        if (!enabled_) {
            stop();
        } else if (!held_.empty()) {
            sequence_.restart();
            startPending_ = true;
        }
    }

    void setMode(ArpMode mode) noexcept { sequence_.setMode(mode); }

    void setOctaveRange(int octaves) noexcept {
        octaves = std::clamp(octaves, kMinArpOctaves, kMaxArpOctaves);
        if (octaves == octaves_) return;
        octaves_ = octaves;
        sequence_.rebuild(held_, octaves_);
    }

    /// @param fraction Portion of a step the note sounds for, [0.05, 1]
    void setGate(float fraction) noexcept {
        if (detail::isNaN(fraction) || detail::isInf(fraction)) return;
        gate_ = std::clamp(fraction, kMinArpGate, kMaxArpGate);
    }

    /// @param steps 1 = quarter notes, 2 = eighths, 3 = eighth triplets,
    ///              4 = sixteenths
    void setStepsPerBeat(int steps) noexcept {
        stepsPerBeat_ = std::clamp(steps, kMinArpStepsPerBeat, kMaxArpStepsPerBeat);
    }

    // =========================================================================
    // Held keys
    // =========================================================================

    void noteOn(uint8_t note, float velocity) noexcept {
        const bool wasEmpty = held_.empty();
        held_.noteOn(note, velocity);
        sequence_.rebuild(held_, octaves_);
        if (wasEmpty && enabled_) {
            sequence_.restart();
            startPending_ = true;
        }
    }

    /// @brief Release a key. Releasing the last key stops the clock and
    /// releases the sounding note.
    void noteOff(uint8_t note) noexcept {
        held_.noteOff(note);
        sequence_.rebuild(held_, octaves_);
        if (held_.empty()) {
            stop();
        }
    }

    /// @brief Drop all held keys and stop.
    void clearNotes() noexcept {
        held_.clear();
        sequence_.rebuild(held_, octaves_);
        stop();
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Advance the clock by one block.
    /// @param ctx Sample rate, block size and tempo for this block
    /// @param out Destination for the events of this block, in offset order
    /// @return Number of events written
    [[nodiscard]] size_t processBlock(const BlockContext& ctx, std::span<ArpEvent> out) noexcept {
        size_t count = 0;
        const auto emit = [&](ArpEvent::Type type, int note, float velocity, size_t offset) {
            if (count < out.size()) {
                out[count++] = ArpEvent{type, static_cast<uint8_t>(note), velocity,
                                        static_cast<int32_t>(offset)};
            }
        };

        const size_t n = ctx.blockSize;
        if (n == 0) {
            return 0;
        }

        if (pendingOffNote_ >= 0) {
            emit(ArpEvent::Type::NoteOff, pendingOffNote_, 0.0f, 0);
            pendingOffNote_ = -1;
        }
        if (!enabled_ || held_.empty()) {
            return count;
        }

        stepLength_ = std::max(1.0, ctx.beatFractionToSamples(1.0 / stepsPerBeat_));
        gateLength_ = stepLength_ * static_cast<double>(gate_);

        // A tempo jump must not replay a backlog of missed steps
        stepCounter_ = std::min(stepCounter_, stepLength_);

        if (startPending_) {
            startPending_ = false;
            running_ = true;
            stepCounter_ = stepLength_;   // first step due at offset 0
            gateCounter_ = 0.0;
        }
        if (!running_) {
            return count;
        }

        size_t pos = 0;
        while (true) {
            const size_t toStep = samplesUntil(stepLength_, stepCounter_);
            const size_t toGate = (soundingNote_ >= 0) ? samplesUntil(gateLength_, gateCounter_)
                                                       : n;
            const size_t advance = std::min(toStep, toGate);
            if (pos + advance >= n) {
                const double rest = static_cast<double>(n - pos);
                stepCounter_ += rest;
                gateCounter_ += rest;
                break;
            }
            pos += advance;
            stepCounter_ += static_cast<double>(advance);
            gateCounter_ += static_cast<double>(advance);

            if (soundingNote_ >= 0 && gateCounter_ >= gateLength_) {
                emit(ArpEvent::Type::NoteOff, soundingNote_, 0.0f, pos);
                soundingNote_ = -1;
            }
            if (stepCounter_ >= stepLength_) {
                stepCounter_ -= stepLength_;
                if (soundingNote_ >= 0) {
                    emit(ArpEvent::Type::NoteOff, soundingNote_, 0.0f, pos);
                    soundingNote_ = -1;
                }
                if (const HeldNote* step = sequence_.advance()) {
                    soundingNote_ = step->note;
                    // Gate is measured from the nominal step time
                    gateCounter_ = stepCounter_;
                    emit(ArpEvent::Type::NoteOn, soundingNote_, step->velocity, pos);
                }
            }
        }
        return count;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool isEnabled() const noexcept { return enabled_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_ || startPending_; }
    [[nodiscard]] int soundingNote() const noexcept { return soundingNote_; }
    [[nodiscard]] const HeldNoteBuffer& heldNotes() const noexcept { return held_; }
    [[nodiscard]] const ArpSequence& sequence() const noexcept { return sequence_; }
    [[nodiscard]] int octaveRange() const noexcept { return octaves_; }
    [[nodiscard]] float gate() const noexcept { return gate_; }
    [[nodiscard]] int stepsPerBeat() const noexcept { return stepsPerBeat_; }

    /// @brief Step length used for the most recent block, in samples.
    [[nodiscard]] double stepLengthSamples() const noexcept { return stepLength_; }

    /// @brief Samples elapsed since the nominal time of the last step.
    [[nodiscard]] double stepCounter() const noexcept { return stepCounter_; }

private:
    /// Whole samples from now until counter reaches length (0 if already due).
    [[nodiscard]] static size_t samplesUntil(double length, double counter) noexcept {
        const double remaining = length - counter;
        if (remaining <= 0.0) return 0;
        return static_cast<size_t>(std::ceil(remaining));
    }

    void stop() noexcept {
        if (soundingNote_ >= 0) {
            pendingOffNote_ = soundingNote_;
            soundingNote_ = -1;
        }
        running_ = false;
        startPending_ = false;
        stepCounter_ = 0.0;
        gateCounter_ = 0.0;
        sequence_.restart();
    }

    HeldNoteBuffer held_;
    ArpSequence sequence_{0xA4F3u};

    double stepLength_ = 6000.0;
    double gateLength_ = 3000.0;
    double stepCounter_ = 0.0;
    double gateCounter_ = 0.0;

    float gate_ = 0.5f;
    int octaves_ = 1;
    int stepsPerBeat_ = 4;
    int soundingNote_ = -1;
    int pendingOffNote_ = -1;
    bool enabled_ = false;
    bool running_ = false;
    bool startPending_ = false;
};

} // namespace Acordes::DSP
