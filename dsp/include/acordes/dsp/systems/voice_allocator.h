// ==============================================================================
// Layer 3: DSP System - Voice Allocator
// ==============================================================================
// Binds MIDI notes to a fixed pool of voices and decides which voice a new
// note gets. Purely bookkeeping: it produces VoiceEvents describing what the
// caller must do to the voices, and owns no audio state.
//
// Allocation order for a NoteOn:
//   1. A voice already bound to the note (any state) is retriggered in place.
//   2. Otherwise the lowest-index idle voice.
//   3. Otherwise a voice is stolen:
//      a. a releasing voice whose note is not physically held, the one that
//         entered release earliest;
//      b. any releasing voice, earliest release first;
//      c. the active voice triggered longest ago.
//
// Age is tracked with monotonic counters rather than wall-clock time.
//
// Dependencies:
//   - Layer 0: midi_utils.h
// ==============================================================================

#pragma once

#include <acordes/dsp/core/midi_utils.h>

#include <array>
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>

namespace Acordes::DSP {

// =============================================================================
// VoiceEvent / VoiceState
// =============================================================================

/// @brief Instruction from the allocator to the voice pool.
struct VoiceEvent {
    enum class Type : uint8_t {
        NoteOn,      ///< Start the note on an idle voice
        Retrigger,   ///< Restart the voice already playing this note
        Steal,       ///< Take over a sounding voice for the new note
        NoteOff      ///< Release the voice
    };

    Type type{Type::NoteOn};
    uint8_t voiceIndex{0};
    uint8_t note{0};
    float velocity{0.0f};
    int previousNote{-1};   ///< Note the voice was bound to before a Steal
};

enum class VoiceState : uint8_t {
    Idle = 0,
    Active,
    Releasing
};

// =============================================================================
// VoiceAllocator
// =============================================================================

/// @brief Note-to-voice binding with retrigger-in-place and age-based
/// stealing over a compile-time voice count.
///
/// @par Invariants
/// - At most one voice is bound to a given note.
/// - Active + Releasing voices never exceed kNumVoices.
///
/// @par Thread Safety
/// Single-threaded; owned by the render thread.
template <size_t NumVoices>
class BasicVoiceAllocator {
public:
    static constexpr size_t kNumVoices = NumVoices;
    static_assert(kNumVoices > 0 && kNumVoices <= 64);

    BasicVoiceAllocator() noexcept { reset(); }

    /// @brief Return every voice to Idle and forget all ages and held keys.
    void reset() noexcept {
        for (auto& slot : slots_) {
            slot = Slot{};
        }
        heldKeys_.reset();
        triggerCounter_ = 0;
        releaseCounter_ = 0;
        eventCount_ = 0;
    }

    // =========================================================================
    // Note events
    // =========================================================================

    /// @brief Allocate a voice for a note.
    /// @return Zero or one event. Invalid notes produce no event.
    [[nodiscard]] std::span<const VoiceEvent> noteOn(int note, float velocity) noexcept {
        eventCount_ = 0;
        if (!isValidMidiNote(note)) {
            return {};
        }
        const auto noteByte = static_cast<uint8_t>(note);

        const int bound = findVoiceForNote(note);
        if (bound >= 0) {
            bind(static_cast<size_t>(bound), noteByte, velocity);
            push(VoiceEvent{VoiceEvent::Type::Retrigger, static_cast<uint8_t>(bound),
                            noteByte, velocity, note});
            return events();
        }

        const int idle = findIdleVoice();
        if (idle >= 0) {
            bind(static_cast<size_t>(idle), noteByte, velocity);
            push(VoiceEvent{VoiceEvent::Type::NoteOn, static_cast<uint8_t>(idle),
                            noteByte, velocity, -1});
            return events();
        }

        const size_t victim = selectStealVictim();
        const int previous = slots_[victim].note;
        bind(victim, noteByte, velocity);
        push(VoiceEvent{VoiceEvent::Type::Steal, static_cast<uint8_t>(victim),
                        noteByte, velocity, previous});
        return events();
    }

    /// @brief Release the voice bound to a note, if it is Active.
    /// @return Zero or one NoteOff event.
    [[nodiscard]] std::span<const VoiceEvent> noteOff(int note) noexcept {
        eventCount_ = 0;
        if (!isValidMidiNote(note)) {
            return {};
        }
        const int bound = findVoiceForNote(note);
        if (bound < 0) {
            return {};
        }
        auto& slot = slots_[static_cast<size_t>(bound)];
        if (slot.state != VoiceState::Active) {
            return {};
        }
        slot.state = VoiceState::Releasing;
        slot.releaseOrder = ++releaseCounter_;
        push(VoiceEvent{VoiceEvent::Type::NoteOff, static_cast<uint8_t>(bound),
                        static_cast<uint8_t>(note), 0.0f, -1});
        return events();
    }

    /// @brief Release every active voice.
    /// @return One NoteOff event per voice released.
    [[nodiscard]] std::span<const VoiceEvent> releaseAll() noexcept {
        eventCount_ = 0;
        for (size_t i = 0; i < kNumVoices; ++i) {
            auto& slot = slots_[i];
            if (slot.state == VoiceState::Active) {
                slot.state = VoiceState::Releasing;
                slot.releaseOrder = ++releaseCounter_;
                push(VoiceEvent{VoiceEvent::Type::NoteOff, static_cast<uint8_t>(i),
                                static_cast<uint8_t>(slot.note), 0.0f, -1});
            }
        }
        return events();
    }

    /// @brief Called once a voice has fallen silent; unbinds it.
    void voiceFinished(size_t voiceIndex) noexcept {
        if (voiceIndex >= kNumVoices) return;
        slots_[voiceIndex] = Slot{};
    }

    /// @brief Track a physical key, used by the first steal preference.
    void setKeyHeld(int note, bool held) noexcept {
        if (!isValidMidiNote(note)) return;
        heldKeys_.set(static_cast<size_t>(note), held);
    }

    void clearHeldKeys() noexcept { heldKeys_.reset(); }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] VoiceState getVoiceState(size_t voiceIndex) const noexcept {
        return (voiceIndex < kNumVoices) ? slots_[voiceIndex].state : VoiceState::Idle;
    }

    /// @return Bound note, or -1 for an idle voice
    [[nodiscard]] int getVoiceNote(size_t voiceIndex) const noexcept {
        return (voiceIndex < kNumVoices) ? slots_[voiceIndex].note : -1;
    }

    [[nodiscard]] float getVoiceVelocity(size_t voiceIndex) const noexcept {
        return (voiceIndex < kNumVoices) ? slots_[voiceIndex].velocity : 0.0f;
    }

    /// @return Number of Active plus Releasing voices
    [[nodiscard]] size_t getActiveVoiceCount() const noexcept {
        size_t count = 0;
        for (const auto& slot : slots_) {
            if (slot.state != VoiceState::Idle) ++count;
        }
        return count;
    }

    [[nodiscard]] bool isKeyHeld(int note) const noexcept {
        return isValidMidiNote(note) && heldKeys_.test(static_cast<size_t>(note));
    }

    /// @return Voice bound to the note, or -1
    [[nodiscard]] int findVoiceForNote(int note) const noexcept {
        for (size_t i = 0; i < kNumVoices; ++i) {
            if (slots_[i].state != VoiceState::Idle && slots_[i].note == note) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

private:
    struct Slot {
        VoiceState state{VoiceState::Idle};
        int note{-1};
        float velocity{0.0f};
        uint64_t triggerOrder{0};
        uint64_t releaseOrder{0};
    };

    [[nodiscard]] int findIdleVoice() const noexcept {
        for (size_t i = 0; i < kNumVoices; ++i) {
            if (slots_[i].state == VoiceState::Idle) return static_cast<int>(i);
        }
        return -1;
    }

    [[nodiscard]] size_t selectStealVictim() const noexcept {
        int releasingUnheld = -1;
        int releasingAny = -1;
        int oldestActive = -1;
        uint64_t bestUnheld = std::numeric_limits<uint64_t>::max();
        uint64_t bestReleasing = std::numeric_limits<uint64_t>::max();
        uint64_t bestActive = std::numeric_limits<uint64_t>::max();

        for (size_t i = 0; i < kNumVoices; ++i) {
            const auto& slot = slots_[i];
            if (slot.state == VoiceState::Releasing) {
                if (!isKeyHeld(slot.note) && slot.releaseOrder < bestUnheld) {
                    bestUnheld = slot.releaseOrder;
                    releasingUnheld = static_cast<int>(i);
                }
                if (slot.releaseOrder < bestReleasing) {
                    bestReleasing = slot.releaseOrder;
                    releasingAny = static_cast<int>(i);
                }
            } else if (slot.state == VoiceState::Active && slot.triggerOrder < bestActive) {
                bestActive = slot.triggerOrder;
                oldestActive = static_cast<int>(i);
            }
        }

        if (releasingUnheld >= 0) return static_cast<size_t>(releasingUnheld);
        if (releasingAny >= 0) return static_cast<size_t>(releasingAny);
        return static_cast<size_t>(oldestActive >= 0 ? oldestActive : 0);
    }

    void bind(size_t voiceIndex, uint8_t note, float velocity) noexcept {
        auto& slot = slots_[voiceIndex];
        slot.state = VoiceState::Active;
        slot.note = note;
        slot.velocity = velocity;
        slot.triggerOrder = ++triggerCounter_;
        slot.releaseOrder = 0;
    }

    void push(const VoiceEvent& event) noexcept {
        if (eventCount_ < eventBuffer_.size()) {
            eventBuffer_[eventCount_++] = event;
        }
    }

    [[nodiscard]] std::span<const VoiceEvent> events() const noexcept {
        return {eventBuffer_.data(), eventCount_};
    }

    std::array<Slot, kNumVoices> slots_{};
    std::array<VoiceEvent, kNumVoices> eventBuffer_{};
    size_t eventCount_{0};
    std::bitset<128> heldKeys_;
    uint64_t triggerCounter_{0};
    uint64_t releaseCounter_{0};
};

/// The engine's eight-voice allocator.
using VoiceAllocator = BasicVoiceAllocator<8>;

} // namespace Acordes::DSP
