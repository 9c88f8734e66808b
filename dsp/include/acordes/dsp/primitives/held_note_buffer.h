// ==============================================================================
// Layer 1: DSP Primitives
// held_note_buffer.h - Arpeggiator note tracking and step sequence
// ==============================================================================
// Real-time safe: no allocation, no locks, no exceptions, no I/O.
// Layer 1: only depends on Layer 0 (Xorshift32 from core/random.h).
// ==============================================================================

#pragma once

#include <acordes/dsp/core/random.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace Acordes::DSP {

// =============================================================================
// Data Types
// =============================================================================

/// @brief A single held MIDI note.
struct HeldNote {
    uint8_t note{0};          ///< MIDI note number (0-127)
    float velocity{0.0f};     ///< Note command velocity (0-127 scale, never 0)
};

/// @brief Arpeggiator pattern mode.
enum class ArpMode : uint8_t {
    Up = 0,       ///< Forward through the sequence, wrap at the end
    Down,         ///< Backward through the sequence, wrap at the start
    UpDown,       ///< Bounce between the ends, no endpoint repeat
    Random        ///< Uniform pick, independent of the previous step
};

inline constexpr int kMinArpOctaves = 1;
inline constexpr int kMaxArpOctaves = 4;

// =============================================================================
// HeldNoteBuffer
// =============================================================================

/// @brief Fixed-capacity (32) buffer of currently held keys, kept in
/// ascending pitch order.
class HeldNoteBuffer {
public:
    static constexpr size_t kMaxNotes = 32;

    /// @brief Add a note, or update its velocity if already held.
    /// A new note is ignored when the buffer is full.
    void noteOn(uint8_t note, float velocity) noexcept {
        for (size_t i = 0; i < size_; ++i) {
            if (notes_[i].note == note) {
                notes_[i].velocity = velocity;
                return;
            }
        }
        if (size_ >= kMaxNotes) {
            return;
        }

        size_t insertPos = size_;
        for (size_t i = 0; i < size_; ++i) {
            if (notes_[i].note > note) {
                insertPos = i;
                break;
            }
        }
        for (size_t i = size_; i > insertPos; --i) {
            notes_[i] = notes_[i - 1];
        }
        notes_[insertPos] = HeldNote{note, velocity};
        ++size_;
    }

    /// @brief Remove a note. Unknown notes are ignored.
    void noteOff(uint8_t note) noexcept {
        for (size_t i = 0; i < size_; ++i) {
            if (notes_[i].note == note) {
                for (size_t j = i; j + 1 < size_; ++j) {
                    notes_[j] = notes_[j + 1];
                }
                --size_;
                return;
            }
        }
    }

    void clear() noexcept { size_ = 0; }

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

    [[nodiscard]] bool contains(uint8_t note) const noexcept {
        for (size_t i = 0; i < size_; ++i) {
            if (notes_[i].note == note) return true;
        }
        return false;
    }

    /// @return Held notes in pitch-ascending order
    [[nodiscard]] std::span<const HeldNote> byPitch() const noexcept {
        return {notes_.data(), size_};
    }

private:
    std::array<HeldNote, kMaxNotes> notes_{};
    size_t size_{0};
};

// =============================================================================
// ArpSequence
// =============================================================================

/// @brief Octave-expanded step sequence derived from a HeldNoteBuffer, plus
/// the traversal state (index, bounce direction) that walks it.
///
/// The sequence lists the held notes in pitch order, then the same notes one
/// octave up, and so on for the configured range. Notes transposed past 127
/// are dropped rather than folded back.
class ArpSequence {
public:
    static constexpr size_t kMaxSteps = HeldNoteBuffer::kMaxNotes * kMaxArpOctaves;

    explicit ArpSequence(uint32_t seed = 1) noexcept
        : rng_(seed) {}

    void setMode(ArpMode mode) noexcept {
        if (mode != mode_) {
            mode_ = mode;
            restart();
        }
    }

    /// @brief Rebuild from the held notes. The traversal position survives
    /// when still in range so that playing a chord does not restart the run.
    void rebuild(const HeldNoteBuffer& held, int octaveRange) noexcept {
        const int octaves = std::clamp(octaveRange, kMinArpOctaves, kMaxArpOctaves);
        const auto pitched = held.byPitch();
        size_ = 0;
        for (int octave = 0; octave < octaves; ++octave) {
            for (const auto& heldNote : pitched) {
                const int note = static_cast<int>(heldNote.note) + octave * 12;
                if (note > 127) continue;
                steps_[size_++] = HeldNote{static_cast<uint8_t>(note), heldNote.velocity};
            }
        }
        if (size_ == 0) {
            restart();
            return;
        }
        if (lastIndex_ >= size_) {
            lastIndex_ = size_ - 1;
        }
    }

    /// @brief Forget the traversal position; the next step starts the pattern.
    void restart() noexcept {
        started_ = false;
        lastIndex_ = 0;
        direction_ = 1;
    }

    /// @brief Advance to the next step per the current mode.
    /// @return The step to play, or nullptr when the sequence is empty
    [[nodiscard]] const HeldNote* advance() noexcept {
        if (size_ == 0) {
            return nullptr;
        }
        if (!started_) {
            started_ = true;
            lastIndex_ = firstIndex();
            return &steps_[lastIndex_];
        }

        switch (mode_) {
            case ArpMode::Up:
                lastIndex_ = (lastIndex_ + 1) % size_;
                break;
            case ArpMode::Down:
                lastIndex_ = (lastIndex_ == 0) ? (size_ - 1) : (lastIndex_ - 1);
                break;
            case ArpMode::UpDown:
                advanceBounce();
                break;
            case ArpMode::Random:
                lastIndex_ = rng_.nextIndex(static_cast<uint32_t>(size_));
                break;
        }
        return &steps_[lastIndex_];
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
    [[nodiscard]] size_t currentIndex() const noexcept { return lastIndex_; }
    [[nodiscard]] int direction() const noexcept { return direction_; }
    [[nodiscard]] ArpMode mode() const noexcept { return mode_; }

    [[nodiscard]] std::span<const HeldNote> steps() const noexcept {
        return {steps_.data(), size_};
    }

private:
    [[nodiscard]] size_t firstIndex() noexcept {
        switch (mode_) {
            case ArpMode::Down:
                direction_ = -1;
                return size_ - 1;
            case ArpMode::Random:
                return rng_.nextIndex(static_cast<uint32_t>(size_));
            case ArpMode::Up:
            case ArpMode::UpDown:
                break;
        }
        direction_ = 1;
        return 0;
    }

    /// Direction flips exactly at the ends; the end step is not repeated.
    void advanceBounce() noexcept {
        if (size_ == 1) {
            lastIndex_ = 0;
            return;
        }
        if (direction_ > 0 && lastIndex_ + 1 >= size_) {
            direction_ = -1;
        } else if (direction_ < 0 && lastIndex_ == 0) {
            direction_ = 1;
        }
        lastIndex_ = (direction_ > 0) ? (lastIndex_ + 1) : (lastIndex_ - 1);
    }

    std::array<HeldNote, kMaxSteps> steps_{};
    size_t size_{0};
    size_t lastIndex_{0};
    int direction_{1};
    bool started_{false};
    ArpMode mode_{ArpMode::Up};
    Xorshift32 rng_;
};

} // namespace Acordes::DSP
