// ==============================================================================
// Layer 1: DSP Primitive - DelayLine
// ==============================================================================
// Real-time safe circular buffer delay line with fractional interpolation.
// Shared ring buffer used by the chorus taps and the feedback delay.
//
// Memory is allocated in prepare() only; write/read are allocation-free.
// ==============================================================================

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace Acordes {
namespace DSP {

/// @brief Next power of 2 greater than or equal to n.
inline constexpr size_t nextPowerOf2(size_t n) noexcept {
    if (n == 0) return 1;
    --n;
    n |= n >> 1;
    n |= n >> 2;
    n |= n >> 4;
    n |= n >> 8;
    n |= n >> 16;
    n |= n >> 32;
    return n + 1;
}

/// @brief Circular buffer delay line with integer and linear reads.
///
/// @code
/// DelayLine delay;
/// delay.prepare(48000.0, 2.0f);  // 2 second max delay
///
/// // In audio callback:
/// delay.write(inputSample);
/// float output = delay.readLinear(12345.6f);
/// @endcode
class DelayLine {
public:
    DelayLine() noexcept = default;
    ~DelayLine() = default;

    // Non-copyable, movable
    DelayLine(const DelayLine&) = delete;
    DelayLine& operator=(const DelayLine&) = delete;
    DelayLine(DelayLine&&) noexcept = default;
    DelayLine& operator=(DelayLine&&) noexcept = default;

    /// @brief Allocate the buffer (next power of 2 above the max delay).
    /// @note Allocates; call outside the render path. Clears the buffer.
    void prepare(double sampleRate, float maxDelaySeconds) noexcept;

    /// @brief Clear the buffer to silence without reallocating.
    void reset() noexcept;

    /// @brief Write one sample. Call once per sample, before reads.
    void write(float sample) noexcept;

    /// @brief Read at an integer delay, clamped to [0, maxDelaySamples].
    /// Delay 0 returns the most recently written sample.
    [[nodiscard]] float read(size_t delaySamples) const noexcept;

    /// @brief Read at a fractional delay with linear interpolation.
    /// Use for LFO-modulated delays (chorus) and smoothed delay times.
    [[nodiscard]] float readLinear(float delaySamples) const noexcept;

    [[nodiscard]] size_t maxDelaySamples() const noexcept { return maxDelaySamples_; }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }

private:
    std::vector<float> buffer_;      ///< Circular buffer (power-of-2 size)
    size_t mask_ = 0;                ///< Bitmask for wraparound (bufferSize - 1)
    size_t writeIndex_ = 0;          ///< Next write position
    double sampleRate_ = 0.0;
    size_t maxDelaySamples_ = 0;     ///< User-requested maximum, not buffer size
};

// =============================================================================
// Inline Implementation
// =============================================================================

inline void DelayLine::prepare(double sampleRate, float maxDelaySeconds) noexcept {
    sampleRate_ = sampleRate;
    maxDelaySamples_ = static_cast<size_t>(sampleRate * static_cast<double>(maxDelaySeconds));
    // +1 so a read at exactly maxDelaySamples is always valid
    const size_t bufferSize = nextPowerOf2(maxDelaySamples_ + 1);
    buffer_.assign(bufferSize, 0.0f);
    mask_ = bufferSize - 1;
    writeIndex_ = 0;
}

inline void DelayLine::reset() noexcept {
    std::fill(buffer_.begin(), buffer_.end(), 0.0f);
    writeIndex_ = 0;
}

inline void DelayLine::write(float sample) noexcept {
    if (buffer_.empty()) return;
    buffer_[writeIndex_] = sample;
    writeIndex_ = (writeIndex_ + 1) & mask_;
}

inline float DelayLine::read(size_t delaySamples) const noexcept {
    if (buffer_.empty()) return 0.0f;
    const size_t clampedDelay = std::min(delaySamples, maxDelaySamples_);
    // writeIndex_ points at the next write, so the newest sample is at writeIndex_ - 1
    const size_t readIndex = (writeIndex_ - 1 - clampedDelay) & mask_;
    return buffer_[readIndex];
}

inline float DelayLine::readLinear(float delaySamples) const noexcept {
    const float clampedDelay = std::clamp(delaySamples, 0.0f, static_cast<float>(maxDelaySamples_));
    const float intPart = std::floor(clampedDelay);
    const float frac = clampedDelay - intPart;

    const size_t index0 = static_cast<size_t>(intPart);
    const size_t index1 = std::min(index0 + 1, maxDelaySamples_);
    const float y0 = read(index0);
    const float y1 = read(index1);
    return y0 + frac * (y1 - y0);
}

} // namespace DSP
} // namespace Acordes
