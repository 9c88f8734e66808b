#pragma once

// ==============================================================================
// ParamUpdate value type and conversions
// ==============================================================================
// A ParamUpdate carries string keys mapped to either a number or a name.
// The helpers below turn a value into what a parameter group needs; each
// returns std::nullopt when the value cannot be interpreted, and the caller
// leaves the parameter unchanged.
// ==============================================================================

#include <acordes/dsp/core/db_utils.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace Acordes {

using ParamValue = std::variant<double, std::string>;

/// Case-insensitive ASCII comparison.
inline bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) return false;
    }
    return true;
}

/// Finite number, or nothing. Strings are not parsed as numbers.
inline std::optional<double> toNumber(const ParamValue& value) noexcept {
    if (const auto* number = std::get_if<double>(&value)) {
        if (DSP::detail::isFiniteBits(*number)) return *number;
    }
    return std::nullopt;
}

/// Number clamped into [lo, hi].
inline std::optional<float> toClampedFloat(const ParamValue& value, float lo, float hi) noexcept {
    const auto number = toNumber(value);
    if (!number) return std::nullopt;
    return std::clamp(static_cast<float>(*number), lo, hi);
}

/// Number rounded to the nearest integer and clamped into [lo, hi].
inline std::optional<int> toClampedInt(const ParamValue& value, int lo, int hi) noexcept {
    const auto number = toNumber(value);
    if (!number) return std::nullopt;
    const double clamped = std::clamp(*number, static_cast<double>(lo), static_cast<double>(hi));
    return static_cast<int>(std::lround(clamped));
}

/// Numbers: >= 0.5 is true. Strings: on/off, true/false, yes/no.
inline std::optional<bool> toBool(const ParamValue& value) noexcept {
    if (const auto number = toNumber(value)) {
        return *number >= 0.5;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        if (equalsIgnoreCase(*text, "on") || equalsIgnoreCase(*text, "true") ||
            equalsIgnoreCase(*text, "yes")) {
            return true;
        }
        if (equalsIgnoreCase(*text, "off") || equalsIgnoreCase(*text, "false") ||
            equalsIgnoreCase(*text, "no")) {
            return false;
        }
    }
    return std::nullopt;
}

/// Index into a name table. Accepts a name from the table or a numeric
/// index, which is rounded and clamped into range.
inline std::optional<int> toChoice(const ParamValue& value,
                                   std::span<const std::string_view> names) noexcept {
    if (names.empty()) return std::nullopt;
    if (const auto* text = std::get_if<std::string>(&value)) {
        for (size_t i = 0; i < names.size(); ++i) {
            if (equalsIgnoreCase(*text, names[i])) return static_cast<int>(i);
        }
        return std::nullopt;
    }
    return toClampedInt(value, 0, static_cast<int>(names.size()) - 1);
}

/// Store a converted value; false (field untouched) when conversion failed.
template <typename T>
inline bool assignIf(T& field, const std::optional<T>& converted) noexcept {
    if (!converted) return false;
    field = *converted;
    return true;
}

} // namespace Acordes
