/**
 * @file types.hpp
 * @brief Fundamental types used throughout U-RAS.
 *
 * Defines identifiers, the millisecond time base, and the stable integer
 * handles that algorithms use instead of string ids on their hot paths.
 */

#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace uras {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using TaskId = std::string;
using ActivityId = std::string;
using ResourceId = std::string;

/// Absolute time or duration in milliseconds.
using TimeMs = int64_t;

inline constexpr TimeMs kTimeMin = 0;
inline constexpr TimeMs kTimeMax = std::numeric_limits<TimeMs>::max() / 4;

// ─────────────────────────────────────────────
// Stable Handles
// ─────────────────────────────────────────────

/// Dense index of an activity inside a ProblemIndex.
using ActivityIndex = uint32_t;
/// Dense index of a resource inside a ProblemIndex.
using ResourceIndex = uint32_t;
/// Dense index of a task inside a ProblemIndex.
using TaskIndex = uint32_t;

inline constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

// ─────────────────────────────────────────────
// Interval
// ─────────────────────────────────────────────

/**
 * @brief Half-open time interval [start, end).
 */
struct Interval {
    TimeMs start{0};
    TimeMs end{0};

    [[nodiscard]] constexpr TimeMs length() const noexcept { return end - start; }
    [[nodiscard]] constexpr bool empty() const noexcept { return end <= start; }

    [[nodiscard]] constexpr bool contains(TimeMs t0, TimeMs t1) const noexcept {
        return start <= t0 && t1 <= end;
    }

    [[nodiscard]] constexpr bool overlaps(TimeMs t0, TimeMs t1) const noexcept {
        return t0 < end && start < t1;
    }

    auto operator<=>(const Interval&) const = default;
};

// ─────────────────────────────────────────────
// Resource Kind
// ─────────────────────────────────────────────

enum class ResourceKind : uint8_t {
    Primary,       ///< Machine, room, vehicle
    Secondary,     ///< Tooling, fixtures
    Human          ///< Operator, staff
};

[[nodiscard]] constexpr std::string_view to_string(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::Primary:   return "primary";
        case ResourceKind::Secondary: return "secondary";
        case ResourceKind::Human:     return "human";
    }
    return "unknown";
}

}  // namespace uras
