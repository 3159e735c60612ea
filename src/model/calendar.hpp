/**
 * @file calendar.hpp
 * @brief Resource availability as sorted, non-overlapping intervals.
 *
 * Queries binary-search the interval list. Mutations (adding availability,
 * blocking a period) rebuild the list and keep it normalized.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace uras {

class Calendar {
public:
    /// Always available over [kTimeMin, kTimeMax).
    Calendar();

    static Calendar always_available() { return Calendar{}; }
    static Calendar never_available();

    /// Sorts and merges the intervals; an inverted interval is InvalidSpec.
    static Result<Calendar> from_intervals(std::vector<Interval> intervals);

    /// Repeating daily window [open, close) for `days` days from `origin`.
    static Result<Calendar> daily(TimeMs origin, TimeMs open_offset, TimeMs close_offset,
                                  uint32_t days, TimeMs day_length = 86'400'000);

    /// Add availability; overlapping or touching intervals are merged.
    Result<void> add_interval(Interval interval);
    /// Remove [start, end) from availability (holiday, maintenance).
    Result<void> block(Interval period);

    [[nodiscard]] bool is_available(TimeMs t0, TimeMs t1) const noexcept;
    /// Earliest s >= t such that [s, s + duration) lies inside one interval.
    [[nodiscard]] std::optional<TimeMs> next_slot(TimeMs t, TimeMs duration) const noexcept;
    /// Total available time overlapping [t0, t1).
    [[nodiscard]] TimeMs available_time(TimeMs t0, TimeMs t1) const noexcept;

    [[nodiscard]] const std::vector<Interval>& intervals() const noexcept { return intervals_; }
    [[nodiscard]] bool is_always_available() const noexcept;

private:
    explicit Calendar(std::vector<Interval> normalized) : intervals_(std::move(normalized)) {}

    static std::vector<Interval> normalize(std::vector<Interval> intervals);

    std::vector<Interval> intervals_;
};

}  // namespace uras
