/**
 * @file calendar.cpp
 * @brief Calendar normalization and binary-search queries.
 */

#include "model/calendar.hpp"

#include <algorithm>

namespace uras {

namespace {

Result<void> check_interval(const Interval& interval) {
    if (interval.end < interval.start) {
        return Error{ErrorKind::InvalidSpec,
                     "calendar interval ends (" + std::to_string(interval.end)
                     + ") before it starts (" + std::to_string(interval.start) + ")"};
    }
    return {};
}

}  // anonymous namespace

Calendar::Calendar() : intervals_{Interval{kTimeMin, kTimeMax}} {}

Calendar Calendar::never_available() {
    return Calendar(std::vector<Interval>{});
}

std::vector<Interval> Calendar::normalize(std::vector<Interval> intervals) {
    std::erase_if(intervals, [](const Interval& i) { return i.empty(); });
    std::sort(intervals.begin(), intervals.end());

    std::vector<Interval> merged;
    merged.reserve(intervals.size());
    for (const auto& interval : intervals) {
        if (!merged.empty() && interval.start <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, interval.end);
        } else {
            merged.push_back(interval);
        }
    }
    return merged;
}

Result<Calendar> Calendar::from_intervals(std::vector<Interval> intervals) {
    for (const auto& interval : intervals) {
        if (auto ok = check_interval(interval); !ok) return ok.error();
    }
    return Calendar(normalize(std::move(intervals)));
}

Result<Calendar> Calendar::daily(TimeMs origin, TimeMs open_offset, TimeMs close_offset,
                                 uint32_t days, TimeMs day_length) {
    if (close_offset < open_offset || close_offset > day_length || open_offset < 0) {
        return Error{ErrorKind::InvalidSpec, "daily calendar window must lie within one day"};
    }
    std::vector<Interval> intervals;
    intervals.reserve(days);
    for (uint32_t d = 0; d < days; ++d) {
        TimeMs day_start = origin + static_cast<TimeMs>(d) * day_length;
        intervals.push_back({day_start + open_offset, day_start + close_offset});
    }
    return Calendar(normalize(std::move(intervals)));
}

Result<void> Calendar::add_interval(Interval interval) {
    if (auto ok = check_interval(interval); !ok) return ok;
    auto updated = intervals_;
    updated.push_back(interval);
    intervals_ = normalize(std::move(updated));
    return {};
}

Result<void> Calendar::block(Interval period) {
    if (auto ok = check_interval(period); !ok) return ok;
    if (period.empty()) return {};

    std::vector<Interval> updated;
    updated.reserve(intervals_.size() + 1);
    for (const auto& interval : intervals_) {
        if (!interval.overlaps(period.start, period.end)) {
            updated.push_back(interval);
            continue;
        }
        if (interval.start < period.start) {
            updated.push_back({interval.start, period.start});
        }
        if (period.end < interval.end) {
            updated.push_back({period.end, interval.end});
        }
    }
    intervals_ = std::move(updated);
    return {};
}

bool Calendar::is_available(TimeMs t0, TimeMs t1) const noexcept {
    if (t1 < t0) return false;
    // Last interval starting at or before t0.
    auto it = std::upper_bound(intervals_.begin(), intervals_.end(), t0,
        [](TimeMs t, const Interval& i) { return t < i.start; });
    if (it == intervals_.begin()) return false;
    --it;
    if (t0 == t1) return t0 <= it->end;
    return it->contains(t0, t1);
}

std::optional<TimeMs> Calendar::next_slot(TimeMs t, TimeMs duration) const noexcept {
    auto it = std::upper_bound(intervals_.begin(), intervals_.end(), t,
        [](TimeMs time, const Interval& i) { return time < i.start; });
    if (it != intervals_.begin()) --it;

    for (; it != intervals_.end(); ++it) {
        TimeMs start = std::max(t, it->start);
        if (start + duration <= it->end) return start;
    }
    return std::nullopt;
}

TimeMs Calendar::available_time(TimeMs t0, TimeMs t1) const noexcept {
    if (t1 <= t0) return 0;
    TimeMs total = 0;
    auto it = std::upper_bound(intervals_.begin(), intervals_.end(), t0,
        [](TimeMs t, const Interval& i) { return t < i.start; });
    if (it != intervals_.begin()) --it;
    for (; it != intervals_.end() && it->start < t1; ++it) {
        TimeMs lo = std::max(t0, it->start);
        TimeMs hi = std::min(t1, it->end);
        if (hi > lo) total += hi - lo;
    }
    return total;
}

bool Calendar::is_always_available() const noexcept {
    return intervals_.size() == 1 && intervals_.front().start <= kTimeMin
        && intervals_.front().end >= kTimeMax;
}

}  // namespace uras
