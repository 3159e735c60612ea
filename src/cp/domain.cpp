/**
 * @file domain.cpp
 * @brief IntervalSet operations and initial domain construction.
 */

#include "cp/domain.hpp"

#include <algorithm>
#include <limits>

namespace uras {

// ─────────────────────────────────────────────
// IntervalSet
// ─────────────────────────────────────────────

IntervalSet::IntervalSet(std::vector<Range> ranges) {
    std::erase_if(ranges, [](const Range& r) { return r.lo > r.hi; });
    std::sort(ranges.begin(), ranges.end());
    for (const auto& r : ranges) {
        if (!ranges_.empty() && r.lo <= ranges_.back().hi + 1) {
            ranges_.back().hi = std::max(ranges_.back().hi, r.hi);
        } else {
            ranges_.push_back(r);
        }
    }
}

uint64_t IntervalSet::size() const noexcept {
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    uint64_t total = 0;
    for (const auto& r : ranges_) {
        auto width = static_cast<uint64_t>(r.hi - r.lo) + 1;
        if (total > kMax - width) return kMax;
        total += width;
    }
    return total;
}

bool IntervalSet::contains(TimeMs value) const noexcept {
    auto it = std::upper_bound(ranges_.begin(), ranges_.end(), value,
        [](TimeMs v, const Range& r) { return v < r.lo; });
    if (it == ranges_.begin()) return false;
    --it;
    return value <= it->hi;
}

std::optional<TimeMs> IntervalSet::first_at_or_after(TimeMs value) const noexcept {
    for (const auto& r : ranges_) {
        if (r.hi < value) continue;
        return std::max(r.lo, value);
    }
    return std::nullopt;
}

bool IntervalSet::remove_below(TimeMs bound) {
    if (ranges_.empty() || ranges_.front().lo >= bound) return false;
    std::vector<Range> kept;
    for (const auto& r : ranges_) {
        if (r.hi < bound) continue;
        kept.push_back(Range{std::max(r.lo, bound), r.hi});
    }
    ranges_ = std::move(kept);
    return true;
}

bool IntervalSet::remove_above(TimeMs bound) {
    if (ranges_.empty() || ranges_.back().hi <= bound) return false;
    std::vector<Range> kept;
    for (const auto& r : ranges_) {
        if (r.lo > bound) break;
        kept.push_back(Range{r.lo, std::min(r.hi, bound)});
    }
    ranges_ = std::move(kept);
    return true;
}

bool IntervalSet::remove_range(TimeMs lo, TimeMs hi) {
    if (lo > hi) return false;
    bool changed = false;
    std::vector<Range> kept;
    kept.reserve(ranges_.size() + 1);
    for (const auto& r : ranges_) {
        if (r.hi < lo || r.lo > hi) {
            kept.push_back(r);
            continue;
        }
        changed = true;
        if (r.lo < lo) kept.push_back(Range{r.lo, lo - 1});
        if (r.hi > hi) kept.push_back(Range{hi + 1, r.hi});
    }
    if (changed) ranges_ = std::move(kept);
    return changed;
}

// ─────────────────────────────────────────────
// ActivityDomain
// ─────────────────────────────────────────────

bool ActivityDomain::empty() const noexcept {
    return std::all_of(options_.begin(), options_.end(),
        [](const ResourceDomain& o) { return o.starts.empty(); });
}

uint64_t ActivityDomain::size() const noexcept {
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    uint64_t total = 0;
    for (const auto& o : options_) {
        uint64_t s = o.starts.size();
        if (total > kMax - s) return kMax;
        total += s;
    }
    return total;
}

TimeMs ActivityDomain::earliest_start() const {
    TimeMs best = kTimeMax;
    for (const auto& o : options_) {
        if (!o.starts.empty()) best = std::min(best, o.starts.min());
    }
    return best;
}

TimeMs ActivityDomain::earliest_finish() const {
    TimeMs best = kTimeMax;
    for (const auto& o : options_) {
        if (!o.starts.empty()) best = std::min(best, o.starts.min() + o.duration_ms);
    }
    return best;
}

TimeMs ActivityDomain::latest_start() const {
    TimeMs best = std::numeric_limits<TimeMs>::min();
    for (const auto& o : options_) {
        if (!o.starts.empty()) best = std::max(best, o.starts.max());
    }
    return best;
}

std::optional<ResourceIndex> ActivityDomain::sole_resource() const noexcept {
    std::optional<ResourceIndex> sole;
    for (const auto& o : options_) {
        if (o.starts.empty()) continue;
        if (sole) return std::nullopt;
        sole = o.resource;
    }
    return sole;
}

const ResourceDomain* ActivityDomain::find(ResourceIndex r) const noexcept {
    for (const auto& o : options_) {
        if (o.resource == r) return &o;
    }
    return nullptr;
}

void ActivityDomain::fix(ResourceIndex r, TimeMs start) {
    for (auto& o : options_) {
        o.starts = o.resource == r ? IntervalSet::single(start) : IntervalSet{};
    }
}

// ─────────────────────────────────────────────
// Initial domains
// ─────────────────────────────────────────────

std::vector<ActivityDomain> initial_domains(const ProblemIndex& problem, TimeMs horizon_ms) {
    std::vector<ActivityDomain> domains;
    domains.reserve(problem.activity_count());

    for (const auto& info : problem.activities()) {
        const TimeMs finish_bound = info.deadline_ms ? std::min(*info.deadline_ms, horizon_ms) : horizon_ms;

        std::vector<ResourceDomain> options;
        options.reserve(info.candidates.size());
        for (const auto& c : info.candidates) {
            std::vector<Range> ranges;
            for (const auto& window : problem.resource(c.resource).calendar.intervals()) {
                TimeMs lo = std::max(window.start, info.head_ms);
                TimeMs hi = std::min(window.end, finish_bound) - c.duration_ms;
                if (window.start >= finish_bound) break;
                if (lo <= hi) ranges.push_back(Range{lo, hi});
            }
            options.push_back(ResourceDomain{c.resource, c.duration_ms, IntervalSet(std::move(ranges))});
        }
        domains.emplace_back(std::move(options));
    }
    return domains;
}

}  // namespace uras
