/**
 * @file domain.hpp
 * @brief Finite domains of the CP model.
 *
 * The variable of an activity ranges over (resource, start) pairs. For each
 * candidate resource the admissible starts are an IntervalSet of closed
 * integer ranges, which keeps millisecond-resolution domains compact.
 */

#pragma once

#include "core/types.hpp"
#include "model/problem.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace uras {

/// Closed integer range [lo, hi].
struct Range {
    TimeMs lo{0};
    TimeMs hi{0};

    auto operator<=>(const Range&) const = default;
};

class IntervalSet {
public:
    IntervalSet() = default;
    /// Ranges with lo > hi are dropped; the rest are sorted and merged.
    explicit IntervalSet(std::vector<Range> ranges);

    static IntervalSet single(TimeMs value) { return IntervalSet({Range{value, value}}); }

    [[nodiscard]] bool empty() const noexcept { return ranges_.empty(); }
    [[nodiscard]] TimeMs min() const { return ranges_.front().lo; }
    [[nodiscard]] TimeMs max() const { return ranges_.back().hi; }
    /// Number of values, saturating at UINT64_MAX.
    [[nodiscard]] uint64_t size() const noexcept;
    [[nodiscard]] bool contains(TimeMs value) const noexcept;
    [[nodiscard]] std::optional<TimeMs> first_at_or_after(TimeMs value) const noexcept;
    [[nodiscard]] const std::vector<Range>& ranges() const noexcept { return ranges_; }

    /// Each returns true when the set changed.
    bool remove_below(TimeMs bound);
    bool remove_above(TimeMs bound);
    bool remove_range(TimeMs lo, TimeMs hi);

private:
    std::vector<Range> ranges_;
};

struct ResourceDomain {
    ResourceIndex resource{kInvalidIndex};
    TimeMs duration_ms{0};
    IntervalSet starts;
};

/**
 * @brief Domain of one activity variable.
 */
class ActivityDomain {
public:
    ActivityDomain() = default;
    explicit ActivityDomain(std::vector<ResourceDomain> options) : options_(std::move(options)) {}

    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] uint64_t size() const noexcept;

    /// Bounds over every non-empty option; only valid when !empty().
    [[nodiscard]] TimeMs earliest_start() const;
    [[nodiscard]] TimeMs earliest_finish() const;
    [[nodiscard]] TimeMs latest_start() const;

    /// The only resource with admissible starts, if exactly one remains.
    [[nodiscard]] std::optional<ResourceIndex> sole_resource() const noexcept;

    [[nodiscard]] std::vector<ResourceDomain>& options() noexcept { return options_; }
    [[nodiscard]] const std::vector<ResourceDomain>& options() const noexcept { return options_; }
    [[nodiscard]] const ResourceDomain* find(ResourceIndex r) const noexcept;

    /// Collapse to a single (resource, start) value.
    void fix(ResourceIndex r, TimeMs start);

private:
    std::vector<ResourceDomain> options_;
};

/**
 * @brief Node-consistent starting domains.
 *
 * Per candidate: starts inside one calendar interval, no earlier than the
 * activity's head (release plus predecessor chain), finishing by the hard
 * deadline and by the horizon.
 */
[[nodiscard]] std::vector<ActivityDomain> initial_domains(const ProblemIndex& problem, TimeMs horizon_ms);

}  // namespace uras
