/**
 * @file placement.hpp
 * @brief Resource timelines and the partial-schedule state shared by the
 *        greedy scheduler, the GA decoder and the CP search.
 *
 * All three place an activity the same way: on a chosen resource, at the
 * earliest start that is past the activity's release and its predecessors'
 * ends (plus delays), inside one calendar interval, and below the
 * resource's concurrency limit over the whole span.
 *
 * On a resource with a transition matrix, activities are appended after
 * the last booking and the span opens with the changeover from the task
 * placed there before.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "model/problem.hpp"
#include "model/schedule.hpp"

#include <optional>
#include <vector>

namespace uras {

// ─────────────────────────────────────────────
// ResourceTimeline
// ─────────────────────────────────────────────

class ResourceTimeline {
public:
    ResourceTimeline(const Calendar* calendar, uint32_t capacity)
        : calendar_(calendar), capacity_(capacity) {}

    /// Earliest s >= from where [s, s + duration) fits; nullopt if never.
    [[nodiscard]] std::optional<TimeMs> earliest_start(TimeMs from, TimeMs duration) const;
    [[nodiscard]] bool fits(TimeMs start, TimeMs duration) const;

    void reserve(TimeMs start, TimeMs end);

    [[nodiscard]] TimeMs busy_ms() const noexcept { return busy_ms_; }
    /// Booked time lying after t.
    [[nodiscard]] TimeMs booked_after(TimeMs t) const noexcept;
    [[nodiscard]] TimeMs last_end() const noexcept { return last_end_; }
    [[nodiscard]] const std::vector<Interval>& busy() const noexcept { return busy_; }

private:
    /// Next start worth trying if [start, end) breaks capacity.
    [[nodiscard]] std::optional<TimeMs> conflict_release(TimeMs start, TimeMs end) const;

    const Calendar* calendar_;
    uint32_t capacity_;
    std::vector<Interval> busy_;     ///< Sorted by start
    TimeMs busy_ms_{0};
    TimeMs last_end_{0};
};

// ─────────────────────────────────────────────
// ScheduleState
// ─────────────────────────────────────────────

struct Placement {
    ResourceIndex resource{kInvalidIndex};
    TimeMs start{0};
    TimeMs end{0};
    TimeMs changeover_ms{0};     ///< Leading part of [start, end)
};

/**
 * @brief Activities placed so far plus one timeline per resource.
 *
 * Copyable; the CP search keeps one copy per open node.
 */
class ScheduleState {
public:
    explicit ScheduleState(const ProblemIndex& problem);

    /// Release and placed predecessors' ends plus delays.
    [[nodiscard]] TimeMs ready_time(ActivityIndex a) const;
    [[nodiscard]] bool predecessors_placed(ActivityIndex a) const;

    /// ready_time, and on a changeover resource the end of its last booking.
    [[nodiscard]] TimeMs ready_on(ActivityIndex a, ResourceIndex r) const;
    /// Changeover `a` would pay if placed next on `r`.
    [[nodiscard]] TimeMs changeover_into(ActivityIndex a, ResourceIndex r) const;

    /// Earliest placement of `a` on `r`, no sooner than `from`.
    [[nodiscard]] std::optional<Placement> place_on(ActivityIndex a, ResourceIndex r, TimeMs from) const;

    /**
     * @brief Best placement over all candidates.
     *
     * Prefers placements meeting the hard deadline, then earliest start,
     * then earliest end, then candidate order.
     */
    [[nodiscard]] std::optional<Placement> best_placement(ActivityIndex a, TimeMs from) const;

    void commit(ActivityIndex a, const Placement& placement);

    [[nodiscard]] bool is_placed(ActivityIndex a) const noexcept { return placed_[a]; }
    [[nodiscard]] const Placement& placement(ActivityIndex a) const { return placements_[a]; }
    [[nodiscard]] size_t placed_count() const noexcept { return placed_count_; }
    [[nodiscard]] bool complete() const noexcept { return placed_count_ == problem_->activity_count(); }
    [[nodiscard]] const ResourceTimeline& timeline(ResourceIndex r) const { return timelines_[r]; }
    [[nodiscard]] TimeMs makespan_ms() const noexcept { return makespan_ms_; }

    /// Sum of soft-window penalties over placed activities.
    [[nodiscard]] double soft_penalty() const;
    /// Milliseconds past hard deadlines over placed activities.
    [[nodiscard]] TimeMs hard_overage_ms() const;

    /// InconsistentSchedule unless every activity is placed.
    [[nodiscard]] Result<Schedule> to_schedule() const;

    [[nodiscard]] const ProblemIndex& problem() const noexcept { return *problem_; }

private:
    const ProblemIndex* problem_;
    std::vector<ResourceTimeline> timelines_;
    std::vector<TaskIndex> last_task_;     ///< Per resource, kInvalidIndex when unused
    std::vector<Placement> placements_;
    std::vector<bool> placed_;
    size_t placed_count_{0};
    TimeMs makespan_ms_{0};
};

/// Weighted objective shared by the CP search and the GA fitness.
struct ObjectiveWeights {
    double makespan = 1.0;
    double penalty = 1.0;

    [[nodiscard]] double evaluate(TimeMs makespan_ms, double soft_penalty) const noexcept {
        return makespan * static_cast<double>(makespan_ms) + penalty * soft_penalty;
    }
};

}  // namespace uras
