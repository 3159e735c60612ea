/**
 * @file placement.cpp
 * @brief ResourceTimeline search and ScheduleState bookkeeping.
 */

#include "scheduler/placement.hpp"

#include <algorithm>
#include <limits>
#include <tuple>

namespace uras {

// ─────────────────────────────────────────────
// ResourceTimeline
// ─────────────────────────────────────────────

std::optional<TimeMs> ResourceTimeline::conflict_release(TimeMs start, TimeMs end) const {
    // Check points: the span start and every busy start inside the span.
    // At the first point where the resource is full, the span can only
    // become feasible once the earliest of the covering intervals ends.
    std::vector<TimeMs> checkpoints{start};
    for (const auto& b : busy_) {
        if (b.start >= end) break;
        if (b.start > start && b.end > start) checkpoints.push_back(b.start);
    }
    std::sort(checkpoints.begin(), checkpoints.end());

    for (TimeMs p : checkpoints) {
        uint32_t count = 0;
        TimeMs earliest_end = std::numeric_limits<TimeMs>::max();
        for (const auto& b : busy_) {
            if (b.start > p) break;
            if (b.end > p) {
                ++count;
                earliest_end = std::min(earliest_end, b.end);
            }
        }
        if (count >= capacity_) return earliest_end;
    }
    return std::nullopt;
}

std::optional<TimeMs> ResourceTimeline::earliest_start(TimeMs from, TimeMs duration) const {
    TimeMs s = from;
    while (true) {
        auto slot = calendar_->next_slot(s, duration);
        if (!slot) return std::nullopt;
        s = *slot;
        if (duration == 0) return s;

        auto retry = conflict_release(s, s + duration);
        if (!retry) return s;
        s = *retry;
    }
}

bool ResourceTimeline::fits(TimeMs start, TimeMs duration) const {
    if (!calendar_->is_available(start, start + duration)) return false;
    if (duration == 0) return true;
    return !conflict_release(start, start + duration).has_value();
}

void ResourceTimeline::reserve(TimeMs start, TimeMs end) {
    last_end_ = std::max(last_end_, end);
    if (end <= start) return;
    Interval interval{start, end};
    auto pos = std::upper_bound(busy_.begin(), busy_.end(), interval);
    busy_.insert(pos, interval);
    busy_ms_ += end - start;
}

TimeMs ResourceTimeline::booked_after(TimeMs t) const noexcept {
    TimeMs total = 0;
    for (const auto& b : busy_) {
        if (b.end > t) total += b.end - std::max(b.start, t);
    }
    return total;
}

// ─────────────────────────────────────────────
// ScheduleState
// ─────────────────────────────────────────────

ScheduleState::ScheduleState(const ProblemIndex& problem)
    : problem_(&problem)
    , last_task_(problem.resource_count(), kInvalidIndex)
    , placements_(problem.activity_count())
    , placed_(problem.activity_count(), false) {
    timelines_.reserve(problem.resource_count());
    for (const auto& r : problem.resources()) {
        timelines_.emplace_back(&r.calendar, r.capacity);
    }
}

TimeMs ScheduleState::ready_time(ActivityIndex a) const {
    const auto& info = problem_->activity(a);
    TimeMs ready = info.release_ms;
    for (const auto& p : info.predecessors) {
        if (placed_[p.activity]) {
            ready = std::max(ready, placements_[p.activity].end + p.min_delay_ms);
        }
    }
    return ready;
}

bool ScheduleState::predecessors_placed(ActivityIndex a) const {
    const auto& preds = problem_->activity(a).predecessors;
    return std::all_of(preds.begin(), preds.end(),
        [this](const PrecedenceLink& p) { return placed_[p.activity]; });
}

TimeMs ScheduleState::ready_on(ActivityIndex a, ResourceIndex r) const {
    const TimeMs ready = ready_time(a);
    if (!problem_->has_changeovers(r)) return ready;
    return std::max(ready, timelines_[r].last_end());
}

TimeMs ScheduleState::changeover_into(ActivityIndex a, ResourceIndex r) const {
    if (last_task_[r] == kInvalidIndex) return 0;
    return problem_->changeover_ms(r, last_task_[r], problem_->activity(a).task);
}

std::optional<Placement> ScheduleState::place_on(ActivityIndex a, ResourceIndex r, TimeMs from) const {
    auto duration = problem_->duration_on(a, r);
    if (!duration) return std::nullopt;
    const TimeMs changeover = changeover_into(a, r);
    const TimeMs span = *duration + changeover;
    auto start = timelines_[r].earliest_start(std::max(from, ready_on(a, r)), span);
    if (!start) return std::nullopt;
    return Placement{r, *start, *start + span, changeover};
}

std::optional<Placement> ScheduleState::best_placement(ActivityIndex a, TimeMs from) const {
    const auto& info = problem_->activity(a);
    std::optional<Placement> best;
    std::tuple<bool, TimeMs, TimeMs> best_key{};

    for (const auto& c : info.candidates) {
        auto option = place_on(a, c.resource, from);
        if (!option) continue;
        bool late = info.deadline_ms && option->end > *info.deadline_ms;
        std::tuple<bool, TimeMs, TimeMs> key{late, option->start, option->end};
        if (!best || key < best_key) {
            best = option;
            best_key = key;
        }
    }
    return best;
}

void ScheduleState::commit(ActivityIndex a, const Placement& placement) {
    placements_[a] = placement;
    if (!placed_[a]) ++placed_count_;
    placed_[a] = true;
    timelines_[placement.resource].reserve(placement.start, placement.end);
    if (problem_->has_changeovers(placement.resource)) {
        last_task_[placement.resource] = problem_->activity(a).task;
    }
    makespan_ms_ = std::max(makespan_ms_, placement.end);
}

double ScheduleState::soft_penalty() const {
    double total = 0.0;
    for (const auto& sw : problem_->soft_windows()) {
        if (sw.scope == WindowScope::Activity) {
            if (!placed_[sw.target]) continue;
            const auto& p = placements_[sw.target];
            total += sw.window.penalty(p.start, p.end);
            continue;
        }
        std::optional<Interval> span;
        for (ActivityIndex a : problem_->task(sw.target).activities) {
            if (!placed_[a]) continue;
            const auto& p = placements_[a];
            if (!span) {
                span = Interval{p.start, p.end};
            } else {
                span->start = std::min(span->start, p.start);
                span->end = std::max(span->end, p.end);
            }
        }
        if (span) total += sw.window.penalty(span->start, span->end);
    }
    return total;
}

TimeMs ScheduleState::hard_overage_ms() const {
    TimeMs total = 0;
    for (ActivityIndex a = 0; a < problem_->activity_count(); ++a) {
        const auto& info = problem_->activity(a);
        if (!placed_[a] || !info.deadline_ms) continue;
        total += std::max<TimeMs>(0, placements_[a].end - *info.deadline_ms);
    }
    return total;
}

Result<Schedule> ScheduleState::to_schedule() const {
    if (!complete()) {
        return Error{ErrorKind::InconsistentSchedule,
                     std::to_string(problem_->activity_count() - placed_count_)
                     + " activities left unplaced"};
    }

    ScheduleBuilder builder;
    for (ActivityIndex a = 0; a < problem_->activity_count(); ++a) {
        const auto& info = problem_->activity(a);
        const auto& p = placements_[a];
        builder.add(Assignment{
            .activity_id = info.id,
            .task_id = problem_->task(info.task).id,
            .resource_id = problem_->resource(p.resource).id,
            .start_ms = p.start,
            .end_ms = p.end,
            .setup_ms = info.setup_ms + p.changeover_ms
        });
    }

    for (const auto& sw : problem_->soft_windows()) {
        TimeMs start = 0;
        TimeMs end = 0;
        std::string target;
        if (sw.scope == WindowScope::Activity) {
            start = placements_[sw.target].start;
            end = placements_[sw.target].end;
            target = problem_->activity(sw.target).id;
        } else {
            const auto& task = problem_->task(sw.target);
            if (task.activities.empty()) continue;
            start = std::numeric_limits<TimeMs>::max();
            for (ActivityIndex a : task.activities) {
                start = std::min(start, placements_[a].start);
                end = std::max(end, placements_[a].end);
            }
            target = task.id;
        }

        TimeMs overage = sw.window.overage_ms(start, end);
        if (overage == 0) continue;
        builder.add_violation(Violation{
            .target = target,
            .description = std::string(to_string(sw.scope)) + " soft window missed by "
                           + std::to_string(overage) + " ms",
            .overage_ms = overage,
            .penalty = sw.window.penalty(start, end),
            .hard = false
        });
    }

    return builder.build();
}

}  // namespace uras
