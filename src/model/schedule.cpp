/**
 * @file schedule.cpp
 * @brief Schedule queries and builder.
 */

#include "model/schedule.hpp"

#include <algorithm>

namespace uras {

const Assignment* Schedule::find(const ActivityId& activity) const {
    auto it = by_activity_.find(activity);
    if (it == by_activity_.end()) return nullptr;
    return &assignments_[it->second];
}

std::vector<Assignment> Schedule::for_resource(const ResourceId& resource) const {
    std::vector<Assignment> out;
    for (const auto& a : assignments_) {
        if (a.resource_id == resource) out.push_back(a);
    }
    return out;
}

std::optional<TimeMs> Schedule::task_completion(const TaskId& task) const {
    std::optional<TimeMs> completion;
    for (const auto& a : assignments_) {
        if (a.task_id != task) continue;
        completion = completion ? std::max(*completion, a.end_ms) : a.end_ms;
    }
    return completion;
}

std::optional<TimeMs> Schedule::task_start(const TaskId& task) const {
    std::optional<TimeMs> start;
    for (const auto& a : assignments_) {
        if (a.task_id != task) continue;
        start = start ? std::min(*start, a.start_ms) : a.start_ms;
    }
    return start;
}

// ── ScheduleBuilder ──────────────────────────

ScheduleBuilder& ScheduleBuilder::add(Assignment assignment) {
    assignments_.push_back(std::move(assignment));
    return *this;
}

ScheduleBuilder& ScheduleBuilder::add_violation(Violation violation) {
    violations_.push_back(std::move(violation));
    return *this;
}

Result<Schedule> ScheduleBuilder::build() {
    Schedule schedule;

    std::sort(assignments_.begin(), assignments_.end(),
        [](const Assignment& a, const Assignment& b) {
            if (a.start_ms != b.start_ms) return a.start_ms < b.start_ms;
            if (a.resource_id != b.resource_id) return a.resource_id < b.resource_id;
            return a.activity_id < b.activity_id;
        });

    for (size_t i = 0; i < assignments_.size(); ++i) {
        const auto& a = assignments_[i];
        if (a.end_ms < a.start_ms) {
            return Error{ErrorKind::InconsistentSchedule,
                         "assignment for activity " + a.activity_id + " ends before it starts"};
        }
        if (!schedule.by_activity_.emplace(a.activity_id, i).second) {
            return Error{ErrorKind::InconsistentSchedule,
                         "activity " + a.activity_id + " is assigned more than once"};
        }
        schedule.makespan_ms_ = std::max(schedule.makespan_ms_, a.end_ms);
    }

    for (const auto& v : violations_) {
        schedule.penalty_ += v.penalty;
    }

    schedule.assignments_ = std::move(assignments_);
    schedule.violations_ = std::move(violations_);
    assignments_.clear();
    violations_.clear();
    return schedule;
}

}  // namespace uras
