/**
 * @file schedule.hpp
 * @brief Immutable schedule produced by an algorithm, and its builder.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace uras {

struct Assignment {
    ActivityId activity_id;
    TaskId task_id;
    ResourceId resource_id;
    TimeMs start_ms{0};
    TimeMs end_ms{0};
    TimeMs setup_ms{0};

    [[nodiscard]] TimeMs duration_ms() const noexcept { return end_ms - start_ms; }
};

/**
 * @brief A constraint breach recorded on a schedule (soft windows only in
 *        schedules returned to callers).
 */
struct Violation {
    std::string target;          ///< Activity or task id
    std::string description;
    TimeMs overage_ms{0};
    double penalty{0.0};
    bool hard = false;
};

/**
 * @brief Activity → (resource, start, end) mapping with derived makespan.
 *
 * Only ScheduleBuilder creates non-empty schedules; once built a schedule
 * is never mutated.
 */
class Schedule {
public:
    Schedule() = default;

    [[nodiscard]] const std::vector<Assignment>& assignments() const noexcept { return assignments_; }
    [[nodiscard]] const std::vector<Violation>& violations() const noexcept { return violations_; }
    [[nodiscard]] size_t size() const noexcept { return assignments_.size(); }
    [[nodiscard]] bool empty() const noexcept { return assignments_.empty(); }

    [[nodiscard]] const Assignment* find(const ActivityId& activity) const;
    [[nodiscard]] std::vector<Assignment> for_resource(const ResourceId& resource) const;
    /// Latest end over the task's assignments.
    [[nodiscard]] std::optional<TimeMs> task_completion(const TaskId& task) const;
    /// Earliest start over the task's assignments.
    [[nodiscard]] std::optional<TimeMs> task_start(const TaskId& task) const;

    /// Max end time over all assignments; 0 for an empty schedule.
    [[nodiscard]] TimeMs makespan_ms() const noexcept { return makespan_ms_; }
    /// Sum of soft-window penalties.
    [[nodiscard]] double penalty() const noexcept { return penalty_; }

private:
    friend class ScheduleBuilder;

    std::vector<Assignment> assignments_;
    std::vector<Violation> violations_;
    std::unordered_map<ActivityId, size_t> by_activity_;
    TimeMs makespan_ms_{0};
    double penalty_{0.0};
};

class ScheduleBuilder {
public:
    ScheduleBuilder& add(Assignment assignment);
    ScheduleBuilder& add_violation(Violation violation);

    /// InconsistentSchedule on duplicate activities or end < start.
    [[nodiscard]] Result<Schedule> build();

private:
    std::vector<Assignment> assignments_;
    std::vector<Violation> violations_;
};

}  // namespace uras
