/**
 * @file context.hpp
 * @brief Scheduling state that dispatching rules read.
 */

#pragma once

#include "core/types.hpp"
#include "model/problem.hpp"

#include <vector>

namespace uras {

/**
 * @brief Snapshot of the schedule under construction, indexed by handles.
 *
 * Vectors may be left empty; readers then fall back to problem data
 * (total task work, task release, zero load).
 */
struct DispatchContext {
    TimeMs now{0};
    std::vector<TimeMs> remaining_work;      ///< Per task, unscheduled work in ms
    std::vector<uint32_t> remaining_ops;     ///< Per task, unscheduled activities
    std::vector<TimeMs> queued_work;         ///< Per resource, booked work ending after now
    std::vector<double> utilization;         ///< Per resource, [0, 1]
    std::vector<TimeMs> ready_time;          ///< Per activity, when it became ready
    double average_processing_ms{0.0};

    /// Context before anything is scheduled.
    static DispatchContext initial(const ProblemIndex& problem, TimeMs now);

    [[nodiscard]] TimeMs remaining_work_of(const ProblemIndex& problem, TaskIndex t) const;
    [[nodiscard]] uint32_t remaining_ops_of(const ProblemIndex& problem, TaskIndex t) const;
    [[nodiscard]] TimeMs queued_work_of(ResourceIndex r) const noexcept;
    [[nodiscard]] double utilization_of(ResourceIndex r) const noexcept;
    [[nodiscard]] TimeMs ready_time_of(const ProblemIndex& problem, ActivityIndex a) const;
};

}  // namespace uras
