/**
 * @file kpi.hpp
 * @brief Key performance indicators of a schedule.
 */

#pragma once

#include "core/result.hpp"
#include "model/problem.hpp"
#include "model/schedule.hpp"

#include <map>
#include <string>

namespace uras {

struct ScheduleKpi {
    TimeMs makespan_ms{0};
    TimeMs total_tardiness_ms{0};
    double mean_tardiness_ms{0.0};          ///< Over tasks with a due date
    TimeMs max_tardiness_ms{0};
    uint32_t tardy_task_count{0};
    double on_time_rate{1.0};               ///< Tasks without due date count as on time
    std::map<ResourceId, double> utilization;
    double mean_utilization{0.0};
    double mean_flow_time_ms{0.0};          ///< Completion − release, averaged over tasks
    double total_penalty{0.0};

    /**
     * @brief Compute indicators over [problem start, makespan).
     *
     * Utilization = busy / (calendar-available time × capacity).
     * InconsistentSchedule when an assignment names an unknown activity,
     * task or resource.
     */
    static Result<ScheduleKpi> compute(const ProblemIndex& problem, const Schedule& schedule);
};

}  // namespace uras
