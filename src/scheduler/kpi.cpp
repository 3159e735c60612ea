/**
 * @file kpi.cpp
 * @brief ScheduleKpi computation.
 */

#include "scheduler/kpi.hpp"

#include <algorithm>
#include <vector>

namespace uras {

Result<ScheduleKpi> ScheduleKpi::compute(const ProblemIndex& problem, const Schedule& schedule) {
    ScheduleKpi kpi;
    kpi.makespan_ms = schedule.makespan_ms();
    kpi.total_penalty = schedule.penalty();

    std::vector<TimeMs> busy(problem.resource_count(), 0);
    std::vector<std::optional<TimeMs>> completion(problem.task_count());

    for (const auto& asg : schedule.assignments()) {
        if (!problem.find_activity(asg.activity_id)) {
            return Error{ErrorKind::InconsistentSchedule,
                         "schedule references unknown activity " + asg.activity_id};
        }
        auto t = problem.find_task(asg.task_id);
        if (!t) {
            return Error{ErrorKind::InconsistentSchedule,
                         "schedule references unknown task " + asg.task_id};
        }
        auto r = problem.find_resource(asg.resource_id);
        if (!r) {
            return Error{ErrorKind::InconsistentSchedule,
                         "schedule references unknown resource " + asg.resource_id};
        }
        busy[*r] += asg.duration_ms();
        completion[*t] = completion[*t] ? std::max(*completion[*t], asg.end_ms) : asg.end_ms;
    }

    // ── Tardiness & flow time ─────────────────
    uint32_t with_due = 0;
    uint32_t on_time = 0;
    uint32_t completed = 0;
    double flow_sum = 0.0;

    for (TaskIndex t = 0; t < problem.task_count(); ++t) {
        const auto& task = problem.task(t);
        if (completion[t]) {
            ++completed;
            flow_sum += static_cast<double>(*completion[t] - task.release_ms);
        }
        if (!task.due_date) {
            ++on_time;
            continue;
        }
        ++with_due;
        TimeMs finish = completion[t].value_or(task.release_ms);
        TimeMs tardiness = std::max<TimeMs>(0, finish - *task.due_date);
        kpi.total_tardiness_ms += tardiness;
        kpi.max_tardiness_ms = std::max(kpi.max_tardiness_ms, tardiness);
        if (tardiness > 0) {
            ++kpi.tardy_task_count;
        } else {
            ++on_time;
        }
    }

    if (with_due > 0) {
        kpi.mean_tardiness_ms = static_cast<double>(kpi.total_tardiness_ms) / with_due;
    }
    if (problem.task_count() > 0) {
        kpi.on_time_rate = static_cast<double>(on_time) / static_cast<double>(problem.task_count());
    }
    if (completed > 0) {
        kpi.mean_flow_time_ms = flow_sum / completed;
    }

    // ── Utilization ───────────────────────────
    const TimeMs horizon_start = problem.start_time_ms();
    const TimeMs horizon_end = std::max(kpi.makespan_ms, horizon_start);
    double util_sum = 0.0;

    for (ResourceIndex r = 0; r < problem.resource_count(); ++r) {
        const auto& res = problem.resource(r);
        TimeMs available = res.calendar.available_time(horizon_start, horizon_end);
        double denom = static_cast<double>(available) * res.capacity;
        double util = denom > 0.0 ? static_cast<double>(busy[r]) / denom : 0.0;
        kpi.utilization[res.id] = util;
        util_sum += util;
    }
    if (problem.resource_count() > 0) {
        kpi.mean_utilization = util_sum / static_cast<double>(problem.resource_count());
    }

    return kpi;
}

}  // namespace uras
