/**
 * @file context.cpp
 * @brief DispatchContext defaults and lookups.
 */

#include "dispatching/context.hpp"

namespace uras {

DispatchContext DispatchContext::initial(const ProblemIndex& problem, TimeMs now) {
    DispatchContext ctx;
    ctx.now = now;
    ctx.remaining_work.reserve(problem.task_count());
    ctx.remaining_ops.reserve(problem.task_count());
    for (const auto& t : problem.tasks()) {
        ctx.remaining_work.push_back(t.total_work_ms);
        ctx.remaining_ops.push_back(static_cast<uint32_t>(t.activities.size()));
    }
    ctx.queued_work.assign(problem.resource_count(), 0);
    ctx.utilization.assign(problem.resource_count(), 0.0);
    ctx.ready_time.reserve(problem.activity_count());
    double total = 0.0;
    for (const auto& a : problem.activities()) {
        ctx.ready_time.push_back(a.head_ms);
        total += static_cast<double>(a.nominal_total_ms());
    }
    if (problem.activity_count() > 0) {
        ctx.average_processing_ms = total / static_cast<double>(problem.activity_count());
    }
    return ctx;
}

TimeMs DispatchContext::remaining_work_of(const ProblemIndex& problem, TaskIndex t) const {
    if (t < remaining_work.size()) return remaining_work[t];
    return problem.task(t).total_work_ms;
}

uint32_t DispatchContext::remaining_ops_of(const ProblemIndex& problem, TaskIndex t) const {
    if (t < remaining_ops.size()) return remaining_ops[t];
    return static_cast<uint32_t>(problem.task(t).activities.size());
}

TimeMs DispatchContext::queued_work_of(ResourceIndex r) const noexcept {
    return r < queued_work.size() ? queued_work[r] : 0;
}

double DispatchContext::utilization_of(ResourceIndex r) const noexcept {
    return r < utilization.size() ? utilization[r] : 0.0;
}

TimeMs DispatchContext::ready_time_of(const ProblemIndex& problem, ActivityIndex a) const {
    if (a < ready_time.size()) return ready_time[a];
    return problem.task(problem.activity(a).task).release_ms;
}

}  // namespace uras
