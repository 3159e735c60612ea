/**
 * @file greedy_scheduler.cpp
 * @brief GreedyScheduler: dispatch-rule list scheduling over event times.
 *
 * Algorithm:
 *   ready ← activities with no predecessors
 *   while activities remain:
 *     for each ready a: best placement at or after the clock
 *     t ← min start over ready; C ← ready activities starting at t
 *     place the dispatching engine's pick from C; clock ← t
 *     release successors whose predecessors are all placed
 *
 * Placement never moves backwards in time, so once a ready activity's best
 * placement misses its hard deadline no later decision can recover it.
 *
 * Complexity: O(A² × R × B) where A = activities, R = candidates per
 * activity, B = bookings per resource.
 */

#include "scheduler/greedy_scheduler.hpp"

#include <algorithm>
#include <chrono>

namespace uras {

namespace {

void refresh_context(DispatchContext& ctx, const ScheduleState& state,
                     const std::vector<ActivityIndex>& contenders, TimeMs now) {
    const auto& problem = state.problem();
    ctx.now = now;

    const TimeMs horizon = std::max<TimeMs>(1, state.makespan_ms() - problem.start_time_ms());
    for (ResourceIndex r = 0; r < problem.resource_count(); ++r) {
        const auto& timeline = state.timeline(r);
        ctx.queued_work[r] = timeline.booked_after(now);
        ctx.utilization[r] = std::min(1.0, static_cast<double>(timeline.busy_ms())
                                           / (static_cast<double>(horizon) * problem.resource(r).capacity));
    }

    double total = 0.0;
    for (ActivityIndex a : contenders) {
        total += static_cast<double>(problem.activity(a).nominal_total_ms());
    }
    ctx.average_processing_ms = contenders.empty() ? 0.0 : total / static_cast<double>(contenders.size());
}

}  // anonymous namespace

GreedyScheduler::GreedyScheduler(DispatchEngine engine, ObjectiveWeights weights)
    : engine_(std::move(engine)), weights_(weights) {}

Result<ScheduleState> GreedyScheduler::construct(const ProblemIndex& problem, Logger* logger) const {
    const size_t n = problem.activity_count();
    ScheduleState state(problem);
    DispatchContext ctx = DispatchContext::initial(problem, problem.start_time_ms());

    std::vector<size_t> pending(n);
    std::vector<ActivityIndex> ready;
    for (ActivityIndex a = 0; a < n; ++a) {
        pending[a] = problem.activity(a).predecessors.size();
        if (pending[a] == 0) ready.push_back(a);
    }

    TimeMs clock = problem.start_time_ms();
    std::vector<Placement> options(n);

    while (!state.complete()) {
        if (ready.empty()) {
            return Error{ErrorKind::Infeasible, "no activity can become ready"};
        }

        TimeMs decision_time = kTimeMax;
        for (ActivityIndex a : ready) {
            auto option = state.best_placement(a, clock);
            const auto& info = problem.activity(a);
            if (!option) {
                return Error{ErrorKind::Infeasible,
                             "activity " + info.id + " has no available slot on any candidate resource"};
            }
            if (info.deadline_ms && option->end > *info.deadline_ms) {
                return Error{ErrorKind::Infeasible,
                             "activity " + info.id + " cannot finish by its hard deadline "
                             + std::to_string(*info.deadline_ms) + " (earliest end "
                             + std::to_string(option->end) + ")"};
            }
            options[a] = *option;
            decision_time = std::min(decision_time, option->start);
        }

        std::vector<ActivityIndex> contenders;
        for (ActivityIndex a : ready) {
            if (options[a].start == decision_time) contenders.push_back(a);
        }

        refresh_context(ctx, state, contenders, decision_time);
        auto winner = engine_.select_best(problem, contenders, ctx);
        if (!winner) {
            return Error{ErrorKind::Infeasible, "dispatching produced no candidate"};
        }

        const ActivityIndex a = *winner;
        state.commit(a, options[a]);
        clock = decision_time;

        const auto& info = problem.activity(a);
        ctx.remaining_work[info.task] -= info.nominal_total_ms();
        ctx.remaining_ops[info.task] -= 1;
        std::erase(ready, a);

        for (const auto& s : info.successors) {
            if (--pending[s.activity] == 0) {
                ready.push_back(s.activity);
                ctx.ready_time[s.activity] = state.ready_time(s.activity);
            }
        }

        if (logger != nullptr && logger->enabled(LogLevel::Debug)) {
            logger->debug("greedy", "placed " + info.id + " on "
                          + problem.resource(options[a].resource).id + " ["
                          + std::to_string(options[a].start) + ", "
                          + std::to_string(options[a].end) + ")");
        }
    }

    return state;
}

Result<SolveReport> GreedyScheduler::solve(const ProblemIndex& problem, Logger* logger) {
    auto started = std::chrono::steady_clock::now();

    auto state = construct(problem, logger);
    if (!state) {
        log_to(logger, LogLevel::Warn, "greedy", state.error().message);
        return state.error();
    }

    auto schedule = state->to_schedule();
    if (!schedule) return schedule.error();

    SolveReport report;
    report.algorithm = std::string(name());
    report.objective = weights_.evaluate(schedule->makespan_ms(), schedule->penalty());
    report.schedule = std::move(*schedule);
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    log_to(logger, LogLevel::Info, "greedy",
           "rules " + engine_.describe() + ", makespan "
           + std::to_string(report.schedule.makespan_ms()) + " ms");
    return report;
}

}  // namespace uras
