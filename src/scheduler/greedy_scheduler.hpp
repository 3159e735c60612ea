/**
 * @file greedy_scheduler.hpp
 * @brief Event-driven list scheduler driven by the dispatching engine.
 */

#pragma once

#include "dispatching/engine.hpp"
#include "scheduler/placement.hpp"
#include "scheduler/scheduler.hpp"

namespace uras {

class GreedyScheduler : public ISchedulingAlgorithm {
public:
    explicit GreedyScheduler(DispatchEngine engine, ObjectiveWeights weights = {});

    Result<SolveReport> solve(const ProblemIndex& problem, Logger* logger) override;

    /// Build the complete placement state; also used to seed GA and CP.
    [[nodiscard]] Result<ScheduleState> construct(const ProblemIndex& problem, Logger* logger) const;

    [[nodiscard]] std::string_view name() const noexcept override { return "greedy"; }

private:
    DispatchEngine engine_;
    ObjectiveWeights weights_;
};

}  // namespace uras
