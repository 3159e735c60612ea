/**
 * @file cp_solver.hpp
 * @brief Exact scheduler: arc consistency, then branch-and-bound search.
 *
 * Each activity is a variable over (resource, start). The root domains are
 * made arc consistent; an emptied domain proves infeasibility without
 * search. The search then builds schedules one activity at a time, each
 * at its earliest start admitted by its domain and the resource timeline,
 * branching over the eligible activity and its candidate resources and
 * maintaining arc consistency after every decision.
 *
 * Optimal among active schedules, which always contain an optimum of the
 * weighted makespan/penalty objective.
 */

#pragma once

#include "dispatching/engine.hpp"
#include "scheduler/placement.hpp"
#include "scheduler/scheduler.hpp"

#include <cstdint>
#include <optional>

namespace uras {

struct CpConfig {
    TimeMs time_budget_ms = 60'000;
    uint64_t node_budget = 1'000'000;
    uint32_t threads = 1;                 ///< > 1 splits top-level branches
    bool stop_after_first = false;        ///< Return the first complete schedule
    bool seed_with_greedy = true;         ///< Greedy result as initial incumbent
    std::optional<TimeMs> horizon_ms;     ///< Latest finish searched; derived when unset
    ObjectiveWeights weights;

    [[nodiscard]] Result<void> validate() const;
};

class CpSolver : public ISchedulingAlgorithm {
public:
    /// `engine` breaks branching ties and drives the greedy seed.
    explicit CpSolver(CpConfig config = {}, DispatchEngine engine = {});

    /**
     * @return proven_optimal when the tree was exhausted; budget_exhausted
     *         with the best schedule when a budget stopped the search;
     *         BudgetExceeded when a budget stopped it before any schedule
     *         was found; Infeasible when none exists.
     */
    Result<SolveReport> solve(const ProblemIndex& problem, Logger* logger) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "cp"; }
    [[nodiscard]] const CpConfig& config() const noexcept { return config_; }

private:
    CpConfig config_;
    DispatchEngine engine_;
};

/**
 * @brief Finish time of a strictly serial schedule in topological order.
 *
 * Each activity waits for its predecessors' ends plus delays and pays the
 * largest changeover of its resource. Upper bound on the makespan of some
 * feasible schedule when no hard deadline interferes; Infeasible if an
 * activity has no calendar slot.
 */
[[nodiscard]] Result<TimeMs> serial_horizon(const ProblemIndex& problem);

}  // namespace uras
