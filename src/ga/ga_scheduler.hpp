/**
 * @file ga_scheduler.hpp
 * @brief Genetic algorithm over dual-vector chromosomes.
 */

#pragma once

#include "dispatching/engine.hpp"
#include "ga/operators.hpp"
#include "scheduler/placement.hpp"
#include "scheduler/scheduler.hpp"

#include <cstdint>

namespace uras {

struct GaConfig {
    uint32_t population_size = 100;
    uint32_t max_generations = 500;
    double crossover_rate = 0.8;
    double mutation_rate = 0.1;             ///< Sequence swap, per child
    double resource_mutation_rate = 0.1;    ///< Resource reassignment, per child
    uint32_t stagnation_limit = 50;         ///< Generations without improvement
    uint64_t seed = 42;
    SelectionMethod selection = SelectionMethod::Tournament;
    uint32_t tournament_size = 3;
    uint32_t elite_count = 10;
    uint32_t threads = 1;                   ///< Fitness evaluation workers
    bool seed_with_greedy = true;
    ObjectiveWeights weights;

    [[nodiscard]] Result<void> validate() const;
};

/**
 * @brief Evolves a population and returns the best decoded schedule.
 *
 * Deterministic for a fixed seed: all random draws happen on the calling
 * thread, workers only evaluate fitness.
 */
class GaScheduler : public ISchedulingAlgorithm {
public:
    explicit GaScheduler(GaConfig config = {}, DispatchEngine engine = {});

    /**
     * @return the best schedule with per-generation best fitness; Infeasible
     *         when even the best individual misses a hard deadline.
     */
    Result<SolveReport> solve(const ProblemIndex& problem, Logger* logger) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "ga"; }
    [[nodiscard]] const GaConfig& config() const noexcept { return config_; }

private:
    GaConfig config_;
    DispatchEngine engine_;
};

}  // namespace uras
