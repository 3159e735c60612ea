/**
 * @file scheduler.hpp
 * @brief Solve report and the runtime interface shared by all algorithms.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "model/problem.hpp"
#include "model/schedule.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace uras {

/**
 * @brief Outcome of one algorithm run.
 */
struct SolveReport {
    Schedule schedule;
    std::string algorithm;
    double objective{0.0};
    bool proven_optimal = false;
    bool budget_exhausted = false;          ///< Search stopped on a budget
    uint64_t nodes_explored{0};             ///< CP
    uint32_t generations{0};                ///< GA
    std::vector<double> fitness_history;    ///< GA best fitness per generation
    std::chrono::milliseconds elapsed{0};
};

/**
 * @brief Abstract interface for scheduling algorithms (runtime polymorphism).
 *
 * Complements the SchedulingAlgorithmLike concept for contexts that pick
 * the algorithm from configuration.
 */
class ISchedulingAlgorithm {
public:
    virtual ~ISchedulingAlgorithm() = default;
    virtual Result<SolveReport> solve(const ProblemIndex& problem, Logger* logger) = 0;
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace uras
