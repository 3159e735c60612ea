/**
 * @file engine.hpp
 * @brief The schedule(request) -> response boundary.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "model/problem.hpp"
#include "scheduler/kpi.hpp"
#include "scheduler/scheduler.hpp"

#include <memory>
#include <optional>

namespace uras {

struct ScheduleRequest {
    ProblemSpec problem;
    AlgorithmKind algorithm = AlgorithmKind::Greedy;
    ObjectiveWeights objective;
    DispatchingConfig dispatching;
    GaConfig ga;
    CpConfig cp;

    /// Algorithm settings and estimate policy from a loaded configuration.
    static ScheduleRequest from_config(ProblemSpec problem, const EngineConfig& config);
};

struct ScheduleResponse {
    std::optional<SolveReport> report;
    std::optional<ScheduleKpi> kpi;
    std::optional<Error> error;

    [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

/// Instantiate the selected algorithm with the request's settings.
[[nodiscard]] Result<std::unique_ptr<ISchedulingAlgorithm>> make_algorithm(const ScheduleRequest& request);

/**
 * @brief Statically dispatched solve plus KPI computation.
 */
template <SchedulingAlgorithmLike A>
Result<std::pair<SolveReport, ScheduleKpi>> run_algorithm(A& algorithm, const ProblemIndex& problem,
                                                          Logger* logger) {
    auto report = algorithm.solve(problem, logger);
    if (!report) return report.error();
    auto kpi = ScheduleKpi::compute(problem, report->schedule);
    if (!kpi) return kpi.error();
    return std::pair{std::move(*report), std::move(*kpi)};
}

/**
 * @brief Validate, index, solve and measure one request.
 *
 * Never throws for bad input: every failure is reported in the response
 * as an Error of the matching kind.
 */
[[nodiscard]] ScheduleResponse schedule(const ScheduleRequest& request, Logger* logger = nullptr);

}  // namespace uras
