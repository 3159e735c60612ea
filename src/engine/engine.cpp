/**
 * @file engine.cpp
 * @brief Request validation and algorithm dispatch.
 */

#include "engine/engine.hpp"

#include "cp/cp_solver.hpp"
#include "ga/ga_scheduler.hpp"
#include "scheduler/greedy_scheduler.hpp"

namespace uras {

ScheduleRequest ScheduleRequest::from_config(ProblemSpec problem, const EngineConfig& config) {
    problem.estimate = config.engine.estimate;
    return ScheduleRequest{
        .problem = std::move(problem),
        .algorithm = config.engine.algorithm,
        .objective = config.objective,
        .dispatching = config.dispatching,
        .ga = config.ga,
        .cp = config.cp
    };
}

Result<std::unique_ptr<ISchedulingAlgorithm>> make_algorithm(const ScheduleRequest& request) {
    auto engine = request.dispatching.make_engine();
    if (!engine) return engine.error();

    switch (request.algorithm) {
        case AlgorithmKind::Greedy:
            return std::unique_ptr<ISchedulingAlgorithm>(
                std::make_unique<GreedyScheduler>(std::move(*engine), request.objective));
        case AlgorithmKind::Ga: {
            GaConfig ga = request.ga;
            ga.weights = request.objective;
            if (auto valid = ga.validate(); !valid) return valid.error();
            return std::unique_ptr<ISchedulingAlgorithm>(
                std::make_unique<GaScheduler>(std::move(ga), std::move(*engine)));
        }
        case AlgorithmKind::Cp: {
            CpConfig cp = request.cp;
            cp.weights = request.objective;
            if (auto valid = cp.validate(); !valid) return valid.error();
            return std::unique_ptr<ISchedulingAlgorithm>(
                std::make_unique<CpSolver>(std::move(cp), std::move(*engine)));
        }
    }
    return Error{ErrorKind::InvalidSpec, "unknown algorithm selector"};
}

ScheduleResponse schedule(const ScheduleRequest& request, Logger* logger) {
    ScheduleResponse response;

    auto fail = [&](Error error) {
        log_to(logger, LogLevel::Warn, "engine",
               std::string(to_string(error.kind)) + ": " + error.message);
        response.error = std::move(error);
        return response;
    };

    auto problem = ProblemIndex::build(request.problem);
    if (!problem) return fail(problem.error());

    auto algorithm = make_algorithm(request);
    if (!algorithm) return fail(algorithm.error());

    log_to(logger, LogLevel::Info, "engine",
           "solving " + std::to_string(problem->activity_count()) + " activities on "
           + std::to_string(problem->resource_count()) + " resources with "
           + std::string((*algorithm)->name()));

    auto solved = run_algorithm(**algorithm, *problem, logger);
    if (!solved) return fail(solved.error());

    response.report = std::move(solved->first);
    response.kpi = std::move(solved->second);
    return response;
}

}  // namespace uras
