/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for uras interfaces.
 *
 * Compile-time counterparts of the virtual interfaces, for call sites that
 * know the algorithm or rule type statically.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <string_view>

namespace uras {

// Forward declarations
class ProblemIndex;
struct SolveReport;
struct DispatchContext;

// ─────────────────────────────────────────────
// SchedulingAlgorithmLike
// ─────────────────────────────────────────────

/**
 * @concept SchedulingAlgorithmLike
 * @brief Constrains types that turn a problem into a solve report.
 */
template <typename T>
concept SchedulingAlgorithmLike = requires(T& algorithm, const ProblemIndex& problem, Logger* logger) {
    { algorithm.solve(problem, logger) } -> std::same_as<Result<SolveReport>>;
    { algorithm.name() } -> std::convertible_to<std::string_view>;
};

// ─────────────────────────────────────────────
// RuleKeyLike
// ─────────────────────────────────────────────

/**
 * @concept RuleKeyLike
 * @brief Constrains callables usable as dispatching keys (lower = first).
 */
template <typename F>
concept RuleKeyLike = std::regular_invocable<F, const ProblemIndex&, ActivityIndex, const DispatchContext&>
    && std::convertible_to<std::invoke_result_t<F, const ProblemIndex&, ActivityIndex, const DispatchContext&>,
                           double>;

}  // namespace uras
