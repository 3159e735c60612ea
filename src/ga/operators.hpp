/**
 * @file operators.hpp
 * @brief Initialization, selection, crossover and mutation for the GA.
 *
 * Every operator keeps `sequence` a topological order and `resources[a]` a
 * candidate of a.
 */

#pragma once

#include "core/result.hpp"
#include "ga/chromosome.hpp"
#include "model/problem.hpp"

#include <random>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace uras {

using Rng = std::mt19937_64;

enum class InitStrategy : uint8_t {
    Random,         ///< Uniform candidate per activity
    LoadBalanced,   ///< Candidate with the least accumulated work
    ShortestTime    ///< Candidate with the shortest effective duration
};

enum class SelectionMethod : uint8_t { Tournament, Roulette };

[[nodiscard]] std::string_view to_string(InitStrategy strategy) noexcept;
[[nodiscard]] std::string_view to_string(SelectionMethod method) noexcept;
[[nodiscard]] Result<SelectionMethod> parse_selection_method(std::string_view name);

// ── Sequences ────────────────────────────────

/// Kahn's algorithm picking uniformly among ready activities.
[[nodiscard]] std::vector<ActivityIndex> random_topological_order(const ProblemIndex& problem, Rng& rng);

/// Kahn's algorithm preferring the activity that comes first in `sequence`.
[[nodiscard]] std::vector<ActivityIndex> repair_order(const ProblemIndex& problem,
                                                      std::span<const ActivityIndex> sequence);

[[nodiscard]] bool is_topological(const ProblemIndex& problem, std::span<const ActivityIndex> sequence);

// ── Initialization ───────────────────────────

[[nodiscard]] Chromosome make_chromosome(const ProblemIndex& problem, InitStrategy strategy, Rng& rng);

// ── Selection ────────────────────────────────

/// Lowest fitness among `size` uniformly drawn individuals.
[[nodiscard]] size_t tournament_select(std::span<const Chromosome> population, uint32_t size, Rng& rng);

/// Fitness-proportionate on 1 / (1 + fitness − best).
[[nodiscard]] size_t roulette_select(std::span<const Chromosome> population, Rng& rng);

// ── Variation ────────────────────────────────

/**
 * @brief Precedence-preserving crossover on sequences, uniform on resources.
 *
 * A random mask says, position by position, which parent donates its
 * leftmost activity not yet taken; the second child uses the inverted mask.
 */
[[nodiscard]] std::pair<Chromosome, Chromosome> crossover(const Chromosome& first, const Chromosome& second,
                                                          Rng& rng);

/// Swap two sequence positions, then restore precedence.
void swap_mutation(const ProblemIndex& problem, Chromosome& chromosome, Rng& rng);

/// Move one activity to another of its candidates; no-op with a single candidate.
void resource_mutation(const ProblemIndex& problem, Chromosome& chromosome, Rng& rng);

}  // namespace uras
