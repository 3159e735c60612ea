/**
 * @file chromosome.hpp
 * @brief Dual-vector chromosome and its schedule decoder.
 */

#pragma once

#include "model/problem.hpp"
#include "scheduler/placement.hpp"

#include <limits>
#include <vector>

namespace uras {

/**
 * @brief One GA individual.
 *
 * `sequence` is a topological order of activity handles; `resources[a]` is
 * the candidate resource of activity a. Both refer to ProblemIndex handles.
 */
struct Chromosome {
    std::vector<ActivityIndex> sequence;
    std::vector<ResourceIndex> resources;
    double fitness = std::numeric_limits<double>::infinity();
};

struct DecodedSchedule {
    ScheduleState state;
    double objective{0.0};
    TimeMs hard_overage_ms{0};
    uint32_t unplaced{0};

    [[nodiscard]] bool feasible() const noexcept { return hard_overage_ms == 0 && unplaced == 0; }
};

/**
 * @brief Turns chromosomes into schedules.
 *
 * Activities are placed left to right in sequence order, each on its
 * assigned resource at the earliest start allowed by release, placed
 * predecessors, calendar and capacity. Decoding never breaks capacity or
 * precedence; hard deadlines may be missed and are charged in the fitness.
 */
class ChromosomeDecoder {
public:
    static constexpr double kHardCostPerMs = 1.0e6;
    static constexpr double kUnplacedCost = 1.0e15;

    ChromosomeDecoder(const ProblemIndex& problem, ObjectiveWeights weights);

    [[nodiscard]] DecodedSchedule decode(const Chromosome& chromosome) const;

    /// Objective plus a dominating cost for hard breaches.
    [[nodiscard]] double fitness(const DecodedSchedule& decoded) const noexcept;

    /// Decode and store the fitness in the chromosome.
    void evaluate(Chromosome& chromosome) const;

    /// Rebuild a chromosome from a complete placement state.
    [[nodiscard]] Chromosome encode(const ScheduleState& state) const;

    [[nodiscard]] const ProblemIndex& problem() const noexcept { return *problem_; }

private:
    const ProblemIndex* problem_;
    ObjectiveWeights weights_;
};

}  // namespace uras
