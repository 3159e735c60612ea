/**
 * @file generator.hpp
 * @brief Synthetic problem generators for testing and benchmarking.
 */

#pragma once

#include "model/problem.hpp"

#include <random>

namespace uras {

struct DurationRange {
    TimeMs min_ms = 1'000;
    TimeMs max_ms = 10'000;
};

/**
 * @brief Factory for ProblemSpecs with classic shop structures.
 *
 * Resources are named "M0".."Mk" with category "machine"; tasks "J0"..
 * with activities "J<i>.O<k>".
 */
class ProblemGenerator {
public:
    /// One task of n activities on one machine, chained by sequence.
    static ProblemSpec linear_chain(size_t num_activities, TimeMs duration_ms);

    /// Every job visits every machine in the same order.
    static ProblemSpec flow_shop(size_t jobs, size_t machines, DurationRange range, std::mt19937& rng);

    /// Every job visits every machine in its own random order.
    static ProblemSpec job_shop(size_t jobs, size_t machines, DurationRange range, std::mt19937& rng);

    /// Single-activity jobs on interchangeable machines of varying efficiency.
    static ProblemSpec parallel_machines(size_t jobs, size_t machines, DurationRange range, std::mt19937& rng);

    /**
     * @brief Mixed problem: PERT durations, due dates, random candidate
     *        subsets and cross-task precedences added with
     *        `edge_probability` from earlier tasks only (acyclic).
     */
    static ProblemSpec random_problem(size_t tasks, size_t resources, size_t max_activities,
                                      float edge_probability, std::mt19937& rng);
};

}  // namespace uras
