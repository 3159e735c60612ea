/**
 * @file test_generator.cpp
 * @brief Unit tests for ProblemGenerator.
 */

#include "support/problems.hpp"
#include "workload/generator.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <set>

using namespace uras;
using namespace uras::fixtures;

// ─── Linear Chain ────────────────────────────

TEST(GeneratorTest, LinearChainShape) {
    auto spec = ProblemGenerator::linear_chain(5, 2'000);
    ASSERT_EQ(spec.tasks.size(), 1u);
    EXPECT_EQ(spec.tasks[0].activities.size(), 5u);
    EXPECT_EQ(spec.resources.size(), 1u);
    EXPECT_EQ(spec.tasks[0].activities[3].id, "J0.O3");
}

TEST(GeneratorTest, LinearChainCriticalPath) {
    auto problem = index_of(ProblemGenerator::linear_chain(10, 1'000));
    EXPECT_EQ(problem.activity_count(), 10u);
    EXPECT_EQ(problem.critical_path_ms(), 10'000);
}

// ─── Flow / Job Shop ─────────────────────────

TEST(GeneratorTest, FlowShopVisitsMachinesInOrder) {
    std::mt19937 rng(1);
    auto spec = ProblemGenerator::flow_shop(4, 3, DurationRange{}, rng);
    ASSERT_EQ(spec.tasks.size(), 4u);
    for (const auto& task : spec.tasks) {
        ASSERT_EQ(task.activities.size(), 3u);
        for (size_t k = 0; k < 3; ++k) {
            const auto& candidates = task.activities[k].resource_groups.at(0).candidates;
            ASSERT_EQ(candidates.size(), 1u);
            EXPECT_EQ(candidates[0], "M" + std::to_string(k));
        }
    }
}

TEST(GeneratorTest, JobShopRoutesArePermutations) {
    std::mt19937 rng(2);
    auto spec = ProblemGenerator::job_shop(6, 4, DurationRange{}, rng);
    for (const auto& task : spec.tasks) {
        std::set<std::string> machines;
        for (const auto& a : task.activities) machines.insert(a.resource_groups.at(0).candidates.at(0));
        EXPECT_EQ(machines.size(), 4u) << task.id;
    }
    EXPECT_NO_THROW((void)index_of(spec));
}

TEST(GeneratorTest, DurationsStayInRange) {
    std::mt19937 rng(3);
    DurationRange range{.min_ms = 500, .max_ms = 700};
    auto problem = index_of(ProblemGenerator::job_shop(5, 5, range, rng));
    for (ActivityIndex a = 0; a < problem.activity_count(); ++a) {
        auto d = problem.duration_on(a, problem.activity(a).candidates.front().resource);
        ASSERT_TRUE(d.has_value());
        EXPECT_GE(*d, 500);
        EXPECT_LE(*d, 700);
    }
}

TEST(GeneratorTest, SameSeedSameProblem) {
    std::mt19937 a(9);
    std::mt19937 b(9);
    auto first = ProblemGenerator::job_shop(3, 3, DurationRange{}, a);
    auto second = ProblemGenerator::job_shop(3, 3, DurationRange{}, b);
    for (size_t j = 0; j < 3; ++j) {
        for (size_t k = 0; k < 3; ++k) {
            EXPECT_EQ(first.tasks[j].activities[k].resource_groups[0].candidates,
                      second.tasks[j].activities[k].resource_groups[0].candidates);
            EXPECT_EQ(first.tasks[j].activities[k].duration.nominal_total_ms(EstimatePolicy{}),
                      second.tasks[j].activities[k].duration.nominal_total_ms(EstimatePolicy{}));
        }
    }
}

// ─── Parallel Machines ───────────────────────

TEST(GeneratorTest, ParallelMachinesOpenToEveryMachine) {
    std::mt19937 rng(4);
    auto problem = index_of(ProblemGenerator::parallel_machines(5, 3, DurationRange{}, rng));
    for (ActivityIndex a = 0; a < problem.activity_count(); ++a) {
        EXPECT_EQ(problem.activity(a).candidates.size(), 3u);
    }
}

// ─── Random Problem ──────────────────────────

TEST(GeneratorTest, RandomProblemIsAcyclic) {
    for (uint32_t seed = 0; seed < 20; ++seed) {
        std::mt19937 rng(seed);
        auto spec = ProblemGenerator::random_problem(8, 3, 4, 0.5f, rng);
        EXPECT_NO_THROW((void)index_of(spec)) << "seed " << seed;
    }
}

TEST(GeneratorTest, RandomProblemHasDueDates) {
    std::mt19937 rng(5);
    auto spec = ProblemGenerator::random_problem(6, 2, 3, 0.0f, rng);
    EXPECT_TRUE(spec.constraints.empty());
    for (const auto& task : spec.tasks) {
        ASSERT_TRUE(task.due_date.has_value());
        EXPECT_GT(*task.due_date, spec.start_time_ms);
    }
}

TEST(GeneratorTest, FullEdgeProbabilityLinksEveryTask) {
    std::mt19937 rng(6);
    auto spec = ProblemGenerator::random_problem(5, 2, 2, 1.0f, rng);
    EXPECT_EQ(spec.constraints.size(), 10u);
}
