/**
 * @file test_ga.cpp
 * @brief Unit tests for the dual-vector chromosome, GA operators and the
 *        GA scheduler.
 */

#include "ga/chromosome.hpp"
#include "ga/ga_scheduler.hpp"
#include "ga/operators.hpp"
#include "scheduler/greedy_scheduler.hpp"
#include "support/problems.hpp"
#include "workload/generator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <random>

using namespace uras;
using namespace uras::fixtures;

namespace {

ProblemIndex random_instance(uint32_t seed) {
    std::mt19937 rng(seed);
    return index_of(ProblemGenerator::random_problem(6, 3, 4, 0.3f, rng));
}

bool resources_are_candidates(const ProblemIndex& problem, const Chromosome& c) {
    for (ActivityIndex a = 0; a < problem.activity_count(); ++a) {
        if (!problem.duration_on(a, c.resources[a])) return false;
    }
    return true;
}

GaConfig small_config() {
    GaConfig config;
    config.population_size = 30;
    config.max_generations = 60;
    config.elite_count = 3;
    config.stagnation_limit = 20;
    config.seed = 1234;
    return config;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Sequence operators
// ─────────────────────────────────────────────

TEST(GaOperatorTest, RandomOrderIsTopological) {
    auto problem = random_instance(1);
    Rng rng(7);
    for (int i = 0; i < 20; ++i) {
        auto order = random_topological_order(problem, rng);
        EXPECT_TRUE(is_topological(problem, order));
    }
}

TEST(GaOperatorTest, RepairRestoresPrecedence) {
    auto problem = random_instance(2);
    std::vector<ActivityIndex> reversed(problem.topological_order().rbegin(), problem.topological_order().rend());
    ASSERT_FALSE(is_topological(problem, reversed));
    auto repaired = repair_order(problem, reversed);
    EXPECT_TRUE(is_topological(problem, repaired));
}

TEST(GaOperatorTest, RepairKeepsValidOrder) {
    auto problem = random_instance(3);
    Rng rng(3);
    auto order = random_topological_order(problem, rng);
    EXPECT_EQ(repair_order(problem, order), order);
}

TEST(GaOperatorTest, IsTopologicalRejectsMalformed) {
    auto problem = index_of(two_by_two_job_shop());
    EXPECT_FALSE(is_topological(problem, std::vector<ActivityIndex>{0, 1, 2}));
    EXPECT_FALSE(is_topological(problem, std::vector<ActivityIndex>{0, 0, 1, 2}));
}

TEST(GaOperatorTest, InitStrategies) {
    auto problem = index_of(single_activity_two_machines());
    Rng rng(9);
    auto shortest = make_chromosome(problem, InitStrategy::ShortestTime, rng);
    EXPECT_EQ(shortest.resources[0], *problem.find_resource("M1"));

    auto problem2 = random_instance(4);
    for (auto strategy : {InitStrategy::Random, InitStrategy::LoadBalanced, InitStrategy::ShortestTime}) {
        auto c = make_chromosome(problem2, strategy, rng);
        EXPECT_TRUE(is_topological(problem2, c.sequence)) << to_string(strategy);
        EXPECT_TRUE(resources_are_candidates(problem2, c)) << to_string(strategy);
    }
}

TEST(GaOperatorTest, LoadBalancedSpreadsWork) {
    ProblemSpec spec;
    spec.resources = {machine("M0"), machine("M1"), machine("M2")};
    for (int j = 0; j < 6; ++j) {
        const std::string id = "J" + std::to_string(j);
        spec.tasks.push_back(job(id, {step(id + ".O0", 0, 1'000, {})}));
    }
    auto problem = index_of(spec);
    Rng rng(2);
    auto c = make_chromosome(problem, InitStrategy::LoadBalanced, rng);
    std::vector<int> per_machine(problem.resource_count(), 0);
    for (ResourceIndex r : c.resources) ++per_machine[r];
    for (int count : per_machine) EXPECT_EQ(count, 2);
}

TEST(GaOperatorTest, CrossoverPreservesFeasibility) {
    auto problem = random_instance(5);
    Rng rng(11);
    auto mother = make_chromosome(problem, InitStrategy::Random, rng);
    auto father = make_chromosome(problem, InitStrategy::ShortestTime, rng);
    for (int i = 0; i < 20; ++i) {
        auto [first, second] = crossover(mother, father, rng);
        EXPECT_TRUE(is_topological(problem, first.sequence));
        EXPECT_TRUE(is_topological(problem, second.sequence));
        EXPECT_TRUE(resources_are_candidates(problem, first));
        EXPECT_TRUE(resources_are_candidates(problem, second));
    }
}

TEST(GaOperatorTest, MutationsPreserveFeasibility) {
    auto problem = random_instance(6);
    Rng rng(13);
    auto c = make_chromosome(problem, InitStrategy::Random, rng);
    for (int i = 0; i < 50; ++i) {
        swap_mutation(problem, c, rng);
        resource_mutation(problem, c, rng);
        ASSERT_TRUE(is_topological(problem, c.sequence));
        ASSERT_TRUE(resources_are_candidates(problem, c));
    }
}

TEST(GaOperatorTest, ResourceMutationAlwaysMoves) {
    auto problem = index_of(single_activity_two_machines());
    Rng rng(17);
    auto c = make_chromosome(problem, InitStrategy::ShortestTime, rng);
    for (int i = 0; i < 10; ++i) {
        const ResourceIndex before = c.resources[0];
        resource_mutation(problem, c, rng);
        EXPECT_NE(c.resources[0], before);
    }
}

TEST(GaOperatorTest, SelectionPrefersFitter) {
    std::vector<Chromosome> population(2);
    population[0].fitness = 100.0;
    population[1].fitness = 1.0;
    Rng rng(19);
    EXPECT_EQ(tournament_select(population, 64, rng), 1u);

    int picks_of_best = 0;
    for (int i = 0; i < 200; ++i) {
        size_t pick = roulette_select(population, rng);
        ASSERT_LT(pick, population.size());
        if (pick == 1) ++picks_of_best;
    }
    EXPECT_GT(picks_of_best, 150);
}

TEST(GaOperatorTest, ParseSelectionMethod) {
    EXPECT_EQ(*parse_selection_method("Roulette"), SelectionMethod::Roulette);
    EXPECT_EQ(*parse_selection_method("tournament"), SelectionMethod::Tournament);
    auto unknown = parse_selection_method("lottery");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().kind, ErrorKind::Config);
}

// ─────────────────────────────────────────────
// Chromosome decoding
// ─────────────────────────────────────────────

TEST(ChromosomeDecoderTest, EncodeDecodeReproducesGreedy) {
    std::mt19937 gen(4);
    auto problem = index_of(ProblemGenerator::job_shop(5, 4, DurationRange{}, gen));
    GreedyScheduler greedy(DispatchEngine::from_names({"SPT"}).value());
    auto state = greedy.construct(problem, nullptr);
    ASSERT_TRUE(state.has_value());

    ChromosomeDecoder decoder(problem, ObjectiveWeights{});
    auto chromosome = decoder.encode(*state);
    EXPECT_TRUE(is_topological(problem, chromosome.sequence));
    auto decoded = decoder.decode(chromosome);
    EXPECT_TRUE(decoded.feasible());
    EXPECT_LE(decoded.state.makespan_ms(), state->makespan_ms());
}

TEST(ChromosomeDecoderTest, HardOverageDominatesFitness) {
    auto problem = index_of(deadline_chain(8'000));
    ChromosomeDecoder decoder(problem, ObjectiveWeights{});
    Rng rng(1);
    auto c = make_chromosome(problem, InitStrategy::ShortestTime, rng);
    auto decoded = decoder.decode(c);
    EXPECT_FALSE(decoded.feasible());
    EXPECT_EQ(decoded.hard_overage_ms, 2'000);
    EXPECT_DOUBLE_EQ(decoder.fitness(decoded), 10'000.0 + 2'000.0 * ChromosomeDecoder::kHardCostPerMs);
}

TEST(ChromosomeDecoderTest, UnplaceableActivityIsCounted) {
    auto spec = single_activity_two_machines();
    spec.resources[0].calendar = Calendar::never_available();
    auto problem = index_of(spec);
    ChromosomeDecoder decoder(problem, ObjectiveWeights{});
    Chromosome c{.sequence = {0}, .resources = {*problem.find_resource("M1")}};
    decoder.evaluate(c);
    EXPECT_GE(c.fitness, ChromosomeDecoder::kUnplacedCost);
}

// ─────────────────────────────────────────────
// GaScheduler
// ─────────────────────────────────────────────

TEST(GaSchedulerTest, FindsPenaltyFreeOrder) {
    auto problem = index_of(soft_deadline_pair());
    auto config = small_config();
    config.seed_with_greedy = false;
    GaScheduler ga(config);
    auto report = ga.solve(problem, nullptr);
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_DOUBLE_EQ(report->objective, 5'000.0);
    EXPECT_EQ(report->algorithm, "ga");
}

TEST(GaSchedulerTest, DecoderPaysChangeovers) {
    auto problem = index_of(changeover_line());
    auto config = small_config();
    config.seed_with_greedy = false;
    GaScheduler ga(config);
    auto report = ga.solve(problem, nullptr);
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report->schedule.makespan_ms(), 3'500);
    EXPECT_TRUE(problem.verify(report->schedule).has_value());
}

TEST(GaSchedulerTest, HistoryIsNonIncreasing) {
    auto problem = random_instance(9);
    GaScheduler ga(small_config());
    auto report = ga.solve(problem, nullptr);
    ASSERT_TRUE(report.has_value()) << report.error().message;
    ASSERT_EQ(report->fitness_history.size(), report->generations + 1u);
    EXPECT_TRUE(std::is_sorted(report->fitness_history.rbegin(), report->fitness_history.rend()));
    EXPECT_DOUBLE_EQ(report->fitness_history.back(), report->objective);
    EXPECT_TRUE(problem.verify(report->schedule).has_value());
}

TEST(GaSchedulerTest, NeverWorseThanGreedySeed) {
    auto problem = random_instance(10);
    auto engine = DispatchEngine::from_names({"EDD", "SPT"}).value();
    GreedyScheduler greedy(engine);
    auto baseline = greedy.solve(problem, nullptr);
    GaScheduler ga(small_config(), engine);
    auto report = ga.solve(problem, nullptr);
    ASSERT_TRUE(baseline.has_value());
    ASSERT_TRUE(report.has_value());
    EXPECT_LE(report->objective, baseline->objective);
}

TEST(GaSchedulerTest, SameSeedSameResult) {
    auto problem = random_instance(12);
    GaScheduler first(small_config());
    GaScheduler second(small_config());
    auto a = first.solve(problem, nullptr);
    auto b = second.solve(problem, nullptr);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->fitness_history, b->fitness_history);
    EXPECT_EQ(a->schedule.makespan_ms(), b->schedule.makespan_ms());
}

TEST(GaSchedulerTest, ParallelEvaluationIsDeterministic) {
    auto problem = random_instance(13);
    auto config = small_config();
    GaScheduler serial(config);
    config.threads = 4;
    GaScheduler parallel(config);
    auto a = serial.solve(problem, nullptr);
    auto b = parallel.solve(problem, nullptr);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(a->fitness_history, b->fitness_history);
}

TEST(GaSchedulerTest, RouletteSelection) {
    auto problem = random_instance(14);
    auto config = small_config();
    config.selection = SelectionMethod::Roulette;
    GaScheduler ga(config);
    auto report = ga.solve(problem, nullptr);
    ASSERT_TRUE(report.has_value());
    EXPECT_TRUE(problem.verify(report->schedule).has_value());
}

TEST(GaSchedulerTest, StagnationStopsEarly) {
    auto problem = index_of(single_activity_two_machines());
    auto config = small_config();
    config.max_generations = 1'000;
    config.stagnation_limit = 5;
    GaScheduler ga(config);
    auto report = ga.solve(problem, nullptr);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->generations, 5u);
}

TEST(GaSchedulerTest, UnreachableDeadlineIsInfeasible) {
    auto problem = index_of(deadline_chain(8'000));
    GaScheduler ga(small_config());
    auto report = ga.solve(problem, nullptr);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::Infeasible);
}

TEST(GaSchedulerTest, RejectsInvalidConfig) {
    auto problem = index_of(two_by_two_job_shop());
    auto config = small_config();
    config.elite_count = config.population_size;
    GaScheduler ga(config);
    auto report = ga.solve(problem, nullptr);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().kind, ErrorKind::InvalidSpec);

    GaConfig bad_rate;
    bad_rate.crossover_rate = 1.5;
    EXPECT_FALSE(bad_rate.validate().has_value());
    GaConfig tiny;
    tiny.population_size = 1;
    tiny.elite_count = 0;
    EXPECT_FALSE(tiny.validate().has_value());
}
