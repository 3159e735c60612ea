/**
 * @file ga_scheduler.cpp
 * @brief GaScheduler generation loop.
 *
 * Per generation:
 *   elites ← best elite_count individuals, copied unchanged
 *   until the population is full:
 *     pick two parents; crossover with crossover_rate, else copy
 *     swap mutation with mutation_rate; resource mutation with its rate
 *   evaluate offspring in parallel; record the best fitness so far
 *   stop at max_generations or after stagnation_limit idle generations
 */

#include "ga/ga_scheduler.hpp"

#include "executor/thread_pool.hpp"
#include "ga/chromosome.hpp"
#include "scheduler/greedy_scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <tuple>

namespace uras {

namespace {

void evaluate_all(const ChromosomeDecoder& decoder, std::vector<Chromosome>& population,
                  size_t from, ThreadPool* pool) {
    const size_t count = population.size() - from;
    auto body = [&](size_t i) { decoder.evaluate(population[from + i]); };
    if (pool == nullptr) {
        for (size_t i = 0; i < count; ++i) body(i);
    } else {
        pool->parallel_for(count, body);
    }
}

void sort_by_fitness(std::vector<Chromosome>& population) {
    std::stable_sort(population.begin(), population.end(),
        [](const Chromosome& a, const Chromosome& b) { return a.fitness < b.fitness; });
}

}  // anonymous namespace

Result<void> GaConfig::validate() const {
    if (population_size < 2) {
        return Error{ErrorKind::InvalidSpec, "ga population must hold at least 2 individuals"};
    }
    if (max_generations == 0) {
        return Error{ErrorKind::InvalidSpec, "ga needs at least one generation"};
    }
    auto is_rate = [](double r) { return std::isfinite(r) && r >= 0.0 && r <= 1.0; };
    if (!is_rate(crossover_rate) || !is_rate(mutation_rate) || !is_rate(resource_mutation_rate)) {
        return Error{ErrorKind::InvalidSpec, "ga rates must lie in [0, 1]"};
    }
    if (stagnation_limit == 0) {
        return Error{ErrorKind::InvalidSpec, "ga stagnation limit must be positive"};
    }
    if (tournament_size == 0) {
        return Error{ErrorKind::InvalidSpec, "ga tournament size must be positive"};
    }
    if (elite_count >= population_size) {
        return Error{ErrorKind::InvalidSpec,
                     "ga elite count (" + std::to_string(elite_count)
                     + ") must be below the population size (" + std::to_string(population_size) + ")"};
    }
    if (threads == 0) {
        return Error{ErrorKind::InvalidSpec, "ga needs at least one thread"};
    }
    if (!std::isfinite(weights.makespan) || !std::isfinite(weights.penalty)
        || weights.makespan < 0.0 || weights.penalty < 0.0) {
        return Error{ErrorKind::InvalidSpec, "objective weights must be finite and >= 0"};
    }
    return {};
}

GaScheduler::GaScheduler(GaConfig config, DispatchEngine engine)
    : config_(std::move(config)), engine_(std::move(engine)) {}

Result<SolveReport> GaScheduler::solve(const ProblemIndex& problem, Logger* logger) {
    const auto started = std::chrono::steady_clock::now();
    if (auto valid = config_.validate(); !valid) return valid.error();

    ChromosomeDecoder decoder(problem, config_.weights);
    Rng rng(config_.seed);

    std::unique_ptr<ThreadPool> pool;
    if (config_.threads > 1) pool = std::make_unique<ThreadPool>(config_.threads);

    // ── Initial population ────────────────────
    std::vector<Chromosome> population;
    population.reserve(config_.population_size);

    if (config_.seed_with_greedy) {
        GreedyScheduler greedy(engine_, config_.weights);
        auto built = greedy.construct(problem, nullptr);
        if (built) {
            population.push_back(decoder.encode(*built));
        } else {
            log_to(logger, LogLevel::Debug, "ga", "no greedy seed: " + built.error().message);
        }
    }

    constexpr InitStrategy kStrategies[] = {
        InitStrategy::Random, InitStrategy::LoadBalanced, InitStrategy::ShortestTime};
    for (size_t i = 0; population.size() < config_.population_size; ++i) {
        population.push_back(make_chromosome(problem, kStrategies[i % 3], rng));
    }

    evaluate_all(decoder, population, 0, pool.get());
    sort_by_fitness(population);

    // ── Evolution ─────────────────────────────
    Chromosome best_ever = population.front();
    std::vector<double> history{best_ever.fitness};
    std::uniform_real_distribution<double> chance(0.0, 1.0);
    uint32_t stagnant = 0;
    uint32_t generation = 0;

    auto select = [&]() -> const Chromosome& {
        size_t i = config_.selection == SelectionMethod::Tournament
                 ? tournament_select(population, config_.tournament_size, rng)
                 : roulette_select(population, rng);
        return population[i];
    };

    while (generation < config_.max_generations && stagnant < config_.stagnation_limit) {
        ++generation;

        std::vector<Chromosome> next(population.begin(), population.begin() + config_.elite_count);
        next.reserve(config_.population_size);

        while (next.size() < config_.population_size) {
            const Chromosome& mother = select();
            const Chromosome& father = select();

            Chromosome first = mother;
            Chromosome second = father;
            if (chance(rng) < config_.crossover_rate) {
                std::tie(first, second) = crossover(mother, father, rng);
            }

            for (Chromosome* child : {&first, &second}) {
                if (chance(rng) < config_.mutation_rate) swap_mutation(problem, *child, rng);
                if (chance(rng) < config_.resource_mutation_rate) resource_mutation(problem, *child, rng);
            }

            next.push_back(std::move(first));
            if (next.size() < config_.population_size) next.push_back(std::move(second));
        }

        evaluate_all(decoder, next, config_.elite_count, pool.get());
        sort_by_fitness(next);
        population = std::move(next);

        if (population.front().fitness < best_ever.fitness) {
            best_ever = population.front();
            stagnant = 0;
        } else {
            ++stagnant;
        }
        const double best = best_ever.fitness;
        history.push_back(best);

        if (logger != nullptr && logger->enabled(LogLevel::Debug) && generation % 50 == 0) {
            logger->debug("ga", "generation " + std::to_string(generation) + ", best fitness "
                          + std::to_string(best));
        }
    }

    // ── Result ────────────────────────────────
    auto decoded = decoder.decode(best_ever);
    if (!decoded.feasible()) {
        log_to(logger, LogLevel::Warn, "ga",
               "best individual misses hard deadlines by " + std::to_string(decoded.hard_overage_ms) + " ms");
        return Error{ErrorKind::Infeasible,
                     "best schedule found misses hard deadlines by "
                     + std::to_string(decoded.hard_overage_ms) + " ms"
                     + (decoded.unplaced > 0 ? " and leaves " + std::to_string(decoded.unplaced)
                                               + " activities unplaced" : std::string{})};
    }

    auto schedule = decoded.state.to_schedule();
    if (!schedule) return schedule.error();

    SolveReport report;
    report.algorithm = std::string(name());
    report.objective = decoded.objective;
    report.generations = generation;
    report.fitness_history = std::move(history);
    report.schedule = std::move(*schedule);
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    log_to(logger, LogLevel::Info, "ga",
           "makespan " + std::to_string(report.schedule.makespan_ms()) + " ms after "
           + std::to_string(generation) + " generations" + (stagnant >= config_.stagnation_limit ? " (stagnated)" : ""));
    return report;
}

}  // namespace uras
