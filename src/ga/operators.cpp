/**
 * @file operators.cpp
 * @brief GA operator implementations.
 */

#include "ga/operators.hpp"

#include <algorithm>
#include <cctype>
#include <queue>
#include <string>

namespace uras {

std::string_view to_string(InitStrategy strategy) noexcept {
    switch (strategy) {
        case InitStrategy::Random:       return "random";
        case InitStrategy::LoadBalanced: return "load_balanced";
        case InitStrategy::ShortestTime: return "shortest_time";
    }
    return "unknown";
}

std::string_view to_string(SelectionMethod method) noexcept {
    switch (method) {
        case SelectionMethod::Tournament: return "tournament";
        case SelectionMethod::Roulette:   return "roulette";
    }
    return "unknown";
}

Result<SelectionMethod> parse_selection_method(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "tournament") return SelectionMethod::Tournament;
    if (lower == "roulette") return SelectionMethod::Roulette;
    return Error{ErrorKind::Config, "unknown selection method: " + std::string(name)};
}

// ─────────────────────────────────────────────
// Sequences
// ─────────────────────────────────────────────

std::vector<ActivityIndex> random_topological_order(const ProblemIndex& problem, Rng& rng) {
    const size_t n = problem.activity_count();
    std::vector<size_t> in_degree(n);
    std::vector<ActivityIndex> ready;
    for (ActivityIndex a = 0; a < n; ++a) {
        in_degree[a] = problem.activity(a).predecessors.size();
        if (in_degree[a] == 0) ready.push_back(a);
    }

    std::vector<ActivityIndex> order;
    order.reserve(n);
    while (!ready.empty()) {
        std::uniform_int_distribution<size_t> pick(0, ready.size() - 1);
        size_t i = pick(rng);
        ActivityIndex a = ready[i];
        ready[i] = ready.back();
        ready.pop_back();
        order.push_back(a);

        for (const auto& s : problem.activity(a).successors) {
            if (--in_degree[s.activity] == 0) ready.push_back(s.activity);
        }
    }
    return order;
}

std::vector<ActivityIndex> repair_order(const ProblemIndex& problem, std::span<const ActivityIndex> sequence) {
    const size_t n = problem.activity_count();
    std::vector<uint32_t> position(n);
    for (uint32_t i = 0; i < sequence.size(); ++i) position[sequence[i]] = i;

    std::vector<size_t> in_degree(n);
    using Entry = std::pair<uint32_t, ActivityIndex>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<>> ready;
    for (ActivityIndex a = 0; a < n; ++a) {
        in_degree[a] = problem.activity(a).predecessors.size();
        if (in_degree[a] == 0) ready.emplace(position[a], a);
    }

    std::vector<ActivityIndex> order;
    order.reserve(n);
    while (!ready.empty()) {
        auto [pos, a] = ready.top();
        ready.pop();
        order.push_back(a);
        for (const auto& s : problem.activity(a).successors) {
            if (--in_degree[s.activity] == 0) ready.emplace(position[s.activity], s.activity);
        }
    }
    return order;
}

bool is_topological(const ProblemIndex& problem, std::span<const ActivityIndex> sequence) {
    const size_t n = problem.activity_count();
    if (sequence.size() != n) return false;

    std::vector<uint32_t> position(n, kInvalidIndex);
    for (uint32_t i = 0; i < n; ++i) {
        if (sequence[i] >= n || position[sequence[i]] != kInvalidIndex) return false;
        position[sequence[i]] = i;
    }
    for (ActivityIndex a = 0; a < n; ++a) {
        for (const auto& s : problem.activity(a).successors) {
            if (position[s.activity] < position[a]) return false;
        }
    }
    return true;
}

// ─────────────────────────────────────────────
// Initialization
// ─────────────────────────────────────────────

Chromosome make_chromosome(const ProblemIndex& problem, InitStrategy strategy, Rng& rng) {
    Chromosome c;
    c.sequence = random_topological_order(problem, rng);
    c.resources.assign(problem.activity_count(), kInvalidIndex);

    std::vector<TimeMs> load(problem.resource_count(), 0);
    for (ActivityIndex a : c.sequence) {
        const auto& candidates = problem.activity(a).candidates;
        size_t chosen = 0;

        switch (strategy) {
            case InitStrategy::Random: {
                std::uniform_int_distribution<size_t> pick(0, candidates.size() - 1);
                chosen = pick(rng);
                break;
            }
            case InitStrategy::LoadBalanced: {
                for (size_t i = 1; i < candidates.size(); ++i) {
                    const auto& best = candidates[chosen];
                    if (load[candidates[i].resource] + candidates[i].duration_ms
                        < load[best.resource] + best.duration_ms) {
                        chosen = i;
                    }
                }
                break;
            }
            case InitStrategy::ShortestTime: {
                for (size_t i = 1; i < candidates.size(); ++i) {
                    if (candidates[i].duration_ms < candidates[chosen].duration_ms) chosen = i;
                }
                break;
            }
        }

        c.resources[a] = candidates[chosen].resource;
        load[candidates[chosen].resource] += candidates[chosen].duration_ms;
    }
    return c;
}

// ─────────────────────────────────────────────
// Selection
// ─────────────────────────────────────────────

size_t tournament_select(std::span<const Chromosome> population, uint32_t size, Rng& rng) {
    std::uniform_int_distribution<size_t> pick(0, population.size() - 1);
    size_t best = pick(rng);
    for (uint32_t i = 1; i < size; ++i) {
        size_t challenger = pick(rng);
        if (population[challenger].fitness < population[best].fitness) best = challenger;
    }
    return best;
}

size_t roulette_select(std::span<const Chromosome> population, Rng& rng) {
    double best = population.front().fitness;
    for (const auto& c : population) best = std::min(best, c.fitness);

    std::vector<double> weights;
    weights.reserve(population.size());
    for (const auto& c : population) weights.push_back(1.0 / (1.0 + (c.fitness - best)));

    std::discrete_distribution<size_t> pick(weights.begin(), weights.end());
    return pick(rng);
}

// ─────────────────────────────────────────────
// Variation
// ─────────────────────────────────────────────

namespace {

std::vector<ActivityIndex> merge_by_mask(const std::vector<ActivityIndex>& first,
                                         const std::vector<ActivityIndex>& second,
                                         const std::vector<bool>& take_first) {
    const size_t n = first.size();
    std::vector<bool> taken(n, false);
    std::vector<ActivityIndex> child;
    child.reserve(n);

    size_t i = 0;
    size_t j = 0;
    for (size_t k = 0; k < n; ++k) {
        const auto& donor = take_first[k] ? first : second;
        size_t& cursor = take_first[k] ? i : j;
        while (taken[donor[cursor]]) ++cursor;
        ActivityIndex a = donor[cursor];
        taken[a] = true;
        child.push_back(a);
    }
    return child;
}

}  // anonymous namespace

std::pair<Chromosome, Chromosome> crossover(const Chromosome& first, const Chromosome& second, Rng& rng) {
    const size_t n = first.sequence.size();
    std::bernoulli_distribution coin(0.5);

    std::vector<bool> mask(n);
    std::vector<bool> inverse(n);
    for (size_t k = 0; k < n; ++k) {
        mask[k] = coin(rng);
        inverse[k] = !mask[k];
    }

    Chromosome a;
    Chromosome b;
    a.sequence = merge_by_mask(first.sequence, second.sequence, mask);
    b.sequence = merge_by_mask(first.sequence, second.sequence, inverse);

    a.resources = first.resources;
    b.resources = second.resources;
    for (size_t k = 0; k < a.resources.size(); ++k) {
        if (coin(rng)) std::swap(a.resources[k], b.resources[k]);
    }
    return {std::move(a), std::move(b)};
}

void swap_mutation(const ProblemIndex& problem, Chromosome& chromosome, Rng& rng) {
    const size_t n = chromosome.sequence.size();
    if (n < 2) return;
    std::uniform_int_distribution<size_t> pick(0, n - 1);
    size_t x = pick(rng);
    size_t y = pick(rng);
    if (x == y) return;
    std::swap(chromosome.sequence[x], chromosome.sequence[y]);
    chromosome.sequence = repair_order(problem, chromosome.sequence);
}

void resource_mutation(const ProblemIndex& problem, Chromosome& chromosome, Rng& rng) {
    const size_t n = chromosome.resources.size();
    if (n == 0) return;
    std::uniform_int_distribution<size_t> pick_activity(0, n - 1);
    ActivityIndex a = static_cast<ActivityIndex>(pick_activity(rng));

    const auto& candidates = problem.activity(a).candidates;
    if (candidates.size() < 2) return;

    std::uniform_int_distribution<size_t> pick(0, candidates.size() - 2);
    size_t i = pick(rng);
    // Skip the current resource so the draw always changes it.
    if (candidates[i].resource == chromosome.resources[a]) i = candidates.size() - 1;
    chromosome.resources[a] = candidates[i].resource;
}

}  // namespace uras
