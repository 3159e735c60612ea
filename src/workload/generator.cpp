/**
 * @file generator.cpp
 * @brief Synthetic problem generators.
 *
 * - Linear chains (precedence only)
 * - Flow shops and job shops (one machine per operation)
 * - Parallel machines (pure assignment)
 * - Random mixed problems (stress testing and benchmarking)
 */

#include "workload/generator.hpp"

#include <algorithm>
#include <numeric>

namespace uras {

namespace {

std::string machine_id(size_t m) { return "M" + std::to_string(m); }
std::string job_id(size_t j) { return "J" + std::to_string(j); }
std::string op_id(size_t j, size_t k) { return job_id(j) + ".O" + std::to_string(k); }

std::vector<Resource> machines_of(size_t count) {
    std::vector<Resource> out;
    out.reserve(count);
    for (size_t m = 0; m < count; ++m) {
        out.push_back(Resource{.id = machine_id(m), .name = "Machine " + std::to_string(m), .category = "machine"});
    }
    return out;
}

Activity operation(size_t job, size_t k, TimeMs duration, std::vector<ResourceId> candidates) {
    return Activity{
        .id = op_id(job, k),
        .task_id = job_id(job),
        .sequence = static_cast<uint32_t>(k),
        .duration = DurationSpec::fixed_ms(duration),
        .resource_groups = {ResourceGroup{.category = "machine", .candidates = std::move(candidates)}}
    };
}

TimeMs draw(DurationRange range, std::mt19937& rng) {
    std::uniform_int_distribution<TimeMs> dist(range.min_ms, range.max_ms);
    return dist(rng);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Linear Chain: O0 → O1 → ... → On-1 on M0
// ─────────────────────────────────────────────

ProblemSpec ProblemGenerator::linear_chain(size_t num_activities, TimeMs duration_ms) {
    ProblemSpec spec;
    spec.resources = machines_of(1);

    Task task{.id = job_id(0), .name = "Chain"};
    for (size_t k = 0; k < num_activities; ++k) {
        task.activities.push_back(operation(0, k, duration_ms, {machine_id(0)}));
    }
    spec.tasks.push_back(std::move(task));
    return spec;
}

// ─────────────────────────────────────────────
// Flow shop: Jj.Ok runs on Mk for every job j
// ─────────────────────────────────────────────

ProblemSpec ProblemGenerator::flow_shop(size_t jobs, size_t machines, DurationRange range, std::mt19937& rng) {
    ProblemSpec spec;
    spec.resources = machines_of(machines);

    for (size_t j = 0; j < jobs; ++j) {
        Task task{.id = job_id(j), .name = "Job " + std::to_string(j)};
        for (size_t k = 0; k < machines; ++k) {
            task.activities.push_back(operation(j, k, draw(range, rng), {machine_id(k)}));
        }
        spec.tasks.push_back(std::move(task));
    }
    return spec;
}

// ─────────────────────────────────────────────
// Job shop: Jj.Ok runs on a per-job permutation of machines
// ─────────────────────────────────────────────

ProblemSpec ProblemGenerator::job_shop(size_t jobs, size_t machines, DurationRange range, std::mt19937& rng) {
    ProblemSpec spec;
    spec.resources = machines_of(machines);

    std::vector<size_t> route(machines);
    for (size_t j = 0; j < jobs; ++j) {
        std::iota(route.begin(), route.end(), size_t{0});
        std::shuffle(route.begin(), route.end(), rng);

        Task task{.id = job_id(j), .name = "Job " + std::to_string(j)};
        for (size_t k = 0; k < machines; ++k) {
            task.activities.push_back(operation(j, k, draw(range, rng), {machine_id(route[k])}));
        }
        spec.tasks.push_back(std::move(task));
    }
    return spec;
}

// ─────────────────────────────────────────────
// Parallel machines: one operation per job, any machine
// ─────────────────────────────────────────────

ProblemSpec ProblemGenerator::parallel_machines(size_t jobs, size_t machines, DurationRange range,
                                                std::mt19937& rng) {
    ProblemSpec spec;
    spec.resources = machines_of(machines);

    std::uniform_real_distribution<double> efficiency(0.8, 1.2);
    for (auto& r : spec.resources) r.efficiency = efficiency(rng);

    for (size_t j = 0; j < jobs; ++j) {
        Task task{.id = job_id(j), .name = "Job " + std::to_string(j)};
        // Empty candidate list: every machine of the category.
        task.activities.push_back(operation(j, 0, draw(range, rng), {}));
        spec.tasks.push_back(std::move(task));
    }
    return spec;
}

// ─────────────────────────────────────────────
// Random mixed problem
// ─────────────────────────────────────────────

ProblemSpec ProblemGenerator::random_problem(size_t tasks, size_t resources, size_t max_activities,
                                             float edge_probability, std::mt19937& rng) {
    ProblemSpec spec;
    spec.resources = machines_of(std::max<size_t>(1, resources));

    std::uniform_int_distribution<size_t> activity_count(1, std::max<size_t>(1, max_activities));
    std::uniform_int_distribution<TimeMs> most_likely(1'000, 8'000);
    std::uniform_int_distribution<size_t> candidate_count(1, spec.resources.size());
    std::uniform_int_distribution<int32_t> priority(0, 3);
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    std::vector<std::string> machine_ids;
    for (const auto& r : spec.resources) machine_ids.push_back(r.id);

    std::vector<ActivityId> earlier;
    for (size_t j = 0; j < tasks; ++j) {
        Task task{.id = job_id(j), .name = "Job " + std::to_string(j), .priority = priority(rng)};
        TimeMs work = 0;

        const size_t n = activity_count(rng);
        for (size_t k = 0; k < n; ++k) {
            TimeMs m = most_likely(rng);
            auto pert = PertEstimate::create(m * 3 / 4, m, m * 2);

            std::shuffle(machine_ids.begin(), machine_ids.end(), rng);
            std::vector<ResourceId> candidates(machine_ids.begin(),
                                               machine_ids.begin() + static_cast<long>(candidate_count(rng)));

            Activity a = operation(j, k, m, std::move(candidates));
            if (pert) a.duration.processing = *pert;
            task.activities.push_back(std::move(a));
            work += m;
        }
        task.due_date = spec.start_time_ms + static_cast<TimeMs>(static_cast<double>(work) * (1.5 + coin(rng)));

        for (const auto& prior : earlier) {
            if (coin(rng) < edge_probability) {
                spec.constraints.emplace_back(PrecedenceConstraint{
                    .before = prior, .after = task.activities.front().id});
            }
        }
        earlier.push_back(task.activities.back().id);
        spec.tasks.push_back(std::move(task));
    }
    return spec;
}

}  // namespace uras
