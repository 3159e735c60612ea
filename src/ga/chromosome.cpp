/**
 * @file chromosome.cpp
 * @brief ChromosomeDecoder implementation.
 */

#include "ga/chromosome.hpp"

#include <algorithm>
#include <numeric>
#include <tuple>

namespace uras {

ChromosomeDecoder::ChromosomeDecoder(const ProblemIndex& problem, ObjectiveWeights weights)
    : problem_(&problem), weights_(weights) {}

DecodedSchedule ChromosomeDecoder::decode(const Chromosome& chromosome) const {
    DecodedSchedule decoded{.state = ScheduleState(*problem_)};

    for (ActivityIndex a : chromosome.sequence) {
        auto placement = decoded.state.place_on(a, chromosome.resources[a], problem_->start_time_ms());
        if (!placement) {
            ++decoded.unplaced;
            continue;
        }
        decoded.state.commit(a, *placement);
    }

    decoded.hard_overage_ms = decoded.state.hard_overage_ms();
    decoded.objective = weights_.evaluate(decoded.state.makespan_ms(), decoded.state.soft_penalty());
    return decoded;
}

double ChromosomeDecoder::fitness(const DecodedSchedule& decoded) const noexcept {
    return decoded.objective
         + kHardCostPerMs * static_cast<double>(decoded.hard_overage_ms)
         + kUnplacedCost * static_cast<double>(decoded.unplaced);
}

void ChromosomeDecoder::evaluate(Chromosome& chromosome) const {
    chromosome.fitness = fitness(decode(chromosome));
}

Chromosome ChromosomeDecoder::encode(const ScheduleState& state) const {
    const size_t n = problem_->activity_count();
    Chromosome chromosome;
    chromosome.resources.resize(n);
    chromosome.sequence.resize(n);
    std::iota(chromosome.sequence.begin(), chromosome.sequence.end(), ActivityIndex{0});

    for (ActivityIndex a = 0; a < n; ++a) {
        chromosome.resources[a] = state.placement(a).resource;
    }

    // Start order is topological: every successor starts at or after its
    // predecessor's end, and zero-length ties fall back to the graph order.
    std::vector<uint32_t> topo_rank(n);
    const auto& topo = problem_->topological_order();
    for (uint32_t i = 0; i < topo.size(); ++i) topo_rank[topo[i]] = i;

    std::sort(chromosome.sequence.begin(), chromosome.sequence.end(),
        [&](ActivityIndex x, ActivityIndex y) {
            return std::tuple(state.placement(x).start, topo_rank[x])
                 < std::tuple(state.placement(y).start, topo_rank[y]);
        });
    return chromosome;
}

}  // namespace uras
