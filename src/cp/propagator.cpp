/**
 * @file propagator.cpp
 * @brief ArcConsistency construction and the AC-3 queue.
 */

#include "cp/propagator.hpp"

#include <deque>

namespace uras {

ArcConsistency::ArcConsistency(const ProblemIndex& problem)
    : problem_(&problem), arcs_from_(problem.activity_count()) {
    const size_t n = problem.activity_count();

    for (ActivityIndex a = 0; a < n; ++a) {
        for (const auto& s : problem.activity(a).successors) {
            arcs_.push_back(Arc{.target = s.activity, .source = a, .kind = ArcKind::After,
                                .delay_ms = s.min_delay_ms});
            arcs_.push_back(Arc{.target = a, .source = s.activity, .kind = ArcKind::Before,
                                .delay_ms = s.min_delay_ms});
        }
    }

    // Pairs sharing a unary resource.
    std::vector<std::vector<ActivityIndex>> users(problem.resource_count());
    for (ActivityIndex a = 0; a < n; ++a) {
        for (const auto& c : problem.activity(a).candidates) {
            if (problem.resource(c.resource).capacity == 1) users[c.resource].push_back(a);
        }
    }
    for (ResourceIndex r = 0; r < users.size(); ++r) {
        const auto& list = users[r];
        for (size_t i = 0; i < list.size(); ++i) {
            for (size_t j = 0; j < list.size(); ++j) {
                if (i == j) continue;
                arcs_.push_back(Arc{.target = list[i], .source = list[j],
                                    .kind = ArcKind::Disjunctive, .resource = r});
            }
        }
    }

    for (size_t id = 0; id < arcs_.size(); ++id) {
        arcs_from_[arcs_[id].source].push_back(id);
    }
}

bool ArcConsistency::revise(const Arc& arc, std::vector<ActivityDomain>& domains) const {
    const ActivityDomain& source = domains[arc.source];
    ActivityDomain& target = domains[arc.target];
    if (source.empty()) return false;

    bool changed = false;
    switch (arc.kind) {
        case ArcKind::After: {
            const TimeMs bound = source.earliest_finish() + arc.delay_ms;
            for (auto& o : target.options()) changed |= o.starts.remove_below(bound);
            break;
        }
        case ArcKind::Before: {
            const TimeMs latest_successor = source.latest_start();
            for (auto& o : target.options()) {
                changed |= o.starts.remove_above(latest_successor - arc.delay_ms - o.duration_ms);
            }
            break;
        }
        case ArcKind::Disjunctive: {
            if (source.sole_resource() != arc.resource) break;
            const ResourceDomain* held = source.find(arc.resource);
            // The source surely occupies [max start, min start + duration).
            const TimeMs busy_from = held->starts.max();
            const TimeMs busy_to = held->starts.min() + held->duration_ms;
            if (busy_from >= busy_to) break;
            for (auto& o : target.options()) {
                // Zero-length placements never take capacity.
                if (o.resource != arc.resource || o.duration_ms == 0) continue;
                changed |= o.starts.remove_range(busy_from - o.duration_ms + 1, busy_to - 1);
            }
            break;
        }
    }
    return changed;
}

Result<uint64_t> ArcConsistency::enforce(std::vector<ActivityDomain>& domains,
                                         std::span<const ActivityIndex> changed) const {
    std::deque<size_t> queue;
    std::vector<bool> queued(arcs_.size(), false);

    auto push_from = [&](ActivityIndex a) {
        for (size_t id : arcs_from_[a]) {
            if (!queued[id]) {
                queued[id] = true;
                queue.push_back(id);
            }
        }
    };

    if (changed.empty()) {
        for (ActivityIndex a = 0; a < domains.size(); ++a) {
            if (domains[a].empty()) {
                return Error{ErrorKind::Infeasible,
                             "activity " + problem_->activity(a).id + " has no admissible start"};
            }
        }
        for (size_t id = 0; id < arcs_.size(); ++id) {
            queued[id] = true;
            queue.push_back(id);
        }
    } else {
        for (ActivityIndex a : changed) push_from(a);
    }

    uint64_t revisions = 0;
    while (!queue.empty()) {
        size_t id = queue.front();
        queue.pop_front();
        queued[id] = false;

        const Arc& arc = arcs_[id];
        if (!revise(arc, domains)) continue;
        ++revisions;

        if (domains[arc.target].empty()) {
            return Error{ErrorKind::Infeasible,
                         "arc consistency emptied the domain of activity "
                         + problem_->activity(arc.target).id};
        }
        push_from(arc.target);
    }
    return revisions;
}

}  // namespace uras
