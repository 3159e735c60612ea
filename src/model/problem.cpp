/**
 * @file problem.cpp
 * @brief ProblemIndex construction, graph algorithms and schedule checks.
 *
 * The precedence graph is ordered with Kahn's algorithm; activities left
 * with positive in-degree lie on a cycle. Head and tail path lengths are
 * longest-path DP passes over the topological order, O(V + E) each.
 */

#include "model/problem.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <queue>
#include <utility>

namespace uras {

namespace {

Error invalid(std::string message) {
    return Error{ErrorKind::InvalidSpec, std::move(message)};
}

template <typename... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

using EdgeMap = std::map<std::pair<ActivityIndex, ActivityIndex>, TimeMs>;

void add_edge(EdgeMap& edges, ActivityIndex from, ActivityIndex to, TimeMs delay) {
    auto [it, inserted] = edges.emplace(std::make_pair(from, to), delay);
    if (!inserted) it->second = std::max(it->second, delay);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<ProblemIndex> ProblemIndex::build(const ProblemSpec& spec) {
    ProblemIndex index;
    index.start_time_ms_ = spec.start_time_ms;

    if (spec.estimate.mode == EstimateMode::Quantile
        && !(spec.estimate.level >= 0.0 && spec.estimate.level <= 1.0)) {
        return invalid("duration quantile level must be within [0, 1]");
    }

    if (auto r = index.index_resources(spec); !r) return r.error();
    if (auto r = index.index_tasks(spec); !r) return r.error();
    if (auto r = index.apply_constraints(spec); !r) return r.error();
    if (auto r = index.index_transitions(spec); !r) return r.error();
    if (auto r = index.order_graph(); !r) return r.error();
    index.compute_paths();
    return index;
}

Result<void> ProblemIndex::index_resources(const ProblemSpec& spec) {
    resources_.reserve(spec.resources.size());
    for (const auto& res : spec.resources) {
        if (res.id.empty()) return invalid("resource with empty id");
        if (!std::isfinite(res.efficiency) || res.efficiency <= 0.0) {
            return invalid("resource " + res.id + " has non-positive efficiency");
        }
        if (res.capacity == 0) {
            return invalid("resource " + res.id + " has zero capacity");
        }

        auto idx = static_cast<ResourceIndex>(resources_.size());
        if (!resource_lookup_.emplace(res.id, idx).second) {
            return invalid("duplicate resource id: " + res.id);
        }
        resources_.push_back(ResourceInfo{
            .id = res.id,
            .category = res.category,
            .efficiency = res.efficiency,
            .capacity = res.capacity,
            .calendar = res.calendar
        });
    }
    return {};
}

Result<void> ProblemIndex::index_tasks(const ProblemSpec& spec) {
    tasks_.reserve(spec.tasks.size());

    for (const auto& task : spec.tasks) {
        if (task.id.empty()) return invalid("task with empty id");
        if (!std::isfinite(task.weight) || task.weight <= 0.0) {
            return invalid("task " + task.id + " has non-positive weight");
        }

        auto t_idx = static_cast<TaskIndex>(tasks_.size());
        if (!task_lookup_.emplace(task.id, t_idx).second) {
            return invalid("duplicate task id: " + task.id);
        }

        auto category = std::find(categories_.begin(), categories_.end(), task.category);
        if (category == categories_.end()) {
            category = categories_.insert(categories_.end(), task.category);
        }

        TaskInfo info{
            .id = task.id,
            .priority = task.priority,
            .weight = task.weight,
            .category = static_cast<uint32_t>(category - categories_.begin()),
            .due_date = task.due_date,
            .release_ms = std::max(start_time_ms_, task.release_time.value_or(start_time_ms_)),
            .activities = {},
            .total_work_ms = 0
        };

        std::optional<uint32_t> last_sequence;
        for (const auto& act : task.activities) {
            if (act.id.empty()) return invalid("activity with empty id in task " + task.id);
            if (!act.task_id.empty() && act.task_id != task.id) {
                return invalid("activity " + act.id + " names task " + act.task_id
                               + " but belongs to " + task.id);
            }
            if (last_sequence && act.sequence <= *last_sequence) {
                return invalid("activity sequence indices in task " + task.id
                               + " must be strictly increasing");
            }
            last_sequence = act.sequence;

            if (auto ok = act.duration.validate(); !ok) {
                return invalid("activity " + act.id + ": " + ok.error().message);
            }

            auto a_idx = static_cast<ActivityIndex>(activities_.size());
            if (!activity_lookup_.emplace(act.id, a_idx).second) {
                return invalid("duplicate activity id: " + act.id);
            }

            ActivityInfo a{
                .id = act.id,
                .task = t_idx,
                .position_in_task = static_cast<uint32_t>(info.activities.size()),
                .processing_ms = act.duration.nominal_processing_ms(spec.estimate),
                .setup_ms = act.duration.setup_ms,
                .teardown_ms = act.duration.teardown_ms
            };
            a.release_ms = info.release_ms;

            if (act.resource_groups.empty()) {
                return invalid("activity " + act.id + " requires no resource");
            }

            std::vector<std::string> seen_categories;
            for (const auto& group : act.resource_groups) {
                if (std::find(seen_categories.begin(), seen_categories.end(), group.category)
                    != seen_categories.end()) {
                    return invalid("activity " + act.id + " lists category '"
                                   + group.category + "' twice");
                }
                seen_categories.push_back(group.category);

                std::vector<ResourceIndex> members;
                if (group.candidates.empty()) {
                    for (ResourceIndex r = 0; r < resources_.size(); ++r) {
                        if (resources_[r].category == group.category) members.push_back(r);
                    }
                    if (members.empty()) {
                        return invalid("activity " + act.id + " needs category '"
                                       + group.category + "' but no resource has it");
                    }
                } else {
                    for (const auto& rid : group.candidates) {
                        auto it = resource_lookup_.find(rid);
                        if (it == resource_lookup_.end()) {
                            return invalid("activity " + act.id + " references unknown resource " + rid);
                        }
                        members.push_back(it->second);
                    }
                }

                for (ResourceIndex r : members) {
                    bool dup = std::any_of(a.candidates.begin(), a.candidates.end(),
                        [r](const CandidateOption& c) { return c.resource == r; });
                    if (dup) continue;
                    a.candidates.push_back(CandidateOption{
                        .resource = r,
                        .duration_ms = effective_duration(a.processing_ms, a.setup_ms,
                                                          a.teardown_ms, resources_[r].efficiency)
                    });
                }
            }

            a.min_duration_ms = a.candidates.front().duration_ms;
            for (const auto& c : a.candidates) {
                a.min_duration_ms = std::min(a.min_duration_ms, c.duration_ms);
            }

            info.total_work_ms += a.nominal_total_ms();
            info.activities.push_back(a_idx);
            activities_.push_back(std::move(a));
        }

        tasks_.push_back(std::move(info));
    }
    return {};
}

Result<void> ProblemIndex::apply_constraints(const ProblemSpec& spec) {
    EdgeMap edges;

    // Sequence edges: each activity waits for every earlier one of its task.
    for (size_t t = 0; t < spec.tasks.size(); ++t) {
        const auto& task_acts = spec.tasks[t].activities;
        const auto& indices = tasks_[t].activities;
        for (size_t k = 0; k < task_acts.size(); ++k) {
            if (task_acts[k].no_precedence) continue;
            for (size_t j = 0; j < k; ++j) {
                add_edge(edges, indices[j], indices[k], 0);
            }
        }
    }

    for (const auto& constraint : spec.constraints) {
        auto result = std::visit(Overloaded{
            [&](const PrecedenceConstraint& c) -> Result<void> {
                auto before = find_activity(c.before);
                auto after = find_activity(c.after);
                if (!before || !after) {
                    return invalid("precedence references unknown activity "
                                   + (!before ? c.before : c.after));
                }
                if (c.min_delay_ms < 0) {
                    return invalid("precedence " + c.before + " -> " + c.after
                                   + " has negative delay");
                }
                if (*before == *after) {
                    return Error{ErrorKind::Infeasible,
                                 "activity " + c.before + " must precede itself"};
                }
                add_edge(edges, *before, *after, c.min_delay_ms);
                return {};
            },
            [&](const CapacityConstraint& c) -> Result<void> {
                auto r = find_resource(c.resource);
                if (!r) return invalid("capacity constraint on unknown resource " + c.resource);
                if (c.max_concurrent == 0) {
                    return invalid("capacity constraint on " + c.resource + " allows nothing");
                }
                resources_[*r].capacity = std::min(resources_[*r].capacity, c.max_concurrent);
                return {};
            },
            [&](const TimeWindowConstraint& c) -> Result<void> {
                if (auto ok = c.window.validate(); !ok) {
                    return invalid("window on " + c.target + ": " + ok.error().message);
                }

                std::vector<ActivityIndex> affected;
                uint32_t target = 0;
                if (c.scope == WindowScope::Activity) {
                    auto a = find_activity(c.target);
                    if (!a) return invalid("time window on unknown activity " + c.target);
                    affected.push_back(*a);
                    target = *a;
                } else {
                    auto t = find_task(c.target);
                    if (!t) return invalid("time window on unknown task " + c.target);
                    affected = tasks_[*t].activities;
                    target = *t;
                }

                for (ActivityIndex a : affected) {
                    auto& info = activities_[a];
                    if (auto es = c.window.earliest_start()) {
                        info.release_ms = std::max(info.release_ms, *es);
                    }
                    if (c.window.is_hard()) {
                        if (auto lf = c.window.latest_finish()) {
                            info.deadline_ms = info.deadline_ms ? std::min(*info.deadline_ms, *lf) : *lf;
                        }
                    }
                }
                if (!c.window.is_hard()) {
                    soft_windows_.push_back(SoftWindowRef{c.scope, target, c.window});
                }
                return {};
            },
        }, constraint);

        if (!result) return result.error();
    }

    for (const auto& [edge, delay] : edges) {
        activities_[edge.first].successors.push_back({edge.second, delay});
        activities_[edge.second].predecessors.push_back({edge.first, delay});
    }
    return {};
}

Result<void> ProblemIndex::index_transitions(const ProblemSpec& spec) {
    const size_t k = categories_.size();
    for (const auto& matrix : spec.transitions) {
        auto r = find_resource(matrix.resource);
        if (!r) return invalid("transition matrix " + matrix.name + " on unknown resource " + matrix.resource);

        auto& res = resources_[*r];
        if (!res.changeovers.empty()) {
            return invalid("resource " + res.id + " has more than one transition matrix");
        }
        if (res.capacity != 1) {
            return invalid("transition matrix " + matrix.name + " needs resource " + res.id
                           + " to have capacity 1");
        }
        if (matrix.default_ms < 0) {
            return invalid("transition matrix " + matrix.name + " has a negative default");
        }
        for (const auto& [pair, ms] : matrix.transitions) {
            if (ms < 0) {
                return invalid("transition " + pair.first + " -> " + pair.second + " in "
                               + matrix.name + " is negative");
            }
        }

        res.changeovers.assign(std::max<size_t>(k * k, 1), 0);
        for (size_t from = 0; from < k; ++from) {
            for (size_t to = 0; to < k; ++to) {
                const TimeMs ms = matrix.between(categories_[from], categories_[to]);
                res.changeovers[from * k + to] = ms;
                res.max_changeover_ms = std::max(res.max_changeover_ms, ms);
            }
        }
    }
    return {};
}

// ─────────────────────────────────────────────
// Topological Ordering (Kahn's Algorithm)
// ─────────────────────────────────────────────

Result<void> ProblemIndex::order_graph() {
    const size_t n = activities_.size();
    std::vector<size_t> in_degree(n, 0);
    for (const auto& a : activities_) {
        for (const auto& s : a.successors) ++in_degree[s.activity];
    }

    std::queue<ActivityIndex> zero_in;
    for (ActivityIndex a = 0; a < n; ++a) {
        if (in_degree[a] == 0) zero_in.push(a);
    }

    topo_order_.clear();
    topo_order_.reserve(n);
    while (!zero_in.empty()) {
        auto current = zero_in.front();
        zero_in.pop();
        topo_order_.push_back(current);
        for (const auto& s : activities_[current].successors) {
            if (--in_degree[s.activity] == 0) zero_in.push(s.activity);
        }
    }

    if (topo_order_.size() != n) {
        std::string members;
        for (ActivityIndex a = 0; a < n; ++a) {
            if (in_degree[a] == 0) continue;
            if (!members.empty()) members += ", ";
            members += activities_[a].id;
        }
        return Error{ErrorKind::Infeasible, "precedence cycle among activities: " + members};
    }
    return {};
}

void ProblemIndex::compute_paths() {
    critical_path_ms_ = 0;

    for (ActivityIndex a : topo_order_) {
        auto& info = activities_[a];
        TimeMs head = info.release_ms;
        for (const auto& p : info.predecessors) {
            const auto& pred = activities_[p.activity];
            head = std::max(head, pred.head_ms + pred.min_duration_ms + p.min_delay_ms);
        }
        info.head_ms = head;
    }

    for (auto it = topo_order_.rbegin(); it != topo_order_.rend(); ++it) {
        auto& info = activities_[*it];
        TimeMs tail = 0;
        for (const auto& s : info.successors) {
            const auto& succ = activities_[s.activity];
            tail = std::max(tail, s.min_delay_ms + succ.min_duration_ms + succ.tail_ms);
        }
        info.tail_ms = tail;
        critical_path_ms_ = std::max(critical_path_ms_, info.head_ms + info.min_duration_ms + tail);
    }
}

// ─────────────────────────────────────────────
// Lookups
// ─────────────────────────────────────────────

std::optional<ActivityIndex> ProblemIndex::find_activity(const ActivityId& id) const {
    auto it = activity_lookup_.find(id);
    if (it == activity_lookup_.end()) return std::nullopt;
    return it->second;
}

std::optional<ResourceIndex> ProblemIndex::find_resource(const ResourceId& id) const {
    auto it = resource_lookup_.find(id);
    if (it == resource_lookup_.end()) return std::nullopt;
    return it->second;
}

std::optional<TaskIndex> ProblemIndex::find_task(const TaskId& id) const {
    auto it = task_lookup_.find(id);
    if (it == task_lookup_.end()) return std::nullopt;
    return it->second;
}

std::optional<TimeMs> ProblemIndex::duration_on(ActivityIndex a, ResourceIndex r) const {
    for (const auto& c : activities_[a].candidates) {
        if (c.resource == r) return c.duration_ms;
    }
    return std::nullopt;
}

TimeMs ProblemIndex::changeover_ms(ResourceIndex r, TaskIndex from, TaskIndex to) const noexcept {
    const auto& matrix = resources_[r].changeovers;
    if (matrix.empty()) return 0;
    return matrix[tasks_[from].category * categories_.size() + tasks_[to].category];
}

TimeMs ProblemIndex::total_work_ms() const noexcept {
    TimeMs total = 0;
    for (const auto& t : tasks_) total += t.total_work_ms;
    return total;
}

// ─────────────────────────────────────────────
// Schedule verification
// ─────────────────────────────────────────────

Result<void> ProblemIndex::verify(const Schedule& schedule) const {
    const size_t n = activities_.size();
    std::vector<const Assignment*> by_index(n, nullptr);
    std::vector<ResourceIndex> resource_of(n, kInvalidIndex);

    for (const auto& asg : schedule.assignments()) {
        auto a = find_activity(asg.activity_id);
        if (!a) {
            return Error{ErrorKind::InconsistentSchedule, "unknown activity " + asg.activity_id};
        }
        auto r = find_resource(asg.resource_id);
        if (!r) {
            return Error{ErrorKind::InconsistentSchedule, "unknown resource " + asg.resource_id};
        }
        if (!duration_on(*a, *r)) {
            return Error{ErrorKind::InconsistentSchedule,
                         "resource " + asg.resource_id + " cannot run activity " + asg.activity_id};
        }
        by_index[*a] = &asg;
        resource_of[*a] = *r;
    }

    for (ActivityIndex a = 0; a < n; ++a) {
        if (by_index[a] == nullptr) {
            return Error{ErrorKind::InconsistentSchedule, "activity " + activities_[a].id + " is unscheduled"};
        }
    }

    // Changeover into each assignment from the one before it on its resource.
    std::vector<TimeMs> changeover(n, 0);
    std::vector<std::vector<ActivityIndex>> sequence(resources_.size());
    for (ActivityIndex a = 0; a < n; ++a) {
        if (has_changeovers(resource_of[a])) sequence[resource_of[a]].push_back(a);
    }
    for (ResourceIndex r = 0; r < resources_.size(); ++r) {
        auto& order = sequence[r];
        std::sort(order.begin(), order.end(), [&by_index](ActivityIndex x, ActivityIndex y) {
            return std::pair(by_index[x]->start_ms, by_index[x]->end_ms)
                 < std::pair(by_index[y]->start_ms, by_index[y]->end_ms);
        });
        for (size_t i = 1; i < order.size(); ++i) {
            changeover[order[i]] = changeover_ms(r, activities_[order[i - 1]].task, activities_[order[i]].task);
        }
    }

    for (ActivityIndex a = 0; a < n; ++a) {
        const Assignment* asg = by_index[a];
        const TimeMs expected = *duration_on(a, resource_of[a]) + changeover[a];
        if (asg->duration_ms() != expected) {
            return Error{ErrorKind::InconsistentSchedule,
                         "activity " + asg->activity_id + " lasts " + std::to_string(asg->duration_ms())
                         + " ms, expected " + std::to_string(expected)};
        }
    }

    for (ActivityIndex a = 0; a < n; ++a) {
        const auto& info = activities_[a];
        const Assignment* asg = by_index[a];
        if (asg->start_ms < info.release_ms) {
            return Error{ErrorKind::Infeasible, "activity " + info.id + " starts before its release"};
        }
        if (info.deadline_ms && asg->end_ms > *info.deadline_ms) {
            return Error{ErrorKind::Infeasible, "activity " + info.id + " misses its hard deadline"};
        }
        if (!resources_[resource_of[a]].calendar.is_available(asg->start_ms, asg->end_ms)) {
            return Error{ErrorKind::Infeasible,
                         "activity " + info.id + " runs outside the calendar of " + asg->resource_id};
        }
        for (const auto& p : info.predecessors) {
            const Assignment* pred = by_index[p.activity];
            if (asg->start_ms < pred->end_ms + p.min_delay_ms) {
                return Error{ErrorKind::Infeasible,
                             "activity " + info.id + " starts before predecessor "
                             + activities_[p.activity].id + " allows"};
            }
        }
    }

    // Capacity: sweep start/end events per resource, ends before starts.
    std::vector<std::vector<std::pair<TimeMs, int>>> events(resources_.size());
    for (ActivityIndex a = 0; a < n; ++a) {
        const Assignment* asg = by_index[a];
        if (asg->end_ms == asg->start_ms) continue;
        events[resource_of[a]].push_back({asg->start_ms, +1});
        events[resource_of[a]].push_back({asg->end_ms, -1});
    }
    for (ResourceIndex r = 0; r < resources_.size(); ++r) {
        auto& ev = events[r];
        std::sort(ev.begin(), ev.end());
        int running = 0;
        for (const auto& [time, delta] : ev) {
            running += delta;
            if (running > static_cast<int>(resources_[r].capacity)) {
                return Error{ErrorKind::Infeasible,
                             "resource " + resources_[r].id + " over capacity at "
                             + std::to_string(time)};
            }
        }
    }
    return {};
}

}  // namespace uras
