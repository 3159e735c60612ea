/**
 * @file problem.hpp
 * @brief Problem definition and its validated, index-based form.
 *
 * ProblemIndex is the arena every algorithm works on: activities, resources
 * and tasks get dense integer handles, candidate resources carry their
 * effective durations, and the precedence graph (sequence edges plus
 * explicit constraints) is stored as adjacency lists with a topological
 * order, cycle detection and head/tail path lengths.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "model/constraint.hpp"
#include "model/duration.hpp"
#include "model/resource.hpp"
#include "model/schedule.hpp"
#include "model/task.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace uras {

/**
 * @brief Everything that defines one scheduling problem.
 */
struct ProblemSpec {
    std::vector<Task> tasks;
    std::vector<Resource> resources;
    std::vector<Constraint> constraints;
    std::vector<TransitionMatrix> transitions;    ///< At most one per resource
    TimeMs start_time_ms{0};
    EstimatePolicy estimate;
};

// ─────────────────────────────────────────────
// Indexed records
// ─────────────────────────────────────────────

struct PrecedenceLink {
    ActivityIndex activity;      ///< The other end of the edge
    TimeMs min_delay_ms{0};
};

struct CandidateOption {
    ResourceIndex resource;
    TimeMs duration_ms;          ///< Effective duration on this resource
};

struct SoftWindowRef {
    WindowScope scope;
    uint32_t target;             ///< ActivityIndex or TaskIndex
    TimeWindow window;
};

struct ActivityInfo {
    ActivityId id;
    TaskIndex task;
    uint32_t position_in_task{0};
    TimeMs processing_ms{0};     ///< Nominal, at efficiency 1
    TimeMs setup_ms{0};
    TimeMs teardown_ms{0};
    std::vector<CandidateOption> candidates;
    std::vector<PrecedenceLink> predecessors;
    std::vector<PrecedenceLink> successors;
    TimeMs release_ms{0};                    ///< Earliest allowed start
    std::optional<TimeMs> deadline_ms;       ///< Hard latest finish
    TimeMs min_duration_ms{0};               ///< Over candidates
    TimeMs head_ms{0};                       ///< Earliest start ignoring resources
    TimeMs tail_ms{0};                       ///< Longest min-duration path after the end

    [[nodiscard]] TimeMs nominal_total_ms() const noexcept {
        return setup_ms + processing_ms + teardown_ms;
    }
};

struct TaskInfo {
    TaskId id;
    int32_t priority{0};
    double weight{1.0};
    uint32_t category{0};            ///< Index into ProblemIndex::categories()
    std::optional<TimeMs> due_date;
    TimeMs release_ms{0};
    std::vector<ActivityIndex> activities;
    TimeMs total_work_ms{0};
};

struct ResourceInfo {
    ResourceId id;
    std::string category;
    double efficiency{1.0};
    uint32_t capacity{1};
    Calendar calendar;
    std::vector<TimeMs> changeovers;     ///< category × category, row = from; empty without a matrix
    TimeMs max_changeover_ms{0};
};

// ─────────────────────────────────────────────
// ProblemIndex
// ─────────────────────────────────────────────

class ProblemIndex {
public:
    /**
     * @brief Validate and index a problem.
     *
     * InvalidSpec for malformed or dangling data, including a transition
     * matrix on a resource of capacity above one; Infeasible for a cycle in
     * the precedence graph.
     */
    static Result<ProblemIndex> build(const ProblemSpec& spec);

    // ── Sizes & records ───────────────────────
    [[nodiscard]] size_t activity_count() const noexcept { return activities_.size(); }
    [[nodiscard]] size_t resource_count() const noexcept { return resources_.size(); }
    [[nodiscard]] size_t task_count() const noexcept { return tasks_.size(); }

    [[nodiscard]] const ActivityInfo& activity(ActivityIndex a) const { return activities_[a]; }
    [[nodiscard]] const ResourceInfo& resource(ResourceIndex r) const { return resources_[r]; }
    [[nodiscard]] const TaskInfo& task(TaskIndex t) const { return tasks_[t]; }
    [[nodiscard]] const std::vector<ActivityInfo>& activities() const noexcept { return activities_; }
    [[nodiscard]] const std::vector<ResourceInfo>& resources() const noexcept { return resources_; }
    [[nodiscard]] const std::vector<TaskInfo>& tasks() const noexcept { return tasks_; }
    [[nodiscard]] const std::vector<SoftWindowRef>& soft_windows() const noexcept { return soft_windows_; }

    [[nodiscard]] std::optional<ActivityIndex> find_activity(const ActivityId& id) const;
    [[nodiscard]] std::optional<ResourceIndex> find_resource(const ResourceId& id) const;
    [[nodiscard]] std::optional<TaskIndex> find_task(const TaskId& id) const;

    /// Effective duration of activity a on resource r, if r is a candidate.
    [[nodiscard]] std::optional<TimeMs> duration_on(ActivityIndex a, ResourceIndex r) const;

    // ── Changeovers ───────────────────────────
    /// Distinct task categories, in first-seen order.
    [[nodiscard]] const std::vector<std::string>& categories() const noexcept { return categories_; }
    [[nodiscard]] bool has_changeovers(ResourceIndex r) const noexcept { return !resources_[r].changeovers.empty(); }
    /// Time to switch r from a task of `from` to a task of `to`; 0 without a matrix.
    [[nodiscard]] TimeMs changeover_ms(ResourceIndex r, TaskIndex from, TaskIndex to) const noexcept;
    [[nodiscard]] TimeMs max_changeover_ms(ResourceIndex r) const noexcept { return resources_[r].max_changeover_ms; }

    // ── Graph queries ─────────────────────────
    [[nodiscard]] const std::vector<ActivityIndex>& topological_order() const noexcept { return topo_order_; }
    /// Longest head + min duration + tail over all activities.
    [[nodiscard]] TimeMs critical_path_ms() const noexcept { return critical_path_ms_; }
    [[nodiscard]] TimeMs total_work_ms() const noexcept;
    [[nodiscard]] TimeMs start_time_ms() const noexcept { return start_time_ms_; }

    /**
     * @brief Check a schedule against every hard constraint.
     *
     * InconsistentSchedule for unknown or missing activities, a resource that
     * is not a candidate, or a duration mismatch (the expected duration on a
     * resource with a transition matrix includes the changeover from the
     * previous assignment there); Infeasible for precedence, capacity,
     * calendar or hard window breaches.
     */
    [[nodiscard]] Result<void> verify(const Schedule& schedule) const;

private:
    ProblemIndex() = default;

    Result<void> index_resources(const ProblemSpec& spec);
    Result<void> index_tasks(const ProblemSpec& spec);
    Result<void> apply_constraints(const ProblemSpec& spec);
    Result<void> index_transitions(const ProblemSpec& spec);
    Result<void> order_graph();
    void compute_paths();

    std::vector<ActivityInfo> activities_;
    std::vector<ResourceInfo> resources_;
    std::vector<TaskInfo> tasks_;
    std::vector<SoftWindowRef> soft_windows_;
    std::vector<ActivityIndex> topo_order_;
    std::vector<std::string> categories_;

    std::unordered_map<ActivityId, ActivityIndex> activity_lookup_;
    std::unordered_map<ResourceId, ResourceIndex> resource_lookup_;
    std::unordered_map<TaskId, TaskIndex> task_lookup_;

    TimeMs start_time_ms_{0};
    TimeMs critical_path_ms_{0};
};

}  // namespace uras
