/**
 * @file task.hpp
 * @brief Task and Activity: the unit of work and its atomic steps.
 */

#pragma once

#include "core/types.hpp"
#include "model/duration.hpp"

#include <optional>
#include <string>
#include <vector>

namespace uras {

/**
 * @brief Alternative resources for one requirement of an activity.
 *
 * An empty candidate list means "any resource of this category".
 */
struct ResourceGroup {
    std::string category;
    std::vector<ResourceId> candidates;
};

/**
 * @brief Atomic step of a task, executed on exactly one resource.
 *
 * Unless no_precedence is set, the activity waits for every activity of
 * the same task with a smaller sequence index.
 */
struct Activity {
    ActivityId id;
    TaskId task_id;
    uint32_t sequence{0};
    DurationSpec duration;
    std::vector<ResourceGroup> resource_groups;
    bool no_precedence = false;
};

/**
 * @brief A unit of work made of ordered activities.
 */
struct Task {
    TaskId id;
    std::string name;
    int32_t priority{0};                    ///< Higher = more urgent; used by PRIORITY
    double weight{1.0};                     ///< Used by WSPT and ATC
    std::string category;                   ///< Keys changeover times on resources
    std::vector<Activity> activities;
    std::optional<TimeMs> due_date;
    std::optional<TimeMs> release_time;
};

}  // namespace uras
