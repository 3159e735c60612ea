/**
 * @file constraint.hpp
 * @brief Constraint variants between activities, resources and time.
 */

#pragma once

#include "core/types.hpp"
#include "model/time_window.hpp"

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace uras {

/// `after` starts no earlier than `before` ends plus min_delay_ms.
struct PrecedenceConstraint {
    ActivityId before;
    ActivityId after;
    TimeMs min_delay_ms{0};
};

/// At most max_concurrent activities at once on the resource.
struct CapacityConstraint {
    ResourceId resource;
    uint32_t max_concurrent{1};
};

enum class WindowScope : uint8_t {
    Activity,   ///< Applies to the activity's [start, end)
    Task        ///< Applies to [first start, completion) of the task
};

[[nodiscard]] constexpr std::string_view to_string(WindowScope scope) noexcept {
    switch (scope) {
        case WindowScope::Activity: return "activity";
        case WindowScope::Task:     return "task";
    }
    return "unknown";
}

struct TimeWindowConstraint {
    WindowScope scope = WindowScope::Activity;
    std::string target;
    TimeWindow window;
};

using Constraint = std::variant<PrecedenceConstraint, CapacityConstraint, TimeWindowConstraint>;

/**
 * @brief Sequence-dependent changeover times on one resource.
 *
 * Running a task of category `to` right after one of category `from` on the
 * resource first costs transitions[{from, to}], or default_ms when the pair
 * is not listed. The first activity on the resource pays nothing.
 */
struct TransitionMatrix {
    std::string name;
    ResourceId resource;
    std::map<std::pair<std::string, std::string>, TimeMs> transitions;
    TimeMs default_ms{0};

    TransitionMatrix& set(std::string from, std::string to, TimeMs ms) {
        transitions[{std::move(from), std::move(to)}] = ms;
        return *this;
    }

    [[nodiscard]] TimeMs between(const std::string& from, const std::string& to) const {
        auto it = transitions.find({from, to});
        return it == transitions.end() ? default_ms : it->second;
    }
};

}  // namespace uras
