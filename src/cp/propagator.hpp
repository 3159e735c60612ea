/**
 * @file propagator.hpp
 * @brief AC-3 over the binary constraints of the CP model.
 *
 * Arcs:
 *   - precedence, forward:  a successor cannot start before the earliest
 *     finish of its predecessor plus the delay.
 *   - precedence, backward: a predecessor must leave room to finish before
 *     the latest start of its successor.
 *   - disjunctive: on a resource of capacity 1, once the source activity
 *     can only run there, a target of positive duration may not start
 *     inside the source's compulsory part.
 */

#pragma once

#include "core/result.hpp"
#include "cp/domain.hpp"
#include "model/problem.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace uras {

class ArcConsistency {
public:
    explicit ArcConsistency(const ProblemIndex& problem);

    /**
     * @brief Revise arcs until no domain changes.
     *
     * With `changed` empty every arc is queued; otherwise only arcs whose
     * source is in `changed`. Returns the number of revisions that removed
     * values, or Infeasible naming the activity whose domain emptied.
     */
    [[nodiscard]] Result<uint64_t> enforce(std::vector<ActivityDomain>& domains,
                                           std::span<const ActivityIndex> changed = {}) const;

    [[nodiscard]] size_t arc_count() const noexcept { return arcs_.size(); }

private:
    enum class ArcKind : uint8_t { After, Before, Disjunctive };

    struct Arc {
        ActivityIndex target;
        ActivityIndex source;
        ArcKind kind;
        TimeMs delay_ms{0};
        ResourceIndex resource{kInvalidIndex};
    };

    /// True when the target's domain lost values.
    bool revise(const Arc& arc, std::vector<ActivityDomain>& domains) const;

    const ProblemIndex* problem_;
    std::vector<Arc> arcs_;
    std::vector<std::vector<size_t>> arcs_from_;   ///< Arc ids by source activity
};

}  // namespace uras
