/**
 * @file rule.hpp
 * @brief Dispatching rules: a key function per activity, lower = first.
 *
 * The built-in catalogue is a closed enum; user rules plug in through the
 * same DispatchRule capability by supplying their own key function.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "dispatching/context.hpp"
#include "model/problem.hpp"

#include <functional>
#include <limits>
#include <string>
#include <string_view>

namespace uras {

enum class RuleKind : uint8_t {
    Spt,    ///< Shortest processing time
    Lpt,    ///< Longest processing time
    Lwkr,   ///< Least work remaining in the task
    Mwkr,   ///< Most work remaining in the task
    Edd,    ///< Earliest due date
    Mst,    ///< Minimum slack time
    Cr,     ///< Critical ratio
    Sro,    ///< Slack per remaining operation
    Fifo,   ///< First in, first out
    Winq,   ///< Least work queued at the candidate resource
    Lpul,   ///< Lowest planned utilization of the candidate resource
    Atc,    ///< Apparent tardiness cost
    Wspt,   ///< Weighted shortest processing time
    Priority    ///< Highest task priority first
};

[[nodiscard]] std::string_view to_string(RuleKind kind) noexcept;

/// Case-insensitive; accepts "S/RO" and "SRO". Unknown names are Config errors.
[[nodiscard]] Result<RuleKind> parse_rule_kind(std::string_view name);

struct RuleParams {
    double atc_k = 2.0;     ///< ATC look-ahead scaling
};

/// Key given to activities whose task has no due date under due-date rules.
inline constexpr double kNoDueDateKey = std::numeric_limits<double>::max();

/// Denominator used when remaining processing time is zero.
inline constexpr double kRuleEpsilon = 1e-9;

using RuleKeyFn = std::function<double(const ProblemIndex&, ActivityIndex, const DispatchContext&)>;

/**
 * @brief A named key function. Keys are compared exactly; NaN maps to +∞.
 */
class DispatchRule {
public:
    DispatchRule(std::string name, RuleKeyFn key);

    static DispatchRule make(RuleKind kind, const RuleParams& params = {});

    /// User-supplied rule.
    template <RuleKeyLike F>
    static DispatchRule custom(std::string name, F key) {
        return DispatchRule(std::move(name), RuleKeyFn(std::move(key)));
    }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] double key(const ProblemIndex& problem, ActivityIndex activity,
                             const DispatchContext& context) const;

private:
    std::string name_;
    RuleKeyFn key_;
};

}  // namespace uras
