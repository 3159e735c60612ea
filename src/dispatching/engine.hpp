/**
 * @file engine.hpp
 * @brief Multi-layer dispatching engine: a primary rule with tie-breakers.
 */

#pragma once

#include "core/result.hpp"
#include "dispatching/context.hpp"
#include "dispatching/rule.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace uras {

enum class EvaluationMode : uint8_t {
    Sequential,   ///< Lexicographic over the rule chain
    Weighted      ///< Single key = Σ weight_i · key_i
};

[[nodiscard]] Result<EvaluationMode> parse_evaluation_mode(std::string_view name);

/**
 * @brief Orders activities by a chain of rules.
 *
 * Sequential mode compares the first rule's keys, falls through to the next
 * rule on exact ties, and finally to the activity id, so the order is a
 * strict total order for any input. Evaluation is pure.
 */
class DispatchEngine {
public:
    DispatchEngine() = default;
    explicit DispatchEngine(std::vector<DispatchRule> chain,
                            EvaluationMode mode = EvaluationMode::Sequential);

    /// Build from rule names such as {"EDD", "SPT"}.
    static Result<DispatchEngine> from_names(const std::vector<std::string>& names,
                                             const RuleParams& params = {},
                                             EvaluationMode mode = EvaluationMode::Sequential,
                                             std::vector<double> weights = {});

    DispatchEngine& add_rule(DispatchRule rule, double weight = 1.0);

    [[nodiscard]] std::vector<ActivityIndex> sort(const ProblemIndex& problem,
                                                  std::span<const ActivityIndex> activities,
                                                  const DispatchContext& context) const;

    [[nodiscard]] std::optional<ActivityIndex> select_best(const ProblemIndex& problem,
                                                           std::span<const ActivityIndex> activities,
                                                           const DispatchContext& context) const;

    /// Key vector of one activity (one entry per rule, or one weighted sum).
    [[nodiscard]] std::vector<double> keys(const ProblemIndex& problem, ActivityIndex activity,
                                           const DispatchContext& context) const;

    [[nodiscard]] size_t rule_count() const noexcept { return chain_.size(); }
    [[nodiscard]] EvaluationMode mode() const noexcept { return mode_; }
    [[nodiscard]] std::string describe() const;

private:
    [[nodiscard]] bool precedes(const ProblemIndex& problem,
                                ActivityIndex a, const std::vector<double>& ka,
                                ActivityIndex b, const std::vector<double>& kb) const;

    std::vector<DispatchRule> chain_;
    std::vector<double> weights_;
    EvaluationMode mode_ = EvaluationMode::Sequential;
};

}  // namespace uras
