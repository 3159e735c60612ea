/**
 * @file engine.cpp
 * @brief DispatchEngine sorting and selection.
 */

#include "dispatching/engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace uras {

Result<EvaluationMode> parse_evaluation_mode(std::string_view name) {
    if (name == "sequential") return EvaluationMode::Sequential;
    if (name == "weighted") return EvaluationMode::Weighted;
    return Error{ErrorKind::Config, "unknown dispatching mode: " + std::string(name)};
}

DispatchEngine::DispatchEngine(std::vector<DispatchRule> chain, EvaluationMode mode)
    : chain_(std::move(chain)), weights_(chain_.size(), 1.0), mode_(mode) {}

Result<DispatchEngine> DispatchEngine::from_names(const std::vector<std::string>& names,
                                                  const RuleParams& params,
                                                  EvaluationMode mode,
                                                  std::vector<double> weights) {
    if (!weights.empty() && weights.size() != names.size()) {
        return Error{ErrorKind::Config, "dispatching weights must match the rule list"};
    }
    DispatchEngine engine;
    engine.mode_ = mode;
    for (size_t i = 0; i < names.size(); ++i) {
        auto kind = parse_rule_kind(names[i]);
        if (!kind) return kind.error();
        engine.add_rule(DispatchRule::make(*kind, params), weights.empty() ? 1.0 : weights[i]);
    }
    return engine;
}

DispatchEngine& DispatchEngine::add_rule(DispatchRule rule, double weight) {
    chain_.push_back(std::move(rule));
    weights_.push_back(weight);
    return *this;
}

std::vector<double> DispatchEngine::keys(const ProblemIndex& problem, ActivityIndex activity,
                                         const DispatchContext& context) const {
    if (mode_ == EvaluationMode::Weighted) {
        double sum = 0.0;
        for (size_t i = 0; i < chain_.size(); ++i) {
            if (weights_[i] == 0.0) continue;
            sum += weights_[i] * chain_[i].key(problem, activity, context);
        }
        if (std::isnan(sum)) sum = std::numeric_limits<double>::infinity();
        return {sum};
    }

    std::vector<double> out;
    out.reserve(chain_.size());
    for (const auto& rule : chain_) {
        out.push_back(rule.key(problem, activity, context));
    }
    return out;
}

bool DispatchEngine::precedes(const ProblemIndex& problem,
                              ActivityIndex a, const std::vector<double>& ka,
                              ActivityIndex b, const std::vector<double>& kb) const {
    for (size_t i = 0; i < ka.size(); ++i) {
        if (ka[i] < kb[i]) return true;
        if (kb[i] < ka[i]) return false;
    }
    return problem.activity(a).id < problem.activity(b).id;
}

std::vector<ActivityIndex> DispatchEngine::sort(const ProblemIndex& problem,
                                                std::span<const ActivityIndex> activities,
                                                const DispatchContext& context) const {
    std::vector<std::vector<double>> key_table;
    key_table.reserve(activities.size());
    for (ActivityIndex a : activities) {
        key_table.push_back(keys(problem, a, context));
    }

    std::vector<size_t> order(activities.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](size_t x, size_t y) {
        return precedes(problem, activities[x], key_table[x], activities[y], key_table[y]);
    });

    std::vector<ActivityIndex> sorted;
    sorted.reserve(order.size());
    for (size_t i : order) sorted.push_back(activities[i]);
    return sorted;
}

std::optional<ActivityIndex> DispatchEngine::select_best(const ProblemIndex& problem,
                                                         std::span<const ActivityIndex> activities,
                                                         const DispatchContext& context) const {
    if (activities.empty()) return std::nullopt;

    ActivityIndex best = activities.front();
    auto best_keys = keys(problem, best, context);
    for (size_t i = 1; i < activities.size(); ++i) {
        auto k = keys(problem, activities[i], context);
        if (precedes(problem, activities[i], k, best, best_keys)) {
            best = activities[i];
            best_keys = std::move(k);
        }
    }
    return best;
}

std::string DispatchEngine::describe() const {
    std::string out = mode_ == EvaluationMode::Weighted ? "weighted(" : "";
    for (size_t i = 0; i < chain_.size(); ++i) {
        if (i > 0) out += mode_ == EvaluationMode::Weighted ? "+" : ">";
        out += chain_[i].name();
    }
    if (mode_ == EvaluationMode::Weighted) out += ")";
    return out.empty() ? "ID" : out;
}

}  // namespace uras
