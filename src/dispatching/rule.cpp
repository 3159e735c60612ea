/**
 * @file rule.cpp
 * @brief Built-in dispatching rule catalogue.
 */

#include "dispatching/rule.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace uras {

namespace {

double processing(const ProblemIndex& problem, ActivityIndex a) {
    return static_cast<double>(problem.activity(a).nominal_total_ms());
}

const TaskInfo& task_of(const ProblemIndex& problem, ActivityIndex a) {
    return problem.task(problem.activity(a).task);
}

double remaining(const ProblemIndex& problem, ActivityIndex a, const DispatchContext& ctx) {
    return static_cast<double>(ctx.remaining_work_of(problem, problem.activity(a).task));
}

/// due − now − remaining work of the task.
double slack(const ProblemIndex& problem, ActivityIndex a, const DispatchContext& ctx) {
    const auto& task = task_of(problem, a);
    return static_cast<double>(*task.due_date - ctx.now) - remaining(problem, a, ctx);
}

double min_over_candidates(const ProblemIndex& problem, ActivityIndex a,
                           const std::function<double(ResourceIndex)>& value) {
    double best = std::numeric_limits<double>::infinity();
    for (const auto& c : problem.activity(a).candidates) {
        best = std::min(best, value(c.resource));
    }
    return best;
}

std::string upper(std::string_view name) {
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(),
        [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

}  // anonymous namespace

std::string_view to_string(RuleKind kind) noexcept {
    switch (kind) {
        case RuleKind::Spt:  return "SPT";
        case RuleKind::Lpt:  return "LPT";
        case RuleKind::Lwkr: return "LWKR";
        case RuleKind::Mwkr: return "MWKR";
        case RuleKind::Edd:  return "EDD";
        case RuleKind::Mst:  return "MST";
        case RuleKind::Cr:   return "CR";
        case RuleKind::Sro:  return "S/RO";
        case RuleKind::Fifo: return "FIFO";
        case RuleKind::Winq: return "WINQ";
        case RuleKind::Lpul: return "LPUL";
        case RuleKind::Atc:  return "ATC";
        case RuleKind::Wspt: return "WSPT";
        case RuleKind::Priority: return "PRIORITY";
    }
    return "unknown";
}

Result<RuleKind> parse_rule_kind(std::string_view name) {
    const std::string key = upper(name);
    if (key == "SRO") return RuleKind::Sro;
    for (auto kind : {RuleKind::Spt, RuleKind::Lpt, RuleKind::Lwkr, RuleKind::Mwkr,
                      RuleKind::Edd, RuleKind::Mst, RuleKind::Cr, RuleKind::Sro,
                      RuleKind::Fifo, RuleKind::Winq, RuleKind::Lpul, RuleKind::Atc,
                      RuleKind::Wspt, RuleKind::Priority}) {
        if (key == to_string(kind)) return kind;
    }
    return Error{ErrorKind::Config, "unknown dispatching rule: " + std::string(name)};
}

// ─────────────────────────────────────────────
// DispatchRule
// ─────────────────────────────────────────────

DispatchRule::DispatchRule(std::string name, RuleKeyFn key)
    : name_(std::move(name)), key_(std::move(key)) {}

double DispatchRule::key(const ProblemIndex& problem, ActivityIndex activity,
                         const DispatchContext& context) const {
    double value = key_(problem, activity, context);
    if (std::isnan(value)) return std::numeric_limits<double>::infinity();
    return value;
}

DispatchRule DispatchRule::make(RuleKind kind, const RuleParams& params) {
    std::string name(to_string(kind));

    switch (kind) {
        case RuleKind::Spt:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext&) {
                return processing(p, a);
            }};

        case RuleKind::Lpt:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext&) {
                return -processing(p, a);
            }};

        case RuleKind::Lwkr:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext& ctx) {
                return remaining(p, a, ctx);
            }};

        case RuleKind::Mwkr:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext& ctx) {
                return -remaining(p, a, ctx);
            }};

        case RuleKind::Edd:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext&) {
                const auto& task = task_of(p, a);
                return task.due_date ? static_cast<double>(*task.due_date) : kNoDueDateKey;
            }};

        case RuleKind::Mst:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext& ctx) {
                if (!task_of(p, a).due_date) return kNoDueDateKey;
                return slack(p, a, ctx);
            }};

        case RuleKind::Cr:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext& ctx) {
                const auto& task = task_of(p, a);
                if (!task.due_date) return kNoDueDateKey;
                double rem = std::max(remaining(p, a, ctx), kRuleEpsilon);
                return static_cast<double>(*task.due_date - ctx.now) / rem;
            }};

        case RuleKind::Sro:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext& ctx) {
                if (!task_of(p, a).due_date) return kNoDueDateKey;
                uint32_t ops = std::max<uint32_t>(1, ctx.remaining_ops_of(p, p.activity(a).task));
                return slack(p, a, ctx) / static_cast<double>(ops);
            }};

        case RuleKind::Fifo:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext& ctx) {
                return static_cast<double>(ctx.ready_time_of(p, a));
            }};

        case RuleKind::Winq:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext& ctx) {
                return min_over_candidates(p, a, [&ctx](ResourceIndex r) {
                    return static_cast<double>(ctx.queued_work_of(r));
                });
            }};

        case RuleKind::Lpul:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext& ctx) {
                return min_over_candidates(p, a, [&ctx](ResourceIndex r) {
                    return ctx.utilization_of(r);
                });
            }};

        case RuleKind::Atc: {
            const double k = params.atc_k;
            return {name, [k](const ProblemIndex& p, ActivityIndex a, const DispatchContext& ctx) {
                const auto& task = task_of(p, a);
                double proc = std::max(processing(p, a), kRuleEpsilon);
                double avg = ctx.average_processing_ms > 0.0 ? ctx.average_processing_ms : proc;
                if (!task.due_date) return -0.0;
                double s = static_cast<double>(*task.due_date - ctx.now) - proc;
                double urgency = std::exp(-std::max(0.0, s) / (k * avg));
                return -(1.0 / proc) * urgency;
            }};
        }

        case RuleKind::Wspt:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext&) {
                return processing(p, a) / task_of(p, a).weight;
            }};

        case RuleKind::Priority:
            return {name, [](const ProblemIndex& p, ActivityIndex a, const DispatchContext&) {
                return -static_cast<double>(task_of(p, a).priority);
            }};
    }
    return {name, [](const ProblemIndex&, ActivityIndex, const DispatchContext&) { return 0.0; }};
}

}  // namespace uras
