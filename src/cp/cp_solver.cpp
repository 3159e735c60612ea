/**
 * @file cp_solver.cpp
 * @brief CpSolver: root propagation, depth-first branch-and-bound.
 *
 * Search loop (per worker):
 *   stack ← [root frame]
 *   while stack not empty:
 *     take the next branch of the top frame, or pop it when exhausted
 *     child ← copy of the frame's node; commit the branch; propagate
 *     complete child → offer as incumbent
 *     lower bound ≥ incumbent → prune
 *     otherwise push a frame with the child's branches
 *
 * Branches of a node: every eligible activity (all predecessors placed),
 * smallest domain first, ties by dispatching rank; per activity, each
 * candidate resource at its earliest admissible start, earliest end first.
 */

#include "cp/cp_solver.hpp"

#include "cp/domain.hpp"
#include "cp/propagator.hpp"
#include "executor/thread_pool.hpp"
#include "scheduler/greedy_scheduler.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <future>
#include <limits>
#include <mutex>
#include <stop_token>

namespace uras {

namespace {

using Clock = std::chrono::steady_clock;

struct SearchNode {
    ScheduleState state;
    std::vector<ActivityDomain> domains;
};

struct Branch {
    ActivityIndex activity;
    Placement placement;
};

struct Frame {
    SearchNode node;
    std::vector<Branch> branches;
    size_t next = 0;
};

// ─────────────────────────────────────────────
// Shared search state
// ─────────────────────────────────────────────

class SharedSearch {
public:
    SharedSearch(uint64_t node_budget, Clock::time_point deadline, bool stop_after_first)
        : node_budget_(node_budget), deadline_(deadline), stop_after_first_(stop_after_first) {}

    /// Count one node; false once a budget is spent or the search stopped.
    bool charge_node() {
        if (stop_.stop_requested()) return false;
        if (nodes_.fetch_add(1, std::memory_order_relaxed) >= node_budget_ || Clock::now() >= deadline_) {
            budget_hit_.store(true, std::memory_order_release);
            stop_.request_stop();
            return false;
        }
        return true;
    }

    [[nodiscard]] bool stopped() const noexcept { return stop_.stop_requested(); }
    [[nodiscard]] double bound() const noexcept { return best_.load(std::memory_order_acquire); }

    void seed(const ScheduleState& state, double objective) {
        std::lock_guard lock(mutex_);
        incumbent_ = state;
        best_.store(objective, std::memory_order_release);
    }

    void offer(const ScheduleState& state, double objective) {
        std::lock_guard lock(mutex_);
        if (incumbent_ && objective >= best_.load(std::memory_order_relaxed)) return;
        incumbent_ = state;
        best_.store(objective, std::memory_order_release);
        ++improvements_;
        if (stop_after_first_) {
            first_found_ = true;
            stop_.request_stop();
        }
    }

    [[nodiscard]] std::optional<ScheduleState> incumbent() const {
        std::lock_guard lock(mutex_);
        return incumbent_;
    }

    [[nodiscard]] uint64_t nodes() const noexcept {
        return std::min(nodes_.load(std::memory_order_relaxed), node_budget_);
    }
    [[nodiscard]] bool budget_hit() const noexcept { return budget_hit_.load(std::memory_order_acquire); }
    [[nodiscard]] bool first_found() const {
        std::lock_guard lock(mutex_);
        return first_found_;
    }
    [[nodiscard]] uint64_t improvements() const {
        std::lock_guard lock(mutex_);
        return improvements_;
    }

private:
    const uint64_t node_budget_;
    const Clock::time_point deadline_;
    const bool stop_after_first_;

    mutable std::mutex mutex_;
    std::optional<ScheduleState> incumbent_;
    uint64_t improvements_{0};
    bool first_found_ = false;

    std::atomic<double> best_{std::numeric_limits<double>::infinity()};
    std::atomic<uint64_t> nodes_{0};
    std::atomic<bool> budget_hit_{false};
    std::stop_source stop_;
};

/// Earliest s >= from admitted by both the domain and the timeline.
std::optional<TimeMs> earliest_admissible(const IntervalSet& starts, const ResourceTimeline& timeline,
                                          TimeMs from, TimeMs duration) {
    TimeMs t = from;
    while (true) {
        auto in_domain = starts.first_at_or_after(t);
        if (!in_domain) return std::nullopt;
        auto fits = timeline.earliest_start(*in_domain, duration);
        if (!fits) return std::nullopt;
        if (starts.contains(*fits)) return fits;
        t = *fits;
    }
}

// ─────────────────────────────────────────────
// BranchAndBound
// ─────────────────────────────────────────────

class BranchAndBound {
public:
    BranchAndBound(const ProblemIndex& problem, const ArcConsistency& propagator,
                   std::vector<uint32_t> rank, ObjectiveWeights weights, SharedSearch& shared)
        : problem_(problem), propagator_(propagator), rank_(std::move(rank))
        , weights_(weights), shared_(shared) {}

    [[nodiscard]] double objective(const ScheduleState& state) const {
        return weights_.evaluate(state.makespan_ms(), state.soft_penalty());
    }

    [[nodiscard]] double lower_bound(const SearchNode& node) const {
        TimeMs makespan = node.state.makespan_ms();
        for (ActivityIndex a = 0; a < problem_.activity_count(); ++a) {
            if (node.state.is_placed(a)) continue;
            makespan = std::max(makespan, node.domains[a].earliest_finish() + problem_.activity(a).tail_ms);
        }
        return weights_.evaluate(makespan, node.state.soft_penalty());
    }

    /// Empty when some eligible activity has no admissible value.
    [[nodiscard]] std::vector<Branch> expand(const SearchNode& node) const {
        struct Choice {
            ActivityIndex activity;
            uint64_t domain_size;
            std::vector<Placement> values;
        };

        std::vector<Choice> choices;
        for (ActivityIndex a = 0; a < problem_.activity_count(); ++a) {
            if (node.state.is_placed(a) || !node.state.predecessors_placed(a)) continue;
            auto values = values_of(node, a);
            if (values.empty()) return {};
            choices.push_back(Choice{a, node.domains[a].size(), std::move(values)});
        }

        std::sort(choices.begin(), choices.end(), [this](const Choice& x, const Choice& y) {
            if (x.domain_size != y.domain_size) return x.domain_size < y.domain_size;
            return rank_[x.activity] < rank_[y.activity];
        });

        std::vector<Branch> branches;
        for (const auto& c : choices) {
            for (const auto& v : c.values) branches.push_back(Branch{c.activity, v});
        }
        return branches;
    }

    [[nodiscard]] std::optional<SearchNode> apply(const SearchNode& parent, const Branch& branch) const {
        SearchNode child = parent;
        child.state.commit(branch.activity, branch.placement);
        child.domains[branch.activity].fix(branch.placement.resource, branch.placement.start);

        const ActivityIndex changed[] = {branch.activity};
        if (!propagator_.enforce(child.domains, changed)) return std::nullopt;
        return child;
    }

    void run(Frame root, std::stop_token worker_stop) const {
        std::vector<Frame> stack;
        stack.push_back(std::move(root));

        while (!stack.empty()) {
            if (worker_stop.stop_requested() || shared_.stopped()) return;

            Frame& top = stack.back();
            if (top.next == top.branches.size()) {
                stack.pop_back();
                continue;
            }
            const Branch branch = top.branches[top.next++];
            if (!shared_.charge_node()) return;

            auto child = apply(top.node, branch);
            if (!child) continue;

            if (child->state.complete()) {
                shared_.offer(child->state, objective(child->state));
                continue;
            }
            if (lower_bound(*child) >= shared_.bound()) continue;

            auto branches = expand(*child);
            if (branches.empty()) continue;
            stack.push_back(Frame{std::move(*child), std::move(branches)});
        }
    }

private:
    [[nodiscard]] std::vector<Placement> values_of(const SearchNode& node, ActivityIndex a) const {
        const auto& info = problem_.activity(a);

        std::vector<Placement> values;
        for (const auto& c : info.candidates) {
            const ResourceDomain* option = node.domains[a].find(c.resource);
            if (option == nullptr || option->starts.empty()) continue;
            const TimeMs changeover = node.state.changeover_into(a, c.resource);
            const TimeMs span = option->duration_ms + changeover;
            auto start = earliest_admissible(option->starts, node.state.timeline(c.resource),
                                             node.state.ready_on(a, c.resource), span);
            if (!start) continue;
            // Domains bound the end without the changeover.
            if (info.deadline_ms && *start + span > *info.deadline_ms) continue;
            values.push_back(Placement{c.resource, *start, *start + span, changeover});
        }
        std::stable_sort(values.begin(), values.end(),
            [](const Placement& x, const Placement& y) { return x.end < y.end; });
        return values;
    }

    const ProblemIndex& problem_;
    const ArcConsistency& propagator_;
    std::vector<uint32_t> rank_;
    ObjectiveWeights weights_;
    SharedSearch& shared_;
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// CpConfig
// ─────────────────────────────────────────────

Result<void> CpConfig::validate() const {
    if (time_budget_ms <= 0) {
        return Error{ErrorKind::InvalidSpec, "cp time budget must be positive"};
    }
    if (node_budget == 0) {
        return Error{ErrorKind::InvalidSpec, "cp node budget must be positive"};
    }
    if (threads == 0) {
        return Error{ErrorKind::InvalidSpec, "cp needs at least one thread"};
    }
    if (!std::isfinite(weights.makespan) || !std::isfinite(weights.penalty)
        || weights.makespan < 0.0 || weights.penalty < 0.0) {
        return Error{ErrorKind::InvalidSpec, "objective weights must be finite and >= 0"};
    }
    return {};
}

// ─────────────────────────────────────────────
// Horizon
// ─────────────────────────────────────────────

Result<TimeMs> serial_horizon(const ProblemIndex& problem) {
    TimeMs clock = problem.start_time_ms();
    std::vector<TimeMs> ends(problem.activity_count(), clock);
    for (ActivityIndex a : problem.topological_order()) {
        const auto& info = problem.activity(a);
        TimeMs from = std::max({clock, info.release_ms, info.head_ms});
        for (const auto& p : info.predecessors) {
            from = std::max(from, ends[p.activity] + p.min_delay_ms);
        }

        std::optional<TimeMs> best_end;
        for (const auto& c : info.candidates) {
            // Worst-case changeover into this activity on the resource.
            const TimeMs span = c.duration_ms + problem.max_changeover_ms(c.resource);
            auto slot = problem.resource(c.resource).calendar.next_slot(from, span);
            if (!slot) continue;
            TimeMs end = *slot + span;
            if (!best_end || end < *best_end) best_end = end;
        }
        if (!best_end) {
            return Error{ErrorKind::Infeasible,
                         "activity " + info.id + " has no available slot on any candidate resource"};
        }
        ends[a] = *best_end;
        clock = *best_end;
    }
    return clock;
}

// ─────────────────────────────────────────────
// CpSolver
// ─────────────────────────────────────────────

CpSolver::CpSolver(CpConfig config, DispatchEngine engine)
    : config_(std::move(config)), engine_(std::move(engine)) {}

Result<SolveReport> CpSolver::solve(const ProblemIndex& problem, Logger* logger) {
    const auto started = Clock::now();
    if (auto valid = config_.validate(); !valid) return valid.error();

    // ── Greedy seed ───────────────────────────
    std::optional<ScheduleState> seed;
    if (config_.seed_with_greedy) {
        GreedyScheduler greedy(engine_, config_.weights);
        auto built = greedy.construct(problem, nullptr);
        if (built) {
            seed = std::move(*built);
        } else {
            log_to(logger, LogLevel::Debug, "cp", "no greedy seed: " + built.error().message);
        }
    }

    // ── Horizon & root propagation ────────────
    TimeMs horizon = 0;
    if (config_.horizon_ms) {
        horizon = *config_.horizon_ms;
    } else {
        auto serial = serial_horizon(problem);
        if (!serial) return serial.error();
        horizon = *serial;
        for (const auto& info : problem.activities()) {
            if (info.deadline_ms) horizon = std::max(horizon, *info.deadline_ms);
        }
        if (seed) horizon = std::max(horizon, seed->makespan_ms());
        horizon += *serial - problem.start_time_ms();
    }

    ArcConsistency propagator(problem);
    auto domains = initial_domains(problem, horizon);
    auto revisions = propagator.enforce(domains);
    if (!revisions) {
        log_to(logger, LogLevel::Info, "cp", "propagation proved infeasibility: " + revisions.error().message);
        return revisions.error();
    }
    log_to(logger, LogLevel::Debug, "cp",
           std::to_string(problem.activity_count()) + " activities, "
           + std::to_string(propagator.arc_count()) + " arcs, horizon "
           + std::to_string(horizon) + " ms, root revisions " + std::to_string(*revisions));

    // ── Search ────────────────────────────────
    std::vector<uint32_t> rank(problem.activity_count(), 0);
    {
        std::vector<ActivityIndex> all(problem.activity_count());
        for (ActivityIndex a = 0; a < all.size(); ++a) all[a] = a;
        auto ordered = engine_.sort(problem, all, DispatchContext::initial(problem, problem.start_time_ms()));
        for (uint32_t i = 0; i < ordered.size(); ++i) rank[ordered[i]] = i;
    }

    SharedSearch shared(config_.node_budget,
                        started + std::chrono::milliseconds(config_.time_budget_ms),
                        config_.stop_after_first);
    BranchAndBound search(problem, propagator, std::move(rank), config_.weights, shared);

    bool searched = false;
    if (seed) shared.seed(*seed, search.objective(*seed));

    if (!(seed && config_.stop_after_first)) {
        searched = true;
        SearchNode root{ScheduleState(problem), std::move(domains)};

        if (root.state.complete()) {
            shared.offer(root.state, search.objective(root.state));
        } else {
            auto branches = search.expand(root);
            const size_t workers = std::min<size_t>(config_.threads, branches.size());

            if (workers <= 1) {
                search.run(Frame{std::move(root), std::move(branches)}, std::stop_token{});
            } else {
                ThreadPool pool(workers);
                std::vector<std::future<void>> pending;
                pending.reserve(workers);
                for (size_t w = 0; w < workers; ++w) {
                    Frame part{root, {}};
                    for (size_t i = w; i < branches.size(); i += workers) part.branches.push_back(branches[i]);
                    pending.push_back(pool.submit_cancellable(
                        [&search, part = std::move(part)](std::stop_token stop) {
                            search.run(part, stop);
                        }));
                }
                for (auto& f : pending) f.get();
            }
        }
    }

    // ── Outcome ───────────────────────────────
    auto best = shared.incumbent();
    const bool budget_hit = shared.budget_hit();

    if (!best) {
        if (budget_hit) {
            log_to(logger, LogLevel::Warn, "cp", "budget exhausted before any schedule was found");
            return Error{ErrorKind::BudgetExceeded,
                         "cp budget exhausted after " + std::to_string(shared.nodes())
                         + " nodes without a feasible schedule"};
        }
        log_to(logger, LogLevel::Info, "cp", "search space exhausted without a feasible schedule");
        return Error{ErrorKind::Infeasible, "no schedule satisfies every hard constraint"};
    }

    auto schedule = best->to_schedule();
    if (!schedule) return schedule.error();
    if (auto ok = problem.verify(*schedule); !ok) return ok.error();

    SolveReport report;
    report.algorithm = std::string(name());
    report.objective = search.objective(*best);
    report.budget_exhausted = budget_hit;
    report.proven_optimal = searched && !budget_hit && !shared.first_found();
    report.nodes_explored = shared.nodes();
    report.schedule = std::move(*schedule);
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

    log_to(logger, LogLevel::Info, "cp",
           "makespan " + std::to_string(report.schedule.makespan_ms()) + " ms, objective "
           + std::to_string(report.objective) + ", nodes " + std::to_string(report.nodes_explored)
           + ", improvements " + std::to_string(shared.improvements())
           + (report.proven_optimal ? ", optimal" : (budget_hit ? ", budget exhausted" : "")));
    return report;
}

}  // namespace uras
