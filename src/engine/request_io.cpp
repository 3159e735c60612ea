/**
 * @file request_io.cpp
 * @brief Request parsing with toml++ and hand-written JSON output.
 */

#include "engine/request_io.hpp"

#include "core/logger.hpp"

#include <cmath>
#include <sstream>

#include <toml++/toml.hpp>

namespace uras {

namespace {

Error invalid(std::string message) {
    return Error{ErrorKind::InvalidSpec, std::move(message)};
}

Result<std::string> required_string(const toml::table& t, std::string_view key, std::string_view what) {
    auto value = t[key].value<std::string>();
    if (!value || value->empty()) {
        return invalid(std::string(what) + " needs a non-empty '" + std::string(key) + "'");
    }
    return *value;
}

std::optional<TimeMs> optional_ms(const toml::table& t, std::string_view key) {
    return t[key].value<int64_t>();
}

/// Array of [start, end] pairs.
Result<std::vector<Interval>> parse_intervals(const toml::table& t, std::string_view key, const std::string& owner) {
    std::vector<Interval> out;
    const auto* array = t[key].as_array();
    if (array == nullptr) return out;
    for (const auto& node : *array) {
        const auto* pair = node.as_array();
        if (pair == nullptr || pair->size() != 2) {
            return invalid(owner + ": '" + std::string(key) + "' entries must be [start_ms, end_ms]");
        }
        auto start = (*pair)[0].value<int64_t>();
        auto end = (*pair)[1].value<int64_t>();
        if (!start || !end) {
            return invalid(owner + ": '" + std::string(key) + "' bounds must be integers");
        }
        out.push_back(Interval{*start, *end});
    }
    return out;
}

Result<ResourceKind> parse_resource_kind(std::string_view name) {
    if (name == "primary") return ResourceKind::Primary;
    if (name == "secondary") return ResourceKind::Secondary;
    if (name == "human") return ResourceKind::Human;
    return invalid("unknown resource kind: " + std::string(name));
}

Result<Resource> parse_resource(const toml::table& t) {
    auto id = required_string(t, "id", "resource");
    if (!id) return id.error();

    Resource r;
    r.id = *id;
    r.name = t["name"].value_or(*id);
    r.category = t["category"].value_or(std::string{});
    r.efficiency = t["efficiency"].value_or(1.0);
    r.capacity = static_cast<uint32_t>(t["capacity"].value_or(int64_t{1}));
    if (auto kind = t["kind"].value<std::string>()) {
        auto parsed = parse_resource_kind(*kind);
        if (!parsed) return parsed.error();
        r.kind = *parsed;
    }

    auto available = parse_intervals(t, "available", "resource " + r.id);
    if (!available) return available.error();
    if (t["available"].is_array()) {
        auto calendar = Calendar::from_intervals(std::move(*available));
        if (!calendar) return calendar.error();
        r.calendar = std::move(*calendar);
    }

    auto blocked = parse_intervals(t, "blocked", "resource " + r.id);
    if (!blocked) return blocked.error();
    for (const auto& period : *blocked) {
        if (auto ok = r.calendar.block(period); !ok) return ok.error();
    }
    return r;
}

Result<DurationDistribution> parse_distribution(const toml::table& activity, const std::string& owner) {
    if (auto fixed = activity["duration_ms"].value<int64_t>()) {
        return DurationDistribution::fixed(*fixed);
    }
    const auto* d = activity["duration"].as_table();
    if (d == nullptr) return invalid(owner + " needs 'duration_ms' or a 'duration' table");

    const std::string kind = (*d)["kind"].value_or(std::string{"fixed"});
    auto ms = [&](std::string_view key) { return (*d)[key].value_or(int64_t{0}); };

    if (kind == "fixed") return DurationDistribution::fixed(ms("ms"));
    if (kind == "pert") return DurationDistribution::pert(ms("optimistic"), ms("most_likely"), ms("pessimistic"));
    if (kind == "uniform") return DurationDistribution::uniform(ms("min"), ms("max"));
    if (kind == "triangular") return DurationDistribution::triangular(ms("min"), ms("mode"), ms("max"));
    if (kind == "lognormal") {
        return DurationDistribution::lognormal((*d)["mu"].value_or(0.0), (*d)["sigma"].value_or(0.0));
    }
    return invalid(owner + ": unknown duration kind '" + kind + "'");
}

Result<Activity> parse_activity(const toml::table& t, const TaskId& task) {
    auto id = required_string(t, "id", "activity of task " + task);
    if (!id) return id.error();

    Activity a;
    a.id = *id;
    a.task_id = task;
    a.sequence = static_cast<uint32_t>(t["sequence"].value_or(int64_t{0}));
    a.no_precedence = t["no_precedence"].value_or(false);

    auto dist = parse_distribution(t, "activity " + a.id);
    if (!dist) return dist.error();
    a.duration.processing = std::move(*dist);
    a.duration.setup_ms = t["setup_ms"].value_or(int64_t{0});
    a.duration.teardown_ms = t["teardown_ms"].value_or(int64_t{0});

    if (const auto* groups = t["resource_groups"].as_array()) {
        for (const auto& node : *groups) {
            const auto* g = node.as_table();
            if (g == nullptr) return invalid("activity " + a.id + ": resource_groups entries must be tables");
            ResourceGroup group;
            group.category = (*g)["category"].value_or(std::string{});
            if (const auto* candidates = (*g)["candidates"].as_array()) {
                for (const auto& c : *candidates) {
                    auto name = c.value<std::string>();
                    if (!name) return invalid("activity " + a.id + ": candidates must be resource ids");
                    group.candidates.push_back(*name);
                }
            }
            a.resource_groups.push_back(std::move(group));
        }
    }
    return a;
}

Result<Task> parse_task(const toml::table& t) {
    auto id = required_string(t, "id", "task");
    if (!id) return id.error();

    Task task;
    task.id = *id;
    task.name = t["name"].value_or(*id);
    task.priority = static_cast<int32_t>(t["priority"].value_or(int64_t{0}));
    task.weight = t["weight"].value_or(1.0);
    task.category = t["category"].value_or(std::string{});
    task.due_date = optional_ms(t, "due_date_ms");
    task.release_time = optional_ms(t, "release_ms");

    if (const auto* activities = t["activities"].as_array()) {
        for (const auto& node : *activities) {
            const auto* at = node.as_table();
            if (at == nullptr) return invalid("task " + task.id + ": activities must be tables");
            auto activity = parse_activity(*at, task.id);
            if (!activity) return activity.error();
            task.activities.push_back(std::move(*activity));
        }
    }
    return task;
}

Result<Constraint> parse_window(const toml::table& t) {
    auto target = required_string(t, "target", "window");
    if (!target) return target.error();

    const std::string scope = t["scope"].value_or(std::string{"activity"});
    WindowScope ws = WindowScope::Activity;
    if (scope == "task") {
        ws = WindowScope::Task;
    } else if (scope != "activity") {
        return invalid("window on " + *target + ": unknown scope '" + scope + "'");
    }

    const std::string kind = t["kind"].value_or(std::string{"hard"});
    if (kind != "hard" && kind != "soft") {
        return invalid("window on " + *target + ": unknown kind '" + kind + "'");
    }
    auto window = TimeWindow::create(optional_ms(t, "earliest_start_ms"), optional_ms(t, "latest_finish_ms"),
                                     kind == "soft" ? WindowKind::Soft : WindowKind::Hard,
                                     t["penalty_per_ms"].value_or(0.0));
    if (!window) return window.error();
    return Constraint{TimeWindowConstraint{.scope = ws, .target = *target, .window = *window}};
}

Result<TransitionMatrix> parse_transitions(const toml::table& t) {
    auto resource = required_string(t, "resource", "transition matrix");
    if (!resource) return resource.error();

    TransitionMatrix matrix;
    matrix.resource = *resource;
    matrix.name = t["name"].value_or(*resource);
    matrix.default_ms = t["default_ms"].value_or(int64_t{0});

    if (const auto* entries = t["entries"].as_array()) {
        for (const auto& node : *entries) {
            const auto* e = node.as_table();
            if (e == nullptr) return invalid("transition matrix " + matrix.name + ": entries must be tables");
            auto from = (*e)["from"].value<std::string>();
            auto to = (*e)["to"].value<std::string>();
            auto ms = (*e)["ms"].value<int64_t>();
            if (!from || !to || !ms) {
                return invalid("transition matrix " + matrix.name + ": entries need 'from', 'to' and 'ms'");
            }
            matrix.set(*from, *to, *ms);
        }
    }
    return matrix;
}

template <typename F>
Result<void> for_each_table(const toml::table& root, std::string_view key, F&& body) {
    const auto* array = root[key].as_array();
    if (array == nullptr) return {};
    for (const auto& node : *array) {
        const auto* t = node.as_table();
        if (t == nullptr) return invalid("'" + std::string(key) + "' entries must be tables");
        if (auto ok = body(*t); !ok) return ok.error();
    }
    return {};
}

Result<ProblemSpec> parse_root(const toml::table& root) {
    ProblemSpec spec;
    spec.start_time_ms = root["start_time_ms"].value_or(int64_t{0});

    auto ok = for_each_table(root, "resources", [&](const toml::table& t) -> Result<void> {
        auto r = parse_resource(t);
        if (!r) return r.error();
        spec.resources.push_back(std::move(*r));
        return {};
    });
    if (!ok) return ok.error();

    ok = for_each_table(root, "tasks", [&](const toml::table& t) -> Result<void> {
        auto task = parse_task(t);
        if (!task) return task.error();
        spec.tasks.push_back(std::move(*task));
        return {};
    });
    if (!ok) return ok.error();

    ok = for_each_table(root, "precedences", [&](const toml::table& t) -> Result<void> {
        auto before = required_string(t, "before", "precedence");
        if (!before) return before.error();
        auto after = required_string(t, "after", "precedence");
        if (!after) return after.error();
        spec.constraints.emplace_back(PrecedenceConstraint{
            .before = *before, .after = *after, .min_delay_ms = t["min_delay_ms"].value_or(int64_t{0})});
        return {};
    });
    if (!ok) return ok.error();

    ok = for_each_table(root, "capacities", [&](const toml::table& t) -> Result<void> {
        auto resource = required_string(t, "resource", "capacity constraint");
        if (!resource) return resource.error();
        spec.constraints.emplace_back(CapacityConstraint{
            .resource = *resource,
            .max_concurrent = static_cast<uint32_t>(t["max_concurrent"].value_or(int64_t{1}))});
        return {};
    });
    if (!ok) return ok.error();

    ok = for_each_table(root, "windows", [&](const toml::table& t) -> Result<void> {
        auto window = parse_window(t);
        if (!window) return window.error();
        spec.constraints.push_back(std::move(*window));
        return {};
    });
    if (!ok) return ok.error();

    ok = for_each_table(root, "transitions", [&](const toml::table& t) -> Result<void> {
        auto matrix = parse_transitions(t);
        if (!matrix) return matrix.error();
        spec.transitions.push_back(std::move(*matrix));
        return {};
    });
    if (!ok) return ok.error();

    return spec;
}

// ── JSON ──────────────────────────────────────

std::string quoted(std::string_view text) {
    return "\"" + json_escape(text) + "\"";
}

std::string number(double value) {
    if (!std::isfinite(value)) return "null";
    std::ostringstream out;
    out.precision(15);
    out << value;
    return out.str();
}

}  // anonymous namespace

Result<ProblemSpec> parse_request(std::string_view toml_text) {
    try {
        return parse_root(toml::parse(toml_text));
    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config, std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<ProblemSpec> load_request(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Request file not found: " + path.string()};
    }
    try {
        return parse_root(toml::parse_file(path.string()));
    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config, std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

std::string to_json(const ScheduleResponse& response) {
    std::ostringstream out;
    out << "{";

    if (response.error) {
        out << "\"ok\":false,\"error\":{\"kind\":" << quoted(to_string(response.error->kind))
            << ",\"message\":" << quoted(response.error->message) << "}}";
        return out.str();
    }

    const auto& report = *response.report;
    out << "\"ok\":true"
        << ",\"algorithm\":" << quoted(report.algorithm)
        << ",\"objective\":" << number(report.objective)
        << ",\"proven_optimal\":" << (report.proven_optimal ? "true" : "false")
        << ",\"budget_exhausted\":" << (report.budget_exhausted ? "true" : "false")
        << ",\"nodes_explored\":" << report.nodes_explored
        << ",\"generations\":" << report.generations
        << ",\"elapsed_ms\":" << report.elapsed.count();

    out << ",\"assignments\":[";
    bool first = true;
    for (const auto& a : report.schedule.assignments()) {
        out << (first ? "" : ",")
            << "{\"activity\":" << quoted(a.activity_id)
            << ",\"task\":" << quoted(a.task_id)
            << ",\"resource\":" << quoted(a.resource_id)
            << ",\"start_ms\":" << a.start_ms
            << ",\"end_ms\":" << a.end_ms
            << ",\"setup_ms\":" << a.setup_ms << "}";
        first = false;
    }
    out << "]";

    out << ",\"violations\":[";
    first = true;
    for (const auto& v : report.schedule.violations()) {
        out << (first ? "" : ",")
            << "{\"target\":" << quoted(v.target)
            << ",\"description\":" << quoted(v.description)
            << ",\"overage_ms\":" << v.overage_ms
            << ",\"penalty\":" << number(v.penalty)
            << ",\"hard\":" << (v.hard ? "true" : "false") << "}";
        first = false;
    }
    out << "]";

    if (response.kpi) {
        const auto& k = *response.kpi;
        out << ",\"kpi\":{\"makespan_ms\":" << k.makespan_ms
            << ",\"total_tardiness_ms\":" << k.total_tardiness_ms
            << ",\"mean_tardiness_ms\":" << number(k.mean_tardiness_ms)
            << ",\"max_tardiness_ms\":" << k.max_tardiness_ms
            << ",\"tardy_tasks\":" << k.tardy_task_count
            << ",\"on_time_rate\":" << number(k.on_time_rate)
            << ",\"mean_flow_time_ms\":" << number(k.mean_flow_time_ms)
            << ",\"mean_utilization\":" << number(k.mean_utilization)
            << ",\"total_penalty\":" << number(k.total_penalty)
            << ",\"utilization\":{";
        first = true;
        for (const auto& [id, u] : k.utilization) {
            out << (first ? "" : ",") << quoted(id) << ":" << number(u);
            first = false;
        }
        out << "}}";
    }

    out << "}";
    return out.str();
}

}  // namespace uras
