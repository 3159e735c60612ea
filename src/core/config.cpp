/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <algorithm>
#include <cctype>

#include <toml++/toml.hpp>

namespace uras {

namespace {

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Re-tag a validation error as a configuration error.
Error as_config_error(const Error& error, std::string_view section) {
    return Error{ErrorKind::Config, "[" + std::string(section) + "] " + error.message};
}

}  // anonymous namespace

std::string_view to_string(AlgorithmKind kind) noexcept {
    switch (kind) {
        case AlgorithmKind::Greedy: return "greedy";
        case AlgorithmKind::Ga:     return "ga";
        case AlgorithmKind::Cp:     return "cp";
    }
    return "unknown";
}

Result<AlgorithmKind> parse_algorithm(std::string_view name) {
    auto lower = lowercase(name);
    if (lower == "greedy" || lower == "simple") return AlgorithmKind::Greedy;
    if (lower == "ga" || lower == "genetic") return AlgorithmKind::Ga;
    if (lower == "cp") return AlgorithmKind::Cp;
    return Error{ErrorKind::Config, "unknown algorithm: " + std::string(name)};
}

Result<EstimateMode> parse_estimate_mode(std::string_view name) {
    auto lower = lowercase(name);
    if (lower == "mean") return EstimateMode::Mean;
    if (lower == "quantile") return EstimateMode::Quantile;
    return Error{ErrorKind::Config, "unknown duration estimate mode: " + std::string(name)};
}

Result<DispatchEngine> DispatchingConfig::make_engine() const {
    if (!weights.empty() && weights.size() != rules.size()) {
        return Error{ErrorKind::Config,
                     "dispatching weights (" + std::to_string(weights.size())
                     + ") must match the rule count (" + std::to_string(rules.size()) + ")"};
    }
    return DispatchEngine::from_names(rules, params, mode, weights);
}

Result<EngineConfig> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::Config, "Configuration file not found: " + path.string()};
    }

    EngineConfig config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            if (auto name = engine["algorithm"].value<std::string>()) {
                auto kind = parse_algorithm(*name);
                if (!kind) return kind.error();
                config.engine.algorithm = *kind;
            }

            // [engine.duration]
            if (auto duration = engine["duration"]; duration.is_table()) {
                if (auto mode = duration["estimate"].value<std::string>()) {
                    auto parsed = parse_estimate_mode(*mode);
                    if (!parsed) return parsed.error();
                    config.engine.estimate.mode = *parsed;
                }
                config.engine.estimate.level = duration["level"].value_or(0.95);
                if (!(config.engine.estimate.level > 0.0 && config.engine.estimate.level < 1.0)) {
                    return Error{ErrorKind::Config, "[engine.duration] level must lie in (0, 1)"};
                }
            }
        }

        // [objective]
        if (auto objective = tbl["objective"]; objective.is_table()) {
            config.objective.makespan = objective["makespan_weight"].value_or(1.0);
            config.objective.penalty = objective["penalty_weight"].value_or(1.0);
        }

        // [dispatching]
        if (auto dispatching = tbl["dispatching"]; dispatching.is_table()) {
            if (auto rules = dispatching["rules"].as_array()) {
                config.dispatching.rules.clear();
                for (const auto& node : *rules) {
                    auto name = node.value<std::string>();
                    if (!name) return Error{ErrorKind::Config, "[dispatching] rules must be strings"};
                    if (auto kind = parse_rule_kind(*name); !kind) return kind.error();
                    config.dispatching.rules.push_back(*name);
                }
            }
            if (auto mode = dispatching["mode"].value<std::string>()) {
                auto parsed = parse_evaluation_mode(*mode);
                if (!parsed) return parsed.error();
                config.dispatching.mode = *parsed;
            }
            if (auto weights = dispatching["weights"].as_array()) {
                for (const auto& node : *weights) {
                    config.dispatching.weights.push_back(node.value_or(1.0));
                }
            }
            config.dispatching.params.atc_k = dispatching["atc_k"].value_or(2.0);
            if (!(config.dispatching.params.atc_k > 0.0)) {
                return Error{ErrorKind::Config, "[dispatching] atc_k must be positive"};
            }
        }

        // [ga]
        if (auto ga = tbl["ga"]; ga.is_table()) {
            auto& g = config.ga;
            g.population_size = static_cast<uint32_t>(ga["population_size"].value_or(int64_t{100}));
            g.max_generations = static_cast<uint32_t>(ga["max_generations"].value_or(int64_t{500}));
            g.crossover_rate = ga["crossover_rate"].value_or(0.8);
            g.mutation_rate = ga["mutation_rate"].value_or(0.1);
            g.resource_mutation_rate = ga["resource_mutation_rate"].value_or(0.1);
            g.stagnation_limit = static_cast<uint32_t>(ga["stagnation_limit"].value_or(int64_t{50}));
            g.seed = static_cast<uint64_t>(ga["seed"].value_or(int64_t{42}));
            g.tournament_size = static_cast<uint32_t>(ga["tournament_size"].value_or(int64_t{3}));
            g.elite_count = static_cast<uint32_t>(ga["elite_count"].value_or(int64_t{10}));
            g.threads = static_cast<uint32_t>(ga["threads"].value_or(int64_t{1}));
            g.seed_with_greedy = ga["seed_with_greedy"].value_or(true);
            if (auto selection = ga["selection"].value<std::string>()) {
                auto parsed = parse_selection_method(*selection);
                if (!parsed) return parsed.error();
                g.selection = *parsed;
            }
        }

        // [cp]
        if (auto cp = tbl["cp"]; cp.is_table()) {
            auto& c = config.cp;
            c.time_budget_ms = cp["time_budget_ms"].value_or(int64_t{60'000});
            c.node_budget = static_cast<uint64_t>(cp["node_budget"].value_or(int64_t{1'000'000}));
            c.threads = static_cast<uint32_t>(cp["threads"].value_or(int64_t{1}));
            c.stop_after_first = cp["stop_after_first"].value_or(false);
            c.seed_with_greedy = cp["seed_with_greedy"].value_or(true);
            if (auto horizon = cp["horizon_ms"].value<int64_t>()) c.horizon_ms = *horizon;
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.log_to_stdout = telemetry["stdout"].value_or(false);
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Config, std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    config.ga.weights = config.objective;
    config.cp.weights = config.objective;

    if (auto valid = config.ga.validate(); !valid) return as_config_error(valid.error(), "ga");
    if (auto valid = config.cp.validate(); !valid) return as_config_error(valid.error(), "cp");
    if (auto engine = config.dispatching.make_engine(); !engine) {
        return as_config_error(engine.error(), "dispatching");
    }
    return config;
}

EngineConfig default_config() {
    return EngineConfig{};
}

}  // namespace uras
