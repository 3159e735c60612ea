/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "core/result.hpp"
#include "cp/cp_solver.hpp"
#include "dispatching/engine.hpp"
#include "ga/ga_scheduler.hpp"
#include "model/duration.hpp"

namespace uras {

enum class AlgorithmKind : uint8_t { Greedy, Ga, Cp };

[[nodiscard]] std::string_view to_string(AlgorithmKind kind) noexcept;
[[nodiscard]] Result<AlgorithmKind> parse_algorithm(std::string_view name);
[[nodiscard]] Result<EstimateMode> parse_estimate_mode(std::string_view name);

struct EngineOptions {
    AlgorithmKind algorithm = AlgorithmKind::Greedy;
    EstimatePolicy estimate;
};

struct DispatchingConfig {
    std::vector<std::string> rules{"EDD", "SPT"};
    EvaluationMode mode = EvaluationMode::Sequential;
    std::vector<double> weights;        ///< Weighted mode; empty = all 1.0
    RuleParams params;

    /// Build the engine; Config error for an unknown rule name.
    [[nodiscard]] Result<DispatchEngine> make_engine() const;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool log_to_stdout = false;
};

/**
 * @brief Top-level engine configuration.
 *
 * `objective` is copied into the GA and CP weights when loading.
 */
struct EngineConfig {
    EngineOptions engine;
    ObjectiveWeights objective;
    DispatchingConfig dispatching;
    GaConfig ga;
    CpConfig cp;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Unknown algorithm, rule, mode or
 * selection names and out-of-range values are Config errors.
 */
Result<EngineConfig> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
EngineConfig default_config();

}  // namespace uras
