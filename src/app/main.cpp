/**
 * @file main.cpp
 * @brief uras command-line entry point.
 *
 * Wires the modules into one request pipeline:
 *   Config → Logger → Request → ProblemIndex → Algorithm → KPI → JSON
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "engine/engine.hpp"
#include "engine/request_io.hpp"
#include "telemetry/json_sink.hpp"
#include "workload/generator.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>

using namespace uras;

namespace {

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path request_path;
    std::filesystem::path output_path;
    std::optional<std::string> algorithm;
    std::string log_level;
    bool demo_mode = false;
};

void print_usage() {
    std::cout << "Usage: uras [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/default.toml)\n"
              << "  --request <path>     Problem request file (TOML)\n"
              << "  --algorithm <name>   Override the configured algorithm (greedy, ga, cp)\n"
              << "  --output <path>      Write the JSON response here instead of stdout\n"
              << "  --log-level <level>  debug, info, warn or error\n"
              << "  --demo               Solve a generated job shop with every algorithm\n"
              << "  --help, -h           Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--request" && i + 1 < argc) {
            args.request_path = argv[++i];
        } else if (arg == "--algorithm" && i + 1 < argc) {
            args.algorithm = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return std::nullopt;
        }
    }
    return args;
}

/**
 * @brief Run a single demo: generate a job shop, solve it with each
 *        algorithm, and print a comparison.
 */
int run_demo(const EngineConfig& config, Logger& logger) {
    logger.info("demo", "=== Demo Mode ===");

    std::mt19937 rng(7);
    auto problem = ProblemGenerator::job_shop(6, 4, DurationRange{.min_ms = 1'000, .max_ms = 9'000}, rng);
    logger.info("demo", "generated job shop: " + std::to_string(problem.tasks.size()) + " jobs on "
                + std::to_string(problem.resources.size()) + " machines");

    std::cout << std::left << std::setw(8) << "algo" << std::setw(14) << "makespan_ms"
              << std::setw(12) << "elapsed_ms" << "status\n";

    for (AlgorithmKind kind : {AlgorithmKind::Greedy, AlgorithmKind::Ga, AlgorithmKind::Cp}) {
        auto request = ScheduleRequest::from_config(problem, config);
        request.algorithm = kind;
        request.cp.time_budget_ms = std::min<TimeMs>(request.cp.time_budget_ms, 5'000);

        auto response = schedule(request, &logger);
        std::cout << std::setw(8) << to_string(kind);
        if (!response.ok()) {
            std::cout << std::setw(14) << "-" << std::setw(12) << "-"
                      << to_string(response.error->kind) << "\n";
            continue;
        }
        const auto& report = *response.report;
        std::cout << std::setw(14) << report.schedule.makespan_ms()
                  << std::setw(12) << report.elapsed.count()
                  << (report.proven_optimal ? "optimal" : (report.budget_exhausted ? "budget" : "ok")) << "\n";
    }

    logger.info("demo", "=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) return 2;

    // Load configuration
    auto config_result = load_config(args->config_path);
    if (!config_result) {
        if (config_result.error().kind == ErrorKind::Config
            && !std::filesystem::exists(args->config_path)) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            std::cerr << "Using default configuration." << std::endl;
        } else {
            std::cerr << "Invalid config: " << config_result.error().message << std::endl;
            return 2;
        }
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (args->algorithm) {
        auto kind = parse_algorithm(*args->algorithm);
        if (!kind) {
            std::cerr << kind.error().message << std::endl;
            return 2;
        }
        config.engine.algorithm = *kind;
    }
    if (!args->log_level.empty()) config.telemetry.log_level = args->log_level;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (config.telemetry.log_to_stdout || config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<StdoutSink>();
    } else {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "uras",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level));
    logger.info("main", "uras starting, algorithm " + std::string(to_string(config.engine.algorithm)));

    // ── Demo mode shortcut ───────────────────
    if (args->demo_mode) {
        return run_demo(config, logger);
    }

    if (args->request_path.empty()) {
        std::cerr << "No request given; use --request <path> or --demo" << std::endl;
        return 2;
    }

    // ── Solve ────────────────────────────────
    ScheduleResponse response;
    auto problem = load_request(args->request_path);
    if (!problem) {
        logger.error("main", problem.error().message);
        response.error = problem.error();
    } else {
        response = schedule(ScheduleRequest::from_config(std::move(*problem), config), &logger);
    }

    const std::string json = to_json(response);
    if (args->output_path.empty()) {
        std::cout << json << std::endl;
    } else {
        std::ofstream out(args->output_path);
        if (!out) {
            std::cerr << "Cannot write " << args->output_path.string() << std::endl;
            return 2;
        }
        out << json << "\n";
    }

    logger.info("main", response.ok() ? "request solved" : "request failed");
    logger.flush();
    return response.ok() ? 0 : 1;
}
