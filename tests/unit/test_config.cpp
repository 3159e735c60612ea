/**
 * @file test_config.cpp
 * @brief Unit tests for configuration loading.
 */

#include "core/config.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace uras;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path() / "uras_test_config";
        std::filesystem::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(temp_dir_);
    }

    std::filesystem::path write_toml(const std::string& content) {
        auto path = temp_dir_ / "test.toml";
        std::ofstream ofs(path);
        ofs << content;
        return path;
    }
};

TEST_F(ConfigTest, DefaultConfig) {
    auto config = default_config();
    EXPECT_EQ(config.engine.algorithm, AlgorithmKind::Greedy);
    EXPECT_EQ(config.engine.estimate.mode, EstimateMode::Mean);
    EXPECT_EQ(config.dispatching.rules, (std::vector<std::string>{"EDD", "SPT"}));
    EXPECT_EQ(config.ga.population_size, 100u);
    EXPECT_EQ(config.cp.node_budget, 1'000'000u);
    EXPECT_EQ(config.telemetry.log_level, "info");
    EXPECT_TRUE(config.ga.validate().has_value());
    EXPECT_TRUE(config.dispatching.make_engine().has_value());
}

TEST_F(ConfigTest, LoadFullConfig) {
    auto path = write_toml(R"(
        [engine]
        algorithm = "cp"

        [engine.duration]
        estimate = "quantile"
        level = 0.9

        [objective]
        makespan_weight = 2.0
        penalty_weight = 0.5

        [dispatching]
        rules = ["ATC", "SPT"]
        mode = "weighted"
        weights = [3.0, 1.0]
        atc_k = 1.5

        [ga]
        population_size = 40
        max_generations = 80
        selection = "roulette"
        elite_count = 4
        threads = 2
        seed = 7

        [cp]
        time_budget_ms = 2000
        node_budget = 5000
        threads = 4
        stop_after_first = true
        horizon_ms = 100000

        [telemetry]
        log_dir = "/tmp/uras_logs"
        log_level = "debug"
        stdout = true
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& config = *result;

    EXPECT_EQ(config.engine.algorithm, AlgorithmKind::Cp);
    EXPECT_EQ(config.engine.estimate.mode, EstimateMode::Quantile);
    EXPECT_DOUBLE_EQ(config.engine.estimate.level, 0.9);

    EXPECT_DOUBLE_EQ(config.objective.makespan, 2.0);
    EXPECT_DOUBLE_EQ(config.ga.weights.penalty, 0.5);
    EXPECT_DOUBLE_EQ(config.cp.weights.makespan, 2.0);

    EXPECT_EQ(config.dispatching.rules, (std::vector<std::string>{"ATC", "SPT"}));
    EXPECT_EQ(config.dispatching.mode, EvaluationMode::Weighted);
    EXPECT_EQ(config.dispatching.weights, (std::vector<double>{3.0, 1.0}));
    EXPECT_DOUBLE_EQ(config.dispatching.params.atc_k, 1.5);

    EXPECT_EQ(config.ga.population_size, 40u);
    EXPECT_EQ(config.ga.max_generations, 80u);
    EXPECT_EQ(config.ga.selection, SelectionMethod::Roulette);
    EXPECT_EQ(config.ga.elite_count, 4u);
    EXPECT_EQ(config.ga.threads, 2u);
    EXPECT_EQ(config.ga.seed, 7u);

    EXPECT_EQ(config.cp.time_budget_ms, 2000);
    EXPECT_EQ(config.cp.node_budget, 5000u);
    EXPECT_EQ(config.cp.threads, 4u);
    EXPECT_TRUE(config.cp.stop_after_first);
    ASSERT_TRUE(config.cp.horizon_ms.has_value());
    EXPECT_EQ(*config.cp.horizon_ms, 100'000);

    EXPECT_EQ(config.telemetry.log_dir.string(), "/tmp/uras_logs");
    EXPECT_EQ(config.telemetry.log_level, "debug");
    EXPECT_TRUE(config.telemetry.log_to_stdout);
}

TEST_F(ConfigTest, PartialConfigUsesDefaults) {
    auto path = write_toml(R"(
        [engine]
        algorithm = "GA"
    )");

    auto result = load_config(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->engine.algorithm, AlgorithmKind::Ga);
    EXPECT_EQ(result->ga.population_size, 100u);
    EXPECT_EQ(result->dispatching.rules.size(), 2u);
}

TEST_F(ConfigTest, MissingFileReturnsError) {
    auto result = load_config("/nonexistent/path.toml");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, InvalidTomlReturnsError) {
    auto path = write_toml("this is not valid [[[ toml");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, UnknownAlgorithmIsRejected) {
    auto path = write_toml(R"(
        [engine]
        algorithm = "annealing"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
    EXPECT_NE(result.error().message.find("annealing"), std::string::npos);
}

TEST_F(ConfigTest, UnknownRuleIsRejected) {
    auto path = write_toml(R"(
        [dispatching]
        rules = ["SPT", "COIN_FLIP"]
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, WeightCountMustMatchRules) {
    auto path = write_toml(R"(
        [dispatching]
        rules = ["SPT", "EDD"]
        mode = "weighted"
        weights = [1.0]
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, QuantileLevelMustBeOpenUnit) {
    auto path = write_toml(R"(
        [engine.duration]
        estimate = "quantile"
        level = 1.0
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST_F(ConfigTest, InvalidGaSectionIsConfigError) {
    auto path = write_toml(R"(
        [ga]
        population_size = 10
        elite_count = 10
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
    EXPECT_EQ(result.error().message.rfind("[ga]", 0), 0u);
}

TEST_F(ConfigTest, UnknownSelectionIsRejected) {
    auto path = write_toml(R"(
        [ga]
        selection = "lottery"
    )");
    auto result = load_config(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::Config);
}

TEST(ConfigNameTest, AlgorithmNames) {
    EXPECT_EQ(*parse_algorithm("genetic"), AlgorithmKind::Ga);
    EXPECT_EQ(*parse_algorithm("Greedy"), AlgorithmKind::Greedy);
    EXPECT_EQ(to_string(AlgorithmKind::Cp), "cp");
    EXPECT_FALSE(parse_estimate_mode("median").has_value());
}
