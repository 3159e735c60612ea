/**
 * @file test_duration.cpp
 * @brief Unit tests for PERT estimates, distributions and effective durations.
 */

#include "model/duration.hpp"

#include <gtest/gtest.h>

#include <cmath>

using namespace uras;

// ─────────────────────────────────────────────
// PertEstimate
// ─────────────────────────────────────────────

TEST(PertEstimateTest, MeanAndStdDev) {
    auto pert = PertEstimate::create(4'000, 6'000, 14'000);
    ASSERT_TRUE(pert.has_value());
    EXPECT_DOUBLE_EQ(pert->mean_ms(), 7'000.0);
    EXPECT_NEAR(pert->std_dev_ms(), 10'000.0 / 6.0, 1e-9);
    EXPECT_NEAR(pert->variance_ms(), std::pow(10'000.0 / 6.0, 2), 1e-6);
}

TEST(PertEstimateTest, MeanBoundedAndMonotoneOverGrid) {
    constexpr TimeMs kStep = 500;
    constexpr TimeMs kMax = 6'000;
    auto mean_of = [](TimeMs o, TimeMs m, TimeMs p) {
        auto pert = PertEstimate::create(o, m, p);
        EXPECT_TRUE(pert.has_value()) << o << " " << m << " " << p;
        return pert ? pert->mean_ms() : 0.0;
    };

    for (TimeMs o = 0; o <= kMax; o += kStep) {
        for (TimeMs m = o; m <= kMax; m += kStep) {
            for (TimeMs p = m; p <= kMax; p += kStep) {
                const double mean = mean_of(o, m, p);
                EXPECT_GE(mean, static_cast<double>(o));
                EXPECT_LE(mean, static_cast<double>(p));

                if (o + kStep <= m) EXPECT_GE(mean_of(o + kStep, m, p), mean);
                if (m + kStep <= p) EXPECT_GE(mean_of(o, m + kStep, p), mean);
                EXPECT_GE(mean_of(o, m, p + kStep), mean);
            }
        }
    }
}

TEST(PertEstimateTest, RejectsUnorderedPoints) {
    auto pert = PertEstimate::create(5'000, 4'000, 6'000);
    ASSERT_FALSE(pert.has_value());
    EXPECT_EQ(pert.error().kind, ErrorKind::InvalidSpec);
    EXPECT_FALSE(PertEstimate::create(-1, 0, 1).has_value());
}

TEST(PertEstimateTest, ShapeParameters) {
    auto pert = PertEstimate::create(0, 2'500, 10'000);
    ASSERT_TRUE(pert.has_value());
    EXPECT_DOUBLE_EQ(pert->alpha(), 2.0);
    EXPECT_DOUBLE_EQ(pert->beta(), 4.0);
}

TEST(PertEstimateTest, SymmetricMedianIsMode) {
    auto pert = PertEstimate::symmetric(5'000, 1'000);
    ASSERT_TRUE(pert.has_value());
    EXPECT_NEAR(pert->quantile(0.5), 5'000.0, 1.0);
    EXPECT_NEAR(pert->p50(), 5'000, 1);
}

TEST(PertEstimateTest, QuantilesAreMonotoneAndBounded) {
    auto pert = PertEstimate::create(4'000, 6'000, 14'000);
    ASSERT_TRUE(pert.has_value());
    EXPECT_DOUBLE_EQ(pert->quantile(0.0), 4'000.0);
    EXPECT_DOUBLE_EQ(pert->quantile(1.0), 14'000.0);
    EXPECT_LT(pert->p50(), pert->p85());
    EXPECT_LT(pert->p85(), pert->p95());
    EXPECT_LE(pert->p95(), 14'000);
}

TEST(PertEstimateTest, ProbabilityOfCompletionInvertsQuantile) {
    auto pert = PertEstimate::create(4'000, 6'000, 14'000);
    ASSERT_TRUE(pert.has_value());
    EXPECT_DOUBLE_EQ(pert->probability_of_completion(3'000), 0.0);
    EXPECT_DOUBLE_EQ(pert->probability_of_completion(14'000), 1.0);
    auto q85 = static_cast<TimeMs>(std::ceil(pert->quantile(0.85)));
    EXPECT_NEAR(pert->probability_of_completion(q85), 0.85, 0.01);
}

TEST(PertEstimateTest, DegenerateEstimate) {
    auto pert = PertEstimate::create(3'000, 3'000, 3'000);
    ASSERT_TRUE(pert.has_value());
    EXPECT_DOUBLE_EQ(pert->mean_ms(), 3'000.0);
    EXPECT_DOUBLE_EQ(pert->quantile(0.3), 3'000.0);
}

TEST(PertEstimateTest, FromVariance) {
    auto pert = PertEstimate::from_variance(10'000, 0.2);
    ASSERT_TRUE(pert.has_value());
    EXPECT_EQ(pert->optimistic(), 8'000);
    EXPECT_EQ(pert->pessimistic(), 12'000);
}

// ─────────────────────────────────────────────
// Numeric helpers
// ─────────────────────────────────────────────

TEST(StatsTest, IncompleteBetaKnownValues) {
    // I_x(1, 1) = x; I_x(2, 1) = x².
    EXPECT_NEAR(stats::incomplete_beta(0.3, 1.0, 1.0), 0.3, 1e-9);
    EXPECT_NEAR(stats::incomplete_beta(0.5, 2.0, 1.0), 0.25, 1e-9);
    EXPECT_NEAR(stats::inverse_incomplete_beta(0.25, 2.0, 1.0), 0.5, 1e-6);
}

TEST(StatsTest, NormalQuantile) {
    EXPECT_NEAR(stats::normal_quantile(0.5), 0.0, 1e-3);
    EXPECT_NEAR(stats::normal_quantile(0.975), 1.96, 1e-3);
    EXPECT_NEAR(stats::normal_cdf(1.96), 0.975, 1e-3);
}

// ─────────────────────────────────────────────
// DurationDistribution
// ─────────────────────────────────────────────

TEST(DurationDistributionTest, Means) {
    EXPECT_DOUBLE_EQ(DurationDistribution::fixed(2'500)->mean_ms(), 2'500.0);
    EXPECT_DOUBLE_EQ(DurationDistribution::uniform(1'000, 3'000)->mean_ms(), 2'000.0);
    EXPECT_DOUBLE_EQ(DurationDistribution::triangular(1'000, 2'000, 6'000)->mean_ms(), 3'000.0);
    auto ln = DurationDistribution::lognormal(std::log(1'000.0), 0.5);
    ASSERT_TRUE(ln.has_value());
    EXPECT_NEAR(ln->mean_ms(), 1'000.0 * std::exp(0.125), 1e-6);
}

TEST(DurationDistributionTest, Quantiles) {
    auto uniform = DurationDistribution::uniform(1'000, 3'000);
    ASSERT_TRUE(uniform.has_value());
    EXPECT_DOUBLE_EQ(uniform->quantile_ms(0.25), 1'500.0);

    auto tri = DurationDistribution::triangular(0, 0, 1'000);
    ASSERT_TRUE(tri.has_value());
    // F(x) = 1 − (1 − x/1000)², so q = 0.75 gives x = 500.
    EXPECT_NEAR(tri->quantile_ms(0.75), 500.0, 1e-6);

    auto ln = DurationDistribution::lognormal(std::log(1'000.0), 0.5);
    ASSERT_TRUE(ln.has_value());
    EXPECT_NEAR(ln->quantile_ms(0.5), 1'000.0, 1.0);
}

TEST(DurationDistributionTest, RejectsInvalidParameters) {
    EXPECT_FALSE(DurationDistribution::fixed(-1).has_value());
    EXPECT_FALSE(DurationDistribution::uniform(10, 5).has_value());
    EXPECT_FALSE(DurationDistribution::triangular(0, 20, 10).has_value());
    EXPECT_FALSE(DurationDistribution::lognormal(1.0, -0.1).has_value());
}

TEST(DurationDistributionTest, KindNames) {
    EXPECT_EQ(DurationDistribution::fixed(1)->kind(), "fixed");
    EXPECT_EQ(DurationDistribution::pert(1, 2, 3)->kind(), "pert");
}

// ─────────────────────────────────────────────
// DurationSpec & efficiency
// ─────────────────────────────────────────────

TEST(DurationSpecTest, NominalUnderPolicy) {
    DurationSpec spec{.processing = *PertEstimate::create(4'000, 6'000, 14'000),
                      .setup_ms = 500, .teardown_ms = 250};
    EstimatePolicy mean{};
    EXPECT_EQ(spec.nominal_processing_ms(mean), 7'000);
    EXPECT_EQ(spec.nominal_total_ms(mean), 7'750);

    EstimatePolicy p95{.mode = EstimateMode::Quantile, .level = 0.95};
    EXPECT_GT(spec.nominal_processing_ms(p95), 7'000);
}

TEST(DurationSpecTest, ValidateRejectsNegativeSetup) {
    auto spec = DurationSpec::fixed_ms(1'000);
    spec.setup_ms = -5;
    EXPECT_FALSE(spec.validate().has_value());
}

TEST(EffectiveDurationTest, EfficiencyScalesProcessingOnly) {
    EXPECT_EQ(effective_duration(5'000, 0, 0, 1.0), 5'000);
    EXPECT_EQ(effective_duration(5'000, 0, 0, 0.9), 5'556);
    EXPECT_EQ(effective_duration(5'000, 200, 100, 2.0), 2'800);
}
