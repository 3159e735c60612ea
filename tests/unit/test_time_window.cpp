/**
 * @file test_time_window.cpp
 * @brief Unit tests for hard and soft time windows.
 */

#include "model/time_window.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace uras;

TEST(TimeWindowTest, UnboundedNeverViolated) {
    auto w = TimeWindow::unbounded();
    EXPECT_EQ(w.overage_ms(-1'000, 1'000'000), 0);
    EXPECT_TRUE(w.is_hard());
}

TEST(TimeWindowTest, DeadlineOverage) {
    auto w = TimeWindow::deadline(8'000);
    EXPECT_EQ(w.overage_ms(0, 8'000), 0);
    EXPECT_EQ(w.overage_ms(5'000, 10'000), 2'000);
    EXPECT_TRUE(w.is_violated(5'000, 8'001));
}

TEST(TimeWindowTest, EarlyAndLateOverageAdd) {
    auto w = TimeWindow::bounded(1'000, 2'000);
    ASSERT_TRUE(w.has_value());
    EXPECT_EQ(w->overage_ms(500, 2'500), 1'000);
}

TEST(TimeWindowTest, HardWindowHasNoPenalty) {
    auto w = TimeWindow::deadline(100);
    EXPECT_DOUBLE_EQ(w.penalty(0, 200), 0.0);
}

TEST(TimeWindowTest, SoftPenaltyIsLinear) {
    auto w = TimeWindow::deadline(1'000).soft(0.5);
    EXPECT_EQ(w.kind(), WindowKind::Soft);
    EXPECT_DOUBLE_EQ(w.penalty(0, 1'400), 200.0);
    EXPECT_DOUBLE_EQ(w.hard().penalty(0, 1'400), 0.0);
}

TEST(TimeWindowTest, CreateRejectsInvertedBounds) {
    auto w = TimeWindow::create(5'000, 1'000);
    ASSERT_FALSE(w.has_value());
    EXPECT_EQ(w.error().kind, ErrorKind::InvalidSpec);
}

TEST(TimeWindowTest, CreateRejectsNegativePenalty) {
    auto w = TimeWindow::create(std::nullopt, 1'000, WindowKind::Soft, -1.0);
    ASSERT_FALSE(w.has_value());
    EXPECT_EQ(w.error().kind, ErrorKind::InvalidSpec);
}

TEST(TimeWindowTest, ValidateRejectsNonFinitePenalty) {
    auto w = TimeWindow::deadline(10).soft(std::numeric_limits<double>::infinity());
    EXPECT_FALSE(w.validate().has_value());
}
