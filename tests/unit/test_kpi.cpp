/**
 * @file test_kpi.cpp
 * @brief Unit tests for schedule KPIs.
 */

#include "scheduler/kpi.hpp"
#include "support/problems.hpp"

#include <gtest/gtest.h>

using namespace uras;
using namespace uras::fixtures;

namespace {

Schedule make_schedule(std::vector<Assignment> assignments) {
    ScheduleBuilder builder;
    for (auto& a : assignments) builder.add(std::move(a));
    return builder.build().value();
}

}  // anonymous namespace

TEST(ScheduleKpiTest, TardinessAndUtilization) {
    auto spec = two_by_two_job_shop();
    spec.tasks[0].due_date = 4'000;
    spec.tasks[1].due_date = 6'000;
    auto problem = index_of(spec);
    auto schedule = make_schedule({
        {"J0.O0", "J0", "M0", 0, 3'000},
        {"J1.O0", "J1", "M1", 0, 3'000},
        {"J0.O1", "J0", "M1", 3'000, 5'000},
        {"J1.O1", "J1", "M0", 3'000, 5'000},
    });

    auto kpi = ScheduleKpi::compute(problem, schedule);
    ASSERT_TRUE(kpi.has_value());
    EXPECT_EQ(kpi->makespan_ms, 5'000);
    EXPECT_EQ(kpi->total_tardiness_ms, 1'000);
    EXPECT_DOUBLE_EQ(kpi->mean_tardiness_ms, 500.0);
    EXPECT_EQ(kpi->max_tardiness_ms, 1'000);
    EXPECT_EQ(kpi->tardy_task_count, 1u);
    EXPECT_DOUBLE_EQ(kpi->on_time_rate, 0.5);
    EXPECT_DOUBLE_EQ(kpi->utilization.at("M0"), 1.0);
    EXPECT_DOUBLE_EQ(kpi->utilization.at("M1"), 1.0);
    EXPECT_DOUBLE_EQ(kpi->mean_utilization, 1.0);
    EXPECT_DOUBLE_EQ(kpi->mean_flow_time_ms, 5'000.0);
}

TEST(ScheduleKpiTest, TaskWithoutDueDateIsOnTime) {
    auto problem = index_of(single_activity_two_machines());
    auto schedule = make_schedule({{"A1", "T1", "M1", 0, 5'000}});

    auto kpi = ScheduleKpi::compute(problem, schedule);
    ASSERT_TRUE(kpi.has_value());
    EXPECT_DOUBLE_EQ(kpi->on_time_rate, 1.0);
    EXPECT_EQ(kpi->total_tardiness_ms, 0);
    EXPECT_DOUBLE_EQ(kpi->mean_tardiness_ms, 0.0);
    EXPECT_DOUBLE_EQ(kpi->utilization.at("M1"), 1.0);
    EXPECT_DOUBLE_EQ(kpi->utilization.at("M2"), 0.0);
    EXPECT_DOUBLE_EQ(kpi->mean_utilization, 0.5);
}

TEST(ScheduleKpiTest, UtilizationCountsOnlyAvailableTime) {
    auto spec = single_activity_two_machines();
    spec.resources[0].calendar = *Calendar::from_intervals({{0, 2'000}, {3'000, 100'000}});
    auto problem = index_of(spec);
    auto schedule = make_schedule({{"A1", "T1", "M1", 3'000, 8'000}});

    auto kpi = ScheduleKpi::compute(problem, schedule);
    ASSERT_TRUE(kpi.has_value());
    EXPECT_NEAR(kpi->utilization.at("M1"), 5.0 / 7.0, 1e-12);
}

TEST(ScheduleKpiTest, UtilizationScalesWithCapacity) {
    ProblemSpec spec;
    spec.resources = {machine("M1", 1.0, 2)};
    spec.tasks = {job("T", {step("A", 0, 1'000, {"M1"})})};
    auto problem = index_of(spec);
    auto schedule = make_schedule({{"A", "T", "M1", 0, 1'000}});

    auto kpi = ScheduleKpi::compute(problem, schedule);
    ASSERT_TRUE(kpi.has_value());
    EXPECT_DOUBLE_EQ(kpi->utilization.at("M1"), 0.5);
}

TEST(ScheduleKpiTest, CarriesSchedulePenalty) {
    auto spec = single_activity_two_machines();
    auto problem = index_of(spec);
    ScheduleBuilder builder;
    builder.add({"A1", "T1", "M1", 0, 5'000})
           .add_violation(Violation{.target = "A1", .description = "late", .overage_ms = 100, .penalty = 50.0});
    auto schedule = builder.build().value();

    auto kpi = ScheduleKpi::compute(problem, schedule);
    ASSERT_TRUE(kpi.has_value());
    EXPECT_DOUBLE_EQ(kpi->total_penalty, 50.0);
}

TEST(ScheduleKpiTest, UnknownActivityIsInconsistent) {
    auto problem = index_of(single_activity_two_machines());
    auto schedule = make_schedule({{"ghost", "T1", "M1", 0, 5'000}});
    auto kpi = ScheduleKpi::compute(problem, schedule);
    ASSERT_FALSE(kpi.has_value());
    EXPECT_EQ(kpi.error().kind, ErrorKind::InconsistentSchedule);
}

TEST(ScheduleKpiTest, EmptyScheduleOnEmptyProblem) {
    auto problem = index_of(ProblemSpec{});
    auto kpi = ScheduleKpi::compute(problem, Schedule{});
    ASSERT_TRUE(kpi.has_value());
    EXPECT_EQ(kpi->makespan_ms, 0);
    EXPECT_DOUBLE_EQ(kpi->on_time_rate, 1.0);
    EXPECT_TRUE(kpi->utilization.empty());
}
