/**
 * @file test_request_io.cpp
 * @brief Unit tests for TOML request parsing and JSON responses.
 */

#include "engine/request_io.hpp"

#include <gtest/gtest.h>
#include <variant>

using namespace uras;

namespace {

constexpr const char* kTwoJobRequest = R"(
start_time_ms = 1000

[[resources]]
id = "M1"
category = "mill"
efficiency = 0.8
capacity = 2
kind = "secondary"
available = [[0, 50000]]
blocked = [[10000, 12000]]

[[resources]]
id = "QA"
category = "inspection"
kind = "human"

[[tasks]]
id = "T1"
priority = 2
weight = 3.0
due_date_ms = 40000
release_ms = 2000

  [[tasks.activities]]
  id = "T1.cut"
  sequence = 0
  duration = { kind = "pert", optimistic = 4000, most_likely = 6000, pessimistic = 14000 }
  setup_ms = 300
  resource_groups = [{ category = "mill", candidates = ["M1"] }]

  [[tasks.activities]]
  id = "T1.check"
  sequence = 1
  duration_ms = 1500
  resource_groups = [{ category = "inspection", candidates = [] }]

[[precedences]]
before = "T1.cut"
after = "T1.check"
min_delay_ms = 250

[[capacities]]
resource = "M1"
max_concurrent = 1

[[windows]]
scope = "task"
target = "T1"
latest_finish_ms = 30000
kind = "soft"
penalty_per_ms = 0.5
)";

constexpr const char* kPaintLineRequest = R"(
[[resources]]
id = "M1"

[[tasks]]
id = "TR"
category = "red"
  [[tasks.activities]]
  id = "R"
  duration_ms = 1000
  resource_groups = [{ candidates = ["M1"] }]

[[tasks]]
id = "TB"
category = "blue"
  [[tasks.activities]]
  id = "B"
  duration_ms = 1000
  resource_groups = [{ candidates = ["M1"] }]

[[transitions]]
name = "paint"
resource = "M1"
default_ms = 50
entries = [{ from = "red", to = "blue", ms = 900 }, { from = "blue", to = "red", ms = 900 }]
)";

}  // anonymous namespace

TEST(RequestIoTest, ParsesResources) {
    auto spec = parse_request(kTwoJobRequest);
    ASSERT_TRUE(spec.has_value()) << spec.error().message;
    EXPECT_EQ(spec->start_time_ms, 1000);
    ASSERT_EQ(spec->resources.size(), 2u);

    const auto& mill = spec->resources[0];
    EXPECT_EQ(mill.id, "M1");
    EXPECT_EQ(mill.name, "M1");
    EXPECT_DOUBLE_EQ(mill.efficiency, 0.8);
    EXPECT_EQ(mill.capacity, 2u);
    EXPECT_EQ(mill.kind, ResourceKind::Secondary);
    EXPECT_TRUE(mill.calendar.is_available(0, 10'000));
    EXPECT_FALSE(mill.calendar.is_available(11'000, 11'500));
    EXPECT_FALSE(mill.calendar.is_available(49'000, 51'000));

    EXPECT_EQ(spec->resources[1].kind, ResourceKind::Human);
    EXPECT_TRUE(spec->resources[1].calendar.is_available(0, 1'000'000'000));
}

TEST(RequestIoTest, ParsesTasksAndActivities) {
    auto spec = parse_request(kTwoJobRequest);
    ASSERT_TRUE(spec.has_value());
    ASSERT_EQ(spec->tasks.size(), 1u);

    const auto& task = spec->tasks[0];
    EXPECT_EQ(task.priority, 2);
    EXPECT_DOUBLE_EQ(task.weight, 3.0);
    EXPECT_EQ(task.due_date, 40'000);
    EXPECT_EQ(task.release_time, 2'000);
    ASSERT_EQ(task.activities.size(), 2u);

    const auto& cut = task.activities[0];
    EXPECT_EQ(cut.task_id, "T1");
    EXPECT_EQ(cut.duration.processing.kind(), "pert");
    EXPECT_DOUBLE_EQ(cut.duration.processing.mean_ms(), 7'000.0);
    EXPECT_EQ(cut.duration.setup_ms, 300);

    const auto& check = task.activities[1];
    EXPECT_EQ(check.sequence, 1u);
    EXPECT_EQ(check.duration.processing.kind(), "fixed");
    ASSERT_EQ(check.resource_groups.size(), 1u);
    EXPECT_TRUE(check.resource_groups[0].candidates.empty());
}

TEST(RequestIoTest, ParsesConstraints) {
    auto spec = parse_request(kTwoJobRequest);
    ASSERT_TRUE(spec.has_value());
    ASSERT_EQ(spec->constraints.size(), 3u);

    const auto* precedence = std::get_if<PrecedenceConstraint>(&spec->constraints[0]);
    ASSERT_NE(precedence, nullptr);
    EXPECT_EQ(precedence->before, "T1.cut");
    EXPECT_EQ(precedence->min_delay_ms, 250);

    const auto* capacity = std::get_if<CapacityConstraint>(&spec->constraints[1]);
    ASSERT_NE(capacity, nullptr);
    EXPECT_EQ(capacity->max_concurrent, 1u);

    const auto* window = std::get_if<TimeWindowConstraint>(&spec->constraints[2]);
    ASSERT_NE(window, nullptr);
    EXPECT_EQ(window->scope, WindowScope::Task);
    EXPECT_EQ(window->window.kind(), WindowKind::Soft);
    EXPECT_EQ(window->window.latest_finish(), 30'000);
    EXPECT_DOUBLE_EQ(window->window.penalty_per_ms(), 0.5);
}

TEST(RequestIoTest, ParsedRequestIndexes) {
    auto spec = parse_request(kTwoJobRequest);
    ASSERT_TRUE(spec.has_value());
    auto problem = ProblemIndex::build(*spec);
    ASSERT_TRUE(problem.has_value()) << problem.error().message;
    EXPECT_EQ(problem->activity_count(), 2u);
}

TEST(RequestIoTest, ParsesTransitionMatrices) {
    auto spec = parse_request(kPaintLineRequest);
    ASSERT_TRUE(spec.has_value()) << spec.error().message;
    EXPECT_EQ(spec->tasks[0].category, "red");
    ASSERT_EQ(spec->transitions.size(), 1u);

    const auto& paint = spec->transitions[0];
    EXPECT_EQ(paint.name, "paint");
    EXPECT_EQ(paint.resource, "M1");
    EXPECT_EQ(paint.default_ms, 50);
    EXPECT_EQ(paint.between("red", "blue"), 900);
    EXPECT_EQ(paint.between("red", "red"), 50);
}

TEST(RequestIoTest, ChangeoverReportedAsSetup) {
    auto spec = parse_request(kPaintLineRequest);
    ASSERT_TRUE(spec.has_value());
    ScheduleRequest request;
    request.problem = std::move(*spec);
    auto response = schedule(request);
    ASSERT_TRUE(response.ok()) << response.error->message;
    EXPECT_EQ(response.report->schedule.makespan_ms(), 2'900);

    const auto json = to_json(response);
    EXPECT_NE(json.find(R"("setup_ms":0)"), std::string::npos);
    EXPECT_NE(json.find(R"("setup_ms":900)"), std::string::npos);
}

TEST(RequestIoTest, SyntaxErrorIsConfig) {
    auto spec = parse_request("[[resources]\nid = ");
    ASSERT_FALSE(spec.has_value());
    EXPECT_EQ(spec.error().kind, ErrorKind::Config);
}

TEST(RequestIoTest, MissingFileIsConfig) {
    auto spec = load_request("/nonexistent/request.toml");
    ASSERT_FALSE(spec.has_value());
    EXPECT_EQ(spec.error().kind, ErrorKind::Config);
}

TEST(RequestIoTest, BadValuesAreInvalidSpec) {
    const char* cases[] = {
        "[[resources]]\ncategory = \"mill\"\n",
        "[[resources]]\nid = \"M1\"\nkind = \"robot\"\n",
        "[[resources]]\nid = \"M1\"\navailable = [[5, 1]]\n",
        "[[tasks]]\nid = \"T\"\n[[tasks.activities]]\nid = \"A\"\n",
        "[[tasks]]\nid = \"T\"\n[[tasks.activities]]\nid = \"A\"\nduration = { kind = \"gamma\" }\n",
        "[[tasks]]\nid = \"T\"\n[[tasks.activities]]\nid = \"A\"\n"
        "duration = { kind = \"pert\", optimistic = 9, most_likely = 5, pessimistic = 10 }\n",
        "[[windows]]\ntarget = \"A\"\nscope = \"shift\"\n",
        "[[windows]]\ntarget = \"A\"\nkind = \"elastic\"\n",
        "[[windows]]\ntarget = \"A\"\nearliest_start_ms = 10\nlatest_finish_ms = 5\n",
        "[[precedences]]\nbefore = \"A\"\n",
        "[[transitions]]\nname = \"paint\"\n",
        "[[transitions]]\nresource = \"M1\"\nentries = [{ from = \"red\", to = \"blue\" }]\n",
    };
    for (const char* text : cases) {
        auto spec = parse_request(text);
        ASSERT_FALSE(spec.has_value()) << text;
        EXPECT_EQ(spec.error().kind, ErrorKind::InvalidSpec) << text;
    }
}

// ─────────────────────────────────────────────
// JSON response
// ─────────────────────────────────────────────

TEST(RequestIoTest, ErrorResponseJson) {
    ScheduleResponse response;
    response.error = Error{ErrorKind::Infeasible, "deadline of \"A2\" unreachable"};
    EXPECT_EQ(to_json(response),
              R"({"ok":false,"error":{"kind":"infeasible","message":"deadline of \"A2\" unreachable"}})");
}

TEST(RequestIoTest, SuccessResponseJson) {
    auto spec = parse_request(kTwoJobRequest);
    ASSERT_TRUE(spec.has_value());
    ScheduleRequest request;
    request.problem = std::move(*spec);
    auto response = schedule(request);
    ASSERT_TRUE(response.ok()) << response.error->message;

    const auto json = to_json(response);
    EXPECT_EQ(json.rfind(R"({"ok":true,"algorithm":"greedy")", 0), 0u);
    EXPECT_NE(json.find(R"("activity":"T1.cut")"), std::string::npos);
    EXPECT_NE(json.find(R"("resource":"QA")"), std::string::npos);
    EXPECT_NE(json.find(R"("kpi":{"makespan_ms":)"), std::string::npos);
    EXPECT_NE(json.find(R"("utilization":{)"), std::string::npos);
    EXPECT_EQ(json.back(), '}');
}
