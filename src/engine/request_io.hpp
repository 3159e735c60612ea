/**
 * @file request_io.hpp
 * @brief TOML request files and JSON responses for the command-line tool.
 *
 * Request layout:
 *
 *   start_time_ms = 0
 *
 *   [[resources]]
 *   id = "M1"  category = "mill"  kind = "primary"  efficiency = 1.0  capacity = 1
 *   available = [[0, 28800000]]      # optional; absent = always available
 *   blocked   = [[3600000, 4500000]] # optional
 *
 *   [[tasks]]
 *   id = "T1"  priority = 0  weight = 1.0  due_date_ms = 20000  release_ms = 0  category = "red"
 *   [[tasks.activities]]
 *   id = "A1"  sequence = 0  duration_ms = 5000  setup_ms = 0  teardown_ms = 0
 *   duration = { kind = "pert", optimistic = 4000, most_likely = 6000, pessimistic = 14000 }
 *   resource_groups = [{ category = "mill", candidates = ["M1", "M2"] }]
 *
 *   [[precedences]]  before = "A1"  after = "B1"  min_delay_ms = 0
 *   [[capacities]]   resource = "M1"  max_concurrent = 1
 *   [[windows]]      scope = "activity"  target = "A2"  latest_finish_ms = 8000  kind = "hard"
 *
 *   [[transitions]]  name = "paint"  resource = "M1"  default_ms = 0
 *   entries = [{ from = "red", to = "blue", ms = 900 }]
 */

#pragma once

#include "core/result.hpp"
#include "engine/engine.hpp"
#include "model/problem.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace uras {

/// Config error for unreadable files or TOML syntax; InvalidSpec for bad values.
[[nodiscard]] Result<ProblemSpec> load_request(const std::filesystem::path& path);
[[nodiscard]] Result<ProblemSpec> parse_request(std::string_view toml_text);

/// Response as one JSON document (schedule, KPIs, statistics or error).
[[nodiscard]] std::string to_json(const ScheduleResponse& response);

}  // namespace uras
