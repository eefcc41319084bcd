#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace storyloop::cli {

struct GraphOptions {
  std::string config_file;
  std::string prd_file{"prd.json"};
  bool include_completed{false};
  bool json{false};
};

struct RunOptions {
  std::string config_file;
  std::string prd_file{"prd.json"};
  bool include_completed{false};
  bool resume{false};
  std::optional<int> max_workers;
  bool json{false};
};

struct HeartbeatOptions {
  std::string config_file;
  std::string worker_id;
  std::string task_id;
  int iteration{0};
  std::uint64_t api_calls{0};
  std::optional<int> pid;
};

struct StateOptions {
  std::string config_file;
  bool json{false};
};

struct CleanupOptions {
  std::string config_file;
  std::optional<int> max_age_hours;
  bool dry_run{false};
  bool merged{false};
};

[[nodiscard]] auto cmd_plan(const GraphOptions& opts) -> int;
[[nodiscard]] auto cmd_check_cycles(const GraphOptions& opts) -> int;
[[nodiscard]] auto cmd_batches(const GraphOptions& opts) -> int;
[[nodiscard]] auto cmd_check_conflicts(const GraphOptions& opts) -> int;
[[nodiscard]] auto cmd_run(const RunOptions& opts) -> int;
[[nodiscard]] auto cmd_heartbeat(const HeartbeatOptions& opts) -> int;
[[nodiscard]] auto cmd_health(const StateOptions& opts) -> int;
[[nodiscard]] auto cmd_retry_stats(const StateOptions& opts) -> int;
[[nodiscard]] auto cmd_runs(const StateOptions& opts) -> int;
[[nodiscard]] auto cmd_branches(const StateOptions& opts) -> int;
[[nodiscard]] auto cmd_cleanup(const CleanupOptions& opts) -> int;

}  // namespace storyloop::cli
