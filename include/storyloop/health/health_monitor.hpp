#pragma once

#include "storyloop/config/system_config.hpp"
#include "storyloop/core/error.hpp"
#include "storyloop/util/id.hpp"
#include "storyloop/util/util.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace storyloop {

enum class WorkerStatus : std::uint8_t {
  Unknown,
  Healthy,
  Hung,
  Dead,
};

inline constexpr std::array kWorkerStatusNames = {"unknown", "healthy", "hung",
                                                  "dead"};

[[nodiscard]] inline auto to_string_view(WorkerStatus status) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(status);
  return idx < kWorkerStatusNames.size() ? kWorkerStatusNames[idx] : "unknown";
}

enum class Liveness : std::uint8_t {
  Unknown,  // no pid, or the probe is unavailable
  Running,
  NotRunning,
};

struct HealthThresholds {
  std::chrono::seconds hung{120};
  std::chrono::seconds dead{300};
};

// Pure classification: a confirmed-dead process wins over age; otherwise
// healthy < hung threshold <= hung < dead threshold <= dead.
[[nodiscard]] constexpr auto classify(std::chrono::duration<double> age,
                                      Liveness liveness,
                                      HealthThresholds thresholds = {}) noexcept
    -> WorkerStatus {
  if (liveness == Liveness::NotRunning) {
    return WorkerStatus::Dead;
  }
  if (age < thresholds.hung) {
    return WorkerStatus::Healthy;
  }
  if (age < thresholds.dead) {
    return WorkerStatus::Hung;
  }
  return WorkerStatus::Dead;
}

struct WorkerStats {
  double memory_mb{0.0};
  std::uint64_t api_calls{0};
  std::optional<pid_t> pid;
  nlohmann::json context = nlohmann::json::object();
};

struct Heartbeat {
  TimePoint timestamp{};
  WorkerId worker_id;
  TaskId task_id;
  int iteration{0};
  double memory_mb{0.0};
  std::uint64_t api_calls{0};
  std::optional<pid_t> pid;
  nlohmann::json context = nlohmann::json::object();

  [[nodiscard]] auto to_json() const -> nlohmann::json;
  [[nodiscard]] static auto from_json(const nlohmann::json& j)
      -> Result<Heartbeat>;
};

struct WorkerHealth {
  WorkerId worker_id;
  WorkerStatus status{WorkerStatus::Unknown};
  std::optional<TimePoint> last_heartbeat;
  double seconds_since_heartbeat{0.0};
  double memory_mb{0.0};
  std::uint64_t api_calls{0};
  std::optional<TaskId> current_task;
  int iteration{0};
  std::optional<pid_t> pid;
  std::optional<bool> process_running;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

struct HealthSummary {
  std::size_t total{0};
  std::size_t healthy{0};
  std::size_t hung{0};
  std::size_t dead{0};
  std::size_t unknown{0};

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

// Supervises worker heartbeats stored as
// `<state_dir>/workers/<worker_id>/heartbeat.json`. Every non-healthy
// classification is appended to `<state_dir>/health.jsonl`.
class HealthMonitor {
public:
  using ClockFn = std::function<TimePoint()>;
  using ProbeFn = std::function<std::optional<bool>(pid_t)>;

  HealthMonitor(std::filesystem::path state_dir, HealthConfig config = {});

  // Test seams for the wall clock and the process probe.
  auto set_clock(ClockFn clock) -> void;
  auto set_process_probe(ProbeFn probe) -> void;

  [[nodiscard]] auto write_heartbeat(const WorkerId& worker,
                                     const TaskId& task, int iteration,
                                     const WorkerStats& stats = {})
      -> Result<void>;
  [[nodiscard]] auto write(const Heartbeat& heartbeat) -> Result<void>;
  [[nodiscard]] auto read(const WorkerId& worker) const -> Result<Heartbeat>;

  // `pid` overrides the pid stored in the heartbeat, when known.
  [[nodiscard]] auto check(const WorkerId& worker,
                           std::optional<pid_t> pid = std::nullopt)
      -> WorkerHealth;
  [[nodiscard]] auto check_all() -> std::vector<WorkerHealth>;
  [[nodiscard]] auto unhealthy_workers() -> std::vector<WorkerHealth>;
  [[nodiscard]] auto summary() -> HealthSummary;

  [[nodiscard]] auto known_workers() const -> std::vector<WorkerId>;

  // Drops the record of a released worker.
  auto remove(const WorkerId& worker) -> void;

  // Removes heartbeat records older than `max_age`; returns their ids.
  [[nodiscard]] auto cleanup(std::chrono::hours max_age)
      -> std::vector<WorkerId>;

  [[nodiscard]] auto thresholds() const noexcept -> HealthThresholds {
    return thresholds_;
  }
  [[nodiscard]] auto worker_dir(const WorkerId& worker) const
      -> std::filesystem::path;
  [[nodiscard]] auto heartbeat_path(const WorkerId& worker) const
      -> std::filesystem::path;
  [[nodiscard]] auto health_log_path() const -> std::filesystem::path;

private:
  auto log_event(const WorkerHealth& health) -> void;

  std::filesystem::path workers_dir_;
  std::filesystem::path health_log_;
  HealthThresholds thresholds_;
  ClockFn clock_;
  ProbeFn probe_;
};

// Resident set size of the calling process, from /proc/self/statm.
[[nodiscard]] auto process_memory_mb() -> double;

}  // namespace storyloop
