#pragma once

#include "storyloop/config/system_config.hpp"
#include "storyloop/core/error.hpp"
#include "storyloop/events/event_bus.hpp"
#include "storyloop/executor/executor.hpp"
#include "storyloop/graph/dependency_graph.hpp"
#include "storyloop/health/health_monitor.hpp"
#include "storyloop/merge/merge_controller.hpp"
#include "storyloop/retry/retry_handler.hpp"
#include "storyloop/storage/run_store.hpp"
#include "storyloop/util/id.hpp"

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace storyloop {

enum class TaskOutcome : std::uint8_t {
  Pending,
  Merged,
  Failed,       // retries exhausted or ineligible
  MergeFailed,  // branch preserved
  Skipped,      // an upstream task failed
  Cancelled,
};

inline constexpr std::array kTaskOutcomeNames = {
    "pending", "merged", "failed", "merge_failed", "skipped", "cancelled"};

[[nodiscard]] inline auto to_string_view(TaskOutcome outcome) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(outcome);
  return idx < kTaskOutcomeNames.size() ? kTaskOutcomeNames[idx] : "pending";
}

struct TaskReport {
  TaskId id;
  TaskOutcome outcome{TaskOutcome::Pending};
  int attempts{0};
  std::size_t batch{0};  // 1-based
  std::optional<FailureType> failure;
  // RetryExhausted, Cancelled or the merge error for terminal outcomes.
  std::error_code error;
  std::string commit;
  std::string detail;
};

struct RunSummary {
  RunId run_id;
  RunState state{RunState::Running};
  std::size_t batches{0};
  std::vector<TaskReport> tasks;  // plan order
  double duration_sec{0.0};

  [[nodiscard]] auto count(TaskOutcome outcome) const -> std::size_t;
  [[nodiscard]] auto find(const TaskId& id) const -> const TaskReport*;
  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

struct RunOptions {
  TaskFilter filter{TaskFilter::IncompleteOnly};
  // Treat tasks merged by earlier runs as complete.
  bool resume{false};
  std::string prd_path;
};

// What a worker reports in `<state_dir>/workers/<id>/result.json`.
struct WorkerResult {
  std::optional<FailureType> failure_type;
  std::string error;
};

[[nodiscard]] auto read_worker_result(const std::filesystem::path& path)
    -> std::optional<WorkerResult>;

// Failure category of a finished attempt: the worker's own report wins,
// then the exit code (124 timeout, 137 resource exhaustion).
[[nodiscard]] auto classify_exit(int exit_code,
                                 const std::optional<WorkerResult>& reported)
    -> FailureType;

// The control plane: runs batches in order, one sub-batch at a time, and
// merges each sub-batch's successes before starting the next.
class Orchestrator {
public:
  struct Services {
    MergeController& merger;
    IExecutor& executor;
    EventBus& bus;
    HealthMonitor& health;
    RetryHandler& retry;
    RunStore* store{nullptr};
  };

  Orchestrator(SystemConfig config, Services services);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  [[nodiscard]] auto run(std::vector<Task> tasks, const RunOptions& options)
      -> Result<RunSummary>;

  // Kills active workers at the next poll and stops dispatching.
  auto request_stop() noexcept -> void {
    stop_requested_.store(true, std::memory_order_release);
  }

private:
  struct Attempt {
    TaskId task;
    int number{1};  // 1-based
    std::chrono::steady_clock::time_point not_before{};
  };

  struct ActiveWorker {
    const Task* task{nullptr};
    int attempt{1};
    WorkerId worker_id;
    WorkerLease lease;
    std::unique_ptr<WorkerProcess> process;
    TimePoint started_at{};
    std::chrono::steady_clock::time_point last_health_check{};
    std::optional<std::chrono::steady_clock::time_point> hung_since;
  };

  enum class ForcedStop : std::uint8_t {
    None,
    Timeout,
    Dead,
    Hung,
    Cancelled,
  };

  [[nodiscard]] auto stopping() const noexcept -> bool;
  auto subscribe_handlers() -> void;

  auto run_sub_batch(const DependencyGraph& graph, const Batch& sub_batch,
                     std::size_t batch_no) -> void;
  auto merge_completed(const DependencyGraph& graph, std::size_t batch_no)
      -> void;

  [[nodiscard]] auto launch(const Task& task, int attempt)
      -> Result<ActiveWorker>;
  auto supervise(ActiveWorker& worker) -> ForcedStop;
  auto finish_attempt(ActiveWorker& worker, int exit_code, ForcedStop forced,
                      std::vector<Attempt>& queue) -> void;
  auto fail_attempt(const Task& task, int attempt, const WorkerId& worker,
                    FailureType type, int exit_code, std::string error,
                    std::vector<Attempt>& queue) -> void;
  auto mark_terminal(const TaskId& task) -> void;

  auto emit(std::string type, nlohmann::json data,
            std::optional<TaskId> task = std::nullopt) -> void;
  [[nodiscard]] auto report(const TaskId& id) -> TaskReport&;

  SystemConfig config_;
  Services services_;
  std::filesystem::path state_dir_;

  std::atomic<bool> stop_requested_{false};
  std::vector<SubscriptionId> subscriptions_;

  // Per-run state.
  RunId run_id_;
  RunSummary summary_;
  std::unordered_map<TaskId, std::size_t> report_idx_;
  std::unordered_map<TaskId, WorkerLease> completed_;
  std::vector<TaskId> merge_queue_;
  std::map<TaskId, RetryDecision> decisions_;
  const DependencyGraph* graph_{nullptr};
};

}  // namespace storyloop
