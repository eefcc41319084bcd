#include "storyloop/cli/commands.hpp"
#include "storyloop/cli/context.hpp"
#include "storyloop/config/config.hpp"
#include "storyloop/health/health_monitor.hpp"
#include "storyloop/retry/retry_handler.hpp"
#include "storyloop/storage/run_store.hpp"
#include "storyloop/util/util.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <print>
#include <unistd.h>

namespace storyloop::cli {

auto cmd_heartbeat(const HeartbeatOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }
  if (opts.worker_id.empty() || opts.task_id.empty()) {
    std::println(stderr, "Error: heartbeat requires --worker and --story");
    return 1;
  }

  HealthMonitor health(config->state_dir, config->health);
  WorkerStats stats{
      .memory_mb = process_memory_mb(),
      .api_calls = opts.api_calls,
      .pid = opts.pid ? static_cast<pid_t>(*opts.pid) : getppid(),
  };
  auto r = health.write_heartbeat(WorkerId{opts.worker_id},
                                  TaskId{opts.task_id}, opts.iteration, stats);
  if (!r) {
    std::println(stderr, "Error: Failed to write heartbeat: {}",
                 r.error().message());
    return 1;
  }
  return 0;
}

auto cmd_health(const StateOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }
  HealthMonitor health(config->state_dir, config->health);
  auto workers = health.check_all();
  auto summary = health.summary();

  if (opts.json) {
    auto list = nlohmann::json::array();
    for (const auto& w : workers) {
      list.push_back(w.to_json());
    }
    std::println("{}", nlohmann::json{{"summary", summary.to_json()},
                                      {"workers", std::move(list)}}
                           .dump(2));
    return summary.hung + summary.dead == 0 ? 0 : 1;
  }

  if (workers.empty()) {
    std::println("No workers reporting.");
    return 0;
  }
  std::println("{:<28} {:<8} {:>10} {:<20} {:>5}", "WORKER", "STATUS", "AGE(s)",
               "STORY", "ITER");
  for (const auto& w : workers) {
    std::println("{:<28} {:<8} {:>10.1f} {:<20} {:>5}", w.worker_id.str(),
                 to_string_view(w.status), w.seconds_since_heartbeat,
                 w.current_task ? w.current_task->str() : "-", w.iteration);
  }
  std::println("\n{} healthy, {} hung, {} dead, {} unknown", summary.healthy,
               summary.hung, summary.dead, summary.unknown);
  return summary.hung + summary.dead == 0 ? 0 : 1;
}

auto cmd_retry_stats(const StateOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }
  RetryHandler retry(config->retry,
                     std::filesystem::path{config->state_dir} / "retries.jsonl");
  auto stats = retry.stats();
  if (!stats) {
    std::println(stderr, "Error: {}", stats.error().message());
    return 1;
  }

  if (opts.json) {
    std::println("{}", stats->to_json().dump(2));
    return 0;
  }

  std::println("Retries granted: {}", stats->total_retries);
  std::println("Retries denied:  {}", stats->total_denied);
  if (!stats->by_failure_type.empty()) {
    std::println("\nBy failure type:");
    for (const auto& [type, n] : stats->by_failure_type) {
      std::println("  {:<24} {}", type, n);
    }
  }
  if (!stats->by_task.empty()) {
    std::println("\nBy story:");
    for (const auto& [task, n] : stats->by_task) {
      std::println("  {:<24} {}", task, n);
    }
  }
  if (!stats->recent.empty()) {
    std::println("\nRecent:");
    for (const auto& rec : stats->recent) {
      std::println("  {} {} attempt {} {} backoff {:.0f}s",
                   format_timestamp(rec.timestamp), rec.task_id, rec.attempt,
                   to_string_view(rec.failure_type), rec.backoff_seconds);
    }
  }
  return 0;
}

auto cmd_runs(const StateOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }
  RunStore store(database_path(*config).string());
  if (auto r = store.open(); !r) {
    std::println(stderr, "Error: Failed to open run store: {}",
                 r.error().message());
    return 1;
  }
  auto runs = store.list_runs();
  if (!runs) {
    std::println(stderr, "Error: {}", runs.error().message());
    return 1;
  }

  if (opts.json) {
    auto list = nlohmann::json::array();
    for (const auto& run : *runs) {
      list.push_back({
          {"run_id", run.id.str()},
          {"prd_path", run.prd_path},
          {"state", std::string(to_string_view(run.state))},
          {"started_at", format_timestamp(run.started_at)},
          {"finished_at", run.finished_at
                              ? nlohmann::json(format_timestamp(*run.finished_at))
                              : nlohmann::json(nullptr)},
      });
    }
    std::println("{}", list.dump(2));
    return 0;
  }

  if (runs->empty()) {
    std::println("No runs recorded.");
    return 0;
  }
  std::println("{:<14} {:<12} {:<26} {}", "RUN_ID", "STATE", "STARTED", "PRD");
  for (const auto& run : *runs) {
    std::println("{:<14} {:<12} {:<26} {}", run.id.str(),
                 to_string_view(run.state), format_timestamp(run.started_at),
                 run.prd_path);
  }
  return 0;
}

}  // namespace storyloop::cli
