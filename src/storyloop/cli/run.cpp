#include "storyloop/cli/commands.hpp"
#include "storyloop/cli/context.hpp"
#include "storyloop/config/config.hpp"
#include "storyloop/events/event_bus.hpp"
#include "storyloop/executor/executor.hpp"
#include "storyloop/health/health_monitor.hpp"
#include "storyloop/orchestrator/orchestrator.hpp"
#include "storyloop/retry/retry_handler.hpp"
#include "storyloop/storage/run_store.hpp"
#include "storyloop/util/fs.hpp"
#include "storyloop/util/log.hpp"
#include "storyloop/util/signals.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <print>

namespace storyloop::cli {

auto cmd_run(const RunOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }
  if (opts.max_workers) {
    config->executor.max_workers = *opts.max_workers;
  }
  setup_logging(*config);
  if (auto r = install_shutdown_handlers(); !r) {
    log::warn("Signal handlers not installed: {}", r.error().message());
  }

  auto tasks = load_tasks(opts.prd_file);
  if (!tasks) {
    log::stop();
    return 1;
  }

  std::filesystem::path state_dir{config->state_dir};
  if (auto r = ensure_directory(state_dir); !r) {
    std::println(stderr, "Error: Cannot create {}: {}", state_dir.string(),
                 r.error().message());
    log::stop();
    return 1;
  }

  auto merger = open_merge_controller(*config);
  if (!merger) {
    log::stop();
    return 1;
  }

  RunStore store(database_path(*config).string());
  if (auto r = store.open(); !r) {
    std::println(stderr, "Error: Failed to open run store: {}",
                 r.error().message());
    log::stop();
    return 1;
  }

  EventBus bus(EventBusOptions{
      .history_capacity = config->events.history_capacity,
      .dispatcher_threads = config->events.dispatcher_threads,
  });
  HealthMonitor health(state_dir, config->health);
  RetryHandler retry(config->retry, state_dir / "retries.jsonl");
  auto executor = create_process_executor();

  // Event trace for operators following the run.
  auto trace = bus.subscribe(
      "story.*",
      [](const Event& e) {
        log::debug("event {} {} {}", e.type,
                   e.ids.task_id ? e.ids.task_id->str() : std::string{},
                   e.data.dump());
      },
      EventPriority::Background, {}, "trace");

  Orchestrator orchestrator(*config, Orchestrator::Services{
                                         .merger = **merger,
                                         .executor = *executor,
                                         .bus = bus,
                                         .health = health,
                                         .retry = retry,
                                         .store = &store,
                                     });

  auto summary = orchestrator.run(
      std::move(*tasks), storyloop::RunOptions{
                             .filter = filter_for(opts.include_completed),
                             .resume = opts.resume,
                             .prd_path = opts.prd_file,
                         });
  bus.unsubscribe(trace);
  bus.wait_idle();

  if (!summary) {
    std::println(stderr, "Error: Run aborted: {}", summary.error().message());
    log::stop();
    return 1;
  }

  if (opts.json) {
    std::println("{}", summary->to_json().dump(2));
  } else {
    std::println("Run {}: {}", summary->run_id, to_string_view(summary->state));
    std::println("{:<24} {:<14} {:<9} {}", "STORY", "OUTCOME", "ATTEMPTS",
                 "DETAIL");
    for (const auto& r : summary->tasks) {
      std::println("{:<24} {:<14} {:<9} {}", r.id.str(),
                   to_string_view(r.outcome), r.attempts,
                   r.commit.empty() ? r.detail : r.commit.substr(0, 12));
    }
    std::println("\n{} merged, {} failed, {} skipped, {} cancelled in {:.1f}s",
                 summary->count(TaskOutcome::Merged),
                 summary->count(TaskOutcome::Failed) +
                     summary->count(TaskOutcome::MergeFailed),
                 summary->count(TaskOutcome::Skipped),
                 summary->count(TaskOutcome::Cancelled),
                 summary->duration_sec);
  }

  if (summary->state == RunState::Interrupted && shutdown_signal() != 0) {
    log::info("Stopped by signal {}", shutdown_signal());
  }
  log::stop();
  switch (summary->state) {
    case RunState::Completed: return 0;
    case RunState::Interrupted: return 130;
    default: return 1;
  }
}

}  // namespace storyloop::cli
