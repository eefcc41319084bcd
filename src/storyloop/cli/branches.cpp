#include "storyloop/cli/commands.hpp"
#include "storyloop/cli/context.hpp"
#include "storyloop/health/health_monitor.hpp"
#include "storyloop/util/util.hpp"

#include <nlohmann/json.hpp>

#include <print>

namespace storyloop::cli {

auto cmd_branches(const StateOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }
  auto merger = open_merge_controller(*config);
  if (!merger) {
    return 1;
  }
  auto branches = (*merger)->list_worker_branches();
  if (!branches) {
    std::println(stderr, "Error: {}", branches.error().message());
    return 1;
  }
  auto locks = (*merger)->lock_status();

  if (opts.json) {
    auto b = nlohmann::json::array();
    for (const auto& br : *branches) {
      b.push_back({{"name", br.name},
                   {"commit", br.commit},
                   {"committed_at", format_timestamp(br.committed_at)}});
    }
    auto l = nlohmann::json::array();
    for (const auto& lock : locks) {
      l.push_back({{"path", lock.path.string()},
                   {"locked", lock.locked},
                   {"holder_pid", lock.holder ? nlohmann::json(*lock.holder)
                                              : nlohmann::json(nullptr)}});
    }
    std::println("{}", nlohmann::json{{"branches", std::move(b)},
                                      {"locks", std::move(l)}}
                           .dump(2));
    return 0;
  }

  if (branches->empty()) {
    std::println("No worker branches.");
  } else {
    std::println("{:<32} {:<12} {}", "BRANCH", "COMMIT", "LAST COMMIT");
    for (const auto& br : *branches) {
      std::println("{:<32} {:<12} {}", br.name, br.commit.substr(0, 10),
                   format_timestamp(br.committed_at));
    }
  }
  for (const auto& lock : locks) {
    if (lock.locked) {
      std::println("locked: {} (pid {})", lock.path.string(),
                   lock.holder ? std::to_string(*lock.holder) : "?");
    } else {
      std::println("free:   {}", lock.path.string());
    }
  }
  return 0;
}

auto cmd_cleanup(const CleanupOptions& opts) -> int {
  auto config = load_config(opts.config_file);
  if (!config) {
    return 1;
  }
  auto merger = open_merge_controller(*config);
  if (!merger) {
    return 1;
  }

  auto hours = opts.max_age_hours.value_or(config->health.cleanup_max_age_hours);
  auto report =
      opts.merged
          ? (*merger)->cleanup_merged(config->repository.base_branch,
                                      opts.dry_run)
          : (*merger)->cleanup(std::chrono::hours(hours), opts.dry_run);
  if (!report) {
    std::println(stderr, "Error: Cleanup failed: {}", report.error().message());
    return 1;
  }

  std::size_t stale_heartbeats = 0;
  if (!opts.dry_run && !opts.merged) {
    HealthMonitor health(config->state_dir, config->health);
    stale_heartbeats = health.cleanup(std::chrono::hours(hours)).size();
  }

  auto verb = opts.dry_run ? "Would remove" : "Removed";
  for (const auto& b : report->branches) {
    std::println("{} branch {}", verb, b);
  }
  for (const auto& w : report->worktrees) {
    std::println("{} worktree {}", verb, w.string());
  }
  std::println("{} {} branch(es), {} worktree(s)", verb,
               report->branches.size(), report->worktrees.size());
  if (stale_heartbeats > 0) {
    std::println("Removed {} stale heartbeat record(s)", stale_heartbeats);
  }
  return 0;
}

}  // namespace storyloop::cli
