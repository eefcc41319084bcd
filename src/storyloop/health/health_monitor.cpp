#include "storyloop/health/health_monitor.hpp"

#include "storyloop/executor/process.hpp"
#include "storyloop/util/fs.hpp"
#include "storyloop/util/log.hpp"

#include <algorithm>
#include <fstream>

#include <unistd.h>

namespace storyloop {

namespace {

inline constexpr std::string_view kHeartbeatFile = "heartbeat.json";

auto to_liveness(std::optional<bool> running) -> Liveness {
  if (!running) {
    return Liveness::Unknown;
  }
  return *running ? Liveness::Running : Liveness::NotRunning;
}

}  // namespace

auto Heartbeat::to_json() const -> nlohmann::json {
  nlohmann::json j{
      {"timestamp", format_timestamp(timestamp)},
      {"worker_id", worker_id.str()},
      {"story_id", task_id.str()},
      {"iteration", iteration},
      {"memory_mb", memory_mb},
      {"api_calls_made", api_calls},
      {"context", context},
  };
  if (pid) {
    j["pid"] = *pid;
  }
  return j;
}

auto Heartbeat::from_json(const nlohmann::json& j) -> Result<Heartbeat> {
  if (!j.is_object()) {
    return fail(Error::HeartbeatMalformed);
  }
  try {
    auto ts = parse_timestamp(j.at("timestamp").get<std::string>());
    if (!ts) {
      return fail(Error::HeartbeatMalformed);
    }
    Heartbeat hb;
    hb.timestamp = *ts;
    hb.worker_id = WorkerId{j.at("worker_id").get<std::string>()};
    hb.task_id = TaskId{j.value("story_id", std::string{})};
    hb.iteration = j.value("iteration", 0);
    hb.memory_mb = j.value("memory_mb", 0.0);
    hb.api_calls = j.value("api_calls_made", std::uint64_t{0});
    if (auto it = j.find("pid"); it != j.end() && it->is_number_integer()) {
      hb.pid = it->get<pid_t>();
    } else if (auto ctx = j.find("context");
               ctx != j.end() && ctx->is_object() && ctx->contains("pid") &&
               (*ctx)["pid"].is_number_integer()) {
      hb.pid = (*ctx)["pid"].get<pid_t>();
    }
    if (auto ctx = j.find("context"); ctx != j.end() && ctx->is_object()) {
      hb.context = *ctx;
    }
    return hb;
  } catch (const nlohmann::json::exception&) {
    return fail(Error::HeartbeatMalformed);
  }
}

auto WorkerHealth::to_json() const -> nlohmann::json {
  nlohmann::json j{
      {"worker_id", worker_id.str()},
      {"status", std::string(to_string_view(status))},
      {"seconds_since_heartbeat", seconds_since_heartbeat},
      {"memory_mb", memory_mb},
      {"api_calls_made", api_calls},
      {"iteration", iteration},
  };
  j["last_heartbeat"] =
      last_heartbeat ? nlohmann::json(format_timestamp(*last_heartbeat))
                     : nlohmann::json(nullptr);
  j["current_story"] =
      current_task ? nlohmann::json(current_task->str()) : nlohmann::json(nullptr);
  j["pid"] = pid ? nlohmann::json(*pid) : nlohmann::json(nullptr);
  j["process_running"] =
      process_running ? nlohmann::json(*process_running) : nlohmann::json(nullptr);
  return j;
}

auto HealthSummary::to_json() const -> nlohmann::json {
  return {{"total_workers", total}, {"healthy", healthy}, {"hung", hung},
          {"dead", dead},           {"unknown", unknown}};
}

HealthMonitor::HealthMonitor(std::filesystem::path state_dir,
                             HealthConfig config)
    : workers_dir_(state_dir / "workers"),
      health_log_(state_dir / "health.jsonl"),
      thresholds_{std::chrono::seconds(config.hung_threshold_sec),
                  std::chrono::seconds(config.dead_threshold_sec)},
      clock_([] { return Clock::now(); }),
      probe_([](pid_t pid) { return is_process_running(pid); }) {
}

auto HealthMonitor::set_clock(ClockFn clock) -> void {
  clock_ = std::move(clock);
}

auto HealthMonitor::set_process_probe(ProbeFn probe) -> void {
  probe_ = std::move(probe);
}

auto HealthMonitor::worker_dir(const WorkerId& worker) const
    -> std::filesystem::path {
  return workers_dir_ / worker.str();
}

auto HealthMonitor::heartbeat_path(const WorkerId& worker) const
    -> std::filesystem::path {
  return worker_dir(worker) / kHeartbeatFile;
}

auto HealthMonitor::health_log_path() const -> std::filesystem::path {
  return health_log_;
}

auto HealthMonitor::write_heartbeat(const WorkerId& worker, const TaskId& task,
                                    int iteration, const WorkerStats& stats)
    -> Result<void> {
  Heartbeat hb;
  hb.timestamp = clock_();
  hb.worker_id = worker;
  hb.task_id = task;
  hb.iteration = iteration;
  hb.memory_mb = stats.memory_mb;
  hb.api_calls = stats.api_calls;
  hb.pid = stats.pid;
  hb.context = stats.context;
  return write(hb);
}

auto HealthMonitor::write(const Heartbeat& heartbeat) -> Result<void> {
  if (heartbeat.worker_id.empty()) {
    return fail(Error::InvalidArgument);
  }
  return write_file_atomic(heartbeat_path(heartbeat.worker_id),
                           heartbeat.to_json().dump(2));
}

auto HealthMonitor::read(const WorkerId& worker) const -> Result<Heartbeat> {
  auto content = read_file(heartbeat_path(worker));
  if (!content) {
    return fail(content.error() == make_error_code(Error::FileNotFound)
                    ? Error::HeartbeatMissing
                    : Error::HeartbeatMalformed);
  }
  auto j = nlohmann::json::parse(*content, nullptr, false);
  if (j.is_discarded()) {
    return fail(Error::HeartbeatMalformed);
  }
  return Heartbeat::from_json(j);
}

auto HealthMonitor::check(const WorkerId& worker, std::optional<pid_t> pid)
    -> WorkerHealth {
  WorkerHealth health;
  health.worker_id = worker;
  health.pid = pid;

  auto hb = read(worker);
  if (!hb) {
    // Missing or unreadable records degrade to UNKNOWN.
    if (hb.error() == make_error_code(Error::HeartbeatMalformed)) {
      log::warn("Heartbeat for {} is malformed", worker);
    }
    health.status = WorkerStatus::Unknown;
    if (pid) {
      health.process_running = probe_(*pid);
    }
    log_event(health);
    return health;
  }

  if (!health.pid) {
    health.pid = hb->pid;
  }
  if (health.pid) {
    health.process_running = probe_(*health.pid);
  }

  auto age = std::chrono::duration<double>(clock_() - hb->timestamp);
  health.last_heartbeat = hb->timestamp;
  health.seconds_since_heartbeat = age.count();
  health.memory_mb = hb->memory_mb;
  health.api_calls = hb->api_calls;
  health.current_task = hb->task_id;
  health.iteration = hb->iteration;
  health.status =
      classify(age, to_liveness(health.process_running), thresholds_);

  if (health.status != WorkerStatus::Healthy) {
    log_event(health);
  }
  return health;
}

auto HealthMonitor::known_workers() const -> std::vector<WorkerId> {
  std::vector<WorkerId> workers;
  std::error_code ec;
  if (!std::filesystem::is_directory(workers_dir_, ec)) {
    return workers;
  }
  for (const auto& entry :
       std::filesystem::directory_iterator(workers_dir_, ec)) {
    if (entry.is_directory(ec)) {
      workers.emplace_back(entry.path().filename().string());
    }
  }
  std::ranges::sort(workers);
  return workers;
}

auto HealthMonitor::check_all() -> std::vector<WorkerHealth> {
  std::vector<WorkerHealth> result;
  for (const auto& worker : known_workers()) {
    result.push_back(check(worker));
  }
  return result;
}

auto HealthMonitor::unhealthy_workers() -> std::vector<WorkerHealth> {
  auto all = check_all();
  std::erase_if(all, [](const WorkerHealth& h) {
    return h.status == WorkerStatus::Healthy;
  });
  return all;
}

auto HealthMonitor::summary() -> HealthSummary {
  HealthSummary s;
  for (const auto& h : check_all()) {
    ++s.total;
    switch (h.status) {
      case WorkerStatus::Healthy: ++s.healthy; break;
      case WorkerStatus::Hung: ++s.hung; break;
      case WorkerStatus::Dead: ++s.dead; break;
      case WorkerStatus::Unknown: ++s.unknown; break;
    }
  }
  return s;
}

auto HealthMonitor::remove(const WorkerId& worker) -> void {
  std::error_code ec;
  std::filesystem::remove_all(worker_dir(worker), ec);
  if (ec) {
    log::warn("Failed to remove worker dir for {}: {}", worker, ec.message());
  }
}

auto HealthMonitor::cleanup(std::chrono::hours max_age)
    -> std::vector<WorkerId> {
  std::vector<WorkerId> removed;
  auto now = clock_();
  for (const auto& worker : known_workers()) {
    std::optional<TimePoint> last;
    if (auto hb = read(worker)) {
      last = hb->timestamp;
    } else {
      std::error_code ec;
      auto path = std::filesystem::exists(heartbeat_path(worker), ec)
                      ? heartbeat_path(worker)
                      : worker_dir(worker);
      auto mtime = std::filesystem::last_write_time(path, ec);
      if (!ec) {
        last = std::chrono::clock_cast<Clock>(mtime);
      }
    }
    if (last && now - *last > max_age) {
      remove(worker);
      removed.push_back(worker);
      log::info("Removed stale heartbeat for {}", worker);
    }
  }
  return removed;
}

auto HealthMonitor::log_event(const WorkerHealth& health) -> void {
  nlohmann::json entry{
      {"timestamp", format_timestamp(clock_())},
      {"worker_id", health.worker_id.str()},
      {"status", std::string(to_string_view(health.status))},
      {"seconds_since_heartbeat", health.seconds_since_heartbeat},
      {"current_story", health.current_task
                            ? nlohmann::json(health.current_task->str())
                            : nlohmann::json(nullptr)},
      {"iteration", health.iteration},
      {"process_running", health.process_running
                              ? nlohmann::json(*health.process_running)
                              : nlohmann::json(nullptr)},
  };
  if (auto r = append_line(health_log_, entry.dump()); !r) {
    log::warn("Failed to append health event for {}: {}", health.worker_id,
              r.error().message());
  }
}

auto process_memory_mb() -> double {
  std::ifstream statm("/proc/self/statm");
  long pages_total = 0;
  long pages_resident = 0;
  if (!(statm >> pages_total >> pages_resident)) {
    return 0.0;
  }
  auto page_size = ::sysconf(_SC_PAGESIZE);
  return static_cast<double>(pages_resident) * static_cast<double>(page_size) /
         (1024.0 * 1024.0);
}

}  // namespace storyloop
