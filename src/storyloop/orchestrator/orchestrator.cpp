#include "storyloop/orchestrator/orchestrator.hpp"

#include "storyloop/util/fs.hpp"
#include "storyloop/util/log.hpp"
#include "storyloop/util/signals.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <thread>
#include <utility>

namespace storyloop {

namespace {

inline constexpr std::string_view kResultFile = "result.json";

using SteadyClock = std::chrono::steady_clock;

auto batch_json(const Batch& batch) -> nlohmann::json {
  auto ids = nlohmann::json::array();
  for (const auto& id : batch) {
    ids.push_back(id.str());
  }
  return ids;
}

}  // namespace

auto read_worker_result(const std::filesystem::path& path)
    -> std::optional<WorkerResult> {
  auto content = read_file(path);
  if (!content) {
    return std::nullopt;
  }
  auto j = nlohmann::json::parse(*content, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    log::warn("Ignoring malformed worker result {}", path.string());
    return std::nullopt;
  }
  WorkerResult result;
  if (auto it = j.find("failure_type"); it != j.end() && it->is_string()) {
    result.failure_type = parse_failure_type(it->get<std::string>());
  }
  if (auto it = j.find("error"); it != j.end() && it->is_string()) {
    result.error = it->get<std::string>();
  }
  return result;
}

auto classify_exit(int exit_code, const std::optional<WorkerResult>& reported)
    -> FailureType {
  if (reported && reported->failure_type) {
    return *reported->failure_type;
  }
  switch (exit_code) {
    case kTimeoutExitCode: return FailureType::Timeout;
    case kKilledExitCode: return FailureType::ResourceExhaustion;
    default: return FailureType::Unknown;
  }
}

auto RunSummary::count(TaskOutcome outcome) const -> std::size_t {
  return static_cast<std::size_t>(std::ranges::count_if(
      tasks, [outcome](const TaskReport& r) { return r.outcome == outcome; }));
}

auto RunSummary::find(const TaskId& id) const -> const TaskReport* {
  auto it = std::ranges::find(tasks, id, &TaskReport::id);
  return it != tasks.end() ? &*it : nullptr;
}

auto RunSummary::to_json() const -> nlohmann::json {
  auto stories = nlohmann::json::array();
  for (const auto& r : tasks) {
    nlohmann::json entry{
        {"id", r.id.str()},
        {"outcome", std::string(to_string_view(r.outcome))},
        {"attempts", r.attempts},
        {"batch", r.batch},
    };
    entry["failure_type"] =
        r.failure ? nlohmann::json(std::string(to_string_view(*r.failure)))
                  : nlohmann::json(nullptr);
    if (!r.commit.empty()) {
      entry["commit_hash"] = r.commit;
    }
    if (r.error) {
      entry["error"] = r.error.message();
    }
    if (!r.detail.empty()) {
      entry["detail"] = r.detail;
    }
    stories.push_back(std::move(entry));
  }
  return {
      {"run_id", run_id.str()},
      {"state", std::string(to_string_view(state))},
      {"batches", batches},
      {"duration_sec", duration_sec},
      {"merged", count(TaskOutcome::Merged)},
      {"failed", count(TaskOutcome::Failed) + count(TaskOutcome::MergeFailed)},
      {"skipped", count(TaskOutcome::Skipped)},
      {"cancelled", count(TaskOutcome::Cancelled)},
      {"stories", std::move(stories)},
  };
}

Orchestrator::Orchestrator(SystemConfig config, Services services)
    : config_(std::move(config)), services_(services) {
  std::error_code ec;
  state_dir_ = std::filesystem::absolute(config_.state_dir, ec);
  if (ec) {
    state_dir_ = config_.state_dir;
  }
  subscribe_handlers();
}

Orchestrator::~Orchestrator() {
  for (auto id : subscriptions_) {
    services_.bus.unsubscribe(id);
  }
}

auto Orchestrator::stopping() const noexcept -> bool {
  return stop_requested_.load(std::memory_order_acquire) ||
         shutdown_requested();
}

auto Orchestrator::subscribe_handlers() -> void {
  auto this_run = [this](const Event& e) {
    return e.ids.run_id && *e.ids.run_id == run_id_;
  };

  subscriptions_.push_back(services_.bus.subscribe(
      "story.failed",
      [this](const Event& e) {
        if (!e.ids.task_id) {
          return;
        }
        auto type = parse_failure_type(
            e.data.value("failure_type", std::string{"unknown"}));
        int attempt = e.data.value("attempt", 1);
        decisions_[*e.ids.task_id] = services_.retry.should_retry(
            *e.ids.task_id, type, attempt - 1,
            e.data.value("error", std::string{}));
      },
      EventPriority::Critical, this_run, "retry-handler"));

  subscriptions_.push_back(services_.bus.subscribe(
      "story.completed",
      [this](const Event& e) {
        if (e.ids.task_id) {
          merge_queue_.push_back(*e.ids.task_id);
        }
      },
      EventPriority::Critical, this_run, "merge-queue"));
}

auto Orchestrator::emit(std::string type, nlohmann::json data,
                        std::optional<TaskId> task) -> void {
  services_.bus.emit(std::move(type), std::move(data),
                     CorrelationIds{run_id_, std::move(task)},
                     DispatchMode::Wait);
}

auto Orchestrator::report(const TaskId& id) -> TaskReport& {
  return summary_.tasks.at(report_idx_.at(id));
}

auto Orchestrator::run(std::vector<Task> tasks, const RunOptions& options)
    -> Result<RunSummary> {
  if (config_.executor.command.empty()) {
    log::error("executor.command is not configured");
    return fail(Error::InvalidArgument);
  }

  auto started = SteadyClock::now();
  run_id_ = generate_run_id();
  summary_ = RunSummary{};
  summary_.run_id = run_id_;
  report_idx_.clear();
  completed_.clear();
  merge_queue_.clear();
  decisions_.clear();
  services_.retry.set_run_id(run_id_.str());

  if (options.resume && services_.store) {
    auto merged = services_.store->merged_tasks();
    if (!merged) {
      return std::unexpected(merged.error());
    }
    std::unordered_set<TaskId> done(merged->begin(), merged->end());
    for (auto& t : tasks) {
      if (!t.passes && done.contains(t.id)) {
        t.passes = true;
        log::info("Resume: {} was merged by an earlier run", t.id);
      }
    }
  }

  auto graph = DependencyGraph::build(std::move(tasks));
  if (!graph) {
    log::error("Cannot build dependency graph: {}", graph.error().message());
    return std::unexpected(graph.error());
  }
  if (auto cycles = graph->detect_cycles(options.filter); !cycles.empty()) {
    for (const auto& cycle : cycles) {
      std::string path;
      for (const auto& id : cycle) {
        path += path.empty() ? id.str() : " -> " + id.str();
      }
      log::error("Dependency cycle: {}", path);
    }
    return fail(Error::CycleDetected);
  }
  auto batches = graph->parallel_batches(options.filter);
  if (!batches) {
    return std::unexpected(batches.error());
  }
  graph_ = &*graph;

  std::size_t total = 0;
  for (std::size_t i = 0; i < batches->size(); ++i) {
    for (const auto& id : (*batches)[i]) {
      report_idx_.emplace(id, summary_.tasks.size());
      summary_.tasks.push_back(TaskReport{.id = id, .batch = i + 1});
      ++total;
    }
  }
  summary_.batches = batches->size();

  if (services_.store) {
    if (auto r = services_.store->begin_run(run_id_, options.prd_path); !r) {
      log::warn("Failed to record run start: {}", r.error().message());
    }
  }
  log::info("Run {} started: {} stories in {} batch(es), {} worker(s)",
            run_id_, total, batches->size(), config_.executor.max_workers);
  emit("run.started", {{"total_stories", total},
                       {"batches", batches->size()},
                       {"max_workers", config_.executor.max_workers}});

  for (std::size_t i = 0; i < batches->size() && !stopping(); ++i) {
    auto batch_no = i + 1;
    Batch runnable;
    for (const auto& id : (*batches)[i]) {
      if (report(id).outcome == TaskOutcome::Pending) {
        runnable.push_back(id);
      }
    }
    if (runnable.empty()) {
      continue;
    }

    log::info("Batch {}/{}: {} stories", batch_no, batches->size(),
              runnable.size());
    emit("batch.started", {{"batch", batch_no}, {"stories", batch_json(runnable)}});

    auto sub_batches = MergeController::resolve_conflicts(*graph, runnable);
    if (sub_batches.size() > 1) {
      auto conflicts = nlohmann::json::array();
      for (const auto& c : MergeController::check_conflicts(*graph, runnable)) {
        conflicts.push_back(c.to_json());
      }
      auto subs = nlohmann::json::array();
      for (const auto& sb : sub_batches) {
        subs.push_back(batch_json(sb));
      }
      emit("plan.conflicts_serialized", {{"batch", batch_no},
                                         {"sub_batches", std::move(subs)},
                                         {"conflicts", std::move(conflicts)}});
    }

    for (const auto& sub : sub_batches) {
      if (stopping()) {
        break;
      }
      run_sub_batch(*graph, sub, batch_no);
      merge_completed(*graph, batch_no);
    }

    std::size_t merged = 0;
    std::size_t failed = 0;
    for (const auto& id : runnable) {
      auto outcome = report(id).outcome;
      merged += outcome == TaskOutcome::Merged;
      failed += outcome == TaskOutcome::Failed ||
                outcome == TaskOutcome::MergeFailed;
    }
    emit("batch.completed",
         {{"batch", batch_no}, {"merged", merged}, {"failed", failed}});
  }

  // Successful but unmerged work survives an interrupt on its branch.
  for (auto& [id, lease] : completed_) {
    lease.preserve();
    auto& r = report(id);
    r.outcome = TaskOutcome::Cancelled;
    r.error = make_error_code(Error::Cancelled);
    r.detail = std::format("interrupted before merge; branch {} kept",
                           lease.branch());
  }
  completed_.clear();

  bool interrupted = stopping();
  for (auto& r : summary_.tasks) {
    if (r.outcome == TaskOutcome::Pending) {
      r.outcome = TaskOutcome::Cancelled;
      r.error = make_error_code(Error::Cancelled);
    }
  }
  bool any_failed = summary_.count(TaskOutcome::Failed) > 0 ||
                    summary_.count(TaskOutcome::MergeFailed) > 0 ||
                    summary_.count(TaskOutcome::Skipped) > 0;
  summary_.state = interrupted  ? RunState::Interrupted
                   : any_failed ? RunState::Failed
                                : RunState::Completed;
  summary_.duration_sec =
      std::chrono::duration<double>(SteadyClock::now() - started).count();

  if (services_.store) {
    if (auto r = services_.store->finish_run(run_id_, summary_.state); !r) {
      log::warn("Failed to record run end: {}", r.error().message());
    }
  }
  log::info("Run {} {}: {} merged, {} failed, {} skipped in {:.1f}s", run_id_,
            to_string_view(summary_.state), summary_.count(TaskOutcome::Merged),
            summary_.count(TaskOutcome::Failed) +
                summary_.count(TaskOutcome::MergeFailed),
            summary_.count(TaskOutcome::Skipped), summary_.duration_sec);
  emit("run.completed", summary_.to_json());

  graph_ = nullptr;
  return summary_;
}

auto Orchestrator::run_sub_batch(const DependencyGraph& graph,
                                 const Batch& sub_batch, std::size_t batch_no)
    -> void {
  std::vector<Attempt> queue;
  for (const auto& id : sub_batch) {
    queue.push_back(Attempt{id, 1, {}});
  }
  std::vector<ActiveWorker> active;
  auto max_workers =
      static_cast<std::size_t>(std::max(1, config_.executor.max_workers));
  auto poll_interval =
      std::chrono::milliseconds(std::max(1, config_.executor.poll_interval_ms));

  log::debug("Sub-batch of batch {}: {} stories", batch_no, sub_batch.size());

  while (!queue.empty() || !active.empty()) {
    if (stopping()) {
      log::warn("Stop requested; killing {} worker(s)", active.size());
      for (auto& w : active) {
        auto code = w.process->kill();
        finish_attempt(w, code, ForcedStop::Cancelled, queue);
      }
      return;
    }

    auto now = SteadyClock::now();
    for (auto it = queue.begin();
         it != queue.end() && active.size() < max_workers;) {
      if (it->not_before > now) {
        ++it;
        continue;
      }
      auto attempt = *it;
      queue.erase(it);
      const auto* task = graph.find(attempt.task);
      auto worker = launch(*task, attempt.number);
      if (!worker) {
        fail_attempt(*task, attempt.number,
                     make_worker_id(task->id, attempt.number),
                     FailureType::CoordinatorError, -1,
                     std::format("launch failed: {}", worker.error().message()),
                     queue);
      } else {
        active.push_back(std::move(*worker));
      }
      it = queue.begin();
    }

    for (auto it = active.begin(); it != active.end();) {
      if (auto code = it->process->poll()) {
        finish_attempt(*it, *code, ForcedStop::None, queue);
        it = active.erase(it);
        continue;
      }
      if (auto forced = supervise(*it); forced != ForcedStop::None) {
        auto code = it->process->kill();
        finish_attempt(*it, code, forced, queue);
        it = active.erase(it);
        continue;
      }
      ++it;
    }

    if (!queue.empty() || !active.empty()) {
      std::this_thread::sleep_for(poll_interval);
    }
  }
}

auto Orchestrator::launch(const Task& task, int attempt)
    -> Result<ActiveWorker> {
  auto worker_id = make_worker_id(task.id, attempt);
  auto lease =
      services_.merger.create_worker(task.id, config_.repository.base_branch);
  if (!lease) {
    return std::unexpected(lease.error());
  }

  // A record under the same id can only be left over from an earlier run.
  services_.health.remove(worker_id);
  if (auto r = ensure_directory(services_.health.worker_dir(worker_id)); !r) {
    return std::unexpected(r.error());
  }

  auto attempt_str = std::to_string(attempt);
  LaunchSpec spec;
  spec.worker_id = worker_id;
  spec.task_id = task.id;
  spec.working_dir = lease->worktree();
  spec.log_file = state_dir_ / "logs" / (worker_id.str() + ".log");
  spec.command = expand_command(config_.executor.command,
                                {{"task_id", task.id.str()},
                                 {"title", task.title},
                                 {"worker_id", worker_id.str()},
                                 {"workspace", lease->worktree().string()},
                                 {"attempt", attempt_str}});
  spec.env = {
      "STORYLOOP_TASK_ID=" + task.id.str(),
      "STORYLOOP_WORKER_ID=" + worker_id.str(),
      "STORYLOOP_WORKSPACE=" + lease->worktree().string(),
      "STORYLOOP_STATE_DIR=" + state_dir_.string(),
      "STORYLOOP_ATTEMPT=" + attempt_str,
  };

  auto process = services_.executor.launch(spec);
  if (!process) {
    log::error("Failed to launch worker {}: {}", worker_id,
               process.error().message());
    return std::unexpected(process.error());
  }

  ActiveWorker worker;
  worker.task = &task;
  worker.attempt = attempt;
  worker.worker_id = worker_id;
  worker.process = std::move(*process);
  worker.lease = std::move(*lease);
  worker.started_at = Clock::now();
  worker.last_health_check = SteadyClock::now();

  report(task.id).attempts = attempt;
  log::info("Started {} (attempt {}, pid {})", worker_id, attempt,
            worker.process->pid());
  emit("story.started",
       {{"worker_id", worker_id.str()},
        {"attempt", attempt},
        {"branch", worker.lease.branch()},
        {"workspace", worker.lease.worktree().string()},
        {"pid", worker.process->pid()}},
       task.id);
  return worker;
}

auto Orchestrator::supervise(ActiveWorker& worker) -> ForcedStop {
  auto now = SteadyClock::now();
  if (config_.executor.timeout_sec > 0 &&
      now - worker.process->started_at() >=
          std::chrono::seconds(config_.executor.timeout_sec)) {
    log::warn("{} exceeded {}s", worker.worker_id, config_.executor.timeout_sec);
    return ForcedStop::Timeout;
  }
  if (now - worker.last_health_check <
      std::chrono::seconds(config_.health.check_interval_sec)) {
    return ForcedStop::None;
  }
  worker.last_health_check = now;

  auto health = services_.health.check(worker.worker_id, worker.process->pid());
  switch (health.status) {
    case WorkerStatus::Healthy:
    case WorkerStatus::Unknown:
      worker.hung_since.reset();
      return ForcedStop::None;
    case WorkerStatus::Hung:
      if (!worker.hung_since) {
        worker.hung_since = now;
        emit("worker.unhealthy", health.to_json(), worker.task->id);
      }
      if (now - *worker.hung_since >=
          std::chrono::seconds(config_.health.hung_grace_sec)) {
        log::warn("{} hung past the grace period", worker.worker_id);
        return ForcedStop::Hung;
      }
      return ForcedStop::None;
    case WorkerStatus::Dead:
      emit("worker.unhealthy", health.to_json(), worker.task->id);
      log::warn("{} classified dead", worker.worker_id);
      return ForcedStop::Dead;
  }
  return ForcedStop::None;
}

auto Orchestrator::finish_attempt(ActiveWorker& worker, int exit_code,
                                  ForcedStop forced,
                                  std::vector<Attempt>& queue) -> void {
  const auto& task = *worker.task;
  bool success = forced == ForcedStop::None && exit_code == 0;
  auto reported = read_worker_result(services_.health.worker_dir(worker.worker_id) /
                                     kResultFile);

  FailureType type = FailureType::Unknown;
  AttemptOutcome outcome = AttemptOutcome::Succeeded;
  std::string error;
  switch (forced) {
    case ForcedStop::None:
      if (!success) {
        type = classify_exit(exit_code, reported);
        outcome = exit_code == kTimeoutExitCode ? AttemptOutcome::TimedOut
                                                : AttemptOutcome::Failed;
        error = std::format("exit code {}", exit_code);
      }
      break;
    case ForcedStop::Timeout:
      type = FailureType::Timeout;
      outcome = AttemptOutcome::TimedOut;
      exit_code = kTimeoutExitCode;
      error = std::format("timed out after {}s", config_.executor.timeout_sec);
      break;
    case ForcedStop::Hung:
      type = FailureType::Timeout;
      outcome = AttemptOutcome::Killed;
      error = "heartbeat stale past the grace period";
      break;
    case ForcedStop::Dead:
      type = FailureType::CoordinatorError;
      outcome = AttemptOutcome::Killed;
      error = "worker classified dead";
      break;
    case ForcedStop::Cancelled:
      outcome = AttemptOutcome::Killed;
      error = "interrupted";
      break;
  }
  if (reported && !reported->error.empty() && !success) {
    error = reported->error;
  }

  if (services_.store) {
    AttemptRecord record{
        .run_id = run_id_,
        .task_id = task.id,
        .attempt = worker.attempt,
        .worker_id = worker.worker_id,
        .started_at = worker.started_at,
        .finished_at = Clock::now(),
        .exit_code = exit_code,
        .outcome = outcome,
        .failure_type = success ? std::string{}
                                : std::string(to_string_view(type)),
    };
    if (auto r = services_.store->record_attempt(record); !r) {
      log::warn("Failed to record attempt of {}: {}", worker.worker_id,
                r.error().message());
    }
  }
  services_.health.remove(worker.worker_id);

  if (forced == ForcedStop::Cancelled) {
    worker.lease.release();
    services_.retry.record_no_retry(task.id, type, worker.attempt - 1,
                                    "run interrupted", error);
    auto& r = report(task.id);
    r.outcome = TaskOutcome::Cancelled;
    r.error = make_error_code(Error::Cancelled);
    r.detail = error;
    return;
  }

  if (success) {
    log::info("{} completed", worker.worker_id);
    services_.retry.reset_retry_count(task.id);
    auto branch = worker.lease.branch();
    completed_.insert_or_assign(task.id, std::move(worker.lease));
    emit("story.completed",
         {{"worker_id", worker.worker_id.str()},
          {"attempt", worker.attempt},
          {"exit_code", exit_code},
          {"branch", branch}},
         task.id);
    return;
  }

  log::warn("{} failed ({}): {}", worker.worker_id, to_string_view(type), error);
  worker.lease.release();
  fail_attempt(task, worker.attempt, worker.worker_id, type, exit_code,
               std::move(error), queue);
}

auto Orchestrator::fail_attempt(const Task& task, int attempt,
                                const WorkerId& worker, FailureType type,
                                int exit_code, std::string error,
                                std::vector<Attempt>& queue) -> void {
  report(task.id).attempts = attempt;
  decisions_.erase(task.id);
  emit("story.failed",
       {{"worker_id", worker.str()},
        {"attempt", attempt},
        {"failure_type", std::string(to_string_view(type))},
        {"exit_code", exit_code},
        {"error", error}},
       task.id);

  auto it = decisions_.find(task.id);
  if (it != decisions_.end() && it->second.should_retry) {
    auto backoff = std::chrono::duration_cast<SteadyClock::duration>(
        it->second.backoff);
    queue.push_back(Attempt{task.id, attempt + 1, SteadyClock::now() + backoff});
    emit("story.retry_scheduled",
         {{"attempt", attempt + 1},
          {"backoff_seconds", it->second.backoff.count()},
          {"failure_type", std::string(to_string_view(type))},
          {"reason", it->second.reason}},
         task.id);
    return;
  }

  auto reason = it != decisions_.end() ? it->second.reason
                                       : std::string{"no retry decision"};
  auto& r = report(task.id);
  r.outcome = TaskOutcome::Failed;
  r.failure = type;
  r.error = make_error_code(Error::RetryExhausted);
  r.detail = std::format("{}: {}", reason, error);
  log::error("{} failed terminally after {} attempt(s): {}", task.id, attempt,
             r.detail);
  emit("story.retry_exhausted",
       {{"attempts", attempt},
        {"failure_type", std::string(to_string_view(type))},
        {"reason", reason},
        {"error", error}},
       task.id);
  mark_terminal(task.id);
}

auto Orchestrator::mark_terminal(const TaskId& task) -> void {
  if (!graph_) {
    return;
  }
  for (const auto& dep : graph_->dependents_closure(task)) {
    auto it = report_idx_.find(dep);
    if (it == report_idx_.end()) {
      continue;
    }
    auto& r = summary_.tasks[it->second];
    if (r.outcome != TaskOutcome::Pending) {
      continue;
    }
    r.outcome = TaskOutcome::Skipped;
    r.detail = std::format("dependency {} failed", task);
    log::warn("Skipping {}: {}", dep, r.detail);
    emit("story.skipped",
         {{"reason", r.detail}, {"failed_dependency", task.str()}}, dep);
  }
}

auto Orchestrator::merge_completed(const DependencyGraph& graph,
                                   std::size_t batch_no) -> void {
  if (merge_queue_.empty()) {
    return;
  }
  auto queue = std::exchange(merge_queue_, {});
  std::ranges::sort(queue, [&graph](const TaskId& a, const TaskId& b) {
    const auto* ta = graph.find(a);
    const auto* tb = graph.find(b);
    return std::pair{ta ? ta->priority : kDefaultPriority, graph.index_of(a)} <
           std::pair{tb ? tb->priority : kDefaultPriority, graph.index_of(b)};
  });

  for (const auto& id : queue) {
    auto it = completed_.find(id);
    if (it == completed_.end()) {
      continue;
    }
    auto lease = std::move(it->second);
    completed_.erase(it);

    auto result = services_.merger.merge_back(lease);
    if (services_.store) {
      MergeRecord record{
          .run_id = run_id_,
          .task_id = id,
          .batch = batch_no,
          .success = result.success,
          .commit_hash = result.commit,
          .error = result.message,
          .merged_at = Clock::now(),
      };
      if (auto r = services_.store->record_merge(record); !r) {
        log::warn("Failed to record merge of {}: {}", id, r.error().message());
      }
    }

    auto& r = report(id);
    if (result.success) {
      r.outcome = TaskOutcome::Merged;
      r.commit = result.commit;
      emit("story.merged", result.to_json(), id);
    } else {
      r.outcome = TaskOutcome::MergeFailed;
      r.error = result.error;
      r.detail = result.message;
      emit("story.merge_failed", result.to_json(), id);
      mark_terminal(id);
    }
  }
}

}  // namespace storyloop
