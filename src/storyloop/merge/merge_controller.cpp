#include "storyloop/merge/merge_controller.hpp"

#include "storyloop/merge/file_lock.hpp"
#include "storyloop/util/fs.hpp"
#include "storyloop/util/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <unordered_set>

#include <fnmatch.h>

namespace storyloop {

namespace {

auto has_glob(std::string_view entry) -> bool {
  return entry.find_first_of("*?[") != std::string_view::npos;
}

auto entries_overlap(const std::string& a, const std::string& b) -> bool {
  if (a == b) {
    return true;
  }
  if (has_glob(a) && ::fnmatch(a.c_str(), b.c_str(), 0) == 0) {
    return true;
  }
  if (has_glob(b) && ::fnmatch(b.c_str(), a.c_str(), 0) == 0) {
    return true;
  }
  if (a.ends_with('/') && b.starts_with(a)) {
    return true;
  }
  return b.ends_with('/') && a.starts_with(b);
}

auto depends_on(const Task& task, const TaskId& dep) -> bool {
  return std::ranges::find(task.dependencies, dep) != task.dependencies.end();
}

auto sanitize_ref(std::string_view ref) -> std::string {
  std::string out(ref);
  std::ranges::replace(out, '/', '_');
  return out;
}

}  // namespace

auto overlapping_paths(const std::vector<std::string>& a,
                       const std::vector<std::string>& b)
    -> std::vector<std::string> {
  std::vector<std::string> paths;
  for (const auto& x : a) {
    for (const auto& y : b) {
      if (!entries_overlap(x, y)) {
        continue;
      }
      paths.push_back(x);
      if (x != y) {
        paths.push_back(y);
      }
    }
  }
  std::ranges::sort(paths);
  auto dup = std::ranges::unique(paths);
  paths.erase(dup.begin(), dup.end());
  return paths;
}

auto ConflictInfo::to_json() const -> nlohmann::json {
  return {
      {"stories", {first.str(), second.str()}},
      {"conflicting_files", paths},
      {"dependency", dependency},
  };
}

auto MergeResult::to_json() const -> nlohmann::json {
  nlohmann::json j{
      {"success", success},
      {"story_id", task_id.str()},
      {"branch_name", branch},
      {"base_branch", base},
      {"files_merged", files_merged},
  };
  j["commit_hash"] = commit.empty() ? nlohmann::json(nullptr)
                                    : nlohmann::json(commit);
  j["error"] = message.empty() ? nlohmann::json(nullptr)
                               : nlohmann::json(message);
  return j;
}

auto CleanupReport::to_json() const -> nlohmann::json {
  auto paths = nlohmann::json::array();
  for (const auto& p : worktrees) {
    paths.push_back(p.string());
  }
  return {{"dry_run", dry_run}, {"branches", branches}, {"worktrees", paths}};
}

// ---------------------------------------------------------------------------
// WorkerLease

WorkerLease::WorkerLease(const GitRepository* repo, TaskId task,
                         std::string branch, std::filesystem::path worktree,
                         std::string base, std::string base_commit)
    : repo_(repo), task_id_(std::move(task)), branch_(std::move(branch)),
      worktree_(std::move(worktree)), base_(std::move(base)),
      base_commit_(std::move(base_commit)), state_(LeaseState::Active) {
}

WorkerLease::~WorkerLease() {
  release();
}

auto WorkerLease::release() -> void {
  finish(LeaseState::Released, true);
}

auto WorkerLease::preserve() -> void {
  finish(LeaseState::Preserved, false);
}

auto WorkerLease::finish(LeaseState state, bool delete_branch) -> void {
  if (!active()) {
    return;
  }
  std::error_code ec;
  if (std::filesystem::exists(worktree_, ec)) {
    if (auto r = repo_->worktree_remove(worktree_); !r) {
      log::warn("Failed to remove worktree {}: {}", worktree_.string(),
                r.error().message());
    }
  }
  if (delete_branch && repo_->branch_exists(branch_)) {
    if (auto r = repo_->delete_branch(branch_); !r) {
      log::warn("Failed to delete branch {}: {}", branch_,
                r.error().message());
    }
  }
  state_ = state;
  log::debug("Worker lease for {} finished ({})", task_id_,
             delete_branch ? "removed" : "branch kept");
}

// ---------------------------------------------------------------------------
// MergeController

MergeController::MergeController(GitRepository repo, MergeOptions options)
    : repo_(std::move(repo)), options_(std::move(options)) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(options_.state_dir, ec);
  if (!ec) {
    options_.state_dir = abs.lexically_normal();
  }
}

auto MergeController::branch_name(const TaskId& task) const -> std::string {
  return options_.branch_prefix + task.str();
}

auto MergeController::worktree_path(const TaskId& task) const
    -> std::filesystem::path {
  return options_.state_dir / "worktrees" / task.str();
}

auto MergeController::lock_path(std::string_view base) const
    -> std::filesystem::path {
  return options_.state_dir / "locks" /
         std::format("branch_{}.lock", sanitize_ref(base));
}

auto MergeController::check_conflicts(const DependencyGraph& graph,
                                      const Batch& batch)
    -> std::vector<ConflictInfo> {
  std::vector<ConflictInfo> conflicts;
  for (std::size_t i = 0; i < batch.size(); ++i) {
    const auto* a = graph.find(batch[i]);
    if (!a) {
      continue;
    }
    for (std::size_t j = i + 1; j < batch.size(); ++j) {
      const auto* b = graph.find(batch[j]);
      if (!b) {
        continue;
      }
      auto paths = overlapping_paths(a->file_scope, b->file_scope);
      bool dependency = depends_on(*a, b->id) || depends_on(*b, a->id);
      if (!paths.empty() || dependency) {
        conflicts.push_back(
            ConflictInfo{a->id, b->id, std::move(paths), dependency});
      }
    }
  }
  return conflicts;
}

auto MergeController::resolve_conflicts(const DependencyGraph& graph,
                                        const Batch& batch)
    -> std::vector<Batch> {
  auto conflicts = check_conflicts(graph, batch);
  if (conflicts.empty()) {
    return batch.empty() ? std::vector<Batch>{} : std::vector<Batch>{batch};
  }

  std::unordered_set<TaskId> conflicting;
  for (const auto& c : conflicts) {
    conflicting.insert(c.first);
    conflicting.insert(c.second);
  }

  std::vector<Batch> result;
  Batch independent;
  std::vector<TaskId> pending;
  for (const auto& id : batch) {
    if (conflicting.contains(id)) {
      pending.push_back(id);
    } else {
      independent.push_back(id);
    }
  }
  if (!independent.empty()) {
    result.push_back(std::move(independent));
  }

  // Pick, among members whose in-set dependencies are already placed, the
  // one with the lowest (priority, declaration index).
  while (!pending.empty()) {
    auto best = pending.end();
    for (auto it = pending.begin(); it != pending.end(); ++it) {
      const auto* task = graph.find(*it);
      bool blocked = task && std::ranges::any_of(pending, [&](const TaskId& o) {
                       return o != *it && depends_on(*task, o);
                     });
      if (blocked) {
        continue;
      }
      if (best == pending.end()) {
        best = it;
        continue;
      }
      const auto* cur = graph.find(*best);
      auto key = [&](const Task* t, const TaskId& id) {
        return std::pair{t ? t->priority : kDefaultPriority, graph.index_of(id)};
      };
      if (key(task, *it) < key(cur, *best)) {
        best = it;
      }
    }
    // A dependency cycle inside the set; fall back to batch order.
    if (best == pending.end()) {
      best = pending.begin();
    }
    result.push_back(Batch{*best});
    pending.erase(best);
  }

  log::info("Serialized {} conflicting task(s) into {} sub-batch(es)",
            conflicting.size(), result.size());
  return result;
}

auto MergeController::reclaim(const TaskId& task) -> void {
  auto wt = worktree_path(task);
  std::error_code ec;
  if (std::filesystem::exists(wt, ec)) {
    log::warn("Reclaiming stale worktree {}", wt.string());
    if (auto r = repo_.worktree_remove(wt); !r) {
      log::warn("Failed to remove stale worktree {}: {}", wt.string(),
                r.error().message());
    }
  }
  if (auto r = repo_.worktree_prune(); !r) {
    log::debug("worktree prune failed: {}", r.error().message());
  }
  auto branch = branch_name(task);
  if (repo_.branch_exists(branch)) {
    log::warn("Reclaiming stale branch {}", branch);
    if (auto r = repo_.delete_branch(branch); !r) {
      log::warn("Failed to delete stale branch {}: {}", branch,
                r.error().message());
    }
  }
}

auto MergeController::create_worker(const TaskId& task, std::string_view base)
    -> Result<WorkerLease> {
  auto base_commit = repo_.rev_parse(base);
  if (!base_commit) {
    log::error("Base ref {} does not resolve", base);
    return std::unexpected(base_commit.error());
  }

  reclaim(task);

  auto wt = worktree_path(task);
  if (auto r = ensure_directory(wt.parent_path()); !r) {
    return std::unexpected(r.error());
  }
  auto branch = branch_name(task);
  if (auto r = repo_.worktree_add(wt, branch, *base_commit); !r) {
    log::error("Failed to create worktree for {}: {}", task,
               r.error().message());
    return std::unexpected(r.error());
  }

  log::info("Created worker branch {} at {} ({})", branch,
            base_commit->substr(0, 8), wt.string());
  return WorkerLease{&repo_, task, std::move(branch), std::move(wt),
                     std::string(base), std::move(*base_commit)};
}

auto MergeController::adopt_worker(const TaskId& task, std::string_view base)
    -> Result<WorkerLease> {
  auto branch = branch_name(task);
  if (!repo_.branch_exists(branch)) {
    return fail(Error::NotFound);
  }
  auto base_commit = repo_.rev_parse(base);
  if (!base_commit) {
    return std::unexpected(base_commit.error());
  }
  auto wt = worktree_path(task);
  std::error_code ec;
  if (!std::filesystem::exists(wt, ec)) {
    if (auto r = repo_.worktree_prune(); !r) {
      log::debug("worktree prune failed: {}", r.error().message());
    }
    if (auto r = ensure_directory(wt.parent_path()); !r) {
      return std::unexpected(r.error());
    }
    if (auto r = repo_.worktree_attach(wt, branch); !r) {
      return std::unexpected(r.error());
    }
  }
  return WorkerLease{&repo_, task, std::move(branch), std::move(wt),
                     std::string(base), std::move(*base_commit)};
}

auto MergeController::merge_back(WorkerLease& lease) -> MergeResult {
  MergeResult result;
  result.task_id = lease.task_id();
  result.branch = lease.branch();
  result.base = lease.base();

  auto fail_with = [&](Error e, std::string message) {
    result.error = make_error_code(e);
    result.message = std::move(message);
    lease.preserve();
    log::error("Merge of {} failed: {}", result.task_id, result.message);
    return result;
  };

  if (!lease.active()) {
    result.error = make_error_code(Error::InvalidArgument);
    result.message = std::format("Worker for {} is not active", result.task_id);
    return result;
  }

  auto lock = FileLock::acquire(lock_path(result.base), options_.lock_timeout);
  if (!lock) {
    return fail_with(lock.error() == make_error_code(Error::LockTimeout)
                         ? Error::LockTimeout
                         : Error::MergeFailed,
                     std::format("Could not lock {}: {}", result.base,
                                 lock.error().message()));
  }

  if (auto files = repo_.changed_files(result.base, result.branch)) {
    result.files_merged = std::move(*files);
  } else {
    log::warn("Could not list files changed by {}", result.branch);
  }

  if (auto r = repo_.rebase(lease.worktree(), result.base); !r) {
    return fail_with(r.error() == make_error_code(Error::RebaseConflict)
                         ? Error::RebaseConflict
                         : Error::MergeFailed,
                     std::format("Rebase of {} onto {} failed for story {}",
                                 result.branch, result.base, result.task_id));
  }

  auto head = repo_.rev_parse(result.branch);
  auto base_tip = repo_.rev_parse(result.base);
  if (!head || !base_tip) {
    return fail_with(Error::GitCommandFailed,
                     std::format("Could not resolve {} or {}", result.branch,
                                 result.base));
  }
  auto ancestor = repo_.is_ancestor(*base_tip, *head);
  if (!ancestor || !*ancestor) {
    return fail_with(Error::MergeFailed,
                     std::format("{} is not a fast-forward of {}",
                                 result.branch, result.base));
  }

  Result<void> advanced;
  if (auto checkout = repo_.checkout_location(result.base)) {
    advanced = repo_.merge_ff_only(result.branch, *checkout);
  } else {
    advanced = repo_.update_branch(result.base, *head, *base_tip);
  }
  if (!advanced) {
    return fail_with(Error::MergeFailed,
                     std::format("Fast-forward of {} to {} failed",
                                 result.base, result.branch));
  }

  auto new_head = repo_.rev_parse(result.base);
  result.commit = new_head ? *new_head : *head;
  result.success = true;
  lease.finish(LeaseState::Merged, true);

  log::info("Merged {} into {} at {} ({} file(s))", result.branch, result.base,
            result.commit.substr(0, 8), result.files_merged.size());
  return result;
}

auto MergeController::merge_back(const TaskId& task, std::string_view base)
    -> MergeResult {
  auto lease = adopt_worker(task, base);
  if (!lease) {
    MergeResult result;
    result.task_id = task;
    result.branch = branch_name(task);
    result.base = std::string(base);
    result.error = lease.error();
    result.message = std::format("No worker branch for story {}: {}", task,
                                 lease.error().message());
    return result;
  }
  return merge_back(*lease);
}

auto MergeController::last_activity(const BranchInfo& branch) const
    -> TimePoint {
  auto last = branch.committed_at;
  auto name = std::string_view(branch.name);
  if (name.starts_with(options_.branch_prefix)) {
    name.remove_prefix(options_.branch_prefix.size());
  }
  std::error_code ec;
  auto wt = worktree_path(TaskId{std::string(name)});
  auto mtime = std::filesystem::last_write_time(wt, ec);
  if (!ec) {
    last = std::max(last, std::chrono::clock_cast<Clock>(mtime));
  }

  // A live worker refreshes `workers/<task>-a<N>/heartbeat.json` even
  // before its first commit.
  auto workers = options_.state_dir / "workers";
  auto prefix = std::string(name) + "-a";
  if (std::filesystem::is_directory(workers, ec)) {
    for (const auto& entry :
         std::filesystem::directory_iterator(workers, ec)) {
      auto dir = entry.path().filename().string();
      if (!dir.starts_with(prefix) || dir.size() == prefix.size() ||
          !std::ranges::all_of(dir.substr(prefix.size()), [](char c) {
            return c >= '0' && c <= '9';
          })) {
        continue;
      }
      std::error_code hb_ec;
      auto hb = std::filesystem::last_write_time(
          entry.path() / "heartbeat.json", hb_ec);
      if (!hb_ec) {
        last = std::max(last, std::chrono::clock_cast<Clock>(hb));
      }
    }
  }
  return last;
}

auto MergeController::cleanup(std::chrono::seconds max_age, bool dry_run)
    -> Result<CleanupReport> {
  auto branches = list_worker_branches();
  if (!branches) {
    return std::unexpected(branches.error());
  }

  CleanupReport report;
  report.dry_run = dry_run;
  auto now = Clock::now();
  std::unordered_set<std::string> kept;

  for (const auto& b : *branches) {
    auto task = TaskId{b.name.substr(
        std::min(options_.branch_prefix.size(), b.name.size()))};
    if (now - last_activity(b) <= max_age) {
      kept.insert(task.str());
      continue;
    }
    auto wt = worktree_path(task);
    std::error_code ec;
    bool has_wt = std::filesystem::exists(wt, ec);
    if (!dry_run) {
      if (has_wt) {
        if (auto r = repo_.worktree_remove(wt); !r) {
          log::warn("Failed to remove worktree {}: {}", wt.string(),
                    r.error().message());
        }
      }
      if (auto r = repo_.delete_branch(b.name); !r) {
        log::warn("Failed to delete branch {}: {}", b.name,
                  r.error().message());
        continue;
      }
      log::info("Removed abandoned worker branch {}", b.name);
    }
    report.branches.push_back(b.name);
    if (has_wt) {
      report.worktrees.push_back(wt);
    }
  }

  // Worktree directories whose branch is already gone.
  auto root = options_.state_dir / "worktrees";
  std::error_code ec;
  std::vector<std::filesystem::path> orphans;
  if (std::filesystem::is_directory(root, ec)) {
    for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
      auto name = entry.path().filename().string();
      if (kept.contains(name) ||
          std::ranges::find(report.worktrees, entry.path()) !=
              report.worktrees.end() ||
          repo_.branch_exists(branch_name(TaskId{name}))) {
        continue;
      }
      auto mtime = std::filesystem::last_write_time(entry.path(), ec);
      if (!ec && now - std::chrono::clock_cast<Clock>(mtime) > max_age) {
        orphans.push_back(entry.path());
      }
    }
  }
  for (auto& path : orphans) {
    if (!dry_run) {
      if (auto r = repo_.worktree_remove(path); !r) {
        log::warn("Failed to remove orphan worktree {}", path.string());
        continue;
      }
    }
    report.worktrees.push_back(std::move(path));
  }

  if (!dry_run) {
    if (auto r = repo_.worktree_prune(); !r) {
      log::debug("worktree prune failed: {}", r.error().message());
    }
  }
  return report;
}

auto MergeController::cleanup_merged(std::string_view base, bool dry_run)
    -> Result<CleanupReport> {
  auto branches = list_worker_branches();
  if (!branches) {
    return std::unexpected(branches.error());
  }
  CleanupReport report;
  report.dry_run = dry_run;
  for (const auto& b : *branches) {
    auto merged = repo_.is_ancestor(b.commit, base);
    if (!merged || !*merged) {
      continue;
    }
    auto task = TaskId{b.name.substr(
        std::min(options_.branch_prefix.size(), b.name.size()))};
    auto wt = worktree_path(task);
    std::error_code ec;
    bool has_wt = std::filesystem::exists(wt, ec);
    if (!dry_run) {
      if (has_wt) {
        if (auto r = repo_.worktree_remove(wt); !r) {
          log::warn("Failed to remove worktree {}", wt.string());
        }
      }
      if (auto r = repo_.delete_branch(b.name); !r) {
        log::warn("Failed to delete merged branch {}", b.name);
        continue;
      }
    }
    report.branches.push_back(b.name);
    if (has_wt) {
      report.worktrees.push_back(wt);
    }
  }
  return report;
}

auto MergeController::list_worker_branches() const
    -> Result<std::vector<BranchInfo>> {
  return repo_.list_branches(options_.branch_prefix);
}

auto MergeController::lock_status() const -> std::vector<LockStatus> {
  std::vector<LockStatus> result;
  auto dir = options_.state_dir / "locks";
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    return result;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (entry.path().extension() != ".lock") {
      continue;
    }
    LockStatus status;
    status.path = entry.path();
    status.locked = FileLock::is_locked(entry.path());
    if (status.locked) {
      status.holder = FileLock::holder_pid(entry.path());
    }
    result.push_back(std::move(status));
  }
  std::ranges::sort(result, {}, &LockStatus::path);
  return result;
}

}  // namespace storyloop
