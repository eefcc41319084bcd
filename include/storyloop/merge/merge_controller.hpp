#pragma once

#include "storyloop/core/error.hpp"
#include "storyloop/graph/dependency_graph.hpp"
#include "storyloop/merge/git_repository.hpp"
#include "storyloop/util/id.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace storyloop {

struct ConflictInfo {
  TaskId first;
  TaskId second;
  std::vector<std::string> paths;  // overlapping scope entries
  bool dependency{false};          // the pair is joined by a dependency edge

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

// Scope entries of `a` and `b` that overlap: equal paths, a glob in one
// matching an entry of the other, or a directory entry ("src/") prefixing
// an entry of the other.
[[nodiscard]] auto overlapping_paths(const std::vector<std::string>& a,
                                     const std::vector<std::string>& b)
    -> std::vector<std::string>;

struct MergeResult {
  bool success{false};
  TaskId task_id;
  std::string branch;
  std::string base;
  std::string commit;  // new base head on success
  std::error_code error;
  std::string message;
  std::vector<std::string> files_merged;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

struct CleanupReport {
  bool dry_run{false};
  std::vector<std::string> branches;
  std::vector<std::filesystem::path> worktrees;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

struct LockStatus {
  std::filesystem::path path;
  bool locked{false};
  std::optional<pid_t> holder;
};

struct MergeOptions {
  std::filesystem::path state_dir{".storyloop"};
  std::string branch_prefix{"worker/"};
  std::chrono::milliseconds lock_timeout{std::chrono::seconds(30)};
};

enum class LeaseState : std::uint8_t {
  Active,
  Merged,
  Preserved,  // worktree removed, branch kept for manual resolution
  Released,
};

// Exclusive ownership of one worker's branch and worktree. Unless merged or
// preserved, destruction removes both. Must not outlive its MergeController.
class WorkerLease {
public:
  WorkerLease() = default;
  ~WorkerLease();

  WorkerLease(WorkerLease&& other) noexcept
      : repo_(std::exchange(other.repo_, nullptr)),
        task_id_(std::move(other.task_id_)),
        branch_(std::move(other.branch_)),
        worktree_(std::move(other.worktree_)),
        base_(std::move(other.base_)),
        base_commit_(std::move(other.base_commit_)),
        state_(std::exchange(other.state_, LeaseState::Released)) {
  }
  WorkerLease& operator=(WorkerLease&& other) noexcept {
    if (this != &other) {
      release();
      repo_ = std::exchange(other.repo_, nullptr);
      task_id_ = std::move(other.task_id_);
      branch_ = std::move(other.branch_);
      worktree_ = std::move(other.worktree_);
      base_ = std::move(other.base_);
      base_commit_ = std::move(other.base_commit_);
      state_ = std::exchange(other.state_, LeaseState::Released);
    }
    return *this;
  }
  WorkerLease(const WorkerLease&) = delete;
  WorkerLease& operator=(const WorkerLease&) = delete;

  // Removes the worktree and deletes the branch.
  auto release() -> void;
  // Removes the worktree and keeps the branch.
  auto preserve() -> void;

  [[nodiscard]] auto active() const noexcept -> bool {
    return repo_ != nullptr && state_ == LeaseState::Active;
  }
  [[nodiscard]] auto state() const noexcept -> LeaseState {
    return state_;
  }
  [[nodiscard]] auto task_id() const noexcept -> const TaskId& {
    return task_id_;
  }
  [[nodiscard]] auto branch() const noexcept -> const std::string& {
    return branch_;
  }
  [[nodiscard]] auto worktree() const noexcept
      -> const std::filesystem::path& {
    return worktree_;
  }
  [[nodiscard]] auto base() const noexcept -> const std::string& {
    return base_;
  }
  [[nodiscard]] auto base_commit() const noexcept -> const std::string& {
    return base_commit_;
  }

private:
  friend class MergeController;

  WorkerLease(const GitRepository* repo, TaskId task, std::string branch,
              std::filesystem::path worktree, std::string base,
              std::string base_commit);

  auto finish(LeaseState state, bool delete_branch) -> void;

  const GitRepository* repo_{nullptr};
  TaskId task_id_;
  std::string branch_;
  std::filesystem::path worktree_;
  std::string base_;
  std::string base_commit_;
  LeaseState state_{LeaseState::Released};
};

// Isolates workers on per-task branches and worktrees, and serializes
// merge-back onto the base branch under an exclusive file lock.
class MergeController {
public:
  MergeController(GitRepository repo, MergeOptions options = {});

  MergeController(const MergeController&) = delete;
  MergeController& operator=(const MergeController&) = delete;

  // Every overlapping pair in `batch`, plus pairs joined by a dependency.
  [[nodiscard]] static auto check_conflicts(const DependencyGraph& graph,
                                            const Batch& batch)
      -> std::vector<ConflictInfo>;

  // Non-conflicting members first as one parallel sub-batch, then each
  // conflicting member alone, dependencies first and then by priority.
  [[nodiscard]] static auto resolve_conflicts(const DependencyGraph& graph,
                                              const Batch& batch)
      -> std::vector<Batch>;

  [[nodiscard]] auto create_worker(const TaskId& task, std::string_view base)
      -> Result<WorkerLease>;
  // Re-attaches to an existing worker branch, e.g. one preserved after a
  // failed merge.
  [[nodiscard]] auto adopt_worker(const TaskId& task, std::string_view base)
      -> Result<WorkerLease>;

  [[nodiscard]] auto merge_back(WorkerLease& lease) -> MergeResult;
  [[nodiscard]] auto merge_back(const TaskId& task, std::string_view base)
      -> MergeResult;

  // Removes worker branches and worktrees idle for longer than `max_age`.
  [[nodiscard]] auto cleanup(std::chrono::seconds max_age, bool dry_run = false)
      -> Result<CleanupReport>;
  // Removes worker branches already contained in `base`.
  [[nodiscard]] auto cleanup_merged(std::string_view base, bool dry_run = false)
      -> Result<CleanupReport>;

  [[nodiscard]] auto list_worker_branches() const
      -> Result<std::vector<BranchInfo>>;
  [[nodiscard]] auto lock_status() const -> std::vector<LockStatus>;

  [[nodiscard]] auto branch_name(const TaskId& task) const -> std::string;
  [[nodiscard]] auto worktree_path(const TaskId& task) const
      -> std::filesystem::path;
  [[nodiscard]] auto lock_path(std::string_view base) const
      -> std::filesystem::path;

  [[nodiscard]] auto repository() const noexcept -> const GitRepository& {
    return repo_;
  }

private:
  auto reclaim(const TaskId& task) -> void;
  [[nodiscard]] auto last_activity(const BranchInfo& branch) const -> TimePoint;

  GitRepository repo_;
  MergeOptions options_;
};

}  // namespace storyloop
