#pragma once

#include "storyloop/core/error.hpp"
#include "storyloop/executor/process.hpp"
#include "storyloop/util/util.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace storyloop {

struct BranchInfo {
  std::string name;
  std::string commit;
  TimePoint committed_at{};
};

struct WorktreeInfo {
  std::filesystem::path path;
  std::string commit;
  std::optional<std::string> branch;  // unset when detached
};

// Thin wrapper over the git CLI rooted at one repository. Every command runs
// through run_command with the repository (or a worktree) as its cwd.
class GitRepository {
public:
  explicit GitRepository(std::filesystem::path root,
                         std::chrono::milliseconds timeout =
                             std::chrono::seconds(120));

  // Resolves the top-level directory of the repository containing `path`.
  [[nodiscard]] static auto discover(const std::filesystem::path& path)
      -> Result<GitRepository>;

  [[nodiscard]] auto root() const noexcept -> const std::filesystem::path& {
    return root_;
  }

  // Raw invocation; a non-zero exit is not an error here.
  [[nodiscard]] auto run(const std::vector<std::string>& args,
                         const std::filesystem::path& cwd = {}) const
      -> Result<CommandOutput>;

  // Invocation that maps a non-zero exit to GitCommandFailed and returns
  // trimmed stdout.
  [[nodiscard]] auto checked(const std::vector<std::string>& args,
                             const std::filesystem::path& cwd = {}) const
      -> Result<std::string>;

  [[nodiscard]] auto rev_parse(std::string_view ref) const
      -> Result<std::string>;
  [[nodiscard]] auto branch_exists(std::string_view branch) const -> bool;
  [[nodiscard]] auto current_branch(const std::filesystem::path& cwd = {}) const
      -> Result<std::string>;

  [[nodiscard]] auto worktree_add(const std::filesystem::path& path,
                                  std::string_view branch,
                                  std::string_view start_point) const
      -> Result<void>;
  // Attaches a worktree to an existing branch.
  [[nodiscard]] auto worktree_attach(const std::filesystem::path& path,
                                     std::string_view branch) const
      -> Result<void>;
  [[nodiscard]] auto worktree_remove(const std::filesystem::path& path) const
      -> Result<void>;
  [[nodiscard]] auto worktree_prune() const -> Result<void>;
  [[nodiscard]] auto worktrees() const -> Result<std::vector<WorktreeInfo>>;

  [[nodiscard]] auto delete_branch(std::string_view branch,
                                   bool force = true) const -> Result<void>;
  [[nodiscard]] auto list_branches(std::string_view prefix) const
      -> Result<std::vector<BranchInfo>>;

  // Files touched by `branch` since its merge base with `base`.
  [[nodiscard]] auto changed_files(std::string_view base,
                                   std::string_view branch) const
      -> Result<std::vector<std::string>>;
  [[nodiscard]] auto is_ancestor(std::string_view ancestor,
                                 std::string_view descendant) const
      -> Result<bool>;

  // Rebases the branch checked out in `worktree` onto `onto`. On conflict the
  // rebase is aborted and RebaseConflict returned.
  [[nodiscard]] auto rebase(const std::filesystem::path& worktree,
                            std::string_view onto) const -> Result<void>;
  [[nodiscard]] auto merge_ff_only(std::string_view branch,
                                   const std::filesystem::path& cwd = {}) const
      -> Result<void>;
  // Compare-and-swap update of refs/heads/<branch>.
  [[nodiscard]] auto update_branch(std::string_view branch,
                                   std::string_view new_commit,
                                   std::string_view old_commit) const
      -> Result<void>;

  // Worktree path that has `branch` checked out, if any.
  [[nodiscard]] auto checkout_location(std::string_view branch) const
      -> std::optional<std::filesystem::path>;

private:
  std::filesystem::path root_;
  std::chrono::milliseconds timeout_;
};

}  // namespace storyloop
