#include "storyloop/merge/git_repository.hpp"

#include "storyloop/util/log.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <sstream>

namespace storyloop {

namespace {

auto trim(std::string_view s) -> std::string {
  auto first = s.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = s.find_last_not_of(" \t\r\n");
  return std::string(s.substr(first, last - first + 1));
}

auto split_lines(std::string_view s) -> std::vector<std::string> {
  std::vector<std::string> lines;
  std::istringstream in{std::string(s)};
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      lines.push_back(std::move(line));
    }
  }
  return lines;
}

auto git_argv(const std::vector<std::string>& args) -> std::vector<std::string> {
  std::vector<std::string> argv;
  argv.reserve(args.size() + 1);
  argv.emplace_back("git");
  argv.insert(argv.end(), args.begin(), args.end());
  return argv;
}

auto join(const std::vector<std::string>& args) -> std::string {
  std::string out;
  for (const auto& a : args) {
    if (!out.empty()) {
      out += ' ';
    }
    out += a;
  }
  return out;
}

}  // namespace

GitRepository::GitRepository(std::filesystem::path root,
                             std::chrono::milliseconds timeout)
    : root_(std::move(root)), timeout_(timeout) {
}

auto GitRepository::discover(const std::filesystem::path& path)
    -> Result<GitRepository> {
  CommandOptions opts;
  opts.working_dir = path;
  opts.timeout = std::chrono::seconds(30);
  auto out = run_command({"git", "rev-parse", "--show-toplevel"}, opts);
  if (!out) {
    return std::unexpected(out.error());
  }
  if (!out->success()) {
    log::error("Not a git repository: {}", path.string());
    return fail(Error::GitCommandFailed);
  }
  return GitRepository{trim(out->stdout_output)};
}

auto GitRepository::run(const std::vector<std::string>& args,
                        const std::filesystem::path& cwd) const
    -> Result<CommandOutput> {
  CommandOptions opts;
  opts.working_dir = cwd.empty() ? root_ : cwd;
  opts.timeout = timeout_;
  log::trace("git {}", join(args));
  return run_command(git_argv(args), opts);
}

auto GitRepository::checked(const std::vector<std::string>& args,
                            const std::filesystem::path& cwd) const
    -> Result<std::string> {
  auto out = run(args, cwd);
  if (!out) {
    return std::unexpected(out.error());
  }
  if (!out->success()) {
    log::debug("git {} failed ({}): {}", join(args), out->exit_code,
               trim(out->stderr_output));
    return fail(out->timed_out ? Error::Timeout : Error::GitCommandFailed);
  }
  return trim(out->stdout_output);
}

auto GitRepository::rev_parse(std::string_view ref) const
    -> Result<std::string> {
  return checked({"rev-parse", "--verify", "--quiet",
                  std::string(ref) + "^{commit}"});
}

auto GitRepository::branch_exists(std::string_view branch) const -> bool {
  auto out = run({"show-ref", "--verify", "--quiet",
                  "refs/heads/" + std::string(branch)});
  return out && out->success();
}

auto GitRepository::current_branch(const std::filesystem::path& cwd) const
    -> Result<std::string> {
  auto out = checked({"symbolic-ref", "--quiet", "--short", "HEAD"}, cwd);
  if (!out) {
    return fail(Error::NotFound);
  }
  return out;
}

auto GitRepository::worktree_add(const std::filesystem::path& path,
                                 std::string_view branch,
                                 std::string_view start_point) const
    -> Result<void> {
  auto out = checked({"worktree", "add", "-b", std::string(branch),
                      path.string(), std::string(start_point)});
  if (!out) {
    return std::unexpected(out.error());
  }
  return ok();
}

auto GitRepository::worktree_attach(const std::filesystem::path& path,
                                    std::string_view branch) const
    -> Result<void> {
  auto out = checked({"worktree", "add", path.string(), std::string(branch)});
  if (!out) {
    return std::unexpected(out.error());
  }
  return ok();
}

auto GitRepository::worktree_remove(const std::filesystem::path& path) const
    -> Result<void> {
  auto out = checked({"worktree", "remove", "--force", path.string()});
  if (!out) {
    // Fall back to deleting the directory and pruning the stale entry.
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
      log::warn("Failed to remove worktree {}: {}", path.string(),
                ec.message());
      return fail(Error::GitCommandFailed);
    }
    return worktree_prune();
  }
  return ok();
}

auto GitRepository::worktree_prune() const -> Result<void> {
  auto out = checked({"worktree", "prune"});
  if (!out) {
    return std::unexpected(out.error());
  }
  return ok();
}

auto GitRepository::worktrees() const -> Result<std::vector<WorktreeInfo>> {
  auto out = checked({"worktree", "list", "--porcelain"});
  if (!out) {
    return std::unexpected(out.error());
  }
  std::vector<WorktreeInfo> result;
  for (const auto& line : split_lines(*out)) {
    if (line.starts_with("worktree ")) {
      result.push_back(WorktreeInfo{line.substr(9), {}, std::nullopt});
    } else if (result.empty()) {
      continue;
    } else if (line.starts_with("HEAD ")) {
      result.back().commit = line.substr(5);
    } else if (line.starts_with("branch ")) {
      auto ref = std::string_view(line).substr(7);
      if (ref.starts_with("refs/heads/")) {
        ref.remove_prefix(11);
      }
      result.back().branch = std::string(ref);
    }
  }
  return result;
}

auto GitRepository::delete_branch(std::string_view branch, bool force) const
    -> Result<void> {
  auto out = checked({"branch", force ? "-D" : "-d", std::string(branch)});
  if (!out) {
    return std::unexpected(out.error());
  }
  return ok();
}

auto GitRepository::list_branches(std::string_view prefix) const
    -> Result<std::vector<BranchInfo>> {
  auto out = checked({"for-each-ref",
                      "--format=%(refname:short)%09%(objectname)%09%(committerdate:unix)",
                      "refs/heads/" + std::string(prefix)});
  if (!out) {
    return std::unexpected(out.error());
  }
  std::vector<BranchInfo> result;
  for (const auto& line : split_lines(*out)) {
    std::vector<std::string> fields;
    std::size_t start = 0;
    for (auto tab = line.find('\t'); tab != std::string::npos;
         tab = line.find('\t', start)) {
      fields.push_back(line.substr(start, tab - start));
      start = tab + 1;
    }
    fields.push_back(line.substr(start));
    if (fields.size() != 3) {
      continue;
    }
    std::int64_t secs = 0;
    std::from_chars(fields[2].data(), fields[2].data() + fields[2].size(),
                    secs);
    result.push_back(BranchInfo{std::move(fields[0]), std::move(fields[1]),
                                TimePoint{std::chrono::seconds(secs)}});
  }
  return result;
}

auto GitRepository::changed_files(std::string_view base,
                                  std::string_view branch) const
    -> Result<std::vector<std::string>> {
  auto out = checked({"diff", "--name-only",
                      std::string(base) + "..." + std::string(branch)});
  if (!out) {
    return std::unexpected(out.error());
  }
  return split_lines(*out);
}

auto GitRepository::is_ancestor(std::string_view ancestor,
                                std::string_view descendant) const
    -> Result<bool> {
  auto out = run({"merge-base", "--is-ancestor", std::string(ancestor),
                  std::string(descendant)});
  if (!out) {
    return std::unexpected(out.error());
  }
  switch (out->exit_code) {
    case 0: return true;
    case 1: return false;
    default: return fail(Error::GitCommandFailed);
  }
}

auto GitRepository::rebase(const std::filesystem::path& worktree,
                           std::string_view onto) const -> Result<void> {
  auto out = run({"rebase", std::string(onto)}, worktree);
  if (!out) {
    return std::unexpected(out.error());
  }
  if (out->success()) {
    return ok();
  }
  log::warn("Rebase onto {} failed in {}: {}", onto, worktree.string(),
            trim(out->stderr_output));
  if (auto abort = run({"rebase", "--abort"}, worktree);
      !abort || !abort->success()) {
    log::warn("rebase --abort failed in {}", worktree.string());
  }
  return fail(Error::RebaseConflict);
}

auto GitRepository::merge_ff_only(std::string_view branch,
                                  const std::filesystem::path& cwd) const
    -> Result<void> {
  auto out = checked({"merge", "--ff-only", std::string(branch)}, cwd);
  if (!out) {
    return fail(Error::MergeFailed);
  }
  return ok();
}

auto GitRepository::update_branch(std::string_view branch,
                                  std::string_view new_commit,
                                  std::string_view old_commit) const
    -> Result<void> {
  auto out = checked({"update-ref", "refs/heads/" + std::string(branch),
                      std::string(new_commit), std::string(old_commit)});
  if (!out) {
    return fail(Error::MergeFailed);
  }
  return ok();
}

auto GitRepository::checkout_location(std::string_view branch) const
    -> std::optional<std::filesystem::path> {
  auto list = worktrees();
  if (!list) {
    return std::nullopt;
  }
  auto it = std::ranges::find_if(*list, [&](const WorktreeInfo& w) {
    return w.branch && *w.branch == branch;
  });
  if (it == list->end()) {
    return std::nullopt;
  }
  return it->path;
}

}  // namespace storyloop
