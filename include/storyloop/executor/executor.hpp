#pragma once

#include "storyloop/core/error.hpp"
#include "storyloop/util/id.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace storyloop {

// Exit status reported by `timeout(1)` and used for our own kills on timeout.
inline constexpr int kTimeoutExitCode = 124;
// 128 + SIGKILL, the usual signature of the OOM killer.
inline constexpr int kKilledExitCode = 137;

struct LaunchSpec {
  WorkerId worker_id;
  TaskId task_id;
  std::string command;  // run through /bin/sh -c
  std::filesystem::path working_dir;
  std::filesystem::path log_file;  // receives stdout and stderr
  std::vector<std::string> env;    // "KEY=VALUE"
};

// Handle to one running agent process (its own process group).
class WorkerProcess {
public:
  virtual ~WorkerProcess() = default;

  [[nodiscard]] virtual auto pid() const noexcept -> pid_t = 0;

  // Non-blocking. Exit code once the process has been reaped.
  [[nodiscard]] virtual auto poll() -> std::optional<int> = 0;

  // SIGKILL to the whole group, then reap. Returns the exit code.
  virtual auto kill() -> int = 0;

  [[nodiscard]] virtual auto started_at() const noexcept
      -> std::chrono::steady_clock::time_point = 0;
};

class IExecutor {
public:
  virtual ~IExecutor() = default;

  [[nodiscard]] virtual auto launch(const LaunchSpec& spec)
      -> Result<std::unique_ptr<WorkerProcess>> = 0;
};

[[nodiscard]] auto create_process_executor() -> std::unique_ptr<IExecutor>;

// Quotes `value` as one /bin/sh word. Values made only of shell-safe
// characters come back unchanged.
[[nodiscard]] auto shell_quote(std::string_view value) -> std::string;

// Replaces each "{key}" in `tmpl` with the shell-quoted value, so templates
// must not put their own quotes around placeholders. Unknown placeholders
// are left untouched.
[[nodiscard]] auto expand_command(
    std::string_view tmpl,
    const std::vector<std::pair<std::string, std::string>>& vars)
    -> std::string;

}  // namespace storyloop
