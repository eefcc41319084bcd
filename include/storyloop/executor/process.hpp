#pragma once

#include "storyloop/core/error.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace storyloop {

struct CommandOptions {
  std::filesystem::path working_dir;
  // Zero means no limit.
  std::chrono::milliseconds timeout{0};
  // Extra "KEY=VALUE" entries added to the inherited environment.
  std::vector<std::string> env;
};

struct CommandOutput {
  int exit_code{-1};
  std::string stdout_output;
  std::string stderr_output;
  bool timed_out{false};

  [[nodiscard]] auto success() const noexcept -> bool {
    return exit_code == 0 && !timed_out;
  }
};

// Runs argv[0] (looked up in PATH) to completion, capturing both streams.
[[nodiscard]] auto run_command(const std::vector<std::string>& argv,
                               const CommandOptions& opts = {})
    -> Result<CommandOutput>;

// 128 + signal for signalled children, as a shell would report it.
[[nodiscard]] auto exit_code_from_status(int status) noexcept -> int;

// The current environment with `extra` "KEY=VALUE" entries added or
// overriding existing keys.
[[nodiscard]] auto build_environment(const std::vector<std::string>& extra)
    -> std::vector<std::string>;

// kill(pid, 0) probe. std::nullopt when liveness cannot be determined.
[[nodiscard]] auto is_process_running(pid_t pid) noexcept
    -> std::optional<bool>;

}  // namespace storyloop
