#include "storyloop/executor/executor.hpp"
#include "storyloop/executor/process.hpp"
#include "storyloop/util/fs.hpp"
#include "storyloop/util/log.hpp"

#include <sys/wait.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

namespace storyloop {

namespace {

class ChildProcess final : public WorkerProcess {
public:
  ChildProcess(WorkerId worker_id, pid_t pid)
      : worker_id_(std::move(worker_id)),
        pid_(pid),
        started_at_(std::chrono::steady_clock::now()) {
  }

  ~ChildProcess() override {
    if (!exit_code_) {
      log::warn("Worker {} (pid {}) still running at release, killing",
                worker_id_, pid_);
      (void)kill();
    }
  }

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  [[nodiscard]] auto pid() const noexcept -> pid_t override {
    return pid_;
  }

  [[nodiscard]] auto poll() -> std::optional<int> override {
    if (exit_code_) {
      return exit_code_;
    }
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
      exit_code_ = exit_code_from_status(status);
    } else if (r < 0 && errno != EINTR) {
      log::warn("waitpid failed for worker {} (pid {}): {}", worker_id_, pid_,
                std::strerror(errno));
      exit_code_ = -1;
    }
    return exit_code_;
  }

  auto kill() -> int override {
    if (exit_code_) {
      return *exit_code_;
    }
    ::kill(-pid_, SIGKILL);
    int status = 0;
    pid_t r;
    do {
      r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    exit_code_ = r == pid_ ? exit_code_from_status(status) : -1;
    return *exit_code_;
  }

  [[nodiscard]] auto started_at() const noexcept
      -> std::chrono::steady_clock::time_point override {
    return started_at_;
  }

private:
  WorkerId worker_id_;
  pid_t pid_;
  std::chrono::steady_clock::time_point started_at_;
  std::optional<int> exit_code_;
};

class ProcessExecutor final : public IExecutor {
public:
  [[nodiscard]] auto launch(const LaunchSpec& spec)
      -> Result<std::unique_ptr<WorkerProcess>> override {
    if (!spec.log_file.empty()) {
      if (auto r = ensure_directory(spec.log_file.parent_path()); !r) {
        return std::unexpected(r.error());
      }
    }

    int log_fd = -1;
    if (!spec.log_file.empty()) {
      log_fd = ::open(spec.log_file.c_str(),
                      O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
      if (log_fd < 0) {
        log::error("Cannot open worker log {}: {}", spec.log_file.string(),
                   std::strerror(errno));
        return fail(Error::FileOpenFailed);
      }
    }

    auto env_storage = build_environment(spec.env);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& s : env_storage) {
      envp.push_back(s.data());
    }
    envp.push_back(nullptr);

    std::string cmd = spec.command;
    std::string working_dir = spec.working_dir.string();
    char sh[] = "sh";
    char dash_c[] = "-c";
    char* argv[] = {sh, dash_c, cmd.data(), nullptr};

    pid_t pid = ::fork();
    if (pid < 0) {
      if (log_fd >= 0) {
        ::close(log_fd);
      }
      log::error("fork failed for worker {}: {}", spec.worker_id,
                 std::strerror(errno));
      return fail(Error::ProcessSpawnFailed);
    }

    if (pid == 0) {
      ::setpgid(0, 0);
      int devnull = ::open("/dev/null", O_RDWR);
      if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
      }
      int out_fd = log_fd >= 0 ? log_fd : devnull;
      if (out_fd >= 0) {
        ::dup2(out_fd, STDOUT_FILENO);
        ::dup2(out_fd, STDERR_FILENO);
      }
      if (!working_dir.empty() && ::chdir(working_dir.c_str()) < 0) {
        _exit(127);
      }
      ::execve("/bin/sh", argv, envp.data());
      _exit(127);
    }

    ::setpgid(pid, pid);
    if (log_fd >= 0) {
      ::close(log_fd);
    }

    log::debug("Launched worker {} for task {} (pid {})", spec.worker_id,
               spec.task_id, pid);
    return std::make_unique<ChildProcess>(spec.worker_id, pid);
  }
};

}  // namespace

auto create_process_executor() -> std::unique_ptr<IExecutor> {
  return std::make_unique<ProcessExecutor>();
}

auto shell_quote(std::string_view value) -> std::string {
  auto safe = [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           std::string_view{"-_./:=@,+%"}.find(c) != std::string_view::npos;
  };
  if (!value.empty() && std::ranges::all_of(value, safe)) {
    return std::string(value);
  }
  std::string out = "'";
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

auto expand_command(
    std::string_view tmpl,
    const std::vector<std::pair<std::string, std::string>>& vars)
    -> std::string {
  std::string out;
  out.reserve(tmpl.size());
  std::size_t i = 0;
  while (i < tmpl.size()) {
    if (tmpl[i] == '{') {
      auto close = tmpl.find('}', i + 1);
      if (close != std::string_view::npos) {
        auto key = tmpl.substr(i + 1, close - i - 1);
        bool replaced = false;
        for (const auto& [name, value] : vars) {
          if (name == key) {
            out += shell_quote(value);
            replaced = true;
            break;
          }
        }
        if (replaced) {
          i = close + 1;
          continue;
        }
      }
    }
    out.push_back(tmpl[i]);
    ++i;
  }
  return out;
}

}  // namespace storyloop
