#include "storyloop/executor/process.hpp"

#include "storyloop/util/log.hpp"

#include <sys/wait.h>

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>

extern char** environ;

namespace storyloop {

namespace {

inline constexpr std::size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;
inline constexpr std::size_t READ_BUFFER_SIZE = 4096;

struct Pipe {
  int read_fd{-1};
  int write_fd{-1};

  ~Pipe() {
    close_read();
    close_write();
  }

  auto open() -> bool {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) < 0) {
      return false;
    }
    read_fd = fds[0];
    write_fd = fds[1];
    return true;
  }

  auto close_read() -> void {
    if (read_fd >= 0) {
      ::close(read_fd);
      read_fd = -1;
    }
  }

  auto close_write() -> void {
    if (write_fd >= 0) {
      ::close(write_fd);
      write_fd = -1;
    }
  }
};

auto drain(int& fd, std::string& out) -> void {
  std::array<char, READ_BUFFER_SIZE> buffer;
  ssize_t n = ::read(fd, buffer.data(), buffer.size());
  if (n > 0) {
    if (out.size() < MAX_OUTPUT_SIZE) {
      out.append(buffer.data(), static_cast<std::size_t>(n));
    }
    return;
  }
  if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
    return;
  }
  ::close(fd);
  fd = -1;
}

}  // namespace

auto build_environment(const std::vector<std::string>& extra)
    -> std::vector<std::string> {
  std::vector<std::string> env;
  for (char** e = environ; e && *e; ++e) {
    std::string_view entry{*e};
    auto eq = entry.find('=');
    bool overridden = false;
    if (eq != std::string_view::npos) {
      auto prefix = entry.substr(0, eq + 1);
      for (const auto& kv : extra) {
        if (std::string_view{kv}.starts_with(prefix)) {
          overridden = true;
          break;
        }
      }
    }
    if (!overridden) {
      env.emplace_back(entry);
    }
  }
  env.insert(env.end(), extra.begin(), extra.end());
  return env;
}

auto exit_code_from_status(int status) noexcept -> int {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

auto is_process_running(pid_t pid) noexcept -> std::optional<bool> {
  if (pid <= 0) {
    return std::nullopt;
  }
  if (::kill(pid, 0) == 0) {
    return true;
  }
  if (errno == ESRCH) {
    return false;
  }
  if (errno == EPERM) {
    return true;
  }
  return std::nullopt;
}

auto run_command(const std::vector<std::string>& argv,
                 const CommandOptions& opts) -> Result<CommandOutput> {
  if (argv.empty()) {
    return fail(Error::InvalidArgument);
  }

  Pipe out_pipe;
  Pipe err_pipe;
  if (!out_pipe.open() || !err_pipe.open()) {
    log::error("pipe2 failed: {}", std::strerror(errno));
    return fail(Error::ProcessSpawnFailed);
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& a : argv) {
    args.push_back(const_cast<char*>(a.c_str()));
  }
  args.push_back(nullptr);

  auto env_storage = build_environment(opts.env);
  std::vector<char*> envp;
  envp.reserve(env_storage.size() + 1);
  for (auto& e : env_storage) {
    envp.push_back(e.data());
  }
  envp.push_back(nullptr);
  std::string working_dir = opts.working_dir.string();

  pid_t pid = ::fork();
  if (pid < 0) {
    log::error("fork failed: {}", std::strerror(errno));
    return fail(Error::ProcessSpawnFailed);
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(out_pipe.write_fd, STDOUT_FILENO);
    ::dup2(err_pipe.write_fd, STDERR_FILENO);
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
    }
    if (!working_dir.empty() && ::chdir(working_dir.c_str()) < 0) {
      _exit(127);
    }
    ::execvpe(args[0], args.data(), envp.data());
    _exit(127);
  }

  ::setpgid(pid, pid);
  out_pipe.close_write();
  err_pipe.close_write();

  CommandOutput result;
  auto start = std::chrono::steady_clock::now();

  std::array<pollfd, 2> fds{};
  while (out_pipe.read_fd >= 0 || err_pipe.read_fd >= 0) {
    int wait_ms = -1;
    if (opts.timeout.count() > 0) {
      auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - start);
      auto remaining = opts.timeout - elapsed;
      if (remaining.count() <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(remaining.count());
    }

    fds[0] = {out_pipe.read_fd, POLLIN, 0};
    fds[1] = {err_pipe.read_fd, POLLIN, 0};
    int rc = ::poll(fds.data(), fds.size(), wait_ms);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      log::warn("poll failed: {}", std::strerror(errno));
      break;
    }
    if (rc == 0) {
      continue;
    }
    if (fds[0].revents != 0) {
      drain(out_pipe.read_fd, result.stdout_output);
    }
    if (fds[1].revents != 0) {
      drain(err_pipe.read_fd, result.stderr_output);
    }
  }

  if (result.timed_out) {
    ::kill(-pid, SIGKILL);
  }

  int status = 0;
  pid_t waited;
  do {
    waited = ::waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);

  if (waited < 0) {
    log::warn("waitpid failed for pid {}: {}", pid, std::strerror(errno));
    result.exit_code = -1;
  } else {
    result.exit_code = exit_code_from_status(status);
  }
  return ok(std::move(result));
}

}  // namespace storyloop
