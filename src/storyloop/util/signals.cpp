#include "storyloop/util/signals.hpp"

#include <csignal>
#include <system_error>

#include <cerrno>
#include <signal.h>

namespace storyloop {

namespace {

volatile std::sig_atomic_t g_signal = 0;

void on_shutdown_signal(int signo) {
  if (g_signal != 0) {
    std::signal(signo, SIG_DFL);
    std::raise(signo);
    return;
  }
  g_signal = signo;
}

}  // namespace

auto install_shutdown_handlers() -> Result<void> {
  struct sigaction sa{};
  sa.sa_handler = on_shutdown_signal;
  sigemptyset(&sa.sa_mask);
  // Restart interrupted waitpid/read calls; the loop polls the flag anyway.
  sa.sa_flags = SA_RESTART;
  for (int signo : {SIGINT, SIGTERM}) {
    if (::sigaction(signo, &sa, nullptr) != 0) {
      return std::unexpected(std::error_code(errno, std::system_category()));
    }
  }
  return ok();
}

auto shutdown_requested() noexcept -> bool {
  return g_signal != 0;
}

auto shutdown_signal() noexcept -> int {
  return g_signal;
}

auto clear_shutdown_request() noexcept -> void {
  g_signal = 0;
}

}  // namespace storyloop
