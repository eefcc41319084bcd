#pragma once

#include "storyloop/core/error.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <utility>

#include <sys/types.h>

namespace storyloop {

// Exclusive advisory lock on a file under the state directory. The holder's
// pid is written into the file; the file is unlinked on release.
class FileLock {
public:
  static constexpr std::chrono::milliseconds kPollInterval{100};

  // Polls LOCK_EX|LOCK_NB until acquired or `timeout` elapses (LockTimeout).
  [[nodiscard]] static auto acquire(std::filesystem::path path,
                                    std::chrono::milliseconds timeout)
      -> Result<FileLock>;

  // True when another descriptor currently holds the lock.
  [[nodiscard]] static auto is_locked(const std::filesystem::path& path)
      -> bool;
  // Pid recorded by the current holder, if readable.
  [[nodiscard]] static auto holder_pid(const std::filesystem::path& path)
      -> std::optional<pid_t>;

  FileLock() = default;
  ~FileLock();

  FileLock(FileLock&& other) noexcept
      : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)) {
  }
  FileLock& operator=(FileLock&& other) noexcept {
    if (this != &other) {
      release();
      path_ = std::move(other.path_);
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }
  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  auto release() -> void;

  [[nodiscard]] auto held() const noexcept -> bool {
    return fd_ >= 0;
  }
  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& {
    return path_;
  }

private:
  FileLock(std::filesystem::path path, int fd) noexcept
      : path_(std::move(path)), fd_(fd) {
  }

  std::filesystem::path path_;
  int fd_{-1};
};

}  // namespace storyloop
