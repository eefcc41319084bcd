#include "storyloop/merge/file_lock.hpp"

#include "storyloop/util/fs.hpp"
#include "storyloop/util/log.hpp"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <format>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace storyloop {

namespace {

// A holder may unlink the file between our open() and flock(); the lock is
// only valid if the path still names the locked inode.
auto same_inode(int fd, const std::filesystem::path& path) -> bool {
  struct stat fd_st{};
  struct stat path_st{};
  if (::fstat(fd, &fd_st) != 0 || ::stat(path.c_str(), &path_st) != 0) {
    return false;
  }
  return fd_st.st_dev == path_st.st_dev && fd_st.st_ino == path_st.st_ino;
}

}  // namespace

auto FileLock::acquire(std::filesystem::path path,
                       std::chrono::milliseconds timeout) -> Result<FileLock> {
  if (path.has_parent_path()) {
    if (auto r = ensure_directory(path.parent_path()); !r) {
      return std::unexpected(r.error());
    }
  }

  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
      log::error("Failed to open lock file {}: {}", path.string(),
                 std::strerror(errno));
      return fail(Error::FileOpenFailed);
    }

    if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
      if (same_inode(fd, path)) {
        auto pid = std::format("{}", ::getpid());
        if (::ftruncate(fd, 0) != 0 ||
            ::pwrite(fd, pid.data(), pid.size(), 0) < 0) {
          log::debug("Could not record pid in {}", path.string());
        }
        log::debug("Acquired lock {}", path.string());
        return FileLock{std::move(path), fd};
      }
      ::flock(fd, LOCK_UN);
      ::close(fd);
      continue;
    }

    int err = errno;
    ::close(fd);
    if (err != EWOULDBLOCK) {
      log::error("flock({}) failed: {}", path.string(), std::strerror(err));
      return fail(Error::FileOpenFailed);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      log::warn("Timed out waiting for lock {}", path.string());
      return fail(Error::LockTimeout);
    }
    std::this_thread::sleep_for(kPollInterval);
  }
}

auto FileLock::is_locked(const std::filesystem::path& path) -> bool {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  bool locked = false;
  if (::flock(fd, LOCK_SH | LOCK_NB) == 0) {
    ::flock(fd, LOCK_UN);
  } else {
    locked = errno == EWOULDBLOCK;
  }
  ::close(fd);
  return locked;
}

auto FileLock::holder_pid(const std::filesystem::path& path)
    -> std::optional<pid_t> {
  auto content = read_file(path);
  if (!content || content->empty()) {
    return std::nullopt;
  }
  pid_t pid = 0;
  auto [ptr, ec] = std::from_chars(content->data(),
                                   content->data() + content->size(), pid);
  if (ec != std::errc{} || pid <= 0) {
    return std::nullopt;
  }
  return pid;
}

FileLock::~FileLock() {
  release();
}

auto FileLock::release() -> void {
  if (fd_ < 0) {
    return;
  }
  // Unlink before unlocking; waiters re-check the inode after flock.
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  ::flock(fd_, LOCK_UN);
  ::close(fd_);
  fd_ = -1;
  log::debug("Released lock {}", path_.string());
}

}  // namespace storyloop
