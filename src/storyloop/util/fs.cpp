#include "storyloop/util/fs.hpp"

#include "storyloop/util/log.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace storyloop {

namespace {

auto write_all(int fd, std::string_view data) -> bool {
  while (!data.empty()) {
    ssize_t n = ::write(fd, data.data(), data.size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data.remove_prefix(static_cast<std::size_t>(n));
  }
  return true;
}

}  // namespace

auto ensure_directory(const std::filesystem::path& dir) -> Result<void> {
  if (dir.empty()) {
    return ok();
  }
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    log::error("Failed to create directory {}: {}", dir.string(), ec.message());
    return fail(Error::FileWriteFailed);
  }
  return ok();
}

auto write_file_atomic(const std::filesystem::path& path,
                       std::string_view content) -> Result<void> {
  if (auto r = ensure_directory(path.parent_path()); !r) {
    return r;
  }

  auto tmp = path;
  tmp += std::format(".tmp.{}", ::getpid());

  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    log::error("Failed to open {}: {}", tmp.string(), std::strerror(errno));
    return fail(Error::FileOpenFailed);
  }

  bool written = write_all(fd, content) && ::fsync(fd) == 0;
  ::close(fd);
  if (!written) {
    log::error("Failed to write {}: {}", tmp.string(), std::strerror(errno));
    ::unlink(tmp.c_str());
    return fail(Error::FileWriteFailed);
  }

  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    log::error("Failed to rename {} -> {}: {}", tmp.string(), path.string(),
               std::strerror(errno));
    ::unlink(tmp.c_str());
    return fail(Error::FileWriteFailed);
  }
  return ok();
}

auto append_line(const std::filesystem::path& path, std::string_view line)
    -> Result<void> {
  if (auto r = ensure_directory(path.parent_path()); !r) {
    return r;
  }

  std::string record{line};
  if (record.empty() || record.back() != '\n') {
    record.push_back('\n');
  }

  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                  0644);
  if (fd < 0) {
    log::error("Failed to open {}: {}", path.string(), std::strerror(errno));
    return fail(Error::FileOpenFailed);
  }
  bool written = write_all(fd, record);
  ::close(fd);
  if (!written) {
    log::error("Failed to append to {}: {}", path.string(),
               std::strerror(errno));
    return fail(Error::FileWriteFailed);
  }
  return ok();
}

auto read_file(const std::filesystem::path& path) -> Result<std::string> {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      return fail(Error::FileNotFound);
    }
    return fail(Error::FileOpenFailed);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ok(buffer.str());
}

auto read_lines(const std::filesystem::path& path)
    -> Result<std::vector<std::string>> {
  std::vector<std::string> lines;
  std::ifstream file(path);
  if (!file.is_open()) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      return ok(std::move(lines));
    }
    return fail(Error::FileOpenFailed);
  }
  std::string line;
  while (std::getline(file, line)) {
    if (!line.empty()) {
      lines.push_back(std::move(line));
    }
  }
  return ok(std::move(lines));
}

}  // namespace storyloop
