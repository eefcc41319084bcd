#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <format>
#include <iterator>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

namespace storyloop::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error, Off };

namespace detail {

struct LevelInfo {
  std::string_view name;
  std::string_view tag;    // fixed width, used in the line prefix
  std::string_view color;
};

inline constexpr LevelInfo kLevels[] = {
    {"trace", "TRACE", "\033[90m"}, {"debug", "DEBUG", "\033[36m"},
    {"info", "INFO ", ""},          {"warn", "WARN ", "\033[33m"},
    {"error", "ERROR", "\033[31m"}, {"off", "OFF  ", ""},
};

[[nodiscard]] constexpr auto info_of(Level level) noexcept -> const LevelInfo& {
  return kLevels[static_cast<std::uint8_t>(level)];
}

}  // namespace detail

// Unknown names map to Info so a typo in the config never silences logging.
[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "warning") return Level::Warn;
  for (std::uint8_t i = 0; i < std::size(detail::kLevels); ++i) {
    if (detail::kLevels[i].name == name) return static_cast<Level>(i);
  }
  return Level::Info;
}

// Lines go to stderr (stdout is reserved for command output) and, when
// configured, are appended to a log file. Between start() and stop() a
// background thread does the writing; otherwise callers write inline.
// A full backlog makes the producer write inline rather than drop lines.
class Logger {
public:
  Logger() = default;
  ~Logger() {
    stop();
    if (file_) std::fclose(file_);
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    std::lock_guard lock(queue_mu_);
    if (writer_.joinable()) return;
    stopping_ = false;
    writer_ = std::thread([this] { drain_loop(); });
  }

  auto stop() -> void {
    {
      std::lock_guard lock(queue_mu_);
      if (!writer_.joinable()) return;
      stopping_ = true;
    }
    ready_.notify_one();
    writer_.join();
  }

  [[nodiscard]] auto set_file(const std::string& path) -> bool {
    std::lock_guard lock(sink_mu_);
    if (file_) {
      std::fclose(file_);
      file_ = nullptr;
    }
    if (path.empty()) return true;
    file_ = std::fopen(path.c_str(), "a");
    return file_ != nullptr;
  }

  auto set_level(Level level) noexcept -> void {
    threshold_.store(level, std::memory_order_relaxed);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return threshold_.load(std::memory_order_relaxed);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < threshold_.load(std::memory_order_relaxed)) return;

    Line line{level, {}};
    auto out = std::back_inserter(line.text);
    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    std::format_to(out, "{:%FT%T}Z {} ", now, detail::info_of(level).tag);
    std::format_to(out, fmt, std::forward<Args>(args)...);
    line.text.push_back('\n');

    {
      std::unique_lock lock(queue_mu_);
      if (writer_.joinable() && !stopping_ && backlog_.size() < kMaxBacklog) {
        backlog_.push_back(std::move(line));
        lock.unlock();
        ready_.notify_one();
        return;
      }
    }
    emit(line);
  }

private:
  static constexpr std::size_t kMaxBacklog = 4096;

  struct Line {
    Level level;
    std::string text;
  };

  auto emit(const Line& line) -> void {
    std::lock_guard lock(sink_mu_);
    auto color = detail::info_of(line.level).color;
    if (color_ && !color.empty()) {
      std::fprintf(stderr, "%.*s%s\033[0m", static_cast<int>(color.size()),
                   color.data(), line.text.c_str());
    } else {
      std::fputs(line.text.c_str(), stderr);
    }
    if (file_) {
      std::fputs(line.text.c_str(), file_);
      std::fflush(file_);
    }
  }

  auto drain_loop() -> void {
    std::vector<Line> batch;
    for (;;) {
      {
        std::unique_lock lock(queue_mu_);
        ready_.wait(lock, [this] { return stopping_ || !backlog_.empty(); });
        if (backlog_.empty()) return;  // stopping with nothing left
        batch.assign(std::make_move_iterator(backlog_.begin()),
                     std::make_move_iterator(backlog_.end()));
        backlog_.clear();
      }
      for (const auto& line : batch) emit(line);
      batch.clear();
    }
  }

  std::atomic<Level> threshold_{Level::Info};

  std::mutex queue_mu_;
  std::condition_variable ready_;
  std::deque<Line> backlog_;
  bool stopping_{false};
  std::thread writer_;

  std::mutex sink_mu_;
  std::FILE* file_{nullptr};
  bool color_{::isatty(STDERR_FILENO) != 0};
};

inline auto logger() -> Logger& {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

[[nodiscard]] inline auto set_file(const std::string& path) -> bool {
  return logger().set_file(path);
}

inline auto start() -> void { logger().start(); }
inline auto stop() -> void { logger().stop(); }

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace storyloop::log
