#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace storyloop {

enum class Error : int {
  Success,
  // Graph construction and planning (fatal for the plan)
  UnknownDependency,
  DuplicateTask,
  CycleDetected,
  // Merge-back
  RebaseConflict,
  MergeFailed,
  LockTimeout,
  GitCommandFailed,
  // Heartbeats
  HeartbeatMissing,
  HeartbeatMalformed,
  // Retry ceiling or ineligible failure category
  RetryExhausted,
  // Infrastructure
  ProcessSpawnFailed,
  FileNotFound,
  FileOpenFailed,
  FileWriteFailed,
  ParseError,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  InvalidArgument,
  NotFound,
  Timeout,
  Cancelled,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "unknown dependency reference",
      "duplicate task id",
      "cycle detected in dependency graph",
      "rebase failed - conflicts detected",
      "merge failed",
      "timed out waiting for lock",
      "git command failed",
      "heartbeat missing",
      "heartbeat malformed",
      "retries exhausted",
      "failed to spawn process",
      "file not found",
      "failed to open file",
      "failed to write file",
      "parse error",
      "failed to open database",
      "database query failed",
      "invalid argument",
      "not found",
      "timeout",
      "cancelled",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "storyloop";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

// Every fallible operation returns a Result; the error side is always a
// std::error_code so storyloop errors and errno values travel the same way.
template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace storyloop

template <>
struct std::is_error_code_enum<storyloop::Error> : std::true_type {};
