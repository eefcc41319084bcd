#pragma once

#include "storyloop/config/system_config.hpp"
#include "storyloop/core/error.hpp"
#include "storyloop/util/id.hpp"
#include "storyloop/util/util.hpp"

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace storyloop {

enum class FailureType : std::uint8_t {
  ApiError,
  Timeout,
  ResourceExhaustion,
  CoordinatorError,
  Unknown,
  Bug,
  LogicError,
  QualityGateFailure,
};

inline constexpr std::array kFailureTypeNames = {
    "api_error", "timeout", "resource_exhaustion", "coordinator_error",
    "unknown",   "bug",     "logic_error",         "quality_gate_failure"};

[[nodiscard]] inline auto to_string_view(FailureType type) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(type);
  return idx < kFailureTypeNames.size() ? kFailureTypeNames[idx] : "unknown";
}

// Unrecognised names map to Unknown, which is retry-eligible.
[[nodiscard]] auto parse_failure_type(std::string_view name) noexcept
    -> FailureType;

// Transient categories are retried; defects needing correction are not.
[[nodiscard]] constexpr auto is_retry_eligible(FailureType type) noexcept
    -> bool {
  switch (type) {
    case FailureType::Bug:
    case FailureType::LogicError:
    case FailureType::QualityGateFailure:
      return false;
    default:
      return true;
  }
}

enum class RetryVerdict : std::uint8_t {
  Granted,
  MaxRetriesExceeded,
  RequiresManualIntervention,
  DeclinedByCaller,
};

using BackoffDuration = std::chrono::duration<double>;

struct RetryDecision {
  bool should_retry{false};
  RetryVerdict verdict{RetryVerdict::Granted};
  std::string reason;
  BackoffDuration backoff{0.0};
  int attempts_remaining{0};
};

struct RetryRecord {
  TimePoint timestamp{};
  std::string run_id;
  TaskId task_id;
  int attempt{0};
  FailureType failure_type{FailureType::Unknown};
  std::string error_message;
  double backoff_seconds{0.0};
  bool will_retry{false};
  std::string reason;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
  [[nodiscard]] static auto from_json(const nlohmann::json& j)
      -> std::optional<RetryRecord>;
};

struct RetryStats {
  std::size_t total_retries{0};  // granted
  std::size_t total_denied{0};
  std::map<std::string, std::size_t, std::less<>> by_task;
  std::map<std::string, std::size_t, std::less<>> by_failure_type;
  std::vector<RetryRecord> recent;  // newest last, at most 10

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

// Decides whether a failed attempt is resubmitted and after what delay.
// Every decision is appended to `<state_dir>/retries.jsonl`.
class RetryHandler {
public:
  RetryHandler(RetryConfig config, std::filesystem::path log_path,
               std::string run_id = {});

  [[nodiscard]] auto should_retry(const TaskId& task, FailureType type,
                                  int attempt, std::string_view error = {})
      -> RetryDecision;
  [[nodiscard]] auto should_retry(const TaskId& task, std::string_view type,
                                  int attempt, std::string_view error = {})
      -> RetryDecision {
    return should_retry(task, parse_failure_type(type), attempt, error);
  }

  // Logs a denial decided elsewhere; the retry counter is left alone.
  auto record_no_retry(const TaskId& task, FailureType type, int attempt,
                       std::string_view reason, std::string_view error = {})
      -> void;

  auto reset_retry_count(const TaskId& task) -> void;
  [[nodiscard]] auto retry_count(const TaskId& task) const -> int;

  [[nodiscard]] auto backoff_for(int attempt) const -> BackoffDuration;

  [[nodiscard]] auto stats() const -> Result<RetryStats>;
  [[nodiscard]] auto records() const -> Result<std::vector<RetryRecord>>;

  auto set_run_id(std::string run_id) -> void;

  [[nodiscard]] auto config() const noexcept -> const RetryConfig& {
    return config_;
  }
  [[nodiscard]] auto log_path() const noexcept
      -> const std::filesystem::path& {
    return log_path_;
  }

private:
  auto append(const RetryRecord& record) -> void;

  RetryConfig config_;
  std::filesystem::path log_path_;

  mutable std::mutex mu_;
  std::string run_id_;
  std::unordered_map<TaskId, int> counts_;
};

}  // namespace storyloop
