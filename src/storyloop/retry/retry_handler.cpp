#include "storyloop/retry/retry_handler.hpp"

#include "storyloop/util/fs.hpp"
#include "storyloop/util/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace storyloop {

namespace {

inline constexpr std::size_t kRecentRecords = 10;

}  // namespace

auto parse_failure_type(std::string_view name) noexcept -> FailureType {
  auto it = std::ranges::find(kFailureTypeNames, name);
  if (it != kFailureTypeNames.end()) {
    return static_cast<FailureType>(
        std::ranges::distance(kFailureTypeNames.begin(), it));
  }
  return FailureType::Unknown;
}

auto RetryRecord::to_json() const -> nlohmann::json {
  return {
      {"timestamp", format_timestamp(timestamp)},
      {"run_id", run_id},
      {"story_id", task_id.str()},
      {"attempt", attempt},
      {"failure_type", std::string(to_string_view(failure_type))},
      {"error_message", error_message},
      {"backoff_seconds", backoff_seconds},
      {"will_retry", will_retry},
      {"reason", reason},
  };
}

auto RetryRecord::from_json(const nlohmann::json& j)
    -> std::optional<RetryRecord> {
  if (!j.is_object() || !j.contains("story_id")) {
    return std::nullopt;
  }
  RetryRecord r;
  if (auto ts = parse_timestamp(j.value("timestamp", std::string{}))) {
    r.timestamp = *ts;
  }
  r.run_id = j.value("run_id", std::string{});
  r.task_id = TaskId{j.value("story_id", std::string{})};
  r.attempt = j.value("attempt", 0);
  r.failure_type = parse_failure_type(j.value("failure_type", std::string{}));
  r.error_message = j.value("error_message", std::string{});
  r.backoff_seconds = j.value("backoff_seconds", 0.0);
  r.will_retry = j.value("will_retry", false);
  r.reason = j.value("reason", std::string{});
  return r;
}

auto RetryStats::to_json() const -> nlohmann::json {
  auto recent_json = nlohmann::json::array();
  for (const auto& r : recent) {
    recent_json.push_back(r.to_json());
  }
  return {
      {"total_retries", total_retries},
      {"total_denied", total_denied},
      {"by_story", by_task},
      {"by_failure_type", by_failure_type},
      {"recent_retries", std::move(recent_json)},
  };
}

RetryHandler::RetryHandler(RetryConfig config, std::filesystem::path log_path,
                           std::string run_id)
    : config_(config), log_path_(std::move(log_path)),
      run_id_(std::move(run_id)) {
}

auto RetryHandler::set_run_id(std::string run_id) -> void {
  std::lock_guard lock(mu_);
  run_id_ = std::move(run_id);
}

auto RetryHandler::backoff_for(int attempt) const -> BackoffDuration {
  return BackoffDuration{config_.base_backoff_sec *
                         std::pow(config_.backoff_multiplier, attempt)};
}

auto RetryHandler::should_retry(const TaskId& task, FailureType type,
                                int attempt, std::string_view error)
    -> RetryDecision {
  RetryDecision decision;
  RetryRecord record;
  record.timestamp = Clock::now();
  record.task_id = task;
  record.attempt = attempt;
  record.failure_type = type;
  record.error_message = std::string(error);

  if (attempt >= config_.max_retries) {
    decision.verdict = RetryVerdict::MaxRetriesExceeded;
    decision.reason =
        std::format("Maximum retries exceeded ({})", config_.max_retries);
  } else if (!is_retry_eligible(type)) {
    decision.verdict = RetryVerdict::RequiresManualIntervention;
    decision.reason = std::format(
        "Failure type '{}' requires manual intervention", to_string_view(type));
  } else {
    decision.should_retry = true;
    decision.verdict = RetryVerdict::Granted;
    decision.reason = "Transient failure, retrying with backoff";
    decision.backoff = backoff_for(attempt);
    decision.attempts_remaining = config_.max_retries - attempt - 1;
  }

  {
    std::lock_guard lock(mu_);
    record.run_id = run_id_;
    if (decision.should_retry) {
      counts_[task] = attempt + 1;
    }
  }

  record.backoff_seconds = decision.backoff.count();
  record.will_retry = decision.should_retry;
  record.reason = decision.reason;
  append(record);

  if (decision.should_retry) {
    log::info("Retry granted for {} ({}, attempt {}): backoff {:.1f}s, {} left",
              task, to_string_view(type), attempt + 1, decision.backoff.count(),
              decision.attempts_remaining);
  } else {
    log::warn("Retry denied for {} ({}, attempt {}): {}", task,
              to_string_view(type), attempt + 1, decision.reason);
  }
  return decision;
}

auto RetryHandler::record_no_retry(const TaskId& task, FailureType type,
                                   int attempt, std::string_view reason,
                                   std::string_view error) -> void {
  RetryRecord record;
  record.timestamp = Clock::now();
  {
    std::lock_guard lock(mu_);
    record.run_id = run_id_;
  }
  record.task_id = task;
  record.attempt = attempt;
  record.failure_type = type;
  record.error_message = std::string(error);
  record.will_retry = false;
  record.reason = std::string(reason);
  append(record);
}

auto RetryHandler::reset_retry_count(const TaskId& task) -> void {
  std::lock_guard lock(mu_);
  counts_.erase(task);
}

auto RetryHandler::retry_count(const TaskId& task) const -> int {
  std::lock_guard lock(mu_);
  auto it = counts_.find(task);
  return it != counts_.end() ? it->second : 0;
}

auto RetryHandler::append(const RetryRecord& record) -> void {
  if (log_path_.empty()) {
    return;
  }
  if (auto r = append_line(log_path_, record.to_json().dump()); !r) {
    log::warn("Failed to append retry record for {}: {}", record.task_id,
              r.error().message());
  }
}

auto RetryHandler::records() const -> Result<std::vector<RetryRecord>> {
  auto lines = read_lines(log_path_);
  if (!lines) {
    return std::unexpected(lines.error());
  }
  std::vector<RetryRecord> result;
  result.reserve(lines->size());
  for (const auto& line : *lines) {
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded()) {
      log::debug("Skipping malformed retry record in {}", log_path_.string());
      continue;
    }
    if (auto rec = RetryRecord::from_json(j)) {
      result.push_back(std::move(*rec));
    }
  }
  return result;
}

auto RetryHandler::stats() const -> Result<RetryStats> {
  auto all = records();
  if (!all) {
    return std::unexpected(all.error());
  }

  RetryStats s;
  std::vector<RetryRecord> granted;
  for (auto& rec : *all) {
    if (!rec.will_retry) {
      ++s.total_denied;
      continue;
    }
    ++s.total_retries;
    ++s.by_task[rec.task_id.str()];
    ++s.by_failure_type[std::string(to_string_view(rec.failure_type))];
    granted.push_back(std::move(rec));
  }
  auto start = granted.size() > kRecentRecords
                   ? granted.size() - kRecentRecords
                   : std::size_t{0};
  s.recent.assign(std::make_move_iterator(granted.begin() + start),
                  std::make_move_iterator(granted.end()));
  return s;
}

}  // namespace storyloop
