#pragma once

#include "storyloop/core/error.hpp"
#include "storyloop/util/id.hpp"
#include "storyloop/util/util.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace storyloop {

enum class RunState : std::uint8_t {
  Running,
  Completed,
  Failed,
  Interrupted,
};

inline constexpr std::array kRunStateNames = {"running", "completed", "failed",
                                              "interrupted"};

[[nodiscard]] inline auto to_string_view(RunState state) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(state);
  return idx < kRunStateNames.size() ? kRunStateNames[idx] : "unknown";
}

enum class AttemptOutcome : std::uint8_t {
  Succeeded,
  Failed,
  TimedOut,
  Killed,
};

inline constexpr std::array kAttemptOutcomeNames = {"succeeded", "failed",
                                                    "timed_out", "killed"};

[[nodiscard]] inline auto to_string_view(AttemptOutcome outcome) noexcept
    -> std::string_view {
  auto idx = std::to_underlying(outcome);
  return idx < kAttemptOutcomeNames.size() ? kAttemptOutcomeNames[idx]
                                           : "failed";
}

struct RunRecord {
  RunId id;
  std::string prd_path;
  RunState state{RunState::Running};
  TimePoint started_at{};
  std::optional<TimePoint> finished_at;
};

struct AttemptRecord {
  RunId run_id;
  TaskId task_id;
  int attempt{0};
  WorkerId worker_id;
  TimePoint started_at{};
  TimePoint finished_at{};
  int exit_code{0};
  AttemptOutcome outcome{AttemptOutcome::Failed};
  std::string failure_type;  // empty on success
};

struct MergeRecord {
  RunId run_id;
  TaskId task_id;
  std::size_t batch{0};
  bool success{false};
  std::string commit_hash;
  std::string error;
  TimePoint merged_at{};
};

// SQLite ledger of runs, attempts and merges.
class RunStore {
public:
  explicit RunStore(std::string_view db_path);
  ~RunStore();

  RunStore(const RunStore&) = delete;
  RunStore& operator=(const RunStore&) = delete;

  [[nodiscard]] auto open() -> Result<void>;
  auto close() -> void;
  [[nodiscard]] auto is_open() const noexcept -> bool {
    return db_ != nullptr;
  }

  [[nodiscard]] auto begin_run(const RunId& id, std::string_view prd_path)
      -> Result<void>;
  [[nodiscard]] auto finish_run(const RunId& id, RunState state)
      -> Result<void>;
  [[nodiscard]] auto get_run(const RunId& id) -> Result<RunRecord>;
  [[nodiscard]] auto list_runs(std::size_t limit = 20)
      -> Result<std::vector<RunRecord>>;

  [[nodiscard]] auto record_attempt(const AttemptRecord& attempt)
      -> Result<void>;
  [[nodiscard]] auto attempts(const RunId& run)
      -> Result<std::vector<AttemptRecord>>;

  [[nodiscard]] auto record_merge(const MergeRecord& merge) -> Result<void>;
  // Tasks merged successfully by any run.
  [[nodiscard]] auto merged_tasks() -> Result<std::vector<TaskId>>;

private:
  [[nodiscard]] auto create_tables() -> Result<void>;
  [[nodiscard]] auto execute(std::string_view sql) -> Result<void>;
  [[nodiscard]] auto prepare(const char* sql) -> Result<sqlite3_stmt*>;

  struct DbDeleter {
    void operator()(sqlite3* db) const;
  };

  class Statement {
  public:
    explicit Statement(sqlite3_stmt* stmt = nullptr) noexcept : stmt_(stmt) {
    }
    ~Statement();
    Statement(Statement&& other) noexcept
        : stmt_(std::exchange(other.stmt_, nullptr)) {
    }
    Statement& operator=(Statement&& other) noexcept {
      if (this != &other) {
        reset();
        stmt_ = std::exchange(other.stmt_, nullptr);
      }
      return *this;
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* {
      return stmt_;
    }
    auto reset() -> void;

  private:
    sqlite3_stmt* stmt_ = nullptr;
  };

  std::string db_path_;
  std::unique_ptr<sqlite3, DbDeleter> db_{nullptr};
};

}  // namespace storyloop
