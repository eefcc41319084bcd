#include "storyloop/storage/run_store.hpp"

#include "storyloop/util/log.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <chrono>

namespace storyloop {

namespace {

auto to_timestamp(TimePoint tp) -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

auto from_timestamp(std::int64_t ts) -> TimePoint {
  return TimePoint(std::chrono::milliseconds(ts));
}

auto string_to_run_state(std::string_view s) -> RunState {
  auto it = std::ranges::find(kRunStateNames, s);
  if (it != kRunStateNames.end()) {
    return static_cast<RunState>(
        std::ranges::distance(kRunStateNames.begin(), it));
  }
  return RunState::Running;
}

auto string_to_outcome(std::string_view s) -> AttemptOutcome {
  auto it = std::ranges::find(kAttemptOutcomeNames, s);
  if (it != kAttemptOutcomeNames.end()) {
    return static_cast<AttemptOutcome>(
        std::ranges::distance(kAttemptOutcomeNames.begin(), it));
  }
  return AttemptOutcome::Failed;
}

auto col_text(sqlite3_stmt* stmt, int col) -> std::string {
  auto* p = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
  return p ? p : "";
}

auto bind_text(sqlite3_stmt* stmt, int idx, std::string_view text) -> void {
  sqlite3_bind_text(stmt, idx, text.data(), static_cast<int>(text.size()),
                    SQLITE_TRANSIENT);
}

}  // namespace

auto RunStore::DbDeleter::operator()(sqlite3* db) const -> void {
  if (db)
    sqlite3_close(db);
}

RunStore::Statement::~Statement() {
  reset();
}

auto RunStore::Statement::reset() -> void {
  if (stmt_) {
    sqlite3_finalize(stmt_);
    stmt_ = nullptr;
  }
}

RunStore::RunStore(std::string_view db_path) : db_path_(db_path) {
}

RunStore::~RunStore() {
  close();
}

auto RunStore::prepare(const char* sql) -> Result<sqlite3_stmt*> {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    log::error("Failed to prepare statement: {}", sqlite3_errmsg(db_.get()));
    return fail(Error::DatabaseQueryFailed);
  }
  return stmt;
}

auto RunStore::open() -> Result<void> {
  if (db_) {
    return ok();
  }

  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path_.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    log::error("Failed to open database: {}",
               raw_db ? sqlite3_errmsg(raw_db) : "out of memory");
    if (raw_db) {
      sqlite3_close(raw_db);
    }
    return fail(Error::DatabaseOpenFailed);
  }
  db_.reset(raw_db);
  sqlite3_busy_timeout(db_.get(), 5000);

  // Concurrent `storyloop runs` readers must not block a live run.
  for (std::string_view pragma : {"PRAGMA journal_mode=WAL;",
                                  "PRAGMA synchronous=NORMAL;",
                                  "PRAGMA foreign_keys=ON;"}) {
    if (auto r = execute(pragma); !r) {
      log::warn("{} failed: {}", pragma, r.error().message());
    }
  }

  if (auto r = create_tables(); !r) {
    close();
    return r;
  }

  log::debug("Run store opened: {}", db_path_);
  return ok();
}

auto RunStore::close() -> void {
  db_.reset();
}

auto RunStore::create_tables() -> Result<void> {
  const char* sql = R"(
    CREATE TABLE IF NOT EXISTS runs (
      id TEXT PRIMARY KEY,
      prd_path TEXT NOT NULL DEFAULT '',
      state TEXT NOT NULL DEFAULT 'running',
      started_at INTEGER NOT NULL,
      finished_at INTEGER
    );

    CREATE TABLE IF NOT EXISTS task_attempts (
      run_id TEXT NOT NULL,
      task_id TEXT NOT NULL,
      attempt INTEGER NOT NULL,
      worker_id TEXT NOT NULL,
      started_at INTEGER NOT NULL,
      finished_at INTEGER NOT NULL,
      exit_code INTEGER NOT NULL DEFAULT 0,
      outcome TEXT NOT NULL,
      failure_type TEXT DEFAULT '',
      PRIMARY KEY (run_id, task_id, attempt),
      FOREIGN KEY (run_id) REFERENCES runs(id) ON DELETE CASCADE
    );

    CREATE TABLE IF NOT EXISTS merges (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      run_id TEXT NOT NULL,
      task_id TEXT NOT NULL,
      batch INTEGER NOT NULL,
      success INTEGER NOT NULL,
      commit_hash TEXT DEFAULT '',
      error TEXT DEFAULT '',
      merged_at INTEGER NOT NULL,
      FOREIGN KEY (run_id) REFERENCES runs(id) ON DELETE CASCADE
    );

    CREATE INDEX IF NOT EXISTS idx_task_attempts_run
      ON task_attempts(run_id);
    CREATE INDEX IF NOT EXISTS idx_merges_task
      ON merges(task_id, success);
  )";

  return execute(sql);
}

auto RunStore::execute(std::string_view sql) -> Result<void> {
  char* err_msg = nullptr;
  std::string sql_str{sql};
  int rc = sqlite3_exec(db_.get(), sql_str.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    log::error("SQL error: {}", err_msg ? err_msg : "unknown");
    sqlite3_free(err_msg);
    return fail(Error::DatabaseQueryFailed);
  }
  return ok();
}

auto RunStore::begin_run(const RunId& id, std::string_view prd_path)
    -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO runs (id, prd_path, state, started_at)
    VALUES (?, ?, 'running', ?)
    ON CONFLICT(id) DO UPDATE SET
      prd_path = excluded.prd_path,
      state = 'running',
      started_at = excluded.started_at,
      finished_at = NULL;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, id.str());
  bind_text(stmt.get(), 2, prd_path);
  sqlite3_bind_int64(stmt.get(), 3, to_timestamp(Clock::now()));

  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto RunStore::finish_run(const RunId& id, RunState state) -> Result<void> {
  constexpr auto sql =
      "UPDATE runs SET state = ?, finished_at = ? WHERE id = ?;";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, to_string_view(state));
  sqlite3_bind_int64(stmt.get(), 2, to_timestamp(Clock::now()));
  bind_text(stmt.get(), 3, id.str());

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return fail(Error::DatabaseQueryFailed);
  }
  if (sqlite3_changes(db_.get()) == 0) {
    return fail(Error::NotFound);
  }
  return ok();
}

namespace {

auto read_run(sqlite3_stmt* stmt) -> RunRecord {
  RunRecord r;
  r.id = RunId{col_text(stmt, 0)};
  r.prd_path = col_text(stmt, 1);
  r.state = string_to_run_state(col_text(stmt, 2));
  r.started_at = from_timestamp(sqlite3_column_int64(stmt, 3));
  if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
    r.finished_at = from_timestamp(sqlite3_column_int64(stmt, 4));
  }
  return r;
}

}  // namespace

auto RunStore::get_run(const RunId& id) -> Result<RunRecord> {
  constexpr auto sql = R"(
    SELECT id, prd_path, state, started_at, finished_at
    FROM runs WHERE id = ?;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, id.str());

  if (sqlite3_step(stmt.get()) != SQLITE_ROW)
    return fail(Error::NotFound);
  return read_run(stmt.get());
}

auto RunStore::list_runs(std::size_t limit)
    -> Result<std::vector<RunRecord>> {
  constexpr auto sql = R"(
    SELECT id, prd_path, state, started_at, finished_at
    FROM runs ORDER BY started_at DESC, rowid DESC LIMIT ?;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  sqlite3_bind_int64(stmt.get(), 1, static_cast<std::int64_t>(limit));

  std::vector<RunRecord> runs;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    runs.push_back(read_run(stmt.get()));
  }
  return runs;
}

auto RunStore::record_attempt(const AttemptRecord& attempt) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO task_attempts
      (run_id, task_id, attempt, worker_id, started_at, finished_at,
       exit_code, outcome, failure_type)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(run_id, task_id, attempt) DO UPDATE SET
      worker_id = excluded.worker_id,
      started_at = excluded.started_at,
      finished_at = excluded.finished_at,
      exit_code = excluded.exit_code,
      outcome = excluded.outcome,
      failure_type = excluded.failure_type;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, attempt.run_id.str());
  bind_text(stmt.get(), 2, attempt.task_id.str());
  sqlite3_bind_int(stmt.get(), 3, attempt.attempt);
  bind_text(stmt.get(), 4, attempt.worker_id.str());
  sqlite3_bind_int64(stmt.get(), 5, to_timestamp(attempt.started_at));
  sqlite3_bind_int64(stmt.get(), 6, to_timestamp(attempt.finished_at));
  sqlite3_bind_int(stmt.get(), 7, attempt.exit_code);
  bind_text(stmt.get(), 8, to_string_view(attempt.outcome));
  bind_text(stmt.get(), 9, attempt.failure_type);

  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto RunStore::attempts(const RunId& run)
    -> Result<std::vector<AttemptRecord>> {
  constexpr auto sql = R"(
    SELECT run_id, task_id, attempt, worker_id, started_at, finished_at,
           exit_code, outcome, failure_type
    FROM task_attempts WHERE run_id = ?
    ORDER BY started_at, task_id, attempt;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);
  bind_text(stmt.get(), 1, run.str());

  std::vector<AttemptRecord> rows;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AttemptRecord a;
    a.run_id = RunId{col_text(stmt.get(), 0)};
    a.task_id = TaskId{col_text(stmt.get(), 1)};
    a.attempt = sqlite3_column_int(stmt.get(), 2);
    a.worker_id = WorkerId{col_text(stmt.get(), 3)};
    a.started_at = from_timestamp(sqlite3_column_int64(stmt.get(), 4));
    a.finished_at = from_timestamp(sqlite3_column_int64(stmt.get(), 5));
    a.exit_code = sqlite3_column_int(stmt.get(), 6);
    a.outcome = string_to_outcome(col_text(stmt.get(), 7));
    a.failure_type = col_text(stmt.get(), 8);
    rows.push_back(std::move(a));
  }
  return rows;
}

auto RunStore::record_merge(const MergeRecord& merge) -> Result<void> {
  constexpr auto sql = R"(
    INSERT INTO merges
      (run_id, task_id, batch, success, commit_hash, error, merged_at)
    VALUES (?, ?, ?, ?, ?, ?, ?);
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  bind_text(stmt.get(), 1, merge.run_id.str());
  bind_text(stmt.get(), 2, merge.task_id.str());
  sqlite3_bind_int64(stmt.get(), 3, static_cast<std::int64_t>(merge.batch));
  sqlite3_bind_int(stmt.get(), 4, merge.success ? 1 : 0);
  bind_text(stmt.get(), 5, merge.commit_hash);
  bind_text(stmt.get(), 6, merge.error);
  sqlite3_bind_int64(stmt.get(), 7, to_timestamp(merge.merged_at));

  return sqlite3_step(stmt.get()) == SQLITE_DONE
             ? ok()
             : fail(Error::DatabaseQueryFailed);
}

auto RunStore::merged_tasks() -> Result<std::vector<TaskId>> {
  constexpr auto sql = R"(
    SELECT DISTINCT task_id FROM merges WHERE success = 1 ORDER BY task_id;
  )";

  auto result = prepare(sql);
  if (!result)
    return std::unexpected(result.error());
  Statement stmt(*result);

  std::vector<TaskId> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    if (auto id = col_text(stmt.get(), 0); !id.empty()) {
      ids.emplace_back(std::move(id));
    }
  }
  return ids;
}

}  // namespace storyloop
