#include "storyloop/storage/run_store.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <format>

using namespace storyloop;
using storyloop::test::task_id;
using storyloop::test::worker_id;

class RunStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    store_ = std::make_unique<RunStore>((dir_.path() / "runs.db").string());
    ASSERT_TRUE(store_->open().has_value());
  }

  auto attempt(std::string_view task, int n, AttemptOutcome outcome)
      -> AttemptRecord {
    AttemptRecord a;
    a.run_id = RunId{"run_1"};
    a.task_id = task_id(task);
    a.attempt = n;
    a.worker_id = worker_id(std::format("{}-a{}", task, n));
    a.started_at = Clock::now();
    a.finished_at = a.started_at + std::chrono::seconds(3);
    a.outcome = outcome;
    a.exit_code = outcome == AttemptOutcome::Succeeded ? 0 : 1;
    a.failure_type = outcome == AttemptOutcome::Succeeded ? "" : "unknown";
    return a;
  }

  test::TempDir dir_;
  std::unique_ptr<RunStore> store_;
};

TEST_F(RunStoreTest, Open_IsIdempotent) {
  EXPECT_TRUE(store_->is_open());
  EXPECT_TRUE(store_->open().has_value());

  store_->close();

  EXPECT_FALSE(store_->is_open());
}

TEST_F(RunStoreTest, BeginAndFinishRun) {
  ASSERT_TRUE(store_->begin_run(RunId{"run_1"}, "prd.json").has_value());

  auto running = store_->get_run(RunId{"run_1"});
  ASSERT_TRUE(running.has_value());
  EXPECT_EQ(running->state, RunState::Running);
  EXPECT_EQ(running->prd_path, "prd.json");
  EXPECT_FALSE(running->finished_at.has_value());

  ASSERT_TRUE(store_->finish_run(RunId{"run_1"}, RunState::Completed).has_value());

  auto done = store_->get_run(RunId{"run_1"});
  ASSERT_TRUE(done.has_value());
  EXPECT_EQ(done->state, RunState::Completed);
  EXPECT_TRUE(done->finished_at.has_value());
}

TEST_F(RunStoreTest, UnknownRun_NotFound) {
  auto run = store_->get_run(RunId{"missing"});
  auto finish = store_->finish_run(RunId{"missing"}, RunState::Failed);

  ASSERT_FALSE(run.has_value());
  EXPECT_EQ(run.error(), make_error_code(Error::NotFound));
  ASSERT_FALSE(finish.has_value());
  EXPECT_EQ(finish.error(), make_error_code(Error::NotFound));
}

TEST_F(RunStoreTest, RecordAttempt_UpsertsByAttemptNumber) {
  ASSERT_TRUE(store_->begin_run(RunId{"run_1"}, "prd.json").has_value());
  ASSERT_TRUE(store_->record_attempt(attempt("A", 1, AttemptOutcome::Failed))
                  .has_value());
  ASSERT_TRUE(store_->record_attempt(attempt("A", 1, AttemptOutcome::TimedOut))
                  .has_value());
  ASSERT_TRUE(store_->record_attempt(attempt("A", 2, AttemptOutcome::Succeeded))
                  .has_value());

  auto attempts = store_->attempts(RunId{"run_1"});

  ASSERT_TRUE(attempts.has_value());
  ASSERT_EQ(attempts->size(), 2u);
  EXPECT_EQ((*attempts)[0].attempt, 1);
  EXPECT_EQ((*attempts)[0].outcome, AttemptOutcome::TimedOut);
  EXPECT_EQ((*attempts)[1].outcome, AttemptOutcome::Succeeded);
  EXPECT_EQ((*attempts)[1].worker_id, worker_id("A-a2"));
  EXPECT_TRUE((*attempts)[1].failure_type.empty());
}

TEST_F(RunStoreTest, MergedTasks_OnlySuccessfulMerges) {
  ASSERT_TRUE(store_->begin_run(RunId{"run_1"}, "prd.json").has_value());
  auto merge = [&](std::string_view task, bool success) {
    MergeRecord m;
    m.run_id = RunId{"run_1"};
    m.task_id = task_id(task);
    m.batch = 1;
    m.success = success;
    m.commit_hash = success ? "abc123" : "";
    m.error = success ? "" : "rebase conflict";
    m.merged_at = Clock::now();
    return store_->record_merge(m);
  };
  ASSERT_TRUE(merge("B", true).has_value());
  ASSERT_TRUE(merge("A", true).has_value());
  ASSERT_TRUE(merge("C", false).has_value());
  ASSERT_TRUE(merge("A", true).has_value());

  auto merged = store_->merged_tasks();

  ASSERT_TRUE(merged.has_value());
  EXPECT_EQ(*merged, (std::vector<TaskId>{task_id("A"), task_id("B")}));
}

TEST_F(RunStoreTest, ListRuns_NewestFirstWithLimit) {
  ASSERT_TRUE(store_->begin_run(RunId{"run_1"}, "a.json").has_value());
  ASSERT_TRUE(store_->begin_run(RunId{"run_2"}, "b.json").has_value());
  ASSERT_TRUE(store_->begin_run(RunId{"run_3"}, "c.json").has_value());

  auto all = store_->list_runs();
  auto limited = store_->list_runs(2);

  ASSERT_TRUE(all.has_value());
  ASSERT_EQ(all->size(), 3u);
  EXPECT_EQ(all->front().id, RunId{"run_3"});
  ASSERT_TRUE(limited.has_value());
  EXPECT_EQ(limited->size(), 2u);
}

TEST_F(RunStoreTest, Reopen_KeepsData) {
  ASSERT_TRUE(store_->begin_run(RunId{"run_1"}, "prd.json").has_value());
  store_->close();

  RunStore reopened((dir_.path() / "runs.db").string());
  ASSERT_TRUE(reopened.open().has_value());

  EXPECT_TRUE(reopened.get_run(RunId{"run_1"}).has_value());
}
