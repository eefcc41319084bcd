#include "storyloop/orchestrator/orchestrator.hpp"
#include "storyloop/util/fs.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

#include <algorithm>

using namespace storyloop;
using namespace std::chrono_literals;
using storyloop::test::make_task;
using storyloop::test::task_id;

namespace {

// Commits <task>.txt in the worker's workspace.
constexpr const char* kCommitWork =
    "echo {task_id} > {task_id}.txt && git add -A && "
    "git commit -q -m \"work on $STORYLOOP_TASK_ID\"";

auto command_for(std::string_view failing_task, std::string_view failure)
    -> std::string {
  return std::format("if [ {{task_id}} = {} ]; then {}; fi; {}", failing_task,
                     failure, kCommitWork);
}

}  // namespace

TEST(ClassifyExitTest, ReportedTypeWinsThenExitCode) {
  WorkerResult reported{.failure_type = FailureType::Bug, .error = "npe"};

  EXPECT_EQ(classify_exit(1, reported), FailureType::Bug);
  EXPECT_EQ(classify_exit(124, std::nullopt), FailureType::Timeout);
  EXPECT_EQ(classify_exit(137, std::nullopt), FailureType::ResourceExhaustion);
  EXPECT_EQ(classify_exit(2, WorkerResult{}), FailureType::Unknown);
}

TEST(WorkerResultTest, ReadsFailureTypeAndError) {
  test::TempDir dir;
  ASSERT_TRUE(dir.valid());
  test::write_text(dir.path() / "result.json",
                   R"({"failure_type": "quality_gate_failure", "error": "lint"})");
  test::write_text(dir.path() / "broken.json", "{");

  auto result = read_worker_result(dir.path() / "result.json");

  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->failure_type.has_value());
  EXPECT_EQ(*result->failure_type, FailureType::QualityGateFailure);
  EXPECT_EQ(result->error, "lint");
  EXPECT_FALSE(read_worker_result(dir.path() / "broken.json").has_value());
  EXPECT_FALSE(read_worker_result(dir.path() / "missing.json").has_value());
}

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (!test::has_git()) {
      GTEST_SKIP() << "git not available";
    }
    ASSERT_TRUE(dir_.valid());
    repo_dir_ = dir_.path() / "repo";
    state_dir_ = dir_.path() / "state";
    ASSERT_TRUE(test::init_repo(repo_dir_));

    config_.state_dir = state_dir_.string();
    config_.repository.path = repo_dir_.string();
    config_.executor.max_workers = 2;
    config_.executor.timeout_sec = 30;
    config_.executor.poll_interval_ms = 20;
    config_.retry.max_retries = 2;
    config_.retry.base_backoff_sec = 0.0;

    auto repo = GitRepository::discover(repo_dir_);
    ASSERT_TRUE(repo.has_value());
    merger_ = std::make_unique<MergeController>(
        std::move(*repo), MergeOptions{.state_dir = state_dir_});
    health_ = std::make_unique<HealthMonitor>(state_dir_, config_.health);
    store_ = std::make_unique<RunStore>((state_dir_ / "runs.db").string());
    ASSERT_TRUE(ensure_state_dir());
    ASSERT_TRUE(store_->open().has_value());
  }

  auto ensure_state_dir() -> bool {
    std::error_code ec;
    std::filesystem::create_directories(state_dir_, ec);
    return !ec;
  }

  auto run(std::vector<Task> tasks, RunOptions options = {})
      -> Result<RunSummary> {
    retry_ = std::make_unique<RetryHandler>(config_.retry,
                                            state_dir_ / "retries.jsonl");
    Orchestrator orchestrator(config_, Orchestrator::Services{
                                           .merger = *merger_,
                                           .executor = *executor_,
                                           .bus = bus_,
                                           .health = *health_,
                                           .retry = *retry_,
                                           .store = store_.get(),
                                       });
    if (stop_on_start_) {
      bus_.subscribe("story.started",
                     [&orchestrator](const Event&) { orchestrator.request_stop(); });
    }
    return orchestrator.run(std::move(tasks), options);
  }

  auto merged_order() -> std::vector<std::string> {
    std::vector<std::string> order;
    for (const auto& e : bus_.history("story.merged")) {
      order.push_back(e.data.value("story_id", std::string{}));
    }
    std::ranges::reverse(order);
    return order;
  }

  test::TempDir dir_;
  std::filesystem::path repo_dir_;
  std::filesystem::path state_dir_;
  SystemConfig config_;
  EventBus bus_{EventBusOptions{.history_capacity = 1000, .dispatcher_threads = 0}};
  std::unique_ptr<MergeController> merger_;
  std::unique_ptr<HealthMonitor> health_;
  std::unique_ptr<RunStore> store_;
  std::unique_ptr<RetryHandler> retry_;
  std::unique_ptr<IExecutor> executor_ = create_process_executor();
  bool stop_on_start_{false};
};

TEST_F(OrchestratorTest, Run_MergesEveryStoryInDependencyOrder) {
  config_.executor.command = kCommitWork;

  auto summary = run({make_task("A"), make_task("B", {"A"}), make_task("C")});

  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->state, RunState::Completed);
  EXPECT_EQ(summary->batches, 2u);
  EXPECT_EQ(summary->count(TaskOutcome::Merged), 3u);
  for (const char* name : {"A.txt", "B.txt", "C.txt"}) {
    EXPECT_TRUE(std::filesystem::exists(repo_dir_ / name)) << name;
  }
  const auto* b = summary->find(task_id("B"));
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->batch, 2u);
  EXPECT_EQ(b->attempts, 1);
  EXPECT_FALSE(b->commit.empty());
  EXPECT_TRUE(merger_->list_worker_branches()->empty());

  auto runs = store_->get_run(summary->run_id);
  ASSERT_TRUE(runs.has_value());
  EXPECT_EQ(runs->state, RunState::Completed);
  auto attempts = store_->attempts(summary->run_id);
  ASSERT_TRUE(attempts.has_value());
  EXPECT_EQ(attempts->size(), 3u);
}

TEST_F(OrchestratorTest, Run_ConflictingStoriesMergeOneAtATime) {
  config_.executor.command = kCommitWork;

  auto summary = run({make_task("A", {}, {"src/core.cpp"}),
                      make_task("B", {"A"}, {"src/feature.cpp"}),
                      make_task("C", {}, {"src/core.cpp"})});

  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->state, RunState::Completed);
  EXPECT_EQ(merged_order(), (std::vector<std::string>{"A", "C", "B"}));
  EXPECT_EQ(bus_.history("plan.conflicts_serialized").size(), 1u);
}

TEST_F(OrchestratorTest, Run_RetriesUntilCeilingThenSkipsDependents) {
  config_.executor.command = command_for("BAD", "exit 1");

  auto summary = run({make_task("BAD"), make_task("NEXT", {"BAD"}),
                      make_task("OK")});

  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->state, RunState::Failed);
  const auto* bad = summary->find(task_id("BAD"));
  ASSERT_NE(bad, nullptr);
  EXPECT_EQ(bad->outcome, TaskOutcome::Failed);
  EXPECT_EQ(bad->attempts, 3);
  EXPECT_EQ(bad->error, make_error_code(Error::RetryExhausted));
  ASSERT_TRUE(bad->failure.has_value());
  EXPECT_EQ(*bad->failure, FailureType::Unknown);
  EXPECT_EQ(summary->find(task_id("NEXT"))->outcome, TaskOutcome::Skipped);
  EXPECT_EQ(summary->find(task_id("OK"))->outcome, TaskOutcome::Merged);
  EXPECT_EQ(bus_.history("story.retry_scheduled").size(), 2u);
  EXPECT_EQ(bus_.history("story.retry_exhausted").size(), 1u);

  auto json = summary->to_json();
  EXPECT_EQ(json["merged"], 1);
  EXPECT_EQ(json["failed"], 1);
  EXPECT_EQ(json["skipped"], 1);
}

TEST_F(OrchestratorTest, Run_TransientFailureRecoversOnRetry) {
  config_.executor.command = std::format(
      "if [ ! -f \"$STORYLOOP_STATE_DIR/flaky\" ]; then "
      "touch \"$STORYLOOP_STATE_DIR/flaky\"; exit 1; fi; {}",
      kCommitWork);

  auto summary = run({make_task("A")});

  ASSERT_TRUE(summary.has_value());
  const auto* a = summary->find(task_id("A"));
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->outcome, TaskOutcome::Merged);
  EXPECT_EQ(a->attempts, 2);
  EXPECT_FALSE(a->error);
  EXPECT_TRUE(std::filesystem::exists(repo_dir_ / "A.txt"));
  EXPECT_EQ(retry_->retry_count(task_id("A")), 0);
}

TEST_F(OrchestratorTest, Run_TitleIsPassedAsOneShellWord) {
  config_.executor.command =
      "printf %s {title} > title.txt && git add -A && git commit -q -m title";
  auto task = make_task("A");
  task.title = "Fix user's login $(touch injected)";

  auto summary = run({task});

  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->find(task_id("A"))->outcome, TaskOutcome::Merged);
  auto written = read_file(repo_dir_ / "title.txt");
  ASSERT_TRUE(written.has_value());
  EXPECT_EQ(*written, task.title);
  EXPECT_FALSE(std::filesystem::exists(repo_dir_ / "injected"));
}

TEST_F(OrchestratorTest, Run_ReportedIneligibleFailureIsNotRetried) {
  config_.executor.command = command_for(
      "A",
      "echo '{\"failure_type\": \"logic_error\", \"error\": \"wrong total\"}' "
      "> \"$STORYLOOP_STATE_DIR/workers/$STORYLOOP_WORKER_ID/result.json\"; "
      "exit 1");

  auto summary = run({make_task("A")});

  ASSERT_TRUE(summary.has_value());
  const auto* a = summary->find(task_id("A"));
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->outcome, TaskOutcome::Failed);
  EXPECT_EQ(a->attempts, 1);
  ASSERT_TRUE(a->failure.has_value());
  EXPECT_EQ(*a->failure, FailureType::LogicError);
  EXPECT_NE(a->detail.find("wrong total"), std::string::npos);
  EXPECT_TRUE(bus_.history("story.retry_scheduled").empty());
}

TEST_F(OrchestratorTest, Run_ExitCode124IsTimeout) {
  config_.retry.max_retries = 0;
  config_.executor.command = "exit 124";

  auto summary = run({make_task("A")});

  ASSERT_TRUE(summary.has_value());
  const auto* a = summary->find(task_id("A"));
  ASSERT_NE(a, nullptr);
  ASSERT_TRUE(a->failure.has_value());
  EXPECT_EQ(*a->failure, FailureType::Timeout);
  auto attempts = store_->attempts(summary->run_id);
  ASSERT_TRUE(attempts.has_value());
  ASSERT_EQ(attempts->size(), 1u);
  EXPECT_EQ(attempts->front().outcome, AttemptOutcome::TimedOut);
}

TEST_F(OrchestratorTest, Run_KillsWorkerPastTimeout) {
  config_.retry.max_retries = 0;
  config_.executor.timeout_sec = 1;
  config_.executor.command = "sleep 30";

  auto start = std::chrono::steady_clock::now();
  auto summary = run({make_task("A")});

  ASSERT_TRUE(summary.has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 15s);
  const auto* a = summary->find(task_id("A"));
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->outcome, TaskOutcome::Failed);
  ASSERT_TRUE(a->failure.has_value());
  EXPECT_EQ(*a->failure, FailureType::Timeout);
}

TEST_F(OrchestratorTest, Run_StopRequestCancelsRemainingWork) {
  stop_on_start_ = true;
  config_.executor.command = "sleep 30";

  auto summary = run({make_task("A"), make_task("B", {"A"})});

  ASSERT_TRUE(summary.has_value());
  EXPECT_EQ(summary->state, RunState::Interrupted);
  EXPECT_EQ(summary->count(TaskOutcome::Cancelled), 2u);
  EXPECT_EQ(summary->find(task_id("A"))->error,
            make_error_code(Error::Cancelled));
  EXPECT_FALSE(merger_->repository().branch_exists("worker/A"));

  auto records = retry_->records();
  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 1u);
  EXPECT_FALSE(records->front().will_retry);
  EXPECT_EQ(records->front().reason, "run interrupted");
}

TEST_F(OrchestratorTest, Resume_SkipsStoriesMergedEarlier) {
  config_.executor.command = kCommitWork;
  auto first = run({make_task("A")});
  ASSERT_TRUE(first.has_value());
  ASSERT_EQ(first->count(TaskOutcome::Merged), 1u);

  auto second = run({make_task("A"), make_task("B", {"A"})},
                    RunOptions{.resume = true});

  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(second->tasks.size(), 1u);
  EXPECT_EQ(second->tasks.front().id, task_id("B"));
  EXPECT_EQ(second->tasks.front().outcome, TaskOutcome::Merged);
  auto runs = store_->list_runs();
  ASSERT_TRUE(runs.has_value());
  EXPECT_EQ(runs->size(), 2u);
}

TEST_F(OrchestratorTest, Run_RejectsMissingCommandAndCycles) {
  auto no_command = run({make_task("A")});

  ASSERT_FALSE(no_command.has_value());
  EXPECT_EQ(no_command.error(), make_error_code(Error::InvalidArgument));

  config_.executor.command = kCommitWork;
  auto cyclic = run({make_task("A", {"B"}), make_task("B", {"A"})});

  ASSERT_FALSE(cyclic.has_value());
  EXPECT_EQ(cyclic.error(), make_error_code(Error::CycleDetected));
}
