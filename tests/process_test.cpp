#include "storyloop/executor/executor.hpp"
#include "storyloop/executor/process.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <algorithm>
#include <thread>

#include <unistd.h>

using namespace storyloop;
using namespace std::chrono_literals;
using storyloop::test::task_id;
using storyloop::test::worker_id;

namespace {

auto wait_for_exit(WorkerProcess& process,
                   std::chrono::milliseconds limit = 5s) -> std::optional<int> {
  auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (auto code = process.poll()) {
      return code;
    }
    std::this_thread::sleep_for(10ms);
  }
  return std::nullopt;
}

}  // namespace

TEST(RunCommandTest, CapturesOutputAndExitCode) {
  auto out = run_command({"sh", "-c", "echo hello; echo oops >&2; exit 3"});

  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->exit_code, 3);
  EXPECT_EQ(out->stdout_output, "hello\n");
  EXPECT_EQ(out->stderr_output, "oops\n");
  EXPECT_FALSE(out->success());
}

TEST(RunCommandTest, WorkingDirAndEnvironment) {
  test::TempDir dir;
  ASSERT_TRUE(dir.valid());

  auto out = run_command({"sh", "-c", "pwd; echo $STORYLOOP_TEST"},
                         CommandOptions{.working_dir = dir.path(),
                                        .env = {"STORYLOOP_TEST=42"}});

  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->success());
  auto expected = std::filesystem::canonical(dir.path()).string() + "\n42\n";
  EXPECT_EQ(out->stdout_output, expected);
}

TEST(RunCommandTest, Timeout_KillsProcessGroup) {
  auto start = std::chrono::steady_clock::now();
  auto out = run_command({"sh", "-c", "sleep 10"},
                         CommandOptions{.timeout = 200ms});
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(out.has_value());
  EXPECT_TRUE(out->timed_out);
  EXPECT_FALSE(out->success());
  EXPECT_LT(elapsed, 5s);
}

TEST(RunCommandTest, EmptyArgv_InvalidArgument) {
  auto out = run_command({});

  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), make_error_code(Error::InvalidArgument));
}

TEST(RunCommandTest, MissingBinary_Exit127) {
  auto out = run_command({"storyloop-no-such-binary"});

  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->exit_code, 127);
}

TEST(ProcessProbeTest, IsProcessRunning) {
  EXPECT_EQ(is_process_running(::getpid()), true);
  EXPECT_FALSE(is_process_running(0).has_value());
}

TEST(BuildEnvironmentTest, ExtraOverridesInherited) {
  ::setenv("STORYLOOP_ENV_TEST", "old", 1);

  auto env = build_environment({"STORYLOOP_ENV_TEST=new"});

  EXPECT_EQ(std::ranges::count(env, "STORYLOOP_ENV_TEST=new"), 1);
  EXPECT_EQ(std::ranges::count(env, "STORYLOOP_ENV_TEST=old"), 0);
  ::unsetenv("STORYLOOP_ENV_TEST");
}

TEST(ExpandCommandTest, ReplacesKnownPlaceholders) {
  auto cmd = expand_command("agent --story {story_id} --dir {worktree} {other}",
                            {{"story_id", "US-001"}, {"worktree", "/tmp/wt"}});

  EXPECT_EQ(cmd, "agent --story US-001 --dir /tmp/wt {other}");
  EXPECT_EQ(expand_command("no braces {", {{"x", "y"}}), "no braces {");
}

TEST(ExpandCommandTest, QuotesValuesForTheShell) {
  auto cmd = expand_command("agent --title {title} --story {task_id}",
                            {{"title", "Fix user's login $(rm -rf ~)"},
                             {"task_id", "US-001"}});

  EXPECT_EQ(cmd,
            "agent --title 'Fix user'\\''s login $(rm -rf ~)' --story US-001");
}

TEST(ExpandCommandTest, QuotedValueRoundTripsThroughShell) {
  std::string title = "it's \"done\" `now` $HOME; echo no";

  auto result = run_command(
      {"sh", "-c", expand_command("printf %s {title}", {{"title", title}})});

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->exit_code, 0);
  EXPECT_EQ(result->stdout_output, title);
}

TEST(ShellQuoteTest, EmptyAndSafeValues) {
  EXPECT_EQ(shell_quote(""), "''");
  EXPECT_EQ(shell_quote("/tmp/wt-1"), "/tmp/wt-1");
  EXPECT_EQ(shell_quote("a b"), "'a b'");
}

class ProcessExecutorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
  }

  auto spec(std::string command) -> LaunchSpec {
    return LaunchSpec{.worker_id = worker_id("US-001-a1"),
                      .task_id = task_id("US-001"),
                      .command = std::move(command),
                      .working_dir = dir_.path(),
                      .log_file = dir_.path() / "logs" / "US-001-a1.log",
                      .env = {"STORY_ID=US-001"}};
  }

  test::TempDir dir_;
  std::unique_ptr<IExecutor> executor_ = create_process_executor();
};

TEST_F(ProcessExecutorTest, Launch_WritesLogAndReportsExit) {
  auto process = executor_->launch(spec("echo story $STORY_ID; exit 5"));

  ASSERT_TRUE(process.has_value());
  EXPECT_GT((*process)->pid(), 0);
  EXPECT_EQ(wait_for_exit(**process), 5);
  EXPECT_EQ((*process)->poll(), 5);
  EXPECT_EQ(test::read_text(dir_.path() / "logs" / "US-001-a1.log"),
            "story US-001\n");
}

TEST_F(ProcessExecutorTest, Launch_RunsInWorkingDir) {
  auto process = executor_->launch(spec("touch marker"));

  ASSERT_TRUE(process.has_value());
  EXPECT_EQ(wait_for_exit(**process), 0);
  EXPECT_TRUE(std::filesystem::exists(dir_.path() / "marker"));
}

TEST_F(ProcessExecutorTest, Kill_ReportsSigkill) {
  auto process = executor_->launch(spec("sleep 30"));
  ASSERT_TRUE(process.has_value());

  EXPECT_FALSE((*process)->poll().has_value());
  auto code = (*process)->kill();

  EXPECT_EQ(code, kKilledExitCode);
  EXPECT_EQ((*process)->poll(), kKilledExitCode);
}
