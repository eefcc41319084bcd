#include "storyloop/retry/retry_handler.hpp"
#include "storyloop/util/fs.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <nlohmann/json.hpp>

using namespace storyloop;
using storyloop::test::task_id;

class RetryHandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    handler_ = std::make_unique<RetryHandler>(
        RetryConfig{.max_retries = 3,
                    .base_backoff_sec = 60.0,
                    .backoff_multiplier = 2.0},
        dir_.path() / "retries.jsonl", "run_test");
  }

  test::TempDir dir_;
  std::unique_ptr<RetryHandler> handler_;
};

TEST(FailureTypeTest, Eligibility) {
  EXPECT_TRUE(is_retry_eligible(FailureType::ApiError));
  EXPECT_TRUE(is_retry_eligible(FailureType::Timeout));
  EXPECT_TRUE(is_retry_eligible(FailureType::ResourceExhaustion));
  EXPECT_TRUE(is_retry_eligible(FailureType::CoordinatorError));
  EXPECT_TRUE(is_retry_eligible(FailureType::Unknown));
  EXPECT_FALSE(is_retry_eligible(FailureType::Bug));
  EXPECT_FALSE(is_retry_eligible(FailureType::LogicError));
  EXPECT_FALSE(is_retry_eligible(FailureType::QualityGateFailure));
}

TEST(FailureTypeTest, Parse_UnrecognisedIsUnknown) {
  EXPECT_EQ(parse_failure_type("timeout"), FailureType::Timeout);
  EXPECT_EQ(parse_failure_type("quality_gate_failure"),
            FailureType::QualityGateFailure);
  EXPECT_EQ(parse_failure_type("cosmic_ray"), FailureType::Unknown);
  EXPECT_EQ(to_string_view(FailureType::ResourceExhaustion),
            "resource_exhaustion");
}

TEST_F(RetryHandlerTest, Grant_BackoffDoublesPerAttempt) {
  auto first = handler_->should_retry(task_id("A"), FailureType::ApiError, 0);
  auto second = handler_->should_retry(task_id("A"), FailureType::ApiError, 1);
  auto third = handler_->should_retry(task_id("A"), FailureType::ApiError, 2);

  EXPECT_TRUE(first.should_retry);
  EXPECT_DOUBLE_EQ(first.backoff.count(), 60.0);
  EXPECT_EQ(first.attempts_remaining, 2);
  EXPECT_DOUBLE_EQ(second.backoff.count(), 120.0);
  EXPECT_DOUBLE_EQ(third.backoff.count(), 240.0);
  EXPECT_EQ(third.attempts_remaining, 0);
  EXPECT_EQ(handler_->retry_count(task_id("A")), 3);
}

TEST_F(RetryHandlerTest, Deny_AtCeiling) {
  auto decision = handler_->should_retry(task_id("A"), FailureType::Timeout, 3);

  EXPECT_FALSE(decision.should_retry);
  EXPECT_EQ(decision.verdict, RetryVerdict::MaxRetriesExceeded);
  EXPECT_NE(decision.reason.find("Maximum retries exceeded"), std::string::npos);
  EXPECT_EQ(handler_->retry_count(task_id("A")), 0);
}

TEST_F(RetryHandlerTest, Deny_IneligibleTypeBelowCeiling) {
  for (int attempt : {0, 1, 2}) {
    auto decision =
        handler_->should_retry(task_id("A"), FailureType::Bug, attempt);
    EXPECT_FALSE(decision.should_retry);
    EXPECT_EQ(decision.verdict, RetryVerdict::RequiresManualIntervention)
        << "attempt " << attempt;
  }

  EXPECT_EQ(handler_->retry_count(task_id("A")), 0);
}

TEST_F(RetryHandlerTest, Deny_CeilingCheckedBeforeEligibility) {
  auto decision =
      handler_->should_retry(task_id("A"), FailureType::LogicError, 3);

  EXPECT_FALSE(decision.should_retry);
  EXPECT_EQ(decision.verdict, RetryVerdict::MaxRetriesExceeded);
  EXPECT_EQ(handler_->retry_count(task_id("A")), 0);
}

TEST_F(RetryHandlerTest, Deny_IneligibleLeavesCounterUntouched) {
  (void)handler_->should_retry(task_id("A"), FailureType::ApiError, 0);
  ASSERT_EQ(handler_->retry_count(task_id("A")), 1);

  auto decision =
      handler_->should_retry(task_id("A"), FailureType::LogicError, 1);

  EXPECT_EQ(decision.verdict, RetryVerdict::RequiresManualIntervention);
  EXPECT_EQ(handler_->retry_count(task_id("A")), 1);
}

TEST_F(RetryHandlerTest, StringOverload_UnknownNameIsRetried) {
  auto decision = handler_->should_retry(task_id("A"), "flaky_network", 0);

  EXPECT_TRUE(decision.should_retry);
}

TEST_F(RetryHandlerTest, EveryDecisionIsLogged) {
  (void)handler_->should_retry(task_id("A"), FailureType::ApiError, 0, "503");
  (void)handler_->should_retry(task_id("B"), FailureType::Bug, 0);
  handler_->record_no_retry(task_id("C"), FailureType::Timeout, 0,
                            "operator declined");

  auto records = handler_->records();

  ASSERT_TRUE(records.has_value());
  ASSERT_EQ(records->size(), 3u);
  EXPECT_EQ((*records)[0].run_id, "run_test");
  EXPECT_EQ((*records)[0].error_message, "503");
  EXPECT_TRUE((*records)[0].will_retry);
  EXPECT_FALSE((*records)[1].will_retry);
  EXPECT_EQ((*records)[2].reason, "operator declined");
  EXPECT_EQ(handler_->retry_count(task_id("C")), 0);

  auto lines = read_lines(handler_->log_path());
  ASSERT_TRUE(lines.has_value());
  ASSERT_EQ(lines->size(), 3u);
  auto line = nlohmann::json::parse(lines->front());
  EXPECT_EQ(line["story_id"], "A");
  EXPECT_EQ(line["failure_type"], "api_error");
  EXPECT_DOUBLE_EQ(line["backoff_seconds"].get<double>(), 60.0);
}

TEST_F(RetryHandlerTest, Stats_AggregatesGrantedAndDenied) {
  (void)handler_->should_retry(task_id("A"), FailureType::ApiError, 0);
  (void)handler_->should_retry(task_id("A"), FailureType::Timeout, 1);
  (void)handler_->should_retry(task_id("B"), FailureType::Timeout, 0);
  (void)handler_->should_retry(task_id("B"), FailureType::LogicError, 1);

  auto stats = handler_->stats();

  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->total_retries, 3u);
  EXPECT_EQ(stats->total_denied, 1u);
  EXPECT_EQ(stats->by_task.at("A"), 2u);
  EXPECT_EQ(stats->by_failure_type.at("timeout"), 2u);
  EXPECT_EQ(stats->recent.size(), 3u);
}

TEST_F(RetryHandlerTest, Stats_MissingLog_IsEmpty) {
  auto stats = handler_->stats();

  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->total_retries, 0u);
  EXPECT_TRUE(stats->recent.empty());
}

TEST_F(RetryHandlerTest, ResetRetryCount) {
  (void)handler_->should_retry(task_id("A"), FailureType::ApiError, 0);
  ASSERT_EQ(handler_->retry_count(task_id("A")), 1);

  handler_->reset_retry_count(task_id("A"));

  EXPECT_EQ(handler_->retry_count(task_id("A")), 0);
}
