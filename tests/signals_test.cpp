#include "storyloop/util/signals.hpp"

#include "gtest/gtest.h"

#include <csignal>

using namespace storyloop;

class SignalsTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(install_shutdown_handlers().has_value());
    clear_shutdown_request();
  }

  void TearDown() override {
    clear_shutdown_request();
  }
};

TEST_F(SignalsTest, NoSignal_NotRequested) {
  EXPECT_FALSE(shutdown_requested());
  EXPECT_EQ(shutdown_signal(), 0);
}

TEST_F(SignalsTest, Sigterm_RecordsRequest) {
  std::raise(SIGTERM);

  EXPECT_TRUE(shutdown_requested());
  EXPECT_EQ(shutdown_signal(), SIGTERM);
}

TEST_F(SignalsTest, Clear_ResetsRequest) {
  std::raise(SIGINT);

  clear_shutdown_request();

  EXPECT_FALSE(shutdown_requested());
}
