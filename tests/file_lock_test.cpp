#include "storyloop/merge/file_lock.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <unistd.h>

using namespace storyloop;
using namespace std::chrono_literals;

class FileLockTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_TRUE(dir_.valid());
    path_ = dir_.path() / "locks" / "branch_main.lock";
  }

  test::TempDir dir_;
  std::filesystem::path path_;
};

TEST_F(FileLockTest, Acquire_CreatesFileAndRecordsPid) {
  auto lock = FileLock::acquire(path_, 1s);

  ASSERT_TRUE(lock.has_value());
  EXPECT_TRUE(lock->held());
  EXPECT_TRUE(FileLock::is_locked(path_));
  EXPECT_EQ(FileLock::holder_pid(path_), ::getpid());
}

TEST_F(FileLockTest, Acquire_WhileHeld_TimesOut) {
  auto first = FileLock::acquire(path_, 1s);
  ASSERT_TRUE(first.has_value());

  auto start = std::chrono::steady_clock::now();
  auto second = FileLock::acquire(path_, 300ms);
  auto waited = std::chrono::steady_clock::now() - start;

  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), make_error_code(Error::LockTimeout));
  EXPECT_GE(waited, 300ms);
}

TEST_F(FileLockTest, Release_UnlinksAndAllowsReacquire) {
  auto first = FileLock::acquire(path_, 1s);
  ASSERT_TRUE(first.has_value());

  first->release();

  EXPECT_FALSE(first->held());
  EXPECT_FALSE(std::filesystem::exists(path_));
  EXPECT_FALSE(FileLock::is_locked(path_));
  EXPECT_TRUE(FileLock::acquire(path_, 100ms).has_value());
}

TEST_F(FileLockTest, Move_TransfersOwnership) {
  auto lock = FileLock::acquire(path_, 1s);
  ASSERT_TRUE(lock.has_value());

  FileLock moved = std::move(*lock);

  EXPECT_FALSE(lock->held());
  EXPECT_TRUE(moved.held());
  EXPECT_TRUE(FileLock::is_locked(path_));
}

TEST_F(FileLockTest, StaleFileWithoutHolder_IsNotLocked) {
  test::write_text(path_, "999999");

  EXPECT_FALSE(FileLock::is_locked(path_));
  EXPECT_TRUE(FileLock::acquire(path_, 100ms).has_value());
}

TEST_F(FileLockTest, HolderPid_Unreadable) {
  test::write_text(path_, "garbage");

  EXPECT_FALSE(FileLock::holder_pid(path_).has_value());
  EXPECT_FALSE(FileLock::holder_pid(dir_.path() / "missing.lock").has_value());
}
