#include "utils/upload/upload_log.hpp"

#include <gtest/gtest.h>

#include <string>

namespace galleon {
TEST(UploadLogTest, TracksAttemptsAndOutcome) {
  UploadLog log;
  log.MarkAttempt("a.jpg");
  log.MarkFailure("a.jpg", "API error: busy");
  log.MarkAttempt("a.jpg");
  log.MarkSuccess("a.jpg");
  log.MarkAttempt("b.jpg");
  log.MarkFailure("b.jpg", "Network error: reset");

  EXPECT_EQ(log.AttemptsOf("a.jpg"), 2u);
  EXPECT_EQ(log.AttemptsOf("b.jpg"), 1u);
  EXPECT_EQ(log.AttemptsOf("c.jpg"), 0u);

  auto snapshot = log.Snapshot();
  EXPECT_EQ(snapshot.attempted_.size(), 2u);
  ASSERT_EQ(snapshot.succeeded_.size(), 1u);
  EXPECT_EQ(snapshot.succeeded_[0], "a.jpg");
  ASSERT_EQ(snapshot.failed_.size(), 1u);
  EXPECT_EQ(snapshot.failed_[0].file_name_, "b.jpg");
  EXPECT_EQ(snapshot.failed_[0].last_error_, "Network error: reset");
}

TEST(UploadLogTest, OutcomesWithoutAttemptAreIgnored) {
  UploadLog log;
  log.MarkSuccess("ghost.jpg");
  log.MarkFailure("ghost.jpg", "x");
  EXPECT_TRUE(log.Snapshot().attempted_.empty());
}

TEST(UploadLogTest, SuccessClearsLastError) {
  UploadLog log;
  log.MarkAttempt("a.jpg");
  log.MarkFailure("a.jpg", "busy");
  log.MarkAttempt("a.jpg");
  log.MarkSuccess("a.jpg");
  auto snapshot = log.Snapshot();
  ASSERT_EQ(snapshot.attempted_.size(), 1u);
  EXPECT_TRUE(snapshot.attempted_[0].succeeded_);
  EXPECT_TRUE(snapshot.attempted_[0].last_error_.empty());
}
};  // namespace galleon
