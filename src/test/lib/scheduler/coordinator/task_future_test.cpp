#include "scheduler/coordinator/task_future.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace skyread {

namespace {

TaskOutcome Succeeded(const std::string& content) {
  TaskOutcome outcome;
  outcome.content = content;
  return outcome;
}

TaskOutcome Failed(StorageErrorType type, const std::string& key) {
  TaskOutcome outcome;
  outcome.error = StorageError(type, "failed", "data", key);
  return outcome;
}

}  // namespace

TEST(TaskFutureTest, GetBlocksUntilReady) {
  std::promise<TaskOutcome> promise;
  const TaskFuture future(promise.get_future().share(), "readKey(data/a)");
  const TaskFuture copy = future;

  EXPECT_FALSE(future.IsReady());
  EXPECT_EQ(future.Description(), "readKey(data/a)");

  promise.set_value(Succeeded("content"));
  EXPECT_TRUE(copy.IsReady());
  EXPECT_EQ(copy.Get().content, "content");
  EXPECT_TRUE(future.Get().IsSuccess());
}

TEST(TaskFutureTest, CheckBatchSucceedsWithoutFailures) {
  EXPECT_FALSE(CheckBatch({}));
  EXPECT_FALSE(CheckBatch({Succeeded("a"), Succeeded("")}));
}

TEST(TaskFutureTest, CheckBatchReportsPartialFailures) {
  const StorageError error = CheckBatch({Succeeded("a"), Failed(StorageErrorType::kObjectNotFound, "b"),
                                         Failed(StorageErrorType::kAccessDenied, "c")});

  EXPECT_EQ(error.GetType(), StorageErrorType::kPartialBatchFailure);
  EXPECT_EQ(error.GetBucket(), "data");
  EXPECT_EQ(error.GetKey(), "b");
  EXPECT_THAT(error.GetMessage(), ::testing::HasSubstr("2 of 3 tasks failed"));
  EXPECT_THAT(error.GetMessage(), ::testing::HasSubstr("kObjectNotFound"));
}

TEST(TaskFutureTest, CheckBatchReturnsFirstErrorIfAllFailed) {
  const StorageError error =
      CheckBatch({Failed(StorageErrorType::kAccessDenied, "a"), Failed(StorageErrorType::kObjectNotFound, "b")});

  EXPECT_EQ(error.GetType(), StorageErrorType::kAccessDenied);
  EXPECT_EQ(error.GetKey(), "a");
}

}  // namespace skyread
