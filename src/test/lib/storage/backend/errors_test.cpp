#include "storage/backend/errors.hpp"

#include <sstream>

#include <gtest/gtest.h>

namespace skyread {

class StorageErrorTest : public ::testing::Test {};

TEST_F(StorageErrorTest, SuccessIsNoError) {
  const StorageError error = StorageError::Success();
  EXPECT_FALSE(error);
  EXPECT_FALSE(error.IsError());
  EXPECT_EQ(error.GetType(), StorageErrorType::kNoError);
}

TEST_F(StorageErrorTest, OnlyTransientErrorsAreTransient) {
  EXPECT_TRUE(StorageError(StorageErrorType::kTransientIOError).IsTransient());
  EXPECT_FALSE(StorageError(StorageErrorType::kObjectNotFound).IsTransient());
  EXPECT_FALSE(StorageError(StorageErrorType::kAccessDenied).IsTransient());
}

TEST_F(StorageErrorTest, WithObjectKeepsInnermostLocation) {
  const StorageError error(StorageErrorType::kObjectNotFound, "gone");
  const StorageError located = error.WithObject("bucket", "key");
  EXPECT_EQ(located.GetType(), StorageErrorType::kObjectNotFound);
  EXPECT_EQ(located.GetMessage(), "gone");
  EXPECT_EQ(located.GetBucket(), "bucket");
  EXPECT_EQ(located.GetKey(), "key");

  const StorageError relocated = located.WithObject("other", "");
  EXPECT_EQ(relocated.GetBucket(), "bucket");
  EXPECT_EQ(relocated.GetKey(), "key");
}

TEST_F(StorageErrorTest, ToString) {
  EXPECT_EQ(StorageError(StorageErrorType::kAccessDenied).ToString(), "kAccessDenied");
  EXPECT_EQ(StorageError(StorageErrorType::kBucketNotFound, "no bucket", "data", "").ToString(),
            "kBucketNotFound (bucket: data): no bucket");

  std::ostringstream stream;
  stream << StorageError(StorageErrorType::kObjectNotFound, "The specified key does not exist.", "data", "tmp/file1");
  EXPECT_EQ(stream.str(), "kObjectNotFound (bucket: data, key: tmp/file1): The specified key does not exist.");
}

}  // namespace skyread
