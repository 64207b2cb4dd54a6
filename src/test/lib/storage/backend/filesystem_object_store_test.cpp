#include "storage/backend/filesystem_object_store.hpp"

#include <gtest/gtest.h>

#include "object_store_provider.hpp"

namespace skyread {

class FilesystemObjectStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_.SetUp();
    provider_.CreateBucket("bucket");
  }

  void TearDown() override { provider_.TearDown(); }

  FilesystemObjectStoreProvider provider_;
};

TEST_F(FilesystemObjectStoreTest, DirectoriesAreNotObjects) {
  provider_.Put("bucket", "a/b/c", "c");

  const auto [objects, error] = provider_.GetObjectStore()->List("bucket", "", std::nullopt);
  ASSERT_FALSE(error);
  ASSERT_EQ(objects.size(), 1);
  EXPECT_EQ(objects.front().GetIdentifier(), "a/b/c");

  std::string content;
  EXPECT_EQ(provider_.GetObjectStore()->GetObject("bucket", "a/b", &content).GetType(),
            StorageErrorType::kObjectNotFound);
}

TEST_F(FilesystemObjectStoreTest, PrefixWithinDirectoryName) {
  provider_.Put("bucket", "data-0/file-0.csv", "a");
  provider_.Put("bucket", "data-1/file-0.csv", "a");
  provider_.Put("bucket", "other/file-0.csv", "a");

  const auto [objects, error] = provider_.GetObjectStore()->List("bucket", "data", std::nullopt);
  ASSERT_FALSE(error);
  EXPECT_EQ(objects.size(), 2);
}

TEST_F(FilesystemObjectStoreTest, BucketNamesMustNotContainSeparators) {
  const auto [objects, error] = provider_.GetObjectStore()->List("bucket/nested", "", std::nullopt);
  EXPECT_EQ(error.GetType(), StorageErrorType::kInvalidArgument);
}

TEST_F(FilesystemObjectStoreTest, KeysCannotLeaveTheirBucket) {
  provider_.CreateBucket("other");
  provider_.Put("other", "secret", "other-bucket");
  provider_.Put("bucket", "data/file", "a");

  std::string content;
  for (const std::string key : {"../other/secret", "data/../../other/secret", "/other/secret", "./data/file"}) {
    const StorageError error = provider_.GetObjectStore()->GetObject("bucket", key, &content);
    EXPECT_EQ(error.GetType(), StorageErrorType::kObjectNotFound) << key;
    EXPECT_EQ(error.GetKey(), key);
    EXPECT_TRUE(content.empty()) << key;
  }

  EXPECT_FALSE(provider_.GetObjectStore()->GetObject("bucket", "data/file", &content));
  EXPECT_EQ(content, "a");
}

TEST_F(FilesystemObjectStoreTest, RegularFileIsNotABucket) {
  provider_.Put("bucket", "file", "content");
  FilesystemObjectStore object_store(provider_.GetRootDirectory() + "/bucket");

  const auto [objects, error] = object_store.List("file", "", std::nullopt);
  EXPECT_EQ(error.GetType(), StorageErrorType::kBucketNotFound);
}

}  // namespace skyread
