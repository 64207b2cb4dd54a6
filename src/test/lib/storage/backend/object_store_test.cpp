#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "object_store_provider.hpp"

namespace skyread {

template <typename Provider>
class ObjectStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_.SetUp();
    object_store_ = provider_.GetObjectStore();
    provider_.CreateBucket(kBucket);
  }

  void TearDown() override { provider_.TearDown(); }

  std::vector<std::string> ListKeys(const std::string& prefix) {
    const auto [objects, error] = object_store_->List(kBucket, prefix, std::nullopt);
    EXPECT_FALSE(error) << error;
    std::vector<std::string> keys;
    for (const auto& object : objects) {
      keys.push_back(object.GetIdentifier());
    }
    std::ranges::sort(keys);
    return keys;
  }

  static inline const std::string kBucket = "bucket";
  Provider provider_;
  std::shared_ptr<ObjectStore> object_store_;
};

using ObjectStoreProviders = ::testing::Types<MockObjectStoreProvider, FilesystemObjectStoreProvider>;
TYPED_TEST_SUITE(ObjectStoreTest, ObjectStoreProviders, );

TYPED_TEST(ObjectStoreTest, ListEmptyBucket) {
  const auto [objects, error] = this->object_store_->List(this->kBucket, "", std::nullopt);
  EXPECT_FALSE(error);
  EXPECT_TRUE(objects.empty());
}

TYPED_TEST(ObjectStoreTest, ListMissingBucket) {
  const auto [objects, error] = this->object_store_->List("missing", "", std::nullopt);
  EXPECT_EQ(error.GetType(), StorageErrorType::kBucketNotFound);
  EXPECT_EQ(error.GetBucket(), "missing");
  EXPECT_TRUE(objects.empty());
}

TYPED_TEST(ObjectStoreTest, ListReturnsMatchingKeys) {
  this->provider_.Put(this->kBucket, "tmp/file1", "1");
  this->provider_.Put(this->kBucket, "tmp/test/file1", "22");
  this->provider_.Put(this->kBucket, "tmp/test/file2", "333");
  this->provider_.Put(this->kBucket, "top-level", "4444");

  EXPECT_EQ(this->ListKeys(""),
            std::vector<std::string>({"tmp/file1", "tmp/test/file1", "tmp/test/file2", "top-level"}));
  EXPECT_EQ(this->ListKeys("tmp/"), std::vector<std::string>({"tmp/file1", "tmp/test/file1", "tmp/test/file2"}));
  EXPECT_EQ(this->ListKeys("tmp/test/file"), std::vector<std::string>({"tmp/test/file1", "tmp/test/file2"}));
  EXPECT_EQ(this->ListKeys("t"),
            std::vector<std::string>({"tmp/file1", "tmp/test/file1", "tmp/test/file2", "top-level"}));
  EXPECT_TRUE(this->ListKeys("other").empty());
}

TYPED_TEST(ObjectStoreTest, ListReportsSizes) {
  this->provider_.Put(this->kBucket, "tmp/test/file2", "333");

  const auto [objects, error] = this->object_store_->List(this->kBucket, "tmp/", std::nullopt);
  ASSERT_FALSE(error);
  ASSERT_EQ(objects.size(), 1);
  EXPECT_FALSE(objects.front().IsKeyGroup());
  EXPECT_EQ(objects.front().GetSize(), 3);
}

TYPED_TEST(ObjectStoreTest, GetObjectReturnsIdenticalBytes) {
  const std::string content("binary\0content\xff\n", 17);
  this->provider_.Put(this->kBucket, "data/binary", content);

  std::string read_content;
  const StorageError error = this->object_store_->GetObject(this->kBucket, "data/binary", &read_content);
  EXPECT_FALSE(error);
  EXPECT_EQ(read_content, content);
}

TYPED_TEST(ObjectStoreTest, GetEmptyObject) {
  this->provider_.Put(this->kBucket, "empty", "");

  std::string read_content = "stale";
  EXPECT_FALSE(this->object_store_->GetObject(this->kBucket, "empty", &read_content));
  EXPECT_TRUE(read_content.empty());
}

TYPED_TEST(ObjectStoreTest, GetMissingObject) {
  std::string read_content;
  const StorageError error = this->object_store_->GetObject(this->kBucket, "missing", &read_content);
  EXPECT_EQ(error.GetType(), StorageErrorType::kObjectNotFound);
  EXPECT_EQ(error.GetBucket(), this->kBucket);
  EXPECT_EQ(error.GetKey(), "missing");
}

TYPED_TEST(ObjectStoreTest, GetObjectFromMissingBucket) {
  std::string read_content;
  const StorageError error = this->object_store_->GetObject("missing", "key", &read_content);
  EXPECT_EQ(error.GetType(), StorageErrorType::kBucketNotFound);
}

TYPED_TEST(ObjectStoreTest, GetDeletedObject) {
  this->provider_.Put(this->kBucket, "tmp/file1", "a");
  this->provider_.Delete(this->kBucket, "tmp/file1");

  std::string read_content;
  EXPECT_EQ(this->object_store_->GetObject(this->kBucket, "tmp/file1", &read_content).GetType(),
            StorageErrorType::kObjectNotFound);
  EXPECT_TRUE(this->ListKeys("").empty());
}

}  // namespace skyread
