#include "storage/access/key_reader.hpp"

#include <gtest/gtest.h>

#include "storage/backend/mock_object_store.hpp"

namespace skyread {

class KeyReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    object_store_ = std::make_shared<MockObjectStore>();
    object_store_->CreateBucket("bucket");
    object_store_->Put("bucket", "tmp/file1", std::string("a\0b", 3));
    key_reader_ = std::make_unique<KeyReader>(object_store_);
  }

  std::shared_ptr<MockObjectStore> object_store_;
  std::unique_ptr<KeyReader> key_reader_;
};

TEST_F(KeyReaderTest, ReadReturnsCompleteContent) {
  std::string content;
  EXPECT_FALSE(key_reader_->Read("bucket", "tmp/file1", &content));
  EXPECT_EQ(content, std::string("a\0b", 3));
  EXPECT_EQ(object_store_->GetGetObjectCount(), 1);
}

TEST_F(KeyReaderTest, ReadMissingKey) {
  std::string content = "stale";
  const StorageError error = key_reader_->Read("bucket", "tmp/file2", &content);
  EXPECT_EQ(error.GetType(), StorageErrorType::kObjectNotFound);
  EXPECT_EQ(error.GetBucket(), "bucket");
  EXPECT_EQ(error.GetKey(), "tmp/file2");
  EXPECT_TRUE(content.empty());
}

TEST_F(KeyReaderTest, ReadDeletedKey) {
  object_store_->Delete("bucket", "tmp/file1");

  std::string content;
  EXPECT_EQ(key_reader_->Read("bucket", "tmp/file1", &content).GetType(), StorageErrorType::kObjectNotFound);
}

TEST_F(KeyReaderTest, ReadDoesNotRetry) {
  object_store_->SetSimulateError("bucket", StorageErrorType::kTransientIOError);

  std::string content;
  const StorageError error = key_reader_->Read("bucket", "tmp/file1", &content);
  EXPECT_TRUE(error.IsTransient());
  EXPECT_EQ(error.GetKey(), "tmp/file1");
  EXPECT_EQ(object_store_->GetGetObjectCount(), 1);
}

}  // namespace skyread
