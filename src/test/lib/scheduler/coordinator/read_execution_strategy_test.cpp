#include "scheduler/coordinator/read_execution_strategy.hpp"

#include <algorithm>

#include <gtest/gtest.h>

#include "scheduler/coordinator/mock_read_task_executor.hpp"
#include "scheduler/coordinator/task_graph_cluster.hpp"
#include "storage/backend/mock_object_store.hpp"

namespace skyread {

class ReadExecutionStrategyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    object_store_ = std::make_shared<MockObjectStore>();
    object_store_->CreateBucket(kBucket);
    for (size_t directory = 0; directory < 3; ++directory) {
      for (size_t file = 0; file < 2; ++file) {
        object_store_->Put(kBucket,
                           "tmp/test/data-" + std::to_string(directory) + "/file-" + std::to_string(file) + ".csv", "a");
      }
    }
    object_store_->Put(kBucket, "tmp/other/file-0.csv", "b");

    read_task_executor_ = std::make_shared<MockReadTaskExecutor>(object_store_);
    cluster_ = std::make_shared<TaskGraphCluster>(read_task_executor_, 4);
    strategy_ = std::make_unique<ReadExecutionStrategy>(
        ReadTaskBuilder(std::make_shared<ListingEngine>(object_store_)), cluster_);
  }

  static std::vector<std::string> Contents(const std::vector<TaskOutcome>& outcomes) {
    std::vector<std::string> contents;
    for (const auto& outcome : outcomes) {
      EXPECT_TRUE(outcome.IsSuccess()) << outcome.error;
      contents.push_back(outcome.content);
    }
    return contents;
  }

  const std::string kBucket = "data";
  const std::string kPrefix = "tmp/test/data";
  std::shared_ptr<MockObjectStore> object_store_;
  std::shared_ptr<MockReadTaskExecutor> read_task_executor_;
  std::shared_ptr<TaskGraphCluster> cluster_;
  std::unique_ptr<ReadExecutionStrategy> strategy_;
};

TEST_F(ReadExecutionStrategyTest, EagerReadBytes) {
  const auto [handles, error] = strategy_->ReadBytes(kBucket, kPrefix, ExecutionMode::kEager);

  ASSERT_FALSE(error) << error;
  ASSERT_EQ(handles.size(), 6);
  EXPECT_TRUE(std::ranges::all_of(handles, IsDispatched));

  const auto outcomes = cluster_->Gather(strategy_->Dispatch(handles));
  EXPECT_EQ(Contents(outcomes), std::vector<std::string>(6, "a"));
  EXPECT_EQ(read_task_executor_->GetExecutionCount(), 6);
}

TEST_F(ReadExecutionStrategyTest, LazyReadBytesDefersAllReads) {
  const auto [handles, error] = strategy_->ReadBytes(kBucket, kPrefix, ExecutionMode::kLazy);

  ASSERT_FALSE(error);
  ASSERT_EQ(handles.size(), 6);
  EXPECT_TRUE(std::ranges::all_of(handles, IsDeferred));
  EXPECT_EQ(read_task_executor_->GetExecutionCount(), 0);
  EXPECT_EQ(object_store_->GetGetObjectCount(), 0);

  const auto outcomes = cluster_->Gather(strategy_->Dispatch(handles));
  EXPECT_EQ(Contents(outcomes), std::vector<std::string>(6, "a"));
  EXPECT_EQ(read_task_executor_->GetExecutionCount(), 6);
}

TEST_F(ReadExecutionStrategyTest, EagerAndLazyYieldEqualResults) {
  object_store_->Put(kBucket, "tmp/test/data-1/file-0.csv", "b");
  object_store_->Put(kBucket, "tmp/test/data-2/file-1.csv", "");

  const auto [eager_handles, eager_error] = strategy_->ReadBytes(kBucket, kPrefix, ExecutionMode::kEager);
  const auto [lazy_handles, lazy_error] = strategy_->ReadBytes(kBucket, kPrefix, ExecutionMode::kLazy);
  ASSERT_FALSE(eager_error);
  ASSERT_FALSE(lazy_error);

  const auto eager_contents = Contents(cluster_->Gather(strategy_->Dispatch(eager_handles)));
  const auto lazy_contents = Contents(cluster_->Gather(strategy_->Dispatch(lazy_handles)));
  EXPECT_EQ(eager_contents.size(), 6);
  // Handles are in listing order in both modes.
  EXPECT_EQ(eager_contents, lazy_contents);
  EXPECT_EQ(eager_contents[2], "b");
  EXPECT_EQ(eager_contents[5], "");
}

TEST_F(ReadExecutionStrategyTest, HandlesFollowListingOrder) {
  const auto [handles, error] = strategy_->ReadBytes(kBucket, "tmp/", ExecutionMode::kEager);
  ASSERT_FALSE(error);
  ASSERT_EQ(handles.size(), 7);

  const auto futures = strategy_->Dispatch(handles);
  EXPECT_EQ(futures.front().Description(), "readKey(data/tmp/other/file-0.csv)");
  EXPECT_EQ(futures.back().Description(), "readKey(data/tmp/test/data-2/file-1.csv)");
}

TEST_F(ReadExecutionStrategyTest, LazyHandlesCanBeCombined) {
  const auto [handles, error] = strategy_->ReadBytes(kBucket, kPrefix, ExecutionMode::kLazy);
  ASSERT_FALSE(error);

  std::vector<std::shared_ptr<const DeferredValue>> nodes;
  for (const auto& handle : handles) {
    nodes.push_back(std::get<std::shared_ptr<const DeferredValue>>(handle));
  }
  const auto combined = DeferredValue::Combine(nodes, ConcatenateValues, "concatenate");

  const auto outcomes = cluster_->Gather({cluster_->Submit(combined)});
  ASSERT_EQ(outcomes.size(), 1);
  EXPECT_EQ(outcomes[0].content, "aaaaaa");
  EXPECT_EQ(read_task_executor_->GetExecutionCount(), 6);
}

TEST_F(ReadExecutionStrategyTest, DeletedKeyFailsOnlyItsTask) {
  for (const auto mode : {ExecutionMode::kEager, ExecutionMode::kLazy}) {
    object_store_->Put(kBucket, "tmp/test/data-1/file-1.csv", "a");

    // Listing and reading are not atomic. The key disappears while the eager reads are still queued.
    read_task_executor_->Block();
    const auto [handles, error] = strategy_->ReadBytes(kBucket, kPrefix, mode);
    ASSERT_FALSE(error);
    ASSERT_EQ(handles.size(), 6);
    object_store_->Delete(kBucket, "tmp/test/data-1/file-1.csv");
    read_task_executor_->Unblock();

    const auto outcomes = cluster_->Gather(strategy_->Dispatch(handles));
    ASSERT_EQ(outcomes.size(), 6);
    EXPECT_EQ(outcomes[3].error.GetType(), StorageErrorType::kObjectNotFound);
    EXPECT_EQ(outcomes[3].error.GetKey(), "tmp/test/data-1/file-1.csv");

    const StorageError batch_error = CheckBatch(outcomes);
    EXPECT_EQ(batch_error.GetType(), StorageErrorType::kPartialBatchFailure);
    EXPECT_EQ(batch_error.GetKey(), "tmp/test/data-1/file-1.csv");

    for (size_t i = 0; i < outcomes.size(); ++i) {
      if (i != 3) {
        EXPECT_EQ(outcomes[i].content, "a");
      }
    }
  }
}

TEST_F(ReadExecutionStrategyTest, ListingErrorAbortsBeforeSubmission) {
  object_store_->SetSimulateError(kBucket, StorageErrorType::kAccessDenied);

  for (const auto mode : {ExecutionMode::kEager, ExecutionMode::kLazy}) {
    const auto [handles, error] = strategy_->ReadBytes(kBucket, kPrefix, mode);
    EXPECT_EQ(error.GetType(), StorageErrorType::kAccessDenied);
    EXPECT_TRUE(handles.empty());
  }
  EXPECT_EQ(read_task_executor_->GetExecutionCount(), 0);
}

TEST_F(ReadExecutionStrategyTest, EmptyPrefixMatch) {
  for (const auto mode : {ExecutionMode::kEager, ExecutionMode::kLazy}) {
    const auto [handles, error] = strategy_->ReadBytes(kBucket, "missing/", mode);
    EXPECT_FALSE(error);
    EXPECT_TRUE(handles.empty());
    EXPECT_TRUE(strategy_->Dispatch(handles).empty());
  }
  EXPECT_EQ(read_task_executor_->GetExecutionCount(), 0);
}

TEST_F(ReadExecutionStrategyTest, DispatchMixedHandles) {
  const auto [eager_handles, eager_error] = strategy_->ReadBytes(kBucket, "tmp/other/", ExecutionMode::kEager);
  const auto [lazy_handles, lazy_error] = strategy_->ReadBytes(kBucket, "tmp/test/data-0/", ExecutionMode::kLazy);
  ASSERT_FALSE(eager_error);
  ASSERT_FALSE(lazy_error);

  std::vector<ReadHandle> handles = lazy_handles;
  handles.insert(handles.begin() + 1, eager_handles.front());

  const auto outcomes = cluster_->Gather(strategy_->Dispatch(handles));
  EXPECT_EQ(Contents(outcomes), std::vector<std::string>({"a", "b", "a"}));
}

TEST_F(ReadExecutionStrategyTest, ReadTextDecompresses) {
  object_store_->Put(kBucket, "logs/part-0.gz", Compress("line 1\r\nline 2\n", CompressionType::kGzip));
  object_store_->Put(kBucket, "logs/part-1.gz", Compress("line 3", CompressionType::kGzip));

  const auto [handles, error] = strategy_->ReadText(kBucket, "logs/", ExecutionMode::kLazy, CompressionType::kGzip);
  ASSERT_FALSE(error);
  ASSERT_EQ(handles.size(), 2);
  EXPECT_EQ(std::get<std::shared_ptr<const DeferredValue>>(handles[0])->Description(),
            "decompressGzip(readKey(data/logs/part-0.gz))");

  const auto contents = Contents(cluster_->Gather(strategy_->Dispatch(handles)));
  ASSERT_EQ(contents.size(), 2);
  EXPECT_EQ(SplitLines(contents[0]), std::vector<std::string>({"line 1", "line 2"}));
  EXPECT_EQ(SplitLines(contents[1]), std::vector<std::string>({"line 3"}));
}

TEST_F(ReadExecutionStrategyTest, ReadTextWithCorruptContent) {
  object_store_->Put(kBucket, "logs/part-0.gz", "not gzip");

  const auto [handles, error] = strategy_->ReadText(kBucket, "logs/", ExecutionMode::kEager, CompressionType::kGzip);
  ASSERT_FALSE(error);

  const auto outcomes = cluster_->Gather(strategy_->Dispatch(handles));
  ASSERT_EQ(outcomes.size(), 1);
  EXPECT_EQ(outcomes[0].error.GetType(), StorageErrorType::kInternalError);
}

TEST_F(ReadExecutionStrategyTest, ReadTextWithoutCompressionReadsBytes) {
  const auto [handles, error] = strategy_->ReadText(kBucket, "tmp/other/");
  ASSERT_FALSE(error);
  ASSERT_EQ(handles.size(), 1);
  ASSERT_TRUE(IsDispatched(handles[0]));
  EXPECT_EQ(std::get<TaskFuture>(handles[0]).Description(), "readKey(data/tmp/other/file-0.csv)");
}

TEST(SplitLinesTest, SplitLines) {
  EXPECT_TRUE(SplitLines("").empty());
  EXPECT_EQ(SplitLines("a\nb\n"), std::vector<std::string>({"a", "b"}));
  EXPECT_EQ(SplitLines("a\r\n\nb"), std::vector<std::string>({"a", "", "b"}));
}

}  // namespace skyread
