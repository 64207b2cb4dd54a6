#include "read_execution_strategy.hpp"

#include <aws/core/utils/logging/LogMacros.h>
#include <magic_enum/magic_enum.hpp>

#include "constants.hpp"
#include "utils/assert.hpp"
#include "utils/string.hpp"

namespace skyread {

bool IsDispatched(const ReadHandle& handle) { return std::holds_alternative<TaskFuture>(handle); }

bool IsDeferred(const ReadHandle& handle) { return std::holds_alternative<std::shared_ptr<const DeferredValue>>(handle); }

ReadExecutionStrategy::ReadExecutionStrategy(ReadTaskBuilder read_task_builder,
                                             std::shared_ptr<AbstractCluster> cluster)
    : read_task_builder_(std::move(read_task_builder)), cluster_(std::move(cluster)) {
  Assert(cluster_ != nullptr, "ReadExecutionStrategy requires a cluster.");
}

std::pair<std::vector<ReadHandle>, StorageError> ReadExecutionStrategy::ReadBytes(const std::string& bucket,
                                                                                  const std::string& prefix,
                                                                                  ExecutionMode mode) const {
  auto [read_tasks, error] = read_task_builder_.Build(bucket, prefix);
  if (error) {
    return {{}, error};
  }

  std::vector<std::shared_ptr<const DeferredValue>> nodes;
  nodes.reserve(read_tasks.size());
  for (auto& read_task : read_tasks) {
    nodes.push_back(DeferredValue::Read(std::move(read_task)));
  }

  return {ToHandles(std::move(nodes), mode), StorageError::Success()};
}

std::pair<std::vector<ReadHandle>, StorageError> ReadExecutionStrategy::ReadText(const std::string& bucket,
                                                                                 const std::string& prefix,
                                                                                 ExecutionMode mode,
                                                                                 CompressionType compression) const {
  auto [read_tasks, error] = read_task_builder_.Build(bucket, prefix);
  if (error) {
    return {{}, error};
  }

  std::vector<std::shared_ptr<const DeferredValue>> nodes;
  nodes.reserve(read_tasks.size());
  for (auto& read_task : read_tasks) {
    auto read = DeferredValue::Read(std::move(read_task));
    if (compression == CompressionType::kNone) {
      nodes.push_back(std::move(read));
    } else {
      nodes.push_back(DeferredValue::Map(
          std::move(read), [compression](const std::string& content) { return Decompress(content, compression); },
          "decompress" + std::string(magic_enum::enum_name(compression).substr(kConstPrefix.size()))));
    }
  }

  return {ToHandles(std::move(nodes), mode), StorageError::Success()};
}

std::vector<TaskFuture> ReadExecutionStrategy::Dispatch(const std::vector<ReadHandle>& handles) const {
  std::vector<std::shared_ptr<const DeferredValue>> deferred_nodes;
  for (const auto& handle : handles) {
    if (IsDeferred(handle)) {
      deferred_nodes.push_back(std::get<std::shared_ptr<const DeferredValue>>(handle));
    }
  }

  std::vector<TaskFuture> submitted_futures;
  if (!deferred_nodes.empty()) {
    submitted_futures = cluster_->Submit(deferred_nodes);
  }

  std::vector<TaskFuture> futures;
  futures.reserve(handles.size());
  auto submitted_future = submitted_futures.cbegin();
  for (const auto& handle : handles) {
    if (IsDispatched(handle)) {
      futures.push_back(std::get<TaskFuture>(handle));
    } else {
      futures.push_back(*submitted_future++);
    }
  }
  return futures;
}

std::vector<ReadHandle> ReadExecutionStrategy::ToHandles(std::vector<std::shared_ptr<const DeferredValue>> nodes,
                                                         ExecutionMode mode) const {
  std::vector<ReadHandle> handles;
  handles.reserve(nodes.size());

  switch (mode) {
    case ExecutionMode::kEager: {
      // An empty batch is not submitted at all.
      if (nodes.empty()) {
        break;
      }
      auto futures = cluster_->Submit(nodes);
      Assert(futures.size() == nodes.size(), "Expected the cluster to return one future per submitted node.");
      for (auto& future : futures) {
        handles.emplace_back(std::move(future));
      }
      AWS_LOGSTREAM_DEBUG(kCoordinatorTag.c_str(), "Dispatched " << handles.size() << " reads.");
      break;
    }
    case ExecutionMode::kLazy:
      for (auto& node : nodes) {
        handles.emplace_back(std::move(node));
      }
      AWS_LOGSTREAM_DEBUG(kCoordinatorTag.c_str(), "Deferred " << handles.size() << " reads.");
      break;
    default:
      Fail("Unexpected execution mode.");
  }

  return handles;
}

std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines = SplitStringByDelimiter(text, '\n');
  for (auto& line : lines) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
  }
  return lines;
}

}  // namespace skyread
