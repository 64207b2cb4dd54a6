#pragma once

#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "abstract_cluster.hpp"
#include "read_task_builder.hpp"
#include "utils/compression.hpp"

namespace skyread {

enum class ExecutionMode { kEager, kLazy };

/**
 * The result of a read for one key: either a future of a task that was already submitted (eager mode) or a graph node
 * that has not been submitted yet (lazy mode).
 */
using ReadHandle = std::variant<TaskFuture, std::shared_ptr<const DeferredValue>>;

bool IsDispatched(const ReadHandle& handle);
bool IsDeferred(const ReadHandle& handle);

/**
 * Turns the keys under a prefix into reads on a cluster. Per call, the read tasks are either submitted right away
 * (ExecutionMode::kEager) or returned as deferred graph nodes that the caller may combine and submit later
 * (ExecutionMode::kLazy). Both modes return one handle per key in listing order and never read content themselves.
 *
 * auto [handles, error] = strategy.ReadBytes("data", "tmp/test/data", ExecutionMode::kLazy);
 * // No read happened so far.
 * const auto outcomes = cluster->Gather(strategy.Dispatch(handles));
 */
class ReadExecutionStrategy {
 public:
  ReadExecutionStrategy(ReadTaskBuilder read_task_builder, std::shared_ptr<AbstractCluster> cluster);

  /**
   * A listing error aborts the call before anything is submitted; no handles are returned in that case.
   */
  std::pair<std::vector<ReadHandle>, StorageError> ReadBytes(const std::string& bucket, const std::string& prefix,
                                                             ExecutionMode mode = ExecutionMode::kEager) const;

  /**
   * Like ReadBytes, but every read is followed by decompressing its content with @param compression.
   */
  std::pair<std::vector<ReadHandle>, StorageError> ReadText(const std::string& bucket, const std::string& prefix,
                                                            ExecutionMode mode = ExecutionMode::kEager,
                                                            CompressionType compression = CompressionType::kNone) const;

  /**
   * Submits all deferred handles with a single submission and returns one future per handle in input order. Handles
   * that are already dispatched are passed through.
   */
  std::vector<TaskFuture> Dispatch(const std::vector<ReadHandle>& handles) const;

 private:
  std::vector<ReadHandle> ToHandles(std::vector<std::shared_ptr<const DeferredValue>> nodes, ExecutionMode mode) const;

  const ReadTaskBuilder read_task_builder_;
  const std::shared_ptr<AbstractCluster> cluster_;
};

/**
 * Splits @param text at '\n'. A trailing "\r" is removed from every line and a final newline does not produce an
 * empty last line.
 */
std::vector<std::string> SplitLines(const std::string& text);

}  // namespace skyread
