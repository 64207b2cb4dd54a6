#pragma once

#include <future>
#include <string>
#include <vector>

#include "storage/backend/errors.hpp"

namespace skyread {

/**
 * The realized value of one task: its content, or the error it failed with.
 */
struct TaskOutcome {
  std::string content;
  StorageError error = StorageError::Success();

  bool IsSuccess() const { return !error.IsError(); }
};

/**
 * Handle to an in-flight or completed task of a cluster. Copies refer to the same task. Pass futures to
 * AbstractCluster::Gather to obtain their outcomes.
 */
class TaskFuture {
 public:
  TaskFuture(std::shared_future<TaskOutcome> future, std::string description);

  bool IsReady() const;

  /**
   * Blocks until the task finished.
   */
  const TaskOutcome& Get() const;

  const std::string& Description() const;

 private:
  std::shared_future<TaskOutcome> future_;
  std::string description_;
};

/**
 * Summarizes the outcomes of a batch:
 *  - success if every task succeeded (including the empty batch),
 *  - kPartialBatchFailure naming the number of failed tasks and the first failing object if some tasks failed,
 *  - the first failure unchanged if every task failed.
 */
StorageError CheckBatch(const std::vector<TaskOutcome>& outcomes);

}  // namespace skyread
