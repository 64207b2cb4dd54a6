#pragma once

#include <memory>
#include <vector>

#include "deferred_value.hpp"
#include "read_task_definition.hpp"
#include "task_future.hpp"

namespace skyread {

/**
 * The capability to execute computation graphs. Clusters are passed explicitly to whoever submits work; there is no
 * global cluster connection.
 */
class AbstractCluster {
 public:
  virtual ~AbstractCluster() = default;

  /**
   * Submits the graphs rooted at @param outputs and returns one future per output in input order. Returns without
   * waiting for the tasks to finish.
   */
  virtual std::vector<TaskFuture> Submit(const std::vector<std::shared_ptr<const DeferredValue>>& outputs) = 0;

  TaskFuture Submit(const std::shared_ptr<const DeferredValue>& output);
  TaskFuture Submit(const ReadTaskDefinition& read_task);

  /**
   * Blocks until all @param futures are done and returns their outcomes in input order. A failed task does not
   * affect the outcomes of its siblings.
   */
  virtual std::vector<TaskOutcome> Gather(const std::vector<TaskFuture>& futures);
};

}  // namespace skyread
