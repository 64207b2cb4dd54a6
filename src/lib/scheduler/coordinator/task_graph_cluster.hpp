#pragma once

#include <memory>
#include <vector>

#include "abstract_cluster.hpp"
#include "read_task_executor.hpp"
#include "scheduler/worker/task_scheduler.hpp"

namespace skyread {

/**
 * A cluster that turns computation graphs into dependent tasks and runs them on a thread pool. Read nodes are handed
 * to a read task executor, which either reads in-process or invokes remote workers. Inner nodes run once all of their
 * inputs are done. An inner node whose input failed does not run its function and fails with the error of its first
 * failing input.
 */
class TaskGraphCluster : public AbstractCluster, public Noncopyable {
 public:
  TaskGraphCluster(std::shared_ptr<AbstractReadTaskExecutor> read_task_executor, size_t num_threads);

  using AbstractCluster::Submit;
  std::vector<TaskFuture> Submit(const std::vector<std::shared_ptr<const DeferredValue>>& outputs) override;

  /**
   * Blocks until every submitted task is done.
   */
  void WaitForAllTasks();

  size_t ThreadCount() const;

 private:
  const std::shared_ptr<AbstractReadTaskExecutor> read_task_executor_;
  TaskScheduler scheduler_;
};

}  // namespace skyread
