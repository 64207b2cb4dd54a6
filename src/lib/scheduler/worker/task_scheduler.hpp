#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

#include "scheduler/worker/abstract_task.hpp"
#include "scheduler/worker/task_executor.hpp"
#include "types.hpp"

namespace skyread {

/**
 * Schedules task graphs onto a TaskExecutor. A task is handed to the executor once all of its predecessors are done.
 * Scheduling a task that still has pending predecessors schedules those predecessors as well.
 */
class TaskScheduler : public Noncopyable {
 public:
  /**
   * Constructs a scheduler with a thread pool size set to the number of available hardware threads.
   */
  TaskScheduler();

  explicit TaskScheduler(size_t num_threads);

  /**
   * Waits for all scheduled tasks, so that no successor is submitted after the executor started shutting down.
   */
  ~TaskScheduler();

  /**
   * Blocks until all tasks of this scheduler are finished.
   */
  void WaitForAllTasks();

  /**
   * Schedules the given tasks for execution and returns immediately. If no asynchronicity is needed, prefer
   * ScheduleAndWaitForTasks.
   */
  void ScheduleTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks);

  /**
   * Blocks until all specified tasks are completed. Executor threads keep processing other jobs while waiting.
   */
  void WaitForTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks);

  void ScheduleAndWaitForTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks);

  void Schedule(const std::shared_ptr<AbstractTask>& task);

  size_t ThreadCount() const;

 private:
  void Submit(const std::shared_ptr<AbstractTask>& task);
  void OnTaskFinished(const std::shared_ptr<AbstractTask>& task);

  std::atomic<TaskId> next_task_id_ = 0;
  std::atomic<size_t> num_scheduled_tasks_ = 0;
  std::mutex lock_;
  std::condition_variable lock_condition_;
  // Declared last so that worker threads are joined before the members above are destroyed.
  TaskExecutor executor_;
};

}  // namespace skyread
