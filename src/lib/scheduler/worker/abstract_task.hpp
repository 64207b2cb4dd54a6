#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "types.hpp"

namespace skyread {

/**
 * @brief Task states and their transitions:
 *
 *    kCreated --Schedule()--> kScheduled --Submit()--> kEnqueued --Execute()--> kStarted --OnExecute() returns--> kDone
 *
 *  1. All tasks are initialized in TaskState::kCreated.
 *  2. A task changes to TaskState::kScheduled once a TaskScheduler accepted it.
 *  3. Once all predecessors are done, the scheduler hands the task to the executor queue (TaskState::kEnqueued).
 *  4. An executor thread picks the task up (TaskState::kStarted) and runs OnExecute().
 *  5. Afterwards, the task is TaskState::kDone and its successors may become ready.
 */

// The state enum values are declared in progressive order to allow for comparisons involving the >, >= operators.
enum class TaskState { kCreated, kScheduled, kEnqueued, kStarted, kDone };
static_assert(static_cast<std::underlying_type_t<TaskState>>(TaskState::kCreated) == 0,
              "TaskState::kCreated is not equal to 0. TaskState enum values are expected to be ordered.");

/**
 * Base class for anything that can be scheduled by a TaskScheduler and executed by a TaskExecutor. Tasks form a
 * directed acyclic graph via SetAsPredecessorOf(). Derive and implement the logic in OnExecute().
 */
class AbstractTask : public std::enable_shared_from_this<AbstractTask> {
 public:
  virtual ~AbstractTask() = default;

  TaskId Id() const;

  /**
   * Ids are assigned by the TaskScheduler when the task is scheduled.
   */
  void SetId(TaskId id);

  /**
   * @return All predecessors are done.
   */
  bool IsReady() const;
  bool IsScheduled() const;
  bool IsDone() const;

  /**
   * Description for logging and debugging purposes.
   */
  std::string Description() const;
  void SetDescription(std::string description);

  /**
   * Makes this task a dependency of @param successor, which will not be executed before this task is done.
   */
  void SetAsPredecessorOf(const std::shared_ptr<AbstractTask>& successor);

  /**
   * Tasks only hold their successors. Predecessors that were already destroyed are omitted.
   */
  std::vector<std::shared_ptr<AbstractTask>> Predecessors() const;
  const std::vector<std::shared_ptr<AbstractTask>>& Successors() const;

  [[nodiscard]] bool TryTransitionToScheduled();
  [[nodiscard]] bool TryTransitionToEnqueued();

  /**
   * Executes the task in the current thread and blocks until it is finished.
   */
  void Execute();

  /**
   * Called by a predecessor when it finished execution.
   * @return the number of predecessors that are still pending.
   */
  size_t AtomicDecrementPredecessorCount();

  /**
   * Blocks the calling thread until the task finished executing.
   */
  void Join();

  TaskState State() const;

 protected:
  virtual void OnExecute() = 0;

  /**
   * Transitions the task's state to @param new_state.
   * @return true on success and false if another thread was faster in progressing this task's state.
   */
  [[nodiscard]] bool TryTransitionTo(TaskState new_state);

 private:
  std::atomic<TaskId> id_ = kInvalidTaskId;

  std::atomic_uint32_t pending_predecessors_ = 0;
  std::vector<std::weak_ptr<AbstractTask>> predecessors_;
  std::vector<std::shared_ptr<AbstractTask>> successors_;

  std::atomic<TaskState> state_ = TaskState::kCreated;
  std::mutex transition_to_mutex_;

  std::condition_variable done_condition_variable_;
  std::mutex done_condition_variable_mutex_;

  std::string description_;
};

}  // namespace skyread
