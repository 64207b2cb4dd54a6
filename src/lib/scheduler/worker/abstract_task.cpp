#include "abstract_task.hpp"

#include <algorithm>
#include <utility>

#include "utils/assert.hpp"

namespace skyread {

TaskId AbstractTask::Id() const { return id_; }

void AbstractTask::SetId(TaskId id) { id_ = id; }

bool AbstractTask::IsReady() const { return pending_predecessors_ == 0; }

bool AbstractTask::IsScheduled() const { return state_ >= TaskState::kScheduled; }

bool AbstractTask::IsDone() const { return state_ == TaskState::kDone; }

std::string AbstractTask::Description() const {
  return description_.empty() ? "{Task with id: " + std::to_string(id_) + "}" : description_;
}

void AbstractTask::SetDescription(std::string description) {
  DebugAssert(!IsScheduled(), "Possible race: Do not set the description after the task was scheduled.");
  description_ = std::move(description);
}

void AbstractTask::SetAsPredecessorOf(const std::shared_ptr<AbstractTask>& successor) {
  DebugAssert(!successor->IsScheduled(), "Dependencies must be set before the successor is scheduled.");

  if (std::ranges::find(successors_, successor) != successors_.cend()) {
    return;
  }

  successors_.push_back(successor);
  successor->predecessors_.emplace_back(shared_from_this());

  const std::lock_guard<std::mutex> lock(done_condition_variable_mutex_);
  if (!IsDone()) {
    ++successor->pending_predecessors_;
  }
}

std::vector<std::shared_ptr<AbstractTask>> AbstractTask::Predecessors() const {
  std::vector<std::shared_ptr<AbstractTask>> predecessors;
  predecessors.reserve(predecessors_.size());
  for (const auto& predecessor : predecessors_) {
    if (auto locked_predecessor = predecessor.lock()) {
      predecessors.push_back(std::move(locked_predecessor));
    }
  }
  return predecessors;
}

const std::vector<std::shared_ptr<AbstractTask>>& AbstractTask::Successors() const { return successors_; }

bool AbstractTask::TryTransitionToScheduled() { return TryTransitionTo(TaskState::kScheduled); }

bool AbstractTask::TryTransitionToEnqueued() { return TryTransitionTo(TaskState::kEnqueued); }

void AbstractTask::Execute() {
  const bool success_started = TryTransitionTo(TaskState::kStarted);
  Assert(success_started, "Expected successful transition to TaskState::kStarted.");
  DebugAssert(IsReady(), "Task must not be executed before its dependencies are done.");

  // Data written by the scheduling thread and by predecessors must be visible to the executing thread.
  std::atomic_thread_fence(std::memory_order_seq_cst);

  OnExecute();

  std::unique_lock<std::mutex> lock(done_condition_variable_mutex_);
  const bool success_done = TryTransitionTo(TaskState::kDone);
  Assert(success_done, "Expected successful transition to TaskState::kDone.");
  lock.unlock();

  done_condition_variable_.notify_all();
}

size_t AbstractTask::AtomicDecrementPredecessorCount() {
  Assert(pending_predecessors_ > 0, "The count of pending predecessors equals zero and cannot be decremented.");
  return --pending_predecessors_;
}

void AbstractTask::Join() {
  std::unique_lock<std::mutex> lock(done_condition_variable_mutex_);
  if (IsDone()) {
    return;
  }

  DebugAssert(IsScheduled(), "Task must be scheduled before it can be waited for.");
  done_condition_variable_.wait(lock, [&]() { return IsDone(); });
}

TaskState AbstractTask::State() const { return state_; }

bool AbstractTask::TryTransitionTo(TaskState new_state) {
  const std::lock_guard<std::mutex> lock(transition_to_mutex_);
  switch (new_state) {
    case TaskState::kScheduled:
      if (state_ >= TaskState::kScheduled) {
        return false;
      }
      Assert(state_ == TaskState::kCreated, "Illegal state transition to TaskState::kScheduled.");
      break;
    case TaskState::kEnqueued:
      if (state_ >= TaskState::kEnqueued) {
        return false;
      }
      Assert(state_ == TaskState::kScheduled, "Illegal state transition to TaskState::kEnqueued.");
      break;
    case TaskState::kStarted:
      Assert(state_ == TaskState::kEnqueued, "Illegal state transition to TaskState::kStarted.");
      break;
    case TaskState::kDone:
      Assert(state_ == TaskState::kStarted, "Illegal state transition to TaskState::kDone.");
      break;
    default:
      Fail("Unexpected target state in AbstractTask.");
  }

  state_.exchange(new_state);
  return true;
}

}  // namespace skyread
