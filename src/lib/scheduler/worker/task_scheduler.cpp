#include "task_scheduler.hpp"

#include <algorithm>
#include <thread>

#include "utils/assert.hpp"

namespace skyread {

TaskScheduler::TaskScheduler() : TaskScheduler(std::max(1u, std::thread::hardware_concurrency())) {}

TaskScheduler::TaskScheduler(size_t num_threads) : executor_(num_threads) {}

TaskScheduler::~TaskScheduler() { WaitForAllTasks(); }

void TaskScheduler::WaitForAllTasks() {
  std::unique_lock<std::mutex> lock(lock_);
  lock_condition_.wait(lock, [&]() { return num_scheduled_tasks_ == 0; });

  // Make sure that all changes to memory are visible to the calling thread.
  std::atomic_thread_fence(std::memory_order_seq_cst);
}

void TaskScheduler::WaitForTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks) {
  if (executor_.IsExecutorThread()) {
    const auto is_finished = [&tasks]() -> bool {
      return std::ranges::all_of(tasks, [](const std::shared_ptr<AbstractTask>& task) { return task->IsDone(); });
    };

    while (!is_finished()) {
      executor_.WorkerProcessSingleItemNoWait();
    }
  } else {
    for (const auto& task : tasks) {
      task->Join();
    }
  }
}

void TaskScheduler::Schedule(const std::shared_ptr<AbstractTask>& task) {
  if (!task->TryTransitionToScheduled()) {
    return;
  }

  task->SetId(next_task_id_++);
  ++num_scheduled_tasks_;

  if (task->IsReady()) {
    Submit(task);
  } else {
    // If a task is not yet ready, its predecessors must be executed first.
    for (const auto& predecessor_task : task->Predecessors()) {
      Schedule(predecessor_task);
    }
  }
}

void TaskScheduler::Submit(const std::shared_ptr<AbstractTask>& task) {
  DebugAssert(task->IsScheduled(), "Tasks which are submitted need to be scheduled first.");
  DebugAssert(task->IsReady(), "Tasks which are submitted need to be ready first.");

  if (!task->TryTransitionToEnqueued()) {
    return;
  }

  executor_.Submit([this, task]() {
    task->Execute();
    OnTaskFinished(task);
  });
}

void TaskScheduler::OnTaskFinished(const std::shared_ptr<AbstractTask>& task) {
  for (const auto& successor : task->Successors()) {
    if (successor->AtomicDecrementPredecessorCount() == 0 && successor->IsScheduled()) {
      Submit(successor);
    }
  }

  const std::lock_guard<std::mutex> lock(lock_);
  if (--num_scheduled_tasks_ == 0) {
    lock_condition_.notify_all();
  }
}

void TaskScheduler::ScheduleTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks) {
  for (const auto& task : tasks) {
    Schedule(task);
  }
}

void TaskScheduler::ScheduleAndWaitForTasks(const std::vector<std::shared_ptr<AbstractTask>>& tasks) {
  ScheduleTasks(tasks);
  WaitForTasks(tasks);
}

size_t TaskScheduler::ThreadCount() const { return executor_.ThreadCount(); }

}  // namespace skyread
