#include "task_executor.hpp"

#include "utils/assert.hpp"

namespace skyread {

TaskExecutor::TaskExecutor(size_t num_threads) {
  Assert(num_threads > 0, "A TaskExecutor requires at least one thread.");
  // Worker threads may only consult thread_ids_ after all of them are registered.
  const std::lock_guard<std::mutex> lock(thread_ids_mutex_);
  thread_pool_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    thread_pool_.emplace_back([this]() { WorkerMain(); });
    thread_ids_.insert(thread_pool_.back().get_id());
  }
}

TaskExecutor::~TaskExecutor() {
  queue_.Close();
  for (auto& thread : thread_pool_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

bool TaskExecutor::IsExecutorThread() const {
  const std::lock_guard<std::mutex> lock(thread_ids_mutex_);
  return thread_ids_.contains(std::this_thread::get_id());
}

size_t TaskExecutor::ThreadCount() const { return thread_pool_.size(); }

void TaskExecutor::WorkerMain() {
  std::function<void()> job;
  while (queue_.Pop(&job)) {
    job();
  }
}

void TaskExecutor::WorkerProcessSingleItemNoWait() {
  DebugAssert(IsExecutorThread(), "This function should only be called from an executor thread.");

  std::function<void()> job;
  if (queue_.TryPop(&job)) {
    job();
  } else {
    std::this_thread::yield();
  }
}

void TaskExecutor::Submit(std::function<void(void)> job) {
  const bool accepted = queue_.Push(std::move(job));
  Assert(accepted, "Cannot submit a job to a TaskExecutor that is shutting down.");
}

}  // namespace skyread
