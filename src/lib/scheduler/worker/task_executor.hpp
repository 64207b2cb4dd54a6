#pragma once

#include <functional>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "types.hpp"
#include "utils/concurrent/concurrent_queue.hpp"

namespace skyread {

/**
 * Fixed-size thread pool that runs submitted jobs in FIFO order. The destructor drains the queue before joining.
 */
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions,hicpp-special-member-functions)
class TaskExecutor : public Noncopyable {
 public:
  explicit TaskExecutor(size_t num_threads);
  ~TaskExecutor();

  void Submit(std::function<void(void)> job);

  /**
   * Runs at most one queued job in the calling thread. Executor threads use this to make progress while they wait.
   */
  void WorkerProcessSingleItemNoWait();
  bool IsExecutorThread() const;
  size_t ThreadCount() const;

 private:
  void WorkerMain();

  mutable std::mutex thread_ids_mutex_;
  std::set<std::thread::id> thread_ids_;
  ConcurrentQueue<std::function<void()>> queue_;
  std::vector<std::thread> thread_pool_;
};

}  // namespace skyread
