#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace skyread {

// ConcurrentQueue is an unbounded, thread-safe FIFO data structure that uses a single lock for every operation. Once
// closed, no new values are accepted but values already inside the queue can still be popped.
template <typename T>
class ConcurrentQueue {
 public:
  size_t Size() const {
    std::lock_guard<std::mutex> guard(queue_mutex_);

    return queue_.size();
  }

  // Adds a value to the queue. Returns `false` without adding the value if the queue has been closed.
  bool Push(T&& value) {
    std::unique_lock<std::mutex> guard(queue_mutex_);

    if (closed_) {
      return false;
    }

    queue_.push(std::move(value));
    guard.unlock();
    queue_can_read_.notify_one();
    return true;
  }

  // Moves the front value of the queue to `result` and returns `true`. If the queue is empty, this call blocks until a
  // value is available. Returns `false` once the queue is closed and drained.
  bool Pop(T* result) {
    std::unique_lock<std::mutex> guard(queue_mutex_);
    queue_can_read_.wait(guard, [&] { return !queue_.empty() || closed_; });

    if (queue_.empty()) {
      return false;
    }

    *result = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  // Non-blocking variant of Pop().
  bool TryPop(T* result) {
    std::lock_guard<std::mutex> guard(queue_mutex_);

    if (queue_.empty()) {
      return false;
    }

    *result = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  void Close() {
    std::unique_lock<std::mutex> guard(queue_mutex_);

    closed_ = true;
    guard.unlock();
    queue_can_read_.notify_all();
  }

 private:
  std::queue<T> queue_;
  mutable std::mutex queue_mutex_;
  std::condition_variable queue_can_read_;
  bool closed_ = false;
};

}  // namespace skyread
