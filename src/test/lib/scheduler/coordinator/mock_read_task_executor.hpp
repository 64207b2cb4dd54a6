#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

#include "scheduler/coordinator/read_task_executor.hpp"

namespace skyread {

/**
 * Reads through a LocalReadTaskExecutor and counts the executed read tasks. Reads of keys marked via SetThrowOnKey
 * throw instead. While blocked, reads wait before touching the object store.
 */
class MockReadTaskExecutor : public AbstractReadTaskExecutor {
 public:
  explicit MockReadTaskExecutor(std::shared_ptr<ObjectStore> object_store) : local_executor_(std::move(object_store)) {}

  TaskOutcome Execute(const ReadTaskDefinition& read_task) override {
    ++execution_count_;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      unblocked_condition_.wait(lock, [this]() { return !blocked_; });
      if (throwing_keys_.contains(read_task.key)) {
        throw std::runtime_error("Simulated executor failure.");
      }
    }
    return local_executor_.Execute(read_task);
  }

  void SetThrowOnKey(const std::string& key) {
    const std::lock_guard<std::mutex> lock(mutex_);
    throwing_keys_.insert(key);
  }

  void Block() {
    const std::lock_guard<std::mutex> lock(mutex_);
    blocked_ = true;
  }

  void Unblock() {
    {
      const std::lock_guard<std::mutex> lock(mutex_);
      blocked_ = false;
    }
    unblocked_condition_.notify_all();
  }

  size_t GetExecutionCount() const { return execution_count_; }

 private:
  LocalReadTaskExecutor local_executor_;
  std::atomic<size_t> execution_count_ = 0;
  std::set<std::string> throwing_keys_;
  bool blocked_ = false;
  std::mutex mutex_;
  std::condition_variable unblocked_condition_;
};

}  // namespace skyread
