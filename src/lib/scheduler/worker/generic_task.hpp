#pragma once

#include <functional>

#include "abstract_task.hpp"

namespace skyread {

/**
 * A task for any kind of work that fits into a void()-function.
 *
 * auto scheduler = std::make_shared<TaskScheduler>(2);
 * std::atomic_uint32_t counter = 0;
 *
 * auto task_0 = std::make_shared<GenericTask>([&counter]() { counter++; });
 * auto task_1 = std::make_shared<GenericTask>([&counter]() { counter++; });
 * scheduler->ScheduleAndWaitForTasks({task_0, task_1});
 *
 * // counter == 2 now
 */
class GenericTask : public AbstractTask {
 public:
  explicit GenericTask(std::function<void()> task_function) : task_function_(std::move(task_function)) {}

 protected:
  void OnExecute() override;

 private:
  std::function<void()> task_function_;
};

}  // namespace skyread
