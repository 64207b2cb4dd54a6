#include "read_task_executor.hpp"

namespace skyread {

LocalReadTaskExecutor::LocalReadTaskExecutor(std::shared_ptr<ObjectStore> object_store)
    : key_reader_(std::move(object_store)) {}

TaskOutcome LocalReadTaskExecutor::Execute(const ReadTaskDefinition& read_task) {
  TaskOutcome outcome;
  outcome.error = key_reader_.Read(read_task.bucket, read_task.key, &outcome.content);
  return outcome;
}

}  // namespace skyread
