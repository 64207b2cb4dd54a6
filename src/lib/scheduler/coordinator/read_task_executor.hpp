#pragma once

#include <memory>

#include "read_task_definition.hpp"
#include "storage/access/key_reader.hpp"
#include "task_future.hpp"

namespace skyread {

/**
 * Runs single read tasks on behalf of a cluster. Implementations must be safe to call concurrently.
 */
class AbstractReadTaskExecutor {
 public:
  virtual ~AbstractReadTaskExecutor() = default;

  /**
   * Blocks until the read finished. Expected failures are reported in the outcome, not thrown.
   */
  virtual TaskOutcome Execute(const ReadTaskDefinition& read_task) = 0;
};

/**
 * Reads in the calling thread through a KeyReader.
 */
class LocalReadTaskExecutor : public AbstractReadTaskExecutor {
 public:
  explicit LocalReadTaskExecutor(std::shared_ptr<ObjectStore> object_store);

  TaskOutcome Execute(const ReadTaskDefinition& read_task) override;

 private:
  const KeyReader key_reader_;
};

}  // namespace skyread
