#include "task_future.hpp"

#include <algorithm>
#include <chrono>

#include "utils/assert.hpp"

namespace skyread {

TaskFuture::TaskFuture(std::shared_future<TaskOutcome> future, std::string description)
    : future_(std::move(future)), description_(std::move(description)) {
  Assert(future_.valid(), "A TaskFuture requires shared state.");
}

bool TaskFuture::IsReady() const { return future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }

const TaskOutcome& TaskFuture::Get() const { return future_.get(); }

const std::string& TaskFuture::Description() const { return description_; }

StorageError CheckBatch(const std::vector<TaskOutcome>& outcomes) {
  const auto first_failure =
      std::ranges::find_if(outcomes, [](const TaskOutcome& outcome) { return !outcome.IsSuccess(); });
  if (first_failure == outcomes.cend()) {
    return StorageError::Success();
  }

  const auto failure_count = static_cast<size_t>(
      std::ranges::count_if(outcomes, [](const TaskOutcome& outcome) { return !outcome.IsSuccess(); }));
  if (failure_count == outcomes.size()) {
    return first_failure->error;
  }

  const StorageError& first_error = first_failure->error;
  return {StorageErrorType::kPartialBatchFailure,
          std::to_string(failure_count) + " of " + std::to_string(outcomes.size()) +
              " tasks failed. First failure: " + first_error.ToString(),
          first_error.GetBucket(), first_error.GetKey()};
}

}  // namespace skyread
