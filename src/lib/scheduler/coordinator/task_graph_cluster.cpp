#include "task_graph_cluster.hpp"

#include <unordered_map>

#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "scheduler/worker/generic_task.hpp"
#include "utils/assert.hpp"

namespace skyread {

namespace {

struct NodeExecution {
  std::shared_ptr<AbstractTask> task;
  std::shared_ptr<std::promise<TaskOutcome>> promise;
  std::shared_future<TaskOutcome> future;
};

TaskOutcome FailedOutcome(StorageError error) {
  TaskOutcome outcome;
  outcome.error = std::move(error);
  return outcome;
}

TaskOutcome ComputeInnerNode(const DeferredValue& node, const std::vector<std::shared_future<TaskOutcome>>& inputs) {
  std::vector<std::string> input_values;
  input_values.reserve(inputs.size());
  for (const auto& input : inputs) {
    const TaskOutcome& input_outcome = input.get();
    if (!input_outcome.IsSuccess()) {
      return FailedOutcome(input_outcome.error);
    }
    input_values.push_back(input_outcome.content);
  }

  TaskOutcome outcome;
  outcome.content = node.Compute(input_values);
  return outcome;
}

}  // namespace

TaskGraphCluster::TaskGraphCluster(std::shared_ptr<AbstractReadTaskExecutor> read_task_executor, size_t num_threads)
    : read_task_executor_(std::move(read_task_executor)), scheduler_(num_threads) {
  Assert(read_task_executor_ != nullptr, "TaskGraphCluster requires a read task executor.");
}

std::vector<TaskFuture> TaskGraphCluster::Submit(const std::vector<std::shared_ptr<const DeferredValue>>& outputs) {
  // Every node reachable from the outputs becomes exactly one task, even if several outputs share it.
  std::unordered_map<const DeferredValue*, NodeExecution> executions;
  std::vector<std::shared_ptr<AbstractTask>> tasks;

  // Post-order traversal, so that the tasks of all inputs exist before the task that consumes them.
  std::vector<std::pair<std::shared_ptr<const DeferredValue>, bool>> stack;
  for (auto output = outputs.crbegin(); output != outputs.crend(); ++output) {
    Assert(*output != nullptr, "Cannot submit a null node.");
    stack.emplace_back(*output, false);
  }

  while (!stack.empty()) {
    const auto [node, inputs_visited] = stack.back();
    stack.pop_back();

    if (executions.contains(node.get())) {
      continue;
    }

    if (!inputs_visited) {
      stack.emplace_back(node, true);
      for (auto input = node->Inputs().crbegin(); input != node->Inputs().crend(); ++input) {
        if (!executions.contains(input->get())) {
          stack.emplace_back(*input, false);
        }
      }
      continue;
    }

    auto promise = std::make_shared<std::promise<TaskOutcome>>();
    std::shared_future<TaskOutcome> future = promise->get_future().share();

    std::vector<std::shared_future<TaskOutcome>> input_futures;
    input_futures.reserve(node->Inputs().size());
    for (const auto& input : node->Inputs()) {
      input_futures.push_back(executions.at(input.get()).future);
    }

    auto task = std::make_shared<GenericTask>(
        [node = node, promise, input_futures = std::move(input_futures), executor = read_task_executor_]() {
          TaskOutcome outcome;
          try {
            outcome = node->IsRead() ? executor->Execute(*node->ReadTask()) : ComputeInnerNode(*node, input_futures);
          } catch (const std::exception& exception) {
            AWS_LOGSTREAM_ERROR(kCoordinatorTag.c_str(), node->Description() << " failed: " << exception.what());
            StorageError error(StorageErrorType::kInternalError, exception.what());
            if (node->IsRead()) {
              error = error.WithObject(node->ReadTask()->bucket, node->ReadTask()->key);
            }
            outcome = FailedOutcome(std::move(error));
          }

          if (!outcome.IsSuccess()) {
            AWS_LOGSTREAM_DEBUG(kCoordinatorTag.c_str(), node->Description() << " failed: " << outcome.error);
          }
          promise->set_value(std::move(outcome));
        });
    task->SetDescription(node->Description());

    for (const auto& input : node->Inputs()) {
      executions.at(input.get()).task->SetAsPredecessorOf(task);
    }

    executions.emplace(node.get(), NodeExecution{task, std::move(promise), std::move(future)});
    tasks.push_back(std::move(task));
  }

  AWS_LOGSTREAM_DEBUG(kCoordinatorTag.c_str(),
                      "Scheduling " << tasks.size() << " tasks for " << outputs.size() << " outputs.");
  scheduler_.ScheduleTasks(tasks);

  std::vector<TaskFuture> futures;
  futures.reserve(outputs.size());
  for (const auto& output : outputs) {
    futures.emplace_back(executions.at(output.get()).future, output->Description());
  }
  return futures;
}

void TaskGraphCluster::WaitForAllTasks() { scheduler_.WaitForAllTasks(); }

size_t TaskGraphCluster::ThreadCount() const { return scheduler_.ThreadCount(); }

}  // namespace skyread
