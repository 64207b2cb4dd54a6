#include "abstract_cluster.hpp"

namespace skyread {

TaskFuture AbstractCluster::Submit(const std::shared_ptr<const DeferredValue>& output) {
  return Submit(std::vector<std::shared_ptr<const DeferredValue>>{output}).front();
}

TaskFuture AbstractCluster::Submit(const ReadTaskDefinition& read_task) {
  return Submit(DeferredValue::Read(read_task));
}

std::vector<TaskOutcome> AbstractCluster::Gather(const std::vector<TaskFuture>& futures) {
  std::vector<TaskOutcome> outcomes;
  outcomes.reserve(futures.size());
  for (const auto& future : futures) {
    outcomes.push_back(future.Get());
  }
  return outcomes;
}

}  // namespace skyread
