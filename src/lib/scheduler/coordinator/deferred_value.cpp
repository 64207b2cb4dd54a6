#include "deferred_value.hpp"

#include <algorithm>
#include <numeric>

#include "utils/assert.hpp"

namespace skyread {

DeferredValue::DeferredValue(ConstructionToken /*token*/, std::optional<ReadTaskDefinition> read_task,
                             std::vector<std::shared_ptr<const DeferredValue>> inputs, CombineFunction function,
                             std::string description)
    : read_task_(std::move(read_task)),
      inputs_(std::move(inputs)),
      function_(std::move(function)),
      description_(std::move(description)) {}

std::shared_ptr<const DeferredValue> DeferredValue::Read(ReadTaskDefinition read_task) {
  std::string description = read_task.Description();
  return std::make_shared<const DeferredValue>(ConstructionToken(), std::move(read_task),
                                               std::vector<std::shared_ptr<const DeferredValue>>{}, nullptr,
                                               std::move(description));
}

std::shared_ptr<const DeferredValue> DeferredValue::Map(std::shared_ptr<const DeferredValue> input,
                                                        MapFunction function, const std::string& name) {
  Assert(input, "A map node requires an input.");
  Assert(function, "A map node requires a function.");
  std::string description = name + "(" + input->Description() + ")";
  auto combine_function = [function = std::move(function)](const std::vector<std::string>& values) {
    return function(values.front());
  };
  return std::make_shared<const DeferredValue>(ConstructionToken(), std::nullopt,
                                               std::vector<std::shared_ptr<const DeferredValue>>{std::move(input)},
                                               std::move(combine_function), std::move(description));
}

std::shared_ptr<const DeferredValue> DeferredValue::Combine(std::vector<std::shared_ptr<const DeferredValue>> inputs,
                                                            CombineFunction function, const std::string& name) {
  Assert(!inputs.empty(), "A combine node requires at least one input.");
  Assert(std::ranges::none_of(inputs, [](const auto& input) { return input == nullptr; }),
         "The inputs of a combine node must not be null.");
  Assert(function, "A combine node requires a function.");
  std::string description = name + "(" + std::to_string(inputs.size()) + " inputs)";
  return std::make_shared<const DeferredValue>(ConstructionToken(), std::nullopt, std::move(inputs), std::move(function),
                                               std::move(description));
}

bool DeferredValue::IsRead() const { return read_task_.has_value(); }

const std::optional<ReadTaskDefinition>& DeferredValue::ReadTask() const { return read_task_; }

const std::vector<std::shared_ptr<const DeferredValue>>& DeferredValue::Inputs() const { return inputs_; }

std::string DeferredValue::Compute(const std::vector<std::string>& input_values) const {
  Assert(!IsRead(), "Read nodes are evaluated by a read task executor.");
  Assert(input_values.size() == inputs_.size(), "Expected one value per input of '" + description_ + "'.");
  return function_(input_values);
}

const std::string& DeferredValue::Description() const { return description_; }

std::string ConcatenateValues(const std::vector<std::string>& values) {
  const size_t total_size = std::accumulate(values.cbegin(), values.cend(), size_t{0},
                                            [](size_t sum, const std::string& value) { return sum + value.size(); });
  std::string result;
  result.reserve(total_size);
  for (const auto& value : values) {
    result += value;
  }
  return result;
}

}  // namespace skyread
