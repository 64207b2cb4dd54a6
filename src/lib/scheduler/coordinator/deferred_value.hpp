#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "read_task_definition.hpp"
#include "types.hpp"

namespace skyread {

/**
 * A DeferredValue is a node of a computation graph that has not been submitted to a cluster yet. Leaf nodes read one
 * key. Inner nodes apply a function to the values of their inputs. Nodes are immutable once created and may be shared
 * between several graphs; a cluster evaluates a shared node once per submission.
 *
 * auto file_0 = DeferredValue::Read(ReadTaskDefinition("data", "file-0.csv"));
 * auto file_1 = DeferredValue::Read(ReadTaskDefinition("data", "file-1.csv"));
 * auto both = DeferredValue::Combine({file_0, file_1}, ConcatenateValues, "concatenate");
 *
 * // Nothing was read so far. Reading happens on cluster->Submit({both}).
 */
class DeferredValue : public Noncopyable {
 private:
  // Restricts construction to the factory functions below while still allowing std::make_shared.
  struct ConstructionToken {
    explicit ConstructionToken() = default;
  };

 public:
  using MapFunction = std::function<std::string(const std::string&)>;
  using CombineFunction = std::function<std::string(const std::vector<std::string>&)>;

  static std::shared_ptr<const DeferredValue> Read(ReadTaskDefinition read_task);

  static std::shared_ptr<const DeferredValue> Map(std::shared_ptr<const DeferredValue> input, MapFunction function,
                                                  const std::string& name);

  static std::shared_ptr<const DeferredValue> Combine(std::vector<std::shared_ptr<const DeferredValue>> inputs,
                                                      CombineFunction function, const std::string& name);

  bool IsRead() const;

  /**
   * Only set for leaf nodes.
   */
  const std::optional<ReadTaskDefinition>& ReadTask() const;

  const std::vector<std::shared_ptr<const DeferredValue>>& Inputs() const;

  /**
   * Applies the node's function to the values of its inputs, which are passed in the order of Inputs(). May throw.
   */
  std::string Compute(const std::vector<std::string>& input_values) const;

  const std::string& Description() const;

  DeferredValue(ConstructionToken token, std::optional<ReadTaskDefinition> read_task,
                std::vector<std::shared_ptr<const DeferredValue>> inputs, CombineFunction function,
                std::string description);

 private:

  const std::optional<ReadTaskDefinition> read_task_;
  const std::vector<std::shared_ptr<const DeferredValue>> inputs_;
  const CombineFunction function_;
  const std::string description_;
};

/**
 * Concatenates the values in input order. Handy to merge the reads of several keys into one value.
 */
std::string ConcatenateValues(const std::vector<std::string>& values);

}  // namespace skyread
