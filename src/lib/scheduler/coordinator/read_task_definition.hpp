#pragma once

#include <string>

#include <aws/core/utils/json/JsonSerializer.h>

namespace skyread {

/**
 * Describes one deferred read of a single key. A ReadTaskDefinition carries no result; it is consumed exactly once,
 * either by dispatching it to a cluster or by wrapping it into a DeferredValue.
 */
struct ReadTaskDefinition final {
  ReadTaskDefinition(std::string init_bucket, std::string init_key);

  bool operator==(const ReadTaskDefinition& rhs) const = default;

  /**
   * E.g., "readKey(data/tmp/file1)".
   */
  std::string Description() const;

  static ReadTaskDefinition FromJson(const Aws::Utils::Json::JsonView& json);
  Aws::Utils::Json::JsonValue ToJson() const;

  std::string operation;
  std::string bucket;
  std::string key;
};

}  // namespace skyread
