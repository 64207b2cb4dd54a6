#include "read_task_definition.hpp"

#include "constants.hpp"
#include "utils/assert.hpp"

namespace skyread {

ReadTaskDefinition::ReadTaskDefinition(std::string init_bucket, std::string init_key)
    : operation(kReadKeyOperation), bucket(std::move(init_bucket)), key(std::move(init_key)) {
  Assert(!bucket.empty() && !key.empty(), "A read task requires a bucket and a key.");
}

std::string ReadTaskDefinition::Description() const { return operation + "(" + bucket + "/" + key + ")"; }

ReadTaskDefinition ReadTaskDefinition::FromJson(const Aws::Utils::Json::JsonView& json) {
  AssertInput(json.KeyExists(kReadTaskOperationAttribute) && json.KeyExists(kReadTaskBucketAttribute) &&
                  json.KeyExists(kReadTaskKeyAttribute),
              "A read task requires the attributes '" + kReadTaskOperationAttribute + "', '" +
                  kReadTaskBucketAttribute + "' and '" + kReadTaskKeyAttribute + "'.");

  const std::string operation = json.GetString(kReadTaskOperationAttribute);
  AssertInput(operation == kReadKeyOperation, "Unsupported read task operation '" + operation + "'.");
  AssertInput(!json.GetString(kReadTaskBucketAttribute).empty() && !json.GetString(kReadTaskKeyAttribute).empty(),
              "A read task requires a non-empty bucket and key.");

  return {json.GetString(kReadTaskBucketAttribute), json.GetString(kReadTaskKeyAttribute)};
}

Aws::Utils::Json::JsonValue ReadTaskDefinition::ToJson() const {
  return Aws::Utils::Json::JsonValue()
      .WithString(kReadTaskOperationAttribute, operation)
      .WithString(kReadTaskBucketAttribute, bucket)
      .WithString(kReadTaskKeyAttribute, key);
}

}  // namespace skyread
