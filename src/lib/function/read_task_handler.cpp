#include "read_task_handler.hpp"

#include <optional>

#include <aws/core/utils/base64/Base64.h>
#include <aws/core/utils/logging/LogMacros.h>
#include <magic_enum/magic_enum.hpp>

#include "constants.hpp"
#include "scheduler/coordinator/read_task_definition.hpp"
#include "utils/assert.hpp"

namespace skyread {

ReadTaskHandler::ReadTaskHandler(std::shared_ptr<ObjectStore> object_store, size_t max_content_bytes)
    : key_reader_(std::move(object_store)), max_content_bytes_(max_content_bytes) {}

Aws::Utils::Json::JsonValue ReadTaskHandler::Handle(const Aws::Utils::Json::JsonView& request) const {
  if (!request.KeyExists(kRequestReadTaskAttribute)) {
    return FailureResponse(StorageError(StorageErrorType::kInvalidArgument,
                                        "The request lacks the attribute '" + kRequestReadTaskAttribute + "'."));
  }

  std::optional<ReadTaskDefinition> read_task;
  try {
    read_task = ReadTaskDefinition::FromJson(request.GetObject(kRequestReadTaskAttribute));
  } catch (const InvalidInputException& exception) {
    return FailureResponse(StorageError(StorageErrorType::kInvalidArgument, exception.what()));
  }

  AWS_LOGSTREAM_INFO(kWorkerTag.c_str(), "Executing " << read_task->Description());
  std::string content;
  const StorageError error = key_reader_.Read(read_task->bucket, read_task->key, &content);
  if (error) {
    return FailureResponse(error);
  }

  if (content.size() > max_content_bytes_) {
    return FailureResponse(StorageError(StorageErrorType::kOperationNotSupported,
                                        "The object has " + std::to_string(content.size()) +
                                            " bytes, which exceeds the response limit of " +
                                            std::to_string(max_content_bytes_) + " bytes.",
                                        read_task->bucket, read_task->key));
  }

  const Aws::Utils::ByteBuffer buffer(reinterpret_cast<const unsigned char*>(content.data()), content.size());
  return Aws::Utils::Json::JsonValue()
      .WithInteger(kResponseIsSuccessAttribute, 1)
      .WithString(kResponseMessageAttribute, "")
      .WithString(kResponseContentAttribute, Aws::Utils::Base64::Base64().Encode(buffer));
}

Aws::Utils::Json::JsonValue ReadTaskHandler::FailureResponse(const StorageError& error) {
  AWS_LOGSTREAM_WARN(kWorkerTag.c_str(), "Read task failed: " << error);
  return Aws::Utils::Json::JsonValue()
      .WithInteger(kResponseIsSuccessAttribute, 0)
      .WithString(kResponseMessageAttribute, error.GetMessage())
      .WithString(kResponseErrorTypeAttribute, std::string(magic_enum::enum_name(error.GetType())));
}

}  // namespace skyread
