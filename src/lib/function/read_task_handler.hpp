#pragma once

#include <memory>

#include <aws/core/utils/json/JsonSerializer.h>

#include "configuration.hpp"
#include "storage/access/key_reader.hpp"

namespace skyread {

/**
 * Executes the read task of a read worker request, i.e., {"read_task": {"operation": "readKey", "bucket": ...,
 * "key": ...}}, and builds the response:
 *
 *  - success: {"isSuccess": 1, "message": "", "content": <base64 content>}
 *  - failure: {"isSuccess": 0, "message": <error>, "error_type": <StorageErrorType name>}
 *
 * Objects larger than @param max_content_bytes fail with kOperationNotSupported, since their encoded content would
 * exceed the synchronous response limit.
 */
class ReadTaskHandler {
 public:
  explicit ReadTaskHandler(std::shared_ptr<ObjectStore> object_store,
                           size_t max_content_bytes = kReadWorkerMaxContentBytes);

  Aws::Utils::Json::JsonValue Handle(const Aws::Utils::Json::JsonView& request) const;

 private:
  static Aws::Utils::Json::JsonValue FailureResponse(const StorageError& error);

  const KeyReader key_reader_;
  const size_t max_content_bytes_;
};

}  // namespace skyread
