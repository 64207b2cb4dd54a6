#include "key_reader.hpp"

#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "utils/assert.hpp"

namespace skyread {

KeyReader::KeyReader(std::shared_ptr<ObjectStore> object_store) : object_store_(std::move(object_store)) {
  Assert(object_store_ != nullptr, "KeyReader requires an object store.");
}

StorageError KeyReader::Read(const std::string& bucket, const std::string& key, std::string* content) const {
  DebugAssert(content != nullptr, "KeyReader requires an output string.");

  const StorageError error = object_store_->GetObject(bucket, key, content).WithObject(bucket, key);
  if (error) {
    content->clear();
    AWS_LOGSTREAM_DEBUG(kBaseTag.c_str(), "Read failed: " << error);
    return error;
  }

  AWS_LOGSTREAM_TRACE(kBaseTag.c_str(), "Read " << content->size() << " bytes from " << bucket << "/" << key);
  return StorageError::Success();
}

}  // namespace skyread
