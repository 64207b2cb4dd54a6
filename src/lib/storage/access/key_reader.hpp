#pragma once

#include <memory>
#include <string>

#include "storage/backend/object_store.hpp"

namespace skyread {

/**
 * KeyReader fetches the complete content of a single key with one request. It neither supports partial reads nor
 * streaming, and it does not retry. Listing and reading are not linked: a key that was listed may be gone by the time
 * it is read, which results in kObjectNotFound.
 */
class KeyReader {
 public:
  explicit KeyReader(std::shared_ptr<ObjectStore> object_store);

  StorageError Read(const std::string& bucket, const std::string& key, std::string* content) const;

 private:
  std::shared_ptr<ObjectStore> object_store_;
};

}  // namespace skyread
