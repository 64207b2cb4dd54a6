#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace skyread {

/**
 * ObjectStatus is an immutable snapshot of one listing entry. It either describes a concrete object (key, size) or a key
 * group, i.e., a common prefix that a delimiter collapsed into a single entry. Key
 * groups have no size.
 */
class ObjectStatus {
 public:
  ObjectStatus(std::string identifier, size_t object_size) : identifier_(std::move(identifier)), size_(object_size) {}

  static ObjectStatus KeyGroup(std::string common_prefix) { return ObjectStatus(std::move(common_prefix)); }

  const std::string& GetIdentifier() const { return identifier_; }
  std::optional<size_t> GetSize() const { return size_; }
  bool IsKeyGroup() const { return !size_.has_value(); }

 private:
  explicit ObjectStatus(std::string common_prefix) : identifier_(std::move(common_prefix)) {}

  std::string identifier_;
  std::optional<size_t> size_;
};

/**
 * ObjectStore is the capability to enumerate and fetch objects of a key/value object store. Implementations handle
 * transport, authentication and retries. The functions are safe to call concurrently from different threads.
 */
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  /**
   * Lists the objects in @param bucket whose keys start with @param prefix. If a @param delimiter is given, backends
   * may already collapse keys into key groups (as S3 does) or return every matching key. Order is not guaranteed.
   * Use ListingEngine for sorted, deduplicated and consistently grouped listings.
   */
  virtual std::pair<std::vector<ObjectStatus>, StorageError> List(const std::string& bucket,
                                                                   const std::string& prefix,
                                                                   const std::optional<std::string>& delimiter) = 0;

  /**
   * Reads the complete content of the object @param key into @param content, which is cleared first.
   */
  virtual StorageError GetObject(const std::string& bucket, const std::string& key, std::string* content) = 0;
};

}  // namespace skyread
