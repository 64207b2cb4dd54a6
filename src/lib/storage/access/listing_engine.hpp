#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "storage/backend/object_store.hpp"

namespace skyread {

/**
 * ListingEngine turns the raw listing of an ObjectStore into a deterministic view of a bucket:
 *
 *  - Entries are sorted lexicographically (byte-wise) by key and contain no duplicates.
 *  - Without a delimiter, there is one entry per key starting with the prefix.
 *  - With a delimiter, the remainder of every matching key after the prefix is cut at the first occurrence of the
 *    delimiter. Keys that contain the delimiter in their remainder collapse into one key group per distinct segment,
 *    e.g., prefix "tmp/" and delimiter "/" collapse "tmp/a/1" and "tmp/a/2" into the key group "tmp/a/". All other keys
 *    are returned as they are. A key that equals the prefix has an empty remainder and stays a concrete object.
 *
 * The view does not depend on whether the backend already collapses keys (S3) or not (filesystem). Store errors are
 * returned unchanged, annotated with the bucket. There are no retries at this layer.
 */
class ListingEngine {
 public:
  explicit ListingEngine(std::shared_ptr<ObjectStore> object_store);

  std::pair<std::vector<ObjectStatus>, StorageError> List(
      const std::string& bucket, const std::string& prefix = "",
      const std::optional<std::string>& delimiter = std::nullopt) const;

  /**
   * Same as List, but drops key groups. Only concrete objects remain.
   */
  std::pair<std::vector<ObjectStatus>, StorageError> ListSummaries(
      const std::string& bucket, const std::string& prefix = "",
      const std::optional<std::string>& delimiter = std::nullopt) const;

 private:
  static std::vector<ObjectStatus> Normalize(std::vector<ObjectStatus> entries, const std::string& prefix,
                                             const std::optional<std::string>& delimiter);

  std::shared_ptr<ObjectStore> object_store_;
};

}  // namespace skyread
