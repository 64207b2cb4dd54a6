#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "object_store.hpp"

namespace skyread {

/**
 * FilesystemObjectStore serves buckets from a local directory tree. Every direct subdirectory of the root directory is
 * a bucket, every regular file below it an object whose key is the file path relative to the bucket directory. The
 * delimiter is not interpreted here. Listings contain every matching key.
 */
class FilesystemObjectStore : public ObjectStore {
 public:
  FilesystemObjectStore() : root_directory_("./") {}
  explicit FilesystemObjectStore(std::string root_directory) : root_directory_(std::move(root_directory)) {}

  std::pair<std::vector<ObjectStatus>, StorageError> List(const std::string& bucket, const std::string& prefix,
                                                           const std::optional<std::string>& delimiter) override;
  StorageError GetObject(const std::string& bucket, const std::string& key, std::string* content) override;

 private:
  StorageError CheckBucket(const std::string& bucket) const;
  StorageError ListDirectoryRecursively(const std::string& bucket_directory, const std::string& relative_directory,
                                        const std::string& prefix, std::vector<ObjectStatus>* output_vector) const;

  // JoinPath joins two path components and ensures that there is exactly a single '/' between them.
  static std::string JoinPath(const std::string& part_a, const std::string& part_b);

  std::string root_directory_;
};

}  // namespace skyread
