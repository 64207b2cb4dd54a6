#include "filesystem_object_store.hpp"

#include <fstream>
#include <iterator>

#if defined(__linux__) || defined(__APPLE__)
#include <cerrno>

#include <dirent.h>
#include <sys/stat.h>
#else
#error "FilesystemObjectStore is not implemented on your platform."
#endif

#include "utils/string.hpp"

namespace skyread {

namespace {

// errno is set by `opendir`, `stat` or a failed open of a file stream.
StorageErrorType ErrnoToStorageErrorType(StorageErrorType not_found_type) {
  switch (errno) {
    case EACCES:
    case EPERM:
      return StorageErrorType::kAccessDenied;
    case EBUSY:
    case EIO:
    case EAGAIN:
      return StorageErrorType::kTransientIOError;
    case ENOENT:
    case ENOTDIR:
      return not_found_type;
    case ENAMETOOLONG:
    case ELOOP:
    case EOVERFLOW:
      return StorageErrorType::kOperationNotSupported;
    case EFAULT:
    case ENOMEM:
      return StorageErrorType::kInternalError;
    default:
      return StorageErrorType::kUnknown;
  }
}

bool IsDirectory(const std::string& path) {
  struct stat info{};
  return stat(path.c_str(), &info) == 0 && S_ISDIR(info.st_mode);  // NOLINT(hicpp-signed-bitwise)
}

// Keys must resolve to a path within their bucket directory.
bool IsKeyWithinBucket(const std::string& key) {
  if (key.empty() || key.front() == '/') {
    return false;
  }
  for (const auto& segment : SplitStringByDelimiter(key, '/')) {
    if (segment == "." || segment == "..") {
      return false;
    }
  }
  return true;
}

}  // namespace

StorageError FilesystemObjectStore::CheckBucket(const std::string& bucket) const {
  if (bucket.empty() || bucket.find('/') != std::string::npos) {
    return {StorageErrorType::kInvalidArgument, "Bucket names must not be empty or contain '/'.", bucket, ""};
  }

  struct stat info{};
  if (stat(JoinPath(root_directory_, bucket).c_str(), &info) == -1) {
    return {ErrnoToStorageErrorType(StorageErrorType::kBucketNotFound), "Bucket directory is not accessible.", bucket,
            ""};
  }
  if (!S_ISDIR(info.st_mode)) {  // NOLINT(hicpp-signed-bitwise)
    return {StorageErrorType::kBucketNotFound, "Bucket is not a directory.", bucket, ""};
  }

  return StorageError::Success();
}

StorageError FilesystemObjectStore::ListDirectoryRecursively(const std::string& bucket_directory,
                                                             const std::string& relative_directory,
                                                             const std::string& prefix,
                                                             std::vector<ObjectStatus>* output_vector) const {
  const std::string directory_name = JoinPath(bucket_directory, relative_directory);
  DIR* dir = opendir(directory_name.c_str());
  if (dir == nullptr) {
    if (!relative_directory.empty() && errno == ENOENT) {
      // The directory vanished while listing its parent.
      return StorageError::Success();
    }
    return StorageError(ErrnoToStorageErrorType(StorageErrorType::kBucketNotFound), directory_name);
  }

  StorageError error = StorageError::Success();
  struct dirent* dir_entry{};
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  while ((dir_entry = readdir(dir)) != nullptr) {
    if (dir_entry->d_name[0] == '.') {
      continue;
    }

    const std::string key =
        relative_directory.empty() ? std::string(dir_entry->d_name) : relative_directory + "/" + dir_entry->d_name;
    const std::string path = JoinPath(bucket_directory, key);

    struct stat info{};
    if (stat(path.c_str(), &info) == -1) {
      // The entry vanished between readdir and stat.
      continue;
    }

    if (S_ISDIR(info.st_mode)) {  // NOLINT(hicpp-signed-bitwise)
      const std::string directory_key = key + "/";
      // Only descend into directories that can contain matching keys.
      if (directory_key.starts_with(prefix) || prefix.starts_with(directory_key)) {
        error = ListDirectoryRecursively(bucket_directory, key, prefix, output_vector);
        if (error) {
          break;
        }
      }
    } else if (S_ISREG(info.st_mode) && key.starts_with(prefix)) {  // NOLINT(hicpp-signed-bitwise)
      output_vector->emplace_back(key, static_cast<size_t>(info.st_size));
    }
  }

  closedir(dir);
  return error;
}

std::pair<std::vector<ObjectStatus>, StorageError> FilesystemObjectStore::List(
    const std::string& bucket, const std::string& prefix, const std::optional<std::string>& /*delimiter*/) {
  std::vector<ObjectStatus> result_vector;

  StorageError error = CheckBucket(bucket);
  if (!error) {
    error = ListDirectoryRecursively(JoinPath(root_directory_, bucket), "", prefix, &result_vector);
  }

  if (error) {
    return std::make_pair(std::vector<ObjectStatus>(), error.WithObject(bucket, ""));
  }
  return std::make_pair(std::move(result_vector), error);
}

StorageError FilesystemObjectStore::GetObject(const std::string& bucket, const std::string& key,
                                              std::string* content) {
  content->clear();

  StorageError error = CheckBucket(bucket);
  if (error) {
    return error;
  }

  if (!IsKeyWithinBucket(key)) {
    return {StorageErrorType::kObjectNotFound, "Key does not name an object within the bucket.", bucket, key};
  }

  const std::string path = JoinPath(JoinPath(root_directory_, bucket), key);
  if (IsDirectory(path)) {
    return {StorageErrorType::kObjectNotFound, "Key does not name a regular file.", bucket, key};
  }

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in.is_open()) {
    return {ErrnoToStorageErrorType(StorageErrorType::kObjectNotFound), "Could not open file.", bucket, key};
  }

  content->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    content->clear();
    return {StorageErrorType::kTransientIOError, "Could not read file.", bucket, key};
  }

  return StorageError::Success();
}

std::string FilesystemObjectStore::JoinPath(const std::string& part_a, const std::string& part_b) {
  if (part_a.empty()) {
    return part_b;
  }
  if (part_b.empty()) {
    return part_a;
  }

  const bool part_a_ends_with_separator = part_a.back() == '/';
  const bool part_b_starts_with_separator = part_b.front() == '/';

  if (!part_a_ends_with_separator && !part_b_starts_with_separator) {
    return part_a + '/' + part_b;
  }

  if (part_a_ends_with_separator && part_b_starts_with_separator) {
    return part_a + part_b.substr(1);
  }

  return part_a + part_b;
}

}  // namespace skyread
