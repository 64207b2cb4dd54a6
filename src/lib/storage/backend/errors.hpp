#pragma once

#include <ostream>
#include <string>

namespace skyread {

enum class StorageErrorType {
  kNoError = 0,
  kBucketNotFound,
  kObjectNotFound,
  kAccessDenied,
  kTransientIOError,
  kPartialBatchFailure,
  kInvalidArgument,
  kInternalError,
  kOperationNotSupported,
  kUninitialized,
  kUnknown
};

/**
 * StorageError is how the object store, the listing engine, the key reader and the cluster report expected failures.
 * Besides the error type and a message, it carries the bucket and key it refers to, so that every failure that
 * reaches a caller identifies the failing object.
 */
class StorageError {
 public:
  static StorageError Success() { return StorageError(StorageErrorType::kNoError); }

  explicit StorageError(StorageErrorType type) : type_(type) {}
  StorageError(StorageErrorType type, std::string message) : type_(type), message_(std::move(message)) {}
  StorageError(StorageErrorType type, std::string message, std::string bucket, std::string key)
      : type_(type), message_(std::move(message)), bucket_(std::move(bucket)), key_(std::move(key)) {}

  [[nodiscard]] StorageErrorType GetType() const { return type_; }
  [[nodiscard]] const std::string& GetMessage() const { return message_; }
  [[nodiscard]] const std::string& GetBucket() const { return bucket_; }
  [[nodiscard]] const std::string& GetKey() const { return key_; }

  /**
   * Returns a copy that refers to @param bucket and @param key. An error that already names a bucket keeps its
   * location, since the innermost layer knows best which object failed.
   */
  [[nodiscard]] StorageError WithObject(const std::string& bucket, const std::string& key) const;

  /**
   * Only transient errors are worth retrying. Retries are up to the object store client, not to skyread.
   */
  bool IsTransient() const { return type_ == StorageErrorType::kTransientIOError; }

  bool IsError() const { return type_ != StorageErrorType::kNoError; }
  explicit operator bool() const { return IsError(); }

  /**
   * E.g., "kObjectNotFound (bucket: data, key: tmp/file1): The specified key does not exist."
   */
  std::string ToString() const;

 private:
  StorageErrorType type_;
  std::string message_;
  std::string bucket_;
  std::string key_;
};

std::ostream& operator<<(std::ostream& stream, const StorageError& error);

}  // namespace skyread
