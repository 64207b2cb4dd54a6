#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <aws/core/Aws.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>

#include "object_store.hpp"

namespace skyread {

StorageErrorType TranslateS3Error(const Aws::S3::S3Errors error);

/**
 * S3ObjectStore accesses S3 (or any S3-compatible service) with the AWS SDK. Listings use ListObjectsV2 and follow
 * continuation tokens until the listing is complete. With a delimiter, S3 returns collapsed common prefixes, which are
 * passed on as key groups.
 */
class S3ObjectStore : public ObjectStore {
 public:
  explicit S3ObjectStore(std::shared_ptr<const Aws::S3::S3Client> client);

  std::pair<std::vector<ObjectStatus>, StorageError> List(const std::string& bucket, const std::string& prefix,
                                                           const std::optional<std::string>& delimiter) override;
  StorageError GetObject(const std::string& bucket, const std::string& key, std::string* content) override;

 private:
  std::shared_ptr<const Aws::S3::S3Client> client_;
};

}  // namespace skyread
