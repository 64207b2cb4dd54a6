#include "s3_object_store.hpp"

#include <aws/core/utils/logging/LogMacros.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/ListObjectsV2Request.h>

#include "configuration.hpp"
#include "constants.hpp"
#include "utils/string.hpp"

namespace skyread {

namespace {

template <class AwsOutcomeClass>
StorageError GetErrorFromOutcome(const AwsOutcomeClass& outcome, const std::string& bucket, const std::string& key) {
  const auto& error = outcome.GetError();
  StorageErrorType type = TranslateS3Error(error.GetErrorType());

  // The SDK marks errors it considers retryable, e.g., unmodeled HTTP 5xx responses.
  if (type == StorageErrorType::kUnknown && error.ShouldRetry()) {
    type = StorageErrorType::kTransientIOError;
  }

  return {type, error.GetMessage(), bucket, key};
}

}  // namespace

StorageErrorType TranslateS3Error(const Aws::S3::S3Errors error) {
  switch (error) {
    case Aws::S3::S3Errors::INCOMPLETE_SIGNATURE:
    case Aws::S3::S3Errors::INVALID_ACTION:
    case Aws::S3::S3Errors::INVALID_PARAMETER_COMBINATION:
    case Aws::S3::S3Errors::INVALID_PARAMETER_VALUE:
    case Aws::S3::S3Errors::INVALID_QUERY_PARAMETER:
    case Aws::S3::S3Errors::MALFORMED_QUERY_STRING:
    case Aws::S3::S3Errors::MISSING_ACTION:
    case Aws::S3::S3Errors::MISSING_PARAMETER:
    case Aws::S3::S3Errors::OPT_IN_REQUIRED:
    case Aws::S3::S3Errors::REQUEST_EXPIRED:
    case Aws::S3::S3Errors::REQUEST_TIME_TOO_SKEWED:
      return StorageErrorType::kInvalidArgument;

    case Aws::S3::S3Errors::ACCESS_DENIED:
    case Aws::S3::S3Errors::INVALID_ACCESS_KEY_ID:
    case Aws::S3::S3Errors::INVALID_CLIENT_TOKEN_ID:
    case Aws::S3::S3Errors::INVALID_SIGNATURE:
    case Aws::S3::S3Errors::MISSING_AUTHENTICATION_TOKEN:
    case Aws::S3::S3Errors::SIGNATURE_DOES_NOT_MATCH:
    case Aws::S3::S3Errors::UNRECOGNIZED_CLIENT:
    case Aws::S3::S3Errors::VALIDATION:
      return StorageErrorType::kAccessDenied;

    case Aws::S3::S3Errors::NO_SUCH_BUCKET:
      return StorageErrorType::kBucketNotFound;

    case Aws::S3::S3Errors::NO_SUCH_KEY:
    case Aws::S3::S3Errors::RESOURCE_NOT_FOUND:
      return StorageErrorType::kObjectNotFound;

    case Aws::S3::S3Errors::INTERNAL_FAILURE:
    case Aws::S3::S3Errors::SERVICE_UNAVAILABLE:
    case Aws::S3::S3Errors::SLOW_DOWN:
    case Aws::S3::S3Errors::THROTTLING:
    case Aws::S3::S3Errors::NETWORK_CONNECTION:
    case Aws::S3::S3Errors::REQUEST_TIMEOUT:
      return StorageErrorType::kTransientIOError;

    default:
      return StorageErrorType::kUnknown;
  }
}

S3ObjectStore::S3ObjectStore(std::shared_ptr<const Aws::S3::S3Client> client) : client_(std::move(client)) {}

std::pair<std::vector<ObjectStatus>, StorageError> S3ObjectStore::List(const std::string& bucket,
                                                                        const std::string& prefix,
                                                                        const std::optional<std::string>& delimiter) {
  bool has_more = true;
  std::string continuation_token;
  StorageError error = StorageError::Success();
  std::vector<ObjectStatus> result_vector;

  while (has_more) {
    Aws::S3::Model::ListObjectsV2Request request;
    request.SetBucket(bucket);
    request.SetMaxKeys(kS3ListMaxKeys);

    if (!prefix.empty()) {
      request.SetPrefix(prefix);
    }

    if (delimiter.has_value() && !delimiter->empty()) {
      request.SetDelimiter(*delimiter);
    }

    if (!continuation_token.empty()) {
      request.SetContinuationToken(continuation_token);
    }

    const auto outcome = client_->ListObjectsV2(request);
    if (!outcome.IsSuccess()) {
      error = GetErrorFromOutcome(outcome, bucket, "");
      result_vector.clear();
      break;
    }
    const auto& result = outcome.GetResult();

    if (result.GetIsTruncated()) {
      continuation_token = result.GetNextContinuationToken();
      has_more = !continuation_token.empty();
    } else {
      has_more = false;
    }

    for (const auto& object : result.GetContents()) {
      result_vector.emplace_back(object.GetKey(), static_cast<size_t>(object.GetSize()));
    }

    for (const auto& common_prefix : result.GetCommonPrefixes()) {
      result_vector.push_back(ObjectStatus::KeyGroup(common_prefix.GetPrefix()));
    }
  }

  AWS_LOGSTREAM_DEBUG(kBaseTag.c_str(), "Listed " << result_vector.size() << " entries in s3://" << bucket << "/"
                                                  << prefix);
  return std::make_pair(std::move(result_vector), error);
}

StorageError S3ObjectStore::GetObject(const std::string& bucket, const std::string& key, std::string* content) {
  content->clear();

  Aws::S3::Model::GetObjectRequest request;
  request.SetBucket(bucket);
  request.SetKey(key);

  auto outcome = client_->GetObject(request);
  if (!outcome.IsSuccess()) {
    return GetErrorFromOutcome(outcome, bucket, key);
  }

  Aws::IOStream& body = outcome.GetResult().GetBody();
  *content = StreamToString(&body);

  if (body.bad()) {
    return {StorageErrorType::kTransientIOError, "Reading the response body failed.", bucket, key};
  }

  return StorageError::Success();
}

}  // namespace skyread
