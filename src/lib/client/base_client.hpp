#pragma once

#include <memory>

#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/lambda/LambdaClient.h>
#include <aws/s3/S3Client.h>

#include "configuration.hpp"

namespace skyread {

/**
 * Creates and owns the AWS service clients skyread talks to: S3 for listing and reading objects, Lambda for invoking
 * read workers. Requires Aws::InitAPI() to have been called.
 */
class BaseClient {
 public:
  BaseClient();
  BaseClient(const BaseClient&) = delete;
  BaseClient(BaseClient&&) = default;
  const BaseClient& operator=(const BaseClient&) = delete;
  BaseClient& operator=(BaseClient&&) = default;

  ~BaseClient() = default;

  std::shared_ptr<const Aws::Lambda::LambdaClient> GetLambdaClient() const;
  std::shared_ptr<const Aws::S3::S3Client> GetS3Client() const;

  const Aws::String& GetClientRegion() const;

 protected:
  static Aws::Client::ClientConfiguration GenerateClientConfig();

 private:
  std::shared_ptr<const Aws::Lambda::LambdaClient> lambda_client_;
  std::shared_ptr<const Aws::S3::S3Client> s3_client_;

  Aws::String client_region_;

  inline static const Aws::Http::Scheme kHttpScheme = Aws::Http::Scheme::HTTPS;
  static constexpr size_t kMaxConnections = 100;
  static constexpr size_t kRequestTimeoutMs = kLambdaFunctionTimeoutSeconds * 1'000;
  static constexpr bool kEnableTcpKeepAlive = true;
  static constexpr bool kVerifySsl = true;
};

}  // namespace skyread
