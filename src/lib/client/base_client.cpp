#include "base_client.hpp"

#include <algorithm>
#include <thread>

#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/utils/threading/Executor.h>

#include "configuration.hpp"
#include "utils/assert.hpp"

namespace {

// Reads run in parallel on many threads and hit S3 throttling more often than the SDK defaults anticipate.
class S3ReadRetryStrategy : public Aws::Client::DefaultRetryStrategy {
 public:
  explicit S3ReadRetryStrategy(long maxRetries = 15, long scaleFactor = 25)
      : DefaultRetryStrategy(maxRetries, scaleFactor) {}
};

}  // namespace

namespace skyread {

BaseClient::BaseClient() {
  const auto credentials_provider = std::make_shared<Aws::Auth::DefaultAWSCredentialsProviderChain>();
  if (credentials_provider->GetAWSCredentials().IsExpiredOrEmpty()) {
    Fail("AWS credentials are missing or expired.");
  }

  const auto endpoint_provider = std::make_shared<Aws::S3::S3EndpointProvider>();

  auto client_configuration = GenerateClientConfig();
  client_region_ = client_configuration.region;

  auto client_configuration_s3 = GenerateClientConfig();
  client_configuration_s3.executor = std::make_shared<Aws::Utils::Threading::PooledThreadExecutor>(
      std::max(1u, std::thread::hardware_concurrency()) * kIoThreadPoolToCpuRatio);
  client_configuration_s3.retryStrategy = std::make_shared<S3ReadRetryStrategy>();

  lambda_client_ = std::make_shared<const Aws::Lambda::LambdaClient>(credentials_provider, client_configuration);
  s3_client_ =
      std::make_shared<const Aws::S3::S3Client>(credentials_provider, endpoint_provider, client_configuration_s3);
}

std::shared_ptr<const Aws::Lambda::LambdaClient> BaseClient::GetLambdaClient() const { return lambda_client_; }

std::shared_ptr<const Aws::S3::S3Client> BaseClient::GetS3Client() const { return s3_client_; }

const Aws::String& BaseClient::GetClientRegion() const { return client_region_; }

Aws::Client::ClientConfiguration BaseClient::GenerateClientConfig() {
  Aws::Client::ClientConfiguration client_configuration;
  client_configuration.scheme = kHttpScheme;
  client_configuration.maxConnections = kMaxConnections;
  client_configuration.requestTimeoutMs = kRequestTimeoutMs;
  client_configuration.enableTcpKeepAlive = kEnableTcpKeepAlive;
  client_configuration.verifySSL = kVerifySsl;

  return client_configuration;
}

}  // namespace skyread
