#pragma once

#include <memory>
#include <string>

#include <aws/lambda/LambdaClient.h>

#include "constants.hpp"
#include "read_task_executor.hpp"

namespace skyread {

/**
 * Runs every read task in its own synchronous invocation of the read worker function. The calling thread blocks for
 * the duration of the invocation, so clusters using this executor should be sized by kLambdaClusterThreadCount rather
 * than by the number of local cores.
 */
class LambdaReadTaskExecutor : public AbstractReadTaskExecutor {
 public:
  explicit LambdaReadTaskExecutor(std::shared_ptr<const Aws::Lambda::LambdaClient> lambda_client,
                                  std::string function_name = kReadWorkerFunctionName);

  TaskOutcome Execute(const ReadTaskDefinition& read_task) override;

  /**
   * Serializes @param read_task into a read worker request.
   */
  static std::string CreateRequestPayload(const ReadTaskDefinition& read_task);

  /**
   * Converts the read worker's response @param payload into an outcome. Malformed responses result in
   * kInternalError.
   */
  static TaskOutcome ParseResponsePayload(const std::string& payload, const ReadTaskDefinition& read_task);

 private:
  const std::shared_ptr<const Aws::Lambda::LambdaClient> lambda_client_;
  const std::string function_name_;
};

}  // namespace skyread
