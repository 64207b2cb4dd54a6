#pragma once

#include <aws/core/utils/json/JsonSerializer.h>
#include <aws/lambda-runtime/runtime.h>

namespace skyread {

/**
 * Base class of skyread's AWS Lambda functions. HandleRequest() initializes the AWS SDK, runs the Lambda runtime loop
 * and passes each JSON request to OnHandleRequest(). Exceptions thrown while handling a request are turned into
 * failure responses of the form {"isSuccess": 0, "message": <what>}.
 */
class Function {
 public:
  virtual ~Function() = default;

  void HandleRequest() const;

 protected:
  aws::lambda_runtime::invocation_response HandlerFunction(
      const aws::lambda_runtime::invocation_request& request) const;
  virtual aws::lambda_runtime::invocation_response OnHandleRequest(const Aws::Utils::Json::JsonView& request) const = 0;
};

}  // namespace skyread
