#pragma once

#include "function/function.hpp"

namespace skyread {

/**
 * Reads one key from S3 per invocation and answers with its base64-encoded content.
 */
class ReadWorkerFunction : public Function {
 protected:
  aws::lambda_runtime::invocation_response OnHandleRequest(const Aws::Utils::Json::JsonView& request) const override;
};

}  // namespace skyread
