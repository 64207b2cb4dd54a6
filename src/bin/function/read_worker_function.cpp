#include "read_worker_function.hpp"

#include <aws/core/utils/logging/LogMacros.h>

#include "client/base_client.hpp"
#include "constants.hpp"
#include "function/read_task_handler.hpp"
#include "storage/backend/s3_object_store.hpp"

namespace skyread {

aws::lambda_runtime::invocation_response ReadWorkerFunction::OnHandleRequest(
    const Aws::Utils::Json::JsonView& request) const {
  AWS_LOGSTREAM_DEBUG(kWorkerTag.c_str(), "Read worker request: " << request.WriteCompact());

  const auto client = std::make_shared<BaseClient>();
  const ReadTaskHandler handler(std::make_shared<S3ObjectStore>(client->GetS3Client()));

  const auto response = handler.Handle(request);
  return aws::lambda_runtime::invocation_response::success(response.View().WriteCompact(), "application/json");
}

}  // namespace skyread

int main() {
  const skyread::ReadWorkerFunction function;
  function.HandleRequest();
  return 0;
}
