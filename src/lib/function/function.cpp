#include "function.hpp"

#include <aws/core/Aws.h>
#include <aws/core/utils/logging/CRTLogSystem.h>
#include <aws/core/utils/logging/ConsoleLogSystem.h>
#include <aws/core/utils/logging/LogLevel.h>
#include <aws/core/utils/logging/LogMacros.h>
#include <malloc.h>

#include "constants.hpp"
#include "utils/signal_handler.hpp"

namespace skyread {

void Function::HandleRequest() const {
  RegisterSignalHandler();

  Aws::SDKOptions sdk_options;
  const Aws::Utils::Logging::LogLevel log_level{Aws::Utils::Logging::LogLevel::Info};
  const Aws::Utils::Logging::LogLevel crt_log_level{Aws::Utils::Logging::LogLevel::Warn};
  sdk_options.httpOptions.installSigPipeHandler = true;
  sdk_options.loggingOptions.logLevel = log_level;
  sdk_options.loggingOptions.logger_create_fn = [log_level]() {
    return Aws::MakeShared<Aws::Utils::Logging::ConsoleLogSystem>("console_log_system", log_level);
  };
  sdk_options.loggingOptions.crt_logger_create_fn = [crt_log_level]() {
    return Aws::MakeShared<Aws::Utils::Logging::DefaultCRTLogSystem>("default_crt_log_system", crt_log_level);
  };

  Aws::InitAPI(sdk_options);
  {
    auto run_handler_callback = [this](const aws::lambda_runtime::invocation_request& request) {
      auto response = aws::lambda_runtime::invocation_response::failure("", "application/json");
      try {
        response = HandlerFunction(request);
      } catch (const std::exception& exception) {
        AWS_LOGSTREAM_ERROR(kWorkerTag.c_str(), "Request failed: " << exception.what());
        Aws::Utils::Json::JsonValue message;
        message.WithString(kResponseMessageAttribute, exception.what()).WithInteger(kResponseIsSuccessAttribute, 0);
        response =
            aws::lambda_runtime::invocation_response::failure(message.View().WriteCompact(), "application/json");
      }

      // Large content buffers are freed in the middle of the heap and would otherwise not be returned to the system
      // between consecutive invocations.
      malloc_trim(0);
      return response;
    };

    aws::lambda_runtime::run_handler(run_handler_callback);
  }
  Aws::ShutdownAPI(sdk_options);
  DeregisterSignalHandler();
}

aws::lambda_runtime::invocation_response Function::HandlerFunction(
    const aws::lambda_runtime::invocation_request& request) const {
  const auto json_value = Aws::Utils::Json::JsonValue(request.payload);
  if (!json_value.WasParseSuccessful()) {
    return aws::lambda_runtime::invocation_response::failure("The request is not valid JSON.", "text/plain");
  }

  return OnHandleRequest(json_value.View());
}

}  // namespace skyread
