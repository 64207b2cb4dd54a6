#include "lambda_read_task_executor.hpp"

#include <aws/core/utils/base64/Base64.h>
#include <aws/core/utils/json/JsonSerializer.h>
#include <aws/core/utils/logging/LogMacros.h>
#include <aws/lambda/model/InvokeRequest.h>
#include <magic_enum/magic_enum.hpp>

#include "utils/assert.hpp"
#include "utils/string.hpp"

namespace skyread {

namespace {

StorageErrorType TranslateLambdaError(const Aws::Client::AWSError<Aws::Lambda::LambdaErrors>& error) {
  if (error.ShouldRetry()) {
    return StorageErrorType::kTransientIOError;
  }

  switch (error.GetErrorType()) {
    case Aws::Lambda::LambdaErrors::ACCESS_DENIED:
    case Aws::Lambda::LambdaErrors::INVALID_ACCESS_KEY_ID:
    case Aws::Lambda::LambdaErrors::INVALID_CLIENT_TOKEN_ID:
    case Aws::Lambda::LambdaErrors::UNRECOGNIZED_CLIENT:
      return StorageErrorType::kAccessDenied;
    case Aws::Lambda::LambdaErrors::RESOURCE_NOT_FOUND:
      return StorageErrorType::kUninitialized;
    default:
      return StorageErrorType::kInternalError;
  }
}

TaskOutcome FailedOutcome(StorageErrorType type, const std::string& message, const ReadTaskDefinition& read_task) {
  TaskOutcome outcome;
  outcome.error = StorageError(type, message, read_task.bucket, read_task.key);
  return outcome;
}

}  // namespace

LambdaReadTaskExecutor::LambdaReadTaskExecutor(std::shared_ptr<const Aws::Lambda::LambdaClient> lambda_client,
                                               std::string function_name)
    : lambda_client_(std::move(lambda_client)), function_name_(std::move(function_name)) {
  Assert(lambda_client_ != nullptr, "LambdaReadTaskExecutor requires a Lambda client.");
}

TaskOutcome LambdaReadTaskExecutor::Execute(const ReadTaskDefinition& read_task) {
  Aws::Lambda::Model::InvokeRequest invoke_request;
  invoke_request.WithFunctionName(function_name_)
      .WithInvocationType(Aws::Lambda::Model::InvocationType::RequestResponse)
      .SetLogType(Aws::Lambda::Model::LogType::None);
  invoke_request.SetBody(std::make_shared<Aws::StringStream>(CreateRequestPayload(read_task)));

  AWS_LOGSTREAM_DEBUG(kCoordinatorTag.c_str(), "Invoking " << function_name_ << " for " << read_task.Description());
  auto outcome = lambda_client_->Invoke(invoke_request);
  if (!outcome.IsSuccess()) {
    const auto& error = outcome.GetError();
    AWS_LOGSTREAM_WARN(kCoordinatorTag.c_str(),
                       "Invocation of " << function_name_ << " failed: " << error.GetMessage());
    return FailedOutcome(TranslateLambdaError(error), error.GetMessage(), read_task);
  }

  auto& result = outcome.GetResult();
  const std::string payload = StreamToString(&result.GetPayload());
  if (!result.GetFunctionError().empty()) {
    return FailedOutcome(StorageErrorType::kInternalError, result.GetFunctionError() + ": " + payload, read_task);
  }

  return ParseResponsePayload(payload, read_task);
}

std::string LambdaReadTaskExecutor::CreateRequestPayload(const ReadTaskDefinition& read_task) {
  return Aws::Utils::Json::JsonValue().WithObject(kRequestReadTaskAttribute, read_task.ToJson()).View().WriteCompact();
}

TaskOutcome LambdaReadTaskExecutor::ParseResponsePayload(const std::string& payload,
                                                         const ReadTaskDefinition& read_task) {
  const Aws::Utils::Json::JsonValue response(payload);
  if (!response.WasParseSuccessful()) {
    return FailedOutcome(StorageErrorType::kInternalError, "Malformed read worker response.", read_task);
  }

  const auto response_view = response.View();
  if (!response_view.KeyExists(kResponseIsSuccessAttribute)) {
    return FailedOutcome(StorageErrorType::kInternalError,
                         "Read worker response lacks '" + kResponseIsSuccessAttribute + "'.", read_task);
  }

  const std::string message =
      response_view.KeyExists(kResponseMessageAttribute) ? response_view.GetString(kResponseMessageAttribute) : "";

  if (response_view.GetInteger(kResponseIsSuccessAttribute) == 0) {
    StorageErrorType type = StorageErrorType::kUnknown;
    if (response_view.KeyExists(kResponseErrorTypeAttribute)) {
      type = magic_enum::enum_cast<StorageErrorType>(response_view.GetString(kResponseErrorTypeAttribute))
                 .value_or(StorageErrorType::kUnknown);
    }
    // A failed response always carries an error, even if the worker reported kNoError.
    if (type == StorageErrorType::kNoError) {
      type = StorageErrorType::kUnknown;
    }
    return FailedOutcome(type, message, read_task);
  }

  if (!response_view.KeyExists(kResponseContentAttribute)) {
    return FailedOutcome(StorageErrorType::kInternalError,
                         "Read worker response lacks '" + kResponseContentAttribute + "'.", read_task);
  }

  const auto buffer = Aws::Utils::Base64::Base64().Decode(response_view.GetString(kResponseContentAttribute));
  TaskOutcome outcome;
  if (buffer.GetLength() > 0) {
    outcome.content.assign(reinterpret_cast<const char*>(buffer.GetUnderlyingData()), buffer.GetLength());
  }
  return outcome;
}

}  // namespace skyread
