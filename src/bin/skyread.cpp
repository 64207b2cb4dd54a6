#include <algorithm>
#include <iostream>
#include <thread>

#include <aws/core/Aws.h>
#include <aws/core/utils/logging/ConsoleLogSystem.h>
#include <aws/core/utils/logging/LogLevel.h>
#include <aws/core/utils/logging/LogMacros.h>

#include "client/base_client.hpp"
#include "configuration.hpp"
#include "constants.hpp"
#include "scheduler/coordinator/lambda_read_task_executor.hpp"
#include "scheduler/coordinator/task_graph_cluster.hpp"
#include "storage/backend/filesystem_object_store.hpp"
#include "storage/backend/s3_object_store.hpp"
#include "tool/object_tools.hpp"
#include "tool/tool_config.hpp"
#include "utils/assert.hpp"
#include "utils/signal_handler.hpp"

using namespace skyread;  // NOLINT(google-build-using-namespace)

namespace {

enum class StorageBackend { kS3, kFilesystem };
enum class ReadExecutor { kLocal, kLambda };

ToolEnvironment CreateEnvironment(const cxxopts::ParseResult& parse_result, std::shared_ptr<BaseClient>* client) {
  const auto storage = OptionToEnum<StorageBackend>(parse_result[kStorageOption].as<std::string>(), kStorageOption);
  const auto executor = OptionToEnum<ReadExecutor>(parse_result[kExecutorOption].as<std::string>(), kExecutorOption);
  AssertInput(executor == ReadExecutor::kLocal || storage == StorageBackend::kS3,
              "Lambda read workers can only read from S3.");

  ToolEnvironment environment;
  if (storage == StorageBackend::kS3) {
    *client = std::make_shared<BaseClient>();
    AWS_LOGSTREAM_INFO(kCoordinatorTag.c_str(), "Using AWS region " << (*client)->GetClientRegion() << ".");
    environment.object_store = std::make_shared<S3ObjectStore>((*client)->GetS3Client());
  } else {
    environment.object_store = std::make_shared<FilesystemObjectStore>(parse_result[kRootOption].as<std::string>());
  }

  size_t thread_count = parse_result[kThreadsOption].as<size_t>();
  std::shared_ptr<AbstractReadTaskExecutor> read_task_executor;
  if (executor == ReadExecutor::kLambda) {
    read_task_executor = std::make_shared<LambdaReadTaskExecutor>((*client)->GetLambdaClient());
    thread_count = thread_count == 0 ? kLambdaClusterThreadCount : thread_count;
  } else {
    read_task_executor = std::make_shared<LocalReadTaskExecutor>(environment.object_store);
    thread_count = thread_count == 0 ? std::max(1u, std::thread::hardware_concurrency()) : thread_count;
  }
  environment.cluster = std::make_shared<TaskGraphCluster>(read_task_executor, thread_count);

  return environment;
}

int RunTool(ToolType tool, const cxxopts::ParseResult& parse_result) {
  std::shared_ptr<BaseClient> client;
  const ToolEnvironment environment = CreateEnvironment(parse_result, &client);
  AWS_LOGSTREAM_INFO(kCoordinatorTag.c_str(), "Running " << magic_enum::enum_name(tool) << ".");

  switch (tool) {
    case ToolType::kListObjects:
      return ListObjectsTool(parse_result, environment, &std::cout);
    case ToolType::kReadKey:
      return ReadKeyTool(parse_result, environment, &std::cout);
    case ToolType::kReadBytes:
      return ReadBytesTool(parse_result, environment, &std::cout);
    case ToolType::kReadText:
      return ReadTextTool(parse_result, environment, &std::cout);
    default:
      Fail("The tool '" + parse_result[kToolOption].as<std::string>() + "' is not implemented!");
  }
}

}  // namespace

/**
 * The command line interface (CLI) for skyread, e.g.,
 *   ./skyread --tool list-objects --bucket data --prefix tmp/ --delimiter /
 *   ./skyread --tool read-bytes --storage filesystem --root /data --bucket logs --prefix 2024/ --lazy
 */
int main(int argc, char** argv) {
  RegisterSignalHandler();
  int exit_code = 0;
  try {
    cxxopts::Options cli_options = ConfigureCliOptions();
    const cxxopts::ParseResult parse_result = cli_options.parse(argc, argv);

    if (parse_result.count(kHelpOption) || !parse_result.count(kToolOption)) {
      // Print help and terminate.
      std::cout << cli_options.help() << std::endl;
      return parse_result.count(kHelpOption) ? 0 : 1;
    }

    const ToolType tool = ToolOptionToEnum(parse_result[kToolOption].as<std::string>());
    const auto log_level = OptionToEnum<Aws::Utils::Logging::LogLevel>(
        parse_result[kLogLevelOption].as<std::string>(), kLogLevelOption, "");

    Aws::SDKOptions sdk_options;
    sdk_options.loggingOptions.logLevel = log_level;
    sdk_options.loggingOptions.logger_create_fn = [log_level]() {
      return Aws::MakeShared<Aws::Utils::Logging::ConsoleLogSystem>("console_log_system", log_level);
    };

    Aws::InitAPI(sdk_options);
    try {
      exit_code = RunTool(tool, parse_result);
    } catch (const std::exception& exception) {
      std::cerr << exception.what() << std::endl;
      exit_code = 1;
    }
    Aws::ShutdownAPI(sdk_options);
  } catch (const std::exception& exception) {
    // Handle cxxopts exceptions and invalid input.
    std::cerr << exception.what() << std::endl;
    return 1;
  }
  DeregisterSignalHandler();
  return exit_code;
}
