#include "object_tools.hpp"

#include <iostream>
#include <optional>
#include <string>

#include "scheduler/coordinator/read_execution_strategy.hpp"
#include "storage/access/key_reader.hpp"
#include "storage/access/listing_engine.hpp"
#include "tool_config.hpp"
#include "utils/assert.hpp"

namespace skyread {

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;

std::string RequiredOption(const cxxopts::ParseResult& parse_result, const std::string& option) {
  AssertInput(parse_result.count(option) > 0, "The option '--" + option + "' is required.");
  return parse_result[option].as<std::string>();
}

ReadExecutionStrategy CreateStrategy(const ToolEnvironment& environment) {
  auto listing_engine = std::make_shared<const ListingEngine>(environment.object_store);
  return {ReadTaskBuilder(std::move(listing_engine)), environment.cluster};
}

ExecutionMode ParseExecutionMode(const cxxopts::ParseResult& parse_result) {
  return parse_result.count(kLazyOption) > 0 ? ExecutionMode::kLazy : ExecutionMode::kEager;
}

int ReportError(const StorageError& error) {
  std::cerr << error << '\n';
  return kExitFailure;
}

}  // namespace

int ListObjectsTool(const cxxopts::ParseResult& parse_result, const ToolEnvironment& environment,
                    std::ostream* output) {
  const std::string bucket = RequiredOption(parse_result, kBucketOption);
  const std::string prefix = parse_result[kPrefixOption].as<std::string>();
  const std::optional<std::string> delimiter =
      parse_result.count(kDelimiterOption) > 0 ? std::make_optional(parse_result[kDelimiterOption].as<std::string>())
                                               : std::nullopt;

  const ListingEngine listing_engine(environment.object_store);
  const auto [entries, error] = listing_engine.List(bucket, prefix, delimiter);
  if (error) {
    return ReportError(error);
  }

  for (const auto& entry : entries) {
    if (entry.IsKeyGroup()) {
      *output << "PRE\t" << entry.GetIdentifier() << '\n';
    } else {
      *output << entry.GetSize().value() << '\t' << entry.GetIdentifier() << '\n';
    }
  }
  return kExitSuccess;
}

int ReadKeyTool(const cxxopts::ParseResult& parse_result, const ToolEnvironment& environment, std::ostream* output) {
  const std::string bucket = RequiredOption(parse_result, kBucketOption);
  const std::string key = RequiredOption(parse_result, kKeyOption);

  const KeyReader key_reader(environment.object_store);
  std::string content;
  const StorageError error = key_reader.Read(bucket, key, &content);
  if (error) {
    return ReportError(error);
  }

  output->write(content.data(), static_cast<std::streamsize>(content.size()));
  return kExitSuccess;
}

int ReadBytesTool(const cxxopts::ParseResult& parse_result, const ToolEnvironment& environment, std::ostream* output) {
  const std::string bucket = RequiredOption(parse_result, kBucketOption);
  const std::string prefix = parse_result[kPrefixOption].as<std::string>();

  const ReadExecutionStrategy strategy = CreateStrategy(environment);
  const auto [handles, error] = strategy.ReadBytes(bucket, prefix, ParseExecutionMode(parse_result));
  if (error) {
    return ReportError(error);
  }

  const std::vector<TaskFuture> futures = strategy.Dispatch(handles);
  const std::vector<TaskOutcome> outcomes = environment.cluster->Gather(futures);
  for (size_t i = 0; i < outcomes.size(); ++i) {
    if (outcomes[i].IsSuccess()) {
      *output << outcomes[i].content.size() << '\t' << futures[i].Description() << '\n';
    } else {
      *output << "ERROR\t" << futures[i].Description() << '\t' << outcomes[i].error << '\n';
    }
  }

  const StorageError batch_error = CheckBatch(outcomes);
  return batch_error ? ReportError(batch_error) : kExitSuccess;
}

int ReadTextTool(const cxxopts::ParseResult& parse_result, const ToolEnvironment& environment, std::ostream* output) {
  const std::string bucket = RequiredOption(parse_result, kBucketOption);
  const std::string prefix = parse_result[kPrefixOption].as<std::string>();
  const auto compression =
      OptionToEnum<CompressionType>(parse_result[kCompressionOption].as<std::string>(), kCompressionOption);

  const ReadExecutionStrategy strategy = CreateStrategy(environment);
  const auto [handles, error] = strategy.ReadText(bucket, prefix, ParseExecutionMode(parse_result), compression);
  if (error) {
    return ReportError(error);
  }

  const std::vector<TaskOutcome> outcomes = environment.cluster->Gather(strategy.Dispatch(handles));
  for (const auto& outcome : outcomes) {
    if (!outcome.IsSuccess()) {
      continue;
    }
    for (const auto& line : SplitLines(outcome.content)) {
      *output << line << '\n';
    }
  }

  const StorageError batch_error = CheckBatch(outcomes);
  return batch_error ? ReportError(batch_error) : kExitSuccess;
}

}  // namespace skyread
