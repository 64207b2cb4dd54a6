#pragma once

#include <cctype>
#include <string>

#include <cxxopts.hpp>
#include <magic_enum/magic_enum.hpp>

#include "constants.hpp"
#include "utils/assert.hpp"

namespace skyread {

enum class ToolType { kListObjects, kReadKey, kReadBytes, kReadText };

static constexpr auto kHelpOption = "help";
static constexpr auto kHelpHint = "Print usage";

static constexpr auto kToolOption = "tool";
static constexpr auto kToolHint = "Name of the tool, i.e., 'list-objects', 'read-key', 'read-bytes' or 'read-text'";
static constexpr auto kToolRegex = "([a-z]+)-([a-z]+)";

static constexpr auto kStorageOption = "storage";
static constexpr auto kStorageHint = "Object store, i.e., 's3' or 'filesystem'";
static constexpr auto kRootOption = "root";
static constexpr auto kRootHint = "Root directory of the filesystem object store; buckets are its subdirectories";
static constexpr auto kExecutorOption = "executor";
static constexpr auto kExecutorHint = "Where reads run, i.e., 'local' or 'lambda' (requires --storage s3)";
static constexpr auto kThreadsOption = "threads";
static constexpr auto kThreadsHint = "Number of cluster threads; 0 picks a default for the executor";
static constexpr auto kLogLevelOption = "log-level";
static constexpr auto kLogLevelHint = "AWS SDK log level, e.g., 'error', 'warn', 'info', 'debug' or 'trace'";

static constexpr auto kBucketOption = "bucket";
static constexpr auto kBucketHint = "Bucket name";
static constexpr auto kPrefixOption = "prefix";
static constexpr auto kPrefixHint = "Key prefix";
static constexpr auto kDelimiterOption = "delimiter";
static constexpr auto kDelimiterHint = "Delimiter that collapses keys into key groups, e.g., '/'";
static constexpr auto kKeyOption = "key";
static constexpr auto kKeyHint = "Object key";
static constexpr auto kLazyOption = "lazy";
static constexpr auto kLazyHint = "Build the read graph first and submit it afterwards";
static constexpr auto kCompressionOption = "compression";
static constexpr auto kCompressionHint = "Compression of the objects, i.e., 'none', 'gzip' or 'zstd'";

static constexpr auto kProgramName = "skyread";

/**
 * Transforms user input, e.g., 'list-objects' to 'kListObjects' and returns the enum value. Throws an
 * InvalidInputException for malformed or unknown tool names.
 */
ToolType ToolOptionToEnum(const std::string& tool_option);

/**
 * Transforms lower-case user input, e.g., 'gzip' to the enum value 'kGzip' of @tparam Enum. Enums whose values are not
 * prefixed with 'k', e.g., Aws::Utils::Logging::LogLevel, pass an empty @param prefix. Throws an
 * InvalidInputException for unknown names.
 */
template <typename Enum>
Enum OptionToEnum(const std::string& option, const std::string& option_name, const std::string& prefix = kConstPrefix) {
  std::string name = option;
  if (!name.empty()) {
    name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
  }
  const auto value = magic_enum::enum_cast<Enum>(prefix + name);
  AssertInput(value.has_value(), "Unknown " + option_name + " '" + option + "'.");
  return value.value();
}

/**
 * Defines groups of valid CLI options which can be passed to the skyread binary.
 */
cxxopts::Options ConfigureCliOptions();

}  // namespace skyread
