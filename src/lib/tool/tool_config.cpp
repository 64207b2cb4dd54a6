#include "tool_config.hpp"

#include <regex>
#include <string>

#include <boost/algorithm/string.hpp>

#include "constants.hpp"
#include "utils/assert.hpp"

namespace skyread {

ToolType ToolOptionToEnum(const std::string& tool_option) {
  std::smatch match;
  const bool is_valid_format = std::regex_match(tool_option, match, std::regex(kToolRegex));
  AssertInput(is_valid_format, "Tool must be specified in format 'verb-object', e.g., 'read-key'.");

  std::string verb = match[1].str();
  std::string object = match[2].str();
  verb.replace(0, 1, boost::to_upper_copy(verb.substr(0, 1)));
  object.replace(0, 1, boost::to_upper_copy(object.substr(0, 1)));

  const auto tool_type = magic_enum::enum_cast<ToolType>(kConstPrefix + verb + object);
  AssertInput(tool_type.has_value(), "The tool '" + tool_option + "' does not exist.");
  return tool_type.value();
}

cxxopts::Options ConfigureCliOptions() {
  cxxopts::Options cli_options(kProgramName, "Lists and reads objects of S3 or filesystem object stores.");
  // General options.
  cli_options.add_options(kHelpOption)("h, help", kHelpHint);
  cli_options.add_options(kToolOption)("t, tool", kToolHint, cxxopts::value<std::string>());
  cli_options.add_options("environment")(kStorageOption, kStorageHint,
                                         cxxopts::value<std::string>()->default_value("s3"))(
      kRootOption, kRootHint, cxxopts::value<std::string>()->default_value("."))(
      kExecutorOption, kExecutorHint, cxxopts::value<std::string>()->default_value("local"))(
      kThreadsOption, kThreadsHint, cxxopts::value<size_t>()->default_value("0"))(
      kLogLevelOption, kLogLevelHint, cxxopts::value<std::string>()->default_value("warn"));
  // Object selection shared by all tools.
  cli_options.add_options("objects")("b, bucket", kBucketHint, cxxopts::value<std::string>())(
      "p, prefix", kPrefixHint, cxxopts::value<std::string>()->default_value(""))(
      "k, key", kKeyHint, cxxopts::value<std::string>());
  // Tool-specific option groups.
  cli_options.add_options("list-objects")("d, delimiter", kDelimiterHint, cxxopts::value<std::string>());
  cli_options.add_options("read-bytes")(kLazyOption, kLazyHint);
  cli_options.add_options("read-text")("c, compression", kCompressionHint,
                                       cxxopts::value<std::string>()->default_value("none"));
  return cli_options;
}

}  // namespace skyread
