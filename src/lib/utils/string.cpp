#include "string.hpp"

namespace skyread {

std::string TrimSourceFilePath(const std::string& file_path) {
  const auto src_position = file_path.find("/src/");

  return src_position == std::string::npos ? file_path : file_path.substr(src_position + 1);
}

std::vector<std::string> SplitStringByDelimiter(const std::string& string, const char delimiter) {
  std::stringstream stream(string);
  std::string token;
  std::vector<std::string> substrings;

  while (std::getline(stream, token, delimiter)) {
    substrings.emplace_back(token);
  }

  return substrings;
}

}  // namespace skyread
