#pragma once

#include <sstream>
#include <string>
#include <vector>

namespace skyread {

/**
 * Crops @param file_path to ensure readable Assert messages.
 * E.g., "/long/path/1234/src/lib/file.cpp" becomes "src/lib/file.cpp"
 */
std::string TrimSourceFilePath(const std::string& file_path);

/**
 * @return the substrings of @param string separated by @param delimiter. A trailing delimiter does not produce an
 * empty last element.
 */
std::vector<std::string> SplitStringByDelimiter(const std::string& string, const char delimiter);

/**
 * Reads the remaining content of @param stream into a string.
 */
template <typename T>
std::string StreamToString(T* stream) {
  std::ostringstream string_stream;
  string_stream << stream->rdbuf();
  return string_stream.str();
}

}  // namespace skyread
