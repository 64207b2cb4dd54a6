#include "errors.hpp"

#include <sstream>

#include <magic_enum/magic_enum.hpp>

namespace skyread {

StorageError StorageError::WithObject(const std::string& bucket, const std::string& key) const {
  if (!bucket_.empty()) {
    return *this;
  }
  return {type_, message_, bucket, key};
}

std::string StorageError::ToString() const {
  std::ostringstream stream;
  stream << magic_enum::enum_name(type_);
  if (!bucket_.empty()) {
    stream << " (bucket: " << bucket_;
    if (!key_.empty()) {
      stream << ", key: " << key_;
    }
    stream << ")";
  }
  if (!message_.empty()) {
    stream << ": " << message_;
  }
  return stream.str();
}

std::ostream& operator<<(std::ostream& stream, const StorageError& error) { return stream << error.ToString(); }

}  // namespace skyread
