#include "listing_engine.hpp"

#include <algorithm>

#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "utils/assert.hpp"

namespace skyread {

ListingEngine::ListingEngine(std::shared_ptr<ObjectStore> object_store) : object_store_(std::move(object_store)) {
  Assert(object_store_ != nullptr, "ListingEngine requires an object store.");
}

std::pair<std::vector<ObjectStatus>, StorageError> ListingEngine::List(
    const std::string& bucket, const std::string& prefix, const std::optional<std::string>& delimiter) const {
  auto [entries, error] = object_store_->List(bucket, prefix, delimiter);
  if (error) {
    AWS_LOGSTREAM_WARN(kBaseTag.c_str(), "Listing failed: " << error.WithObject(bucket, ""));
    return std::make_pair(std::vector<ObjectStatus>(), error.WithObject(bucket, ""));
  }

  auto result = Normalize(std::move(entries), prefix, delimiter);
  AWS_LOGSTREAM_DEBUG(kBaseTag.c_str(),
                      "Listing of bucket '" << bucket << "' with prefix '" << prefix << "' has " << result.size()
                                            << " entries.");
  return std::make_pair(std::move(result), StorageError::Success());
}

std::pair<std::vector<ObjectStatus>, StorageError> ListingEngine::ListSummaries(
    const std::string& bucket, const std::string& prefix, const std::optional<std::string>& delimiter) const {
  auto [entries, error] = List(bucket, prefix, delimiter);
  std::erase_if(entries, [](const ObjectStatus& entry) { return entry.IsKeyGroup(); });
  return std::make_pair(std::move(entries), error);
}

std::vector<ObjectStatus> ListingEngine::Normalize(std::vector<ObjectStatus> entries, const std::string& prefix,
                                                   const std::optional<std::string>& delimiter) {
  const bool has_delimiter = delimiter.has_value() && !delimiter->empty();

  std::vector<ObjectStatus> result;
  result.reserve(entries.size());

  for (auto& entry : entries) {
    const std::string& key = entry.GetIdentifier();
    if (!key.starts_with(prefix)) {
      continue;
    }

    if (!has_delimiter) {
      if (!entry.IsKeyGroup()) {
        result.push_back(std::move(entry));
      }
      continue;
    }

    // Backends that group server-side return key groups that already end with the delimiter. Collapsing them again
    // yields the same key group.
    const size_t delimiter_position = key.find(*delimiter, prefix.size());
    if (delimiter_position == std::string::npos) {
      result.push_back(std::move(entry));
    } else {
      result.push_back(ObjectStatus::KeyGroup(key.substr(0, delimiter_position + delimiter->size())));
    }
  }

  std::stable_sort(result.begin(), result.end(), [](const ObjectStatus& lhs, const ObjectStatus& rhs) {
    return lhs.GetIdentifier() < rhs.GetIdentifier();
  });

  const auto duplicates = std::unique(result.begin(), result.end(), [](const ObjectStatus& lhs, const ObjectStatus& rhs) {
    return lhs.GetIdentifier() == rhs.GetIdentifier();
  });
  result.erase(duplicates, result.end());

  return result;
}

}  // namespace skyread
