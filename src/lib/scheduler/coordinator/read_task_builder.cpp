#include "read_task_builder.hpp"

#include <aws/core/utils/logging/LogMacros.h>

#include "constants.hpp"
#include "utils/assert.hpp"

namespace skyread {

ReadTaskBuilder::ReadTaskBuilder(std::shared_ptr<const ListingEngine> listing_engine)
    : listing_engine_(std::move(listing_engine)) {
  Assert(listing_engine_ != nullptr, "ReadTaskBuilder requires a listing engine.");
}

std::pair<std::vector<ReadTaskDefinition>, StorageError> ReadTaskBuilder::Build(const std::string& bucket,
                                                                                const std::string& prefix) const {
  // Reads apply to every concrete key, so the listing must not collapse keys into groups.
  const auto [objects, error] = listing_engine_->ListSummaries(bucket, prefix, std::nullopt);
  if (error) {
    return {{}, error};
  }

  std::vector<ReadTaskDefinition> read_tasks;
  read_tasks.reserve(objects.size());
  for (const auto& object : objects) {
    read_tasks.emplace_back(bucket, object.GetIdentifier());
  }

  AWS_LOGSTREAM_DEBUG(kCoordinatorTag.c_str(),
                      "Built " << read_tasks.size() << " read tasks for " << bucket << "/" << prefix << ".");
  return {std::move(read_tasks), StorageError::Success()};
}

}  // namespace skyread
