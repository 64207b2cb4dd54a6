#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "read_task_definition.hpp"
#include "storage/access/listing_engine.hpp"

namespace skyread {

/**
 * Creates one read task per concrete key under a prefix, in listing order. Building never fetches content.
 */
class ReadTaskBuilder {
 public:
  explicit ReadTaskBuilder(std::shared_ptr<const ListingEngine> listing_engine);

  /**
   * An empty listing results in zero read tasks and no error. A failed listing results in no read tasks at all and the
   * listing error.
   */
  std::pair<std::vector<ReadTaskDefinition>, StorageError> Build(const std::string& bucket,
                                                                 const std::string& prefix) const;

 private:
  std::shared_ptr<const ListingEngine> listing_engine_;
};

}  // namespace skyread
