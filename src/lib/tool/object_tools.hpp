#pragma once

#include <memory>
#include <ostream>

#include <cxxopts.hpp>

#include "scheduler/coordinator/abstract_cluster.hpp"
#include "storage/backend/object_store.hpp"

namespace skyread {

/**
 * What the tools operate on. The CLI creates it from the environment options; tests inject mocks.
 */
struct ToolEnvironment {
  std::shared_ptr<ObjectStore> object_store;
  std::shared_ptr<AbstractCluster> cluster;
};

/**
 * Prints one line per listing entry: "<size>\t<key>" for objects and "PRE\t<key>" for key groups.
 * @return the process exit code.
 */
int ListObjectsTool(const cxxopts::ParseResult& parse_result, const ToolEnvironment& environment,
                    std::ostream* output);

/**
 * Writes the content of one key.
 */
int ReadKeyTool(const cxxopts::ParseResult& parse_result, const ToolEnvironment& environment, std::ostream* output);

/**
 * Reads every key under the prefix on the cluster and prints one line per key in listing order, e.g.,
 * "1\treadKey(data/tmp/file1)". Failed reads are printed as "ERROR\treadKey(data/tmp/file1)\t<error>" and do not
 * stop the other reads.
 */
int ReadBytesTool(const cxxopts::ParseResult& parse_result, const ToolEnvironment& environment, std::ostream* output);

/**
 * Reads and decompresses every key under the prefix and prints their lines in listing order.
 */
int ReadTextTool(const cxxopts::ParseResult& parse_result, const ToolEnvironment& environment, std::ostream* output);

}  // namespace skyread
