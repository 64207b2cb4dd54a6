#pragma once

#include <cstddef>

#include "constants.hpp"

namespace skyread {

/**
 * The AWS Lambda service-side timeout limit for functions is 15 minutes. A single object read is not expected to run
 * longer than 5 minutes, so client requests time out after that.
 */
inline constexpr size_t kLambdaFunctionTimeoutSeconds = 300;

/**
 * Synchronous (RequestResponse) invocations return at most 6 MB of payload. Base64 encoding inflates the content by a
 * factor of 4/3, which leaves roughly 4.5 MB of object content per read task.
 */
inline constexpr size_t kLambdaSynchronousResponseLimitBytes = 6 * 1024 * 1024;
inline constexpr size_t kReadWorkerMaxContentBytes = kLambdaSynchronousResponseLimitBytes / 4 * 3 - 4096;

/**
 * Every Lambda-backed read task blocks one cluster thread for the duration of its invocation.
 */
inline constexpr size_t kLambdaClusterThreadCount = 256;

/**
 * The ratio between AWS SDK I/O threads and available CPU cores for the S3 client.
 */
inline constexpr size_t kIoThreadPoolToCpuRatio = 4;

/**
 * The maximum number of keys requested per ListObjectsV2 page.
 */
inline constexpr int kS3ListMaxKeys = 1000;

}  // namespace skyread
