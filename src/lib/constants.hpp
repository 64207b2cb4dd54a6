#pragma once

#include <string>

namespace skyread {

const std::string kConstPrefix = "k";

const std::string kBaseTag = "Skyread";
const std::string kCoordinatorTag = "SkyreadCoordinator";
const std::string kWorkerTag = "SkyreadWorker";

/**
 * The operation name of a read task definition. A read task fetches the complete content of one key.
 */
inline const std::string kReadKeyOperation = "readKey";

/**
 * Read worker binary and function names.
 */
inline const std::string kReadWorkerBinaryName = "skyreadReadWorkerFunction";
inline const std::string kReadWorkerFunctionName = kReadWorkerBinaryName;

/**
 * Function request parameter.
 */
inline const std::string kRequestReadTaskAttribute = "read_task";

/**
 * Read task definition attributes.
 */
inline const std::string kReadTaskOperationAttribute = "operation";
inline const std::string kReadTaskBucketAttribute = "bucket";
inline const std::string kReadTaskKeyAttribute = "key";

/**
 * Function response parameter.
 */
inline const std::string kResponseIsSuccessAttribute = "isSuccess";
inline const std::string kResponseMessageAttribute = "message";
inline const std::string kResponseContentAttribute = "content";
inline const std::string kResponseErrorTypeAttribute = "error_type";

}  // namespace skyread
