#pragma once

#include <aws/core/Aws.h>

namespace skyread {

// Initializes the AWS SDK for the lifetime of the object. Tests that construct SDK clients or use the SDK's JSON and
// Base64 utilities hold one as a member of their fixture.
// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions,hicpp-special-member-functions)
class AwsApi {
 public:
  AwsApi() {
    options_.httpOptions.installSigPipeHandler = true;
    Aws::InitAPI(options_);
  }
  ~AwsApi() { Aws::ShutdownAPI(options_); }

 private:
  Aws::SDKOptions options_;
};

}  // namespace skyread
