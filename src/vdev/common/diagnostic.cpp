#include "vdev/common/diagnostic.hpp"

namespace vdev {

auto ToString(ErrorKind kind) -> const char* {
  switch (kind) {
    case ErrorKind::kInvalidSizeSpec:
      return "invalid size";
    case ErrorKind::kInvalidBlockRange:
      return "invalid block range";
    case ErrorKind::kResourceExhaustion:
      return "resource exhausted";
    case ErrorKind::kDeviceSetupFailure:
      return "device setup failed";
    case ErrorKind::kTeardownFailure:
      return "teardown failed";
    case ErrorKind::kHostError:
      return "host error";
  }
  return "error";
}

}  // namespace vdev
