#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace vdev::common {

// Raised when vdev's own invariants break (a bug, never bad user input).
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in vdev, not a problem with the host.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace vdev::common
