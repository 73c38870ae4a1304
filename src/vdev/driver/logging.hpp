#pragma once

#include <optional>
#include <string>

#include "vdev/common/diagnostic.hpp"

namespace vdev::driver {

struct LogOptions {
  bool verbose = false;  // -v
  bool quiet = false;    // -q
  std::optional<std::string> config_level;
};

// Install the "vdev" stderr logger as spdlog's default. Command line flags
// win over the config level; info otherwise.
auto ConfigureLogging(const LogOptions& options) -> Result<void>;

}  // namespace vdev::driver
