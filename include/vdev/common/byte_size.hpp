#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "vdev/common/diagnostic.hpp"

namespace vdev::common {

// Parse a human size string into bytes.
// Accepted: "4096", "100B", "512K", "1G", "1.5G", "2GiB", "10mb" (1024-based,
// case-insensitive). Fractions are truncated to whole bytes.
auto ParseByteSize(std::string_view text) -> Result<uint64_t>;

// "1G", "1.5G", "512B": for log lines and listings.
auto FormatByteSize(uint64_t bytes) -> std::string;

}  // namespace vdev::common
