#include "vdev/session/batch_plan.hpp"

#include <cstdint>
#include <expected>
#include <random>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "vdev/common/byte_size.hpp"
#include "vdev/common/diagnostic.hpp"
#include "vdev/mapping/fault_spec.hpp"

namespace vdev::session {

using mapping::kSectorSize;

auto ResolveSizes(const BatchPlan& plan, std::mt19937_64& rng)
    -> Result<std::vector<uint64_t>> {
  if (!plan.size_range) {
    if (plan.size_bytes < kSectorSize) {
      return std::unexpected(
          Diagnostic::InvalidSizeSpec(
              fmt::format(
                  "size {} is smaller than one {}-byte block",
                  common::FormatByteSize(plan.size_bytes), kSectorSize)));
    }
    return std::vector<uint64_t>(plan.count, plan.size_bytes);
  }

  const SizeRange& range = *plan.size_range;
  if (range.min_bytes > range.max_bytes) {
    return std::unexpected(
        Diagnostic::InvalidSizeSpec(
            fmt::format(
                "minimum size {} is larger than maximum size {}",
                common::FormatByteSize(range.min_bytes),
                common::FormatByteSize(range.max_bytes))));
  }

  uint64_t lo = (range.min_bytes + kSectorSize - 1) / kSectorSize;
  uint64_t hi = range.max_bytes / kSectorSize;
  if (lo == 0) {
    lo = 1;
  }
  if (lo > hi) {
    return std::unexpected(
        Diagnostic::InvalidSizeSpec(
            fmt::format(
                "size range {}..{} holds no whole {}-byte block",
                range.min_bytes, range.max_bytes, kSectorSize)));
  }

  std::uniform_int_distribution<uint64_t> dist(lo, hi);
  std::vector<uint64_t> sizes;
  sizes.reserve(plan.count);
  for (uint32_t i = 0; i < plan.count; ++i) {
    sizes.push_back(dist(rng) * kSectorSize);
  }
  return sizes;
}

auto MakeSessionId() -> std::string {
  std::random_device rd;
  return fmt::format("{:06x}", rd() & 0xffffffU);
}

}  // namespace vdev::session
