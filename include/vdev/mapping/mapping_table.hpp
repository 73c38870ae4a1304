#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "vdev/common/diagnostic.hpp"
#include "vdev/mapping/fault_spec.hpp"

namespace vdev::mapping {

// Identity remap onto the underlying device: source_offset == start_block.
struct PassThrough {
  uint64_t start_block = 0;
  uint64_t length = 0;
  uint64_t source_offset = 0;

  auto operator==(const PassThrough&) const -> bool = default;
};

// Every I/O in [start_block, start_block + length) fails.
struct Fault {
  uint64_t start_block = 0;
  uint64_t length = 0;

  auto operator==(const Fault&) const -> bool = default;
};

using Segment = std::variant<PassThrough, Fault>;

auto SegmentStart(const Segment& segment) -> uint64_t;
auto SegmentLength(const Segment& segment) -> uint64_t;
auto IsFault(const Segment& segment) -> bool;

// Gapless partition of [0, total_blocks) into segments.
//
// Invariants (CheckMappingTable):
//   - segments are ordered, contiguous and non-overlapping
//   - every length is > 0
//   - the first starts at 0 and the lengths sum to total_blocks
struct MappingTable {
  uint64_t total_blocks = 0;
  std::vector<Segment> segments;

  auto operator==(const MappingTable&) const -> bool = default;

  [[nodiscard]] auto FaultBlockCount() const -> uint64_t;
  [[nodiscard]] auto FaultSegmentCount() const -> size_t;
};

// Compile a validated spec over a device of total_blocks blocks.
// The spec is normalized first, so unsorted, overlapping and adjacent input
// ranges are accepted. Throws InternalError if total_blocks is 0 or a range
// exceeds the device (ValidateFaultSpec must have run).
auto CompileMappingTable(const FaultSpec& spec, uint64_t total_blocks)
    -> MappingTable;

auto CheckMappingTable(const MappingTable& table) -> Result<void>;

// Device-mapper table text, one line per segment, each ending in '\n':
//   <start> <length> linear <device_path> <source_offset>
//   <start> <length> error
auto FormatDmTable(const MappingTable& table, std::string_view device_path)
    -> std::string;

}  // namespace vdev::mapping
