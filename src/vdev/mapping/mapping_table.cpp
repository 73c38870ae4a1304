#include "vdev/mapping/mapping_table.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <variant>

#include <fmt/core.h>

#include "vdev/common/diagnostic.hpp"
#include "vdev/common/internal_error.hpp"
#include "vdev/common/overloaded.hpp"
#include "vdev/mapping/fault_spec.hpp"

namespace vdev::mapping {

auto SegmentStart(const Segment& segment) -> uint64_t {
  return std::visit([](const auto& s) { return s.start_block; }, segment);
}

auto SegmentLength(const Segment& segment) -> uint64_t {
  return std::visit([](const auto& s) { return s.length; }, segment);
}

auto IsFault(const Segment& segment) -> bool {
  return std::holds_alternative<Fault>(segment);
}

auto MappingTable::FaultBlockCount() const -> uint64_t {
  uint64_t count = 0;
  for (const auto& segment : segments) {
    if (IsFault(segment)) {
      count += SegmentLength(segment);
    }
  }
  return count;
}

auto MappingTable::FaultSegmentCount() const -> size_t {
  size_t count = 0;
  for (const auto& segment : segments) {
    if (IsFault(segment)) {
      ++count;
    }
  }
  return count;
}

auto CompileMappingTable(const FaultSpec& spec, uint64_t total_blocks)
    -> MappingTable {
  if (total_blocks == 0) {
    common::ThrowInternalError(
        "CompileMappingTable", "device has no addressable blocks");
  }

  FaultSpec normalized = NormalizeFaultSpec(spec);

  MappingTable table{.total_blocks = total_blocks, .segments = {}};
  uint64_t cursor = 0;

  for (const auto& range : normalized.ranges) {
    if (range.end >= total_blocks) {
      common::ThrowInternalError(
          "CompileMappingTable",
          fmt::format(
              "range {}-{} exceeds {} blocks", range.start, range.end,
              total_blocks));
    }
    if (range.start < cursor) {
      common::ThrowInternalError(
          "CompileMappingTable",
          fmt::format(
              "range {}-{} starts behind cursor {}", range.start, range.end,
              cursor));
    }

    if (cursor < range.start) {
      table.segments.emplace_back(
          PassThrough{
              .start_block = cursor,
              .length = range.start - cursor,
              .source_offset = cursor});
    }
    table.segments.emplace_back(
        Fault{.start_block = range.start, .length = range.Length()});
    cursor = range.end + 1;
  }

  if (cursor < total_blocks) {
    table.segments.emplace_back(
        PassThrough{
            .start_block = cursor,
            .length = total_blocks - cursor,
            .source_offset = cursor});
  }

  return table;
}

auto CheckMappingTable(const MappingTable& table) -> Result<void> {
  auto broken = [](std::string why) {
    return std::unexpected(
        Diagnostic::DeviceSetupFailure("malformed mapping table: " + why));
  };

  if (table.segments.empty()) {
    return broken("no segments");
  }

  uint64_t expected_start = 0;
  for (size_t i = 0; i < table.segments.size(); ++i) {
    const Segment& segment = table.segments[i];
    uint64_t start = SegmentStart(segment);
    uint64_t length = SegmentLength(segment);

    if (length == 0) {
      return broken(fmt::format("segment {} has zero length", i));
    }
    if (start != expected_start) {
      return broken(
          fmt::format(
              "segment {} starts at {}, expected {}", i, start,
              expected_start));
    }
    if (const auto* pass = std::get_if<PassThrough>(&segment)) {
      if (pass->source_offset != pass->start_block) {
        return broken(
            fmt::format(
                "segment {} remaps {} to {}", i, pass->start_block,
                pass->source_offset));
      }
    }
    if (length > table.total_blocks - start) {
      return broken(
          fmt::format("segment {} runs past {} blocks", i, table.total_blocks));
    }
    expected_start = start + length;
  }

  if (expected_start != table.total_blocks) {
    return broken(
        fmt::format(
            "segments cover {} of {} blocks", expected_start,
            table.total_blocks));
  }
  return {};
}

auto FormatDmTable(const MappingTable& table, std::string_view device_path)
    -> std::string {
  std::string out;
  for (const auto& segment : table.segments) {
    std::visit(
        common::Overloaded{
            [&](const PassThrough& pass) {
              out += fmt::format(
                  "{} {} linear {} {}\n", pass.start_block, pass.length,
                  device_path, pass.source_offset);
            },
            [&](const Fault& fault) {
              out += fmt::format(
                  "{} {} error\n", fault.start_block, fault.length);
            },
        },
        segment);
  }
  return out;
}

}  // namespace vdev::mapping
