#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <random>
#include <string>
#include <variant>

#include "vdev/common/diagnostic.hpp"
#include "vdev/common/internal_error.hpp"
#include "vdev/mapping/fault_spec.hpp"
#include "vdev/mapping/mapping_table.hpp"

namespace vdev::mapping {
namespace {

class MappingTableTest : public ::testing::Test {
 protected:
  static auto Compile(const std::string& blocks, uint64_t total)
      -> MappingTable {
    auto spec = ParseFaultSpec(blocks, total);
    EXPECT_TRUE(spec.has_value()) << spec.error().message;
    return CompileMappingTable(*spec, total);
  }

  // Coverage property: contiguous from 0, lengths sum to total, all > 0.
  static void ExpectCovers(const MappingTable& table, uint64_t total) {
    uint64_t cursor = 0;
    for (const auto& segment : table.segments) {
      EXPECT_EQ(SegmentStart(segment), cursor);
      EXPECT_GT(SegmentLength(segment), 0);
      cursor += SegmentLength(segment);
    }
    EXPECT_EQ(cursor, total);
    EXPECT_TRUE(CheckMappingTable(table).has_value());
  }
};

// =============================================================================
// Compilation
// =============================================================================

TEST_F(MappingTableTest, NoFaultsIsOnePassThrough) {
  auto table = Compile("", 2048);
  ASSERT_EQ(table.segments.size(), 1);
  EXPECT_EQ(
      std::get<PassThrough>(table.segments[0]),
      (PassThrough{.start_block = 0, .length = 2048, .source_offset = 0}));
  EXPECT_EQ(table.FaultBlockCount(), 0);
}

TEST_F(MappingTableTest, TwoSingleBlocksGiveFiveSegments) {
  auto table = Compile("500,1000", 2048);
  ASSERT_EQ(table.segments.size(), 5);
  EXPECT_EQ(
      std::get<Fault>(table.segments[1]),
      (Fault{.start_block = 500, .length = 1}));
  EXPECT_EQ(
      std::get<Fault>(table.segments[3]),
      (Fault{.start_block = 1000, .length = 1}));
  EXPECT_EQ(table.FaultSegmentCount(), 2);
  ExpectCovers(table, 2048);
}

TEST_F(MappingTableTest, RangeGivesThreeSegments) {
  auto table = Compile("500-510", 2048);
  ASSERT_EQ(table.segments.size(), 3);
  EXPECT_EQ(
      std::get<Fault>(table.segments[1]),
      (Fault{.start_block = 500, .length = 11}));
  EXPECT_EQ(table.FaultBlockCount(), 11);
  ExpectCovers(table, 2048);
}

TEST_F(MappingTableTest, PassThroughIsIdentityMapped) {
  auto table = Compile("3,9", 16);
  for (const auto& segment : table.segments) {
    if (const auto* pass = std::get_if<PassThrough>(&segment)) {
      EXPECT_EQ(pass->source_offset, pass->start_block);
    }
  }
}

TEST_F(MappingTableTest, FaultsAtBothEnds) {
  auto table = Compile("0,15", 16);
  ASSERT_EQ(table.segments.size(), 3);
  EXPECT_TRUE(IsFault(table.segments.front()));
  EXPECT_TRUE(IsFault(table.segments.back()));
  ExpectCovers(table, 16);
}

TEST_F(MappingTableTest, OverlappingInputMergedBeforeCompile) {
  auto table = Compile("4-8,6-10,11", 32);
  EXPECT_EQ(table.FaultSegmentCount(), 1);
  EXPECT_EQ(table.FaultBlockCount(), 8);
  ExpectCovers(table, 32);
}

TEST_F(MappingTableTest, RandomSpecsAlwaysCover) {
  std::mt19937_64 rng(7);
  for (int round = 0; round < 200; ++round) {
    uint64_t total = std::uniform_int_distribution<uint64_t>(1, 300)(rng);
    std::uniform_int_distribution<uint64_t> block(0, total - 1);
    FaultSpec spec;
    int count = std::uniform_int_distribution<int>(0, 6)(rng);
    for (int i = 0; i < count; ++i) {
      uint64_t a = block(rng);
      uint64_t b = block(rng);
      spec.ranges.push_back(
          BlockRange{.start = std::min(a, b), .end = std::max(a, b)});
    }
    SCOPED_TRACE(FormatFaultSpec(spec) + " over " + std::to_string(total));

    auto table = CompileMappingTable(spec, total);
    ExpectCovers(table, total);

    // Every listed block is a fault, nothing else is
    uint64_t listed = 0;
    for (const auto& range : NormalizeFaultSpec(spec).ranges) {
      listed += range.Length();
    }
    EXPECT_EQ(table.FaultBlockCount(), listed);
  }
}

TEST_F(MappingTableTest, CompileRejectsZeroBlocks) {
  EXPECT_THROW(CompileMappingTable(FaultSpec{}, 0), common::InternalError);
}

TEST_F(MappingTableTest, CompileRejectsUnvalidatedRange) {
  FaultSpec spec{.ranges = {{.start = 5, .end = 16}}};
  EXPECT_THROW(CompileMappingTable(spec, 16), common::InternalError);
}

// =============================================================================
// Checking
// =============================================================================

TEST_F(MappingTableTest, CheckRejectsGap) {
  MappingTable table{
      .total_blocks = 10,
      .segments = {
          PassThrough{.start_block = 0, .length = 4, .source_offset = 0},
          Fault{.start_block = 5, .length = 5}}};
  auto check = CheckMappingTable(table);
  ASSERT_FALSE(check.has_value());
  EXPECT_EQ(check.error().kind, ErrorKind::kDeviceSetupFailure);
}

TEST_F(MappingTableTest, CheckRejectsShortCoverage) {
  MappingTable table{
      .total_blocks = 10,
      .segments = {PassThrough{
          .start_block = 0, .length = 9, .source_offset = 0}}};
  EXPECT_FALSE(CheckMappingTable(table).has_value());
}

TEST_F(MappingTableTest, CheckRejectsZeroLength) {
  MappingTable table{
      .total_blocks = 4,
      .segments = {
          Fault{.start_block = 0, .length = 0},
          PassThrough{.start_block = 0, .length = 4, .source_offset = 0}}};
  EXPECT_FALSE(CheckMappingTable(table).has_value());
}

TEST_F(MappingTableTest, CheckRejectsShiftedSource) {
  MappingTable table{
      .total_blocks = 4,
      .segments = {PassThrough{
          .start_block = 0, .length = 4, .source_offset = 1}}};
  EXPECT_FALSE(CheckMappingTable(table).has_value());
}

TEST_F(MappingTableTest, CheckRejectsEmptyTable) {
  MappingTable table{.total_blocks = 4, .segments = {}};
  EXPECT_FALSE(CheckMappingTable(table).has_value());
}

// =============================================================================
// Serialization
// =============================================================================

TEST_F(MappingTableTest, FormatsDmTableExactly) {
  auto table = Compile("500,1000", 2048);
  EXPECT_EQ(
      FormatDmTable(table, "/dev/loop3"),
      "0 500 linear /dev/loop3 0\n"
      "500 1 error\n"
      "501 499 linear /dev/loop3 501\n"
      "1000 1 error\n"
      "1001 1047 linear /dev/loop3 1001\n");
}

TEST_F(MappingTableTest, FormatsAllFaultTable) {
  auto table = Compile("0-3", 4);
  EXPECT_EQ(FormatDmTable(table, "/dev/loop0"), "0 4 error\n");
}

}  // namespace
}  // namespace vdev::mapping
