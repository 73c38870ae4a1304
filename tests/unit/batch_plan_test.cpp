#include <gtest/gtest.h>

#include <cstdint>
#include <random>
#include <set>

#include "vdev/common/diagnostic.hpp"
#include "vdev/session/batch_plan.hpp"

namespace vdev::session {
namespace {

class BatchPlanTest : public ::testing::Test {
 protected:
  std::mt19937_64 rng_{1234};
};

TEST_F(BatchPlanTest, FixedSizeRepeated) {
  BatchPlan plan{.count = 3, .size_bytes = 1 << 20};
  auto sizes = ResolveSizes(plan, rng_);
  ASSERT_TRUE(sizes.has_value());
  EXPECT_EQ(*sizes, (std::vector<uint64_t>(3, 1 << 20)));
}

TEST_F(BatchPlanTest, FixedSizeBelowOneBlock) {
  BatchPlan plan{.count = 1, .size_bytes = 511};
  auto sizes = ResolveSizes(plan, rng_);
  ASSERT_FALSE(sizes.has_value());
  EXPECT_EQ(sizes.error().kind, ErrorKind::kInvalidSizeSpec);
}

TEST_F(BatchPlanTest, RandomSizesStayInRangeAndWholeBlocks) {
  BatchPlan plan{.count = 200};
  plan.size_range = SizeRange{.min_bytes = 1000, .max_bytes = 10000};

  auto sizes = ResolveSizes(plan, rng_);

  ASSERT_TRUE(sizes.has_value());
  ASSERT_EQ(sizes->size(), 200);
  std::set<uint64_t> distinct;
  for (uint64_t size : *sizes) {
    EXPECT_EQ(size % 512, 0);
    EXPECT_GE(size, 1024);  // ceil(1000 / 512) blocks
    EXPECT_LE(size, 9728);  // floor(10000 / 512) blocks
    distinct.insert(size);
  }
  EXPECT_GT(distinct.size(), 1);
}

TEST_F(BatchPlanTest, DegenerateRange) {
  BatchPlan plan{.count = 4};
  plan.size_range = SizeRange{.min_bytes = 4096, .max_bytes = 4096};
  auto sizes = ResolveSizes(plan, rng_);
  ASSERT_TRUE(sizes.has_value());
  EXPECT_EQ(*sizes, (std::vector<uint64_t>(4, 4096)));
}

TEST_F(BatchPlanTest, InvertedRangeRejected) {
  BatchPlan plan{.count = 2};
  plan.size_range = SizeRange{.min_bytes = 8192, .max_bytes = 4096};
  auto sizes = ResolveSizes(plan, rng_);
  ASSERT_FALSE(sizes.has_value());
  EXPECT_EQ(sizes.error().kind, ErrorKind::kInvalidSizeSpec);
}

TEST_F(BatchPlanTest, RangeWithoutWholeBlockRejected) {
  BatchPlan plan{.count = 1};
  plan.size_range = SizeRange{.min_bytes = 600, .max_bytes = 1000};
  EXPECT_FALSE(ResolveSizes(plan, rng_).has_value());
}

TEST_F(BatchPlanTest, SessionIdIsSixHexDigits) {
  auto id = MakeSessionId();
  ASSERT_EQ(id.size(), 6);
  EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
}

}  // namespace
}  // namespace vdev::session
