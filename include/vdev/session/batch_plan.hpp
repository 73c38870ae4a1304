#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "vdev/common/diagnostic.hpp"

namespace vdev::session {

enum class ErrorPolicy : uint8_t {
  kFailFast,         // Single instance: first error aborts the command
  kContinueOnError,  // Batch: a failed instance is rolled back and skipped
};

// Inclusive bounds for randomized batches.
struct SizeRange {
  uint64_t min_bytes = 0;
  uint64_t max_bytes = 0;
};

struct BatchPlan {
  uint32_t count = 1;
  uint64_t size_bytes = 0;                // Used when size_range is unset
  std::optional<SizeRange> size_range;    // One draw per instance
  std::optional<std::string> fault_blocks;  // "500,1000-1010"
  // Bind this user file instead of creating one (count must be 1).
  std::optional<std::filesystem::path> existing_file;

  bool use_tmpfs = false;
  bool format = false;
  bool mount = false;  // Implies format
  std::string fstype = "ext4";
  std::vector<std::string> mkfs_args;

  std::filesystem::path store_dir = std::filesystem::temp_directory_path();
  std::filesystem::path mount_root = std::filesystem::temp_directory_path();
  std::string name_prefix = "vdev";

  ErrorPolicy policy = ErrorPolicy::kFailFast;
  std::optional<uint64_t> seed;
  std::optional<std::string> session_id;  // Random when unset
};

// Sizes of all instances, decided before anything is allocated so a shared
// tmpfs pool can be sized exactly. Randomized sizes are whole sectors drawn
// uniformly from [ceil(min / 512), floor(max / 512)].
auto ResolveSizes(const BatchPlan& plan, std::mt19937_64& rng)
    -> Result<std::vector<uint64_t>>;

// Six hex digits, used to keep file and dm names of concurrent or leftover
// sessions apart.
auto MakeSessionId() -> std::string;

}  // namespace vdev::session
