#pragma once

#include <cstdint>
#include <filesystem>

#include "vdev/common/diagnostic.hpp"

namespace vdev::device {

enum class Hosting : uint8_t {
  kPersistentDir,  // Plain directory on disk (store_dir)
  kTmpfsPool,      // Inside the batch's shared tmpfs mount
};

auto ToString(Hosting hosting) -> const char*;

struct BackingStore {
  std::filesystem::path path;
  uint64_t size_bytes = 0;
  // Created by vdev and deleted on release. False for a user's own file.
  bool ephemeral = true;
  Hosting hosted_on = Hosting::kPersistentDir;
};

class BackingStoreProvider {
 public:
  virtual ~BackingStoreProvider() = default;

  // Create a new file of exactly size_bytes logical length. The path must
  // not exist yet.
  virtual auto Create(
      const std::filesystem::path& path, uint64_t size_bytes, Hosting hosted_on)
      -> Result<BackingStore> = 0;

  // Wrap an existing user file; it is never deleted by Destroy().
  virtual auto Adopt(const std::filesystem::path& path)
      -> Result<BackingStore> = 0;

  // Delete the file if it is ephemeral. A file that is already gone is not an
  // error.
  virtual auto Destroy(const BackingStore& store) -> Result<void> = 0;
};

// Sparse files: the length is extended with ftruncate(), no data is written.
class SparseFileProvider final : public BackingStoreProvider {
 public:
  auto Create(
      const std::filesystem::path& path, uint64_t size_bytes, Hosting hosted_on)
      -> Result<BackingStore> override;
  auto Adopt(const std::filesystem::path& path)
      -> Result<BackingStore> override;
  auto Destroy(const BackingStore& store) -> Result<void> override;
};

}  // namespace vdev::device
