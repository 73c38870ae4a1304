#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "vdev/common/diagnostic.hpp"

namespace vdev::device {

struct MountedFilesystem {
  std::filesystem::path mountpoint;
  std::string device;
};

// Shared RAM-backed directory holding every backing file of a batch.
struct TmpfsPool {
  std::filesystem::path mountpoint;
  uint64_t capacity_bytes = 0;
};

class FilesystemService {
 public:
  virtual ~FilesystemService() = default;

  virtual auto Format(
      const std::string& device, const std::string& fstype,
      const std::vector<std::string>& extra_args) -> Result<void> = 0;

  // Mount on a fresh unique directory under mount_root.
  virtual auto Mount(
      const std::string& device, const std::filesystem::path& mount_root)
      -> Result<MountedFilesystem> = 0;

  // Idempotent. The directory is removed only after a successful unmount.
  virtual auto Unmount(const MountedFilesystem& mounted) -> Result<void> = 0;

  // The capacity is fixed here and cannot grow afterwards.
  virtual auto MountTmpfsPool(
      uint64_t capacity_bytes, const std::filesystem::path& mount_root)
      -> Result<TmpfsPool> = 0;

  virtual auto ReleaseTmpfsPool(const TmpfsPool& pool) -> Result<void> = 0;
};

// mkfs(8), mount(8) and umount(8) driven provisioner.
class HostFilesystemService final : public FilesystemService {
 public:
  auto Format(
      const std::string& device, const std::string& fstype,
      const std::vector<std::string>& extra_args) -> Result<void> override;
  auto Mount(
      const std::string& device, const std::filesystem::path& mount_root)
      -> Result<MountedFilesystem> override;
  auto Unmount(const MountedFilesystem& mounted) -> Result<void> override;
  auto MountTmpfsPool(
      uint64_t capacity_bytes, const std::filesystem::path& mount_root)
      -> Result<TmpfsPool> override;
  auto ReleaseTmpfsPool(const TmpfsPool& pool) -> Result<void> override;
};

// True if path is listed in the given mount table (/proc/self/mounts format).
// An unreadable table is an error rather than "not mounted".
auto IsMountpoint(
    const std::filesystem::path& path,
    const std::filesystem::path& mount_table = "/proc/self/mounts")
    -> Result<bool>;

// Decode the octal escapes (\040 for space) of a mount table field.
auto UnescapeMountField(const std::string& field) -> std::string;

}  // namespace vdev::device
