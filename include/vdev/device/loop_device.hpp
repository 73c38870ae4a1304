#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "vdev/common/diagnostic.hpp"
#include "vdev/device/backing_store.hpp"

namespace vdev::device {

struct LoopBinding {
  std::string device_path;  // "/dev/loop7"
  std::filesystem::path backing_path;
};

class LoopDeviceService {
 public:
  virtual ~LoopDeviceService() = default;

  // Bind the store to the first free loop device. Picking the free device is
  // left to the kernel; two vdev processes may race for the same number.
  virtual auto Attach(const BackingStore& store) -> Result<LoopBinding> = 0;

  // Idempotent: a device that is no longer bound counts as detached.
  virtual auto Detach(const LoopBinding& binding) -> Result<void> = 0;
};

// losetup(8) driven binder.
class LosetupLoopService final : public LoopDeviceService {
 public:
  // sysfs_root is "/sys" outside of tests.
  explicit LosetupLoopService(std::filesystem::path sysfs_root = "/sys")
      : sysfs_root_(std::move(sysfs_root)) {
  }

  auto Attach(const BackingStore& store) -> Result<LoopBinding> override;
  auto Detach(const LoopBinding& binding) -> Result<void> override;

  // True while /sys/block/<loopN>/loop/backing_file exists.
  [[nodiscard]] auto IsBound(const std::string& device_path) const -> bool;

 private:
  std::filesystem::path sysfs_root_;
};

}  // namespace vdev::device
