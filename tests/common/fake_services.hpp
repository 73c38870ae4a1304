#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "vdev/common/diagnostic.hpp"
#include "vdev/device/backing_store.hpp"
#include "vdev/device/device_mapper.hpp"
#include "vdev/device/filesystem.hpp"
#include "vdev/device/loop_device.hpp"
#include "vdev/device/release_signal.hpp"
#include "vdev/mapping/mapping_table.hpp"
#include "vdev/session/orchestrator.hpp"

// In-memory stand-ins for the host services. Each keeps the set of resources
// it currently holds so tests can assert that nothing is left behind, and
// fails on request: `fail_on` holds 1-based call numbers that return an
// error instead of acquiring anything.
namespace vdev::test {

class FakeStores final : public device::BackingStoreProvider {
 public:
  auto Create(
      const std::filesystem::path& path, uint64_t size_bytes,
      device::Hosting hosted_on) -> Result<device::BackingStore> override {
    ++create_calls;
    if (fail_on.contains(create_calls)) {
      return std::unexpected(
          Diagnostic::ResourceExhaustion(
              fmt::format("no space left for '{}'", path.string())));
    }
    if (live.contains(path)) {
      return std::unexpected(
          Diagnostic::DeviceSetupFailure(
              fmt::format("'{}' already exists", path.string())));
    }
    live.insert(path);
    created_sizes.push_back(size_bytes);
    return device::BackingStore{
        .path = path,
        .size_bytes = size_bytes,
        .ephemeral = true,
        .hosted_on = hosted_on};
  }

  auto Adopt(const std::filesystem::path& path)
      -> Result<device::BackingStore> override {
    if (!adoptable_size) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format("cannot stat '{}'", path.string())));
    }
    return device::BackingStore{
        .path = path, .size_bytes = *adoptable_size, .ephemeral = false};
  }

  auto Destroy(const device::BackingStore& store) -> Result<void> override {
    ++destroy_calls;
    if (!store.ephemeral) {
      return {};
    }
    live.erase(store.path);
    return {};
  }

  std::set<std::filesystem::path> live;
  std::vector<uint64_t> created_sizes;
  std::set<size_t> fail_on;
  std::optional<uint64_t> adoptable_size;
  size_t create_calls = 0;
  size_t destroy_calls = 0;
};

class FakeLoops final : public device::LoopDeviceService {
 public:
  auto Attach(const device::BackingStore& store)
      -> Result<device::LoopBinding> override {
    ++attach_calls;
    if (fail_on.contains(attach_calls)) {
      return std::unexpected(
          Diagnostic::ResourceExhaustion("could not find any free loop device"));
    }
    std::string device = fmt::format("/dev/loop{}", next_number++);
    bound.insert(device);
    return device::LoopBinding{.device_path = device, .backing_path = store.path};
  }

  auto Detach(const device::LoopBinding& binding) -> Result<void> override {
    ++detach_calls;
    if (fail_detach) {
      return std::unexpected(
          Diagnostic::TeardownFailure(
              fmt::format("{}: device is busy", binding.device_path)));
    }
    bound.erase(binding.device_path);
    return {};
  }

  std::set<std::string> bound;
  std::set<size_t> fail_on;
  bool fail_detach = false;
  int next_number = 0;
  size_t attach_calls = 0;
  size_t detach_calls = 0;
};

class FakeMapper final : public device::DeviceMapperService {
 public:
  auto Create(
      const std::string& name, const mapping::MappingTable& table,
      const std::string& underlying_device)
      -> Result<device::MappedDevice> override {
    ++create_calls;
    if (fail_on.contains(create_calls)) {
      return std::unexpected(
          Diagnostic::DeviceSetupFailure(
              fmt::format("device-mapper rejected '{}'", name)));
    }
    if (auto check = mapping::CheckMappingTable(table); !check) {
      return std::unexpected(check.error());
    }
    names.insert(name);
    tables.push_back(table);
    return device::MappedDevice{
        .name = name,
        .table = table,
        .underlying_device = underlying_device,
        .device_path = "/dev/mapper/" + name};
  }

  auto Remove(const device::MappedDevice& device) -> Result<void> override {
    ++remove_calls;
    names.erase(device.name);
    return {};
  }

  std::set<std::string> names;
  std::vector<mapping::MappingTable> tables;
  std::set<size_t> fail_on;
  size_t create_calls = 0;
  size_t remove_calls = 0;
};

class FakeFilesystems final : public device::FilesystemService {
 public:
  auto Format(
      const std::string& device, const std::string& fstype,
      const std::vector<std::string>& /*extra_args*/) -> Result<void> override {
    ++format_calls;
    if (fail_format_on.contains(format_calls)) {
      return std::unexpected(
          Diagnostic::DeviceSetupFailure(
              fmt::format("mkfs.{} failed on {}", fstype, device)));
    }
    formatted.insert(device);
    return {};
  }

  auto Mount(
      const std::string& device, const std::filesystem::path& mount_root)
      -> Result<device::MountedFilesystem> override {
    ++mount_calls;
    if (fail_mount_on.contains(mount_calls)) {
      return std::unexpected(
          Diagnostic::DeviceSetupFailure(
              fmt::format("cannot mount {}", device)));
    }
    auto mountpoint = mount_root / fmt::format("mnt{}", mount_calls);
    mounts.insert(mountpoint);
    return device::MountedFilesystem{.mountpoint = mountpoint, .device = device};
  }

  auto Unmount(const device::MountedFilesystem& mounted)
      -> Result<void> override {
    ++unmount_calls;
    mounts.erase(mounted.mountpoint);
    return {};
  }

  auto MountTmpfsPool(
      uint64_t capacity_bytes, const std::filesystem::path& mount_root)
      -> Result<device::TmpfsPool> override {
    ++pool_mounts;
    if (fail_pool) {
      return std::unexpected(
          Diagnostic::ResourceExhaustion("cannot mount tmpfs pool"));
    }
    pool = device::TmpfsPool{
        .mountpoint = mount_root / "pool", .capacity_bytes = capacity_bytes};
    return *pool;
  }

  auto ReleaseTmpfsPool(const device::TmpfsPool& /*released*/)
      -> Result<void> override {
    ++pool_releases;
    pool.reset();
    return {};
  }

  std::set<std::string> formatted;
  std::set<std::filesystem::path> mounts;
  std::optional<device::TmpfsPool> pool;
  std::set<size_t> fail_format_on;
  std::set<size_t> fail_mount_on;
  bool fail_pool = false;
  size_t format_calls = 0;
  size_t mount_calls = 0;
  size_t unmount_calls = 0;
  size_t pool_mounts = 0;
  size_t pool_releases = 0;
};

// All fakes wired together.
struct FakeHost {
  FakeStores stores;
  FakeLoops loops;
  FakeMapper mapper;
  FakeFilesystems filesystems;
  device::ImmediateReleaseSignal release;

  auto Wire() -> session::Services {
    return session::Services{
        .stores = stores,
        .loops = loops,
        .mapper = mapper,
        .filesystems = filesystems,
        .release = release};
  }

  // Resources still held by any service.
  [[nodiscard]] auto Leftovers() const -> size_t {
    return stores.live.size() + loops.bound.size() + mapper.names.size() +
           filesystems.mounts.size() + (filesystems.pool ? 1 : 0);
  }
};

}  // namespace vdev::test
