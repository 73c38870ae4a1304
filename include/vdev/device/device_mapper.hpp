#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "vdev/common/diagnostic.hpp"
#include "vdev/mapping/mapping_table.hpp"

namespace vdev::device {

struct MappedDevice {
  std::string name;               // dm name, unique per session
  mapping::MappingTable table;
  std::string underlying_device;  // loop device the table points at
  std::string device_path;        // "/dev/mapper/<name>"
};

class DeviceMapperService {
 public:
  virtual ~DeviceMapperService() = default;

  // Load the table as a single named device on top of underlying_device.
  virtual auto Create(
      const std::string& name, const mapping::MappingTable& table,
      const std::string& underlying_device) -> Result<MappedDevice> = 0;

  // Idempotent: an unknown name counts as removed.
  virtual auto Remove(const MappedDevice& device) -> Result<void> = 0;
};

// dmsetup(8) driven materializer. Tables are handed over through a file in
// scratch_dir because dmsetup's --table only takes one line.
class DmsetupService final : public DeviceMapperService {
 public:
  explicit DmsetupService(
      std::filesystem::path scratch_dir = std::filesystem::temp_directory_path())
      : scratch_dir_(std::move(scratch_dir)) {
  }

  auto Create(
      const std::string& name, const mapping::MappingTable& table,
      const std::string& underlying_device) -> Result<MappedDevice> override;
  auto Remove(const MappedDevice& device) -> Result<void> override;

  // False only when dmsetup reports the name as unknown. Any other failure
  // to query is an error, never a guess.
  [[nodiscard]] auto Exists(const std::string& name) const -> Result<bool>;

 private:
  std::filesystem::path scratch_dir_;
};

}  // namespace vdev::device
