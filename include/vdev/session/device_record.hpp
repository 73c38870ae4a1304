#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "vdev/common/diagnostic.hpp"
#include "vdev/device/backing_store.hpp"
#include "vdev/device/device_mapper.hpp"
#include "vdev/device/filesystem.hpp"
#include "vdev/device/loop_device.hpp"

namespace vdev::session {

// Lifecycle of one instance:
//   Pending -> StoreCreated -> LoopAttached -> [MappingApplied]
//     -> [Formatted -> [Mounted]] -> Live -> TornDown
// Any setup failure ends in Failed after a local rollback.
enum class RecordState : uint8_t {
  kPending,
  kStoreCreated,
  kLoopAttached,
  kMappingApplied,
  kFormatted,
  kMounted,
  kLive,
  kTornDown,
  kFailed,
};

auto ToString(RecordState state) -> const char*;

struct DeviceRecord {
  uint32_t index = 0;
  uint64_t size_bytes = 0;
  RecordState state = RecordState::kPending;

  std::optional<device::BackingStore> store;
  std::optional<device::LoopBinding> loop;
  std::optional<device::MappedDevice> mapped;
  bool formatted = false;
  std::optional<device::MountedFilesystem> mount;

  // The device users should touch: the mapped device if any, else the loop.
  [[nodiscard]] auto TopDevicePath() const -> std::string;
};

struct FailedInstance {
  uint32_t index = 0;
  uint64_t size_bytes = 0;
  Diagnostic error;
};

struct BatchSession {
  std::string session_id;
  std::vector<DeviceRecord> records;  // Live set, in creation order
  std::vector<FailedInstance> failures;
  std::optional<device::TmpfsPool> shared_tmpfs;

  [[nodiscard]] auto LiveCount() const -> size_t;
};

}  // namespace vdev::session
