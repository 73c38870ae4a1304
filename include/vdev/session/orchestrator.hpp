#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "vdev/common/diagnostic.hpp"
#include "vdev/device/backing_store.hpp"
#include "vdev/device/device_mapper.hpp"
#include "vdev/device/filesystem.hpp"
#include "vdev/device/loop_device.hpp"
#include "vdev/device/release_signal.hpp"
#include "vdev/mapping/fault_spec.hpp"
#include "vdev/session/batch_plan.hpp"
#include "vdev/session/device_record.hpp"

namespace vdev::session {

// Capabilities the orchestrator drives. Production code wires the host
// implementations; tests wire fakes.
struct Services {
  device::BackingStoreProvider& stores;
  device::LoopDeviceService& loops;
  device::DeviceMapperService& mapper;
  device::FilesystemService& filesystems;
  device::ReleaseSignal& release;
};

struct TeardownReport {
  size_t torn_down = 0;
  size_t step_failures = 0;  // Logged, never fatal
};

// Creates the instances of one BatchPlan, waits for the release signal and
// tears them down.
//
// Setup() walks the instances in order. Under kContinueOnError a failing
// instance is rolled back in reverse acquisition order and recorded in
// BatchSession::failures; the rest of the batch carries on. Under kFailFast
// the first failure is rolled back (including the tmpfs pool) and returned.
//
// Teardown() is best effort and idempotent: every Live record is released
// (unmount, dm remove, loop detach, file delete), each failed step is logged
// and counted, and the shared tmpfs pool goes last.
class Orchestrator {
 public:
  Orchestrator(Services services, BatchPlan plan);

  auto Setup() -> Result<void>;
  void WaitForRelease();
  auto Teardown() -> TeardownReport;

  // Setup, wait, teardown.
  auto Run() -> Result<TeardownReport>;

  [[nodiscard]] auto Session() const -> const BatchSession& {
    return session_;
  }
  [[nodiscard]] auto Plan() const -> const BatchPlan& {
    return plan_;
  }

 private:
  // Checks done before anything is allocated. Returns the instance sizes.
  auto Preflight() -> Result<std::vector<uint64_t>>;

  auto CreateInstance(DeviceRecord& record) -> Result<void>;
  auto CreateStore(DeviceRecord& record) -> Result<void>;
  auto ApplyFaultMapping(DeviceRecord& record) -> Result<void>;

  // Release whatever the record holds, newest first. Returns failed steps.
  auto ReleaseRecord(DeviceRecord& record) -> size_t;
  auto ReleasePool() -> size_t;

  Services services_;
  BatchPlan plan_;
  BatchSession session_;
  std::mt19937_64 rng_;
  std::optional<std::vector<mapping::BlockRange>> fault_ranges_;
  bool setup_done_ = false;
};

}  // namespace vdev::session
