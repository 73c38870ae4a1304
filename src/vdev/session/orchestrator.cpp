#include "vdev/session/orchestrator.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <limits>
#include <random>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "vdev/common/byte_size.hpp"
#include "vdev/common/diagnostic.hpp"
#include "vdev/common/internal_error.hpp"
#include "vdev/mapping/fault_spec.hpp"
#include "vdev/mapping/mapping_table.hpp"
#include "vdev/session/batch_plan.hpp"
#include "vdev/session/device_record.hpp"

namespace vdev::session {

namespace fs = std::filesystem;

namespace {

void LogFailure(const std::string& context, const Diagnostic& diag) {
  spdlog::warn("{}: {}", context, diag.message);
  for (const auto& note : diag.notes) {
    if (!note.empty()) {
      spdlog::warn("  {}", note);
    }
  }
}

auto SeedFor(const BatchPlan& plan) -> uint64_t {
  if (plan.seed) {
    return *plan.seed;
  }
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) | rd();
}

}  // namespace

Orchestrator::Orchestrator(Services services, BatchPlan plan)
    : services_(services), plan_(std::move(plan)), rng_(SeedFor(plan_)) {
  session_.session_id = plan_.session_id.value_or(MakeSessionId());
}

auto Orchestrator::Preflight() -> Result<std::vector<uint64_t>> {
  if (plan_.count == 0) {
    return std::unexpected(
        Diagnostic::HostError("instance count must be at least 1"));
  }

  if (plan_.existing_file) {
    if (plan_.count != 1 || plan_.size_range || plan_.use_tmpfs) {
      return std::unexpected(
          Diagnostic::HostError(
              "an existing file binds exactly one device and cannot be "
              "combined with a size range or a tmpfs pool"));
    }
  } else if (!plan_.use_tmpfs) {
    std::error_code ec;
    if (!fs::is_directory(plan_.store_dir, ec)) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "store directory '{}' does not exist",
                  plan_.store_dir.string())));
    }
  }

  // Bounds depend on each instance's size; syntax can be rejected now.
  if (plan_.fault_blocks) {
    auto ranges = mapping::ParseFaultRanges(*plan_.fault_blocks);
    if (!ranges) {
      return std::unexpected(ranges.error());
    }
    fault_ranges_ = std::move(*ranges);
  }

  if (plan_.existing_file) {
    // Taken from the file itself once adopted.
    return std::vector<uint64_t>{0};
  }
  return ResolveSizes(plan_, rng_);
}

auto Orchestrator::Setup() -> Result<void> {
  if (setup_done_) {
    common::ThrowInternalError("Orchestrator::Setup", "called twice");
  }
  setup_done_ = true;

  auto sizes = Preflight();
  if (!sizes) {
    return std::unexpected(sizes.error());
  }

  if (plan_.use_tmpfs) {
    uint64_t capacity = 0;
    for (uint64_t size : *sizes) {
      if (capacity > std::numeric_limits<uint64_t>::max() - size) {
        return std::unexpected(
            Diagnostic::InvalidSizeSpec("total batch size overflows 64 bits"));
      }
      capacity += size;
    }
    auto pool = services_.filesystems.MountTmpfsPool(capacity, plan_.mount_root);
    if (!pool) {
      return std::unexpected(pool.error());
    }
    session_.shared_tmpfs = *pool;
  }

  spdlog::info(
      "session {}: setting up {} device{}", session_.session_id, plan_.count,
      plan_.count == 1 ? "" : "s");

  for (uint32_t i = 0; i < plan_.count; ++i) {
    DeviceRecord record{.index = i + 1, .size_bytes = (*sizes)[i]};

    auto created = CreateInstance(record);
    if (created) {
      record.state = RecordState::kLive;
      spdlog::info(
          "device {}: {} ({}) backed by {}", record.index,
          record.TopDevicePath(), common::FormatByteSize(record.size_bytes),
          record.store->path.string());
      if (record.mount) {
        spdlog::info(
            "device {}: mounted on {}", record.index,
            record.mount->mountpoint.string());
      }
      session_.records.push_back(std::move(record));
      continue;
    }

    LogFailure(
        fmt::format(
            "device {} failed after reaching {}", record.index,
            ToString(record.state)),
        created.error());
    size_t rollback_failures = ReleaseRecord(record);
    if (rollback_failures > 0) {
      spdlog::warn(
          "device {}: rollback left {} resource{} behind", record.index,
          rollback_failures, rollback_failures == 1 ? "" : "s");
    }
    record.state = RecordState::kFailed;
    session_.failures.push_back(
        FailedInstance{
            .index = record.index,
            .size_bytes = record.size_bytes,
            .error = created.error()});

    if (plan_.policy == ErrorPolicy::kFailFast) {
      ReleasePool();
      return std::unexpected(created.error());
    }
  }

  if (session_.records.empty()) {
    spdlog::warn(
        "no devices were set up ({} of {} failed)", session_.failures.size(),
        plan_.count);
  } else if (!session_.failures.empty()) {
    spdlog::info(
        "{} of {} devices set up, {} failed", session_.records.size(),
        plan_.count, session_.failures.size());
  }
  return {};
}

auto Orchestrator::CreateInstance(DeviceRecord& record) -> Result<void> {
  if (auto stored = CreateStore(record); !stored) {
    return stored;
  }
  record.state = RecordState::kStoreCreated;

  auto loop = services_.loops.Attach(*record.store);
  if (!loop) {
    return std::unexpected(loop.error());
  }
  record.loop = *loop;
  record.state = RecordState::kLoopAttached;

  if (fault_ranges_) {
    if (auto mapped = ApplyFaultMapping(record); !mapped) {
      return mapped;
    }
    record.state = RecordState::kMappingApplied;
  }

  if (plan_.format || plan_.mount) {
    auto formatted = services_.filesystems.Format(
        record.TopDevicePath(), plan_.fstype, plan_.mkfs_args);
    if (!formatted) {
      return formatted;
    }
    record.formatted = true;
    record.state = RecordState::kFormatted;
  }

  if (plan_.mount) {
    auto mounted =
        services_.filesystems.Mount(record.TopDevicePath(), plan_.mount_root);
    if (!mounted) {
      return std::unexpected(mounted.error());
    }
    record.mount = *mounted;
    record.state = RecordState::kMounted;
  }

  return {};
}

auto Orchestrator::CreateStore(DeviceRecord& record) -> Result<void> {
  if (plan_.existing_file) {
    auto adopted = services_.stores.Adopt(*plan_.existing_file);
    if (!adopted) {
      return std::unexpected(adopted.error());
    }
    if (adopted->size_bytes < mapping::kSectorSize) {
      return std::unexpected(
          Diagnostic::InvalidSizeSpec(
              fmt::format(
                  "'{}' is smaller than one {}-byte block",
                  adopted->path.string(), mapping::kSectorSize)));
    }
    record.size_bytes = adopted->size_bytes;
    record.store = *adopted;
    return {};
  }

  auto hosting = session_.shared_tmpfs ? device::Hosting::kTmpfsPool
                                       : device::Hosting::kPersistentDir;
  fs::path dir =
      session_.shared_tmpfs ? session_.shared_tmpfs->mountpoint : plan_.store_dir;
  fs::path path =
      dir / fmt::format(
                "{}-{}-{}.img", plan_.name_prefix, session_.session_id,
                record.index);

  auto store = services_.stores.Create(path, record.size_bytes, hosting);
  if (!store) {
    return std::unexpected(store.error());
  }
  record.store = *store;
  return {};
}

auto Orchestrator::ApplyFaultMapping(DeviceRecord& record) -> Result<void> {
  uint64_t total_blocks = mapping::BlocksForSize(record.size_bytes);
  auto spec = mapping::ValidateFaultSpec(*fault_ranges_, total_blocks);
  if (!spec) {
    return std::unexpected(spec.error());
  }

  auto table = mapping::CompileMappingTable(*spec, total_blocks);
  std::string name = fmt::format(
      "{}-{}-{}", plan_.name_prefix, session_.session_id,
      fs::path(record.loop->device_path).filename().string());

  auto mapped =
      services_.mapper.Create(name, table, record.loop->device_path);
  if (!mapped) {
    return std::unexpected(mapped.error());
  }
  record.mapped = *mapped;

  spdlog::debug(
      "device {}: {} faulty block{} in {} segment{} over {}", record.index,
      table.FaultBlockCount(), table.FaultBlockCount() == 1 ? "" : "s",
      table.FaultSegmentCount(), table.FaultSegmentCount() == 1 ? "" : "s",
      record.loop->device_path);
  return {};
}

auto Orchestrator::ReleaseRecord(DeviceRecord& record) -> size_t {
  size_t failures = 0;
  auto step = [&](const Result<void>& result) {
    if (!result) {
      ++failures;
      LogFailure(fmt::format("device {}", record.index), result.error());
    }
  };

  if (record.mount) {
    step(services_.filesystems.Unmount(*record.mount));
  }
  if (record.mapped) {
    step(services_.mapper.Remove(*record.mapped));
  }
  if (record.loop) {
    step(services_.loops.Detach(*record.loop));
  }
  if (record.store) {
    step(services_.stores.Destroy(*record.store));
  }
  return failures;
}

auto Orchestrator::ReleasePool() -> size_t {
  if (!session_.shared_tmpfs) {
    return 0;
  }
  auto released = services_.filesystems.ReleaseTmpfsPool(*session_.shared_tmpfs);
  session_.shared_tmpfs.reset();
  if (!released) {
    LogFailure("tmpfs pool", released.error());
    return 1;
  }
  return 0;
}

void Orchestrator::WaitForRelease() {
  size_t live = session_.LiveCount();
  if (live == 0) {
    spdlog::info("nothing to wait for");
    return;
  }
  services_.release.Wait(live);
}

auto Orchestrator::Teardown() -> TeardownReport {
  TeardownReport report;
  for (auto& record : session_.records) {
    if (record.state != RecordState::kLive) {
      continue;
    }
    spdlog::debug(
        "tearing down device {} ({})", record.index, record.TopDevicePath());
    report.step_failures += ReleaseRecord(record);
    record.state = RecordState::kTornDown;
    ++report.torn_down;
  }
  report.step_failures += ReleasePool();

  if (report.step_failures > 0) {
    spdlog::warn(
        "teardown finished with {} failed step{}, check for leftover devices",
        report.step_failures, report.step_failures == 1 ? "" : "s");
  } else if (report.torn_down > 0) {
    spdlog::info(
        "released {} device{}", report.torn_down,
        report.torn_down == 1 ? "" : "s");
  }
  return report;
}

auto Orchestrator::Run() -> Result<TeardownReport> {
  auto setup = Setup();
  if (!setup) {
    return std::unexpected(setup.error());
  }
  WaitForRelease();
  return Teardown();
}

}  // namespace vdev::session
