#include "commands.hpp"

#include <unistd.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <system_error>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "argparse/argparse.hpp"
#include "input.hpp"
#include "logging.hpp"
#include "print.hpp"
#include "vdev/common/byte_size.hpp"
#include "vdev/common/diagnostic.hpp"
#include "vdev/config/project_config.hpp"
#include "vdev/device/backing_store.hpp"
#include "vdev/device/device_mapper.hpp"
#include "vdev/device/filesystem.hpp"
#include "vdev/device/loop_device.hpp"
#include "vdev/device/release_signal.hpp"
#include "vdev/mapping/fault_spec.hpp"
#include "vdev/mapping/mapping_table.hpp"
#include "vdev/session/batch_plan.hpp"
#include "vdev/session/device_record.hpp"
#include "vdev/session/manifest.hpp"
#include "vdev/session/orchestrator.hpp"

namespace vdev::driver {
namespace {

namespace fs = std::filesystem;

constexpr const char* kPlaceholderDevice = "/dev/loopN";

// Load vdev.toml (if any) and set up logging from it. Prints the error and
// returns nullopt on failure.
auto PrepareConfig(const GlobalOptions& global)
    -> std::optional<std::optional<config::ProjectConfig>> {
  auto config = config::LoadOptionalConfig();
  if (!config) {
    PrintDiagnostic(config.error());
    return std::nullopt;
  }

  LogOptions log_options{.verbose = global.verbose, .quiet = global.quiet};
  if (*config) {
    log_options.config_level = (*config)->log_level;
  }
  if (auto logging = ConfigureLogging(log_options); !logging) {
    PrintDiagnostic(logging.error());
    return std::nullopt;
  }
  return *config;
}

auto HaveRoot() -> bool {
  if (geteuid() == 0) {
    return true;
  }
  PrintError("loop and device-mapper setup needs root privileges");
  return false;
}

void PrintSession(const session::BatchSession& session) {
  for (const auto& record : session.records) {
    std::string line = fmt::format(
        "{:>3}  {:<24} {:>8}  {}", record.index, record.TopDevicePath(),
        common::FormatByteSize(record.size_bytes),
        record.store->path.string());
    if (record.mount) {
      line += fmt::format("  mounted on {}", record.mount->mountpoint.string());
    }
    fmt::print("{}\n", line);
  }
  for (const auto& failure : session.failures) {
    fmt::print(
        "{:>3}  failed: {} ({})\n", failure.index, failure.error.message,
        ToString(failure.error.kind));
  }
  std::fflush(stdout);
}

auto RunPlan(const session::BatchPlan& plan, const argparse::ArgumentParser& cmd)
    -> int {
  if (!HaveRoot()) {
    return 1;
  }

  device::SparseFileProvider stores;
  device::LosetupLoopService loops;
  device::DmsetupService mapper;
  device::HostFilesystemService filesystems;
  device::StreamReleaseSignal release(std::cin, std::cout);

  session::Orchestrator orchestrator(
      session::Services{
          .stores = stores,
          .loops = loops,
          .mapper = mapper,
          .filesystems = filesystems,
          .release = release},
      plan);

  auto setup = orchestrator.Setup();
  if (!setup) {
    PrintDiagnostic(setup.error());
    return 1;
  }

  PrintSession(orchestrator.Session());

  // A missing manifest must not leak the devices that are already live.
  if (auto manifest = cmd.present<std::string>("--manifest")) {
    auto written = session::WriteManifest(orchestrator.Session(), *manifest);
    if (!written) {
      PrintWarning(written.error().message);
    } else {
      spdlog::debug("manifest written to {}", *manifest);
    }
  }

  orchestrator.WaitForRelease();
  orchestrator.Teardown();
  return 0;
}

auto BatchCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& global,
    PlanMode mode) -> int {
  auto config = PrepareConfig(global);
  if (!config) {
    return 1;
  }

  auto plan = BuildPlan(cmd, *config, mode);
  if (!plan) {
    PrintDiagnostic(plan.error());
    return 1;
  }
  return RunPlan(*plan, cmd);
}

}  // namespace

auto CreateCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& global) -> int {
  return BatchCommand(cmd, global, PlanMode::kCreate);
}

auto FaultyCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& global) -> int {
  return BatchCommand(cmd, global, PlanMode::kFaulty);
}

auto AttachCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& global) -> int {
  return BatchCommand(cmd, global, PlanMode::kAttach);
}

auto TableCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& global) -> int {
  auto config = PrepareConfig(global);
  if (!config) {
    return 1;
  }

  auto size = common::ParseByteSize(cmd.get<std::string>("size"));
  if (!size) {
    PrintDiagnostic(size.error());
    return 1;
  }
  uint64_t total_blocks = mapping::BlocksForSize(*size);
  if (total_blocks == 0) {
    PrintError(
        fmt::format(
            "size {} is smaller than one {}-byte block",
            common::FormatByteSize(*size), mapping::kSectorSize));
    return 1;
  }

  auto spec =
      mapping::ParseFaultSpec(cmd.get<std::string>("--blocks"), total_blocks);
  if (!spec) {
    PrintDiagnostic(spec.error());
    return 1;
  }

  auto table = mapping::CompileMappingTable(*spec, total_blocks);
  std::string device = kPlaceholderDevice;
  if (auto path = cmd.present<std::string>("--device")) {
    device = *path;
  }
  spdlog::debug(
      "{} blocks, {} faulty in {} segment{}", total_blocks,
      table.FaultBlockCount(), table.FaultSegmentCount(),
      table.FaultSegmentCount() == 1 ? "" : "s");
  fmt::print("{}", mapping::FormatDmTable(table, device));
  return 0;
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  bool force = cmd.get<bool>("--force");
  fs::path path = fs::current_path() / config::kConfigFileName;

  std::error_code ec;
  bool exists = fs::exists(path, ec);
  if (ec) {
    PrintError(
        fmt::format("cannot access '{}': {}", path.string(), ec.message()));
    return 1;
  }
  if (exists && !force) {
    PrintError(
        fmt::format(
            "{} already exists (use --force to overwrite)",
            config::kConfigFileName));
    return 1;
  }

  std::ofstream out(path);
  out << config::DefaultConfigText();
  if (!out) {
    PrintError(fmt::format("cannot write '{}'", path.string()));
    return 1;
  }
  fmt::print("Created {}\n", path.string());
  return 0;
}

}  // namespace vdev::driver
