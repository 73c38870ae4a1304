#pragma once

#include <argparse/argparse.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "vdev/common/diagnostic.hpp"
#include "vdev/config/project_config.hpp"
#include "vdev/session/batch_plan.hpp"

namespace vdev::driver {

enum class PlanMode {
  kCreate,  // Plain devices
  kFaulty,  // --blocks required
  kAttach,  // Existing user file
};

// Split attached flag forms: -n4 -> -n 4, -C/dir -> -C /dir
auto PreprocessArgs(std::span<char*> argv) -> std::vector<std::string>;

// Add -n, --min, --max, --tmpfs and --seed to a subcommand.
void AddBatchFlags(argparse::ArgumentParser& cmd);

// Add --format, --mount, --fstype, --store-dir and --manifest to a
// subcommand.
void AddDeviceFlags(argparse::ArgumentParser& cmd);

auto ParseCount(std::string_view text) -> Result<uint32_t>;
auto ParseSeed(std::string_view text) -> Result<uint64_t>;

// Merge CLI arguments and optional config into a BatchPlan. Flags override
// config values, config overrides built-in defaults.
auto BuildPlan(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config, PlanMode mode)
    -> Result<session::BatchPlan>;

}  // namespace vdev::driver
