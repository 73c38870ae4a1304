#include "input.hpp"

#include <charconv>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "argparse/argparse.hpp"
#include "vdev/common/byte_size.hpp"
#include "vdev/common/diagnostic.hpp"
#include "vdev/config/project_config.hpp"
#include "vdev/session/batch_plan.hpp"

namespace vdev::driver {

namespace {

namespace fs = std::filesystem;

auto AbsolutePath(const fs::path& path) -> Result<fs::path> {
  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot resolve '{}': {}", path.string(), ec.message())));
  }
  return absolute;
}

template <typename T>
auto ParseUnsigned(std::string_view text, T& value) -> bool {
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  return ec == std::errc{} && ptr == end && !text.empty();
}

auto ParseSize(const std::string& text, std::string_view what)
    -> Result<uint64_t> {
  auto size = common::ParseByteSize(text);
  if (!size) {
    return std::unexpected(
        Diagnostic::InvalidSizeSpec(
            fmt::format("{}: {}", what, size.error().message)));
  }
  return size;
}

// SIZE or --min/--max, exactly one of them.
auto ApplySizes(const argparse::ArgumentParser& cmd, session::BatchPlan& plan)
    -> Result<void> {
  auto size = cmd.present<std::string>("size");
  auto min = cmd.present<std::string>("--min");
  auto max = cmd.present<std::string>("--max");

  if (min.has_value() != max.has_value()) {
    return std::unexpected(
        Diagnostic::InvalidSizeSpec("--min and --max must be given together"));
  }
  if (min && size) {
    return std::unexpected(
        Diagnostic::InvalidSizeSpec(
            "give either a size or --min/--max, not both"));
  }
  if (!min && !size) {
    return std::unexpected(
        Diagnostic::InvalidSizeSpec("missing device size"));
  }

  if (size) {
    auto bytes = common::ParseByteSize(*size);
    if (!bytes) {
      return std::unexpected(bytes.error());
    }
    plan.size_bytes = *bytes;
    return {};
  }

  auto min_bytes = ParseSize(*min, "--min");
  if (!min_bytes) {
    return std::unexpected(min_bytes.error());
  }
  auto max_bytes = ParseSize(*max, "--max");
  if (!max_bytes) {
    return std::unexpected(max_bytes.error());
  }
  plan.size_range =
      session::SizeRange{.min_bytes = *min_bytes, .max_bytes = *max_bytes};
  return {};
}

}  // namespace

auto PreprocessArgs(std::span<char*> argv) -> std::vector<std::string> {
  std::vector<std::string> result;
  for (char* raw_arg : argv) {
    std::string_view arg = raw_arg;
    if (arg.size() > 2 && (arg.starts_with("-n") || arg.starts_with("-C")) &&
        arg[1] != '-') {
      result.emplace_back(arg.substr(0, 2));
      result.emplace_back(arg.substr(2));
    } else {
      result.emplace_back(arg);
    }
  }
  return result;
}

void AddBatchFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-n", "--count")
      .default_value(std::string("1"))
      .help("Number of devices to create")
      .metavar("N");
  cmd.add_argument("--min")
      .help("Smallest random size (with --max, replaces SIZE)")
      .metavar("SIZE");
  cmd.add_argument("--max").help("Largest random size").metavar("SIZE");
  cmd.add_argument("--tmpfs")
      .default_value(false)
      .implicit_value(true)
      .help("Keep backing files on one tmpfs sized for the whole batch");
  cmd.add_argument("--seed").help("Seed for random sizes").metavar("N");
}

void AddDeviceFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--format")
      .default_value(false)
      .implicit_value(true)
      .help("Create a filesystem on each device");
  cmd.add_argument("--mount")
      .default_value(false)
      .implicit_value(true)
      .help("Format and mount each device");
  cmd.add_argument("--fstype").help("Filesystem type (default ext4)");
  cmd.add_argument("--store-dir")
      .help("Directory for backing files")
      .metavar("DIR");
  cmd.add_argument("--manifest")
      .help("Write a JSON description of the devices")
      .metavar("FILE");
}

auto ParseCount(std::string_view text) -> Result<uint32_t> {
  uint32_t count = 0;
  if (!ParseUnsigned(text, count) || count == 0) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "invalid device count '{}', expected a positive integer",
                text)));
  }
  return count;
}

auto ParseSeed(std::string_view text) -> Result<uint64_t> {
  uint64_t seed = 0;
  if (!ParseUnsigned(text, seed)) {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("invalid seed '{}'", text)));
  }
  return seed;
}

auto BuildPlan(
    const argparse::ArgumentParser& cmd,
    const std::optional<config::ProjectConfig>& config, PlanMode mode)
    -> Result<session::BatchPlan> {
  session::BatchPlan plan;

  // Config first, flags override below
  if (config) {
    if (config->fstype) {
      plan.fstype = *config->fstype;
    }
    if (config->mkfs_args) {
      plan.mkfs_args = *config->mkfs_args;
    }
    if (config->store_dir) {
      plan.store_dir = *config->store_dir;
    }
    if (config->mount_root) {
      plan.mount_root = *config->mount_root;
    }
    if (config->name_prefix) {
      plan.name_prefix = *config->name_prefix;
    }
  }

  if (mode == PlanMode::kAttach) {
    auto file = AbsolutePath(cmd.get<std::string>("file"));
    if (!file) {
      return std::unexpected(file.error());
    }
    plan.existing_file = *file;
  } else {
    if (auto sizes = ApplySizes(cmd, plan); !sizes) {
      return std::unexpected(sizes.error());
    }
    auto count = ParseCount(cmd.get<std::string>("--count"));
    if (!count) {
      return std::unexpected(count.error());
    }
    plan.count = *count;
    plan.use_tmpfs = cmd.get<bool>("--tmpfs");
    if (auto seed = cmd.present<std::string>("--seed")) {
      auto parsed = ParseSeed(*seed);
      if (!parsed) {
        return std::unexpected(parsed.error());
      }
      plan.seed = *parsed;
    }
  }

  // `create` has no --blocks flag
  if (mode != PlanMode::kCreate) {
    if (auto blocks = cmd.present<std::string>("--blocks")) {
      plan.fault_blocks = *blocks;
    } else if (mode == PlanMode::kFaulty) {
      return std::unexpected(
          Diagnostic::HostError("faulty devices need --blocks"));
    }
  }

  plan.mount = cmd.get<bool>("--mount");
  plan.format = cmd.get<bool>("--format") || plan.mount;
  if (auto fstype = cmd.present<std::string>("--fstype")) {
    plan.fstype = *fstype;
  }
  if (auto dir = cmd.present<std::string>("--store-dir")) {
    auto store_dir = AbsolutePath(*dir);
    if (!store_dir) {
      return std::unexpected(store_dir.error());
    }
    plan.store_dir = *store_dir;
  }

  // A lone device fails fast; a batch keeps going past a bad instance.
  bool single = plan.count == 1 && !plan.size_range;
  plan.policy = single ? session::ErrorPolicy::kFailFast
                       : session::ErrorPolicy::kContinueOnError;
  return plan;
}

}  // namespace vdev::driver
