#include "vdev/device/filesystem.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "vdev/common/byte_size.hpp"
#include "vdev/common/diagnostic.hpp"
#include "vdev/common/subprocess.hpp"

namespace vdev::device {

namespace fs = std::filesystem;

namespace {

auto MakeUniqueDirectory(const fs::path& root, const std::string& prefix)
    -> Result<fs::path> {
  std::string tmpl = (root / (prefix + "XXXXXX")).string();
  if (::mkdtemp(tmpl.data()) == nullptr) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot create a directory in '{}': {}", root.string(),
                std::strerror(errno))));
  }
  return fs::path(tmpl);
}

// Remove an empty directory, logging instead of failing.
void RemoveDirectory(const fs::path& dir) {
  std::error_code ec;
  fs::remove(dir, ec);
  if (ec) {
    spdlog::warn("cannot remove directory {}: {}", dir.string(), ec.message());
  }
}

auto UnmountDirectory(const fs::path& mountpoint) -> Result<void> {
  auto mounted = IsMountpoint(mountpoint);
  if (!mounted) {
    return std::unexpected(mounted.error());
  }

  if (*mounted) {
    std::vector<std::string> argv = {"umount", mountpoint.string()};
    spdlog::debug("running: {}", common::FormatCommandLine(argv));
    auto result = common::RunSubprocess(argv);
    if (!result.Succeeded()) {
      auto still = IsMountpoint(mountpoint);
      if (!still || *still) {
        // Leave the directory so unflushed data stays reachable.
        return std::unexpected(
            Diagnostic::TeardownFailure(
                fmt::format(
                    "cannot unmount '{}', directory left in place",
                    mountpoint.string()))
                .WithNote(common::TrimOutput(result.output)));
      }
    }
  } else {
    spdlog::debug("{} is not mounted", mountpoint.string());
  }

  std::error_code ec;
  if (fs::exists(mountpoint, ec)) {
    RemoveDirectory(mountpoint);
  }
  return {};
}

}  // namespace

auto UnescapeMountField(const std::string& field) -> std::string {
  std::string out;
  out.reserve(field.size());
  for (size_t i = 0; i < field.size(); ++i) {
    if (field[i] == '\\' && i + 3 < field.size() &&
        field[i + 1] >= '0' && field[i + 1] <= '7' && field[i + 2] >= '0' &&
        field[i + 2] <= '7' && field[i + 3] >= '0' && field[i + 3] <= '7') {
      int value = ((field[i + 1] - '0') << 6) | ((field[i + 2] - '0') << 3) |
                  (field[i + 3] - '0');
      out += static_cast<char>(value);
      i += 3;
      continue;
    }
    out += field[i];
  }
  return out;
}

auto IsMountpoint(const fs::path& path, const fs::path& mount_table)
    -> Result<bool> {
  std::ifstream in(mount_table);
  if (!in) {
    return std::unexpected(
        Diagnostic::TeardownFailure(
            fmt::format(
                "cannot read mount table '{}': {}", mount_table.string(),
                std::strerror(errno))));
  }

  std::error_code ec;
  fs::path wanted = fs::weakly_canonical(path, ec);
  if (ec) {
    wanted = path;
  }

  std::string line;
  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string source;
    std::string target;
    if (!(fields >> source >> target)) {
      continue;
    }
    if (fs::path(UnescapeMountField(target)) == wanted) {
      return true;
    }
  }
  return false;
}

auto HostFilesystemService::Format(
    const std::string& device, const std::string& fstype,
    const std::vector<std::string>& extra_args) -> Result<void> {
  std::vector<std::string> argv = {"mkfs", "-t", fstype};
  argv.insert(argv.end(), extra_args.begin(), extra_args.end());
  argv.push_back(device);

  spdlog::debug("running: {}", common::FormatCommandLine(argv));
  auto result = common::RunSubprocess(argv);
  if (!result.Succeeded()) {
    return std::unexpected(
        Diagnostic::DeviceSetupFailure(
            fmt::format("cannot format {} as {}", device, fstype))
            .WithNote(common::TrimOutput(result.output)));
  }
  return {};
}

auto HostFilesystemService::Mount(
    const std::string& device, const fs::path& mount_root)
    -> Result<MountedFilesystem> {
  auto dir = MakeUniqueDirectory(mount_root, "vdev-mnt-");
  if (!dir) {
    return std::unexpected(dir.error());
  }

  std::vector<std::string> argv = {"mount", device, dir->string()};
  spdlog::debug("running: {}", common::FormatCommandLine(argv));
  auto result = common::RunSubprocess(argv);
  if (!result.Succeeded()) {
    RemoveDirectory(*dir);
    return std::unexpected(
        Diagnostic::DeviceSetupFailure(
            fmt::format("cannot mount {} on '{}'", device, dir->string()))
            .WithNote(common::TrimOutput(result.output)));
  }

  return MountedFilesystem{.mountpoint = *dir, .device = device};
}

auto HostFilesystemService::Unmount(const MountedFilesystem& mounted)
    -> Result<void> {
  return UnmountDirectory(mounted.mountpoint);
}

auto HostFilesystemService::MountTmpfsPool(
    uint64_t capacity_bytes, const fs::path& mount_root) -> Result<TmpfsPool> {
  // size=0 would mean "unlimited" to tmpfs
  if (capacity_bytes == 0) {
    return std::unexpected(
        Diagnostic::InvalidSizeSpec("tmpfs pool needs a non-zero capacity"));
  }

  auto dir = MakeUniqueDirectory(mount_root, "vdev-pool-");
  if (!dir) {
    return std::unexpected(dir.error());
  }

  std::vector<std::string> argv = {
      "mount",      "-t", "tmpfs", "-o", fmt::format("size={}", capacity_bytes),
      "vdev-pool", dir->string()};
  spdlog::debug("running: {}", common::FormatCommandLine(argv));
  auto result = common::RunSubprocess(argv);
  if (!result.Succeeded()) {
    RemoveDirectory(*dir);
    auto output = common::TrimOutput(result.output);
    std::string msg = fmt::format(
        "cannot mount a {} tmpfs pool on '{}'",
        common::FormatByteSize(capacity_bytes), dir->string());
    if (output.find("No space left") != std::string::npos ||
        output.find("Cannot allocate memory") != std::string::npos) {
      return std::unexpected(
          Diagnostic::ResourceExhaustion(std::move(msg)).WithNote(output));
    }
    return std::unexpected(
        Diagnostic::DeviceSetupFailure(std::move(msg)).WithNote(output));
  }

  spdlog::info(
      "mounted tmpfs pool {} ({})", dir->string(),
      common::FormatByteSize(capacity_bytes));
  return TmpfsPool{.mountpoint = *dir, .capacity_bytes = capacity_bytes};
}

auto HostFilesystemService::ReleaseTmpfsPool(const TmpfsPool& pool)
    -> Result<void> {
  return UnmountDirectory(pool.mountpoint);
}

}  // namespace vdev::device
