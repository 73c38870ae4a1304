#include "vdev/device/device_mapper.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <filesystem>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "vdev/common/diagnostic.hpp"
#include "vdev/common/subprocess.hpp"
#include "vdev/mapping/mapping_table.hpp"

namespace vdev::device {

namespace fs = std::filesystem;

namespace {

// Temporary table file, unlinked when the scope ends.
class ScopedTableFile {
 public:
  ScopedTableFile(const ScopedTableFile&) = delete;
  ScopedTableFile(ScopedTableFile&&) = delete;
  auto operator=(const ScopedTableFile&) -> ScopedTableFile& = delete;
  auto operator=(ScopedTableFile&&) -> ScopedTableFile& = delete;

  explicit ScopedTableFile(fs::path path) : path_(std::move(path)) {
  }

  ~ScopedTableFile() {
    if (!path_.empty()) {
      ::unlink(path_.c_str());
    }
  }

  [[nodiscard]] auto Path() const -> const fs::path& {
    return path_;
  }

 private:
  fs::path path_;
};

auto WriteTableFile(const fs::path& dir, const std::string& text)
    -> Result<fs::path> {
  std::string tmpl = (dir / "vdev-table-XXXXXX").string();
  int fd = ::mkstemp(tmpl.data());
  if (fd == -1) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot create table file in '{}': {}", dir.string(),
                std::strerror(errno))));
  }

  size_t written = 0;
  while (written < text.size()) {
    ssize_t n = ::write(fd, text.data() + written, text.size() - written);
    if (n == -1) {
      if (errno == EINTR) {
        continue;
      }
      int err = errno;
      ::close(fd);
      ::unlink(tmpl.c_str());
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "cannot write table file '{}': {}", tmpl,
                  std::strerror(err))));
    }
    written += static_cast<size_t>(n);
  }
  ::close(fd);
  return fs::path(tmpl);
}

}  // namespace

auto DmsetupService::Create(
    const std::string& name, const mapping::MappingTable& table,
    const std::string& underlying_device) -> Result<MappedDevice> {
  if (auto check = mapping::CheckMappingTable(table); !check) {
    return std::unexpected(check.error());
  }

  std::string text = mapping::FormatDmTable(table, underlying_device);
  auto table_path = WriteTableFile(scratch_dir_, text);
  if (!table_path) {
    return std::unexpected(table_path.error());
  }
  ScopedTableFile table_file(*table_path);

  std::vector<std::string> argv = {
      "dmsetup", "create", name, table_file.Path().string()};
  spdlog::debug("running: {}", common::FormatCommandLine(argv));
  auto result = common::RunSubprocess(argv);
  if (!result.Succeeded()) {
    return std::unexpected(
        Diagnostic::DeviceSetupFailure(
            fmt::format(
                "cannot create mapped device '{}' over {}", name,
                underlying_device))
            .WithNote(common::TrimOutput(result.output)));
  }

  spdlog::debug("loaded table for {}:\n{}", name, text);
  return MappedDevice{
      .name = name,
      .table = table,
      .underlying_device = underlying_device,
      .device_path = "/dev/mapper/" + name};
}

auto DmsetupService::Exists(const std::string& name) const -> Result<bool> {
  std::vector<std::string> argv = {"dmsetup", "info", name};
  auto result = common::RunSubprocess(argv);
  if (result.Succeeded()) {
    return true;
  }
  if (result.output.find("Device does not exist") != std::string::npos) {
    return false;
  }
  return std::unexpected(
      Diagnostic::TeardownFailure(
          fmt::format("cannot query mapped device '{}'", name))
          .WithNote(common::TrimOutput(result.output)));
}

auto DmsetupService::Remove(const MappedDevice& device) -> Result<void> {
  auto exists = Exists(device.name);
  if (!exists) {
    return std::unexpected(exists.error());
  }
  if (!*exists) {
    spdlog::info("mapped device {} is already gone", device.name);
    return {};
  }

  std::vector<std::string> argv = {"dmsetup", "remove", "--retry", device.name};
  spdlog::debug("running: {}", common::FormatCommandLine(argv));
  auto result = common::RunSubprocess(argv);
  if (result.Succeeded()) {
    return {};
  }
  // A concurrent remove may have won the race.
  if (auto still = Exists(device.name); still && !*still) {
    return {};
  }

  return std::unexpected(
      Diagnostic::TeardownFailure(
          fmt::format("cannot remove mapped device '{}'", device.name))
          .WithNote(common::TrimOutput(result.output)));
}

}  // namespace vdev::device
