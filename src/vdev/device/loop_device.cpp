#include "vdev/device/loop_device.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "vdev/common/diagnostic.hpp"
#include "vdev/common/subprocess.hpp"

namespace vdev::device {

namespace fs = std::filesystem;

namespace {

auto LooksExhausted(const std::string& output) -> bool {
  return output.find("could not find any free loop device") !=
             std::string::npos ||
         output.find("No free loop device") != std::string::npos;
}

}  // namespace

auto LosetupLoopService::Attach(const BackingStore& store)
    -> Result<LoopBinding> {
  std::vector<std::string> argv = {
      "losetup", "--find", "--show", "--partscan", store.path.string()};
  spdlog::debug("running: {}", common::FormatCommandLine(argv));

  auto result = common::RunSubprocess(argv);
  std::string output = common::TrimOutput(result.output);

  if (!result.Succeeded()) {
    std::string msg =
        fmt::format("cannot attach '{}' to a loop device", store.path.string());
    if (LooksExhausted(output)) {
      return std::unexpected(
          Diagnostic::ResourceExhaustion(std::move(msg))
              .WithNote(output));
    }
    return std::unexpected(
        Diagnostic::DeviceSetupFailure(std::move(msg)).WithNote(output));
  }

  // --show prints the allocated device on the last line
  auto newline = output.find_last_of('\n');
  std::string device =
      newline == std::string::npos ? output : output.substr(newline + 1);
  if (!device.starts_with("/dev/")) {
    return std::unexpected(
        Diagnostic::DeviceSetupFailure(
            fmt::format(
                "losetup returned unexpected output for '{}'",
                store.path.string()))
            .WithNote(output));
  }

  return LoopBinding{.device_path = device, .backing_path = store.path};
}

auto LosetupLoopService::IsBound(const std::string& device_path) const
    -> bool {
  auto name = fs::path(device_path).filename();
  std::error_code ec;
  return fs::exists(sysfs_root_ / "block" / name / "loop" / "backing_file", ec);
}

auto LosetupLoopService::Detach(const LoopBinding& binding) -> Result<void> {
  if (!IsBound(binding.device_path)) {
    spdlog::debug("{} already detached", binding.device_path);
    return {};
  }

  std::vector<std::string> argv = {"losetup", "--detach", binding.device_path};
  spdlog::debug("running: {}", common::FormatCommandLine(argv));
  auto result = common::RunSubprocess(argv);
  if (result.Succeeded() || !IsBound(binding.device_path)) {
    return {};
  }

  return std::unexpected(
      Diagnostic::TeardownFailure(
          fmt::format("cannot detach {}", binding.device_path))
          .WithNote(common::TrimOutput(result.output)));
}

}  // namespace vdev::device
