#include "vdev/device/release_signal.hpp"

#include <cstddef>
#include <string>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace vdev::device {

void StreamReleaseSignal::Wait(size_t live_devices) {
  out_ << fmt::format(
      "{} device{} ready. Press Enter to tear down...", live_devices,
      live_devices == 1 ? "" : "s");
  out_.flush();

  std::string line;
  if (!std::getline(in_, line)) {
    out_ << '\n';
    spdlog::info("input closed, releasing devices");
  }
}

}  // namespace vdev::device
