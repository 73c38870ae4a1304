#include "logging.hpp"

#include <expected>
#include <memory>
#include <string>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "vdev/common/diagnostic.hpp"

namespace vdev::driver {

namespace {

constexpr const char* kLogPattern = "[vdev][%H:%M:%S][%l] %v";

auto ResolveLevel(const LogOptions& options)
    -> Result<spdlog::level::level_enum> {
  if (options.verbose) {
    return spdlog::level::debug;
  }
  if (options.quiet) {
    return spdlog::level::warn;
  }
  if (!options.config_level) {
    return spdlog::level::info;
  }
  const std::string& name = *options.config_level;
  auto level = spdlog::level::from_str(name);
  // from_str maps anything it does not know to off.
  if (level == spdlog::level::off && name != "off") {
    return std::unexpected(
        Diagnostic::HostError(fmt::format("unknown log level '{}'", name)));
  }
  return level;
}

}  // namespace

auto ConfigureLogging(const LogOptions& options) -> Result<void> {
  auto level = ResolveLevel(options);
  if (!level) {
    return std::unexpected(level.error());
  }

  auto logger = spdlog::get("vdev");
  if (!logger) {
    logger = spdlog::stderr_color_mt("vdev");
  }
  logger->set_pattern(kLogPattern);
  logger->set_level(*level);
  spdlog::set_default_logger(logger);
  return {};
}

}  // namespace vdev::driver
