#include "vdev/session/manifest.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <string>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "vdev/common/diagnostic.hpp"
#include "vdev/mapping/mapping_table.hpp"
#include "vdev/session/device_record.hpp"

namespace vdev::session {

namespace {

auto DeviceToJson(const DeviceRecord& record) -> nlohmann::json {
  nlohmann::json j;
  j["index"] = record.index;
  j["size_bytes"] = record.size_bytes;
  j["state"] = ToString(record.state);
  if (record.store) {
    j["backing_file"] = record.store->path.string();
    j["hosted_on"] = device::ToString(record.store->hosted_on);
    j["ephemeral"] = record.store->ephemeral;
  }
  if (record.loop) {
    j["loop_device"] = record.loop->device_path;
  }
  if (record.mapped) {
    j["mapped_device"] = record.mapped->device_path;
    j["fault_table"] = mapping::FormatDmTable(
        record.mapped->table, record.mapped->underlying_device);
  }
  if (record.mount) {
    j["mountpoint"] = record.mount->mountpoint.string();
  }
  return j;
}

}  // namespace

auto RenderManifest(const BatchSession& session) -> std::string {
  nlohmann::json root;
  root["session"] = session.session_id;

  root["devices"] = nlohmann::json::array();
  for (const auto& record : session.records) {
    root["devices"].push_back(DeviceToJson(record));
  }

  root["failures"] = nlohmann::json::array();
  for (const auto& failure : session.failures) {
    root["failures"].push_back(
        {{"index", failure.index},
         {"size_bytes", failure.size_bytes},
         {"kind", ToString(failure.error.kind)},
         {"error", failure.error.message}});
  }

  if (session.shared_tmpfs) {
    root["tmpfs_pool"] = {
        {"mountpoint", session.shared_tmpfs->mountpoint.string()},
        {"capacity_bytes", session.shared_tmpfs->capacity_bytes}};
  }

  // Paths are raw bytes on Linux; invalid UTF-8 becomes U+FFFD instead of
  // throwing while devices are live.
  return root.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) +
         "\n";
}

auto WriteManifest(
    const BatchSession& session, const std::filesystem::path& path)
    -> Result<void> {
  std::ofstream out(path);
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot write manifest '{}'", path.string())));
  }
  out << RenderManifest(session);
  if (!out) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("cannot write manifest '{}'", path.string())));
  }
  return {};
}

}  // namespace vdev::session
