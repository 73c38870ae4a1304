#pragma once

#include <filesystem>
#include <string>

#include "vdev/common/diagnostic.hpp"
#include "vdev/session/device_record.hpp"

namespace vdev::session {

// JSON description of a session's live devices and failed instances, so that
// scripts can find the devices while vdev waits for release.
auto RenderManifest(const BatchSession& session) -> std::string;

auto WriteManifest(
    const BatchSession& session, const std::filesystem::path& path)
    -> Result<void>;

}  // namespace vdev::session
