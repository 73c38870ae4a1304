#include "vdev/session/device_record.hpp"

#include <algorithm>
#include <cstddef>
#include <string>

namespace vdev::session {

auto ToString(RecordState state) -> const char* {
  switch (state) {
    case RecordState::kPending:
      return "pending";
    case RecordState::kStoreCreated:
      return "store-created";
    case RecordState::kLoopAttached:
      return "loop-attached";
    case RecordState::kMappingApplied:
      return "mapping-applied";
    case RecordState::kFormatted:
      return "formatted";
    case RecordState::kMounted:
      return "mounted";
    case RecordState::kLive:
      return "live";
    case RecordState::kTornDown:
      return "torn-down";
    case RecordState::kFailed:
      return "failed";
  }
  return "unknown";
}

auto DeviceRecord::TopDevicePath() const -> std::string {
  if (mapped) {
    return mapped->device_path;
  }
  if (loop) {
    return loop->device_path;
  }
  return {};
}

auto BatchSession::LiveCount() const -> size_t {
  return static_cast<size_t>(
      std::ranges::count_if(records, [](const DeviceRecord& r) {
        return r.state == RecordState::kLive;
      }));
}

}  // namespace vdev::session
