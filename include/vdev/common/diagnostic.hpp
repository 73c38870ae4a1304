#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace vdev {

// Failure taxonomy shared by every fallible operation.
enum class ErrorKind : uint8_t {
  kInvalidSizeSpec,     // Size string or size range unusable
  kInvalidBlockRange,   // Malformed fault token, end < start, end >= total
  kResourceExhaustion,  // No free loop device, out of space or memory
  kDeviceSetupFailure,  // attach/format/mount/mapping-load failed
  kTeardownFailure,     // Best-effort release step failed
  kHostError,           // Config, I/O, usage
};

auto ToString(ErrorKind kind) -> const char*;

struct Diagnostic {
  ErrorKind kind;
  std::string message;
  std::vector<std::string> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto InvalidSizeSpec(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kInvalidSizeSpec,
        .message = std::move(msg),
        .notes = {}};
  }

  static auto InvalidBlockRange(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kInvalidBlockRange,
        .message = std::move(msg),
        .notes = {}};
  }

  static auto ResourceExhaustion(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kResourceExhaustion,
        .message = std::move(msg),
        .notes = {}};
  }

  static auto DeviceSetupFailure(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kDeviceSetupFailure,
        .message = std::move(msg),
        .notes = {}};
  }

  static auto TeardownFailure(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kTeardownFailure,
        .message = std::move(msg),
        .notes = {}};
  }

  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .kind = ErrorKind::kHostError,
        .message = std::move(msg),
        .notes = {}};
  }

  // Attach an auxiliary line (e.g. captured tool output).
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(std::move(msg));
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace vdev
