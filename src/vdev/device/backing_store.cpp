#include "vdev/device/backing_store.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <expected>
#include <fcntl.h>
#include <filesystem>
#include <string>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "vdev/common/byte_size.hpp"
#include "vdev/common/diagnostic.hpp"

namespace vdev::device {

namespace fs = std::filesystem;

namespace {

auto IsOutOfSpace(int err) -> bool {
  return err == ENOSPC || err == EFBIG || err == EDQUOT || err == ENOMEM;
}

auto ErrnoDiagnostic(int err, std::string what) -> Diagnostic {
  std::string msg = fmt::format("{}: {}", what, std::strerror(err));
  if (IsOutOfSpace(err)) {
    return Diagnostic::ResourceExhaustion(std::move(msg));
  }
  return Diagnostic::DeviceSetupFailure(std::move(msg));
}

}  // namespace

auto ToString(Hosting hosting) -> const char* {
  switch (hosting) {
    case Hosting::kPersistentDir:
      return "disk";
    case Hosting::kTmpfsPool:
      return "tmpfs";
  }
  return "unknown";
}

auto SparseFileProvider::Create(
    const fs::path& path, uint64_t size_bytes, Hosting hosted_on)
    -> Result<BackingStore> {
  int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
  if (fd == -1) {
    return std::unexpected(
        ErrnoDiagnostic(
            errno, fmt::format("cannot create '{}'", path.string())));
  }

  if (::ftruncate(fd, static_cast<off_t>(size_bytes)) != 0) {
    int err = errno;
    ::close(fd);
    ::unlink(path.c_str());
    return std::unexpected(
        ErrnoDiagnostic(
            err, fmt::format(
                     "cannot extend '{}' to {}", path.string(),
                     common::FormatByteSize(size_bytes))));
  }

  if (::close(fd) != 0) {
    int err = errno;
    ::unlink(path.c_str());
    return std::unexpected(
        ErrnoDiagnostic(err, fmt::format("cannot close '{}'", path.string())));
  }

  spdlog::debug(
      "created sparse file {} ({}, {})", path.string(),
      common::FormatByteSize(size_bytes), ToString(hosted_on));
  return BackingStore{
      .path = path,
      .size_bytes = size_bytes,
      .ephemeral = true,
      .hosted_on = hosted_on};
}

auto SparseFileProvider::Adopt(const fs::path& path) -> Result<BackingStore> {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot use '{}': {}", path.string(), std::strerror(errno))));
  }
  if (!S_ISREG(st.st_mode)) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("'{}' is not a regular file", path.string())));
  }

  std::error_code ec;
  fs::path absolute = fs::absolute(path, ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "cannot resolve '{}': {}", path.string(), ec.message())));
  }

  return BackingStore{
      .path = absolute,
      .size_bytes = static_cast<uint64_t>(st.st_size),
      .ephemeral = false,
      .hosted_on = Hosting::kPersistentDir};
}

auto SparseFileProvider::Destroy(const BackingStore& store) -> Result<void> {
  if (!store.ephemeral) {
    spdlog::debug("keeping user file {}", store.path.string());
    return {};
  }
  if (::unlink(store.path.c_str()) != 0 && errno != ENOENT) {
    return std::unexpected(
        Diagnostic::TeardownFailure(
            fmt::format(
                "cannot delete '{}': {}", store.path.string(),
                std::strerror(errno))));
  }
  return {};
}

}  // namespace vdev::device
