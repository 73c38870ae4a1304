#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "vdev/common/diagnostic.hpp"

namespace vdev::config {

inline constexpr const char* kConfigFileName = "vdev.toml";

// Settings from vdev.toml. Unset fields fall back to built-in defaults;
// command line flags override both.
struct ProjectConfig {
  std::optional<std::string> fstype;
  std::optional<std::vector<std::string>> mkfs_args;
  std::optional<std::filesystem::path> store_dir;
  std::optional<std::filesystem::path> mount_root;
  std::optional<std::string> name_prefix;
  std::optional<std::string> log_level;

  // Directory where vdev.toml was found
  std::filesystem::path root_dir;
};

// Search for vdev.toml starting from start_dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse vdev.toml. Relative directories are resolved against the file's
// directory. Unknown sections or keys and wrongly typed values are errors.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// FindConfig + LoadConfig; an absent file yields nullopt.
auto LoadOptionalConfig() -> Result<std::optional<ProjectConfig>>;

// Commented default file written by `vdev init`.
auto DefaultConfigText() -> std::string;

}  // namespace vdev::config
