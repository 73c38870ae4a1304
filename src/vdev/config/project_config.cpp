#include "vdev/config/project_config.hpp"

#include <algorithm>
#include <expected>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "vdev/common/diagnostic.hpp"

namespace vdev::config {

namespace fs = std::filesystem;

namespace {

constexpr std::initializer_list<std::string_view> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "off"};

auto ConfigError(const fs::path& path, std::string msg) -> Diagnostic {
  return Diagnostic::HostError(fmt::format("{}: {}", path.string(), msg));
}

auto CheckKeys(
    const toml::table& table, std::initializer_list<std::string_view> allowed,
    std::string_view context, const fs::path& path) -> Result<void> {
  for (auto&& [key, node] : table) {
    bool found = std::ranges::find(allowed, key.str()) != allowed.end();
    if (!found) {
      return std::unexpected(
          ConfigError(
              path, fmt::format("unknown key '{}' in {}", key.str(), context)));
    }
  }
  return {};
}

auto ReadString(
    const toml::table& table, std::string_view section, std::string_view key,
    const fs::path& path) -> Result<std::optional<std::string>> {
  const toml::node* node = table.get(key);
  if (node == nullptr) {
    return std::optional<std::string>{};
  }
  auto value = node->value<std::string>();
  if (!node->is_string() || !value) {
    return std::unexpected(
        ConfigError(
            path, fmt::format("'{}.{}' must be a string", section, key)));
  }
  return value;
}

auto ReadDirectory(
    const toml::table& table, std::string_view section, std::string_view key,
    const fs::path& path, const fs::path& root_dir)
    -> Result<std::optional<fs::path>> {
  auto value = ReadString(table, section, key, path);
  if (!value) {
    return std::unexpected(value.error());
  }
  if (!*value) {
    return std::optional<fs::path>{};
  }
  fs::path dir = **value;
  if (dir.is_relative()) {
    dir = root_dir / dir;
  }
  return std::optional<fs::path>{dir};
}

auto ReadStringArray(
    const toml::table& table, std::string_view section, std::string_view key,
    const fs::path& path) -> Result<std::optional<std::vector<std::string>>> {
  const toml::node* node = table.get(key);
  if (node == nullptr) {
    return std::optional<std::vector<std::string>>{};
  }
  const toml::array* arr = node->as_array();
  if (arr == nullptr) {
    return std::unexpected(
        ConfigError(
            path,
            fmt::format("'{}.{}' must be an array of strings", section, key)));
  }
  std::vector<std::string> values;
  for (const auto& elem : *arr) {
    auto str = elem.value<std::string>();
    if (!elem.is_string() || !str) {
      return std::unexpected(
          ConfigError(
              path,
              fmt::format(
                  "'{}.{}' must be an array of strings", section, key)));
    }
    values.push_back(*str);
  }
  return std::optional<std::vector<std::string>>{std::move(values)};
}

// Quoted and escaped as a TOML basic string.
auto TomlString(const std::string& text) -> std::string {
  std::ostringstream out;
  out << toml::toml_formatter{
      toml::value<std::string>{text}, toml::format_flags::none};
  return out.str();
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = fs::absolute(config_path).parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        ConfigError(config_path, fmt::format("parse error: {}", e.what())));
  }

  if (auto keys = CheckKeys(tbl, {"defaults", "logging"}, "top level",
                            config_path);
      !keys) {
    return std::unexpected(keys.error());
  }

  // [defaults] section (optional)
  if (auto* defaults = tbl["defaults"].as_table()) {
    if (auto keys = CheckKeys(
            *defaults,
            {"fstype", "mkfs_args", "store_dir", "mount_root", "name_prefix"},
            "[defaults]", config_path);
        !keys) {
      return std::unexpected(keys.error());
    }

    auto fstype = ReadString(*defaults, "defaults", "fstype", config_path);
    if (!fstype) {
      return std::unexpected(fstype.error());
    }
    config.fstype = *fstype;

    auto mkfs_args =
        ReadStringArray(*defaults, "defaults", "mkfs_args", config_path);
    if (!mkfs_args) {
      return std::unexpected(mkfs_args.error());
    }
    config.mkfs_args = *mkfs_args;

    auto store_dir = ReadDirectory(
        *defaults, "defaults", "store_dir", config_path, config.root_dir);
    if (!store_dir) {
      return std::unexpected(store_dir.error());
    }
    config.store_dir = *store_dir;

    auto mount_root = ReadDirectory(
        *defaults, "defaults", "mount_root", config_path, config.root_dir);
    if (!mount_root) {
      return std::unexpected(mount_root.error());
    }
    config.mount_root = *mount_root;

    auto prefix = ReadString(*defaults, "defaults", "name_prefix", config_path);
    if (!prefix) {
      return std::unexpected(prefix.error());
    }
    if (*prefix && (*prefix)->empty()) {
      return std::unexpected(
          ConfigError(config_path, "'defaults.name_prefix' must not be empty"));
    }
    config.name_prefix = *prefix;
  } else if (tbl.contains("defaults")) {
    return std::unexpected(ConfigError(config_path, "[defaults] must be a table"));
  }

  // [logging] section (optional)
  if (auto* logging = tbl["logging"].as_table()) {
    if (auto keys = CheckKeys(*logging, {"level"}, "[logging]", config_path);
        !keys) {
      return std::unexpected(keys.error());
    }
    auto level = ReadString(*logging, "logging", "level", config_path);
    if (!level) {
      return std::unexpected(level.error());
    }
    if (*level && std::ranges::find(kLogLevels, **level) == kLogLevels.end()) {
      return std::unexpected(
          ConfigError(
              config_path,
              fmt::format(
                  "unknown log level '{}', use trace, debug, info, warn, "
                  "error or off",
                  **level)));
    }
    config.log_level = *level;
  } else if (tbl.contains("logging")) {
    return std::unexpected(ConfigError(config_path, "[logging] must be a table"));
  }

  return config;
}

auto LoadOptionalConfig() -> Result<std::optional<ProjectConfig>> {
  auto config_path = FindConfig();
  if (!config_path) {
    return std::optional<ProjectConfig>{};
  }
  auto config = LoadConfig(*config_path);
  if (!config) {
    return std::unexpected(config.error());
  }
  return std::optional<ProjectConfig>{std::move(*config)};
}

auto DefaultConfigText() -> std::string {
  return fmt::format(
      "# vdev settings; command line flags take precedence.\n"
      "\n"
      "[defaults]\n"
      "fstype = \"ext4\"\n"
      "mkfs_args = [\"-q\"]\n"
      "store_dir = {}\n"
      "mount_root = {}\n"
      "name_prefix = \"vdev\"\n"
      "\n"
      "[logging]\n"
      "level = \"info\"\n",
      TomlString(fs::temp_directory_path().string()),
      TomlString(fs::temp_directory_path().string()));
}

}  // namespace vdev::config
