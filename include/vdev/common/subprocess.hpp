#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace vdev::common {

struct SubprocessResult {
  int exit_code = -1;
  std::string output;  // stdout and stderr, merged

  [[nodiscard]] auto Succeeded() const -> bool {
    return exit_code == 0;
  }
};

// Execute a program with an argv array (no shell interpretation).
// argv[0] is looked up on PATH.
// If the child cannot be started, exit_code is -1 and output holds the reason.
// A child that cannot exec exits with 127.
auto RunSubprocess(
    const std::vector<std::string>& argv,
    const std::optional<std::filesystem::path>& working_dir = std::nullopt)
    -> SubprocessResult;

// Render argv for log lines: "losetup --find --show /var/tmp/x.img".
auto FormatCommandLine(const std::vector<std::string>& argv) -> std::string;

// Output with trailing whitespace removed (tools end with '\n').
auto TrimOutput(const std::string& output) -> std::string;

}  // namespace vdev::common
