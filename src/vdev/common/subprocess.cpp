#include "vdev/common/subprocess.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <optional>
#include <spawn.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace vdev::common {

namespace {

auto WaitForExit(pid_t pid) -> int {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return -1;
    }
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

}  // namespace

auto RunSubprocess(
    const std::vector<std::string>& argv,
    const std::optional<std::filesystem::path>& working_dir)
    -> SubprocessResult {
  if (argv.empty()) {
    return {.exit_code = -1, .output = "empty argv"};
  }

  std::array<int, 2> pipe_fds{};
  if (pipe2(pipe_fds.data(), O_CLOEXEC) != 0) {
    return {
        .exit_code = -1,
        .output = "pipe2() failed: " + std::string(strerror(errno))};
  }

  // Null-terminated argv for exec
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  pid_t pid = 0;

  if (working_dir.has_value()) {
    // posix_spawn has no portable chdir action, fall back to fork+exec
    pid = fork();
    if (pid == -1) {
      close(pipe_fds[0]);
      close(pipe_fds[1]);
      return {
          .exit_code = -1,
          .output = "fork() failed: " + std::string(strerror(errno))};
    }

    if (pid == 0) {
      dup2(pipe_fds[1], STDOUT_FILENO);
      dup2(pipe_fds[1], STDERR_FILENO);
      if (chdir(working_dir->c_str()) != 0) {
        _exit(127);
      }
      execvp(c_argv[0], c_argv.data());
      _exit(127);
    }
  } else {
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDERR_FILENO);

    int spawn_result = posix_spawnp(
        &pid, c_argv[0], &actions, nullptr, c_argv.data(), environ);

    posix_spawn_file_actions_destroy(&actions);

    if (spawn_result != 0) {
      close(pipe_fds[0]);
      close(pipe_fds[1]);
      return {
          .exit_code = -1,
          .output = "cannot run '" + argv[0] +
                    "': " + std::string(strerror(spawn_result))};
    }
  }

  close(pipe_fds[1]);

  std::string output;
  std::array<char, 4096> buffer{};
  ssize_t bytes_read = 0;
  while (true) {
    bytes_read = read(pipe_fds[0], buffer.data(), buffer.size());
    if (bytes_read > 0) {
      output.append(buffer.data(), static_cast<size_t>(bytes_read));
      continue;
    }
    if (bytes_read == -1 && errno == EINTR) {
      continue;
    }
    break;
  }
  close(pipe_fds[0]);

  return {.exit_code = WaitForExit(pid), .output = std::move(output)};
}

auto FormatCommandLine(const std::vector<std::string>& argv) -> std::string {
  std::string line;
  for (const auto& arg : argv) {
    if (!line.empty()) {
      line += ' ';
    }
    line += arg;
  }
  return line;
}

auto TrimOutput(const std::string& output) -> std::string {
  auto end = output.find_last_not_of(" \t\r\n");
  if (end == std::string::npos) {
    return {};
  }
  return output.substr(0, end + 1);
}

}  // namespace vdev::common
