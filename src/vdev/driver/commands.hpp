#pragma once

#include <argparse/argparse.hpp>

namespace vdev::driver {

// Flags of the top-level parser that every subcommand honors.
struct GlobalOptions {
  bool verbose = false;
  bool quiet = false;
};

auto CreateCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& global) -> int;
auto FaultyCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& global) -> int;
auto AttachCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& global) -> int;
auto TableCommand(
    const argparse::ArgumentParser& cmd, const GlobalOptions& global) -> int;
auto InitCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace vdev::driver
