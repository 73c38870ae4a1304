#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <span>
#include <string>
#include <system_error>

#include <fmt/core.h>

#include "commands.hpp"
#include "input.hpp"
#include "print.hpp"
#include "vdev/common/internal_error.hpp"

namespace fs = std::filesystem;

auto main(int argc, char* argv[]) -> int {
  auto args = vdev::driver::PreprocessArgs(
      std::span<char*>(argv, static_cast<size_t>(argc)));

  argparse::ArgumentParser program("vdev", "0.1.0");
  program.add_description(
      "Disposable loop-backed block devices, optionally with faulty blocks");
  program.add_epilog(
      "Devices live until Enter is pressed (or stdin closes). Killing vdev "
      "before that leaks them;\nclean up with umount, dmsetup remove and "
      "losetup -d.");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Log every setup and teardown step");
  program.add_argument("-q", "--quiet")
      .default_value(false)
      .implicit_value(true)
      .help("Only log warnings and errors");

  // Subcommand: create
  argparse::ArgumentParser create_cmd("create");
  create_cmd.add_description("Create a batch of loop devices");
  create_cmd.add_argument("size").nargs(0, 1).help(
      "Device size, e.g. 64M or 1.5G");
  vdev::driver::AddBatchFlags(create_cmd);
  vdev::driver::AddDeviceFlags(create_cmd);

  // Subcommand: faulty
  argparse::ArgumentParser faulty_cmd("faulty");
  faulty_cmd.add_description(
      "Create loop devices whose listed blocks fail every I/O");
  faulty_cmd.add_argument("size").nargs(0, 1).help(
      "Device size, e.g. 64M or 1.5G");
  faulty_cmd.add_argument("--blocks")
      .help("Faulty 512-byte blocks, e.g. 500,1000-1010")
      .metavar("SPEC");
  vdev::driver::AddBatchFlags(faulty_cmd);
  vdev::driver::AddDeviceFlags(faulty_cmd);

  // Subcommand: attach
  argparse::ArgumentParser attach_cmd("attach");
  attach_cmd.add_description(
      "Bind an existing file to a loop device (the file is kept)");
  attach_cmd.add_argument("file").help("Backing file");
  attach_cmd.add_argument("--blocks")
      .help("Faulty 512-byte blocks, e.g. 500,1000-1010")
      .metavar("SPEC");
  vdev::driver::AddDeviceFlags(attach_cmd);

  // Subcommand: table
  argparse::ArgumentParser table_cmd("table");
  table_cmd.add_description(
      "Print the device-mapper table for a faulty device without creating it");
  table_cmd.add_argument("size").help("Device size, e.g. 64M or 1.5G");
  table_cmd.add_argument("--blocks")
      .required()
      .help("Faulty 512-byte blocks, e.g. 500,1000-1010")
      .metavar("SPEC");
  table_cmd.add_argument("--device")
      .help("Underlying device named in the table")
      .metavar("PATH");

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Write a default vdev.toml");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing vdev.toml");

  program.add_subparser(create_cmd);
  program.add_subparser(faulty_cmd);
  program.add_subparser(attach_cmd);
  program.add_subparser(table_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(args);
  } catch (const std::exception& err) {
    vdev::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      vdev::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  vdev::driver::GlobalOptions global{
      .verbose = program.get<bool>("--verbose"),
      .quiet = program.get<bool>("--quiet")};

  try {
    if (program.is_subcommand_used("create")) {
      return vdev::driver::CreateCommand(create_cmd, global);
    }
    if (program.is_subcommand_used("faulty")) {
      return vdev::driver::FaultyCommand(faulty_cmd, global);
    }
    if (program.is_subcommand_used("attach")) {
      return vdev::driver::AttachCommand(attach_cmd, global);
    }
    if (program.is_subcommand_used("table")) {
      return vdev::driver::TableCommand(table_cmd, global);
    }
    if (program.is_subcommand_used("init")) {
      return vdev::driver::InitCommand(init_cmd);
    }
  } catch (const vdev::common::InternalError& e) {
    vdev::driver::PrintError(e.what());
    return 1;
  } catch (const std::exception& e) {
    vdev::driver::PrintError(e.what());
    return 1;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
