#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

#include "vdev/common/subprocess.hpp"

namespace vdev::common {
namespace {

class SubprocessTest : public ::testing::Test {};

TEST_F(SubprocessTest, CapturesOutput) {
  auto result = RunSubprocess({"echo", "hello", "world"});
  EXPECT_TRUE(result.Succeeded());
  EXPECT_EQ(result.output, "hello world\n");
}

TEST_F(SubprocessTest, MergesStderr) {
  auto result = RunSubprocess({"sh", "-c", "echo out; echo err >&2"});
  EXPECT_TRUE(result.Succeeded());
  EXPECT_NE(result.output.find("out"), std::string::npos);
  EXPECT_NE(result.output.find("err"), std::string::npos);
}

TEST_F(SubprocessTest, ReportsExitCode) {
  auto result = RunSubprocess({"sh", "-c", "exit 3"});
  EXPECT_FALSE(result.Succeeded());
  EXPECT_EQ(result.exit_code, 3);
}

TEST_F(SubprocessTest, MissingProgram) {
  auto result = RunSubprocess({"vdev-no-such-program-xyz"});
  EXPECT_FALSE(result.Succeeded());
}

TEST_F(SubprocessTest, WorkingDirectory) {
  auto dir = std::filesystem::temp_directory_path();
  auto result = RunSubprocess({"pwd"}, dir);
  ASSERT_TRUE(result.Succeeded());
  EXPECT_EQ(
      std::filesystem::canonical(TrimOutput(result.output)),
      std::filesystem::canonical(dir));
}

TEST_F(SubprocessTest, FormatsCommandLine) {
  EXPECT_EQ(
      FormatCommandLine({"losetup", "--find", "--show", "/tmp/a.img"}),
      "losetup --find --show /tmp/a.img");
}

TEST_F(SubprocessTest, TrimsTrailingWhitespace) {
  EXPECT_EQ(TrimOutput("/dev/loop3\n"), "/dev/loop3");
  EXPECT_EQ(TrimOutput("x \n\n"), "x");
  EXPECT_EQ(TrimOutput(""), "");
}

}  // namespace
}  // namespace vdev::common
