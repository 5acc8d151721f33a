#include "linux/linux_process_launcher.hpp"
#include "linux/subprocess.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace pnav {
namespace {

using namespace std::chrono_literals;
using Argv = std::vector<std::string>;

TEST(TerminalArgvTest, AppendsDirectoryByDefault) {
    EXPECT_EQ(build_terminal_argv("kitty --directory", "/dev/rust/C"),
              (Argv{"kitty", "--directory", "/dev/rust/C"}));
}

TEST(TerminalArgvTest, ReplacesPathToken) {
    EXPECT_EQ(build_terminal_argv("alacritty --working-directory {path} -e zsh", "/dev/x"),
              (Argv{"alacritty", "--working-directory", "/dev/x", "-e", "zsh"}));
    EXPECT_EQ(build_terminal_argv("wezterm start --cwd={path}", "/dev/x"),
              (Argv{"wezterm", "start", "--cwd=/dev/x"}));
}

TEST(TerminalArgvTest, CollapsesWhitespace) {
    EXPECT_EQ(build_terminal_argv("  foot \t -D  ", "/p"), (Argv{"foot", "-D", "/p"}));
}

TEST(TerminalArgvTest, EmptyTemplateGivesEmptyArgv) {
    EXPECT_TRUE(build_terminal_argv("   ", "/p").empty());
}

TEST(LinuxProcessLauncherTest, MissingIdeIsReported) {
    LinuxProcessLauncher launcher("/nonexistent/bin/idea", "true");
    auto result = launcher.launch_ide(std::nullopt);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error_message.find("/nonexistent/bin/idea"), std::string::npos);
}

TEST(LinuxProcessLauncherTest, LaunchesWithoutWaiting) {
    LinuxProcessLauncher launcher("true", "true");
    EXPECT_TRUE(launcher.launch_ide(std::string("/tmp")).success);
}

TEST(LinuxProcessLauncherTest, TerminalInProjectDirectory) {
    test::TempDir tmp;
    LinuxProcessLauncher launcher("true", "true");
    EXPECT_TRUE(launcher.open_terminal(tmp.path().string()).success);
}

TEST(LinuxProcessLauncherTest, EmptyTerminalCommandFails) {
    LinuxProcessLauncher launcher("true", "");
    auto result = launcher.open_terminal("/tmp");
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
}

TEST(SubprocessTest, CapturesStdout) {
    auto result = run_command({"echo", "hello"}, "", 2000ms);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.output, "hello\n");
}

TEST(SubprocessTest, ReportsExitCode) {
    auto result = run_command({"false"}, "", 2000ms);
    EXPECT_TRUE(result.started);
    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.exit_code, 0);
}

TEST(SubprocessTest, KillsOnTimeout) {
    const auto start = std::chrono::steady_clock::now();
    auto result = run_command({"sleep", "10"}, "", 100ms);
    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.ok());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
}

TEST(SubprocessTest, MissingProgramDoesNotStart) {
    auto result = run_command({"pnav-no-such-program"}, "", 1000ms);
    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.error_message.empty());
}

} // namespace
} // namespace pnav
