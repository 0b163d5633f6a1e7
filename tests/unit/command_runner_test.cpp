#include "agent/command_runner.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <stdexcept>

using namespace hostlink;
using namespace hostlink::agent;
using namespace std::chrono_literals;

namespace {
runtime::ExecConfig test_config() {
    runtime::ExecConfig config;
    config.shell = "/bin/sh";
    config.default_timeout_ms = 10000;
    config.max_output_bytes = 1024 * 1024;
    return config;
}
}  // namespace

TEST(CommandRunnerTest, ExitCodeWithoutOutput) {
    CommandRunner runner(test_config());
    auto result = runner.run("exit 7", std::nullopt, std::nullopt);
    EXPECT_EQ(result.exit_code, 7);
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_EQ(result.stderr_text, "");
    EXPECT_FALSE(result.timed_out);

    auto json = result.to_json();
    EXPECT_EQ(json["exitCode"], 7);
    EXPECT_EQ(json["stdout"], "");
    EXPECT_FALSE(json.contains("timedOut"));
}

TEST(CommandRunnerTest, CapturesBothStreams) {
    CommandRunner runner(test_config());
    auto result = runner.run("echo out; echo err 1>&2", std::nullopt, std::nullopt);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "out\n");
    EXPECT_EQ(result.stderr_text, "err\n");
}

TEST(CommandRunnerTest, RunsInWorkingDirectory) {
    CommandRunner runner(test_config());
    const auto dir = std::filesystem::temp_directory_path();
    auto result = runner.run("pwd", dir.string(), std::nullopt);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(std::filesystem::path(result.stdout_text.substr(0, result.stdout_text.size() - 1)),
              std::filesystem::canonical(dir));
}

TEST(CommandRunnerTest, MissingWorkingDirectoryThrows) {
    CommandRunner runner(test_config());
    EXPECT_THROW(runner.run("true", std::string("/definitely/not/here"), std::nullopt), std::runtime_error);
}

TEST(CommandRunnerTest, StdinIsEmpty) {
    CommandRunner runner(test_config());
    auto result = runner.run("cat", std::nullopt, 5000);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(result.stdout_text, "");
}

TEST(CommandRunnerTest, TimeoutKillsAndKeepsPartialOutput) {
    CommandRunner runner(test_config());
    const auto start = std::chrono::steady_clock::now();
    auto result = runner.run("echo started; sleep 30", std::nullopt, 200);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 5s);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, kExitCodeTimedOut);
    EXPECT_EQ(result.stdout_text, "started\n");
    EXPECT_NE(result.stderr_text.find("timed out after 200ms"), std::string::npos);
    EXPECT_EQ(result.to_json()["timedOut"], true);
}

TEST(CommandRunnerTest, TimeoutAppliesAfterOutputCloses) {
    CommandRunner runner(test_config());
    const auto start = std::chrono::steady_clock::now();
    auto result = runner.run("exec >/dev/null 2>&1; sleep 3", std::nullopt, 200);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 2s);
    EXPECT_TRUE(result.timed_out);
    EXPECT_EQ(result.exit_code, kExitCodeTimedOut);
    EXPECT_TRUE(result.stdout_text.empty());
}

TEST(CommandRunnerTest, SignalExitCode) {
    CommandRunner runner(test_config());
    auto result = runner.run("kill -9 $$", std::nullopt, std::nullopt);
    EXPECT_EQ(result.exit_code, 128 + 9);
}

TEST(CommandRunnerTest, OutputIsTruncatedAtLimit) {
    runtime::ExecConfig config = test_config();
    config.max_output_bytes = 16;
    CommandRunner runner(config);

    auto result = runner.run("printf '0123456789abcdefghijklmnop'", std::nullopt, std::nullopt);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_text, "0123456789abcdef");
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.to_json()["truncated"], true);
}

TEST(CommandRunnerTest, UnknownShellReports127) {
    runtime::ExecConfig config = test_config();
    config.shell = "/no/such/shell";
    CommandRunner runner(config);
    EXPECT_EQ(runner.run("true", std::nullopt, std::nullopt).exit_code, 127);
}
