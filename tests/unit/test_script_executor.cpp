#include <gtest/gtest.h>
#include "fsgate/script_executor.hpp"
#include "fsgate/error.hpp"
#include "test_fixtures.hpp"
#include <chrono>

using namespace fsgate;
using fsgate::testing::TempDir;

namespace {

ScriptConfig enabled_config(std::vector<std::string> allowed, std::vector<std::string> blocked = {}) {
    ScriptConfig cfg;
    cfg.enabled = true;
    cfg.allowed_patterns = std::move(allowed);
    cfg.blocked_patterns = std::move(blocked);
    cfg.timeout_seconds = 5;
    return cfg;
}

} // namespace

TEST(ScriptExecutor, DisabledThrows) {
    TempDir dir;
    ProcessScriptExecutor exec(ScriptConfig{});
    EXPECT_FALSE(exec.enabled());
    EXPECT_THROW(exec.execute("echo hi", dir.path()), SecurityError);
}

TEST(ScriptExecutor, CommandLinesSkipBlanksAndComments) {
    auto lines = ProcessScriptExecutor::command_lines("# header\n\n  echo one  \r\n\t# note\necho two");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "echo one");
    EXPECT_EQ(lines[1], "echo two");
}

TEST(ScriptExecutor, Validate) {
    ProcessScriptExecutor exec(enabled_config({".*"}));
    EXPECT_FALSE(exec.validate("echo ok").has_value());
    EXPECT_TRUE(exec.validate("").has_value());
    EXPECT_TRUE(exec.validate("# only a comment").has_value());
    EXPECT_TRUE(exec.validate("cat /etc/passwd").has_value());
    EXPECT_TRUE(exec.validate("/usr/bin/env ls").has_value());
    EXPECT_TRUE(exec.validate(std::string(ProcessScriptExecutor::MAX_SCRIPT_LENGTH + 1, 'x')).has_value());
}

TEST(ScriptExecutor, AllowListIsFullMatchAndBlockedWins) {
    ProcessScriptExecutor exec(enabled_config({"echo .*", "ls( .*)?"}, {".*rm -rf.*"}));
    EXPECT_TRUE(exec.is_command_allowed("echo hello"));
    EXPECT_TRUE(exec.is_command_allowed("ls"));
    EXPECT_FALSE(exec.is_command_allowed("xecho hello"));
    EXPECT_FALSE(exec.is_command_allowed("echo x; rm -rf /"));
    EXPECT_FALSE(exec.is_command_allowed("cat file"));
}

TEST(ScriptExecutor, EmptyAllowListAllowsNothing) {
    ProcessScriptExecutor exec(enabled_config({}));
    EXPECT_FALSE(exec.is_command_allowed("echo hi"));
}

TEST(ScriptExecutor, RunsAllowedCommandsInWorkingDirectory) {
    TempDir dir;
    dir.write("marker.txt", "");
    ProcessScriptExecutor exec(enabled_config({"echo .*", "ls"}));

    auto result = exec.execute("echo first\nls", dir.path());
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.working_dir, dir.path());
    ASSERT_EQ(result.output.size(), 2u);
    EXPECT_EQ(result.output[0], "first");
    EXPECT_EQ(result.output[1], "marker.txt");

    nlohmann::json j = result;
    EXPECT_EQ(j["exitCode"], 0);
    EXPECT_TRUE(j.contains("durationMs"));
    EXPECT_FALSE(j.contains("error"));
}

TEST(ScriptExecutor, RejectedCommandStopsScript) {
    TempDir dir;
    ProcessScriptExecutor exec(enabled_config({"echo .*"}));
    auto result = exec.execute("echo before\ntouch created.txt\necho after", dir.path());
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("touch created.txt"), std::string::npos);
    EXPECT_EQ(result.output, std::vector<std::string>{"before"});
    EXPECT_FALSE(std::filesystem::exists(dir.path("created.txt")));
}

TEST(ScriptExecutor, FailingCommandReportsExitCode) {
    TempDir dir;
    ProcessScriptExecutor exec(enabled_config({"false", "echo .*"}));
    auto result = exec.execute("false\necho never", dir.path());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.output.empty());
}

TEST(ScriptExecutor, DangerousPathReportedNotThrown) {
    TempDir dir;
    ProcessScriptExecutor exec(enabled_config({".*"}));
    auto result = exec.execute("cat /etc/shadow", dir.path());
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("/etc/shadow"), std::string::npos);
}

TEST(ScriptExecutor, Timeout) {
    TempDir dir;
    auto cfg = enabled_config({"sleep .*"});
    cfg.timeout_seconds = 1;
    ProcessScriptExecutor exec(cfg);

    auto result = exec.execute("sleep 10", dir.path());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("timed out"), std::string::npos);
    EXPECT_LT(result.duration_ms, 5000);
}

TEST(ScriptExecutor, TimeoutAfterOutputClosed) {
    TempDir dir;
    auto cfg = enabled_config({".*"});
    cfg.timeout_seconds = 1;
    ProcessScriptExecutor exec(cfg);

    auto started = std::chrono::steady_clock::now();
    auto result = exec.execute("exec >/dev/null 2>&1; sleep 30", dir.path());
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.exit_code, -1);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("timed out"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(ScriptExecutor, OutputIsCapped) {
    TempDir dir;
    ProcessScriptExecutor exec(enabled_config({"head .*"}));

    auto result = exec.execute("head -c 3000000 /dev/zero", dir.path());
    EXPECT_TRUE(result.success);
    std::size_t total = 0;
    for (const auto& line : result.output) total += line.size();
    EXPECT_LE(total, ProcessScriptExecutor::MAX_OUTPUT_BYTES + 100);
    ASSERT_FALSE(result.output.empty());
    EXPECT_NE(result.output.back().find("output truncated"), std::string::npos);
}

TEST(ScriptExecutor, OverlongCommandLineRejected) {
    TempDir dir;
    ProcessScriptExecutor exec(enabled_config({"echo .*"}));
    std::string command = "echo token=" + std::string(90000, 'x');

    EXPECT_FALSE(exec.is_command_allowed(command));
    EXPECT_TRUE(exec.validate(command).has_value());

    auto result = exec.execute(command, dir.path());
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->find("too long"), std::string::npos);
}
