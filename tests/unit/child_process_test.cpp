/**
 * child_process_test.cpp - ChildProcess unit tests
 *
 * Tests:
 * - Spawn with missing executable (error path)
 * - Exit status and signal reporting
 * - Environment overrides and removals reach the child
 * - Killing the process group
 */

#include "exec/child_process.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <cstdlib>
#include <string>
#include <vector>

using namespace envkeeper;
using namespace envkeeper::exec;

namespace {

std::string read_all(int fd) {
    std::string data;
    char buffer[256];
    ssize_t n;
    while ((n = ::read(fd, buffer, sizeof(buffer))) > 0) {
        data.append(buffer, static_cast<size_t>(n));
    }
    return data;
}

}  // namespace

TEST(ChildProcessTest, MissingExecutableFails) {
    ChildProcess child;
    common::Error error;
    Command command(std::vector<std::string>{"/nonexistent_path/fake_executable"});

    EXPECT_FALSE(child.spawn(command, error));
    EXPECT_EQ(error.code, common::ErrorCode::IO);
    EXPECT_NE(error.message.find("failed to execute"), std::string::npos);
    EXPECT_FALSE(child.running());
}

TEST(ChildProcessTest, EmptyCommandIsRejected) {
    ChildProcess child;
    common::Error error;

    EXPECT_FALSE(child.spawn(Command(), error));
    EXPECT_EQ(error.code, common::ErrorCode::CONFIGURATION);
}

TEST(ChildProcessTest, ReportsExitStatusAndOutput) {
    ChildProcess child;
    common::Error error;
    Command command(std::vector<std::string>{"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});

    ASSERT_TRUE(child.spawn(command, error)) << error.message;
    EXPECT_TRUE(child.running());
    EXPECT_EQ(read_all(child.stdout_fd()), "out\n");
    EXPECT_EQ(read_all(child.stderr_fd()), "err\n");

    std::optional<int> exit_code;
    ASSERT_TRUE(child.wait(exit_code, error)) << error.message;
    ASSERT_TRUE(exit_code.has_value());
    EXPECT_EQ(*exit_code, 3);
    EXPECT_FALSE(child.running());
}

TEST(ChildProcessTest, EnvironmentChangesApply) {
    ::setenv("ENVKEEPER_TEST_REMOVED", "present", 1);

    ChildProcess child;
    common::Error error;
    Command command(std::vector<std::string>{
        "/bin/sh", "-c", "echo \"${ENVKEEPER_TEST_SET}:${ENVKEEPER_TEST_REMOVED:-unset}\""});
    command.set_env("ENVKEEPER_TEST_SET", "value");
    command.remove_env("ENVKEEPER_TEST_REMOVED");

    ASSERT_TRUE(child.spawn(command, error)) << error.message;
    EXPECT_EQ(read_all(child.stdout_fd()), "value:unset\n");

    std::optional<int> exit_code;
    ASSERT_TRUE(child.wait(exit_code, error));
    EXPECT_EQ(exit_code.value_or(-1), 0);

    ::unsetenv("ENVKEEPER_TEST_REMOVED");
}

TEST(ChildProcessTest, WorkingDirectoryIsUsed) {
    ChildProcess child;
    common::Error error;
    Command command(std::vector<std::string>{"/bin/pwd"});
    command.working_dir = "/";

    ASSERT_TRUE(child.spawn(command, error)) << error.message;
    EXPECT_EQ(read_all(child.stdout_fd()), "/\n");
    std::optional<int> exit_code;
    ASSERT_TRUE(child.wait(exit_code, error));
}

TEST(ChildProcessTest, KillGroupReportsSignal) {
    ChildProcess child;
    common::Error error;
    Command command(std::vector<std::string>{"/bin/sh", "-c", "sleep 30 & sleep 30"});

    ASSERT_TRUE(child.spawn(command, error)) << error.message;
    child.kill_group();

    std::optional<int> exit_code;
    ASSERT_TRUE(child.wait(exit_code, error)) << error.message;
    EXPECT_FALSE(exit_code.has_value());

    // The backgrounded sleep was in the same group: stdout reaches EOF
    EXPECT_EQ(read_all(child.stdout_fd()), "");
}

TEST(CommandTest, ToStringQuotesArgumentsWithSpaces) {
    Command command(std::vector<std::string>{"echo", "hello world", "say \"hi\" now", "plain"});
    EXPECT_EQ(command.to_string(), "echo \"hello world\" \"say \\\"hi\\\" now\" plain");
}

TEST(CommandTest, SetAndRemoveOverrideEachOther) {
    Command command;
    command.remove_env("FOO");
    command.set_env("FOO", "bar");
    EXPECT_EQ(command.env_remove.count("FOO"), 0u);
    EXPECT_EQ(command.env_set.at("FOO"), "bar");

    command.remove_env("FOO");
    EXPECT_EQ(command.env_set.count("FOO"), 0u);

    bool found = false;
    for (const auto &var : command.build_environment()) {
        if (var.rfind("FOO=", 0) == 0) {
            found = true;
        }
    }
    EXPECT_FALSE(found);
}
