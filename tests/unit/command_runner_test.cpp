/**
 * command_runner_test.cpp - supervised command execution
 *
 * Tests:
 * - Idle timeout kills a silent command, output keeps a slow one alive
 * - Progress lines are cleaned and empty lines skipped
 * - Failed commands keep their log, successful ones do not
 * - Output capture and stream tagging
 * - The askpass relay environment reaches the child
 */

#include "exec/command_runner.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

#include "mocks/mock_progress_handler.hpp"

using namespace envkeeper;
using namespace envkeeper::exec;
using envkeeper::tests::MockProgressHandler;
using ::testing::_;
using ::testing::NiceMock;

namespace {

Command shell(const std::string &script) { return Command(std::vector<std::string>{"/bin/sh", "-c", script}); }

std::vector<std::string> split_lines(const std::string &text) {
    std::vector<std::string> lines;
    std::stringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

TEST(StripControlCharactersTest, RemovesCursorMovementAndCarriageReturns) {
    EXPECT_EQ(strip_control_characters("plain"), "plain");
    EXPECT_EQ(strip_control_characters("\x1B[2Kdownloading\r"), "downloading");
    EXPECT_EQ(strip_control_characters("a\x1B[1Ab\x1B[10;3Bc\x1B[Cd\x1B[De"), "abcde");
    // Colors are not cursor movement
    EXPECT_EQ(strip_control_characters("\x1B[31mred\x1B[0m"), "\x1B[31mred\x1B[0m");
}

TEST(CommandRunnerTest, IdleTimeoutKillsSilentCommand) {
    RunConfig config;
    config.with_timeout(std::chrono::seconds(1));

    auto start = std::chrono::steady_clock::now();
    common::Error error;
    bool ok = run_command_with_handler(
        Command(std::vector<std::string>{"sleep", "30"}), [](StreamKind, const std::string &) {}, config, error);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(ok);
    EXPECT_EQ(error.code, common::ErrorCode::TIMEOUT);
    EXPECT_EQ(error.command, "sleep 30");
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(CommandRunnerTest, OutputJustUnderTimeoutNeverTimesOut) {
    RunConfig config;
    config.with_timeout(std::chrono::seconds(2));

    std::vector<std::string> lines;
    common::Error error;
    bool ok = run_command_with_handler(
        shell("for i in 1 2 3 4; do echo tick $i; sleep 1; done"),
        [&lines](StreamKind kind, const std::string &line) {
            EXPECT_EQ(kind, StreamKind::STDOUT);
            lines.push_back(line);
        },
        config, error);

    ASSERT_TRUE(ok) << error.to_string();
    EXPECT_EQ(lines, std::vector<std::string>({"tick 1", "tick 2", "tick 3", "tick 4"}));
}

TEST(CommandRunnerTest, HandlerSeesBothStreams) {
    std::vector<std::pair<StreamKind, std::string>> seen;
    common::Error error;
    ASSERT_TRUE(run_command_with_handler(
        shell("echo to-out; echo to-err >&2; printf 'no newline'"),
        [&seen](StreamKind kind, const std::string &line) { seen.emplace_back(kind, line); }, RunConfig(), error))
        << error.to_string();

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_THAT(seen, ::testing::UnorderedElementsAre(std::make_pair(StreamKind::STDOUT, std::string("to-out")),
                                                      std::make_pair(StreamKind::STDERR, std::string("to-err")),
                                                      std::make_pair(StreamKind::STDOUT, std::string("no newline"))));
}

TEST(CommandRunnerTest, HandlerFailureNamesCommand) {
    common::Error error;
    EXPECT_FALSE(run_command_with_handler(shell("exit 7"), [](StreamKind, const std::string &) {}, RunConfig(),
                                          error));
    EXPECT_EQ(error.code, common::ErrorCode::EXECUTION);
    EXPECT_EQ(error.exit_code, 7);
    EXPECT_NE(error.message.find("/bin/sh -c \"exit 7\""), std::string::npos);
}

TEST(CommandRunnerTest, ProgressLinesAreCleaned) {
    NiceMock<MockProgressHandler> progress;
    {
        ::testing::InSequence seq;
        EXPECT_CALL(progress, progress("first"));
        EXPECT_CALL(progress, progress("onetwo"));
    }
    EXPECT_CALL(progress, progress("")).Times(0);

    common::Error error;
    ASSERT_TRUE(run_progress(shell("echo first; echo; printf 'one\\033[1A\\033[Ktwo\\r\\n'"), progress, RunConfig(),
                             error))
        << error.to_string();
}

TEST(CommandRunnerTest, RawLinesWhenStrippingDisabled) {
    NiceMock<MockProgressHandler> progress;
    EXPECT_CALL(progress, progress("a\x1B[Kb"));

    RunConfig config;
    config.strip_ctrl_chars = false;
    common::Error error;
    ASSERT_TRUE(run_progress(shell("printf 'a\\033[Kb\\n'"), progress, config, error)) << error.to_string();
}

TEST(CommandRunnerTest, FailedCommandKeepsLog) {
    NiceMock<MockProgressHandler> progress;
    EXPECT_CALL(progress, progress("building"));
    EXPECT_CALL(progress, progress("broken"));

    common::Error error;
    EXPECT_FALSE(run_progress(shell("echo building; echo broken >&2; exit 4"), progress, RunConfig(), error));
    EXPECT_EQ(error.code, common::ErrorCode::EXECUTION);
    EXPECT_EQ(error.exit_code, 4);
    EXPECT_FALSE(error.command.empty());
    ASSERT_FALSE(error.log_path.empty());
    EXPECT_NE(error.message.find("process exited with status 4; log is available at " + error.log_path),
              std::string::npos);
    EXPECT_NE(error.log_path.find("envkeeper-exec."), std::string::npos);

    std::ifstream log(error.log_path);
    std::stringstream contents;
    contents << log.rdbuf();
    EXPECT_NE(contents.str().find("building\n"), std::string::npos);
    EXPECT_NE(contents.str().find("broken\n"), std::string::npos);

    std::filesystem::remove(error.log_path);
}

TEST(CommandRunnerTest, SuccessfulCommandRemovesLog) {
    namespace fs = std::filesystem;
    fs::path tmp = fs::temp_directory_path() / ("envkeeper_runner_test_" + std::to_string(::getpid()));
    fs::create_directories(tmp);
    const char *previous = std::getenv("TMPDIR");
    std::string saved = previous != nullptr ? previous : "";
    ::setenv("TMPDIR", tmp.c_str(), 1);

    NiceMock<MockProgressHandler> progress;
    common::Error error;
    EXPECT_TRUE(run_progress(shell("echo ok"), progress, RunConfig(), error)) << error.to_string();
    EXPECT_TRUE(fs::is_empty(tmp));

    if (previous != nullptr) {
        ::setenv("TMPDIR", saved.c_str(), 1);
    } else {
        ::unsetenv("TMPDIR");
    }
    fs::remove_all(tmp);
}

TEST(CommandRunnerTest, SignalReportsSpecialStatus) {
    NiceMock<MockProgressHandler> progress;
    common::Error error;
    EXPECT_FALSE(run_progress(shell("kill -9 $$"), progress, RunConfig(), error));
    EXPECT_EQ(error.code, common::ErrorCode::EXECUTION);
    EXPECT_EQ(error.exit_code, kSignalExitStatus);
    if (!error.log_path.empty()) {
        std::filesystem::remove(error.log_path);
    }
}

TEST(CommandRunnerTest, SpawnFailureIsReported) {
    NiceMock<MockProgressHandler> progress;
    common::Error error;
    EXPECT_FALSE(run_progress(Command(std::vector<std::string>{"/nonexistent_path/tool"}), progress, RunConfig(),
                              error));
    EXPECT_EQ(error.code, common::ErrorCode::IO);
    EXPECT_TRUE(error.log_path.empty());
}

TEST(CommandRunnerTest, GetCommandOutputCapturesEverything) {
    CommandOutput output;
    common::Error error;
    ASSERT_TRUE(get_command_output(shell("printf 'a\\nb'; printf 'warn' >&2; exit 2"), RunConfig(), output, error))
        << error.to_string();
    EXPECT_EQ(output.stdout_data, "a\nb");
    EXPECT_EQ(output.stderr_data, "warn");
    EXPECT_EQ(output.exit_code, 2);
}

class CommandRunnerAskPassTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char *name : {"SUDO_ASKPASS", "SSH_ASKPASS"}) {
            const char *value = std::getenv(name);
            if (value != nullptr) {
                saved_.emplace_back(name, value);
            }
            ::unsetenv(name);
        }
    }

    void TearDown() override {
        for (const auto &entry : saved_) {
            ::setenv(entry.first.c_str(), entry.second.c_str(), 1);
        }
    }

    std::vector<std::pair<std::string, std::string>> saved_;
};

TEST_F(CommandRunnerAskPassTest, RelayEnvironmentReachesChild) {
    RunConfig config;
    config.with_askpass();
    config.askpass_prompter = [](const std::string &, std::string &answer, std::string &) {
        answer = "unused";
        return true;
    };

    Command command = shell("echo \"$SUDO_ASKPASS\"; echo \"$SSH_ASKPASS\"; echo \"$SSH_ASKPASS_REQUIRE\"; "
                            "echo \"${DISPLAY:-nodisplay}\"; test -x \"$SUDO_ASKPASS\" && echo executable");
    command.set_env("DISPLAY", ":0");

    CommandOutput output;
    common::Error error;
    ASSERT_TRUE(get_command_output(command, config, output, error)) << error.to_string();

    auto lines = split_lines(output.stdout_data);
    ASSERT_EQ(lines.size(), 5u) << output.stdout_data;
    EXPECT_NE(lines[0].find("sudo-askpass.sh"), std::string::npos);
    EXPECT_NE(lines[1].find("ssh-askpass.sh"), std::string::npos);
    EXPECT_EQ(lines[2], "force");
    EXPECT_EQ(lines[3], "nodisplay");
    EXPECT_EQ(lines[4], "executable");

    // Scripts and socket are gone once the command finished
    EXPECT_FALSE(std::filesystem::exists(lines[0]));
}

TEST_F(CommandRunnerAskPassTest, DisabledRelayLeavesEnvironmentAlone) {
    RunConfig config;
    config.with_askpass();
    config.askpass_options.enabled = false;

    CommandOutput output;
    common::Error error;
    ASSERT_TRUE(get_command_output(shell("echo \"${SUDO_ASKPASS:-none}\""), config, output, error));
    EXPECT_EQ(output.stdout_data, "none\n");
}

TEST_F(CommandRunnerAskPassTest, ExistingAskPassIsKept) {
    ::setenv("SUDO_ASKPASS", "/usr/bin/my-askpass", 1);

    RunConfig config;
    config.with_askpass();
    CommandOutput output;
    common::Error error;
    ASSERT_TRUE(get_command_output(shell("echo \"$SUDO_ASKPASS\"; echo \"${SSH_ASKPASS:-none}\""), config, output,
                                   error));

    auto lines = split_lines(output.stdout_data);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "/usr/bin/my-askpass");
    EXPECT_NE(lines[1].find("ssh-askpass.sh"), std::string::npos);

    ::unsetenv("SUDO_ASKPASS");
}
