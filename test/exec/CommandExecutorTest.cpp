#include "CommandExecutor.hpp"
#include "ProcessRunner.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;

class MockProcessRunner : public ProcessRunner {
public:
  MOCK_METHOD(ProcessResult, execute, (const Command &command), (override));
  MOCK_METHOD(bool, commandExists, (const std::string &name),
              (const, override));
  MOCK_METHOD(bool, pathExists, (const std::string &path), (const, override));
};

TEST(CommandExecutorTests, DryRunNeverExecutes) {
  MockProcessRunner runner;
  EXPECT_CALL(runner, execute(_)).Times(0);

  CommandExecutor executor(runner, true);
  const CommandResult result = executor.run(
      Command::args({"nmcli", "radio", "wifi", "on"}), Tolerance::Mandatory);

  EXPECT_TRUE(result.ok());
  EXPECT_TRUE(result.dry_run);
  EXPECT_EQ(result.exit_code, 0);
  EXPECT_THAT(executor.dryRunLog(), ElementsAre("nmcli radio wifi on"));
}

TEST(CommandExecutorTests, DryRunLogMasksSecrets) {
  MockProcessRunner runner;
  EXPECT_CALL(runner, execute(_)).Times(0);

  CommandExecutor executor(runner, true);
  Command create = Command::args({"airport", "--create", "net", "hunter22"});
  create.redactArg(3);
  executor.run(create, Tolerance::BestEffort);

  EXPECT_THAT(executor.dryRunLog(),
              ElementsAre("airport --create net ********"));
}

TEST(CommandExecutorTests, CaptureRunsEvenInDryRun) {
  MockProcessRunner runner;
  EXPECT_CALL(runner, execute(_))
      .WillOnce(Return(ProcessResult{0, "type AP\n", ""}));

  CommandExecutor executor(runner, true);
  const ProcessResult result =
      executor.capture(Command::args({"iw", "dev", "wlan0", "info"}));

  EXPECT_EQ(result.out, "type AP\n");
  EXPECT_TRUE(executor.dryRunLog().empty());
}

TEST(CommandExecutorTests, CaptureReturnsNonZeroExitWithoutThrowing) {
  MockProcessRunner runner;
  EXPECT_CALL(runner, execute(_))
      .WillOnce(Return(ProcessResult{1, "", "no such table"}));

  CommandExecutor executor(runner, false);
  ProcessResult result;
  EXPECT_NO_THROW(result = executor.capture(Command::args({"nft", "list"})));
  EXPECT_FALSE(result.succeeded());
}

TEST(CommandExecutorTests, BestEffortFailureIsTolerated) {
  MockProcessRunner runner;
  EXPECT_CALL(runner, execute(_))
      .WillOnce(Return(ProcessResult{10, "", "not found"}));

  CommandExecutor executor(runner, false);
  const CommandResult result =
      executor.run(Command::args({"nmcli", "connection", "down", "Hotspot"}),
                   Tolerance::BestEffort);

  EXPECT_EQ(result.status, ExecutionStatus::FailedTolerated);
  EXPECT_EQ(result.exit_code, 10);
  EXPECT_EQ(result.err, "not found");
}

TEST(CommandExecutorTests, MandatoryFailureThrowsCommandError) {
  MockProcessRunner runner;
  EXPECT_CALL(runner, execute(_))
      .WillOnce(Return(ProcessResult{4, "", "AP mode not supported"}));

  CommandExecutor executor(runner, false);
  try {
    executor.run(Command::args({"nmcli", "dev", "wifi", "hotspot"}),
                 Tolerance::Mandatory);
    FAIL() << "expected CommandError";
  } catch (const CommandError &error) {
    EXPECT_EQ(error.exitCode(), 4);
    EXPECT_EQ(error.stderrText(), "AP mode not supported");
    EXPECT_EQ(error.result().status, ExecutionStatus::FailedFatal);
    EXPECT_FALSE(error.result().ok());
  }
}

TEST(CommandExecutorTests, SuccessIsOk) {
  MockProcessRunner runner;
  EXPECT_CALL(runner, execute(_))
      .WillOnce(Return(ProcessResult{0, "done\n", ""}));

  CommandExecutor executor(runner, false);
  const CommandResult result =
      executor.run(Command::args({"true"}), Tolerance::Mandatory);
  EXPECT_TRUE(result.ok());
  EXPECT_FALSE(result.dry_run);
  EXPECT_EQ(result.out, "done\n");
}

// ---- SystemProcessRunner, against the real /bin/sh ---- //

TEST(SystemProcessRunnerTests, CapturesStdoutStderrAndExitCode) {
  SystemProcessRunner runner;
  const ProcessResult result = runner.execute(
      Command::args({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}));

  EXPECT_EQ(result.exit_code, 3);
  EXPECT_EQ(result.out, "out\n");
  EXPECT_EQ(result.err, "err\n");
}

TEST(SystemProcessRunnerTests, ShellFormSupportsOrTrue) {
  SystemProcessRunner runner;
  const ProcessResult result =
      runner.execute(Command::shell("false 2>/dev/null || true"));
  EXPECT_EQ(result.exit_code, 0);
}

TEST(SystemProcessRunnerTests, QuotedArgumentsArriveIntact) {
  SystemProcessRunner runner;
  const ProcessResult result = runner.execute(
      Command::args({"/bin/sh", "-c", "printf '%s' \"$1\"", "sh", "a b;c"}));
  EXPECT_EQ(result.out, "a b;c");
}

TEST(SystemProcessRunnerTests, MissingProgramExitsWith127) {
  SystemProcessRunner runner;
  const ProcessResult result =
      runner.execute(Command::args({"definitely-not-a-real-command-4242"}));
  EXPECT_EQ(result.exit_code, 127);
  EXPECT_FALSE(result.err.empty());
}

TEST(SystemProcessRunnerTests, CommandExistsSearchesPath) {
  SystemProcessRunner runner;
  EXPECT_TRUE(runner.commandExists("sh"));
  EXPECT_FALSE(runner.commandExists("definitely-not-a-real-command-4242"));
}

TEST(SystemProcessRunnerTests, PathExists) {
  SystemProcessRunner runner;
  EXPECT_TRUE(runner.pathExists("/"));
  EXPECT_FALSE(runner.pathExists("/definitely/not/here"));
}
