// src/exec/CommandExecutor.hpp

// ---- CommandExecutor Usage ---- //

// Every mutating command goes through run(), every read-only query through
// capture(). The executor is constructed once per invocation with the
// dry-run flag, so no call site has to special-case dry-run itself.

// Example:
// CommandExecutor executor(runner, /*dry_run=*/true);
// executor.run(Command::args({"nmcli", "radio", "wifi", "on"}),
//              Tolerance::BestEffort); // printed, not executed
// auto info = executor.capture(Command::args({"iw", "dev", "wlan0", "info"}));

// Each call site declares its tolerance:
// - Mandatory: a non-zero exit throws CommandError (status FailedFatal)
// - BestEffort: a non-zero exit is logged and returned as FailedTolerated

// In dry-run mode run() returns a synthetic success (exit code 0), so the
// caller takes the same branch it would after a successful real command.

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "Command.hpp"
#include "ProcessRunner.hpp"

enum class Tolerance { Mandatory, BestEffort };

enum class ExecutionStatus { Ok, FailedTolerated, FailedFatal };

struct CommandResult {
  ExecutionStatus status = ExecutionStatus::Ok;
  int exit_code = 0;
  std::string out;
  std::string err;
  bool dry_run = false;

  bool ok() const { return status == ExecutionStatus::Ok; }
};

// thrown by run() for a failed Mandatory command, result().status is
// FailedFatal
class CommandError : public std::runtime_error {
public:
  CommandError(const std::string &command, CommandResult result);

  const CommandResult &result() const { return result_; }
  int exitCode() const { return result_.exit_code; }
  const std::string &stderrText() const { return result_.err; }

private:
  CommandResult result_;
};

class CommandExecutor {
public:
  CommandExecutor(ProcessRunner &runner, bool dry_run);

  CommandResult run(const Command &command, Tolerance tolerance);

  // read-only queries run in dry-run mode too; non-zero exit is not an error
  ProcessResult capture(const Command &command);

  bool dryRun() const { return dry_run_; }
  ProcessRunner &runner() { return runner_; }

  // display strings of the commands skipped because of dry-run
  const std::vector<std::string> &dryRunLog() const { return dry_run_log_; }

private:
  ProcessRunner &runner_;
  bool dry_run_;
  std::vector<std::string> dry_run_log_;
};
