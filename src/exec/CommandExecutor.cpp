// src/exec/CommandExecutor.cpp

#include "CommandExecutor.hpp"

#include <spdlog/spdlog.h>

namespace {

std::string trimmed(const std::string &text) {
  const auto first = text.find_first_not_of(" \n\r\t");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \n\r\t");
  return text.substr(first, last - first + 1);
}

} // namespace

CommandError::CommandError(const std::string &command, CommandResult result)
    : std::runtime_error("Command failed: " + command + " (exit code: " +
                         std::to_string(result.exit_code) + ")"),
      result_(std::move(result)) {}

CommandExecutor::CommandExecutor(ProcessRunner &runner, bool dry_run)
    : runner_(runner), dry_run_(dry_run) {}

CommandResult CommandExecutor::run(const Command &command,
                                   Tolerance tolerance) {
  const std::string display = command.toDisplayString();

  if (dry_run_) {
    spdlog::info("→ {}", display);
    dry_run_log_.push_back(display);

    CommandResult result;
    result.dry_run = true;
    return result;
  }

  spdlog::debug("Executing: {}", display);
  ProcessResult process = runner_.execute(command);

  CommandResult result;
  result.exit_code = process.exit_code;
  result.out = std::move(process.out);
  result.err = std::move(process.err);

  if (result.exit_code == 0) {
    return result;
  }

  if (tolerance == Tolerance::BestEffort) {
    spdlog::warn("Command failed (tolerated): {} (exit code: {}) {}", display,
                 result.exit_code, trimmed(result.err));
    result.status = ExecutionStatus::FailedTolerated;
    return result;
  }

  spdlog::error("Command failed: {} (exit code: {}) {}", display,
                result.exit_code, trimmed(result.err));
  result.status = ExecutionStatus::FailedFatal;
  throw CommandError(display, std::move(result));
}

ProcessResult CommandExecutor::capture(const Command &command) {
  spdlog::debug("Querying: {}", command.toDisplayString());
  ProcessResult result = runner_.execute(command);
  if (!result.succeeded()) {
    spdlog::debug("Query exited with code {}", result.exit_code);
  }
  return result;
}
