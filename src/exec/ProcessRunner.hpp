// src/exec/ProcessRunner.hpp

// ---- ProcessRunner Usage ---- //

// ProcessRunner is the only place that touches the live system. Everything
// above it (resolver, precondition checks, access point, firewall) talks to
// the OS through this interface, so tests can swap in a scripted fake.

// SystemProcessRunner forks and execs the command, collecting stdout and
// stderr through pipes. It blocks until the child exits; there is no timeout.

#pragma once

#include <string>

#include "Command.hpp"

struct ProcessResult {
  int exit_code = 0;
  std::string out;
  std::string err;

  bool succeeded() const { return exit_code == 0; }
};

class ProcessRunner {
public:
  virtual ~ProcessRunner() = default;

  virtual ProcessResult execute(const Command &command) = 0;

  // true if an executable with this name is found on PATH
  virtual bool commandExists(const std::string &name) const = 0;

  virtual bool pathExists(const std::string &path) const = 0;
};

class SystemProcessRunner : public ProcessRunner {
public:
  ProcessResult execute(const Command &command) override;
  bool commandExists(const std::string &name) const override;
  bool pathExists(const std::string &path) const override;
};
