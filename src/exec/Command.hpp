// src/exec/Command.hpp

// ---- Command Usage ---- //

// A Command is either an argument vector (executed directly) or a single
// script string (executed through /bin/sh -c). Use the shell form only when
// the command needs redirection or "||".

// Example:
// Command probe = Command::args({"iw", "dev", "wlan0", "info"});
// Command drop = Command::shell("sudo nft delete table ip t 2>/dev/null || true");

// Secrets are replaced by "********" in toDisplayString(), which is what gets
// printed in dry-run mode and written to the logs:
// - argument vector: redactArg(index) masks that one argument
// - script: redact(secret) masks every occurrence of the value

#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <vector>

// POSIX shell quoting, safe to paste into a /bin/sh command line
std::string shellQuote(const std::string &value);

class Command {
public:
  static Command args(std::vector<std::string> argv);
  static Command shell(std::string script);

  Command &redactArg(std::size_t index);
  Command &redact(const std::string &secret);

  bool usesShell() const { return use_shell_; }
  const std::vector<std::string> &argv() const { return argv_; }
  const std::string &script() const { return script_; }

  // the exact command line, secrets included
  std::string toString() const;

  // the command line with redacted values masked
  std::string toDisplayString() const;

private:
  Command() = default;

  std::vector<std::string> argv_;
  std::string script_;
  bool use_shell_ = false;
  std::set<std::size_t> redacted_args_;
  std::vector<std::string> redacted_;
};
