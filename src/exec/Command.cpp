// src/exec/Command.cpp

#include "Command.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

constexpr const char *MASK = "********";

bool isShellSafe(const char c) {
  if (std::isalnum(static_cast<unsigned char>(c))) {
    return true;
  }
  switch (c) {
  case '@':
  case '%':
  case '+':
  case '=':
  case ':':
  case ',':
  case '.':
  case '/':
  case '_':
  case '-':
    return true;
  default:
    return false;
  }
}

void replaceAll(std::string &text, const std::string &from,
                const std::string &to) {
  if (from.empty()) {
    return;
  }
  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

} // namespace

std::string shellQuote(const std::string &value) {
  if (value.empty()) {
    return "''";
  }
  if (std::all_of(value.begin(), value.end(), isShellSafe)) {
    return value;
  }

  // close the quote, emit a double-quoted ', reopen
  std::string quoted = "'";
  for (const char c : value) {
    if (c == '\'') {
      quoted += "'\"'\"'";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

Command Command::args(std::vector<std::string> argv) {
  Command command;
  command.argv_ = std::move(argv);
  return command;
}

Command Command::shell(std::string script) {
  Command command;
  command.script_ = std::move(script);
  command.use_shell_ = true;
  return command;
}

Command &Command::redactArg(std::size_t index) {
  if (use_shell_ || index >= argv_.size()) {
    throw std::out_of_range("redactArg: no argument " + std::to_string(index));
  }
  redacted_args_.insert(index);
  return *this;
}

Command &Command::redact(const std::string &secret) {
  if (!secret.empty()) {
    redacted_.push_back(secret);
  }
  return *this;
}

std::string Command::toString() const {
  if (use_shell_) {
    return script_;
  }

  std::string line;
  for (const auto &arg : argv_) {
    if (!line.empty()) {
      line += ' ';
    }
    line += shellQuote(arg);
  }
  return line;
}

std::string Command::toDisplayString() const {
  if (!use_shell_) {
    std::string line;
    for (std::size_t idx = 0; idx < argv_.size(); ++idx) {
      if (idx > 0) {
        line += ' ';
      }
      line += redacted_args_.count(idx) > 0 ? MASK : shellQuote(argv_[idx]);
    }
    return line;
  }

  std::string line = script_;
  for (const auto &secret : redacted_) {
    replaceAll(line, shellQuote(secret), MASK);
    replaceAll(line, secret, MASK);
  }
  return line;
}
