// src/hotspot/PasswordPrompt.hpp

// ---- Password handling ---- //

// validatePassword() is the pure rule (at least MIN_PASSWORD_LENGTH chars).
// obtainPassword() decides where the password comes from:
// - supplied on the command line: validated once, too short => throws
//   HotspotError(PasswordTooShort), no prompt
// - not supplied: the prompt is shown again until the rule is met

// Example:
// TerminalPasswordPrompt prompt;
// std::string pw = obtainPassword(config.password, prompt);

#pragma once

#include <optional>
#include <string>

bool validatePassword(const std::string &password);

class PasswordPrompt {
public:
  virtual ~PasswordPrompt() = default;

  // false => nobody can answer, obtainPassword() fails instead of asking
  virtual bool interactive() const = 0;

  // nullopt on end of input
  virtual std::optional<std::string> read(const std::string &prompt) = 0;

  // shown after an invalid entry
  virtual void reject(const std::string &message) = 0;
};

// hidden input on the controlling terminal (getpass)
class TerminalPasswordPrompt : public PasswordPrompt {
public:
  bool interactive() const override;
  std::optional<std::string> read(const std::string &prompt) override;
  void reject(const std::string &message) override;
};

std::string obtainPassword(const std::optional<std::string> &supplied,
                           PasswordPrompt &prompt);

// throws PasswordTooShort for a supplied password that breaks the rule,
// so the caller can fail before running any command
void checkSuppliedPassword(const std::optional<std::string> &supplied);
