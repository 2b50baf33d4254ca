// src/hotspot/PasswordPrompt.cpp

#include "PasswordPrompt.hpp"
#include "HotspotError.hpp"
#include "configs.hpp"

#include <iostream>

#include <unistd.h> // getpass, isatty

namespace {

const std::string TOO_SHORT_MESSAGE = "Password must be at least " +
                                      std::to_string(MIN_PASSWORD_LENGTH) +
                                      " characters.";

} // namespace

bool validatePassword(const std::string &password) {
  return password.size() >= MIN_PASSWORD_LENGTH;
}

bool TerminalPasswordPrompt::interactive() const {
  return isatty(STDIN_FILENO) == 1;
}

std::optional<std::string>
TerminalPasswordPrompt::read(const std::string &prompt) {
  const char *entered = getpass(prompt.c_str());
  if (entered == nullptr) {
    return std::nullopt;
  }
  return std::string(entered);
}

void TerminalPasswordPrompt::reject(const std::string &message) {
  std::cerr << message << "\n";
}

void checkSuppliedPassword(const std::optional<std::string> &supplied) {
  if (supplied && !validatePassword(*supplied)) {
    throw HotspotError(HotspotErrc::PasswordTooShort, TOO_SHORT_MESSAGE);
  }
}

std::string obtainPassword(const std::optional<std::string> &supplied,
                           PasswordPrompt &prompt) {
  if (supplied) {
    checkSuppliedPassword(supplied);
    return *supplied;
  }

  if (!prompt.interactive()) {
    throw HotspotError(HotspotErrc::PasswordTooShort,
                       "No password given and no terminal to ask for one. " +
                           TOO_SHORT_MESSAGE,
                       "   Pass --password with at least " +
                           std::to_string(MIN_PASSWORD_LENGTH) +
                           " characters.");
  }

  const std::string question = "\nEnter hotspot password (min " +
                               std::to_string(MIN_PASSWORD_LENGTH) +
                               " chars): ";
  while (true) {
    const auto entered = prompt.read(question);
    if (!entered) {
      throw HotspotError(HotspotErrc::PasswordTooShort,
                         "Password prompt closed. " + TOO_SHORT_MESSAGE);
    }
    if (validatePassword(*entered)) {
      return *entered;
    }
    prompt.reject(TOO_SHORT_MESSAGE);
  }
}
