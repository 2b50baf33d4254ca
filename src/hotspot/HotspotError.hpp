// src/hotspot/HotspotError.hpp

#pragma once

#include <stdexcept>
#include <string>

enum class HotspotErrc {
  UnsupportedPlatform,
  MissingTool,
  MissingFirewallTable,
  InterfaceNotFound,
  NoWifiInterface,
  InvalidInterfaceName,
  PasswordTooShort,
  HotspotCreationFailed,
  CommandFailed,
};

const char *toString(HotspotErrc code);

// Fatal errors of the hotspot subcommands. The hint, when present, tells the
// operator how to fix the problem (install command, GUI setting, ...).
class HotspotError : public std::runtime_error {
public:
  HotspotError(HotspotErrc code, const std::string &message,
               std::string hint = "");

  HotspotErrc code() const { return code_; }
  const std::string &hint() const { return hint_; }

private:
  HotspotErrc code_;
  std::string hint_;
};
