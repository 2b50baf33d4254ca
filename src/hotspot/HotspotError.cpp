// src/hotspot/HotspotError.cpp

#include "HotspotError.hpp"

const char *toString(HotspotErrc code) {
  switch (code) {
  case HotspotErrc::UnsupportedPlatform:
    return "UnsupportedPlatform";
  case HotspotErrc::MissingTool:
    return "MissingTool";
  case HotspotErrc::MissingFirewallTable:
    return "MissingFirewallTable";
  case HotspotErrc::InterfaceNotFound:
    return "InterfaceNotFound";
  case HotspotErrc::NoWifiInterface:
    return "NoWifiInterface";
  case HotspotErrc::InvalidInterfaceName:
    return "InvalidInterfaceName";
  case HotspotErrc::PasswordTooShort:
    return "PasswordTooShort";
  case HotspotErrc::HotspotCreationFailed:
    return "HotspotCreationFailed";
  case HotspotErrc::CommandFailed:
    return "CommandFailed";
  }
  return "Unknown";
}

HotspotError::HotspotError(HotspotErrc code, const std::string &message,
                           std::string hint)
    : std::runtime_error(message), code_(code), hint_(std::move(hint)) {}
