// src/config/HotspotConfig.hpp

// Built fresh for every "hotspot enable" from the command line and the
// loaded Settings, never written back anywhere.

#pragma once

#include <optional>
#include <string>

struct HotspotConfig {
  std::string ssid;

  // empty optional => prompt on the terminal
  std::optional<std::string> password;

  // empty optional => resolve the first Wi-Fi device
  std::optional<std::string> interface;

  std::string tunnel_interface;
};
