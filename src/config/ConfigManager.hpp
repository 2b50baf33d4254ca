// src/config/ConfigManager.hpp

// ---- ConfigManager Usage ---- //

// The constructor will attempt to load values from a JSON file.
// If no config file is found, it will use the default values.
// Example:
// ConfigManager mgr("/etc/hotspot-bridge/config.json");

// getSettings() returns a copy of the loaded settings.
// Example:
// Settings settings = mgr.getSettings();

// Every key is optional, a missing key is logged and replaced by its default.

#pragma once

#include <string>

struct Settings {
  std::string ssid;
  std::string tunnel_interface;
  std::string nat_table;
  std::string required_table;
  std::string connection_name;

  // prefix firewall commands with sudo
  bool use_sudo;

  // list the table after applying and warn if anything is missing
  bool verify_after_apply;

  struct MacOS {
    std::string airport_tool;
    std::string internet_sharing_plist;

    bool operator==(const MacOS &) const = default;
  } macos;

  bool operator==(const Settings &) const = default;
};

Settings defaultSettings();

class ConfigManager {
public:
  explicit ConfigManager(const std::string &config_file);

  Settings getSettings() const;

private:
  std::string config_file_;
  Settings settings_;

  void loadConfig();
  void loadDefaultConfig();
};
