// src/config/ConfigManager.cpp

#include "ConfigManager.hpp"
#include "configs.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Anonymous namespace (to avoid cluttering global namespace)
namespace {
namespace nm = nlohmann;

// Helper functions
std::string getStringWithLog(const nm::json &j, const std::string &key,
                             const std::string &defaultValue);
bool getBoolWithLog(const nm::json &j, const std::string &key,
                    const bool defaultValue);
void loadMacOSSection(const nm::json &j, Settings::MacOS &target,
                      const Settings::MacOS &defaults);
} // namespace

Settings defaultSettings() {
  Settings settings;
  settings.ssid = DEFAULT_SSID;
  settings.tunnel_interface = DEFAULT_TUNNEL_INTERFACE;
  settings.nat_table = DEFAULT_NAT_TABLE;
  settings.required_table = DEFAULT_REQUIRED_TABLE;
  settings.connection_name = DEFAULT_CONNECTION_NAME;
  settings.use_sudo = true;
  settings.verify_after_apply = false;
  settings.macos.airport_tool = DEFAULT_AIRPORT_TOOL;
  settings.macos.internet_sharing_plist = DEFAULT_INTERNET_SHARING_PLIST;
  return settings;
}

ConfigManager::ConfigManager(const std::string &config_file)
    : config_file_(config_file) {
  try {
    loadConfig();
  } catch (const std::exception &error) {
    spdlog::debug("No configuration loaded: {}. Using default configuration.",
                  error.what());
    loadDefaultConfig();
  }
}

Settings ConfigManager::getSettings() const { return settings_; }

void ConfigManager::loadConfig() {
  std::ifstream infile(config_file_);
  if (!infile) {
    std::error_code ec;
    if (std::filesystem::exists(config_file_, ec)) {
      spdlog::warn("Config file {} exists but cannot be read. Using default "
                   "configuration.",
                   config_file_);
    }
    throw std::runtime_error("Error opening config file: " + config_file_);
  }

  try {
    nm::json j;
    infile >> j;
    if (!j.is_object()) {
      throw std::runtime_error("top-level value is not an object");
    }

    const Settings defaults = defaultSettings();
    Settings loaded;
    loaded.ssid = getStringWithLog(j, "ssid", defaults.ssid);
    loaded.tunnel_interface =
        getStringWithLog(j, "tunnel_interface", defaults.tunnel_interface);
    loaded.nat_table = getStringWithLog(j, "nat_table", defaults.nat_table);
    loaded.required_table =
        getStringWithLog(j, "required_table", defaults.required_table);
    loaded.connection_name =
        getStringWithLog(j, "connection_name", defaults.connection_name);
    loaded.use_sudo = getBoolWithLog(j, "use_sudo", defaults.use_sudo);
    loaded.verify_after_apply =
        getBoolWithLog(j, "verify_after_apply", defaults.verify_after_apply);
    loadMacOSSection(j, loaded.macos, defaults.macos);

    // only replace the settings once the whole file parsed
    settings_ = loaded;
  } catch (const std::exception &error) {
    spdlog::warn("Error parsing config file {}: {}.", config_file_,
                 error.what());
    throw;
  }
}

void ConfigManager::loadDefaultConfig() { settings_ = defaultSettings(); }

// ---- Helper function implementations ---- //

namespace {

// Helper function: if key is missing, log and return default.
std::string getStringWithLog(const nm::json &j, const std::string &key,
                             const std::string &defaultValue) {
  if (!j.contains(key)) {
    spdlog::debug("Key '{}' not found, using default '{}'.", key,
                  defaultValue);
    return defaultValue;
  }
  const auto value = j.at(key).get<std::string>();
  if (value.empty()) {
    spdlog::warn("Key '{}' is empty, using default '{}'.", key, defaultValue);
    return defaultValue;
  }
  return value;
}

bool getBoolWithLog(const nm::json &j, const std::string &key,
                    const bool defaultValue) {
  if (!j.contains(key)) {
    spdlog::debug("Key '{}' not found, using default {}.", key, defaultValue);
    return defaultValue;
  }
  return j.at(key).get<bool>();
}

// Helper function: the macos section is optional as a whole
void loadMacOSSection(const nm::json &j, Settings::MacOS &target,
                      const Settings::MacOS &defaults) {
  if (!j.contains("macos")) {
    target = defaults;
    return;
  }
  const auto &sec = j["macos"];
  target.airport_tool =
      getStringWithLog(sec, "airport_tool", defaults.airport_tool);
  target.internet_sharing_plist = getStringWithLog(
      sec, "internet_sharing_plist", defaults.internet_sharing_plist);
}
} // namespace
