// src/hotspot/InterfaceResolver.hpp

// ---- InterfaceResolver Usage ---- //

// Finds the Wi-Fi device that will host the access point. Nothing is
// cached: every call asks the platform tool again.

// Example:
// NmcliInterfaceResolver resolver(executor);
// std::string iface = resolver.resolveInterface(std::nullopt); // first wifi
// std::string wlan0 = resolver.resolveInterface("wlan0");      // validated

// Failures throw HotspotError with InterfaceNotFound (a requested name that
// is not a Wi-Fi device) or NoWifiInterface (nothing to pick from).

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CommandExecutor.hpp"

struct NetworkInterface {
  std::string name;
  std::string type; // as reported by the platform tool, e.g. "wifi"

  bool isWifi() const { return type == "wifi"; }
  bool operator==(const NetworkInterface &) const = default;
};

class InterfaceResolver {
public:
  virtual ~InterfaceResolver() = default;

  virtual std::string
  resolveInterface(const std::optional<std::string> &requested) = 0;
};

// Linux, NetworkManager
class NmcliInterfaceResolver : public InterfaceResolver {
public:
  explicit NmcliInterfaceResolver(CommandExecutor &executor);

  std::string
  resolveInterface(const std::optional<std::string> &requested) override;

  // "nmcli device status" table, header line included
  static std::vector<NetworkInterface>
  parseDeviceStatus(const std::string &output);

  // "nmcli -t -f DEVICE,TYPE device", one "device:type" per line
  static std::vector<NetworkInterface>
  parseTerseDeviceList(const std::string &output);

private:
  CommandExecutor &executor_;
};

// macOS, networksetup
class NetworksetupInterfaceResolver : public InterfaceResolver {
public:
  explicit NetworksetupInterfaceResolver(CommandExecutor &executor);

  std::string
  resolveInterface(const std::optional<std::string> &requested) override;

  // "networksetup -listallhardwareports"; Wi-Fi and AirPort ports are
  // reported with type "wifi", others with their lowercased port name
  static std::vector<NetworkInterface>
  parseHardwarePorts(const std::string &output);

private:
  CommandExecutor &executor_;
};
