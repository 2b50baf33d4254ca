// src/hotspot/AccessPointController.hpp

// ---- AccessPointController Usage ---- //

// Drives the radio and the access point itself. The hotspot state is never
// stored, it is read back from the OS on every run:
//   Inactive -> RadioEnabling -> Creating -> Active   (enable)
//   Active -> TearingDown -> Inactive                  (disable)

// Mutating calls go through CommandExecutor::run(), so dry-run prints them.
// isAccessPointActive() is a query and runs in both modes.

#pragma once

#include <string>

#include "CommandExecutor.hpp"
#include "ConfigManager.hpp"

class AccessPointController {
public:
  virtual ~AccessPointController() = default;

  // best-effort, a failure is logged and ignored
  virtual void enableRadio(const std::string &iface) = 0;

  virtual bool isAccessPointActive(const std::string &iface) = 0;

  virtual void createAccessPoint(const std::string &iface,
                                 const std::string &ssid,
                                 const std::string &password) = 0;

  // best-effort, the connection may not exist
  virtual void teardown() = 0;
};

// Linux: nmcli for the radio and the connection, iw for the mode probe
class NmcliAccessPoint : public AccessPointController {
public:
  NmcliAccessPoint(CommandExecutor &executor, const Settings &settings);

  void enableRadio(const std::string &iface) override;
  bool isAccessPointActive(const std::string &iface) override;

  // throws HotspotError(HotspotCreationFailed)
  void createAccessPoint(const std::string &iface, const std::string &ssid,
                         const std::string &password) override;

  void teardown() override;

private:
  CommandExecutor &executor_;
  const Settings &settings_;
};

// macOS: networksetup, the private airport helper and Internet Sharing.
// Creation is advisory only, a failure is a warning.
class AirportAccessPoint : public AccessPointController {
public:
  AirportAccessPoint(CommandExecutor &executor, const Settings &settings);

  void enableRadio(const std::string &iface) override;

  // airport cannot report AP mode, always false
  bool isAccessPointActive(const std::string &iface) override;

  void createAccessPoint(const std::string &iface, const std::string &ssid,
                         const std::string &password) override;

  // unloads Internet Sharing
  void teardown() override;

  void startInternetSharing();

private:
  CommandExecutor &executor_;
  const Settings &settings_;

  void toggleInternetSharing(const std::string &action);
};
