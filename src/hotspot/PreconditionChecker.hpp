// src/hotspot/PreconditionChecker.hpp

// ---- PreconditionChecker Usage ---- //

// Runs once per "hotspot enable", before anything is changed on the host.
// Throws HotspotError:
// - MissingTool, with the install command for the detected distribution
// - MissingFirewallTable (Linux), when the tunneling application has not
//   created its nftables table yet, traffic would have nowhere to go

#pragma once

#include <string>

#include "CommandExecutor.hpp"
#include "ConfigManager.hpp"
#include "OsRelease.hpp"

class PreconditionChecker {
public:
  virtual ~PreconditionChecker() = default;

  virtual void checkPreconditions() = 0;
};

class LinuxPreconditionChecker : public PreconditionChecker {
public:
  LinuxPreconditionChecker(CommandExecutor &executor, const Settings &settings,
                           DistroFamily family);

  void checkPreconditions() override;

  void checkTools();
  void checkRequiredTable();

private:
  CommandExecutor &executor_;
  const Settings &settings_;
  DistroFamily family_;
};

class MacOSPreconditionChecker : public PreconditionChecker {
public:
  MacOSPreconditionChecker(CommandExecutor &executor, const Settings &settings);

  void checkPreconditions() override;

private:
  CommandExecutor &executor_;
  const Settings &settings_;
};
