// src/hotspot/HotspotService.hpp

// ---- HotspotService Usage ---- //

// Orchestrates the whole "hotspot enable" / "hotspot disable" flow. One
// implementation per platform, picked once at startup by create().

// Example:
// auto service = HotspotService::create(currentPlatform(), executor, settings,
//                                       prompt, family);
// EnableReport report = service->enable(config);
// service->disable();

// Linux enable:
//   password rule -> tools + tunnel table -> interface -> radio on
//   -> AP probe (already AP: stop here, the AP may not be ours)
//   -> password -> create AP -> nftables rules
// Linux disable:
//   connection down + delete -> drop nftables table
// macOS enable (best-effort):
//   password rule -> tools -> interface -> password -> radio on
//   -> airport --create -> Internet Sharing on
// macOS disable:
//   Internet Sharing off

// Fatal problems throw HotspotError. Windows and unknown platforms throw
// UnsupportedPlatform from create(), before any work is done.

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "AccessPointController.hpp"
#include "CommandExecutor.hpp"
#include "ConfigManager.hpp"
#include "FirewallRuleManager.hpp"
#include "HotspotConfig.hpp"
#include "InterfaceResolver.hpp"
#include "OsRelease.hpp"
#include "PasswordPrompt.hpp"
#include "Platform.hpp"
#include "PreconditionChecker.hpp"

enum class EnableOutcome { Created, AlreadyActive };

struct EnableReport {
  EnableOutcome outcome = EnableOutcome::Created;
  std::string interface;
  std::string ssid;
  std::string password;
  std::size_t failed_firewall_steps = 0;

  // one-line result for the operator, plus an optional follow-up step
  std::string summary;
  std::string hint;
};

class HotspotService {
public:
  virtual ~HotspotService() = default;

  virtual EnableReport enable(const HotspotConfig &config) = 0;
  virtual void disable() = 0;
  virtual std::string disableSummary() const = 0;

  static std::unique_ptr<HotspotService>
  create(Platform platform, CommandExecutor &executor, const Settings &settings,
         PasswordPrompt &prompt, DistroFamily family);
};

class LinuxHotspotService : public HotspotService {
public:
  LinuxHotspotService(CommandExecutor &executor, const Settings &settings,
                      PasswordPrompt &prompt, DistroFamily family);

  EnableReport enable(const HotspotConfig &config) override;
  void disable() override;
  std::string disableSummary() const override;

private:
  CommandExecutor &executor_;
  const Settings &settings_;
  PasswordPrompt &prompt_;

  LinuxPreconditionChecker preconditions_;
  NmcliInterfaceResolver resolver_;
  NmcliAccessPoint access_point_;
  FirewallRuleManager firewall_;
};

class MacOSHotspotService : public HotspotService {
public:
  MacOSHotspotService(CommandExecutor &executor, const Settings &settings,
                      PasswordPrompt &prompt);

  EnableReport enable(const HotspotConfig &config) override;
  void disable() override;
  std::string disableSummary() const override;

private:
  const Settings &settings_;
  PasswordPrompt &prompt_;

  MacOSPreconditionChecker preconditions_;
  NetworksetupInterfaceResolver resolver_;
  AirportAccessPoint access_point_;
};
