// src/hotspot/HotspotService.cpp

#include "HotspotService.hpp"
#include "HotspotError.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

std::unique_ptr<HotspotService>
HotspotService::create(Platform platform, CommandExecutor &executor,
                       const Settings &settings, PasswordPrompt &prompt,
                       DistroFamily family) {
  switch (platform) {
  case Platform::Linux:
    return std::make_unique<LinuxHotspotService>(executor, settings, prompt,
                                                 family);
  case Platform::MacOS:
    return std::make_unique<MacOSHotspotService>(executor, settings, prompt);
  case Platform::Windows:
  case Platform::Unknown:
    break;
  }
  throw HotspotError(HotspotErrc::UnsupportedPlatform,
                     "Hotspot commands are supported on Linux/macOS only (this "
                     "is " +
                         platformName(platform) + ").");
}

// ---- Linux ---- //

LinuxHotspotService::LinuxHotspotService(CommandExecutor &executor,
                                         const Settings &settings,
                                         PasswordPrompt &prompt,
                                         DistroFamily family)
    : executor_(executor), settings_(settings), prompt_(prompt),
      preconditions_(executor, settings, family), resolver_(executor),
      access_point_(executor, settings),
      firewall_(executor, settings.use_sudo) {}

EnableReport LinuxHotspotService::enable(const HotspotConfig &config) {
  // a bad --password must fail before anything runs
  checkSuppliedPassword(config.password);

  preconditions_.checkPreconditions();

  EnableReport report;
  report.interface = resolver_.resolveInterface(config.interface);
  spdlog::info("Wi-Fi interface: {}", report.interface);

  const std::string tunnel = config.tunnel_interface.empty()
                                 ? settings_.tunnel_interface
                                 : config.tunnel_interface;
  // built before anything changes, a name nft cannot take stops here
  FirewallTable table;
  try {
    table = hotspotTable(settings_.nat_table, tunnel, report.interface);
  } catch (const std::invalid_argument &error) {
    throw HotspotError(HotspotErrc::InvalidInterfaceName, error.what());
  }

  access_point_.enableRadio(report.interface);

  if (access_point_.isAccessPointActive(report.interface)) {
    spdlog::warn("A Wi-Fi hotspot is already active on {}. Skipping creation.",
                 report.interface);
    report.outcome = EnableOutcome::AlreadyActive;
    return report;
  }

  report.password = obtainPassword(config.password, prompt_);
  report.ssid = config.ssid.empty() ? settings_.ssid : config.ssid;

  access_point_.createAccessPoint(report.interface, report.ssid,
                                  report.password);

  report.failed_firewall_steps = firewall_.applyTable(table);

  if (settings_.verify_after_apply) {
    if (executor_.dryRun()) {
      spdlog::debug("Dry-run: skipping nftables verification.");
    } else if (!firewall_.verifyRules(table)) {
      spdlog::warn("nftables table '{}' is incomplete. Run 'hotspot disable' "
                   "then 'hotspot enable' to rebuild it.",
                   settings_.nat_table);
    }
  }

  report.outcome = EnableOutcome::Created;
  report.summary = "Hotspot is ready and running!";
  return report;
}

void LinuxHotspotService::disable() {
  access_point_.teardown();
  firewall_.removeRules(settings_.nat_table);
}

std::string LinuxHotspotService::disableSummary() const {
  return "Hotspot stopped and forwarding rules removed.";
}

// ---- macOS ---- //

MacOSHotspotService::MacOSHotspotService(CommandExecutor &executor,
                                         const Settings &settings,
                                         PasswordPrompt &prompt)
    : settings_(settings), prompt_(prompt),
      preconditions_(executor, settings), resolver_(executor),
      access_point_(executor, settings) {}

EnableReport MacOSHotspotService::enable(const HotspotConfig &config) {
  checkSuppliedPassword(config.password);

  preconditions_.checkPreconditions();

  EnableReport report;
  report.interface = resolver_.resolveInterface(config.interface);
  spdlog::info("Wi-Fi interface: {}", report.interface);

  report.ssid = config.ssid.empty() ? settings_.ssid : config.ssid;
  report.password = obtainPassword(config.password, prompt_);

  access_point_.enableRadio(report.interface);
  access_point_.createAccessPoint(report.interface, report.ssid,
                                  report.password);
  access_point_.startInternetSharing();

  report.outcome = EnableOutcome::Created;
  report.summary = "Hotspot command completed (best-effort).";
  report.hint = "Verify in System Settings > General > Sharing > Internet "
                "Sharing.";
  return report;
}

void MacOSHotspotService::disable() { access_point_.teardown(); }

std::string MacOSHotspotService::disableSummary() const {
  return "Hotspot stop command completed (best-effort).";
}
