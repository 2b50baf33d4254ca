// src/hotspot/AccessPointController.cpp

#include "AccessPointController.hpp"
#include "HotspotError.hpp"

#include <spdlog/spdlog.h>

namespace {

// "iw dev <iface> info" prints "type AP" when the device is an access point
constexpr const char *AP_MODE_MARKER = "type AP";

} // namespace

// ---- NmcliAccessPoint ---- //

NmcliAccessPoint::NmcliAccessPoint(CommandExecutor &executor,
                                   const Settings &settings)
    : executor_(executor), settings_(settings) {}

void NmcliAccessPoint::enableRadio(const std::string & /*iface*/) {
  spdlog::info("Enabling Wi-Fi...");
  executor_.run(Command::args({"nmcli", "radio", "wifi", "on"}),
                Tolerance::BestEffort);
}

bool NmcliAccessPoint::isAccessPointActive(const std::string &iface) {
  const ProcessResult res =
      executor_.capture(Command::args({"iw", "dev", iface, "info"}));
  return res.succeeded() && res.out.find(AP_MODE_MARKER) != std::string::npos;
}

void NmcliAccessPoint::createAccessPoint(const std::string &iface,
                                         const std::string &ssid,
                                         const std::string &password) {
  spdlog::info("Starting hotspot...");

  Command create = Command::args({"nmcli", "dev", "wifi", "hotspot", "ifname",
                                  iface, "ssid", ssid, "password", password});
  create.redactArg(create.argv().size() - 1);

  try {
    executor_.run(create, Tolerance::Mandatory);
  } catch (const CommandError &error) {
    throw HotspotError(HotspotErrc::HotspotCreationFailed,
                       "Failed to start hotspot on " + iface +
                           " (exit code " + std::to_string(error.exitCode()) +
                           ") - maybe AP mode is unsupported.");
  }
}

void NmcliAccessPoint::teardown() {
  spdlog::info("Stopping hotspot...");
  executor_.run(
      Command::args({"nmcli", "connection", "down", settings_.connection_name}),
      Tolerance::BestEffort);
  executor_.run(Command::args({"nmcli", "connection", "delete",
                               settings_.connection_name}),
                Tolerance::BestEffort);
}

// ---- AirportAccessPoint ---- //

AirportAccessPoint::AirportAccessPoint(CommandExecutor &executor,
                                       const Settings &settings)
    : executor_(executor), settings_(settings) {}

void AirportAccessPoint::enableRadio(const std::string &iface) {
  spdlog::info("Enabling Wi-Fi...");
  executor_.run(Command::args({"networksetup", "-setairportpower", iface, "on"}),
                Tolerance::BestEffort);
}

bool AirportAccessPoint::isAccessPointActive(const std::string & /*iface*/) {
  return false;
}

void AirportAccessPoint::createAccessPoint(const std::string & /*iface*/,
                                           const std::string &ssid,
                                           const std::string &password) {
  spdlog::info("Attempting to create hotspot...");

  Command create = Command::args(
      {settings_.macos.airport_tool, "--create", ssid, password});
  create.redactArg(3);

  if (!executor_.run(create, Tolerance::BestEffort).ok()) {
    spdlog::warn("Failed to create hotspot via 'airport'. macOS hotspot setup "
                 "can require manual configuration.");
  }
}

void AirportAccessPoint::teardown() { toggleInternetSharing("unload"); }

void AirportAccessPoint::startInternetSharing() { toggleInternetSharing("load"); }

void AirportAccessPoint::toggleInternetSharing(const std::string &action) {
  const std::string &plist = settings_.macos.internet_sharing_plist;
  if (!executor_.runner().pathExists(plist)) {
    spdlog::warn("Internet Sharing plist not found: {}", plist);
    return;
  }

  spdlog::info("Attempting to {} Internet Sharing...",
               action == "load" ? "enable" : "disable");
  executor_.run(Command::args({"sudo", "launchctl", action, "-w", plist}),
                Tolerance::BestEffort);
}
