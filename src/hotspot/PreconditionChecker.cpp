// src/hotspot/PreconditionChecker.cpp

#include "PreconditionChecker.hpp"
#include "FirewallRuleManager.hpp"
#include "HotspotError.hpp"

#include <array>

#include <spdlog/spdlog.h>

namespace {

// NetworkManager CLI, wireless info, firewall
constexpr std::array<const char *, 3> LINUX_TOOLS{"nmcli", "iw", "nft"};

} // namespace

// ---- Linux ---- //

LinuxPreconditionChecker::LinuxPreconditionChecker(CommandExecutor &executor,
                                                   const Settings &settings,
                                                   DistroFamily family)
    : executor_(executor), settings_(settings), family_(family) {}

void LinuxPreconditionChecker::checkPreconditions() {
  checkTools();
  checkRequiredTable();
}

void LinuxPreconditionChecker::checkTools() {
  for (const char *tool : LINUX_TOOLS) {
    if (!executor_.runner().commandExists(tool)) {
      throw HotspotError(HotspotErrc::MissingTool,
                         std::string("'") + tool +
                             "' command not found. Please install it.",
                         installHint(tool, family_));
    }
    spdlog::debug("Found {}", tool);
  }
}

void LinuxPreconditionChecker::checkRequiredTable() {
  auto args = nftPrefix(settings_.use_sudo);
  args.insert(args.end(), {"list", "table", "inet", settings_.required_table});

  const ProcessResult res = executor_.capture(Command::args(args));
  if (!res.succeeded()) {
    throw HotspotError(HotspotErrc::MissingFirewallTable,
                       "Missing 'inet " + settings_.required_table +
                           "' nftables table.",
                       "   Please enable 'Tun Mode' in Throne/NekoRay GUI "
                       "settings.");
  }
  spdlog::debug("Found 'inet {}' nftables table.", settings_.required_table);
}

// ---- macOS ---- //

MacOSPreconditionChecker::MacOSPreconditionChecker(CommandExecutor &executor,
                                                   const Settings &settings)
    : executor_(executor), settings_(settings) {}

void MacOSPreconditionChecker::checkPreconditions() {
  if (!executor_.runner().commandExists("networksetup")) {
    throw HotspotError(HotspotErrc::MissingTool,
                       "'networksetup' not found. macOS hotspot is "
                       "unavailable.");
  }
  if (!executor_.runner().pathExists(settings_.macos.airport_tool)) {
    throw HotspotError(HotspotErrc::MissingTool,
                       "'airport' tool not found. macOS hotspot is "
                       "unavailable.",
                       "   Expected at " + settings_.macos.airport_tool);
  }
}
