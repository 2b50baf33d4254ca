// src/cli/CommandLine.hpp

// ---- CommandLine Usage ---- //

// hotspot-bridge [--config FILE] [--log-file FILE] [--verbose]
//                hotspot enable [--iface NAME] [--ssid SSID]
//                               [--password PW] [--dry-run]
// hotspot-bridge hotspot disable [--dry-run]

// parseCommandLine() throws UsageError for anything it cannot make sense of;
// main prints the message and the usage text and exits with 1.

#pragma once

#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

enum class CliAction { Help, HotspotEnable, HotspotDisable };

struct CliOptions {
  CliAction action = CliAction::Help;

  std::optional<std::string> iface;
  std::optional<std::string> ssid;
  std::optional<std::string> password;

  // nullopt => ask on the terminal
  std::optional<bool> dry_run;

  std::string config_path;
  std::optional<std::string> log_file;
  bool verbose = false;
};

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

CliOptions parseCommandLine(int argc, char *argv[]);

std::string usageText(const std::string &program);

// "Run in dry-run mode? (y/N): ", anything but y/yes is a no
bool askDryRun(std::istream &in, std::ostream &out);
