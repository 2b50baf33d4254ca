// src/cli/CommandLine.cpp

#include "CommandLine.hpp"
#include "configs.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>
#include <vector>

#include <getopt.h>

namespace {

enum LongOnly : int {
  OPT_IFACE = 1000,
  OPT_SSID,
  OPT_PASSWORD,
  OPT_DRY_RUN,
  OPT_CONFIG,
  OPT_LOG_FILE,
};

const option LONG_OPTIONS[] = {
    {"iface", required_argument, nullptr, OPT_IFACE},
    {"ssid", required_argument, nullptr, OPT_SSID},
    {"password", required_argument, nullptr, OPT_PASSWORD},
    {"dry-run", no_argument, nullptr, OPT_DRY_RUN},
    {"config", required_argument, nullptr, OPT_CONFIG},
    {"log-file", required_argument, nullptr, OPT_LOG_FILE},
    {"verbose", no_argument, nullptr, 'v'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

// leading ':' => missing arguments are reported as ':' instead of '?'
constexpr const char *SHORT_OPTIONS = ":vh";

void resetGetopt() {
#if defined(__APPLE__)
  optreset = 1;
  optind = 1;
#else
  // glibc re-initialises (permutation state included) when optind is 0
  optind = 0;
#endif
  opterr = 0;
}

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

} // namespace

CliOptions parseCommandLine(int argc, char *argv[]) {
  CliOptions options;
  options.config_path = DEFAULT_CONFIG_PATH;
  bool help = false;

  resetGetopt();
  int c;
  while ((c = getopt_long(argc, argv, SHORT_OPTIONS, LONG_OPTIONS, nullptr)) !=
         -1) {
    switch (c) {
    case OPT_IFACE:
      options.iface = optarg;
      break;
    case OPT_SSID:
      options.ssid = optarg;
      break;
    case OPT_PASSWORD:
      options.password = optarg;
      break;
    case OPT_DRY_RUN:
      options.dry_run = true;
      break;
    case OPT_CONFIG:
      options.config_path = optarg;
      break;
    case OPT_LOG_FILE:
      options.log_file = optarg;
      break;
    case 'v':
      options.verbose = true;
      break;
    case 'h':
      help = true;
      break;
    case ':':
      throw UsageError(std::string("option '") + argv[optind - 1] +
                       "' requires an argument");
    case '?':
    default:
      // optopt names the character for short options, even inside "-vx"
      if (optopt != 0) {
        throw UsageError(std::string("unknown option '-") +
                         static_cast<char>(optopt) + "'");
      }
      throw UsageError(std::string("unknown option '") + argv[optind - 1] +
                       "'");
    }
  }

  std::vector<std::string> positionals(argv + optind, argv + argc);

  if (help) {
    options.action = CliAction::Help;
    return options;
  }
  if (positionals.empty()) {
    throw UsageError("missing command");
  }
  if (positionals[0] != "hotspot") {
    throw UsageError("unknown command '" + positionals[0] + "'");
  }
  if (positionals.size() < 2) {
    throw UsageError("missing hotspot action (enable or disable)");
  }
  if (positionals.size() > 2) {
    throw UsageError("unexpected argument '" + positionals[2] + "'");
  }

  if (positionals[1] == "enable") {
    options.action = CliAction::HotspotEnable;
  } else if (positionals[1] == "disable") {
    options.action = CliAction::HotspotDisable;
    if (options.iface || options.ssid || options.password) {
      throw UsageError(
          "--iface, --ssid and --password only apply to 'hotspot enable'");
    }
  } else {
    throw UsageError("unknown hotspot action '" + positionals[1] + "'");
  }
  return options;
}

std::string usageText(const std::string &program) {
  return "Usage:\n"
         "  " +
         program +
         " [--config FILE] [--log-file FILE] [--verbose] hotspot enable\n"
         "      [--iface NAME] [--ssid SSID] [--password PW] [--dry-run]\n"
         "  " +
         program +
         " [--config FILE] [--log-file FILE] [--verbose] hotspot disable "
         "[--dry-run]\n"
         "\n"
         "Options:\n"
         "  --iface NAME      Wi-Fi interface to use (default: first Wi-Fi "
         "device)\n"
         "  --ssid SSID       Hotspot SSID (default: " +
         DEFAULT_SSID +
         ")\n"
         "  --password PW     Hotspot password, at least " +
         std::to_string(MIN_PASSWORD_LENGTH) +
         " characters (prompted if omitted)\n"
         "  --dry-run         Print the commands instead of running them\n"
         "  --config FILE     Settings file (default: " +
         DEFAULT_CONFIG_PATH +
         ")\n"
         "  --log-file FILE   Also write the log to FILE\n"
         "  -v, --verbose     Show every command as it runs\n"
         "  -h, --help        Show this help\n"
         "\n"
         "Example:\n"
         "  " +
         program + " hotspot enable --iface wlp2s0 --dry-run\n";
}

bool askDryRun(std::istream &in, std::ostream &out) {
  out << "Run in dry-run mode? (y/N): " << std::flush;
  std::string answer;
  if (!std::getline(in, answer)) {
    out << "\n";
    return false;
  }
  const auto first = answer.find_first_not_of(" \t");
  const auto last = answer.find_last_not_of(" \t\r");
  if (first == std::string::npos) {
    return false;
  }
  const std::string choice = toLower(answer.substr(first, last - first + 1));
  return choice == "y" || choice == "yes";
}
