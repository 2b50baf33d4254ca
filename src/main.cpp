// src/main.cpp

#include <exception>
#include <iostream>
#include <memory>
#include <vector>

#include <unistd.h>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "CommandExecutor.hpp"
#include "CommandLine.hpp"
#include "ConfigManager.hpp"
#include "HotspotError.hpp"
#include "HotspotService.hpp"
#include "OsRelease.hpp"
#include "PasswordPrompt.hpp"
#include "Platform.hpp"
#include "ProcessRunner.hpp"

void setupLogging(const CliOptions &options);
int runHotspot(const CliOptions &options);

int main(int argc, char *argv[]) {
  const std::string program = argc > 0 ? argv[0] : "hotspot-bridge";

  CliOptions options;
  try {
    options = parseCommandLine(argc, argv);
  } catch (const UsageError &error) {
    std::cerr << program << ": " << error.what() << "\n\n"
              << usageText(program);
    return 1;
  }

  if (options.action == CliAction::Help) {
    std::cout << usageText(program);
    return 0;
  }

  try {
    setupLogging(options);
  } catch (const spdlog::spdlog_ex &error) {
    std::cerr << "Failed to set up logging: " << error.what() << "\n";
    return 1;
  }

  try {
    return runHotspot(options);
  } catch (const HotspotError &error) {
    spdlog::error("{}", error.what());
    if (!error.hint().empty()) {
      std::cerr << error.hint() << "\n";
    }
    spdlog::debug("Error code: {}", toString(error.code()));
  } catch (const CommandError &error) {
    spdlog::error("{}", error.what());
  } catch (const std::exception &error) {
    spdlog::critical("Fatal error: {}", error.what());
  }
  return 1;
}

void setupLogging(const CliOptions &options) {
  std::vector<spdlog::sink_ptr> sinks;

  auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console->set_pattern("%^%v%$");
  sinks.push_back(console);

  if (options.log_file) {
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        *options.log_file);
    file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    sinks.push_back(file);
  }

  auto logger = std::make_shared<spdlog::logger>("hotspot-bridge",
                                                 sinks.begin(), sinks.end());
  logger->set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::info);
  spdlog::set_default_logger(logger);
}

int runHotspot(const CliOptions &options) {
  const bool enabling = options.action == CliAction::HotspotEnable;
  spdlog::info(enabling ? "=== ENABLE HOTSPOT ===" : "=== DISABLE HOTSPOT ===");

  bool dry_run = options.dry_run.value_or(false);
  // nobody to answer the question => real run, as with a plain "N"
  if (!options.dry_run && isatty(STDIN_FILENO)) {
    dry_run = askDryRun(std::cin, std::cout);
  }
  if (dry_run) {
    spdlog::warn("Running in dry-run mode - no changes will be made.");
  }

  ConfigManager config_manager(options.config_path);
  const Settings settings = config_manager.getSettings();

  SystemProcessRunner runner;
  CommandExecutor executor(runner, dry_run);
  TerminalPasswordPrompt prompt;

  // fails with UnsupportedPlatform before anything runs
  auto service =
      HotspotService::create(currentPlatform(), executor, settings, prompt,
                             detectDistroFamily(readOsRelease()));

  if (!enabling) {
    service->disable();
    spdlog::info("{}", service->disableSummary());
    return 0;
  }

  HotspotConfig config;
  config.ssid = options.ssid.value_or(settings.ssid);
  config.password = options.password;
  config.interface = options.iface;
  config.tunnel_interface = settings.tunnel_interface;

  const EnableReport report = service->enable(config);
  if (report.outcome == EnableOutcome::AlreadyActive) {
    return 0;
  }

  spdlog::info("{}", report.summary);
  std::cout << "SSID: " << report.ssid << "\n"
            << "Password: " << report.password << "\n";
  if (!report.hint.empty()) {
    std::cout << report.hint << "\n";
  }
  return 0;
}
