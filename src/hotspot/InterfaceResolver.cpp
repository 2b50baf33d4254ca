// src/hotspot/InterfaceResolver.cpp

#include "InterfaceResolver.hpp"
#include "HotspotError.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <spdlog/spdlog.h>

namespace {

std::vector<std::string> splitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(line);
  }
  return lines;
}

std::string trim(const std::string &text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

bool startsWith(const std::string &text, const std::string &prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

// nmcli terse output escapes ':' and '\' inside values with a backslash
std::vector<std::string> splitTerseFields(const std::string &line) {
  std::vector<std::string> fields(1);
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '\\' && i + 1 < line.size()) {
      fields.back() += line[++i];
    } else if (c == ':') {
      fields.emplace_back();
    } else {
      fields.back() += c;
    }
  }
  return fields;
}

std::string notFoundMessage(const std::string &requested) {
  return "Wi-Fi interface not found: " + requested;
}

} // namespace

// ---- NmcliInterfaceResolver ---- //

NmcliInterfaceResolver::NmcliInterfaceResolver(CommandExecutor &executor)
    : executor_(executor) {}

std::string NmcliInterfaceResolver::resolveInterface(
    const std::optional<std::string> &requested) {
  if (requested) {
    const ProcessResult res = executor_.capture(
        Command::args({"nmcli", "-t", "-f", "DEVICE,TYPE", "device"}));
    const auto devices = res.succeeded() ? parseTerseDeviceList(res.out)
                                         : std::vector<NetworkInterface>{};

    for (const auto &device : devices) {
      if (device.name == *requested && device.isWifi()) {
        return device.name;
      }
    }
    throw HotspotError(HotspotErrc::InterfaceNotFound,
                       notFoundMessage(*requested));
  }

  const ProcessResult res =
      executor_.capture(Command::args({"nmcli", "device", "status"}));
  if (res.succeeded()) {
    for (const auto &device : parseDeviceStatus(res.out)) {
      if (device.isWifi()) {
        spdlog::debug("Picked first Wi-Fi device {}", device.name);
        return device.name;
      }
    }
  }
  throw HotspotError(HotspotErrc::NoWifiInterface, "No Wi-Fi interface found.");
}

std::vector<NetworkInterface>
NmcliInterfaceResolver::parseDeviceStatus(const std::string &output) {
  std::vector<NetworkInterface> devices;
  for (const auto &line : splitLines(output)) {
    std::istringstream columns(line);
    std::string device;
    std::string type;
    if (!(columns >> device >> type)) {
      continue;
    }
    // header row
    if (device == "DEVICE" && type == "TYPE") {
      continue;
    }
    devices.push_back({device, type});
  }
  return devices;
}

std::vector<NetworkInterface>
NmcliInterfaceResolver::parseTerseDeviceList(const std::string &output) {
  std::vector<NetworkInterface> devices;
  for (const auto &line : splitLines(output)) {
    if (line.find(':') == std::string::npos) {
      continue;
    }
    const auto fields = splitTerseFields(line);
    devices.push_back({fields[0], fields.size() > 1 ? fields[1] : ""});
  }
  return devices;
}

// ---- NetworksetupInterfaceResolver ---- //

NetworksetupInterfaceResolver::NetworksetupInterfaceResolver(
    CommandExecutor &executor)
    : executor_(executor) {}

std::string NetworksetupInterfaceResolver::resolveInterface(
    const std::optional<std::string> &requested) {
  const ProcessResult res = executor_.capture(
      Command::args({"networksetup", "-listallhardwareports"}));
  const auto ports = res.succeeded() ? parseHardwarePorts(res.out)
                                     : std::vector<NetworkInterface>{};

  for (const auto &port : ports) {
    if (!port.isWifi()) {
      continue;
    }
    if (!requested || port.name == *requested) {
      return port.name;
    }
  }

  if (requested) {
    throw HotspotError(HotspotErrc::InterfaceNotFound,
                       notFoundMessage(*requested));
  }
  throw HotspotError(HotspotErrc::NoWifiInterface,
                     "Wi-Fi interface not found on macOS.");
}

std::vector<NetworkInterface>
NetworksetupInterfaceResolver::parseHardwarePorts(const std::string &output) {
  std::vector<NetworkInterface> ports;
  const auto lines = splitLines(output);

  for (std::size_t idx = 0; idx < lines.size(); ++idx) {
    if (!startsWith(lines[idx], "Hardware Port:")) {
      continue;
    }
    const std::string port = toLower(trim(lines[idx].substr(14)));
    const std::string type =
        (port == "wi-fi" || port == "airport") ? "wifi" : port;

    // the Device: line follows within the next two lines
    for (std::size_t next = idx + 1; next < lines.size() && next <= idx + 2;
         ++next) {
      if (startsWith(lines[next], "Device:")) {
        ports.push_back({trim(lines[next].substr(7)), type});
        break;
      }
    }
  }
  return ports;
}
