// src/system/OsRelease.cpp

#include "OsRelease.hpp"

#include <array>
#include <fstream>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

struct PackageNames {
  const char *tool;
  const char *debian;
  const char *fedora;
  const char *arch;
};

constexpr std::array<PackageNames, 3> PACKAGES{{
    {"nmcli", "network-manager", "NetworkManager", "networkmanager"},
    {"iw", "iw", "iw", "iw"},
    {"nft", "nftables", "nftables", "nftables"},
}};

std::string trim(const std::string &text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return "";
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string unquote(std::string value) {
  if (value.size() >= 2 &&
      (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    value = value.substr(1, value.size() - 2);
  }
  return value;
}

DistroFamily familyOf(const std::string &id) {
  static const std::vector<std::string> debian{"debian", "ubuntu", "linuxmint",
                                               "pop", "raspbian", "elementary"};
  static const std::vector<std::string> fedora{
      "fedora", "rhel", "centos", "rocky", "almalinux", "ol"};
  static const std::vector<std::string> arch{"arch", "manjaro", "endeavouros",
                                             "garuda"};

  auto contains = [&id](const std::vector<std::string> &ids) {
    for (const auto &candidate : ids) {
      if (candidate == id) {
        return true;
      }
    }
    return false;
  };

  if (contains(debian)) {
    return DistroFamily::Debian;
  }
  if (contains(fedora)) {
    return DistroFamily::Fedora;
  }
  if (contains(arch)) {
    return DistroFamily::Arch;
  }
  return DistroFamily::Unknown;
}

} // namespace

OsReleaseFields parseOsRelease(const std::string &contents) {
  OsReleaseFields fields;
  std::istringstream lines(contents);
  std::string line;
  while (std::getline(lines, line)) {
    line = trim(line);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    fields[line.substr(0, eq)] = unquote(trim(line.substr(eq + 1)));
  }
  return fields;
}

OsReleaseFields readOsRelease(const std::string &path) {
  std::ifstream infile(path);
  if (!infile) {
    spdlog::debug("No {} found, distribution unknown.", path);
    return {};
  }
  std::ostringstream contents;
  contents << infile.rdbuf();
  return parseOsRelease(contents.str());
}

DistroFamily detectDistroFamily(const OsReleaseFields &fields) {
  auto id = fields.find("ID");
  if (id != fields.end()) {
    const DistroFamily family = familyOf(id->second);
    if (family != DistroFamily::Unknown) {
      return family;
    }
  }

  // ID_LIKE is a space separated list, closest relative first
  auto like = fields.find("ID_LIKE");
  if (like != fields.end()) {
    std::istringstream ids(like->second);
    std::string candidate;
    while (ids >> candidate) {
      const DistroFamily family = familyOf(candidate);
      if (family != DistroFamily::Unknown) {
        return family;
      }
    }
  }
  return DistroFamily::Unknown;
}

std::string installHint(const std::string &tool, DistroFamily family) {
  const PackageNames *names = nullptr;
  for (const auto &entry : PACKAGES) {
    if (tool == entry.tool) {
      names = &entry;
      break;
    }
  }
  if (names == nullptr) {
    return "   Install '" + tool + "' with your package manager.";
  }

  const std::string debian =
      std::string("   Debian/Ubuntu: sudo apt install ") + names->debian;
  const std::string fedora =
      std::string("   Fedora:        sudo dnf install ") + names->fedora;
  const std::string arch =
      std::string("   Arch:          sudo pacman -S ") + names->arch;

  switch (family) {
  case DistroFamily::Debian:
    return debian;
  case DistroFamily::Fedora:
    return fedora;
  case DistroFamily::Arch:
    return arch;
  case DistroFamily::Unknown:
    break;
  }
  return debian + "\n" + fedora + "\n" + arch;
}
