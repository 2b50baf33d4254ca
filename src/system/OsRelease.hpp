// src/system/OsRelease.hpp

// ---- OsRelease Usage ---- //

// Reads /etc/os-release to decide which package manager to suggest when a
// required tool is missing.

// Example:
// DistroFamily family = detectDistroFamily(readOsRelease());
// std::string hint = installHint("nft", family);
//   => "   Debian/Ubuntu: sudo apt install nftables"

#pragma once

#include <map>
#include <string>

enum class DistroFamily { Debian, Fedora, Arch, Unknown };

constexpr const char *OS_RELEASE_PATH = "/etc/os-release";

using OsReleaseFields = std::map<std::string, std::string>;

// missing file => empty map
OsReleaseFields readOsRelease(const std::string &path = OS_RELEASE_PATH);
OsReleaseFields parseOsRelease(const std::string &contents);

DistroFamily detectDistroFamily(const OsReleaseFields &fields);

// remediation text for a missing tool; all families when unknown
std::string installHint(const std::string &tool, DistroFamily family);
