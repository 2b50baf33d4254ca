// src/system/Platform.hpp

#pragma once

#include <string>

#if defined(_WIN32) || defined(_WIN64) || defined(__WIN32__)
#define HOTSPOT_BRIDGE_PLATFORM_WINDOWS
#elif defined(__APPLE__) && defined(__MACH__)
#define HOTSPOT_BRIDGE_PLATFORM_MACOS
#elif defined(__linux__) || defined(__gnu_linux__)
#define HOTSPOT_BRIDGE_PLATFORM_LINUX
#endif

enum class Platform { Linux, MacOS, Windows, Unknown };

// the platform this binary was built for
constexpr Platform currentPlatform() {
#if defined(HOTSPOT_BRIDGE_PLATFORM_LINUX)
  return Platform::Linux;
#elif defined(HOTSPOT_BRIDGE_PLATFORM_MACOS)
  return Platform::MacOS;
#elif defined(HOTSPOT_BRIDGE_PLATFORM_WINDOWS)
  return Platform::Windows;
#else
  return Platform::Unknown;
#endif
}

std::string platformName(Platform platform);
