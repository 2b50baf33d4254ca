// src/system/Platform.cpp

#include "Platform.hpp"

std::string platformName(Platform platform) {
  switch (platform) {
  case Platform::Linux:
    return "Linux";
  case Platform::MacOS:
    return "macOS";
  case Platform::Windows:
    return "Windows";
  case Platform::Unknown:
    break;
  }
  return "Unknown";
}
