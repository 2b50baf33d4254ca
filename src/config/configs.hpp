// src/config/configs.hpp

#pragma once

#include <cstddef>

// Hotspot defaults
constexpr const char *DEFAULT_SSID = "thronetools";
constexpr std::size_t MIN_PASSWORD_LENGTH = 8;

// NetworkManager names the connection created by "nmcli dev wifi hotspot"
constexpr const char *DEFAULT_CONNECTION_NAME = "Hotspot";

// Tunnel side, owned by the tunneling application
constexpr const char *DEFAULT_TUNNEL_INTERFACE = "nekoray-tun";
constexpr const char *DEFAULT_REQUIRED_TABLE = "sing-box"; // inet family

// Our own nftables table (ip family)
constexpr const char *DEFAULT_NAT_TABLE = "throne_hotspot";

// macOS
constexpr const char *DEFAULT_AIRPORT_TOOL =
    "/System/Library/PrivateFrameworks/Apple80211.framework/Versions/Current/"
    "Resources/airport";
constexpr const char *DEFAULT_INTERNET_SHARING_PLIST =
    "/System/Library/LaunchDaemons/com.apple.InternetSharing.plist";

// Config file
constexpr const char *DEFAULT_CONFIG_PATH = "/etc/hotspot-bridge/config.json";
