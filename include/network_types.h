// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netpanel {

/**
 * @brief One reconciled Wi-Fi network as seen in a scan
 *
 * Identity for deduplication is (ssid, band).
 */
struct WifiNetwork {
    std::string ssid;          ///< Network name, may repeat across bands
    int signal = 0;            ///< Signal strength (0-100 percentage)
    bool secured = false;      ///< True if network requires credentials
    bool connected = false;    ///< True if this is the active network
    std::string band;          ///< "2.4 GHz", "5 GHz", "6 GHz" or "Unknown"
    uint32_t channel = 0;      ///< 0 = unknown
    uint32_t freq_mhz = 0;     ///< Centre frequency
    std::string security_type; ///< "Open", "WEP", "WPA", "WPA2", "WPA3" or "Secured"
};

/**
 * @brief One raw row of `nmcli device wifi list`, before reconciliation
 */
struct ScanRow {
    std::string ssid;
    int signal = 0;
    std::string security;
    bool active = false;
    uint32_t channel = 0;
    uint32_t freq_mhz = 0;
};

/**
 * @brief Result of an activation request
 */
enum class ConnectStatus {
    Connected, ///< nmcli reported the connection as activated
    Queued     ///< nmcli accepted the request asynchronously
};

const char* connect_status_name(ConnectStatus status);

/**
 * @brief Details for the network detail view
 *
 * Merged from a saved-profile lookup and a live-device lookup.
 */
struct NetworkInfo {
    std::optional<std::string> connection_type;
    std::optional<std::string> mac_address; ///< BSSID list or hardware address
    std::optional<std::string> ip_address;
    std::optional<std::string> gateway;
    std::optional<std::string> subnet_mask;
    std::vector<std::string> dns; ///< In nmcli index order
    std::optional<std::string> ipv6_address;
    std::optional<std::string> interface;
    std::optional<uint32_t> link_speed_mbps;
    std::optional<std::string> state;
    std::optional<std::string> uuid;
    std::optional<uint32_t> dhcp_lease_time_seconds;
};

/**
 * @brief A saved Wi-Fi profile
 */
struct SavedConnection {
    std::string uuid;
    std::string ssid;
};

/**
 * @brief A saved wired profile, as listed for the wired view
 */
struct WiredConnection {
    std::string name;
    std::string uuid;
    std::string device; ///< Empty when inactive
    bool active = false;
};

/**
 * @brief A client attached to the hotspot
 *
 * Identity is the MAC address, falling back to the IP address.
 */
struct ConnectedDevice {
    std::string ip;
    std::string mac;
    std::optional<std::string> hostname;
    std::optional<int64_t> lease_expiry; ///< Epoch seconds

    std::string identity() const {
        return mac.empty() ? ip : mac;
    }
};

/**
 * @brief Coarse device category, used to pick an icon
 */
enum class DeviceKind { Phone, Computer, Tv, Iot, Unknown };

const char* device_kind_name(DeviceKind kind);

} // namespace netpanel
