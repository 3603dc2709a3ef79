// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_executor.h"
#include "net_error.h"
#include "network_types.h"
#include "utils/nmcli_parser.h"

#include <optional>
#include <string>
#include <vector>

namespace netpanel {

/// Reserved profile name of the software access point
constexpr const char* HOTSPOT_CONNECTION_NAME = "Hotspot";

/**
 * @brief Read-side NetworkManager queries and simple profile edits
 *
 * Holds only a reference to the executor: every call re-reads nmcli output,
 * so results always reflect changes made by other tools in the meantime.
 */
class NetworkQuery {
  public:
    explicit NetworkQuery(CommandExecutor& executor);

    // ========================================================================
    // Radio / Hardware
    // ========================================================================

    NetError is_wifi_enabled(bool& enabled);
    NetError set_wifi_enabled(bool enabled);
    NetError has_wifi_device(bool& present);
    NetError has_ethernet_device(bool& present);

    /**
     * @brief First Wi-Fi device whose state is not "unavailable"
     */
    NetError find_available_wifi_device(std::string& device);

    // ========================================================================
    // Scanning
    // ========================================================================

    /**
     * @brief Rescan and return reconciled networks (connected first, then by signal)
     */
    NetError scan_networks(std::vector<WifiNetwork>& networks);

    /**
     * @brief Ask NetworkManager to rescan; result is ignored by design of callers
     */
    void request_rescan();

    // ========================================================================
    // Active State
    // ========================================================================

    NetError get_active_wifi_ssid(std::optional<std::string>& ssid);

    /**
     * @brief Active ethernet connection name ("Wired connection" when unnamed)
     */
    NetError get_active_wired_connection(std::optional<std::string>& name);

    /**
     * @brief Name of the connection on the first connected device
     */
    NetError get_active_connection_name(std::optional<std::string>& name);

    /**
     * @brief Device currently carrying `ssid`, from the live scan table
     */
    std::optional<std::string> get_device_for_active_ssid(const std::string& ssid);

    /**
     * @brief Details for one network, merged from profile and live device
     *
     * Never fails: missing profile or inactive device simply leave fields empty.
     */
    NetworkInfo get_network_info(const std::string& ssid);

    // ========================================================================
    // Saved Profiles
    // ========================================================================

    NetError get_saved_connections(std::vector<SavedConnection>& connections);
    NetError is_network_saved(const std::string& ssid, bool& saved);
    NetError get_saved_password_for_ssid(const std::string& ssid, std::string& password);
    NetError delete_connection(const std::string& name_or_uuid);
    NetError get_autoconnect(const std::string& ssid, bool& enabled);
    NetError set_autoconnect(const std::string& ssid, bool enabled);

    // ========================================================================
    // Wired
    // ========================================================================

    /**
     * @brief Ethernet profiles, active first, then by name
     */
    NetError get_wired_connections(std::vector<WiredConnection>& connections);

    /**
     * @brief Connect or disconnect every ethernet device
     */
    NetError set_ethernet_enabled(bool enabled);

    NetError is_ethernet_enabled(bool& enabled);

    // ========================================================================
    // DNS
    // ========================================================================

    /**
     * @brief Set static DNS servers; an empty list restores automatic DNS
     */
    NetError set_ipv4_dns(const std::string& connection, const std::vector<std::string>& servers);

    /**
     * @brief Re-activate a connection so modified settings take effect
     */
    NetError reapply_connection(const std::string& connection);

  private:
    CommandExecutor& executor_;

    CommandResult nmcli(const std::vector<std::string>& args);

    /**
     * @brief Run nmcli and parse its key-value output
     * @return std::nullopt when nmcli fails
     */
    std::optional<KeyValueMap> key_value_map(const std::vector<std::string>& args);

    /**
     * @brief List (DEVICE, TYPE, STATE, CONNECTION) rows of `device status`
     */
    NetError list_devices(std::vector<std::vector<std::string>>& rows);

    void fill_from_profile(NetworkInfo& info, const KeyValueMap& profile, bool only_missing);
};

} // namespace netpanel
