// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace netpanel {

/// Band/channel value meaning "let NetworkManager choose"
constexpr const char* HOTSPOT_AUTO = "Auto";

/**
 * @brief Access point settings
 *
 * Validated before every read and write; an invalid config is never
 * persisted or applied.
 */
struct HotspotConfig {
    std::string ssid;
    std::string password;           ///< Empty for an open hotspot
    std::string band = HOTSPOT_AUTO; ///< "2.4 GHz", "5 GHz" or "Auto"
    std::string channel = HOTSPOT_AUTO; ///< "Auto" or a channel number
    bool hidden = false;

    /**
     * @brief Check every field
     *
     * @param reason Set to a user-facing explanation on failure
     */
    bool validate(std::string& reason) const;
};

/**
 * @brief SSID rule: 1-32 printable ASCII characters
 */
bool validate_hotspot_ssid(const std::string& ssid, std::string& reason);

/**
 * @brief Password rule: empty, or 8-63 printable ASCII characters
 */
bool validate_hotspot_password(const std::string& password, std::string& reason);

/**
 * @brief nmcli band value: "5 GHz" -> "a", everything else -> "bg"
 */
std::string band_to_nmcli(const std::string& band);

/**
 * @brief Front-end preferences kept next to the hotspot settings
 */
struct AppSettings {
    std::string color_scheme = "system"; ///< "system", "light" or "dark"
    bool auto_scan = true;
    bool expand_connected_details = false;

    bool validate(std::string& reason) const;
};

} // namespace netpanel
