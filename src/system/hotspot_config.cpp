// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hotspot_config.h"

#include "utils/network_validation.h"

#include <algorithm>
#include <cctype>

namespace netpanel {

bool validate_hotspot_ssid(const std::string& ssid, std::string& reason) {
    if (ssid.empty() || ssid.size() > MAX_SSID_BYTES) {
        reason = "SSID must be 1-32 characters";
        return false;
    }
    if (!is_printable_ascii(ssid)) {
        reason = "SSID must contain only printable ASCII characters";
        return false;
    }
    return true;
}

bool validate_hotspot_password(const std::string& password, std::string& reason) {
    if (password.empty()) {
        return true;
    }
    if (password.size() < MIN_PSK_LENGTH || password.size() > MAX_PSK_LENGTH) {
        reason = "Password must be 8-63 characters, or empty for an open hotspot";
        return false;
    }
    if (!is_printable_ascii(password)) {
        reason = "Password must contain only printable ASCII characters";
        return false;
    }
    return true;
}

bool HotspotConfig::validate(std::string& reason) const {
    if (!validate_hotspot_ssid(ssid, reason) || !validate_hotspot_password(password, reason)) {
        return false;
    }

    if (band != HOTSPOT_AUTO && band != "2.4 GHz" && band != "5 GHz") {
        reason = "Band must be 2.4 GHz, 5 GHz or Auto";
        return false;
    }

    if (channel != HOTSPOT_AUTO) {
        bool numeric = !channel.empty() && channel.size() <= 3 &&
                       std::all_of(channel.begin(), channel.end(),
                                   [](unsigned char c) { return std::isdigit(c); });
        if (!numeric || std::stoi(channel) == 0) {
            reason = "Channel must be Auto or a channel number";
            return false;
        }
    }
    return true;
}

std::string band_to_nmcli(const std::string& band) {
    return band == "5 GHz" ? "a" : "bg";
}

bool AppSettings::validate(std::string& reason) const {
    if (color_scheme != "system" && color_scheme != "light" && color_scheme != "dark") {
        reason = "Color scheme must be system, light or dark";
        return false;
    }
    return true;
}

} // namespace netpanel
