// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/network_validation.h"

#include "utils/nmcli_parser.h"

#include <algorithm>
#include <cctype>

namespace netpanel {

bool has_control_chars(const std::string& value) {
    return std::any_of(value.begin(), value.end(), [](char ch) {
        unsigned char c = static_cast<unsigned char>(ch);
        return c < 32 || c == 127;
    });
}

bool is_printable_ascii(const std::string& value) {
    return std::all_of(value.begin(), value.end(), [](char ch) {
        unsigned char c = static_cast<unsigned char>(ch);
        return c >= 32 && c < 127;
    });
}

bool validate_connect_ssid(const std::string& ssid, std::string& reason) {
    if (ssid.empty()) {
        reason = "SSID cannot be empty";
        return false;
    }
    if (ssid.size() > MAX_SSID_BYTES) {
        reason = "SSID must be at most 32 bytes";
        return false;
    }
    if (has_control_chars(ssid)) {
        reason = "SSID contains invalid characters";
        return false;
    }
    return true;
}

bool validate_connect_password(const std::string& password, std::string& reason) {
    if (password.empty()) {
        reason = "Password cannot be empty";
        return false;
    }
    if (has_control_chars(password)) {
        reason = "Password contains invalid characters";
        return false;
    }
    return true;
}

bool is_valid_ipv4_address(const std::string& address_raw) {
    std::string address = trim(address_raw);
    if (address.empty() || address.front() == '.' || address.back() == '.') {
        return false;
    }

    size_t segment_start = 0;
    int octet_count = 0;
    for (size_t i = 0; i <= address.length(); i++) {
        if (i < address.length() && address[i] != '.') {
            continue;
        }

        std::string segment = address.substr(segment_start, i - segment_start);

        // Empty segment (e.g., "192..1.1") or oversized octet
        if (segment.empty() || segment.length() > 3) {
            return false;
        }
        if (!std::all_of(segment.begin(), segment.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        if (std::stoi(segment) > 255) {
            return false;
        }

        octet_count++;
        segment_start = i + 1;
    }

    return octet_count == 4;
}

bool is_valid_interface_name(const std::string& name) {
    // IFNAMSIZ is 16 including the terminator
    if (name.empty() || name.length() > 15 || name[0] == '-') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

} // namespace netpanel
