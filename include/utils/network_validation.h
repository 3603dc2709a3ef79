// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace netpanel {

/// Longest SSID an 802.11 beacon can carry, in bytes
constexpr size_t MAX_SSID_BYTES = 32;

/// WPA-PSK passphrase bounds
constexpr size_t MIN_PSK_LENGTH = 8;
constexpr size_t MAX_PSK_LENGTH = 63;

/**
 * @brief Check a string for control characters
 *
 * Rejects 0x00-0x1F and DEL (0x7F). Bytes >= 0x80 are allowed so UTF-8
 * SSIDs survive.
 */
bool has_control_chars(const std::string& value);

/**
 * @brief True when every byte is printable ASCII (0x20-0x7E)
 */
bool is_printable_ascii(const std::string& value);

/**
 * @brief Validate an SSID handed to a connect operation
 *
 * Non-empty, at most 32 bytes, no control characters.
 *
 * @param ssid Network name
 * @param reason Set to a user-facing explanation on failure
 * @return true if valid
 */
bool validate_connect_ssid(const std::string& ssid, std::string& reason);

/**
 * @brief Validate a password handed to a connect operation
 *
 * Non-empty and free of control characters. Length is left to
 * NetworkManager, which knows the key management in use.
 */
bool validate_connect_password(const std::string& password, std::string& reason);

/**
 * @brief Validate a dotted-quad IPv4 address
 *
 * Exactly four decimal octets, each 0-255. Surrounding whitespace is ignored.
 */
bool is_valid_ipv4_address(const std::string& address);

/**
 * @brief Validate a Linux network interface name
 *
 * 1-15 characters of [A-Za-z0-9_.-], not starting with '-'. Names are passed
 * to nmcli as a single argument, but rejecting junk early gives a better
 * error than NetworkManager's.
 */
bool is_valid_interface_name(const std::string& name);

} // namespace netpanel
