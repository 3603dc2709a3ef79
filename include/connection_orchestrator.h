// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_executor.h"
#include "net_error.h"
#include "network_query.h"
#include "network_types.h"

#include <optional>
#include <string>
#include <vector>

namespace netpanel {

/**
 * @brief Map a scan security label to an nmcli key-mgmt value
 *
 * Case-insensitive: contains "wpa3" -> "sae", contains "wep" -> "none",
 * anything else (or no hint) -> "wpa-psk".
 */
std::string key_mgmt_from_security_hint(const std::optional<std::string>& hint);

/**
 * @brief Drives connect, activate and disconnect through nmcli
 *
 * Each call is a self-contained attempt:
 *
 *   Idle -> Attempting -> Connected
 *                      -> Queued     ("activation was enqueued")
 *                      -> Retrying   (transient error: rescan once, try once more)
 *                      -> Failed     (anything else, message wrapped with context)
 *
 * Every nmcli failure goes through classify_nmcli_error() before it reaches
 * the caller. No state survives between calls.
 */
class ConnectionOrchestrator {
  public:
    explicit ConnectionOrchestrator(CommandExecutor& executor);

    /**
     * @brief Connect to an open network
     *
     * Interrupted or not-found errors trigger one rescan and one retry.
     */
    NetError connect_open(const std::string& ssid, ConnectStatus& status);

    /**
     * @brief Connect to a secured network with a password
     *
     * Same retry policy as connect_open(). When nmcli reports a missing
     * key-mgmt property, a profile is created explicitly instead:
     * resolve a Wi-Fi device, add a bare profile (an existing one is fine),
     * set key-mgmt and the secret from @p security_hint, then activate it.
     *
     * @param security_hint Security label from the scan ("WPA2", "WEP", ...)
     */
    NetError connect_secured(const std::string& ssid, const std::string& password,
                             const std::optional<std::string>& security_hint,
                             ConnectStatus& status);

    /**
     * @brief Activate a saved profile by name
     *
     * An interrupted connection is retried once after a rescan.
     */
    NetError activate_saved(const std::string& name, ConnectStatus& status);

    /**
     * @brief Deactivate the connection, falling back to a device disconnect
     */
    NetError disconnect(const std::string& ssid);

    /**
     * @brief Bring up a known network, reconnecting from scratch if its profile is stale
     *
     * Tries activate_saved(). If that fails because the network was not found,
     * connects again using the stored password when one exists, or as an open
     * network otherwise.
     */
    NetError connect_known(const std::string& ssid, ConnectStatus& status);

  private:
    CommandExecutor& executor_;
    NetworkQuery query_;

    CommandResult nmcli(const std::vector<std::string>& args);

    /**
     * @brief Run a connect/activate command with classification and one retry
     *
     * @param args nmcli arguments
     * @param context Prefix for the wrapped error ("Failed to connect")
     * @param retry_on_not_found Whether NetworkNotFound also earns a retry
     * @param key_mgmt_missing Set when the final error was KeyMgmtMissing
     */
    NetError attempt(const std::vector<std::string>& args, const std::string& context,
                     bool retry_on_not_found, ConnectStatus& status, bool* key_mgmt_missing);

    NetError create_secured_profile(const std::string& ssid, const std::string& password,
                                    const std::optional<std::string>& security_hint,
                                    ConnectStatus& status);
};

} // namespace netpanel
