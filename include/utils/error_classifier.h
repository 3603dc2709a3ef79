// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace netpanel {

/**
 * @brief Triage outcome for an nmcli error message
 *
 * nmcli has no structured error protocol, so every call site classifies the
 * raw message through classify_nmcli_error(). Matching is case-insensitive
 * substring matching against the phrase table in error_classifier.cpp;
 * anything unmatched is Fatal.
 */
enum class NmcliErrorClass {
    ActivationQueued,      ///< "activation was enqueued": not a failure
    KeyMgmtMissing,        ///< "802-11-wireless-security.key-mgmt: property is missing"
    ConnectionInterrupted, ///< "base network connection was interrupted"
    NetworkNotFound,       ///< "No network with SSID 'x' found"
    AlreadyExists,         ///< profile add collided with an existing one
    UnknownConnection,     ///< "Error: unknown connection 'x'"
    Fatal                  ///< Anything else
};

/**
 * @brief Classify a message; the first matching table row wins
 *
 * Precedence: ActivationQueued, KeyMgmtMissing, ConnectionInterrupted,
 * NetworkNotFound, AlreadyExists, UnknownConnection.
 */
NmcliErrorClass classify_nmcli_error(const std::string& message);

/**
 * @brief Test a message against one class only, ignoring precedence
 */
bool matches_error_class(const std::string& message, NmcliErrorClass cls);

/**
 * @brief True for classes recovered by "rescan, then retry once"
 */
bool is_rescan_recoverable(NmcliErrorClass cls);

const char* nmcli_error_class_name(NmcliErrorClass cls);

} // namespace netpanel
