// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace netpanel {

/**
 * @brief Network operation result with detailed error information
 */
enum class NetResult {
    SUCCESS = 0,            ///< Operation succeeded
    INVALID_PARAMETERS,     ///< Invalid SSID, password, or other parameters
    DEVICE_NOT_FOUND,       ///< Requested interface does not exist
    DEVICE_WRONG_TYPE,      ///< Interface exists but is not a Wi-Fi device
    HARDWARE_NOT_AVAILABLE, ///< No usable Wi-Fi device at all
    EXEC_FAILED,            ///< nmcli (or helper tool) could not be run or timed out
    COMMAND_FAILED,         ///< nmcli ran and reported an unrecoverable failure
    ACTIVATION_FAILED,      ///< Activation finished but the connection never came up
    IO_ERROR                ///< Config or lease file problems
};

/**
 * @brief Detailed error information for network operations
 */
struct NetError {
    NetResult result;          ///< Primary error code
    std::string technical_msg; ///< Technical details for logging/debugging
    std::string user_msg;      ///< User-facing message, shown verbatim
    std::string suggestion;    ///< Suggested action for user (optional)

    NetError(NetResult r = NetResult::SUCCESS, const std::string& tech = "",
             const std::string& user = "", const std::string& suggest = "")
        : result(r), technical_msg(tech), user_msg(user), suggestion(suggest) {}

    bool success() const {
        return result == NetResult::SUCCESS;
    }
    operator bool() const {
        return success();
    }
};

/**
 * @brief Factory helpers for the common error shapes
 */
class NetErrorHelper {
  public:
    static NetError success() {
        return NetError(NetResult::SUCCESS);
    }

    static NetError invalid_parameters(const std::string& detail) {
        return NetError(NetResult::INVALID_PARAMETERS, detail, detail,
                        "Check the value and try again");
    }

    static NetError device_not_found(const std::string& iface) {
        return NetError(NetResult::DEVICE_NOT_FOUND, "Device " + iface + " not found",
                        "WiFi device " + iface + " not found",
                        "Select another wireless interface");
    }

    static NetError device_wrong_type(const std::string& iface, const std::string& type) {
        return NetError(NetResult::DEVICE_WRONG_TYPE,
                        "Device " + iface + " has type " + type,
                        "Device " + iface + " is not a WiFi device (type: " + type + ")",
                        "Select a wireless interface");
    }

    static NetError hardware_not_available(const std::string& detail) {
        return NetError(NetResult::HARDWARE_NOT_AVAILABLE, detail, detail,
                        "Make sure you have a wireless network adapter");
    }

    static NetError exec_failed(const std::string& program, const std::string& detail) {
        return NetError(NetResult::EXEC_FAILED, program + ": " + detail,
                        "Could not run " + program,
                        "Check that NetworkManager is installed and running");
    }

    /**
     * @brief Fatal utility failure, wrapped with context
     *
     * @param context Prefix such as "Failed to connect"
     * @param message Raw nmcli error text
     */
    static NetError command_failed(const std::string& context, const std::string& message) {
        return NetError(NetResult::COMMAND_FAILED, message, context + ": " + message);
    }

    static NetError activation_failed(const std::string& message) {
        return NetError(NetResult::ACTIVATION_FAILED, message, message,
                        "Check that the interface supports access point mode");
    }

    static NetError io_error(const std::string& detail) {
        return NetError(NetResult::IO_ERROR, detail, detail);
    }
};

/**
 * @brief Short name for a result code, used in logs
 */
const char* net_result_name(NetResult result);

} // namespace netpanel
