// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "connection_orchestrator.h"

#include "utils/error_classifier.h"
#include "utils/network_validation.h"
#include "utils/nmcli_parser.h"

#include <spdlog/spdlog.h>

namespace netpanel {

std::string key_mgmt_from_security_hint(const std::optional<std::string>& hint) {
    if (!hint) {
        return "wpa-psk";
    }
    std::string lower = to_lower(*hint);
    if (lower.find("wpa3") != std::string::npos) {
        return "sae";
    }
    if (lower.find("wep") != std::string::npos) {
        return "none";
    }
    return "wpa-psk";
}

ConnectionOrchestrator::ConnectionOrchestrator(CommandExecutor& executor)
    : executor_(executor), query_(executor) {}

CommandResult ConnectionOrchestrator::nmcli(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.emplace_back(NMCLI);
    argv.insert(argv.end(), args.begin(), args.end());
    spdlog::trace("[Connect] exec: {}", describe_command(argv));
    return executor_.run(argv);
}

NetError ConnectionOrchestrator::attempt(const std::vector<std::string>& args,
                                         const std::string& context, bool retry_on_not_found,
                                         ConnectStatus& status, bool* key_mgmt_missing) {
    if (key_mgmt_missing) {
        *key_mgmt_missing = false;
    }

    CommandResult result = nmcli(args);
    if (result.ok()) {
        status = ConnectStatus::Connected;
        return NetErrorHelper::success();
    }

    std::string message = result.error_text();
    NmcliErrorClass cls = classify_nmcli_error(message);
    spdlog::debug("[Connect] Attempt failed ({}): {}", nmcli_error_class_name(cls), message);

    if (cls == NmcliErrorClass::KeyMgmtMissing && key_mgmt_missing) {
        *key_mgmt_missing = true;
        return command_error(result, context);
    }
    if (cls == NmcliErrorClass::ActivationQueued) {
        status = ConnectStatus::Queued;
        return NetErrorHelper::success();
    }

    // Not-found only retries where a rescan can surface the network
    bool retry = is_rescan_recoverable(cls) &&
                 (retry_on_not_found || cls != NmcliErrorClass::NetworkNotFound);
    if (!retry) {
        return command_error(result, context);
    }

    spdlog::info("[Connect] Retrying after rescan ({})", nmcli_error_class_name(cls));
    query_.request_rescan();

    result = nmcli(args);
    if (result.ok()) {
        status = ConnectStatus::Connected;
        return NetErrorHelper::success();
    }

    message = result.error_text();
    cls = classify_nmcli_error(message);
    if (cls == NmcliErrorClass::ActivationQueued) {
        status = ConnectStatus::Queued;
        return NetErrorHelper::success();
    }
    if (cls == NmcliErrorClass::KeyMgmtMissing && key_mgmt_missing) {
        *key_mgmt_missing = true;
    }
    return command_error(result, context);
}

// ============================================================================
// Connect
// ============================================================================

NetError ConnectionOrchestrator::connect_open(const std::string& ssid, ConnectStatus& status) {
    std::string reason;
    if (!validate_connect_ssid(ssid, reason)) {
        spdlog::error("[Connect] Rejected SSID: {}", reason);
        return NetErrorHelper::invalid_parameters(reason);
    }

    spdlog::info("[Connect] Connecting to open network '{}'", ssid);
    NetError err = attempt({"device", "wifi", "connect", ssid}, "Failed to connect", true, status,
                           nullptr);
    if (err) {
        spdlog::info("[Connect] '{}': {}", ssid, connect_status_name(status));
    } else {
        spdlog::warn("[Connect] {}", err.user_msg);
    }
    return err;
}

NetError ConnectionOrchestrator::connect_secured(const std::string& ssid,
                                                 const std::string& password,
                                                 const std::optional<std::string>& security_hint,
                                                 ConnectStatus& status) {
    std::string reason;
    if (!validate_connect_ssid(ssid, reason) || !validate_connect_password(password, reason)) {
        spdlog::error("[Connect] Rejected input: {}", reason);
        return NetErrorHelper::invalid_parameters(reason);
    }

    spdlog::info("[Connect] Connecting to secured network '{}'", ssid);
    bool key_mgmt_missing = false;
    NetError err = attempt({"device", "wifi", "connect", ssid, "password", password},
                           "Failed to connect", true, status, &key_mgmt_missing);

    if (!err && key_mgmt_missing) {
        spdlog::info("[Connect] key-mgmt missing for '{}', creating profile explicitly", ssid);
        err = create_secured_profile(ssid, password, security_hint, status);
    }

    if (err) {
        spdlog::info("[Connect] '{}': {}", ssid, connect_status_name(status));
    } else {
        spdlog::warn("[Connect] {}", err.user_msg);
    }
    return err;
}

NetError ConnectionOrchestrator::create_secured_profile(
    const std::string& ssid, const std::string& password,
    const std::optional<std::string>& security_hint, ConnectStatus& status) {
    std::string device;
    NetError err = query_.find_available_wifi_device(device);
    if (!err) {
        return err;
    }

    CommandResult add = nmcli(
        {"connection", "add", "type", "wifi", "ifname", device, "con-name", ssid, "ssid", ssid});
    if (!add.ok()) {
        std::string message = add.error_text();
        if (matches_error_class(message, NmcliErrorClass::AlreadyExists)) {
            spdlog::debug("[Connect] Profile '{}' already exists, reusing it", ssid);
        } else {
            // The modify below reports the real problem if the profile is unusable
            spdlog::warn("[Connect] Adding profile '{}' failed: {}", ssid, message);
        }
    }

    std::string key_mgmt = key_mgmt_from_security_hint(security_hint);
    std::vector<std::string> modify = {"connection", "modify", ssid, "wifi-sec.key-mgmt", key_mgmt};
    if (key_mgmt == "none") {
        modify.insert(modify.end(), {"wifi-sec.wep-key0", password});
    } else {
        modify.insert(modify.end(), {"wifi-sec.psk", password});
    }

    CommandResult result = nmcli(modify);
    if (!result.ok()) {
        return command_error(result, "Failed to set security");
    }

    return activate_saved(ssid, status);
}

NetError ConnectionOrchestrator::activate_saved(const std::string& name, ConnectStatus& status) {
    if (name.empty()) {
        return NetErrorHelper::invalid_parameters("Connection name cannot be empty");
    }

    spdlog::info("[Connect] Activating saved connection '{}'", name);
    return attempt({"connection", "up", name}, "Failed to activate connection", false, status,
                   nullptr);
}

NetError ConnectionOrchestrator::connect_known(const std::string& ssid, ConnectStatus& status) {
    NetError err = activate_saved(ssid, status);
    if (err || !matches_error_class(err.technical_msg, NmcliErrorClass::NetworkNotFound)) {
        return err;
    }

    spdlog::info("[Connect] Saved profile for '{}' did not find the network, reconnecting", ssid);
    std::string password;
    if (query_.get_saved_password_for_ssid(ssid, password)) {
        return connect_secured(ssid, password, std::nullopt, status);
    }
    return connect_open(ssid, status);
}

// ============================================================================
// Disconnect
// ============================================================================

NetError ConnectionOrchestrator::disconnect(const std::string& ssid) {
    if (ssid.empty()) {
        return NetErrorHelper::invalid_parameters("SSID cannot be empty");
    }

    spdlog::info("[Connect] Disconnecting '{}'", ssid);
    CommandResult down = nmcli({"connection", "down", ssid});
    if (down.ok()) {
        return NetErrorHelper::success();
    }
    spdlog::debug("[Connect] connection down failed: {}", down.error_text());

    auto device = query_.get_device_for_active_ssid(ssid);
    if (!device) {
        return command_error(down, "Failed to disconnect");
    }

    CommandResult result = nmcli({"device", "disconnect", *device});
    if (!result.ok()) {
        return command_error(result, "Failed to disconnect device " + *device);
    }
    return NetErrorHelper::success();
}

} // namespace netpanel
