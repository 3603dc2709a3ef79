// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hotspot_manager.h"

#include "network_query.h"
#include "utils/error_classifier.h"
#include "utils/network_validation.h"
#include "utils/nmcli_parser.h"

#include <spdlog/spdlog.h>

#include <thread>

namespace netpanel {

const char* hotspot_state_name(HotspotState state) {
    switch (state) {
    case HotspotState::Off:
        return "off";
    case HotspotState::Starting:
        return "starting";
    case HotspotState::On:
        return "on";
    case HotspotState::Stopping:
        return "stopping";
    case HotspotState::Error:
        return "error";
    }
    return "unknown";
}

namespace {

bool is_wireless_type(const std::string& type) {
    return type == "802-11-wireless" || type == "wifi";
}

// nmcli rejects wifi.channel without wifi.band
std::string band_for_channel(const std::string& channel) {
    return parse_u32_digits(channel) > 14 ? "a" : "bg";
}

} // namespace

HotspotManager::HotspotManager(CommandExecutor& executor, HotspotTimings timings)
    : executor_(executor), timings_(timings) {}

void HotspotManager::set_state_observer(StateObserver observer) {
    observer_ = std::move(observer);
}

CommandResult HotspotManager::nmcli(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.emplace_back(NMCLI);
    argv.insert(argv.end(), args.begin(), args.end());
    spdlog::trace("[Hotspot] exec: {}", describe_command(argv));
    return executor_.run(argv);
}

void HotspotManager::wait(std::chrono::milliseconds duration) {
    if (duration.count() > 0) {
        std::this_thread::sleep_for(duration);
    }
}

void HotspotManager::notify(HotspotState state) {
    spdlog::debug("[Hotspot] State: {}", hotspot_state_name(state));
    if (observer_) {
        observer_(state);
    }
}

// ============================================================================
// Start
// ============================================================================

NetError HotspotManager::start(const HotspotConfig& config, const std::string& interface) {
    std::string reason;
    if (!config.validate(reason)) {
        spdlog::error("[Hotspot] Invalid configuration: {}", reason);
        return NetErrorHelper::invalid_parameters(reason);
    }

    std::string iface = interface;
    if (iface.empty()) {
        std::vector<std::string> devices;
        NetError err = get_wifi_devices(devices);
        if (!err) {
            return err;
        }
        iface = devices.front();
        spdlog::debug("[Hotspot] No interface given, using {}", iface);
    } else if (!is_valid_interface_name(iface)) {
        return NetErrorHelper::invalid_parameters("Invalid interface name: " + iface);
    }

    notify(HotspotState::Starting);
    NetError err = start_on(config, iface);
    notify(err ? HotspotState::On : HotspotState::Error);
    return err;
}

NetError HotspotManager::start_on(const HotspotConfig& config, const std::string& interface) {
    spdlog::info("[Hotspot] Starting '{}' on {}", config.ssid, interface);

    NetError err = check_device(interface);
    if (!err) {
        return err;
    }

    disconnect_clients(interface);
    stop_shared_connections();

    if (profile_exists()) {
        spdlog::info("[Hotspot] Removing existing hotspot profile");
        remove_profile();
        wait(timings_.profile_delete);
    }

    if (!create_fast(config, interface)) {
        // A failed fast path can leave a half-made profile behind
        if (profile_exists()) {
            remove_profile();
        }
        err = create_manual(config, interface);
        if (!err) {
            return err;
        }
    }

    wait(timings_.activation_verify);
    bool active = false;
    if (is_active(active) && active) {
        spdlog::info("[Hotspot] '{}' is up", config.ssid);
        return NetErrorHelper::success();
    }

    return activate();
}

NetError HotspotManager::check_device(const std::string& interface) {
    CommandResult result = nmcli({"-t", "-f", "DEVICE,TYPE", "device", "status"});
    if (!result.ok()) {
        return command_error(result, "Failed to list devices");
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_left(trim(line), 2);
        if (fields.size() < 2 || fields[0] != interface) {
            continue;
        }
        if (fields[1] != "wifi") {
            return NetErrorHelper::device_wrong_type(interface, fields[1]);
        }
        return NetErrorHelper::success();
    }
    return NetErrorHelper::device_not_found(interface);
}

void HotspotManager::disconnect_clients(const std::string& interface) {
    CommandResult result = nmcli({"-t", "-f", "NAME,DEVICE,TYPE", "connection", "show", "--active"});
    if (!result.ok()) {
        spdlog::debug("[Hotspot] Could not list active connections: {}", result.error_text());
        return;
    }

    bool dropped = false;
    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_right(trim(line), 3);
        if (fields.size() < 3 || fields[1] != interface || !is_wireless_type(fields[2])) {
            continue;
        }
        if (fields[0] == HOTSPOT_CONNECTION_NAME) {
            continue;
        }

        spdlog::info("[Hotspot] Disconnecting '{}' from {}", fields[0], interface);
        CommandResult down = nmcli({"connection", "down", fields[0]});
        if (!down.ok()) {
            spdlog::debug("[Hotspot] Ignoring failed disconnect: {}", down.error_text());
        }
        dropped = true;
    }

    if (dropped) {
        wait(timings_.client_settle);
    }
}

void HotspotManager::stop_shared_connections() {
    CommandResult result = nmcli({"-t", "-f", "NAME,TYPE", "connection", "show", "--active"});
    if (!result.ok()) {
        spdlog::debug("[Hotspot] Could not list active connections: {}", result.error_text());
        return;
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_right(trim(line), 2);
        if (fields.size() < 2 || !is_wireless_type(fields[1])) {
            continue;
        }
        const std::string& name = fields[0];
        if (name == HOTSPOT_CONNECTION_NAME) {
            continue;
        }

        CommandResult detail = nmcli(
            {"-t", "-f", "ipv4.method,802-11-wireless.mode", "connection", "show", name});
        if (!detail.ok()) {
            continue;
        }
        KeyValueMap props = parse_key_value_output(detail.out);
        bool shared = get_value(props, "ipv4.method").value_or("") == "shared";
        bool ap = get_value(props, "802-11-wireless.mode").value_or("") == "ap";
        if (!shared && !ap) {
            continue;
        }

        spdlog::info("[Hotspot] Stopping conflicting access point '{}'", name);
        CommandResult down = nmcli({"connection", "down", name});
        if (!down.ok()) {
            spdlog::debug("[Hotspot] Ignoring failed stop: {}", down.error_text());
        }
        wait(timings_.shared_cleanup);
    }
}

bool HotspotManager::profile_exists() {
    CommandResult result = nmcli({"-t", "-f", "NAME", "connection", "show"});
    if (!result.ok()) {
        return false;
    }
    for (const auto& line : split_lines(result.out)) {
        if (trim(line) == HOTSPOT_CONNECTION_NAME) {
            return true;
        }
    }
    return false;
}

void HotspotManager::remove_profile() {
    CommandResult down = nmcli({"connection", "down", HOTSPOT_CONNECTION_NAME});
    if (!down.ok()) {
        spdlog::trace("[Hotspot] down: {}", down.error_text());
    }
    wait(timings_.stop_settle);

    CommandResult del = nmcli({"connection", "delete", HOTSPOT_CONNECTION_NAME});
    if (!del.ok()) {
        spdlog::debug("[Hotspot] delete: {}", del.error_text());
    }
}

bool HotspotManager::create_fast(const HotspotConfig& config, const std::string& interface) {
    std::vector<std::string> args = {"device", "wifi", "hotspot", "ifname", interface,
                                     "con-name", HOTSPOT_CONNECTION_NAME, "ssid", config.ssid};
    if (!config.password.empty()) {
        args.insert(args.end(), {"password", config.password});
    }
    if (config.band != HOTSPOT_AUTO) {
        args.insert(args.end(), {"band", band_to_nmcli(config.band)});
        if (config.channel != HOTSPOT_AUTO) {
            args.insert(args.end(), {"channel", config.channel});
        }
    }

    CommandResult result = nmcli(args);
    if (!result.ok()) {
        spdlog::info("[Hotspot] Fast path failed, creating profile manually: {}",
                     result.error_text());
        return false;
    }

    CommandResult modify =
        nmcli({"connection", "modify", HOTSPOT_CONNECTION_NAME, "connection.autoconnect", "no"});
    if (!modify.ok()) {
        spdlog::warn("[Hotspot] Could not disable autoconnect: {}", modify.error_text());
    }
    if (config.hidden) {
        modify = nmcli({"connection", "modify", HOTSPOT_CONNECTION_NAME, "wifi.hidden", "yes"});
        if (!modify.ok()) {
            spdlog::warn("[Hotspot] Could not hide SSID: {}", modify.error_text());
        }
    }
    return true;
}

NetError HotspotManager::create_manual(const HotspotConfig& config, const std::string& interface) {
    std::vector<std::string> args = {"connection", "add",
                                     "type",       "wifi",
                                     "ifname",     interface,
                                     "con-name",   HOTSPOT_CONNECTION_NAME,
                                     "autoconnect", "no",
                                     "ssid",       config.ssid,
                                     "mode",       "ap",
                                     "ipv4.method", "shared",
                                     "ipv4.addresses", HOTSPOT_ADDRESS_CIDR,
                                     "ipv6.method", "disabled"};
    if (!config.password.empty()) {
        args.insert(args.end(),
                    {"wifi-sec.key-mgmt", "wpa-psk", "wifi-sec.psk", config.password});
    }
    if (config.band != HOTSPOT_AUTO) {
        args.insert(args.end(), {"wifi.band", band_to_nmcli(config.band)});
    } else if (config.channel != HOTSPOT_AUTO) {
        args.insert(args.end(), {"wifi.band", band_for_channel(config.channel)});
    }
    if (config.channel != HOTSPOT_AUTO) {
        args.insert(args.end(), {"wifi.channel", config.channel});
    }
    if (config.hidden) {
        args.insert(args.end(), {"wifi.hidden", "yes"});
    }

    CommandResult result = nmcli(args);
    if (!result.ok()) {
        NetError err = command_error(result, "Failed to add hotspot");
        spdlog::error("[Hotspot] {}", err.user_msg);
        return err;
    }
    return NetErrorHelper::success();
}

NetError HotspotManager::activate() {
    CommandResult result;
    for (int attempt = 0; attempt < 2; ++attempt) {
        if (attempt > 0) {
            spdlog::info("[Hotspot] Not active yet, retrying activation");
            wait(timings_.activation_retry);
        }

        result = nmcli({"connection", "up", HOTSPOT_CONNECTION_NAME});
        if (!result.ok()) {
            spdlog::debug("[Hotspot] Activation attempt {} failed: {}", attempt + 1,
                          result.error_text());
        }

        // Exit status alone is unreliable in both directions
        wait(timings_.activation_verify);
        bool active = false;
        if (is_active(active) && active) {
            spdlog::info("[Hotspot] Activated");
            return NetErrorHelper::success();
        }
    }

    if (!result.ok()) {
        NetError err = command_error(result, "Failed to activate hotspot");
        spdlog::error("[Hotspot] {}", err.user_msg);
        return err;
    }
    spdlog::error("[Hotspot] Activation completed but the profile is not active");
    return NetErrorHelper::activation_failed("Hotspot activation completed but not active");
}

// ============================================================================
// Stop
// ============================================================================

NetError HotspotManager::stop() {
    spdlog::info("[Hotspot] Stopping");
    notify(HotspotState::Stopping);

    CommandResult down = nmcli({"connection", "down", HOTSPOT_CONNECTION_NAME});
    if (!down.ok()) {
        spdlog::debug("[Hotspot] Ignoring failed deactivate: {}", down.error_text());
    }
    wait(timings_.stop_settle);

    CommandResult del = nmcli({"connection", "delete", HOTSPOT_CONNECTION_NAME});
    if (!del.ok() && !matches_error_class(del.error_text(), NmcliErrorClass::UnknownConnection)) {
        NetError err = command_error(del, "Failed to stop hotspot");
        spdlog::error("[Hotspot] {}", err.user_msg);
        notify(HotspotState::Error);
        return err;
    }

    notify(HotspotState::Off);
    return NetErrorHelper::success();
}

// ============================================================================
// Queries
// ============================================================================

NetError HotspotManager::is_active(bool& active) {
    active = false;
    CommandResult result = nmcli({"-t", "-f", "NAME,STATE", "connection", "show", "--active"});
    if (!result.ok()) {
        return command_error(result, "Failed to read hotspot state");
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_right(trim(line), 2);
        if (fields.size() == 2 && fields[0] == HOTSPOT_CONNECTION_NAME &&
            fields[1] == "activated") {
            active = true;
            break;
        }
    }
    return NetErrorHelper::success();
}

HotspotState HotspotManager::query_state() {
    bool active = false;
    NetError err = is_active(active);
    if (!err) {
        spdlog::warn("[Hotspot] {}", err.user_msg);
        return HotspotState::Error;
    }
    return active ? HotspotState::On : HotspotState::Off;
}

NetError HotspotManager::get_wifi_devices(std::vector<std::string>& devices) {
    devices.clear();
    CommandResult result = nmcli({"-t", "-f", "DEVICE,TYPE", "device", "status"});
    if (!result.ok()) {
        return command_error(result, "Failed to list devices");
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_left(trim(line), 2);
        if (fields.size() == 2 && fields[1] == "wifi" && !fields[0].empty()) {
            devices.push_back(fields[0]);
        }
    }

    if (devices.empty()) {
        return NetErrorHelper::hardware_not_available(
            "No WiFi devices found. Make sure you have a wireless network adapter.");
    }
    return NetErrorHelper::success();
}

NetError HotspotManager::get_hotspot_ip(std::optional<std::string>& ip) {
    ip.reset();
    CommandResult result =
        nmcli({"-t", "-f", "IP4.ADDRESS", "connection", "show", HOTSPOT_CONNECTION_NAME});
    if (!result.ok()) {
        return command_error(result, "Failed to read hotspot address");
    }

    auto addresses = collect_indexed_values(parse_key_value_output(result.out), "IP4.ADDRESS");
    if (!addresses.empty()) {
        ip = addresses.front().substr(0, addresses.front().find('/'));
    }
    return NetErrorHelper::success();
}

NetError HotspotManager::get_hotspot_device(std::optional<std::string>& device) {
    device.reset();
    bool active = false;
    NetError err = is_active(active);
    if (!err || !active) {
        return err;
    }

    CommandResult result =
        nmcli({"-t", "-f", "GENERAL.DEVICES", "connection", "show", HOTSPOT_CONNECTION_NAME});
    if (!result.ok()) {
        return command_error(result, "Failed to read hotspot device");
    }

    // A profile is bound to one Wi-Fi device; take the first if several are listed
    if (auto devices = get_value(parse_key_value_output(result.out), "GENERAL.DEVICES")) {
        std::string first = trim(devices->substr(0, devices->find(',')));
        if (!first.empty()) {
            device = first;
        }
    }
    return NetErrorHelper::success();
}

} // namespace netpanel
