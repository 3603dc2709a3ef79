// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "network_query.h"

#include "utils/scan_reconciler.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace netpanel {

namespace {

bool is_wireless_type(const std::string& type) {
    return type == "802-11-wireless" || type == "wifi";
}

bool is_ethernet_type(const std::string& type) {
    return type == "802-3-ethernet" || type == "ethernet";
}

} // namespace

NetworkQuery::NetworkQuery(CommandExecutor& executor) : executor_(executor) {}

CommandResult NetworkQuery::nmcli(const std::vector<std::string>& args) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.emplace_back(NMCLI);
    argv.insert(argv.end(), args.begin(), args.end());
    spdlog::trace("[Nmcli] exec: {}", describe_command(argv));
    return executor_.run(argv);
}

std::optional<KeyValueMap> NetworkQuery::key_value_map(const std::vector<std::string>& args) {
    CommandResult result = nmcli(args);
    if (!result.ok()) {
        spdlog::debug("[Nmcli] Key-value query failed: {}", result.error_text());
        return std::nullopt;
    }
    return parse_key_value_output(result.out);
}

NetError NetworkQuery::list_devices(std::vector<std::vector<std::string>>& rows) {
    rows.clear();
    CommandResult result = nmcli({"-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device", "status"});
    if (!result.ok()) {
        return command_error(result, "Failed to list devices");
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_left(trim(line), 4);
        if (fields.size() < 3) {
            continue;
        }
        fields.resize(4);
        rows.push_back(std::move(fields));
    }
    return NetErrorHelper::success();
}

// ============================================================================
// Radio / Hardware
// ============================================================================

NetError NetworkQuery::is_wifi_enabled(bool& enabled) {
    enabled = false;
    CommandResult result = nmcli({"-t", "-f", "WIFI", "radio"});
    if (!result.ok()) {
        return command_error(result, "Failed to read Wi-Fi radio state");
    }
    enabled = trim(result.out) == "enabled";
    return NetErrorHelper::success();
}

NetError NetworkQuery::set_wifi_enabled(bool enabled) {
    spdlog::info("[Nmcli] Turning Wi-Fi radio {}", enabled ? "on" : "off");
    CommandResult result = nmcli({"radio", "wifi", enabled ? "on" : "off"});
    if (!result.ok()) {
        return command_error(result, "Failed to set Wi-Fi radio");
    }
    return NetErrorHelper::success();
}

NetError NetworkQuery::has_wifi_device(bool& present) {
    present = false;
    std::vector<std::vector<std::string>> rows;
    NetError err = list_devices(rows);
    if (!err) {
        return err;
    }
    present = std::any_of(rows.begin(), rows.end(),
                          [](const auto& row) { return row[1] == "wifi"; });
    return NetErrorHelper::success();
}

NetError NetworkQuery::has_ethernet_device(bool& present) {
    present = false;
    std::vector<std::vector<std::string>> rows;
    NetError err = list_devices(rows);
    if (!err) {
        return err;
    }
    present = std::any_of(rows.begin(), rows.end(),
                          [](const auto& row) { return row[1] == "ethernet"; });
    return NetErrorHelper::success();
}

NetError NetworkQuery::find_available_wifi_device(std::string& device) {
    device.clear();
    CommandResult result = nmcli({"-t", "-f", "DEVICE,TYPE,STATE", "device"});
    if (!result.ok()) {
        return command_error(result, "Failed to list devices");
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_left(trim(line), 3);
        if (fields.size() < 3) {
            continue;
        }
        if (fields[1] == "wifi" && fields[2] != "unavailable") {
            device = fields[0];
            spdlog::debug("[Nmcli] Available Wi-Fi device: {}", device);
            return NetErrorHelper::success();
        }
    }
    return NetErrorHelper::hardware_not_available("No available Wi-Fi device found");
}

// ============================================================================
// Scanning
// ============================================================================

NetError NetworkQuery::scan_networks(std::vector<WifiNetwork>& networks) {
    networks.clear();
    CommandResult result = nmcli({"-t", "-f", "SSID,SIGNAL,SECURITY,ACTIVE,CHAN,FREQ", "device",
                                  "wifi", "list", "--rescan", "yes"});
    if (!result.ok()) {
        NetError err = command_error(result, "Failed to scan networks");
        spdlog::warn("[Nmcli] {}", err.user_msg);
        return err;
    }

    networks = reconcile_scan(parse_scan_rows(result.out));
    spdlog::debug("[Nmcli] Scan complete, {} networks", networks.size());
    return NetErrorHelper::success();
}

void NetworkQuery::request_rescan() {
    CommandResult result = nmcli({"device", "wifi", "rescan"});
    if (!result.ok()) {
        spdlog::debug("[Nmcli] Rescan request not accepted: {}", result.error_text());
    }
}

// ============================================================================
// Active State
// ============================================================================

NetError NetworkQuery::get_active_wifi_ssid(std::optional<std::string>& ssid) {
    ssid.reset();
    CommandResult result = nmcli({"-t", "-f", "ACTIVE,SSID", "device", "wifi"});
    if (!result.ok()) {
        return command_error(result, "Failed to read active network");
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_left(trim(line), 2);
        if (fields.size() == 2 && fields[0] == "yes" && !fields[1].empty()) {
            ssid = fields[1];
            break;
        }
    }
    return NetErrorHelper::success();
}

NetError NetworkQuery::get_active_wired_connection(std::optional<std::string>& name) {
    name.reset();
    CommandResult result = nmcli({"-t", "-f", "TYPE,STATE,CONNECTION", "device", "status"});
    if (!result.ok()) {
        return command_error(result, "Failed to read wired state");
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_left(trim(line), 3);
        if (fields.size() < 2 || fields[0] != "ethernet") {
            continue;
        }
        if (fields[1].compare(0, 9, "connected") != 0) {
            continue;
        }
        std::string connection = fields.size() > 2 ? trim(fields[2]) : std::string();
        name = is_placeholder(connection) ? std::string("Wired connection") : connection;
        break;
    }
    return NetErrorHelper::success();
}

NetError NetworkQuery::get_active_connection_name(std::optional<std::string>& name) {
    name.reset();
    std::vector<std::vector<std::string>> rows;
    NetError err = list_devices(rows);
    if (!err) {
        return err;
    }

    for (const auto& row : rows) {
        if (row[1] == "loopback" || row[2].compare(0, 9, "connected") != 0) {
            continue;
        }
        if (!is_placeholder(row[3])) {
            name = row[3];
            break;
        }
    }
    return NetErrorHelper::success();
}

std::optional<std::string> NetworkQuery::get_device_for_active_ssid(const std::string& ssid) {
    CommandResult result = nmcli({"-t", "-f", "SSID,DEVICE,ACTIVE", "device", "wifi", "list"});
    if (!result.ok()) {
        spdlog::debug("[Nmcli] Device lookup failed: {}", result.error_text());
        return std::nullopt;
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_right(trim(line), 3);
        if (fields.size() < 3) {
            continue;
        }
        if (fields[0] == ssid && fields[2] == "yes" && !fields[1].empty()) {
            return fields[1];
        }
    }
    return std::nullopt;
}

void NetworkQuery::fill_from_profile(NetworkInfo& info, const KeyValueMap& profile,
                                     bool only_missing) {
    if (!only_missing || !info.connection_type) {
        if (auto type = get_value(profile, "connection.type")) {
            info.connection_type = type;
        }
    }
    if (!only_missing || !info.uuid) {
        if (auto uuid = get_value(profile, "connection.uuid")) {
            info.uuid = uuid;
        }
    }
    if (!only_missing || !info.mac_address) {
        auto mac = get_value(profile, "802-11-wireless.seen-bssids");
        if (!mac) {
            mac = get_value(profile, "802-11-wireless.mac-address");
        }
        if (mac) {
            info.mac_address = mac;
        }
    }
    if (!only_missing || !info.interface) {
        if (auto iface = get_value(profile, "connection.interface-name")) {
            info.interface = iface;
        }
    }
}

NetworkInfo NetworkQuery::get_network_info(const std::string& ssid) {
    NetworkInfo info;

    if (auto profile = key_value_map({"-t", "connection", "show", ssid})) {
        fill_from_profile(info, *profile, false);
    }

    auto device = get_device_for_active_ssid(ssid);
    if (!device) {
        spdlog::debug("[Nmcli] '{}' is not active, profile details only", ssid);
        return info;
    }

    auto live = key_value_map({"-t", "-f", "GENERAL,IP4,IP6,DHCP4", "device", "show", *device});
    if (!live) {
        return info;
    }
    const KeyValueMap& dev = *live;

    auto active_connection = get_value(dev, "GENERAL.CONNECTION");

    if (auto iface = get_value(dev, "GENERAL.DEVICE")) {
        info.interface = iface;
    } else if (!info.interface) {
        info.interface = device;
    }
    info.state = get_value(dev, "GENERAL.STATE");
    if (!info.connection_type) {
        info.connection_type = get_value(dev, "GENERAL.TYPE");
    }

    if (auto speed = get_value(dev, "GENERAL.SPEED")) {
        std::string first = speed->substr(0, speed->find(' '));
        uint32_t mbps = parse_u32_digits(first);
        if (mbps > 0) {
            info.link_speed_mbps = mbps;
        }
    }

    if (!info.mac_address) {
        info.mac_address = get_value(dev, "GENERAL.HWADDR");
    }

    auto addresses = collect_indexed_values(dev, "IP4.ADDRESS");
    if (!addresses.empty()) {
        if (auto cidr = parse_ipv4_cidr(addresses.front())) {
            info.ip_address = cidr->first;
            info.subnet_mask = cidr->second;
        } else {
            info.ip_address = addresses.front();
        }
    }

    info.gateway = get_value(dev, "IP4.GATEWAY");
    info.dns = collect_indexed_values(dev, "IP4.DNS");

    auto ipv6 = collect_indexed_values(dev, "IP6.ADDRESS");
    if (!ipv6.empty()) {
        info.ipv6_address = ipv6.front().substr(0, ipv6.front().find('/'));
    }

    info.dhcp_lease_time_seconds = parse_dhcp_lease_time_seconds(dev);

    // Profile named differently from the SSID: fill the gaps from the active one
    if (active_connection && (!info.uuid || !info.connection_type || !info.mac_address)) {
        if (auto profile = key_value_map({"-t", "connection", "show", *active_connection})) {
            fill_from_profile(info, *profile, true);
        }
    }

    return info;
}

// ============================================================================
// Saved Profiles
// ============================================================================

NetError NetworkQuery::get_saved_connections(std::vector<SavedConnection>& connections) {
    connections.clear();
    CommandResult result = nmcli({"-t", "-f", "NAME,UUID,TYPE", "connection", "show"});
    if (!result.ok()) {
        return command_error(result, "Failed to list saved connections");
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_right(trim(line), 3);
        if (fields.size() < 3 || !is_wireless_type(fields[2])) {
            continue;
        }
        if (fields[0] == HOTSPOT_CONNECTION_NAME) {
            continue;
        }
        connections.push_back(SavedConnection{fields[1], fields[0]});
    }
    return NetErrorHelper::success();
}

NetError NetworkQuery::is_network_saved(const std::string& ssid, bool& saved) {
    saved = false;
    CommandResult result = nmcli({"-t", "-f", "NAME,TYPE", "connection", "show"});
    if (!result.ok()) {
        return command_error(result, "Failed to list saved connections");
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_right(trim(line), 2);
        if (fields.size() == 2 && fields[0] == ssid && is_wireless_type(fields[1])) {
            saved = true;
            break;
        }
    }
    return NetErrorHelper::success();
}

NetError NetworkQuery::get_saved_password_for_ssid(const std::string& ssid, std::string& password) {
    password.clear();
    CommandResult result = nmcli(
        {"--show-secrets", "-g", "802-11-wireless-security.psk", "connection", "show", ssid});
    if (!result.ok()) {
        return command_error(result, "Failed to read saved password");
    }

    password = trim(result.out);
    if (password.empty()) {
        return NetErrorHelper::command_failed("Failed to read saved password",
                                              "no password stored for " + ssid);
    }
    return NetErrorHelper::success();
}

NetError NetworkQuery::delete_connection(const std::string& name_or_uuid) {
    spdlog::info("[Nmcli] Deleting connection '{}'", name_or_uuid);
    CommandResult result = nmcli({"connection", "delete", name_or_uuid});
    if (!result.ok()) {
        return command_error(result, "Failed to delete connection");
    }
    return NetErrorHelper::success();
}

NetError NetworkQuery::get_autoconnect(const std::string& ssid, bool& enabled) {
    enabled = false;
    CommandResult result = nmcli({"-t", "-g", "connection.autoconnect", "connection", "show", ssid});
    if (!result.ok()) {
        return command_error(result, "Failed to read autoconnect");
    }
    std::string value = to_lower(trim(result.out));
    enabled = value == "yes" || value == "true";
    return NetErrorHelper::success();
}

NetError NetworkQuery::set_autoconnect(const std::string& ssid, bool enabled) {
    spdlog::info("[Nmcli] Autoconnect for '{}': {}", ssid, enabled ? "yes" : "no");
    CommandResult result =
        nmcli({"connection", "modify", ssid, "connection.autoconnect", enabled ? "yes" : "no"});
    if (!result.ok()) {
        return command_error(result, "Failed to set autoconnect");
    }
    return NetErrorHelper::success();
}

// ============================================================================
// Wired
// ============================================================================

NetError NetworkQuery::get_wired_connections(std::vector<WiredConnection>& connections) {
    connections.clear();
    CommandResult result = nmcli({"-t", "-f", "NAME,UUID,TYPE,DEVICE", "connection", "show"});
    if (!result.ok()) {
        return command_error(result, "Failed to list wired connections");
    }

    for (const auto& line : split_lines(result.out)) {
        auto fields = split_fields_from_right(trim(line), 4);
        if (fields.size() < 4 || !is_ethernet_type(fields[2])) {
            continue;
        }
        WiredConnection conn;
        conn.name = fields[0];
        conn.uuid = fields[1];
        conn.active = !is_placeholder(fields[3]);
        if (conn.active) {
            conn.device = fields[3];
        }
        connections.push_back(std::move(conn));
    }

    std::stable_sort(connections.begin(), connections.end(),
                     [](const WiredConnection& a, const WiredConnection& b) {
                         if (a.active != b.active) {
                             return a.active;
                         }
                         return a.name < b.name;
                     });
    return NetErrorHelper::success();
}

NetError NetworkQuery::set_ethernet_enabled(bool enabled) {
    std::vector<std::vector<std::string>> rows;
    NetError err = list_devices(rows);
    if (!err) {
        return err;
    }

    size_t attempted = 0;
    NetError last_error = NetErrorHelper::success();
    for (const auto& row : rows) {
        if (row[1] != "ethernet") {
            continue;
        }
        ++attempted;
        spdlog::info("[Nmcli] {} ethernet device {}", enabled ? "Connecting" : "Disconnecting",
                     row[0]);
        CommandResult result = nmcli({"device", enabled ? "connect" : "disconnect", row[0]});
        if (!result.ok()) {
            last_error = command_error(result, "Failed to update device " + row[0]);
            spdlog::warn("[Nmcli] {}", last_error.user_msg);
        }
    }

    if (attempted == 0) {
        return NetErrorHelper::hardware_not_available("No ethernet device found");
    }
    return last_error;
}

NetError NetworkQuery::is_ethernet_enabled(bool& enabled) {
    enabled = false;
    std::vector<std::vector<std::string>> rows;
    NetError err = list_devices(rows);
    if (!err) {
        return err;
    }
    // "connected", "connecting (getting IP configuration)", ...
    enabled = std::any_of(rows.begin(), rows.end(), [](const auto& row) {
        return row[1] == "ethernet" && row[2].compare(0, 7, "connect") == 0;
    });
    return NetErrorHelper::success();
}

// ============================================================================
// DNS
// ============================================================================

NetError NetworkQuery::set_ipv4_dns(const std::string& connection,
                                    const std::vector<std::string>& servers) {
    std::string joined;
    for (const auto& server : servers) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += server;
    }

    spdlog::info("[Nmcli] DNS for '{}': {}", connection, joined.empty() ? "automatic" : joined);
    CommandResult result = nmcli({"connection", "modify", connection, "ipv4.dns", joined,
                                  "ipv4.ignore-auto-dns", servers.empty() ? "no" : "yes"});
    if (!result.ok()) {
        return command_error(result, "Failed to set DNS");
    }
    return NetErrorHelper::success();
}

NetError NetworkQuery::reapply_connection(const std::string& connection) {
    CommandResult result = nmcli({"connection", "up", connection});
    if (!result.ok()) {
        return command_error(result, "Failed to apply settings");
    }
    return NetErrorHelper::success();
}

} // namespace netpanel
