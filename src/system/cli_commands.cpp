// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_commands.h"

#include "connection_orchestrator.h"
#include "device_discovery.h"
#include "hotspot_manager.h"
#include "network_query.h"
#include "utils/device_classifier.h"
#include "utils/network_validation.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <ctime>

namespace netpanel {

namespace {

int report(const NetError& err) {
    if (err) {
        return 0;
    }
    spdlog::debug("[CLI] {} ({})", err.technical_msg, net_result_name(err.result));
    fprintf(stderr, "Error: %s\n", err.user_msg.c_str());
    if (!err.suggestion.empty()) {
        fprintf(stderr, "  %s\n", err.suggestion.c_str());
    }
    return 1;
}

void print_field(const char* label, const std::optional<std::string>& value) {
    if (value) {
        printf("%-14s %s\n", label, value->c_str());
    }
}

// ============================================================================
// Wi-Fi
// ============================================================================

int cmd_scan(NetworkQuery& query) {
    std::vector<WifiNetwork> networks;
    NetError err = query.scan_networks(networks);
    if (!err) {
        return report(err);
    }

    for (const auto& net : networks) {
        printf("%c %-32s %3d%%  %-8s ch %-3u %s\n", net.connected ? '*' : ' ', net.ssid.c_str(),
               net.signal, net.band.c_str(), net.channel, net.security_type.c_str());
    }
    return 0;
}

int cmd_connect(const CliArgs& args, ConnectionOrchestrator& orchestrator) {
    const std::string& ssid = args.positional[0];
    ConnectStatus status = ConnectStatus::Connected;

    NetError err = args.password
                       ? orchestrator.connect_secured(ssid, *args.password, args.security, status)
                       : orchestrator.connect_open(ssid, status);
    if (!err) {
        return report(err);
    }
    printf("%s: %s\n", ssid.c_str(),
           status == ConnectStatus::Queued ? "activation queued" : "connected");
    return 0;
}

int cmd_activate(const std::string& name, ConnectionOrchestrator& orchestrator) {
    ConnectStatus status = ConnectStatus::Connected;
    NetError err = orchestrator.connect_known(name, status);
    if (!err) {
        return report(err);
    }
    printf("%s: %s\n", name.c_str(),
           status == ConnectStatus::Queued ? "activation queued" : "connected");
    return 0;
}

int cmd_info(const std::string& ssid, NetworkQuery& query) {
    NetworkInfo info = query.get_network_info(ssid);

    printf("%-14s %s\n", "SSID", ssid.c_str());
    print_field("Type", info.connection_type);
    print_field("State", info.state);
    print_field("Interface", info.interface);
    print_field("MAC/BSSID", info.mac_address);
    print_field("IPv4", info.ip_address);
    print_field("Subnet mask", info.subnet_mask);
    print_field("Gateway", info.gateway);
    for (size_t i = 0; i < info.dns.size(); ++i) {
        printf("%-14s %s\n", i == 0 ? "DNS" : "", info.dns[i].c_str());
    }
    print_field("IPv6", info.ipv6_address);
    if (info.link_speed_mbps) {
        printf("%-14s %u Mb/s\n", "Speed", *info.link_speed_mbps);
    }
    print_field("UUID", info.uuid);
    if (info.dhcp_lease_time_seconds) {
        printf("%-14s %u s\n", "DHCP lease", *info.dhcp_lease_time_seconds);
    }
    return 0;
}

int cmd_saved(NetworkQuery& query) {
    std::vector<SavedConnection> saved;
    NetError err = query.get_saved_connections(saved);
    if (!err) {
        return report(err);
    }
    for (const auto& conn : saved) {
        printf("%-36s %s\n", conn.uuid.c_str(), conn.ssid.c_str());
    }
    return 0;
}

int cmd_autoconnect(const CliArgs& args, NetworkQuery& query) {
    const std::string& ssid = args.positional[0];
    if (args.positional.size() == 2) {
        return report(query.set_autoconnect(ssid, args.positional[1] == "on"));
    }

    bool enabled = false;
    NetError err = query.get_autoconnect(ssid, enabled);
    if (!err) {
        return report(err);
    }
    printf("%s\n", enabled ? "on" : "off");
    return 0;
}

int cmd_radio(const CliArgs& args, NetworkQuery& query) {
    if (!args.positional.empty()) {
        return report(query.set_wifi_enabled(args.positional[0] == "on"));
    }

    bool enabled = false;
    NetError err = query.is_wifi_enabled(enabled);
    if (!err) {
        return report(err);
    }
    printf("%s\n", enabled ? "on" : "off");
    return 0;
}

// ============================================================================
// Wired / DNS
// ============================================================================

int cmd_wired(NetworkQuery& query) {
    std::vector<WiredConnection> connections;
    NetError err = query.get_wired_connections(connections);
    if (!err) {
        return report(err);
    }
    for (const auto& conn : connections) {
        printf("%c %-32s %-36s %s\n", conn.active ? '*' : ' ', conn.name.c_str(),
               conn.uuid.c_str(), conn.device.c_str());
    }
    return 0;
}

int cmd_dns(const CliArgs& args, NetworkQuery& query) {
    const std::string& connection = args.positional[0];
    std::vector<std::string> servers(args.positional.begin() + 1, args.positional.end());

    if (servers.size() == 1 && servers[0] == "auto") {
        servers.clear();
    }
    for (const auto& server : servers) {
        if (!is_valid_ipv4_address(server)) {
            return report(NetErrorHelper::invalid_parameters("Invalid DNS server: " + server));
        }
    }

    NetError err = query.set_ipv4_dns(connection, servers);
    if (!err) {
        return report(err);
    }
    return report(query.reapply_connection(connection));
}

// ============================================================================
// Hotspot
// ============================================================================

/// Device the running hotspot serves: the active profile's, else the configured one
NetError hotspot_interface(HotspotManager& manager, Config& config, std::string& interface) {
    interface.clear();
    bool active = false;
    NetError err = manager.is_active(active);
    if (!err) {
        return err;
    }
    if (!active) {
        return NetError(NetResult::DEVICE_NOT_FOUND, "hotspot profile not active",
                        "Hotspot is not running", "Start it with 'netpanel hotspot start'");
    }

    std::optional<std::string> device;
    err = manager.get_hotspot_device(device);
    if (!err) {
        return err;
    }
    interface = device ? *device : config.get_hotspot_interface();
    if (interface.empty()) {
        return NetError(NetResult::DEVICE_NOT_FOUND, "hotspot device unknown",
                        "Could not tell which device the hotspot runs on",
                        "Set /hotspot/interface in the settings file");
    }
    spdlog::debug("[CLI] Hotspot clients on {}", interface);
    return NetErrorHelper::success();
}

int cmd_hotspot(const CliArgs& args, CommandExecutor& executor, Config& config) {
    HotspotManager manager(executor);
    const std::string& action = args.positional[0];

    if (action == "stop") {
        return report(manager.stop());
    }

    if (action == "start") {
        HotspotConfig hotspot;
        NetError err = config.get_hotspot_config(hotspot);
        if (!err) {
            return report(err);
        }
        std::string interface =
            args.interface.empty() ? config.get_hotspot_interface() : args.interface;
        err = manager.start(hotspot, interface);
        if (!err) {
            return report(err);
        }
        printf("Hotspot '%s' is on\n", hotspot.ssid.c_str());
        return 0;
    }

    HotspotState state = manager.query_state();
    if (state == HotspotState::Error) {
        bool active = false;
        return report(manager.is_active(active));
    }
    printf("%s\n", hotspot_state_name(state));
    if (state == HotspotState::On) {
        std::optional<std::string> ip;
        if (manager.get_hotspot_ip(ip) && ip) {
            printf("Address: %s\n", ip->c_str());
        }
        std::string interface;
        size_t count = 0;
        DeviceDiscovery discovery(executor);
        if (hotspot_interface(manager, config, interface) &&
            discovery.count_connected_devices(count, interface)) {
            printf("Clients: %zu\n", count);
        }
    }
    return 0;
}

int cmd_devices(CommandExecutor& executor, Config& config) {
    HotspotManager manager(executor);
    std::string interface;
    NetError err = hotspot_interface(manager, config, interface);
    if (!err) {
        return report(err);
    }

    DeviceDiscovery discovery(executor);
    std::vector<ConnectedDevice> devices;
    err = discovery.get_connected_devices(devices, interface);
    if (!err) {
        return report(err);
    }

    int64_t now = static_cast<int64_t>(std::time(nullptr));
    for (const auto& device : devices) {
        printf("%-9s %-15s %-17s %s", device_kind_name(classify_device(device)),
               device.ip.c_str(), device.mac.c_str(),
               device.hostname ? device.hostname->c_str() : "-");
        if (device.lease_expiry) {
            printf("  (%s)", format_lease_remaining(*device.lease_expiry, now).c_str());
        }
        printf("\n");
    }
    return 0;
}

} // namespace

int run_cli_command(const CliArgs& args, CommandExecutor& executor, Config& config) {
    NetworkQuery query(executor);
    ConnectionOrchestrator orchestrator(executor);
    const std::string& cmd = args.command;

    spdlog::debug("[CLI] Running '{}'", cmd);

    if (cmd == "scan")
        return cmd_scan(query);
    if (cmd == "connect")
        return cmd_connect(args, orchestrator);
    if (cmd == "activate")
        return cmd_activate(args.positional[0], orchestrator);
    if (cmd == "disconnect")
        return report(orchestrator.disconnect(args.positional[0]));
    if (cmd == "info")
        return cmd_info(args.positional[0], query);
    if (cmd == "saved")
        return cmd_saved(query);
    if (cmd == "forget")
        return report(query.delete_connection(args.positional[0]));
    if (cmd == "autoconnect")
        return cmd_autoconnect(args, query);
    if (cmd == "radio")
        return cmd_radio(args, query);
    if (cmd == "wired")
        return cmd_wired(query);
    if (cmd == "wired-up") {
        ConnectStatus status = ConnectStatus::Connected;
        return report(orchestrator.activate_saved(args.positional[0], status));
    }
    if (cmd == "wired-enable")
        return report(query.set_ethernet_enabled(args.positional[0] == "on"));
    if (cmd == "dns")
        return cmd_dns(args, query);
    if (cmd == "hotspot")
        return cmd_hotspot(args, executor, config);
    if (cmd == "devices")
        return cmd_devices(executor, config);

    return report(NetErrorHelper::invalid_parameters("Unknown command: " + cmd));
}

} // namespace netpanel
