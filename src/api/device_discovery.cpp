// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_discovery.h"

#include "utils/nmcli_parser.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <dirent.h>
#include <fstream>
#include <memory>
#include <set>
#include <sstream>

namespace netpanel {

namespace {

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> parts;
    std::istringstream stream(line);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

} // namespace

bool is_excluded_address(const std::string& ip) {
    return ends_with(ip, ".1") || ends_with(ip, ".0") || to_lower(ip).compare(0, 4, "fe80") == 0;
}

std::vector<ConnectedDevice> parse_neigh_output(const std::string& output,
                                                const std::string& interface) {
    std::vector<ConnectedDevice> devices;

    // 192.168.50.12 dev wlan0 lladdr aa:bb:cc:dd:ee:ff REACHABLE
    for (const auto& line : split_lines(output)) {
        auto parts = split_whitespace(line);
        if (parts.size() < 3) {
            continue;
        }

        auto lladdr = std::find(parts.begin(), parts.end(), "lladdr");
        if (lladdr == parts.end() || lladdr + 1 == parts.end()) {
            continue;
        }

        auto dev = std::find(parts.begin(), parts.end(), "dev");
        if (!interface.empty() && dev != parts.end() && dev + 1 != parts.end() &&
            *(dev + 1) != interface) {
            continue;
        }

        const std::string& ip = parts[0];
        if (is_excluded_address(ip)) {
            continue;
        }

        ConnectedDevice device;
        device.ip = ip;
        device.mac = to_lower(*(lladdr + 1));
        devices.push_back(std::move(device));
    }
    return devices;
}

std::vector<ConnectedDevice> parse_lease_content(const std::string& content) {
    std::vector<ConnectedDevice> devices;

    for (const auto& line : split_lines(content)) {
        auto parts = split_whitespace(line);
        if (parts.size() < 3) {
            continue;
        }

        const std::string& ip = parts[2];
        if (is_excluded_address(ip)) {
            continue;
        }

        ConnectedDevice device;
        device.ip = ip;
        device.mac = to_lower(parts[1]);
        if (parts.size() > 3 && parts[3] != "*") {
            device.hostname = parts[3];
        }
        try {
            device.lease_expiry = std::stoll(parts[0]);
        } catch (const std::exception&) {
            spdlog::trace("[Devices] Lease line without expiry: {}", line);
        }
        devices.push_back(std::move(device));
    }
    return devices;
}

std::optional<std::string> parse_nslookup_name(const std::string& output) {
    for (const auto& line : split_lines(output)) {
        size_t pos = line.find("name =");
        if (pos == std::string::npos) {
            continue;
        }
        std::string name = trim(line.substr(pos + 6));
        while (!name.empty() && name.back() == '.') {
            name.pop_back();
        }
        if (!name.empty()) {
            return name;
        }
    }
    return std::nullopt;
}

std::vector<ConnectedDevice> dedupe_devices(const std::vector<ConnectedDevice>& devices) {
    std::vector<ConnectedDevice> unique;
    std::set<std::string> seen;
    for (const auto& device : devices) {
        if (seen.insert(device.identity()).second) {
            unique.push_back(device);
        }
    }
    return unique;
}

// ============================================================================
// DeviceDiscovery
// ============================================================================

DeviceDiscovery::DeviceDiscovery(CommandExecutor& executor, LeaseSources sources)
    : executor_(executor), sources_(std::move(sources)) {}

NetError DeviceDiscovery::get_connected_devices(std::vector<ConnectedDevice>& devices,
                                                const std::string& interface,
                                                bool resolve_hostnames) {
    devices.clear();

    std::vector<ConnectedDevice> found;
    NetError err = read_neighbors(interface, found);
    if (!err) {
        // Lease files still work without iproute2
        spdlog::debug("[Devices] Neighbour table unavailable: {}", err.technical_msg);
    }

    if (!found.empty()) {
        if (resolve_hostnames) {
            for (auto& device : found) {
                if (!device.hostname) {
                    device.hostname = resolve_hostname(device.ip);
                }
            }
        }
        devices = dedupe_devices(found);
        spdlog::debug("[Devices] {} devices from neighbour table", devices.size());
        return NetErrorHelper::success();
    }

    devices = dedupe_devices(read_leases(interface));
    spdlog::debug("[Devices] {} devices from lease files", devices.size());
    return NetErrorHelper::success();
}

NetError DeviceDiscovery::count_connected_devices(size_t& count, const std::string& interface) {
    std::vector<ConnectedDevice> devices;
    NetError err = get_connected_devices(devices, interface, false);
    count = devices.size();
    return err;
}

NetError DeviceDiscovery::read_neighbors(const std::string& interface,
                                         std::vector<ConnectedDevice>& devices) {
    std::vector<std::string> argv = {"ip", "neigh", "show"};
    if (!interface.empty()) {
        argv.insert(argv.end(), {"dev", interface});
    }

    CommandResult result = executor_.run(argv);
    if (!result.ok()) {
        return command_error(result, "Failed to read neighbour table", "ip");
    }
    devices = parse_neigh_output(result.out, interface);
    return NetErrorHelper::success();
}

std::vector<std::string> DeviceDiscovery::lease_candidates(const std::string& interface) {
    std::vector<std::string> candidates;

    auto dir_deleter = [](DIR* d) {
        if (d)
            closedir(d);
    };

    for (const auto& directory : sources_.directories) {
        std::unique_ptr<DIR, decltype(dir_deleter)> dir(opendir(directory.c_str()), dir_deleter);
        if (!dir) {
            spdlog::trace("[Devices] Cannot open {}", directory);
            continue;
        }

        std::vector<std::string> names;
        struct dirent* entry;
        while ((entry = readdir(dir.get())) != nullptr) {
            std::string name = entry->d_name;
            if (name.compare(0, 8, "dnsmasq-") != 0 || !ends_with(name, ".leases")) {
                continue;
            }
            // dnsmasq-<iface>.leases
            if (interface.empty() || name == "dnsmasq-" + interface + ".leases") {
                names.push_back(name);
            }
        }
        // readdir order is arbitrary
        std::sort(names.begin(), names.end());
        for (const auto& name : names) {
            candidates.push_back(directory + "/" + name);
        }
    }

    candidates.insert(candidates.end(), sources_.files.begin(), sources_.files.end());
    return candidates;
}

std::vector<ConnectedDevice> DeviceDiscovery::read_leases(const std::string& interface) {
    for (const auto& path : lease_candidates(interface)) {
        std::ifstream file(path);
        if (!file.is_open()) {
            continue;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        auto devices = parse_lease_content(buffer.str());
        if (!devices.empty()) {
            spdlog::debug("[Devices] Using lease file {}", path);
            return devices;
        }
    }
    return {};
}

std::optional<std::string> DeviceDiscovery::resolve_hostname(const std::string& ip) {
    CommandResult result = executor_.run({"nslookup", ip});
    if (!result.ok()) {
        spdlog::trace("[Devices] No reverse name for {}", ip);
        return std::nullopt;
    }
    return parse_nslookup_name(result.out);
}

} // namespace netpanel
