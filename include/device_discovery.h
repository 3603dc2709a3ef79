// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_executor.h"
#include "net_error.h"
#include "network_types.h"

#include <optional>
#include <string>
#include <vector>

namespace netpanel {

/**
 * @brief Where DHCP lease files are looked for, in priority order
 *
 * `directories` are searched for NetworkManager's per-interface
 * `dnsmasq-*.leases` files before the fixed `files` are tried.
 */
struct LeaseSources {
    std::vector<std::string> directories = {"/var/lib/NetworkManager"};
    std::vector<std::string> files = {"/var/lib/dnsmasq/dnsmasq.leases",
                                      "/var/lib/misc/dnsmasq.leases", "/var/db/dnsmasq.leases",
                                      "/tmp/dnsmasq.leases"};
};

/**
 * @brief Gateway, network and link-local addresses never count as clients
 *
 * True for addresses ending in ".0" or ".1" and for fe80:: addresses.
 */
bool is_excluded_address(const std::string& ip);

/**
 * @brief Parse `ip neigh show` output
 *
 * Keeps entries with a resolved `lladdr`; excluded addresses are dropped.
 * With @p interface set, entries naming another `dev` are dropped too.
 */
std::vector<ConnectedDevice> parse_neigh_output(const std::string& output,
                                                const std::string& interface = "");

/**
 * @brief Parse dnsmasq lease file content
 *
 * Lines are `<expiry> <mac> <ip> <hostname> [client-id]`; a hostname of "*"
 * means none.
 */
std::vector<ConnectedDevice> parse_lease_content(const std::string& content);

/**
 * @brief Extract the name from `nslookup <ip>` output ("... name = host.lan.")
 */
std::optional<std::string> parse_nslookup_name(const std::string& output);

/**
 * @brief Drop repeated identities (MAC, else IP), keeping the first occurrence
 */
std::vector<ConnectedDevice> dedupe_devices(const std::vector<ConnectedDevice>& devices);

/**
 * @brief Lists clients attached to the hotspot
 *
 * The neighbour table is authoritative when it has entries; lease files are
 * only consulted when it is empty. Sources are never merged.
 */
class DeviceDiscovery {
  public:
    explicit DeviceDiscovery(CommandExecutor& executor, LeaseSources sources = LeaseSources());

    /**
     * @brief Current clients, deduplicated
     *
     * @param interface Hotspot device; restricts the neighbour table and NetworkManager's
     *                  per-interface lease files (empty = all)
     * @param resolve_hostnames Reverse-resolve neighbour entries without a name
     */
    NetError get_connected_devices(std::vector<ConnectedDevice>& devices,
                                   const std::string& interface = "",
                                   bool resolve_hostnames = true);

    NetError count_connected_devices(size_t& count, const std::string& interface = "");

  private:
    CommandExecutor& executor_;
    LeaseSources sources_;

    NetError read_neighbors(const std::string& interface, std::vector<ConnectedDevice>& devices);
    std::vector<ConnectedDevice> read_leases(const std::string& interface);
    std::vector<std::string> lease_candidates(const std::string& interface);
    std::optional<std::string> resolve_hostname(const std::string& ip);
};

} // namespace netpanel
