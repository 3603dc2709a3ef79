// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/scan_reconciler.h"

#include "utils/nmcli_parser.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <map>
#include <utility>

namespace netpanel {

std::string band_from_frequency(uint32_t freq_mhz) {
    if (freq_mhz >= 2400 && freq_mhz <= 2500) {
        return "2.4 GHz";
    }
    if (freq_mhz >= 4900 && freq_mhz <= 5900) {
        return "5 GHz";
    }
    if (freq_mhz >= 5925 && freq_mhz <= 7125) {
        return "6 GHz";
    }
    return "Unknown";
}

std::string security_type_from(const std::string& security) {
    if (security.find("WPA3") != std::string::npos) {
        return "WPA3";
    }
    if (security.find("WPA2") != std::string::npos) {
        return "WPA2";
    }
    if (security.find("WPA") != std::string::npos) {
        return "WPA";
    }
    if (security.find("WEP") != std::string::npos) {
        return "WEP";
    }
    if (!is_placeholder(security)) {
        return "Secured";
    }
    return "Open";
}

std::vector<ScanRow> parse_scan_rows(const std::string& output) {
    std::vector<ScanRow> rows;

    for (const auto& raw : split_lines(output)) {
        std::string line = trim(raw);

        // SSID:SIGNAL:SECURITY:ACTIVE:CHAN:FREQ
        auto fields = split_fields_from_right(line, 6);
        if (fields.size() < 6) {
            spdlog::trace("[Scan] Skipping malformed scan line ({} fields): {}", fields.size(),
                          line);
            continue;
        }

        ScanRow row;
        row.ssid = fields[0];
        row.signal = std::max(0, std::min(100, parse_int_or_zero(fields[1])));
        row.security = fields[2];
        row.active = fields[3] == "yes";
        row.channel = parse_u32_digits(fields[4]);
        row.freq_mhz = parse_u32_digits(fields[5]);
        rows.push_back(std::move(row));
    }

    return rows;
}

std::vector<WifiNetwork> reconcile_scan(const std::vector<ScanRow>& rows) {
    std::vector<WifiNetwork> networks;
    std::map<std::pair<std::string, std::string>, size_t> index_by_key;

    for (const auto& row : rows) {
        // Hidden networks have no SSID to show or connect to
        if (row.ssid.empty()) {
            continue;
        }

        WifiNetwork network;
        network.ssid = row.ssid;
        network.signal = row.signal;
        network.secured = !is_placeholder(row.security);
        network.connected = row.active;
        network.band = band_from_frequency(row.freq_mhz);
        network.channel = row.channel;
        network.freq_mhz = row.freq_mhz;
        network.security_type = security_type_from(row.security);

        auto key = std::make_pair(network.ssid, network.band);
        auto it = index_by_key.find(key);
        if (it == index_by_key.end()) {
            index_by_key.emplace(std::move(key), networks.size());
            networks.push_back(std::move(network));
            continue;
        }

        WifiNetwork& kept = networks[it->second];
        bool replace = (network.connected && !kept.connected) ||
                       (network.connected == kept.connected && network.signal > kept.signal);
        if (replace) {
            kept = std::move(network);
        }
    }

    if (networks.size() < rows.size()) {
        spdlog::debug("[Scan] Reconciled {} rows into {} networks", rows.size(),
                      networks.size());
    }

    sort_networks(networks);
    return networks;
}

void sort_networks(std::vector<WifiNetwork>& networks) {
    std::stable_sort(networks.begin(), networks.end(),
                     [](const WifiNetwork& a, const WifiNetwork& b) {
                         if (a.connected != b.connected) {
                             return a.connected;
                         }
                         return a.signal > b.signal;
                     });
}

} // namespace netpanel
