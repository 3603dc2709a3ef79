// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "network_types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace netpanel {

/**
 * @brief Band label for a centre frequency
 *
 * 2400-2500 -> "2.4 GHz", 4900-5900 -> "5 GHz", 5925-7125 -> "6 GHz", else "Unknown".
 */
std::string band_from_frequency(uint32_t freq_mhz);

/**
 * @brief Security label for nmcli's SECURITY column
 *
 * Substring precedence WPA3 > WPA2 > WPA > WEP; any other non-empty,
 * non-"--" value is "Secured"; otherwise "Open".
 */
std::string security_type_from(const std::string& security);

/**
 * @brief Parse `nmcli -t -f SSID,SIGNAL,SECURITY,ACTIVE,CHAN,FREQ device wifi list`
 *
 * Records are split from the right so SSIDs may contain colons. Lines with
 * fewer than six fields are skipped; numeric fields degrade to 0.
 */
std::vector<ScanRow> parse_scan_rows(const std::string& output);

/**
 * @brief Deduplicate and order scan rows
 *
 * Keeps one entry per (SSID, band). A later row replaces the kept one when
 * it is connected and the kept one is not, or when both have the same
 * connected state and the later row has a strictly higher signal. Rows with
 * an empty SSID are dropped. Output is ordered by sort_networks().
 */
std::vector<WifiNetwork> reconcile_scan(const std::vector<ScanRow>& rows);

/**
 * @brief Connected networks first, then descending signal (stable)
 */
void sort_networks(std::vector<WifiNetwork>& networks);

} // namespace netpanel
