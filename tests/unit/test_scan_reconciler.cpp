// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/scan_reconciler.h"

#include <catch2/catch_test_macros.hpp>

using namespace netpanel;

namespace {

ScanRow row(const std::string& ssid, int signal, bool active, uint32_t freq,
            const std::string& security = "WPA2") {
    ScanRow r;
    r.ssid = ssid;
    r.signal = signal;
    r.active = active;
    r.freq_mhz = freq;
    r.security = security;
    return r;
}

} // namespace

// ============================================================================
// Field derivation
// ============================================================================

TEST_CASE("Scan: band from frequency", "[scan]") {
    REQUIRE(band_from_frequency(2412) == "2.4 GHz");
    REQUIRE(band_from_frequency(2484) == "2.4 GHz");
    REQUIRE(band_from_frequency(5180) == "5 GHz");
    REQUIRE(band_from_frequency(5825) == "5 GHz");
    REQUIRE(band_from_frequency(5955) == "6 GHz");
    REQUIRE(band_from_frequency(0) == "Unknown");
    REQUIRE(band_from_frequency(900) == "Unknown");
}

TEST_CASE("Scan: security type label", "[scan]") {
    REQUIRE(security_type_from("WPA2 WPA3") == "WPA3");
    REQUIRE(security_type_from("WPA1 WPA2") == "WPA2");
    REQUIRE(security_type_from("WPA1") == "WPA");
    REQUIRE(security_type_from("WEP") == "WEP");
    REQUIRE(security_type_from("802.1X") == "Secured");
    REQUIRE(security_type_from("") == "Open");
    REQUIRE(security_type_from("--") == "Open");
}

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("Scan: parse rows", "[scan][parse]") {
    std::string output = "Home:82:WPA2:yes:36:5180\n"
                         "Cafe\\:Guest:40::no:6:2437\n"
                         "Odd:Name:55:WPA1 WPA2:no:11:2462\n"
                         "broken:line\n"
                         ":30:WPA2:no:1:2412\n";

    auto rows = parse_scan_rows(output);
    REQUIRE(rows.size() == 4);

    REQUIRE(rows[0].ssid == "Home");
    REQUIRE(rows[0].signal == 82);
    REQUIRE(rows[0].active);
    REQUIRE(rows[0].channel == 36);
    REQUIRE(rows[0].freq_mhz == 5180);

    REQUIRE(rows[1].ssid == "Cafe:Guest");
    REQUIRE(rows[1].security.empty());

    REQUIRE(rows[2].ssid == "Odd:Name");
    REQUIRE(rows[2].security == "WPA1 WPA2");

    REQUIRE(rows[3].ssid.empty());
}

TEST_CASE("Scan: signal is clamped to 0-100", "[scan][parse]") {
    auto rows = parse_scan_rows("A:140:WPA2:no:1:2412\nB:-5:WPA2:no:1:2412\nC:x:WPA2:no:1:2412\n");
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].signal == 100);
    REQUIRE(rows[1].signal == 0);
    REQUIRE(rows[2].signal == 0);
}

// ============================================================================
// Reconciliation
// ============================================================================

TEST_CASE("Scan: one entry per SSID and band", "[scan][reconcile]") {
    std::vector<ScanRow> rows = {row("Home", 40, false, 2412), row("Home", 70, false, 2437),
                                 row("Home", 60, false, 5180)};

    auto networks = reconcile_scan(rows);
    REQUIRE(networks.size() == 2);

    REQUIRE(networks[0].band == "2.4 GHz");
    REQUIRE(networks[0].signal == 70);
    REQUIRE(networks[1].band == "5 GHz");
    REQUIRE(networks[1].signal == 60);
}

TEST_CASE("Scan: active access point beats a stronger one", "[scan][reconcile]") {
    std::vector<ScanRow> rows = {row("Home", 90, false, 2412), row("Home", 30, true, 2437),
                                 row("Home", 95, false, 2462)};

    auto networks = reconcile_scan(rows);
    REQUIRE(networks.size() == 1);
    REQUIRE(networks[0].connected);
    REQUIRE(networks[0].signal == 30);
}

TEST_CASE("Scan: hidden networks are dropped", "[scan][reconcile]") {
    auto networks = reconcile_scan({row("", 90, false, 2412), row("Visible", 20, false, 2412)});
    REQUIRE(networks.size() == 1);
    REQUIRE(networks[0].ssid == "Visible");
}

TEST_CASE("Scan: connected first, then by signal", "[scan][reconcile]") {
    auto networks = reconcile_scan({row("Weak", 10, false, 2412), row("Strong", 90, false, 2412),
                                    row("Mine", 35, true, 5180), row("Mid", 50, false, 2412)});

    REQUIRE(networks.size() == 4);
    REQUIRE(networks[0].ssid == "Mine");
    REQUIRE(networks[1].ssid == "Strong");
    REQUIRE(networks[2].ssid == "Mid");
    REQUIRE(networks[3].ssid == "Weak");
}

TEST_CASE("Scan: open networks are not secured", "[scan][reconcile]") {
    auto networks = reconcile_scan({row("Open", 50, false, 2412, "--"),
                                    row("Closed", 40, false, 2412, "WPA3")});
    REQUIRE(networks.size() == 2);
    REQUIRE_FALSE(networks[0].secured);
    REQUIRE(networks[0].security_type == "Open");
    REQUIRE(networks[1].secured);
    REQUIRE(networks[1].security_type == "WPA3");
}
