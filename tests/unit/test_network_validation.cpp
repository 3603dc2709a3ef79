// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "utils/network_validation.h"

#include <catch2/catch_test_macros.hpp>

using namespace netpanel;

// ============================================================================
// Connect input validation
// ============================================================================

TEST_CASE("Network validation: connect SSID", "[validation][network][ssid]") {
    std::string reason;

    REQUIRE(validate_connect_ssid("Home", reason));
    REQUIRE(validate_connect_ssid("Cafe: Guest 5G", reason));
    REQUIRE(validate_connect_ssid(std::string(32, 'a'), reason));

    REQUIRE_FALSE(validate_connect_ssid("", reason));
    REQUIRE(reason == "SSID cannot be empty");

    REQUIRE_FALSE(validate_connect_ssid(std::string(33, 'a'), reason));
    REQUIRE_FALSE(validate_connect_ssid("bad\nssid", reason));
    REQUIRE_FALSE(validate_connect_ssid(std::string("nul\0l", 5), reason));
}

TEST_CASE("Network validation: SSID length counts bytes", "[validation][network][ssid]") {
    std::string reason;
    // 11 three-byte characters = 33 bytes
    std::string wide;
    for (int i = 0; i < 11; i++) {
        wide += "\xe2\x82\xac";
    }
    REQUIRE_FALSE(validate_connect_ssid(wide, reason));
    REQUIRE(validate_connect_ssid(wide.substr(0, 30), reason));
}

TEST_CASE("Network validation: connect password", "[validation][network][password]") {
    std::string reason;

    REQUIRE(validate_connect_password("hunter22", reason));
    REQUIRE(validate_connect_password("short", reason)); // WEP keys can be short

    REQUIRE_FALSE(validate_connect_password("", reason));
    REQUIRE_FALSE(validate_connect_password("tab\there", reason));
    REQUIRE_FALSE(validate_connect_password("del\x7f", reason));
}

// ============================================================================
// IP Address Validation Tests
// ============================================================================

TEST_CASE("Network validation: Valid IPv4 addresses", "[validation][network][ip]") {
    REQUIRE(is_valid_ipv4_address("192.168.1.1") == true);
    REQUIRE(is_valid_ipv4_address("10.0.0.1") == true);
    REQUIRE(is_valid_ipv4_address("8.8.8.8") == true);
    REQUIRE(is_valid_ipv4_address("255.255.255.255") == true);
    REQUIRE(is_valid_ipv4_address("0.0.0.0") == true);
    REQUIRE(is_valid_ipv4_address(" 1.1.1.1 ") == true);
}

TEST_CASE("Network validation: Invalid IPv4 addresses", "[validation][network][ip]") {
    REQUIRE(is_valid_ipv4_address("999.1.1.1") == false);
    REQUIRE(is_valid_ipv4_address("192.168.1.256") == false);
    REQUIRE(is_valid_ipv4_address("192.168.1") == false);
    REQUIRE(is_valid_ipv4_address("192.168.1.1.1") == false);
    REQUIRE(is_valid_ipv4_address("192.168..1") == false);
    REQUIRE(is_valid_ipv4_address("192.168.1.") == false);
    REQUIRE(is_valid_ipv4_address(".192.168.1.1") == false);
    REQUIRE(is_valid_ipv4_address("dns.google") == false);
    REQUIRE(is_valid_ipv4_address("") == false);
    REQUIRE(is_valid_ipv4_address("1.1.1.1000") == false);
}

// ============================================================================
// Interface names
// ============================================================================

TEST_CASE("Network validation: interface names", "[validation][network][iface]") {
    REQUIRE(is_valid_interface_name("wlan0"));
    REQUIRE(is_valid_interface_name("wlp2s0"));
    REQUIRE(is_valid_interface_name("wlan0.100"));
    REQUIRE(is_valid_interface_name("ap_0-x"));
    REQUIRE(is_valid_interface_name(std::string(15, 'w')));

    REQUIRE_FALSE(is_valid_interface_name(""));
    REQUIRE_FALSE(is_valid_interface_name(std::string(16, 'w')));
    REQUIRE_FALSE(is_valid_interface_name("-wlan0"));
    REQUIRE_FALSE(is_valid_interface_name("wlan 0"));
    REQUIRE_FALSE(is_valid_interface_name("wlan0;reboot"));
    REQUIRE_FALSE(is_valid_interface_name("wlan/0"));
}
