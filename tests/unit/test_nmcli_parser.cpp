// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/nmcli_parser.h"

#include <catch2/catch_test_macros.hpp>

using namespace netpanel;

// ============================================================================
// Terse field splitting
// ============================================================================

TEST_CASE("nmcli parser: escaped colons stay inside a field", "[nmcli][parser]") {
    auto fields = split_terse_fields("My\\:Net:80:WPA2");
    REQUIRE(fields.size() == 3);
    REQUIRE(fields[0] == "My:Net");
    REQUIRE(fields[1] == "80");
    REQUIRE(fields[2] == "WPA2");
}

TEST_CASE("nmcli parser: escaped backslash", "[nmcli][parser]") {
    auto fields = split_terse_fields("a\\\\b:c");
    REQUIRE(fields.size() == 2);
    REQUIRE(fields[0] == "a\\b");
}

TEST_CASE("nmcli parser: empty fields are kept", "[nmcli][parser]") {
    auto fields = split_terse_fields(":80::no");
    REQUIRE(fields.size() == 4);
    REQUIRE(fields[0].empty());
    REQUIRE(fields[2].empty());
}

TEST_CASE("nmcli parser: split from right rejoins unescaped colons into the name",
          "[nmcli][parser]") {
    SECTION("surplus colons go to the first field") {
        auto fields = split_fields_from_right("Cafe:Guest:72:WPA2:no:6:2437", 6);
        REQUIRE(fields.size() == 6);
        REQUIRE(fields[0] == "Cafe:Guest");
        REQUIRE(fields[1] == "72");
        REQUIRE(fields[5] == "2437");
    }

    SECTION("exact count is untouched") {
        auto fields = split_fields_from_right("Home:60:WPA2:yes:36:5180", 6);
        REQUIRE(fields.size() == 6);
        REQUIRE(fields[0] == "Home");
    }

    SECTION("short lines are returned as-is") {
        REQUIRE(split_fields_from_right("a:b", 6).size() == 2);
    }
}

TEST_CASE("nmcli parser: split from left rejoins into the last field", "[nmcli][parser]") {
    auto fields = split_fields_from_left("wlan0:wifi:connected:Cafe:Guest", 4);
    REQUIRE(fields.size() == 4);
    REQUIRE(fields[0] == "wlan0");
    REQUIRE(fields[3] == "Cafe:Guest");
}

TEST_CASE("nmcli parser: split_lines drops blank lines and carriage returns", "[nmcli][parser]") {
    auto lines = split_lines("one\r\n\n  \ntwo\n");
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "one");
    REQUIRE(lines[1] == "two");
}

// ============================================================================
// Key-value output
// ============================================================================

TEST_CASE("nmcli parser: key-value output", "[nmcli][parser][kv]") {
    std::string output = "GENERAL.DEVICE:wlan0\n"
                         "GENERAL.HWADDR:AA\\:BB\\:CC\\:DD\\:EE\\:FF\n"
                         "IP4.ADDRESS[1]:192.168.1.20/24\n"
                         "IP4.GATEWAY:--\n"
                         "garbage line\n";
    KeyValueMap map = parse_key_value_output(output);

    REQUIRE(map["GENERAL.DEVICE"] == "wlan0");
    REQUIRE(map["GENERAL.HWADDR"] == "AA:BB:CC:DD:EE:FF");
    REQUIRE(map["IP4.ADDRESS[1]"] == "192.168.1.20/24");
    REQUIRE(map.count("garbage line") == 0);

    SECTION("placeholders read as absent") {
        REQUIRE_FALSE(get_value(map, "IP4.GATEWAY").has_value());
        REQUIRE_FALSE(get_value(map, "MISSING").has_value());
        REQUIRE(get_value(map, "GENERAL.DEVICE").value() == "wlan0");
    }
}

TEST_CASE("nmcli parser: indexed values are ordered by index", "[nmcli][parser][kv]") {
    KeyValueMap map = {{"IP4.DNS[2]", "1.1.1.1"},
                       {"IP4.DNS[10]", "9.9.9.9"},
                       {"IP4.DNS[1]", "8.8.8.8"},
                       {"IP4.DNSSEC", "ignored"},
                       {"IP4.DNS[3]", "--"}};

    auto dns = collect_indexed_values(map, "IP4.DNS");
    REQUIRE(dns.size() == 3);
    REQUIRE(dns[0] == "8.8.8.8");
    REQUIRE(dns[1] == "1.1.1.1");
    REQUIRE(dns[2] == "9.9.9.9");
}

TEST_CASE("nmcli parser: unindexed key counts as one value", "[nmcli][parser][kv]") {
    KeyValueMap map = {{"IP4.ADDRESS", "10.0.0.5/8"}};
    auto addresses = collect_indexed_values(map, "IP4.ADDRESS");
    REQUIRE(addresses.size() == 1);
    REQUIRE(addresses[0] == "10.0.0.5/8");
}

// ============================================================================
// Addresses
// ============================================================================

TEST_CASE("nmcli parser: prefix to netmask", "[nmcli][parser][ip]") {
    REQUIRE(prefix_to_netmask(24).value() == "255.255.255.0");
    REQUIRE(prefix_to_netmask(16).value() == "255.255.0.0");
    REQUIRE(prefix_to_netmask(0).value() == "0.0.0.0");
    REQUIRE(prefix_to_netmask(32).value() == "255.255.255.255");
    REQUIRE(prefix_to_netmask(20).value() == "255.255.240.0");
    REQUIRE_FALSE(prefix_to_netmask(33).has_value());
    REQUIRE_FALSE(prefix_to_netmask(-1).has_value());
}

TEST_CASE("nmcli parser: CIDR split", "[nmcli][parser][ip]") {
    auto parsed = parse_ipv4_cidr("192.168.50.1/24");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->first == "192.168.50.1");
    REQUIRE(parsed->second == "255.255.255.0");

    REQUIRE_FALSE(parse_ipv4_cidr("192.168.50.1").has_value());
    REQUIRE_FALSE(parse_ipv4_cidr("192.168.50.1/").has_value());
    REQUIRE_FALSE(parse_ipv4_cidr("192.168.50.1/40").has_value());
    REQUIRE_FALSE(parse_ipv4_cidr("192.168.50.1/x").has_value());
}

// ============================================================================
// DHCP lease time
// ============================================================================

TEST_CASE("nmcli parser: DHCP lease time from options", "[nmcli][parser][dhcp]") {
    SECTION("found among other options") {
        KeyValueMap map = {{"DHCP4.OPTION[1]", "broadcast_address = 192.168.1.255"},
                           {"DHCP4.OPTION[4]", "dhcp_lease_time = 86400"}};
        REQUIRE(parse_dhcp_lease_time_seconds(map).value() == 86400u);
    }

    SECTION("non-numeric value is ignored") {
        KeyValueMap map = {{"DHCP4.OPTION[4]", "dhcp_lease_time = forever"}};
        REQUIRE_FALSE(parse_dhcp_lease_time_seconds(map).has_value());
    }

    SECTION("absent") {
        KeyValueMap map = {{"DHCP4.OPTION[1]", "domain_name = lan"}};
        REQUIRE_FALSE(parse_dhcp_lease_time_seconds(map).has_value());
    }
}

// ============================================================================
// Numbers
// ============================================================================

TEST_CASE("nmcli parser: numeric helpers", "[nmcli][parser]") {
    REQUIRE(parse_u32_digits("36") == 36u);
    REQUIRE(parse_u32_digits("5180 MHz") == 5180u);
    REQUIRE(parse_u32_digits("") == 0u);
    REQUIRE(parse_u32_digits("--") == 0u);

    REQUIRE(parse_int_or_zero("72") == 72);
    REQUIRE(parse_int_or_zero(" 72 ") == 72);
    REQUIRE(parse_int_or_zero("7x") == 0);
    REQUIRE(parse_int_or_zero("") == 0);
}

TEST_CASE("nmcli parser: case-insensitive helpers", "[nmcli][parser]") {
    REQUIRE(to_lower("Error: NO Network") == "error: no network");
    REQUIRE(contains_ci("Error: Connection Activation Failed", "activation failed"));
    REQUIRE_FALSE(contains_ci("abc", "abd"));
    REQUIRE(trim("  \tvalue \n") == "value");
    REQUIRE(trim("   ").empty());
}
