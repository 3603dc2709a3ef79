// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/error_classifier.h"

#include <catch2/catch_test_macros.hpp>

using namespace netpanel;

TEST_CASE("Error classifier: real nmcli messages", "[nmcli][errors]") {
    REQUIRE(classify_nmcli_error("Connection activation was enqueued.") ==
            NmcliErrorClass::ActivationQueued);
    REQUIRE(classify_nmcli_error(
                "Error: 802-11-wireless-security.key-mgmt: property is missing.") ==
            NmcliErrorClass::KeyMgmtMissing);
    REQUIRE(classify_nmcli_error("Error: Connection activation failed: The base network "
                                 "connection was interrupted.") ==
            NmcliErrorClass::ConnectionInterrupted);
    REQUIRE(classify_nmcli_error("Error: No network with SSID 'Cafe' found.") ==
            NmcliErrorClass::NetworkNotFound);
    REQUIRE(classify_nmcli_error("Error: Connection activation failed: The Wi-Fi network "
                                 "could not be found.") == NmcliErrorClass::NetworkNotFound);
    REQUIRE(classify_nmcli_error("Error: connection 'Cafe' already exists.") ==
            NmcliErrorClass::AlreadyExists);
    REQUIRE(classify_nmcli_error("Error: unknown connection 'Hotspot'.") ==
            NmcliErrorClass::UnknownConnection);
    REQUIRE(classify_nmcli_error("Error: Connection activation failed: Secrets were required, "
                                 "but not provided.") == NmcliErrorClass::Fatal);
    REQUIRE(classify_nmcli_error("") == NmcliErrorClass::Fatal);
}

TEST_CASE("Error classifier: matching ignores case", "[nmcli][errors]") {
    REQUIRE(classify_nmcli_error("ERROR: NO NETWORK WITH SSID 'X' FOUND") ==
            NmcliErrorClass::NetworkNotFound);
    REQUIRE(classify_nmcli_error("Error: Unknown Connection 'Hotspot'") ==
            NmcliErrorClass::UnknownConnection);
}

TEST_CASE("Error classifier: table order decides overlapping messages", "[nmcli][errors]") {
    // Mentions both a missing key-mgmt and an interrupted connection
    std::string message = "key-mgmt property is missing; base network connection was interrupted";
    REQUIRE(classify_nmcli_error(message) == NmcliErrorClass::KeyMgmtMissing);

    SECTION("matches_error_class checks one class regardless of order") {
        REQUIRE(matches_error_class(message, NmcliErrorClass::ConnectionInterrupted));
        REQUIRE(matches_error_class(message, NmcliErrorClass::KeyMgmtMissing));
        REQUIRE_FALSE(matches_error_class(message, NmcliErrorClass::Fatal));
    }
}

TEST_CASE("Error classifier: rescan-recoverable classes", "[nmcli][errors]") {
    REQUIRE(is_rescan_recoverable(NmcliErrorClass::ConnectionInterrupted));
    REQUIRE(is_rescan_recoverable(NmcliErrorClass::NetworkNotFound));
    REQUIRE_FALSE(is_rescan_recoverable(NmcliErrorClass::Fatal));
    REQUIRE_FALSE(is_rescan_recoverable(NmcliErrorClass::ActivationQueued));
    REQUIRE_FALSE(is_rescan_recoverable(NmcliErrorClass::KeyMgmtMissing));
}

TEST_CASE("Error classifier: names", "[nmcli][errors]") {
    REQUIRE(std::string(nmcli_error_class_name(NmcliErrorClass::Fatal)) == "fatal");
    REQUIRE(std::string(nmcli_error_class_name(NmcliErrorClass::NetworkNotFound)) ==
            "network-not-found");
}
