// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace netpanel {

// Test fixture for Config class testing
class ConfigTestFixture {
  protected:
    Config config;
    fs::path dir;
    std::string path;

    ConfigTestFixture() {
        static int counter = 0;
        dir = fs::temp_directory_path() /
              ("netpanel_config_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        fs::create_directories(dir);
        path = (dir / "settings.json").string();
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    void write_file(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    std::string read_file(const std::string& file) {
        std::ifstream in(file);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    json& data() {
        return config.data;
    }
};

} // namespace netpanel

using namespace netpanel;

// ============================================================================
// Loading
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: missing file creates defaults",
                 "[core][config][init]") {
    config.init(path);

    REQUIRE(fs::exists(path));
    REQUIRE(config.get_path() == path);
    REQUIRE(config.get<std::string>("/hotspot/band") == "Auto");
    REQUIRE(config.get<std::string>("/hotspot/channel") == "Auto");
    REQUIRE(config.get<bool>("/hotspot/hidden") == false);
    REQUIRE(config.get<std::string>("/hotspot/password").empty());
    REQUIRE(config.get<std::string>("/app/color_scheme") == "system");
    REQUIRE(config.get<bool>("/app/auto_scan") == true);
    REQUIRE(config.get<std::string>("/log/level") == "warn");

    std::string reason;
    REQUIRE(validate_hotspot_ssid(config.get<std::string>("/hotspot/ssid"), reason));

    json on_disk = json::parse(read_file(path));
    REQUIRE(on_disk["app"]["color_scheme"] == "system");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: corrupt file is backed up and replaced",
                 "[core][config][init]") {
    SECTION("parse error") {
        write_file("{ \"hotspot\": { \"ssid\": ");
    }
    SECTION("top level is not an object") {
        write_file("[1, 2, 3]");
    }

    config.init(path);

    REQUIRE(fs::exists(path + ".corrupt"));
    REQUIRE(data().is_object());
    REQUIRE(config.get<std::string>("/hotspot/band") == "Auto");
    REQUIRE(json::parse(read_file(path)).is_object());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: missing keys are filled, existing kept",
                 "[core][config][init]") {
    write_file(R"({"hotspot": {"ssid": "garage", "band": "5 GHz"}, "custom": 42})");

    config.init(path);

    REQUIRE(config.get<std::string>("/hotspot/ssid") == "garage");
    REQUIRE(config.get<std::string>("/hotspot/band") == "5 GHz");
    REQUIRE(config.get<std::string>("/hotspot/channel") == "Auto");
    REQUIRE(config.get<int>("/custom") == 42);
    REQUIRE(config.get<bool>("/app/auto_scan") == true);

    json on_disk = json::parse(read_file(path));
    REQUIRE(on_disk["hotspot"]["channel"] == "Auto");
    REQUIRE_FALSE(fs::exists(path + ".corrupt"));
}

// ============================================================================
// get() with default
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default", "[core][config][get]") {
    data() = {{"app", {{"auto_scan", "yes please"}}}};

    REQUIRE(config.get<bool>("/app/auto_scan", true) == true);
    REQUIRE(config.get<std::string>("/app/missing", "fallback") == "fallback");
    REQUIRE(config.get<std::string>("/nowhere/at/all", "x") == "x");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() without default throws on missing path",
                 "[core][config][get]") {
    data() = json::object();
    REQUIRE_THROWS_AS(config.get<std::string>("/hotspot/ssid"), json::exception);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate objects",
                 "[core][config][set]") {
    data() = json::object();
    config.set<std::string>("/log/level", "debug");
    REQUIRE(config.get<std::string>("/log/level") == "debug");
    REQUIRE(config.get_json("/log").is_object());
}

// ============================================================================
// Typed sections
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: hotspot settings round trip through disk",
                 "[core][config][hotspot]") {
    config.init(path);

    HotspotConfig hotspot;
    hotspot.ssid = "netpanel";
    hotspot.password = "supersecret";
    hotspot.band = "5 GHz";
    hotspot.channel = "36";
    hotspot.hidden = true;
    REQUIRE(config.set_hotspot_config(hotspot).success());
    config.set_hotspot_interface("wlan1");
    REQUIRE(config.save());

    Config reloaded;
    reloaded.init(path);
    HotspotConfig loaded;
    REQUIRE(reloaded.get_hotspot_config(loaded).success());
    REQUIRE(loaded.ssid == "netpanel");
    REQUIRE(loaded.password == "supersecret");
    REQUIRE(loaded.band == "5 GHz");
    REQUIRE(loaded.channel == "36");
    REQUIRE(loaded.hidden);
    REQUIRE(reloaded.get_hotspot_interface() == "wlan1");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: invalid hotspot settings are refused",
                 "[core][config][hotspot]") {
    config.init(path);

    SECTION("on write") {
        HotspotConfig hotspot;
        hotspot.ssid = "netpanel";
        hotspot.password = "short";
        NetError err = config.set_hotspot_config(hotspot);
        REQUIRE(err.result == NetResult::INVALID_PARAMETERS);
        REQUIRE(config.get<std::string>("/hotspot/password").empty());
    }

    SECTION("on read") {
        config.set<std::string>("/hotspot/ssid", std::string(40, 'x'));

        HotspotConfig loaded;
        loaded.ssid = "untouched";
        NetError err = config.get_hotspot_config(loaded);
        REQUIRE(err.result == NetResult::INVALID_PARAMETERS);
        REQUIRE(err.user_msg == "SSID must be 1-32 characters");
        REQUIRE(loaded.ssid == "untouched");
    }
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: app settings", "[core][config][app]") {
    config.init(path);

    AppSettings settings;
    REQUIRE(config.get_app_settings(settings).success());
    REQUIRE(settings.color_scheme == "system");

    settings.color_scheme = "dark";
    settings.auto_scan = false;
    REQUIRE(config.set_app_settings(settings).success());

    AppSettings loaded;
    REQUIRE(config.get_app_settings(loaded).success());
    REQUIRE(loaded.color_scheme == "dark");
    REQUIRE_FALSE(loaded.auto_scan);

    settings.color_scheme = "neon";
    REQUIRE(config.set_app_settings(settings).result == NetResult::INVALID_PARAMETERS);
    REQUIRE(config.get<std::string>("/app/color_scheme") == "dark");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: reset to defaults", "[core][config]") {
    config.init(path);
    config.set<std::string>("/hotspot/band", "5 GHz");
    config.set<int>("/custom", 1);

    config.reset_to_defaults();

    REQUIRE(config.get<std::string>("/hotspot/band") == "Auto");
    REQUIRE_FALSE(data().contains("custom"));
}
