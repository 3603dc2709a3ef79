// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace netpanel {

Config* Config::instance{NULL};

namespace {

/// Default hotspot SSID: the host name when it is a valid SSID
std::string default_hotspot_ssid() {
    char hostname[256] = {0};
    if (gethostname(hostname, sizeof(hostname) - 1) == 0) {
        std::string name(hostname);
        std::string reason;
        if (validate_hotspot_ssid(name, reason)) {
            return name;
        }
    }
    return "Hotspot";
}

json get_default_hotspot_config() {
    return {{"ssid", default_hotspot_ssid()},
            {"password", ""},
            {"band", HOTSPOT_AUTO},
            {"channel", HOTSPOT_AUTO},
            {"hidden", false},
            {"interface", ""}};
}

json get_default_app_config() {
    return {{"color_scheme", "system"}, {"auto_scan", true}, {"expand_connected_details", false}};
}

json get_default_log_config() {
    return {{"level", "warn"}, {"target", "auto"}, {"file", ""}};
}

json get_default_config() {
    return {{"hotspot", get_default_hotspot_config()},
            {"app", get_default_app_config()},
            {"log", get_default_log_config()}};
}

/// Fill keys missing from `section` with their defaults; true if anything was added
bool ensure_section(json& data, const std::string& name, const json& defaults) {
    if (!data.contains(name) || !data[name].is_object()) {
        data[name] = defaults;
        return true;
    }

    bool modified = false;
    auto& section = data[name];
    for (auto& [key, value] : defaults.items()) {
        if (!section.contains(key)) {
            section[key] = value;
            modified = true;
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

std::string Config::default_path() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::string(home) + "/.config/netpanel/settings.json";
    }
    return "/tmp/netpanel-settings.json";
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;
    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            data = json::parse(std::fstream(config_path));
            if (!data.is_object()) {
                parse_error = "top-level value is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    if (ensure_section(data, "hotspot", get_default_hotspot_config())) {
        config_modified = true;
    }
    if (ensure_section(data, "app", get_default_app_config())) {
        config_modified = true;
    }
    if (ensure_section(data, "log", get_default_log_config())) {
        config_modified = true;
    }

    if (config_modified) {
        save();
    }

    spdlog::debug("[Config] initialized: hotspot ssid='{}'",
                  get<std::string>("/hotspot/ssid", ""));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        fs::path config_dir = fs::path(path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir)) {
            fs::create_directories(config_dir);
        }

        std::string tmp_path = path + ".tmp";
        {
            std::ofstream o(tmp_path);
            if (!o.is_open()) {
                spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
                return false;
            }

            o << std::setw(2) << data << std::endl;

            if (!o.good()) {
                spdlog::error("[Config] Error writing to config file: {}", tmp_path);
                return false;
            }
        }

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            spdlog::error("[Config] Could not replace {}", path);
            std::remove(tmp_path.c_str());
            return false;
        }

        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

// ============================================================================
// Typed sections
// ============================================================================

NetError Config::get_hotspot_config(HotspotConfig& config) {
    HotspotConfig loaded;
    loaded.ssid = get<std::string>("/hotspot/ssid", "");
    loaded.password = get<std::string>("/hotspot/password", "");
    loaded.band = get<std::string>("/hotspot/band", HOTSPOT_AUTO);
    loaded.channel = get<std::string>("/hotspot/channel", HOTSPOT_AUTO);
    loaded.hidden = get<bool>("/hotspot/hidden", false);

    std::string reason;
    if (!loaded.validate(reason)) {
        spdlog::warn("[Config] Stored hotspot settings are invalid: {}", reason);
        return NetErrorHelper::invalid_parameters(reason);
    }

    config = loaded;
    return NetErrorHelper::success();
}

NetError Config::set_hotspot_config(const HotspotConfig& config) {
    std::string reason;
    if (!config.validate(reason)) {
        spdlog::warn("[Config] Refusing to store hotspot settings: {}", reason);
        return NetErrorHelper::invalid_parameters(reason);
    }

    data["hotspot"]["ssid"] = config.ssid;
    data["hotspot"]["password"] = config.password;
    data["hotspot"]["band"] = config.band;
    data["hotspot"]["channel"] = config.channel;
    data["hotspot"]["hidden"] = config.hidden;
    return NetErrorHelper::success();
}

std::string Config::get_hotspot_interface() {
    return get<std::string>("/hotspot/interface", "");
}

void Config::set_hotspot_interface(const std::string& interface) {
    data["hotspot"]["interface"] = interface;
}

NetError Config::get_app_settings(AppSettings& settings) {
    AppSettings loaded;
    loaded.color_scheme = get<std::string>("/app/color_scheme", "system");
    loaded.auto_scan = get<bool>("/app/auto_scan", true);
    loaded.expand_connected_details = get<bool>("/app/expand_connected_details", false);

    std::string reason;
    if (!loaded.validate(reason)) {
        spdlog::warn("[Config] Stored app settings are invalid: {}", reason);
        return NetErrorHelper::invalid_parameters(reason);
    }

    settings = loaded;
    return NetErrorHelper::success();
}

NetError Config::set_app_settings(const AppSettings& settings) {
    std::string reason;
    if (!settings.validate(reason)) {
        return NetErrorHelper::invalid_parameters(reason);
    }

    data["app"]["color_scheme"] = settings.color_scheme;
    data["app"]["auto_scan"] = settings.auto_scan;
    data["app"]["expand_connected_details"] = settings.expand_connected_details;
    return NetErrorHelper::success();
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting configuration to defaults");
    data = get_default_config();
}

} // namespace netpanel
