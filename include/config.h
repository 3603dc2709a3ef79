// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "hotspot_config.h"
#include "net_error.h"

#include "spdlog/spdlog.h"

#include <nlohmann/json.hpp>
#include <string>

namespace netpanel {

using json = nlohmann::json;

/**
 * @brief NetPanel settings file, one process-wide instance
 *
 * Values are addressed by JSON pointer ("/hotspot/band").
 *
 * Sections:
 * - /hotspot: ssid, password, band, channel, hidden, interface
 * - /app: color_scheme, auto_scan, expand_connected_details
 * - /log: level, target, file
 *
 * Initialize once from main() before any component reads it; no locking.
 *
 * @example
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init(Config::default_path());
 *
 * HotspotConfig hotspot;
 * if (cfg->get_hotspot_config(hotspot)) { ... }
 *
 * cfg->set<bool>("/app/auto_scan", false);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Load @p config_path, writing defaults when it is missing
     *
     * An unparseable file is renamed to `<path>.corrupt` and replaced by
     * defaults. Sections absent from the file are added.
     */
    void init(const std::string& config_path);

    /// @throws nlohmann::json::exception when the value is absent or mistyped
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /// Value at @p json_ptr, or @p default_value when absent or mistyped
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] {} has unexpected type: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /// Store a value, creating parent objects; persisted by save()
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    json& get_json(const std::string& json_path);

    /**
     * @brief Write configuration to disk (temp file + rename)
     *
     * @return false when the file could not be written
     */
    bool save();

    std::string get_path();

    /**
     * @brief Read the validated hotspot settings
     *
     * Fails with INVALID_PARAMETERS when the stored values do not validate;
     * @p config is left untouched in that case.
     */
    NetError get_hotspot_config(HotspotConfig& config);

    /**
     * @brief Validate and store hotspot settings (in memory)
     */
    NetError set_hotspot_config(const HotspotConfig& config);

    /// Preferred hotspot interface, empty for "first Wi-Fi device"
    std::string get_hotspot_interface();
    void set_hotspot_interface(const std::string& interface);

    NetError get_app_settings(AppSettings& settings);
    NetError set_app_settings(const AppSettings& settings);

    /**
     * @brief Replace everything with factory defaults (in memory)
     */
    void reset_to_defaults();

    /**
     * @brief `$HOME/.config/netpanel/settings.json`, or a /tmp fallback without HOME
     */
    static std::string default_path();

    static Config* get_instance();
};

} // namespace netpanel
