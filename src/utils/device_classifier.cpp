// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/device_classifier.h"

#include "utils/nmcli_parser.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace netpanel {

namespace {

struct KeywordGroup {
    DeviceKind kind;
    std::vector<const char*> keywords;
};

// Checked in order; the first group with a match wins
const std::vector<KeywordGroup>& hostname_keywords() {
    static const std::vector<KeywordGroup> groups = {
        {DeviceKind::Phone,
         {"phone", "android", "iphone", "ipad", "pixel", "galaxy", "mobile", "tablet"}},
        {DeviceKind::Tv,
         {"tv", "roku", "chromecast", "firetv", "bravia", "hisense", "samsung", "lg", "philips",
          "tcl", "vizio"}},
        {DeviceKind::Computer, {"laptop", "desktop", "pc", "macbook", "thinkpad", "surface"}},
        {DeviceKind::Iot, {"speaker", "echo", "nest", "homepod", "sonos"}},
    };
    return groups;
}

const std::vector<KeywordGroup>& vendor_keywords() {
    static const std::vector<KeywordGroup> groups = {
        {DeviceKind::Tv,
         {"roku", "chromecast", "vizio", "hisense", "tcl", "panasonic", "philips", "sharp",
          "toshiba", "lg electronics"}},
        {DeviceKind::Phone,
         {"apple", "samsung", "huawei", "xiaomi", "oneplus", "oppo", "vivo", "google", "motorola",
          "nokia", "sony", "htc"}},
        {DeviceKind::Computer,
         {"dell", "lenovo", "asus", "acer", "hewlett", "hp", "intel", "microsoft", "msi",
          "gigabyte", "framework", "system76"}},
        {DeviceKind::Iot, {"amazon", "ring", "nest", "sonos", "bose", "ubiquiti"}},
    };
    return groups;
}

DeviceKind match_keywords(const std::string& text, const std::vector<KeywordGroup>& groups) {
    std::string lower = to_lower(text);
    for (const auto& group : groups) {
        for (const char* keyword : group.keywords) {
            if (lower.find(keyword) != std::string::npos) {
                return group.kind;
            }
        }
    }
    return DeviceKind::Unknown;
}

// "aa:bb:cc:..." / "AA-BB-CC" / "aabbcc..." -> "AABBCC"
std::string oui_key(const std::string& text) {
    std::string key;
    for (char c : text) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            key += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            if (key.size() == 6) {
                break;
            }
        }
    }
    return key.size() == 6 ? key : std::string();
}

} // namespace

// ============================================================================
// OuiDatabase
// ============================================================================

const std::vector<std::string>& OuiDatabase::default_paths() {
    static const std::vector<std::string> paths = {
        "/usr/share/hwdata/oui.txt", "/usr/share/misc/oui.txt", "/usr/share/ieee-data/oui.txt",
        "/var/lib/ieee-data/oui.txt"};
    return paths;
}

const OuiDatabase& OuiDatabase::instance() {
    static const OuiDatabase database = load_first(default_paths());
    return database;
}

OuiDatabase OuiDatabase::load_first(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        std::ifstream file(path);
        if (!file.is_open()) {
            continue;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        OuiDatabase database = from_content(buffer.str());
        if (database.size() > 0) {
            spdlog::debug("[Oui] Loaded {} vendors from {}", database.size(), path);
            return database;
        }
    }

    spdlog::debug("[Oui] No vendor database found, vendor lookup disabled");
    return OuiDatabase();
}

OuiDatabase OuiDatabase::from_content(const std::string& content) {
    OuiDatabase database;

    for (const auto& line : split_lines(content)) {
        size_t marker = line.find("(hex)");
        size_t marker_len = 5;
        if (marker == std::string::npos) {
            marker = line.find("(base 16)");
            marker_len = 9;
        }
        if (marker == std::string::npos) {
            continue;
        }

        std::string key = oui_key(trim(line.substr(0, marker)));
        std::string vendor = trim(line.substr(marker + marker_len));
        if (key.empty() || vendor.empty()) {
            continue;
        }
        database.vendors_.emplace(key, vendor);
    }
    return database;
}

std::optional<std::string> OuiDatabase::lookup(const std::string& mac) const {
    std::string key = oui_key(mac);
    if (key.empty()) {
        return std::nullopt;
    }
    auto it = vendors_.find(key);
    if (it == vendors_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Classification
// ============================================================================

bool is_locally_administered(const std::string& mac) {
    std::string key = oui_key(mac);
    if (key.empty()) {
        return false;
    }
    int first_octet = std::stoi(key.substr(0, 2), nullptr, 16);
    return (first_octet & 0x02) != 0;
}

DeviceKind classify_hostname(const std::string& hostname) {
    return match_keywords(hostname, hostname_keywords());
}

DeviceKind classify_vendor(const std::string& vendor) {
    return match_keywords(vendor, vendor_keywords());
}

DeviceKind classify_device(const ConnectedDevice& device, const OuiDatabase& oui) {
    if (device.hostname) {
        DeviceKind kind = classify_hostname(*device.hostname);
        if (kind != DeviceKind::Unknown) {
            return kind;
        }
    }

    if (auto vendor = oui.lookup(device.mac)) {
        DeviceKind kind = classify_vendor(*vendor);
        if (kind != DeviceKind::Unknown) {
            return kind;
        }
    }

    if (is_locally_administered(device.mac)) {
        return DeviceKind::Phone;
    }
    return DeviceKind::Unknown;
}

DeviceKind classify_device(const ConnectedDevice& device) {
    return classify_device(device, OuiDatabase::instance());
}

std::string format_lease_remaining(int64_t expiry, int64_t now) {
    if (expiry <= now) {
        return "Lease expired";
    }

    int64_t minutes = (expiry - now + 59) / 60;
    if (minutes < 60) {
        return "Lease expires in " + std::to_string(minutes) + "m";
    }

    int64_t hours = minutes / 60;
    if (hours < 24) {
        return "Lease expires in " + std::to_string(hours) + "h " + std::to_string(minutes % 60) +
               "m";
    }

    return "Lease expires in " + std::to_string(hours / 24) + "d " + std::to_string(hours % 24) +
           "h";
}

} // namespace netpanel
