// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/nmcli_parser.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace netpanel {

std::string trim(const std::string& s) {
    auto start =
        std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
                   return std::isspace(c);
               }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string to_lower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> split_terse_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;

    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '\\' && i + 1 < line.size()) {
            char next = line[i + 1];
            if (next == ':' || next == '\\') {
                current += next;
                ++i;
            } else {
                current += line[i];
            }
        } else if (line[i] == ':') {
            fields.push_back(current);
            current.clear();
        } else {
            current += line[i];
        }
    }

    fields.push_back(current);
    return fields;
}

std::vector<std::string> split_fields_from_right(const std::string& line, size_t count) {
    std::vector<std::string> tokens = split_terse_fields(line);
    if (count == 0 || tokens.size() <= count) {
        return tokens;
    }

    // Rejoin the surplus leading tokens: they were unescaped colons inside the name
    size_t surplus = tokens.size() - count;
    std::vector<std::string> fields;
    fields.reserve(count);

    std::string name = tokens[0];
    for (size_t i = 1; i <= surplus; ++i) {
        name += ':';
        name += tokens[i];
    }
    fields.push_back(name);
    fields.insert(fields.end(), tokens.begin() + static_cast<std::ptrdiff_t>(surplus) + 1,
                  tokens.end());
    return fields;
}

std::vector<std::string> split_fields_from_left(const std::string& line, size_t count) {
    std::vector<std::string> tokens = split_terse_fields(line);
    if (count == 0 || tokens.size() <= count) {
        return tokens;
    }

    std::vector<std::string> fields(tokens.begin(),
                                    tokens.begin() + static_cast<std::ptrdiff_t>(count));
    for (size_t i = count; i < tokens.size(); ++i) {
        fields.back() += ':';
        fields.back() += tokens[i];
    }
    return fields;
}

KeyValueMap parse_key_value_output(const std::string& text) {
    KeyValueMap map;
    for (const auto& raw : split_lines(text)) {
        std::string line = trim(raw);
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, colon));
        std::string value = line.substr(colon + 1);

        // Values such as seen-bssids arrive as "AA\:BB\:..." in terse mode
        std::string unescaped;
        unescaped.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i) {
            if (value[i] == '\\' && i + 1 < value.size() &&
                (value[i + 1] == ':' || value[i + 1] == '\\')) {
                unescaped += value[i + 1];
                ++i;
            } else {
                unescaped += value[i];
            }
        }

        if (!key.empty()) {
            map[key] = trim(unescaped);
        }
    }
    return map;
}

bool is_placeholder(const std::string& value) {
    return value.empty() || value == "--";
}

std::optional<std::string> get_value(const KeyValueMap& map, const std::string& key) {
    auto it = map.find(key);
    if (it == map.end() || is_placeholder(it->second)) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> prefix_to_netmask(int prefix) {
    if (prefix < 0 || prefix > 32) {
        return std::nullopt;
    }
    uint32_t mask = (prefix == 0) ? 0u : (~0u << (32 - prefix));
    return std::to_string((mask >> 24) & 0xff) + "." + std::to_string((mask >> 16) & 0xff) +
           "." + std::to_string((mask >> 8) & 0xff) + "." + std::to_string(mask & 0xff);
}

std::optional<std::pair<std::string, std::string>> parse_ipv4_cidr(const std::string& cidr) {
    std::string value = trim(cidr);
    size_t slash = value.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }

    std::string prefix_str = value.substr(slash + 1);
    if (prefix_str.empty() || prefix_str.size() > 3 ||
        !std::all_of(prefix_str.begin(), prefix_str.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    auto mask = prefix_to_netmask(std::stoi(prefix_str));
    if (!mask) {
        return std::nullopt;
    }
    return std::make_pair(value.substr(0, slash), *mask);
}

std::vector<std::string> collect_indexed_values(const KeyValueMap& map,
                                                const std::string& prefix) {
    std::vector<std::pair<uint32_t, std::string>> items;

    for (const auto& [key, value] : map) {
        if (key.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::string rest = key.substr(prefix.size());
        uint32_t index = 0;
        if (!rest.empty()) {
            // Only "PREFIX[n]" belongs to the array; "IP4.DNSSEC" does not
            if (rest.front() != '[' || rest.back() != ']') {
                continue;
            }
            index = parse_u32_digits(rest.substr(1, rest.size() - 2));
        }

        std::string trimmed = trim(value);
        if (is_placeholder(trimmed)) {
            continue;
        }
        items.emplace_back(index, trimmed);
    }

    std::stable_sort(items.begin(), items.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> values;
    values.reserve(items.size());
    for (auto& item : items) {
        values.push_back(std::move(item.second));
    }
    return values;
}

std::optional<uint32_t> parse_dhcp_lease_time_seconds(const KeyValueMap& map) {
    for (const auto& [key, value] : map) {
        if (key.compare(0, 12, "DHCP4.OPTION") != 0) {
            continue;
        }

        std::string v = trim(value);
        size_t eq = v.find('=');
        std::string left = trim(eq == std::string::npos ? v : v.substr(0, eq));
        std::string right = eq == std::string::npos ? "" : trim(v.substr(eq + 1));

        if (left != "dhcp_lease_time" || right.empty()) {
            continue;
        }
        if (!std::all_of(right.begin(), right.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        try {
            unsigned long long seconds = std::stoull(right);
            if (seconds <= std::numeric_limits<uint32_t>::max()) {
                return static_cast<uint32_t>(seconds);
            }
        } catch (const std::exception&) {
            continue;
        }
    }
    return std::nullopt;
}

uint32_t parse_u32_digits(const std::string& value) {
    std::string digits;
    for (char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    if (digits.empty() || digits.size() > 10) {
        return 0;
    }
    unsigned long long parsed = std::stoull(digits);
    if (parsed > std::numeric_limits<uint32_t>::max()) {
        return 0;
    }
    return static_cast<uint32_t>(parsed);
}

int parse_int_or_zero(const std::string& value) {
    try {
        size_t consumed = 0;
        std::string trimmed = trim(value);
        int parsed = std::stoi(trimmed, &consumed);
        return consumed == trimmed.size() ? parsed : 0;
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace netpanel
