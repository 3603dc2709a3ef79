// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @file nmcli_parser.h
 * @brief Parsers for nmcli's two machine-readable output styles
 *
 * Style (a), terse records: `nmcli -t -f A,B,C ...` prints one record per line
 * with ':' between fields. Free-form values (SSIDs, profile names) may contain
 * colons, escaped as "\:" by current nmcli and unescaped by older versions and
 * by `-g`. Such a value is always the leftmost field of the records we request,
 * so records are split from the right.
 *
 * Style (b), key-value blocks: `nmcli -t connection show <id>` and
 * `nmcli -t device show <dev>` print `KEY:VALUE` lines, with array properties
 * as `IP4.DNS[1]`, `IP4.DNS[2]`, ...
 *
 * None of these functions fail: malformed input yields empty or partial results.
 */

namespace netpanel {

using KeyValueMap = std::map<std::string, std::string>;

/// Strip leading/trailing whitespace
std::string trim(const std::string& s);

/// ASCII lowercase copy
std::string to_lower(const std::string& s);

/// Case-insensitive substring test
bool contains_ci(const std::string& haystack, const std::string& needle);

/// Split text into lines, dropping '\r' and blank lines
std::vector<std::string> split_lines(const std::string& text);

/**
 * @brief Split a terse line on unescaped colons
 *
 * "\:" becomes a literal ':' and "\\" a literal '\' inside a field.
 */
std::vector<std::string> split_terse_fields(const std::string& line);

/**
 * @brief Split a terse record into exactly `count` fields, from the right
 *
 * The rightmost count-1 fields never contain colons; everything to their left
 * is rejoined into the first field. Returns fewer than `count` fields when the
 * line has too few separators; callers skip such lines.
 */
std::vector<std::string> split_fields_from_right(const std::string& line, size_t count);

/**
 * @brief Split a terse record into at most `count` fields, from the left
 *
 * For records whose free-form value is the last column (e.g. the CONNECTION
 * column of `device status`); surplus tokens are rejoined into the last field.
 */
std::vector<std::string> split_fields_from_left(const std::string& line, size_t count);

/**
 * @brief Parse `KEY:VALUE` lines into a map
 *
 * Splits on the first colon; key and value are trimmed and escaped colons in
 * the value are unescaped. Lines without a colon are ignored.
 */
KeyValueMap parse_key_value_output(const std::string& text);

/// True for nmcli's "no value" renderings: empty or "--"
bool is_placeholder(const std::string& value);

/// Map lookup that treats placeholders as absent
std::optional<std::string> get_value(const KeyValueMap& map, const std::string& key);

/**
 * @brief Convert an IPv4 prefix length to dotted-decimal netmask
 * @return std::nullopt when prefix is outside 0-32
 */
std::optional<std::string> prefix_to_netmask(int prefix);

/**
 * @brief Decompose "a.b.c.d/len" into (address, netmask)
 * @return std::nullopt when there is no '/', the prefix is not a number, or it exceeds 32
 */
std::optional<std::pair<std::string, std::string>> parse_ipv4_cidr(const std::string& cidr);

/**
 * @brief Collect `PREFIX[n]` values in ascending n, skipping placeholders
 *
 * A key equal to the bare prefix counts as index 0.
 */
std::vector<std::string> collect_indexed_values(const KeyValueMap& map, const std::string& prefix);

/**
 * @brief Find `dhcp_lease_time = N` among `DHCP4.OPTION[n]` entries
 */
std::optional<uint32_t> parse_dhcp_lease_time_seconds(const KeyValueMap& map);

/**
 * @brief Parse the digits of a value like "5180 MHz" or "36"
 * @return 0 when no digits are present or the number does not fit
 */
uint32_t parse_u32_digits(const std::string& value);

/**
 * @brief Parse a plain integer field, 0 on failure
 */
int parse_int_or_zero(const std::string& value);

} // namespace netpanel
