// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "network_types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace netpanel {

/**
 * @brief MAC prefix to vendor name table from an IEEE oui.txt file
 *
 * The process-wide instance is loaded on first use from the first well-known
 * path that yields entries, and never changes afterwards.
 */
class OuiDatabase {
  public:
    /// Default search order for the system vendor database
    static const std::vector<std::string>& default_paths();

    /**
     * @brief Lazily loaded process-wide table
     */
    static const OuiDatabase& instance();

    /**
     * @brief Load the first file in @p paths that yields any entries
     */
    static OuiDatabase load_first(const std::vector<std::string>& paths);

    /**
     * @brief Parse oui.txt content
     *
     * Accepts `AA-BB-CC   (hex)\t\tVendor` and `AABBCC     (base 16)\t\tVendor`.
     */
    static OuiDatabase from_content(const std::string& content);

    /**
     * @brief Vendor for a MAC address in any common notation
     */
    std::optional<std::string> lookup(const std::string& mac) const;

    size_t size() const {
        return vendors_.size();
    }

  private:
    std::unordered_map<std::string, std::string> vendors_; ///< "AABBCC" -> vendor
};

/**
 * @brief True when the locally administered bit (0x02) of the first octet is set
 *
 * Phones randomise their MAC per network and set this bit.
 */
bool is_locally_administered(const std::string& mac);

/**
 * @brief Category from a hostname alone, Unknown when nothing matches
 */
DeviceKind classify_hostname(const std::string& hostname);

/**
 * @brief Category from a vendor name alone, Unknown when nothing matches
 *
 * Keyword groups are checked in order TV, phone, computer, IoT.
 */
DeviceKind classify_vendor(const std::string& vendor);

/**
 * @brief Classify a client for its icon
 *
 * Hostname keywords, then vendor keywords via @p oui, then the locally
 * administered bit (Phone), else Unknown.
 */
DeviceKind classify_device(const ConnectedDevice& device, const OuiDatabase& oui);

/// classify_device() against the process-wide OUI table
DeviceKind classify_device(const ConnectedDevice& device);

/**
 * @brief Human-readable time left on a lease
 *
 * "Lease expired", "Lease expires in 5m", "... 2h 5m", "... 3d 4h".
 * Minutes are rounded up.
 */
std::string format_lease_remaining(int64_t expiry, int64_t now);

} // namespace netpanel
