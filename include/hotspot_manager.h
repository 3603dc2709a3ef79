// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_executor.h"
#include "hotspot_config.h"
#include "net_error.h"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace netpanel {

/// Gateway address and subnet of the shared-mode access point
constexpr const char* HOTSPOT_ADDRESS_CIDR = "192.168.50.1/24";

/**
 * @brief Hotspot lifecycle
 *
 * Off -> Starting -> On -> Stopping -> Off; any transition may end in Error.
 */
enum class HotspotState { Off, Starting, On, Stopping, Error };

const char* hotspot_state_name(HotspotState state);

/**
 * @brief Fixed waits between dependent hotspot steps
 *
 * NetworkManager needs time to release the radio and to bring an AP up.
 * Tests construct HotspotTimings::none() so nothing sleeps.
 */
struct HotspotTimings {
    std::chrono::milliseconds client_settle{2000};     ///< After disconnecting client Wi-Fi
    std::chrono::milliseconds shared_cleanup{300};     ///< After each conflicting AP is stopped
    std::chrono::milliseconds profile_delete{500};     ///< After removing an old profile
    std::chrono::milliseconds stop_settle{200};        ///< Between down and delete
    std::chrono::milliseconds activation_verify{1000}; ///< Before reading back active state
    std::chrono::milliseconds activation_retry{2000};  ///< Before the second activation

    static HotspotTimings none() {
        using std::chrono::milliseconds;
        return HotspotTimings{milliseconds(0), milliseconds(0), milliseconds(0),
                              milliseconds(0), milliseconds(0), milliseconds(0)};
    }
};

/**
 * @brief Creates, activates and tears down the software access point
 *
 * The profile named HOTSPOT_CONNECTION_NAME and the radio are shared with
 * every other NetworkManager client, so nothing is cached: each call reads
 * the current state back from nmcli.
 *
 * Start protocol, strictly in order:
 * 1. Validate the config
 * 2. Check the interface exists and is a Wi-Fi device
 * 3. Disconnect client Wi-Fi on that interface (settle if anything was dropped)
 * 4. Stop other connections running in AP or shared mode
 * 5. Delete an existing hotspot profile
 * 6. Fast path: `nmcli device wifi hotspot ...`
 * 7. Otherwise a manual `connection add` with explicit AP settings
 * 8. Activate (one retry) until the profile reads back as activated
 */
class HotspotManager {
  public:
    using StateObserver = std::function<void(HotspotState)>;

    explicit HotspotManager(CommandExecutor& executor, HotspotTimings timings = HotspotTimings());

    /**
     * @brief Receive Starting/On/Stopping/Off/Error transitions
     */
    void set_state_observer(StateObserver observer);

    /**
     * @brief Start (or restart) the hotspot
     *
     * @param config Validated before any command runs
     * @param interface Wi-Fi device; empty selects the first one found
     */
    NetError start(const HotspotConfig& config, const std::string& interface);

    /**
     * @brief Stop the hotspot and delete its profile
     *
     * Succeeds when the profile is already gone.
     */
    NetError stop();

    /**
     * @brief Whether the hotspot profile is currently activated
     */
    NetError is_active(bool& active);

    /**
     * @brief On or Off as NetworkManager sees it now, Error when unreadable
     */
    HotspotState query_state();

    /**
     * @brief Names of all Wi-Fi devices
     *
     * Fails with HARDWARE_NOT_AVAILABLE when there are none.
     */
    NetError get_wifi_devices(std::vector<std::string>& devices);

    /**
     * @brief IPv4 address of the hotspot profile, without prefix
     */
    NetError get_hotspot_ip(std::optional<std::string>& ip);

    /**
     * @brief Device the hotspot profile is active on, empty when it is not active
     */
    NetError get_hotspot_device(std::optional<std::string>& device);

  private:
    CommandExecutor& executor_;
    HotspotTimings timings_;
    StateObserver observer_;

    CommandResult nmcli(const std::vector<std::string>& args);
    void wait(std::chrono::milliseconds duration);
    void notify(HotspotState state);

    NetError check_device(const std::string& interface);
    void disconnect_clients(const std::string& interface);
    void stop_shared_connections();
    bool profile_exists();
    void remove_profile();

    bool create_fast(const HotspotConfig& config, const std::string& interface);
    NetError create_manual(const HotspotConfig& config, const std::string& interface);
    NetError activate();

    NetError start_on(const HotspotConfig& config, const std::string& interface);
};

} // namespace netpanel
