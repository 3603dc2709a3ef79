// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace netpanel {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< Journal when built with systemd and running under it, else syslog
    Journal, ///< systemd journal
    Syslog,  ///< syslog(3)
    File,    ///< Rotating file
    Console  ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Explicit path for LogTarget::File, empty for the default
};

/**
 * @brief Replace the default spdlog logger according to @p config
 */
void init(const LogConfig& config);

/**
 * @brief "auto", "journal", "syslog", "file" or "console"; anything else is Auto
 */
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Parse a level name ("trace" .. "off", "warning" accepted for warn)
 *
 * @return @p default_level for empty or unrecognized input
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/**
 * @brief Level for a -v count: 0 keeps @p base, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum level_from_verbosity(int verbosity, spdlog::level::level_enum base);

} // namespace logging
} // namespace netpanel
