// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <utility>
#include <vector>

#ifdef __linux__
#ifdef NETPANEL_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace netpanel {
namespace logging {

namespace {

constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

const std::pair<LogTarget, const char*> TARGET_NAMES[] = {
    {LogTarget::Auto, "auto"},       {LogTarget::Journal, "journal"},
    {LogTarget::Syslog, "syslog"},   {LogTarget::File, "file"},
    {LogTarget::Console, "console"},
};

const std::pair<const char*, spdlog::level::level_enum> LEVEL_NAMES[] = {
    {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
    {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
};

/// $XDG_DATA_HOME/netpanel/netpanel.log, ~/.local/share/... or /tmp
std::string default_log_file() {
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".local" / "share";
    } else {
        return "/tmp/netpanel.log";
    }

    std::filesystem::path dir = base / "netpanel";
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return "/tmp/netpanel.log";
    }
    return (dir / "netpanel.log").string();
}

LogTarget resolve_auto_target() {
#if defined(__linux__) && defined(NETPANEL_HAS_SYSTEMD)
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

/// Sink for @p target, nullptr when the target adds nothing beyond the console
spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::File:
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_path.empty() ? default_log_file() : file_path, LOG_FILE_MAX_BYTES,
            LOG_FILE_COUNT);
#ifdef __linux__
    case LogTarget::Journal:
#ifdef NETPANEL_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>("netpanel");
#endif
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>("netpanel", 0, LOG_USER, true);
#else
    case LogTarget::Journal:
    case LogTarget::Syslog:
#endif
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
    return nullptr;
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        // stdout belongs to command output
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget target = config.target == LogTarget::Auto ? resolve_auto_target() : config.target;
    try {
        if (auto sink = make_target_sink(target, config.file_path)) {
            sinks.push_back(std::move(sink));
        }
    } catch (const spdlog::spdlog_ex& e) {
        fprintf(stderr, "[Logging] Could not open %s sink: %s\n", log_target_name(target),
                e.what());
    }

    auto logger = std::make_shared<spdlog::logger>("netpanel", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] {} sink(s), target {}, level {}", sinks.size(),
                  log_target_name(target), spdlog::level::to_string_view(config.level));
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& [target, name] : TARGET_NAMES) {
        if (str == name) {
            return target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& [value, name] : TARGET_NAMES) {
        if (value == target) {
            return name;
        }
    }
    return "unknown";
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    for (const auto& [name, level] : LEVEL_NAMES) {
        if (str == name) {
            return level;
        }
    }
    return default_level;
}

spdlog::level::level_enum level_from_verbosity(int verbosity, spdlog::level::level_enum base) {
    switch (verbosity) {
    case 0:
        return base;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity < 0 ? base : spdlog::level::trace;
    }
}

} // namespace logging
} // namespace netpanel
