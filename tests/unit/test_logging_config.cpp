// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace netpanel;
using namespace netpanel::logging;

// ============================================================================
// parse_level() tests
// ============================================================================

TEST_CASE("parse_level: valid level strings", "[logging][config]") {
    SECTION("trace") {
        REQUIRE(parse_level("trace") == spdlog::level::trace);
    }

    SECTION("debug") {
        REQUIRE(parse_level("debug") == spdlog::level::debug);
    }

    SECTION("info") {
        REQUIRE(parse_level("info") == spdlog::level::info);
    }

    SECTION("warn") {
        REQUIRE(parse_level("warn") == spdlog::level::warn);
    }

    SECTION("warning (alias)") {
        REQUIRE(parse_level("warning") == spdlog::level::warn);
    }

    SECTION("error") {
        REQUIRE(parse_level("error") == spdlog::level::err);
    }

    SECTION("critical") {
        REQUIRE(parse_level("critical") == spdlog::level::critical);
    }

    SECTION("off") {
        REQUIRE(parse_level("off") == spdlog::level::off);
    }
}

TEST_CASE("parse_level: returns default for invalid input", "[logging][config]") {
    SECTION("empty string") {
        REQUIRE(parse_level("", spdlog::level::warn) == spdlog::level::warn);
        REQUIRE(parse_level("", spdlog::level::debug) == spdlog::level::debug);
    }

    SECTION("unrecognized string") {
        REQUIRE(parse_level("verbose", spdlog::level::warn) == spdlog::level::warn);
        REQUIRE(parse_level("TRACE", spdlog::level::info) == spdlog::level::info); // case sensitive
    }
}

// ============================================================================
// level_from_verbosity() tests
// ============================================================================

TEST_CASE("level_from_verbosity: CLI verbosity flags", "[logging][config]") {
    SECTION("0 keeps the configured level") {
        REQUIRE(level_from_verbosity(0, spdlog::level::warn) == spdlog::level::warn);
        REQUIRE(level_from_verbosity(0, spdlog::level::debug) == spdlog::level::debug);
    }

    SECTION("-v (1) = info") {
        REQUIRE(level_from_verbosity(1, spdlog::level::warn) == spdlog::level::info);
    }

    SECTION("-vv (2) = debug") {
        REQUIRE(level_from_verbosity(2, spdlog::level::warn) == spdlog::level::debug);
    }

    SECTION("-vvv (3+) = trace") {
        REQUIRE(level_from_verbosity(3, spdlog::level::warn) == spdlog::level::trace);
        REQUIRE(level_from_verbosity(10, spdlog::level::warn) == spdlog::level::trace);
    }
}

// ============================================================================
// Log targets
// ============================================================================

TEST_CASE("parse_log_target: names", "[logging][config]") {
    REQUIRE(parse_log_target("journal") == LogTarget::Journal);
    REQUIRE(parse_log_target("syslog") == LogTarget::Syslog);
    REQUIRE(parse_log_target("file") == LogTarget::File);
    REQUIRE(parse_log_target("console") == LogTarget::Console);
    REQUIRE(parse_log_target("auto") == LogTarget::Auto);
    REQUIRE(parse_log_target("somewhere") == LogTarget::Auto);
    REQUIRE(parse_log_target("") == LogTarget::Auto);
}

TEST_CASE("log_target_name: round trips through parse_log_target", "[logging][config]") {
    for (LogTarget target : {LogTarget::Auto, LogTarget::Journal, LogTarget::Syslog,
                             LogTarget::File, LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
}

TEST_CASE("logging::init: file target writes to the given path", "[logging][init]") {
    std::filesystem::path file = std::filesystem::temp_directory_path() /
                                 ("netpanel_log_" + std::to_string(getpid()) + ".log");

    LogConfig config;
    config.level = spdlog::level::info;
    config.target = LogTarget::File;
    config.enable_console = false;
    config.file_path = file.string();
    init(config);

    spdlog::info("[Test] hello from the log test");
    spdlog::default_logger()->flush();

    std::ifstream in(file);
    std::stringstream buffer;
    buffer << in.rdbuf();
    REQUIRE(buffer.str().find("[Test] hello from the log test") != std::string::npos);

    // Leave a quiet console logger for the remaining tests
    LogConfig quiet;
    quiet.level = spdlog::level::off;
    quiet.target = LogTarget::Console;
    init(quiet);

    std::error_code ec;
    std::filesystem::remove(file, ec);
}
