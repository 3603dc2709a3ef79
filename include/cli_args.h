// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the netpanel tool
 *
 * Global options may appear anywhere; the first non-option word is the
 * subcommand and the remaining words are its arguments.
 */

#include <optional>
#include <string>
#include <vector>

namespace netpanel {

/// Exit status for a usage error
constexpr int EXIT_USAGE = 2;

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    // Global options
    std::string config_path; ///< Empty = Config::default_path()
    int verbosity = 0;
    std::string log_dest; ///< auto, journal, syslog, file, console (empty = config)
    std::string log_file;

    // Subcommand
    std::string command;
    std::vector<std::string> positional;

    // connect options
    std::optional<std::string> password;
    std::optional<std::string> security;

    // hotspot start option
    std::string interface;
};

enum class CliParseResult {
    Ok,   ///< Run `args.command`
    Help, ///< Help was printed; exit 0
    Error ///< Usage error was printed; exit EXIT_USAGE
};

/**
 * @brief Parse command-line arguments
 *
 * Checks the subcommand name and its argument count; values such as SSIDs
 * are validated later by the operations themselves.
 */
CliParseResult parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Print usage to stdout
 */
void print_help(const char* program_name);

} // namespace netpanel
