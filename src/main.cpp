// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "cli_commands.h"
#include "command_executor.h"
#include "config.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

using namespace netpanel;

int main(int argc, char** argv) {
    CliArgs args;
    switch (parse_cli_args(argc, argv, args)) {
    case CliParseResult::Help:
        return 0;
    case CliParseResult::Error:
        return EXIT_USAGE;
    case CliParseResult::Ok:
        break;
    }

    // Initialize config system early so we can read logging settings
    Config* config = Config::get_instance();
    config->init(args.config_path.empty() ? Config::default_path() : args.config_path);

    // Initialize logging subsystem
    // Priority: CLI > config > defaults
    {
        logging::LogConfig log_config;

        spdlog::level::level_enum base =
            logging::parse_level(config->get<std::string>("/log/level", "warn"));
        log_config.level = logging::level_from_verbosity(args.verbosity, base);

        std::string log_dest_str = args.log_dest;
        if (log_dest_str.empty()) {
            log_dest_str = config->get<std::string>("/log/target", "auto");
        }
        log_config.target = logging::parse_log_target(log_dest_str);

        log_config.file_path = args.log_file;
        if (log_config.file_path.empty()) {
            log_config.file_path = config->get<std::string>("/log/file", "");
        }

        logging::init(log_config);
    }

    spdlog::debug("[Main] netpanel {} (config {})", args.command, config->get_path());

    ProcessCommandExecutor executor;
    int status = run_cli_command(args, executor, *config);

    spdlog::shutdown();
    return status;
}
