// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstring>

namespace netpanel {

namespace {

struct CommandInfo {
    const char* name;
    int min_args;
    int max_args; ///< -1 = unlimited
};

const CommandInfo COMMANDS[] = {
    {"scan", 0, 0},        {"connect", 1, 1},      {"activate", 1, 1},
    {"disconnect", 1, 1},  {"info", 1, 1},         {"saved", 0, 0},
    {"forget", 1, 1},      {"autoconnect", 1, 2},  {"radio", 0, 1},
    {"wired", 0, 0},       {"wired-up", 1, 1},     {"wired-enable", 1, 1},
    {"dns", 2, -1},        {"hotspot", 1, 1},      {"devices", 0, 0},
};

const CommandInfo* find_command(const std::string& name) {
    for (const auto& info : COMMANDS) {
        if (name == info.name) {
            return &info;
        }
    }
    return nullptr;
}

bool is_on_off(const std::string& value) {
    return value == "on" || value == "off";
}

// Subcommand-specific argument values
bool check_command_args(const CliArgs& args) {
    const auto& pos = args.positional;

    if ((args.password || args.security) && args.command != "connect") {
        printf("Error: --password/--security only apply to 'connect'\n");
        return false;
    }
    if (!args.interface.empty() && args.command != "hotspot") {
        printf("Error: --interface only applies to 'hotspot start'\n");
        return false;
    }

    if (args.command == "autoconnect" && pos.size() == 2 && !is_on_off(pos[1])) {
        printf("Error: autoconnect expects on or off, got '%s'\n", pos[1].c_str());
        return false;
    }
    if ((args.command == "radio" || args.command == "wired-enable") && !pos.empty() &&
        !is_on_off(pos[0])) {
        printf("Error: %s expects on or off, got '%s'\n", args.command.c_str(), pos[0].c_str());
        return false;
    }
    if (args.command == "hotspot" && pos[0] != "start" && pos[0] != "stop" &&
        pos[0] != "status") {
        printf("Error: hotspot expects start, stop or status, got '%s'\n", pos[0].c_str());
        return false;
    }
    return true;
}

} // namespace

void print_help(const char* program_name) {
    printf("Usage: %s [options] <command> [arguments]\n", program_name);
    printf("\nCommands:\n");
    printf("  scan                        List Wi-Fi networks (connected first)\n");
    printf("  connect <ssid>              Connect to a network\n");
    printf("      --password <pw>         Password for a secured network\n");
    printf("      --security <type>       Security from the scan (WPA2, WPA3, WEP...)\n");
    printf("  activate <name>             Activate a saved connection\n");
    printf("  disconnect <ssid>           Disconnect from a network\n");
    printf("  info <ssid>                 Show details for a network\n");
    printf("  saved                       List saved Wi-Fi connections\n");
    printf("  forget <ssid>               Delete a saved connection\n");
    printf("  autoconnect <ssid> [on|off] Show or set autoconnect\n");
    printf("  radio [on|off]              Show or set the Wi-Fi radio\n");
    printf("  wired                       List wired connections\n");
    printf("  wired-up <name>             Activate a wired connection\n");
    printf("  wired-enable on|off         Connect or disconnect all ethernet devices\n");
    printf("  dns <connection> <servers...>  Set DNS servers ('auto' restores DHCP DNS)\n");
    printf("  hotspot start|stop|status   Control the hotspot (settings from config)\n");
    printf("      --interface <dev>       Wi-Fi device for 'hotspot start'\n");
    printf("  devices                     List devices connected to the hotspot\n");
    printf("\nOptions:\n");
    printf("  -c, --config <path>  Settings file (default: ~/.config/netpanel/settings.json)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("\nExit status: 0 on success, 1 when the operation fails, 2 on usage errors\n");
}

CliParseResult parse_cli_args(int argc, char** argv, CliArgs& args) {
    const char* program_name = argc > 0 ? argv[0] : "netpanel";

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(program_name);
            return CliParseResult::Help;
        } else if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: -c/--config requires a path argument\n");
                return CliParseResult::Error;
            }
            args.config_path = argv[++i];
        }
        // -v, -vv, -vvv
        else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        } else if (argv[i][0] == '-' && argv[i][1] == 'v' &&
                   strspn(argv[i] + 1, "v") == strlen(argv[i] + 1)) {
            args.verbosity += static_cast<int>(strlen(argv[i] + 1));
        } else if (strcmp(argv[i], "--log-dest") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-dest requires an argument\n");
                return CliParseResult::Error;
            }
            args.log_dest = argv[++i];
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: unknown log destination: %s\n", args.log_dest.c_str());
                return CliParseResult::Error;
            }
        } else if (strcmp(argv[i], "--log-file") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-file requires a path argument\n");
                return CliParseResult::Error;
            }
            args.log_file = argv[++i];
        } else if (strcmp(argv[i], "--password") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --password requires an argument\n");
                return CliParseResult::Error;
            }
            args.password = std::string(argv[++i]);
        } else if (strcmp(argv[i], "--security") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --security requires an argument\n");
                return CliParseResult::Error;
            }
            args.security = std::string(argv[++i]);
        } else if (strcmp(argv[i], "--interface") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --interface requires an argument\n");
                return CliParseResult::Error;
            }
            args.interface = argv[++i];
        } else if (strcmp(argv[i], "--") == 0) {
            // Everything after "--" is positional (SSIDs may start with '-')
            for (++i; i < argc; i++) {
                if (args.command.empty()) {
                    args.command = argv[i];
                } else {
                    args.positional.emplace_back(argv[i]);
                }
            }
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            printf("Unknown option: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return CliParseResult::Error;
        } else if (args.command.empty()) {
            args.command = argv[i];
        } else {
            args.positional.emplace_back(argv[i]);
        }
    }

    if (args.command.empty()) {
        printf("Error: no command given\n");
        print_help(program_name);
        return CliParseResult::Error;
    }

    const CommandInfo* info = find_command(args.command);
    if (!info) {
        printf("Unknown command: %s\n", args.command.c_str());
        printf("Use --help for usage information\n");
        return CliParseResult::Error;
    }

    int count = static_cast<int>(args.positional.size());
    if (count < info->min_args || (info->max_args >= 0 && count > info->max_args)) {
        printf("Error: wrong number of arguments for '%s'\n", info->name);
        printf("Use --help for usage information\n");
        return CliParseResult::Error;
    }

    if (!check_command_args(args)) {
        return CliParseResult::Error;
    }
    return CliParseResult::Ok;
}

} // namespace netpanel
