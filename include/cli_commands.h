// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cli_args.h"
#include "command_executor.h"
#include "config.h"

namespace netpanel {

/**
 * @brief Run one parsed subcommand and print its result to stdout
 *
 * Failures are printed to stderr as the wrapped user message.
 *
 * @return 0 on success, 1 when the operation failed
 */
int run_cli_command(const CliArgs& args, CommandExecutor& executor, Config& config);

} // namespace netpanel
