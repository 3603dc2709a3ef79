// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "net_error.h"

#include <chrono>
#include <future>
#include <string>
#include <vector>

namespace netpanel {

/// Program name used for every NetworkManager call
constexpr const char* NMCLI = "nmcli";

/**
 * @brief Captured outcome of one subprocess invocation
 */
struct CommandResult {
    std::string out;      ///< Captured stdout
    std::string err;      ///< Captured stderr
    int exit_status = -1; ///< Exit code, or 127 when the program could not be started

    bool ok() const {
        return exit_status == 0;
    }

    /**
     * @brief Error text as nmcli reports it
     *
     * stderr trimmed; when stderr is empty, stdout trimmed.
     */
    std::string error_text() const;
};

/**
 * @brief Runs external commands and captures their output
 *
 * Implementations perform no retry and no interpretation of the output.
 * Everything above this seam (parsing, classification, retry) is tested
 * against MockCommandExecutor.
 */
class CommandExecutor {
  public:
    virtual ~CommandExecutor() = default;

    /**
     * @brief Run a program and wait for it to finish
     *
     * @param argv Program name followed by its arguments
     * @return Captured stdout, stderr and exit status
     */
    virtual CommandResult run(const std::vector<std::string>& argv) = 0;

    /**
     * @brief Run a program on a worker thread
     *
     * The executor must outlive the returned future.
     */
    std::future<CommandResult> run_async(std::vector<std::string> argv);
};

/**
 * @brief fork/exec based executor (no shell involved)
 *
 * stdout and stderr are drained concurrently through pipes. A child that
 * outlives the timeout gets SIGTERM, then SIGKILL.
 */
class ProcessCommandExecutor : public CommandExecutor {
  public:
    explicit ProcessCommandExecutor(std::chrono::seconds timeout = std::chrono::seconds(30));

    CommandResult run(const std::vector<std::string>& argv) override;

  private:
    std::chrono::seconds timeout_;
};

/**
 * @brief Render argv for logging, masking values that follow secret-bearing keys
 */
std::string describe_command(const std::vector<std::string>& argv);

/**
 * @brief Turn a failed command into a NetError
 *
 * A program that could not be started or timed out (exit 127) maps to EXEC_FAILED;
 * anything else to COMMAND_FAILED with `context` prefixed to the error text.
 */
NetError command_error(const CommandResult& result, const std::string& context,
                       const std::string& program = NMCLI);

} // namespace netpanel
