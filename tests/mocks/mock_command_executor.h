// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file mock_command_executor.h
 * @brief Scripted CommandExecutor for tests
 *
 * Responses are registered against an argv prefix. The longest matching
 * prefix wins; several responses for the same prefix are consumed in order
 * and the last one repeats. Unscripted commands succeed with empty output.
 * Every call is recorded.
 *
 * @example
 * MockCommandExecutor mock;
 * mock.on({"nmcli", "device", "wifi", "connect"}, MockCommandExecutor::fail("Error: ..."));
 * mock.on({"nmcli", "device", "wifi", "connect"}, MockCommandExecutor::ok());
 * ...
 * REQUIRE(mock.count({"nmcli", "device", "wifi", "rescan"}) == 1);
 */

#include "command_executor.h"

#include <mutex>
#include <string>
#include <vector>

using namespace netpanel;

class MockCommandExecutor : public CommandExecutor {
  public:
    using Argv = std::vector<std::string>;

    static CommandResult ok(const std::string& out = "") {
        CommandResult result;
        result.out = out;
        result.exit_status = 0;
        return result;
    }

    static CommandResult fail(const std::string& err, int exit_status = 1) {
        CommandResult result;
        result.err = err;
        result.exit_status = exit_status;
        return result;
    }

    /**
     * @brief Queue a response for commands starting with @p prefix
     */
    void on(const Argv& prefix, const CommandResult& result) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& script : scripts_) {
            if (script.prefix == prefix) {
                script.responses.push_back(result);
                return;
            }
        }
        scripts_.push_back(Script{prefix, {result}, 0});
    }

    CommandResult run(const Argv& argv) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(argv);

        Script* best = nullptr;
        for (auto& script : scripts_) {
            if (starts_with(argv, script.prefix) &&
                (!best || script.prefix.size() > best->prefix.size())) {
                best = &script;
            }
        }
        if (!best) {
            return ok();
        }

        const CommandResult& result = best->responses[best->next];
        if (best->next + 1 < best->responses.size()) {
            ++best->next;
        }
        return result;
    }

    const std::vector<Argv>& calls() const {
        return calls_;
    }

    /// Number of recorded calls starting with @p prefix
    size_t count(const Argv& prefix) const {
        size_t n = 0;
        for (const auto& call : calls_) {
            if (starts_with(call, prefix)) {
                ++n;
            }
        }
        return n;
    }

    /// Position of the first call starting with @p prefix, -1 if never called
    int index_of(const Argv& prefix) const {
        for (size_t i = 0; i < calls_.size(); ++i) {
            if (starts_with(calls_[i], prefix)) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    /// First call starting with @p prefix, empty if never called
    Argv find(const Argv& prefix) const {
        int index = index_of(prefix);
        return index < 0 ? Argv() : calls_[static_cast<size_t>(index)];
    }

    static bool contains(const Argv& argv, const std::string& token) {
        for (const auto& arg : argv) {
            if (arg == token) {
                return true;
            }
        }
        return false;
    }

  private:
    struct Script {
        Argv prefix;
        std::vector<CommandResult> responses;
        size_t next;
    };

    static bool starts_with(const Argv& argv, const Argv& prefix) {
        if (prefix.size() > argv.size()) {
            return false;
        }
        for (size_t i = 0; i < prefix.size(); ++i) {
            if (argv[i] != prefix[i]) {
                return false;
            }
        }
        return true;
    }

    mutable std::mutex mutex_;
    std::vector<Script> scripts_;
    std::vector<Argv> calls_;
};
