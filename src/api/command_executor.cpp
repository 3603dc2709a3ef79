// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command_executor.h"

#include "utils/nmcli_parser.h"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace netpanel {

std::string CommandResult::error_text() const {
    std::string text = trim(err);
    if (!text.empty()) {
        return text;
    }
    return trim(out);
}

std::future<CommandResult> CommandExecutor::run_async(std::vector<std::string> argv) {
    return std::async(std::launch::async,
                      [this, args = std::move(argv)]() { return run(args); });
}

std::string describe_command(const std::vector<std::string>& argv) {
    std::string text;
    bool mask_next = false;
    for (const auto& arg : argv) {
        if (!text.empty()) {
            text += ' ';
        }
        if (mask_next) {
            text += "******";
            mask_next = false;
            continue;
        }
        text += arg;
        // "password <pw>", "wifi-sec.psk <pw>", "wifi-sec.wep-key0 <key>"
        if (arg == "password" || arg == "wifi-sec.psk" || arg == "wifi-sec.wep-key0") {
            mask_next = true;
        }
    }
    return text;
}

NetError command_error(const CommandResult& result, const std::string& context,
                       const std::string& program) {
    std::string message = result.error_text();
    if (result.exit_status == 127) {
        return NetErrorHelper::exec_failed(program, message.empty() ? "could not be started" : message);
    }
    if (message.empty()) {
        message = "exit status " + std::to_string(result.exit_status);
    }
    return NetErrorHelper::command_failed(context, message);
}

// ============================================================================
// ProcessCommandExecutor
// ============================================================================

namespace {

constexpr int EXEC_FAILED_STATUS = 127;
constexpr int POLL_INTERVAL_MS = 100;

/// Current environment with LC_ALL=C, so nmcli output is parseable
std::vector<std::string> child_environment() {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        if (strncmp(*entry, "LC_ALL=", 7) != 0) {
            env.emplace_back(*entry);
        }
    }
    env.emplace_back("LC_ALL=C");
    return env;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

ProcessCommandExecutor::ProcessCommandExecutor(std::chrono::seconds timeout) : timeout_(timeout) {}

CommandResult ProcessCommandExecutor::run(const std::vector<std::string>& argv) {
    CommandResult result;

    if (argv.empty()) {
        result.exit_status = EXEC_FAILED_STATUS;
        result.err = "empty command";
        return result;
    }

    spdlog::trace("[Exec] {}", describe_command(argv));

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    // Close-on-exec so children of concurrent calls do not inherit each other's pipes
    if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.exit_status = EXEC_FAILED_STATUS;
        result.err = std::string("pipe failed: ") + strerror(errno);
        spdlog::error("[Exec] {}", result.err);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return result;
    }

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    // Prepared before fork: the child may only call async-signal-safe functions
    std::vector<std::string> env = child_environment();
    std::vector<char*> c_env;
    c_env.reserve(env.size() + 1);
    for (auto& entry : env) {
        c_env.push_back(const_cast<char*>(entry.c_str()));
    }
    c_env.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.exit_status = EXEC_FAILED_STATUS;
        result.err = std::string("fork failed: ") + strerror(errno);
        spdlog::error("[Exec] {}", result.err);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: dup2 clears close-on-exec on stdout/stderr, the pipe ends close at exec
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        execvpe(c_argv[0], c_argv.data(), c_env.data());
        const char* msg = "exec failed\n";
        ssize_t ignored = write(STDERR_FILENO, msg, strlen(msg));
        (void)ignored;
        _exit(EXEC_FAILED_STATUS);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(err_pipe[0], F_SETFL, O_NONBLOCK);

    auto start_time = std::chrono::steady_clock::now();
    bool timed_out = false;
    std::array<char, 4096> buffer;

    while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
        struct pollfd fds[2];
        nfds_t count = 0;
        int* owners[2] = {nullptr, nullptr};
        std::string* sinks[2] = {nullptr, nullptr};
        if (out_pipe[0] >= 0) {
            fds[count] = {out_pipe[0], POLLIN, 0};
            owners[count] = &out_pipe[0];
            sinks[count] = &result.out;
            ++count;
        }
        if (err_pipe[0] >= 0) {
            fds[count] = {err_pipe[0], POLLIN, 0};
            owners[count] = &err_pipe[0];
            sinks[count] = &result.err;
            ++count;
        }

        int ready = poll(fds, count, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[Exec] poll failed: {}", strerror(errno));
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buffer.data(), buffer.size());
            if (n > 0) {
                sinks[i]->append(buffer.data(), static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                close_fd(*owners[i]);
            }
        }

        if (std::chrono::steady_clock::now() - start_time > timeout_) {
            timed_out = true;
            break;
        }
    }

    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);

    int status = 0;
    if (timed_out) {
        spdlog::warn("[Exec] '{}' timed out after {}s", argv[0], timeout_.count());
        kill(pid, SIGTERM);
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        result.exit_status = EXEC_FAILED_STATUS;
        if (!result.err.empty() && result.err.back() != '\n') {
            result.err += '\n';
        }
        result.err += "timed out";
        return result;
    }

    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            spdlog::error("[Exec] waitpid failed: {}", strerror(errno));
            result.exit_status = EXEC_FAILED_STATUS;
            return result;
        }
    }

    result.exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (result.exit_status != 0) {
        spdlog::trace("[Exec] '{}' exited with code {}", argv[0], result.exit_status);
    }
    return result;
}

} // namespace netpanel
