/*
 * Process runner - ToolBridge
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <toolbridge/exec/command.hpp>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace toolbridge {

struct ExecutionResult {
    int exit_code = -1;
    std::vector<std::string> stdout_lines;
    std::vector<std::string> stderr_lines;
    bool timed_out = false;
    bool cancelled = false;
    std::chrono::milliseconds duration{0};
    std::optional<std::string> spawn_error; // set when the executable could not be started (exit_code 127)

    bool succeeded() const { return exit_code == 0 && !timed_out && !cancelled && !spawn_error; }
    std::optional<std::string> first_stdout_line() const;
    std::optional<std::string> first_stderr_line() const;
    std::string stdout_text() const; // lines joined with '\n'
    std::string stderr_text() const;
};

enum class OutputStream { Stdout, Stderr };

// Receives output as soon as a complete line/record is read.
// Called from the thread that invoked ProcessRunner::run.
class OutputListener {
public:
    virtual ~OutputListener() = default;
    virtual void on_started(pid_t) {}
    virtual void on_output(OutputStream stream, const std::string& chunk) = 0;
};

class CancellationToken {
public:
    void cancel() { m_requested.store(true); }
    bool is_cancelled() const { return m_requested.load(); }
private:
    std::atomic<bool> m_requested{false};
};

class ProcessRunner {
public:
    struct Options {
        std::chrono::milliseconds kill_grace{5000};  // SIGTERM -> SIGKILL
        std::chrono::milliseconds drain_grace{2000}; // reading after exit while descendants hold the pipes
    };

    ProcessRunner() = default;
    explicit ProcessRunner(Options opts) : m_opts(opts) {}

    // Never throws for process failures: spawn errors, timeouts, cancellation
    // and non-zero exits are all reported in the result.
    ExecutionResult run(const CommandInvocation& inv,
                        OutputListener* listener = nullptr,
                        const CancellationToken* token = nullptr) const;
private:
    Options m_opts;
};

} // namespace toolbridge
