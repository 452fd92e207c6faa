/*
 * File:        process_runner.h
 * Module:      brs-core
 * Purpose:     Abstract child-process seam used by the prober and supervisor
 *
 * The core never talks to an operating-system process API directly. A front
 * end supplies a ProcessRunner implementation that delivers output lines and
 * exit notifications on the control thread; tests supply a scripted one.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace brs {

/**
 * @brief Description of a process to launch
 */
struct ProcessSpec {
    std::string program;
    std::vector<std::string> arguments;
    std::string working_directory;           ///< Empty: inherit
    bool merge_stderr = true;                ///< Deliver stderr as output lines
    std::chrono::milliseconds timeout{0};    ///< Zero: no timeout
};

/**
 * @brief How a process ended
 */
enum class ExitStatus {
    Normal,         // Exited on its own (any exit code)
    Crashed,        // Terminated by a signal or abnormally
    FailedToStart,  // Executable missing, not executable, ...
    TimedOut        // Killed by the runner after ProcessSpec::timeout
};

std::string to_string(ExitStatus status);

struct ProcessExit {
    ExitStatus status = ExitStatus::Normal;
    int exit_code = 0;
    std::string error;  ///< Runner error text for non-Normal exits
};

/**
 * @brief Notifications for a started process
 *
 * on_finished is delivered exactly once per start(), after every output line
 * has been delivered.
 */
struct ProcessCallbacks {
    std::function<void()> on_started;
    std::function<void(const std::string& line)> on_output_line;
    std::function<void(const ProcessExit& exit)> on_finished;
};

/**
 * @brief Non-blocking child process launcher
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Launch a process
     *
     * Returns immediately. A launch failure is reported through
     * on_finished with ExitStatus::FailedToStart.
     */
    virtual void start(const ProcessSpec& spec, ProcessCallbacks callbacks) = 0;

    /**
     * @brief Forcefully terminate the running process
     *
     * No further callbacks are delivered for the killed process.
     */
    virtual void kill() = 0;

    virtual bool is_running() const = 0;
};

/**
 * @brief Splits arbitrary output chunks into complete lines
 *
 * Handles LF and CRLF line endings. A lone CR (progress-bar style rewrite)
 * also terminates a line.
 */
class LineAssembler {
public:
    /// Append a chunk, returning every line completed by it
    std::vector<std::string> feed(const std::string& chunk);

    /// Return the buffered partial line, if any, and clear it
    std::vector<std::string> flush();

private:
    std::string pending_;
    bool last_was_cr_ = false;
};

} // namespace brs
