/******************************************************************************
 * test_qt_process_runner.cpp
 *
 * Tests for the QProcess-backed process runner using /bin/sh
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "qt_process_runner.h"
#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>
#include <cassert>
#include <iostream>
#include <optional>

using namespace brs;

struct RunResult {
    bool started = false;
    std::vector<std::string> lines;
    std::optional<ProcessExit> exit;
};

// Runs the event loop until the process finishes or 10 s pass
static RunResult run_process(QtProcessRunner& runner, const ProcessSpec& spec) {
    RunResult result;
    QEventLoop loop;

    ProcessCallbacks callbacks;
    callbacks.on_started = [&]() { result.started = true; };
    callbacks.on_output_line = [&](const std::string& line) { result.lines.push_back(line); };
    callbacks.on_finished = [&](const ProcessExit& exit) {
        result.exit = exit;
        loop.quit();
    };

    QTimer::singleShot(10000, &loop, &QEventLoop::quit);
    runner.start(spec, std::move(callbacks));
    loop.exec();
    return result;
}

static ProcessSpec shell(const std::string& script) {
    ProcessSpec spec;
    spec.program = "/bin/sh";
    spec.arguments = {"-c", script};
    return spec;
}

void test_lines_and_exit_code() {
    QtProcessRunner runner;
    auto r = run_process(runner, shell("printf 'Fra: 1\\nFra: 2\\r\\n[DONE]'; echo oops >&2; exit 3"));

    assert(r.started);
    assert(r.exit && r.exit->status == ExitStatus::Normal);
    assert(r.exit->exit_code == 3);
    assert(r.lines.size() == 3);
    assert(r.lines[0] == "Fra: 1");
    assert(r.lines[1] == "Fra: 2");
    // Unterminated line is flushed before the exit; stderr is merged
    assert(r.lines[2] == "[DONE]oops");
    assert(!runner.is_running());

    std::cout << "test_lines_and_exit_code: PASSED\n";
}

void test_failed_to_start() {
    QtProcessRunner runner;
    ProcessSpec spec;
    spec.program = "/nonexistent/blender";
    auto r = run_process(runner, spec);

    assert(r.exit && r.exit->status == ExitStatus::FailedToStart);
    assert(!r.exit->error.empty());
    assert(!r.started);

    std::cout << "test_failed_to_start: PASSED\n";
}

void test_timeout() {
    QtProcessRunner runner;
    ProcessSpec spec = shell("sleep 30");
    spec.timeout = std::chrono::milliseconds(200);
    auto r = run_process(runner, spec);

    assert(r.exit && r.exit->status == ExitStatus::TimedOut);

    std::cout << "test_timeout: PASSED\n";
}

void test_crash_exit() {
    QtProcessRunner runner;
    auto r = run_process(runner, shell("echo 'Fra: 7'; kill -SEGV $$"));

    assert(r.exit && r.exit->status == ExitStatus::Crashed);
    assert(!r.lines.empty() && r.lines[0] == "Fra: 7");

    std::cout << "test_crash_exit: PASSED\n";
}

void test_kill_suppresses_callbacks() {
    QtProcessRunner runner;
    bool finished = false;
    ProcessCallbacks callbacks;
    callbacks.on_finished = [&](const ProcessExit&) { finished = true; };
    runner.start(shell("sleep 30"), std::move(callbacks));

    QEventLoop loop;
    QTimer::singleShot(200, &loop, &QEventLoop::quit);
    loop.exec();
    assert(runner.is_running());

    runner.kill();
    assert(!runner.is_running());

    QTimer::singleShot(500, &loop, &QEventLoop::quit);
    loop.exec();
    assert(!finished);

    // The runner is reusable after a kill
    auto r = run_process(runner, shell("echo again"));
    assert(r.exit && r.exit->exit_code == 0);
    assert(r.lines.size() == 1 && r.lines[0] == "again");

    std::cout << "test_kill_suppresses_callbacks: PASSED\n";
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    std::cout << "Running Qt process runner tests...\n";

    test_lines_and_exit_code();
    test_failed_to_start();
    test_timeout();
    test_crash_exit();
    test_kill_suppresses_callbacks();

    std::cout << "All Qt process runner tests passed!\n";
    return 0;
}
