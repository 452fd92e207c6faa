/*
 * File:        qt_process_runner.h
 * Module:      brs-gui
 * Purpose:     QProcess-backed implementation of the process runner
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef QT_PROCESS_RUNNER_H
#define QT_PROCESS_RUNNER_H

#include <QObject>
#include <QProcess>
#include <QPointer>
#include <QTimer>
#include <process_runner.h>

/**
 * Runs child processes through QProcess on the Qt event loop
 *
 * Each start() creates a fresh QProcess. Output is read as it arrives and
 * split into lines; the finished callback is delivered only after the
 * remaining output has been drained. A killed process is disconnected
 * immediately and deletes itself once it has actually exited.
 */
class QtProcessRunner : public QObject, public brs::ProcessRunner
{
public:
    explicit QtProcessRunner(QObject *parent = nullptr);
    ~QtProcessRunner() override;

    void start(const brs::ProcessSpec& spec, brs::ProcessCallbacks callbacks) override;
    void kill() override;
    bool is_running() const override;

private:
    void onReadyRead();
    void onFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void onErrorOccurred(QProcess::ProcessError error);
    void onTimeout();

    void deliverLines(const std::vector<std::string>& lines);
    void deliverFinished(const brs::ProcessExit& exit);
    void detachProcess(bool terminate);

    QPointer<QProcess> process_;
    QTimer timeout_timer_;
    brs::ProcessCallbacks callbacks_;
    brs::LineAssembler assembler_;
    bool timed_out_ = false;
};

#endif // QT_PROCESS_RUNNER_H
