/*
 * File:        qt_process_runner.cpp
 * Module:      brs-gui
 * Purpose:     QProcess-backed implementation of the process runner
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "qt_process_runner.h"
#include <logging.h>
#include <QStringList>

QtProcessRunner::QtProcessRunner(QObject *parent)
    : QObject(parent)
{
    timeout_timer_.setSingleShot(true);
    connect(&timeout_timer_, &QTimer::timeout, this, [this]() { onTimeout(); });
}

QtProcessRunner::~QtProcessRunner()
{
    callbacks_ = brs::ProcessCallbacks{};
    detachProcess(true);
}

void QtProcessRunner::start(const brs::ProcessSpec& spec, brs::ProcessCallbacks callbacks)
{
    if (is_running()) {
        BRS_LOG_WARN("QtProcessRunner: start requested while a process is running; killing it");
        kill();
    }

    callbacks_ = std::move(callbacks);
    assembler_ = brs::LineAssembler{};
    timed_out_ = false;

    process_ = new QProcess(this);
    process_->setProcessChannelMode(spec.merge_stderr ? QProcess::MergedChannels
                                                      : QProcess::SeparateChannels);
    if (!spec.working_directory.empty()) {
        process_->setWorkingDirectory(QString::fromStdString(spec.working_directory));
    }

    QStringList args;
    for (const auto& arg : spec.arguments) {
        args << QString::fromStdString(arg);
    }

    QProcess *process = process_;
    connect(process, &QProcess::started, this, [this]() {
        BRS_LOG_DEBUG("Process started (pid {})", process_ ? process_->processId() : 0);
        if (callbacks_.on_started) {
            callbacks_.on_started();
        }
    });
    connect(process, &QProcess::readyReadStandardOutput, this, [this]() { onReadyRead(); });
    connect(process, &QProcess::finished, this,
            [this](int exitCode, QProcess::ExitStatus exitStatus) { onFinished(exitCode, exitStatus); });
    connect(process, &QProcess::errorOccurred, this,
            [this](QProcess::ProcessError error) { onErrorOccurred(error); });

    BRS_LOG_DEBUG("Starting {} {}", spec.program, args.join(' ').toStdString());
    process->start(QString::fromStdString(spec.program), args);

    if (spec.timeout.count() > 0) {
        timeout_timer_.start(static_cast<int>(spec.timeout.count()));
    }
}

void QtProcessRunner::kill()
{
    timeout_timer_.stop();
    callbacks_ = brs::ProcessCallbacks{};
    detachProcess(true);
}

bool QtProcessRunner::is_running() const
{
    return process_ && process_->state() != QProcess::NotRunning;
}

void QtProcessRunner::onReadyRead()
{
    if (!process_) {
        return;
    }
    const QByteArray chunk = process_->readAllStandardOutput();
    deliverLines(assembler_.feed(chunk.toStdString()));
}

void QtProcessRunner::onFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    timeout_timer_.stop();
    if (!process_) {
        return;
    }

    // Drain whatever arrived after the last readyRead
    deliverLines(assembler_.feed(process_->readAllStandardOutput().toStdString()));
    deliverLines(assembler_.flush());

    brs::ProcessExit exit;
    exit.exit_code = exitCode;
    if (timed_out_) {
        exit.status = brs::ExitStatus::TimedOut;
        exit.error = "Process timed out";
    } else if (exitStatus == QProcess::CrashExit) {
        exit.status = brs::ExitStatus::Crashed;
        exit.error = process_->errorString().toStdString();
    } else {
        exit.status = brs::ExitStatus::Normal;
    }
    deliverFinished(exit);
}

void QtProcessRunner::onErrorOccurred(QProcess::ProcessError error)
{
    if (!process_) {
        return;
    }

    // Other errors are followed by finished()
    if (error != QProcess::FailedToStart) {
        BRS_LOG_DEBUG("Process error {}: {}", static_cast<int>(error), process_->errorString().toStdString());
        return;
    }

    timeout_timer_.stop();
    brs::ProcessExit exit;
    exit.status = brs::ExitStatus::FailedToStart;
    exit.exit_code = -1;
    exit.error = process_->errorString().toStdString();
    deliverFinished(exit);
}

void QtProcessRunner::onTimeout()
{
    if (!is_running()) {
        return;
    }
    BRS_LOG_WARN("Process exceeded its timeout; killing it");
    timed_out_ = true;
    process_->kill();
}

void QtProcessRunner::deliverLines(const std::vector<std::string>& lines)
{
    for (const auto& line : lines) {
        // A callback may have killed the process
        if (!callbacks_.on_output_line) {
            return;
        }
        callbacks_.on_output_line(line);
    }
}

void QtProcessRunner::deliverFinished(const brs::ProcessExit& exit)
{
    // The callback may start the next process on this runner
    auto onFinished = std::move(callbacks_.on_finished);
    callbacks_ = brs::ProcessCallbacks{};
    detachProcess(false);

    if (onFinished) {
        onFinished(exit);
    }
}

void QtProcessRunner::detachProcess(bool terminate)
{
    if (!process_) {
        return;
    }

    QProcess *process = process_;
    process_ = nullptr;
    QObject::disconnect(process, nullptr, this, nullptr);

    if (terminate && process->state() != QProcess::NotRunning) {
        process->setParent(nullptr);
        connect(process, &QProcess::finished, process, &QObject::deleteLater);
        process->kill();
    } else {
        process->deleteLater();
    }
}
