/*
 * File:        main.cpp
 * Module:      brs-gui
 * Purpose:     Application entry point
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "mainwindow.h"
#include "settings_store.h"
#include <application_state.h>
#include <logging.h>
#include <QApplication>
#include <QCommandLineParser>
#include <QDir>

// Qt message handler that bridges to spdlog
void qtMessageHandler(QtMsgType type, const QMessageLogContext& /*context*/, const QString& msg)
{
    switch (type) {
    case QtDebugMsg:
        BRS_LOG_DEBUG("[Qt] {}", msg.toStdString());
        break;
    case QtInfoMsg:
        BRS_LOG_INFO("[Qt] {}", msg.toStdString());
        break;
    case QtWarningMsg:
        BRS_LOG_WARN("[Qt] {}", msg.toStdString());
        break;
    case QtCriticalMsg:
        BRS_LOG_ERROR("[Qt] {}", msg.toStdString());
        break;
    case QtFatalMsg:
        BRS_LOG_CRITICAL("[Qt] {}", msg.toStdString());
        break;
    }
}

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("brs-gui");
    app.setApplicationVersion(BRS_VERSION);
    app.setOrganizationName("brs");

    // Command-line argument parsing
    QCommandLineParser parser;
    parser.setApplicationDescription("Blender Render Supervisor - crash-resilient batch rendering");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption logLevelOption(
        "log-level",
        "Set logging verbosity (trace, debug, info, warn, error, critical, off)",
        "level",
        "info"
    );
    parser.addOption(logLevelOption);

    QCommandLineOption logFileOption(
        "log-file",
        "Write logs to specified file (in addition to console)",
        "filename"
    );
    parser.addOption(logFileOption);

    QCommandLineOption configOption(
        "config",
        "Settings file to use instead of the default location",
        "filename"
    );
    parser.addOption(configOption);

    QCommandLineOption blenderOption(
        "blender",
        "Blender executable for this session (not saved)",
        "path"
    );
    parser.addOption(blenderOption);

    parser.addPositionalArgument("scenes", "Scene files to queue at startup (optional)", "[scenes...]");

    parser.process(app);

    brs::init_app_logging(parser.value(logLevelOption).toStdString(),
                          "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                          parser.value(logFileOption).toStdString(),
                          "gui");

    // Install Qt message handler to bridge Qt messages to spdlog
    qInstallMessageHandler(qtMessageHandler);

    BRS_LOG_INFO("brs-gui {} starting", BRS_VERSION);

    const QString settingsPath = parser.isSet(configOption) ? parser.value(configOption)
                                                            : SettingsStore::defaultPath();
    SettingsStore settings(settingsPath);

    brs::ApplicationState state;
    state.settings = settings.load();
    state.render_driver_script = QDir(QCoreApplication::applicationDirPath())
                                     .filePath("scripts/render_driver.py").toStdString();

    if (parser.isSet(blenderOption)) {
        state.settings.blender_path = brs::resolve_renderer_selection(parser.value(blenderOption).toStdString());
        BRS_LOG_INFO("Using Blender from the command line: {}", state.settings.blender_path);
    }

    MainWindow window(state, settings);

    // Queue scene files given on the command line
    const QStringList scenes = parser.positionalArguments();
    for (const QString &scene : scenes) {
        BRS_LOG_INFO("Queueing scene from command line: {}", scene.toStdString());
        window.submitScene(QDir::current().absoluteFilePath(scene));
    }

    window.show();
    BRS_LOG_DEBUG("Main window shown, entering event loop");

    int result = app.exec();
    BRS_LOG_INFO("brs-gui exiting");
    return result;
}
