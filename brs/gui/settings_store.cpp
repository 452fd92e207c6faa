/*
 * File:        settings_store.cpp
 * Module:      brs-gui
 * Purpose:     JSON persistence of the application settings
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "settings_store.h"
#include <logging.h>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStandardPaths>

namespace {
const QString BLENDER_PATH_KEY = QStringLiteral("blender_path");
}

SettingsStore::SettingsStore(const QString &filePath)
    : file_path_(filePath)
{
}

QString SettingsStore::defaultPath()
{
    const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath(QStringLiteral("config.json"));
}

brs::AppSettings SettingsStore::load()
{
    brs::AppSettings settings;

    QFile file(file_path_);
    if (!file.exists()) {
        BRS_LOG_INFO("No settings file at {}; creating one", file_path_.toStdString());
        if (!save(settings)) {
            BRS_LOG_WARN("Continuing with default settings that could not be saved");
        }
        return settings;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        BRS_LOG_WARN("Cannot read settings {}: {}", file_path_.toStdString(), file.errorString().toStdString());
        return settings;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        BRS_LOG_WARN("Settings file {} is malformed ({}); using defaults",
                     file_path_.toStdString(), parseError.errorString().toStdString());
        return settings;
    }

    settings.blender_path = doc.object().value(BLENDER_PATH_KEY).toString().toStdString();
    BRS_LOG_DEBUG("Loaded settings from {}: blender_path='{}'", file_path_.toStdString(), settings.blender_path);
    return settings;
}

bool SettingsStore::save(const brs::AppSettings &settings)
{
    const QFileInfo info(file_path_);
    if (!QDir().mkpath(info.absolutePath())) {
        BRS_LOG_ERROR("Cannot create settings directory {}", info.absolutePath().toStdString());
        return false;
    }

    QJsonObject root;
    root.insert(BLENDER_PATH_KEY, QString::fromStdString(settings.blender_path));

    QFile file(file_path_);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        BRS_LOG_ERROR("Cannot write settings {}: {}", file_path_.toStdString(), file.errorString().toStdString());
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    file.close();
    if (file.error() != QFileDevice::NoError) {
        BRS_LOG_ERROR("Failed writing settings {}: {}", file_path_.toStdString(), file.errorString().toStdString());
        return false;
    }

    BRS_LOG_DEBUG("Saved settings to {}", file_path_.toStdString());
    return true;
}
