/*
 * File:        settings_store.h
 * Module:      brs-gui
 * Purpose:     JSON persistence of the application settings
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef SETTINGS_STORE_H
#define SETTINGS_STORE_H

#include <QString>
#include <application_state.h>

/**
 * Reads and writes { "blender_path": "..." }
 *
 * A missing file is created with an empty path. A missing key reads as an
 * empty string. A malformed file is reported and read as empty settings; it
 * is replaced on the next save.
 */
class SettingsStore
{
public:
    explicit SettingsStore(const QString &filePath);

    /// config.json in the application's config location
    static QString defaultPath();

    const QString &filePath() const { return file_path_; }

    brs::AppSettings load();
    bool save(const brs::AppSettings &settings);

private:
    QString file_path_;
};

#endif // SETTINGS_STORE_H
