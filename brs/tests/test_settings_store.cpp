/******************************************************************************
 * test_settings_store.cpp
 *
 * Tests for JSON settings persistence
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 ******************************************************************************/

#include "settings_store.h"
#include "test_support.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <cassert>
#include <iostream>

using brs::test::TempDir;

static QString qpath(const std::filesystem::path& p) {
    return QString::fromStdString(p.string());
}

void test_missing_file_is_created() {
    TempDir dir;
    const auto file = dir.path() / "nested" / "config.json";
    SettingsStore store(qpath(file));

    auto settings = store.load();
    assert(settings.blender_path.empty());
    assert(std::filesystem::exists(file));

    QFile f(qpath(file));
    assert(f.open(QIODevice::ReadOnly));
    const QJsonObject obj = QJsonDocument::fromJson(f.readAll()).object();
    assert(obj.contains("blender_path"));
    assert(obj.value("blender_path").toString().isEmpty());

    std::cout << "test_missing_file_is_created: PASSED\n";
}

void test_save_and_reload() {
    TempDir dir;
    SettingsStore store(qpath(dir.path() / "config.json"));

    brs::AppSettings settings;
    settings.blender_path = "/opt/blender-4.1/blender";
    assert(store.save(settings));

    SettingsStore reopened(qpath(dir.path() / "config.json"));
    assert(reopened.load().blender_path == "/opt/blender-4.1/blender");

    std::cout << "test_save_and_reload: PASSED\n";
}

void test_missing_key_and_malformed_file() {
    TempDir dir;
    dir.touch("nokey.json", "{ \"other\": 1 }");
    dir.touch("broken.json", "{ \"blender_path\": ");

    assert(SettingsStore(qpath(dir.path() / "nokey.json")).load().blender_path.empty());
    assert(SettingsStore(qpath(dir.path() / "broken.json")).load().blender_path.empty());

    std::cout << "test_missing_key_and_malformed_file: PASSED\n";
}

int main() {
    std::cout << "Running settings store tests...\n";

    test_missing_file_is_created();
    test_save_and_reload();
    test_missing_key_and_malformed_file();

    std::cout << "All settings store tests passed!\n";
    return 0;
}
