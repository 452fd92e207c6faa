/*
 * File:        application_state.h
 * Module:      brs-core
 * Purpose:     Explicitly owned application-wide state
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>

namespace brs {

/**
 * @brief Persisted user settings
 */
struct AppSettings {
    std::string blender_path;  ///< Renderer executable; empty when unset
};

/**
 * @brief Injectable clocks
 *
 * steady_now times frames and jobs; wall_now stamps sessions and projects
 * completion times.
 */
struct TimeSource {
    std::function<std::chrono::steady_clock::time_point()> steady_now;
    std::function<std::chrono::system_clock::time_point()> wall_now;

    static TimeSource system();
};

/**
 * @brief State constructed at startup and passed into the queue manager
 */
struct ApplicationState {
    AppSettings settings;
    std::filesystem::path render_driver_script;  ///< Script run inside the renderer
    std::string frame_prefix = "frame_";         ///< Output file name prefix
    std::chrono::milliseconds probe_timeout{std::chrono::seconds(120)};
    TimeSource clock = TimeSource::system();
};

/**
 * @brief Check that a usable renderer is configured
 *
 * @throws ConfigError if the path is empty or does not exist
 */
void validate_renderer(const AppSettings& settings);

/// True if validate_renderer() would succeed
bool is_renderer_configured(const AppSettings& settings);

/**
 * @brief Normalize a user-selected renderer path
 *
 * On macOS an application bundle (X.app) is mapped to the executable inside
 * it (X.app/Contents/MacOS/Blender). Other paths, and every path on other
 * platforms, are returned unchanged.
 */
std::string resolve_renderer_selection(const std::string& selected_path);

} // namespace brs
