/*
 * File:        application_state.cpp
 * Module:      brs-core
 * Purpose:     Explicitly owned application-wide state
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "application_state.h"
#include "render_errors.h"

#include <fmt/format.h>
#include <system_error>

namespace fs = std::filesystem;

namespace brs {

TimeSource TimeSource::system() {
    TimeSource source;
    source.steady_now = [] { return std::chrono::steady_clock::now(); };
    source.wall_now = [] { return std::chrono::system_clock::now(); };
    return source;
}

void validate_renderer(const AppSettings& settings) {
    if (settings.blender_path.empty()) {
        throw ConfigError("Blender path is not set");
    }

    std::error_code ec;
    if (!fs::exists(settings.blender_path, ec)) {
        throw ConfigError(fmt::format("Blender executable not found: {}", settings.blender_path));
    }
}

bool is_renderer_configured(const AppSettings& settings) {
    try {
        validate_renderer(settings);
        return true;
    } catch (const ConfigError&) {
        return false;
    }
}

std::string resolve_renderer_selection(const std::string& selected_path) {
#ifdef __APPLE__
    fs::path p(selected_path);
    if (p.extension() == ".app") {
        return (p / "Contents" / "MacOS" / "Blender").string();
    }
#endif
    return selected_path;
}

} // namespace brs
