/*
 * File:        render_errors.cpp
 * Module:      brs-core
 * Purpose:     Error taxonomy for probing, inspecting and rendering
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "render_errors.h"

namespace brs {

std::string to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "None";
        case FailureKind::Config: return "ConfigError";
        case FailureKind::Probe: return "ProbeError";
        case FailureKind::OutputDirectory: return "OutputDirectoryError";
        case FailureKind::Launch: return "LaunchError";
        case FailureKind::Crash: return "CrashError";
        case FailureKind::ParseWarning: return "ParseWarning";
    }
    return "Unknown";
}

} // namespace brs
