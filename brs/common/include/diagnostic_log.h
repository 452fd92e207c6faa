/*
 * File:        diagnostic_log.h
 * Module:      brs-common
 * Purpose:     Per-scene diagnostic log written on unrecoverable job failures
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <filesystem>
#include <map>
#include <string>

namespace brs {

/**
 * @brief Failure report appended to the scene's diagnostic log
 */
struct DiagnosticReport {
    std::string error_message;                   ///< Short error text
    std::string failure_kind;                    ///< e.g. "OutputDirectoryError"
    std::map<std::string, std::string> context;  ///< Key/value failure context
};

/**
 * @brief Path of the diagnostic log for a scene file
 *
 * The log sits beside the scene file and is named after its stem:
 * /shots/A.blend -> /shots/A.log
 */
std::filesystem::path diagnostic_log_path(const std::filesystem::path& scene_file);

/**
 * @brief Append a failure report to the scene's diagnostic log
 *
 * Writes a timestamp, the error message, the failure context and a stack
 * backtrace of the reporting thread. Never throws; failures to write are
 * logged through the application logger.
 *
 * @return Path written to, or an empty path if the log could not be written
 */
std::filesystem::path write_diagnostic_log(const std::filesystem::path& scene_file,
                                           const DiagnosticReport& report);

} // namespace brs
