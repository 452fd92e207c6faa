/*
 * File:        render_errors.h
 * Module:      brs-core
 * Purpose:     Error taxonomy for probing, inspecting and rendering
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <stdexcept>
#include <string>

namespace brs {

/**
 * @brief Renderer path unset or nonexistent; blocks all job submission
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Probe process failed, timed out, or produced unusable output
 */
class ProbeError : public std::runtime_error {
public:
    explicit ProbeError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Output directory cannot be created or read
 */
class OutputDirectoryError : public std::runtime_error {
public:
    explicit OutputDirectoryError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Render process could not be started
 */
class LaunchError : public std::runtime_error {
public:
    explicit LaunchError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Attempt to remove the job that is currently active
 */
class InUseError : public std::runtime_error {
public:
    explicit InUseError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief Classification of job failures and recoverable conditions
 *
 * Crash and ParseWarning are handled inside the render supervisor and are
 * never reported as job failures.
 */
enum class FailureKind {
    None,
    Config,
    Probe,
    OutputDirectory,
    Launch,
    Crash,
    ParseWarning
};

std::string to_string(FailureKind kind);

} // namespace brs
