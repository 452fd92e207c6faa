/*
 * File:        logging.h
 * Module:      brs-common
 * Purpose:     Shared logging convenience header for core/GUI
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace brs {

/// Get the application logger (created on first use)
std::shared_ptr<spdlog::logger> get_app_logger();

/// Initialize application logging
/// @param level Log level (trace, debug, info, warn, error, critical, off)
/// @param pattern spdlog pattern
/// @param log_file Optional file path to write logs to (in addition to console)
/// @param logger_name Name shown in the [%n] field
void init_app_logging(const std::string& level = "info",
                      const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                      const std::string& log_file = "",
                      const std::string& logger_name = "brs");

} // namespace brs

// Application-wide logging macros that use the app logger
#define BRS_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(brs::get_app_logger(), __VA_ARGS__)
#define BRS_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(brs::get_app_logger(), __VA_ARGS__)
#define BRS_LOG_INFO(...)     SPDLOG_LOGGER_INFO(brs::get_app_logger(), __VA_ARGS__)
#define BRS_LOG_WARN(...)     SPDLOG_LOGGER_WARN(brs::get_app_logger(), __VA_ARGS__)
#define BRS_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(brs::get_app_logger(), __VA_ARGS__)
#define BRS_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(brs::get_app_logger(), __VA_ARGS__)
