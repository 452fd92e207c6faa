/*
 * File:        error_codes.h
 * Module:      brs-common
 * Purpose:     Common error codes and status enums
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#pragma once

#include <cstdint>

namespace brs {

/**
 * @brief Common result codes for API operations
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_FILE_NOT_FOUND = -1,
    ERROR_INVALID_FORMAT = -2,
    ERROR_NOT_CONFIGURED = -3,
    ERROR_IN_USE = -4
};

/**
 * @brief Check if a result code indicates success
 */
inline bool is_success(ResultCode code) {
    return code == ResultCode::SUCCESS;
}

/**
 * @brief Check if a result code indicates an error
 */
inline bool is_error(ResultCode code) {
    return code != ResultCode::SUCCESS;
}

} // namespace brs
