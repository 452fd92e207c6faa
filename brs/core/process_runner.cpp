/*
 * File:        process_runner.cpp
 * Module:      brs-core
 * Purpose:     Child-process seam helpers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "process_runner.h"

namespace brs {

std::string to_string(ExitStatus status) {
    switch (status) {
        case ExitStatus::Normal: return "normal";
        case ExitStatus::Crashed: return "crashed";
        case ExitStatus::FailedToStart: return "failed to start";
        case ExitStatus::TimedOut: return "timed out";
    }
    return "unknown";
}

std::vector<std::string> LineAssembler::feed(const std::string& chunk) {
    std::vector<std::string> lines;

    for (char c : chunk) {
        if (c == '\n') {
            // CRLF: the CR already terminated this line
            if (!last_was_cr_) {
                lines.push_back(std::move(pending_));
                pending_.clear();
            }
            last_was_cr_ = false;
        } else if (c == '\r') {
            lines.push_back(std::move(pending_));
            pending_.clear();
            last_was_cr_ = true;
        } else {
            pending_.push_back(c);
            last_was_cr_ = false;
        }
    }

    return lines;
}

std::vector<std::string> LineAssembler::flush() {
    std::vector<std::string> lines;
    if (!pending_.empty()) {
        lines.push_back(std::move(pending_));
        pending_.clear();
    }
    last_was_cr_ = false;
    return lines;
}

} // namespace brs
