/*
 * File:        render_queue_view_models.h
 * Module:      brs-presenters
 * Purpose:     View-facing render queue data models for GUI layers
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace brs {
struct SceneJob;
struct ProgressSnapshot;
struct SessionStatistics;
}

namespace brs::presenters {

/**
 * @brief One row of the queue list
 */
struct QueueRowView {
    std::string path;
    std::string file_name;
    std::string status;          // "Queued", "Rendering", ...
    std::string status_message;  // Short user-facing text
    int crash_count = 0;
    bool is_active = false;
    bool is_finished = false;
};

/**
 * @brief Progress display for the active job
 */
struct ProgressView {
    std::string file_name;
    int value = 0;
    int maximum = 0;
    std::string frame_text;       // "Rendering frame 4/20 | Crashes: 1"
    std::string average_text;     // "Avg frame: 00:00:12" or "calculating..."
    std::string elapsed_text;
    std::string remaining_text;
    std::string completion_text;  // Projected wall-clock finish
};

/**
 * @brief End-of-batch summary
 */
struct SessionSummaryView {
    int scenes_completed = 0;
    long long frames_completed = 0;
    std::string render_time_text;
    std::string session_time_text;
    std::string text;
};

/// "HH:MM:SS"; hours are not wrapped at 24
std::string formatDuration(std::chrono::duration<double> duration);

/// Local wall-clock time "HH:MM:SS"
std::string formatClockTime(std::chrono::system_clock::time_point time);

QueueRowView toQueueRowView(const brs::SceneJob& job, bool is_active, bool is_finished);

ProgressView toProgressView(const brs::ProgressSnapshot& snapshot);

SessionSummaryView toSessionSummaryView(const brs::SessionStatistics& stats,
                                        std::chrono::system_clock::time_point now);

} // namespace brs::presenters
