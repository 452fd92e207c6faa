/*
 * File:        render_queue_view_models.cpp
 * Module:      brs-presenters
 * Purpose:     Conversion of core queue state into view models
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "../include/render_queue_view_models.h"
#include <scene_job.h>
#include <render_supervisor.h>
#include <frame_statistics.h>

#include <fmt/format.h>
#include <fmt/chrono.h>
#include <algorithm>
#include <cmath>
#include <ctime>

namespace brs::presenters {

std::string formatDuration(std::chrono::duration<double> duration) {
    long long total = static_cast<long long>(std::llround(std::max(0.0, duration.count())));
    const long long hours = total / 3600;
    const long long minutes = (total / 60) % 60;
    const long long seconds = total % 60;
    return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
}

std::string formatClockTime(std::chrono::system_clock::time_point time) {
    const std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return fmt::format("{:%H:%M:%S}", tm);
}

QueueRowView toQueueRowView(const brs::SceneJob& job, bool is_active, bool is_finished) {
    QueueRowView row;
    row.path = job.path.string();
    row.file_name = job.path.filename().string();
    row.status = brs::to_string(job.status);
    row.status_message = job.status_message;
    row.crash_count = job.crash_count;
    row.is_active = is_active;
    row.is_finished = is_finished;
    return row;
}

ProgressView toProgressView(const brs::ProgressSnapshot& snapshot) {
    ProgressView v;
    v.file_name = snapshot.scene.filename().string();
    v.value = snapshot.progress_value;
    v.maximum = snapshot.progress_maximum;

    if (snapshot.frame_seen) {
        v.frame_text = fmt::format("Rendering frame {}/{} | Crashes: {}",
                                   snapshot.current_frame, snapshot.end_frame, snapshot.crash_count);
    } else {
        v.frame_text = fmt::format("Rendering frames {}-{}", snapshot.start_frame, snapshot.end_frame);
    }

    const auto& est = snapshot.estimate;
    v.elapsed_text = fmt::format("Elapsed: {}", formatDuration(est.elapsed));
    if (est.is_calculating()) {
        v.average_text = "Avg frame: calculating...";
        v.remaining_text = "Remaining: calculating...";
        v.completion_text = "Finish: calculating...";
    } else {
        v.average_text = fmt::format("Avg frame: {}", formatDuration(*est.average_frame_time));
        v.remaining_text = fmt::format("Remaining: {}", formatDuration(*est.estimated_remaining));
        v.completion_text = est.estimated_completion
            ? fmt::format("Finish: {}", formatClockTime(*est.estimated_completion))
            : std::string("Finish: calculating...");
    }
    return v;
}

SessionSummaryView toSessionSummaryView(const brs::SessionStatistics& stats,
                                        std::chrono::system_clock::time_point now) {
    SessionSummaryView v;
    v.scenes_completed = stats.scenes_completed;
    v.frames_completed = static_cast<long long>(stats.frames_completed);
    v.render_time_text = formatDuration(stats.total_render_time);
    v.session_time_text = formatDuration(now - stats.session_start);
    v.text = fmt::format("Queue finished: {} scene(s), {} frame(s) rendered in {} (session {})",
                         v.scenes_completed, v.frames_completed,
                         v.render_time_text, v.session_time_text);
    return v;
}

} // namespace brs::presenters
