/*
 * File:        frame_statistics.cpp
 * Module:      brs-core
 * Purpose:     Per-frame timing, averages and ETA estimation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "frame_statistics.h"

#include <algorithm>
#include <numeric>

namespace brs {

FrameEstimate estimate_frames(const std::vector<Seconds>& frame_times,
                              int32_t total_frames,
                              Seconds elapsed,
                              std::chrono::system_clock::time_point now) {
    FrameEstimate estimate;
    estimate.elapsed = elapsed;
    estimate.total_frames = total_frames;
    estimate.frames_done = static_cast<int32_t>(frame_times.size());

    if (frame_times.empty()) {
        return estimate;
    }

    const Seconds sum = std::accumulate(frame_times.begin(), frame_times.end(), Seconds{0.0});
    const Seconds average = sum / static_cast<double>(frame_times.size());
    estimate.average_frame_time = average;

    const int32_t remaining_frames = std::max(0, total_frames - estimate.frames_done);
    const Seconds remaining = average * static_cast<double>(remaining_frames);
    estimate.estimated_remaining = remaining;
    estimate.estimated_completion =
        now + std::chrono::duration_cast<std::chrono::system_clock::duration>(remaining);

    return estimate;
}

void SessionStatistics::reset(std::chrono::system_clock::time_point start) {
    scenes_completed = 0;
    frames_completed = 0;
    total_render_time = Seconds{0.0};
    session_start = start;
}

} // namespace brs
