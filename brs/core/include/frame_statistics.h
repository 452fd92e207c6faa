/*
 * File:        frame_statistics.h
 * Module:      brs-core
 * Purpose:     Per-frame timing, averages and ETA estimation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace brs {

using Seconds = std::chrono::duration<double>;

/**
 * @brief Estimate derived from a job's frame-time history
 *
 * average_frame_time, estimated_remaining and estimated_completion are unset
 * while no frame has completed ("calculating").
 */
struct FrameEstimate {
    std::optional<Seconds> average_frame_time;
    Seconds elapsed{0.0};
    std::optional<Seconds> estimated_remaining;
    std::optional<std::chrono::system_clock::time_point> estimated_completion;
    int32_t frames_done = 0;
    int32_t total_frames = 0;

    bool is_calculating() const { return !average_frame_time.has_value(); }
};

/**
 * @brief Compute timing statistics for the active job
 *
 * Pure function; recomputed on every progress event.
 *
 * @param frame_times Durations of the frames completed so far
 * @param total_frames Frames the job will render in total
 * @param elapsed Time since the job started rendering
 * @param now Wall clock used to project the completion time
 */
FrameEstimate estimate_frames(const std::vector<Seconds>& frame_times,
                              int32_t total_frames,
                              Seconds elapsed,
                              std::chrono::system_clock::time_point now);

/**
 * @brief Aggregate statistics for one queue batch
 *
 * Reset when the queue leaves the idle state; only completed jobs
 * contribute.
 */
struct SessionStatistics {
    int32_t scenes_completed = 0;
    int64_t frames_completed = 0;
    Seconds total_render_time{0.0};
    std::chrono::system_clock::time_point session_start{};

    void reset(std::chrono::system_clock::time_point start);
};

} // namespace brs
