/*
 * File:        scene_job.h
 * Module:      brs-core
 * Purpose:     Scene job data model
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace brs {

/**
 * @brief Inclusive animation frame range
 *
 * end < start means there is nothing to render.
 */
struct FrameRange {
    int32_t start = 1;
    int32_t end = 0;

    int32_t count() const { return end >= start ? end - start + 1 : 0; }
    bool contains(int32_t frame) const { return frame >= start && frame <= end; }
};

/**
 * @brief Lifecycle state of a scene job
 */
enum class JobStatus {
    Queued,           // Waiting in the pending list
    Probing,          // Active, reading scene metadata
    Rendering,        // Active, render process supervised
    AlreadyComplete,  // Every frame was on disk before rendering
    Completed,        // Render finished
    Cancelled,        // Cancelled by the user
    Failed            // Probe, output directory or launch failure
};

std::string to_string(JobStatus status);

/**
 * @brief One scene file to be rendered
 *
 * Created when a file is accepted into the queue. The Prober fills in the
 * range and output settings, the Output Inspector the resume point and
 * missing frames, the Supervisor the status and crash count.
 */
struct SceneJob {
    std::filesystem::path path;                 ///< Absolute scene path (queue key)

    FrameRange frame_range;                     ///< Range as probed from the scene
    std::filesystem::path output_directory;     ///< Absolute output directory
    std::string image_format = "png";           ///< Lowercase format token

    int32_t start_frame = 1;                    ///< Effective first frame to render
    std::optional<std::vector<int32_t>> missing_frames;  ///< Explicit frames when non-contiguous

    int32_t crash_count = 0;
    JobStatus status = JobStatus::Queued;
    std::string status_message;                 ///< Short user-facing status

    // Filled in by the supervisor
    int32_t frames_rendered = 0;                ///< Frames observed to complete
    std::chrono::steady_clock::duration render_duration{};  ///< Total supervised time

    explicit SceneJob(std::filesystem::path p) : path(std::move(p)) {}

    /// Frames the render will cover given the current resume state
    int32_t frames_to_render() const;
};

} // namespace brs
