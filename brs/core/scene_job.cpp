/*
 * File:        scene_job.cpp
 * Module:      brs-core
 * Purpose:     Scene job data model
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "scene_job.h"

namespace brs {

std::string to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Queued: return "Queued";
        case JobStatus::Probing: return "Probing";
        case JobStatus::Rendering: return "Rendering";
        case JobStatus::AlreadyComplete: return "AlreadyComplete";
        case JobStatus::Completed: return "Completed";
        case JobStatus::Cancelled: return "Cancelled";
        case JobStatus::Failed: return "Failed";
    }
    return "Unknown";
}

int32_t SceneJob::frames_to_render() const {
    if (missing_frames) {
        return static_cast<int32_t>(missing_frames->size());
    }
    return frame_range.end >= start_frame ? frame_range.end - start_frame + 1 : 0;
}

} // namespace brs
