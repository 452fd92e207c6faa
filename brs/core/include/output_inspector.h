/*
 * File:        output_inspector.h
 * Module:      brs-core
 * Purpose:     Detects already-rendered frames and computes the resume point
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "scene_job.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace brs {

/**
 * @brief Resume decision for a frame range
 *
 * start_frame == range.end + 1 means nothing is left to render.
 * missing_frames is set only when the missing frames are not contiguous.
 */
struct InspectionResult {
    int32_t start_frame = 0;
    std::optional<std::vector<int32_t>> missing_frames;

    bool operator==(const InspectionResult& other) const {
        return start_frame == other.start_frame && missing_frames == other.missing_frames;
    }
};

/**
 * @brief Collect frame numbers of rendered images in a directory
 *
 * Considers regular files whose extension matches `extension`
 * case-insensitively and whose name matches one of:
 *   <anything><digits>.<ext>
 *   <anything><digits>_L.<ext>   (stereo left eye)
 *   <anything><digits>_R.<ext>   (stereo right eye)
 *
 * @throws OutputDirectoryError if the directory cannot be read
 */
std::set<int32_t> scan_rendered_frames(const std::filesystem::path& directory,
                                       const std::string& extension);

/**
 * @brief Decide where to resume given the frames already on disk
 *
 * Pure function of its inputs.
 */
InspectionResult compute_resume(const std::set<int32_t>& rendered, const FrameRange& range);

/**
 * @brief Scan a directory and decide where to resume
 *
 * @param image_format Format token as probed (mapped to its file extension)
 * @throws OutputDirectoryError if the directory cannot be read
 */
InspectionResult inspect_output(const std::filesystem::path& directory,
                                const std::string& image_format,
                                const FrameRange& range);

/// Copy an inspection result into the job's resume state
void apply_inspection(SceneJob& job, const InspectionResult& result);

} // namespace brs
