/*
 * File:        scene_prober.h
 * Module:      brs-core
 * Purpose:     Reads frame range and output settings from a scene file
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "scene_job.h"
#include "render_errors.h"
#include "process_runner.h"
#include "output_parsing.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace brs {

/**
 * @brief Scene metadata needed to render and resume
 */
struct ProbeResult {
    FrameRange frame_range;
    std::filesystem::path output_directory;  ///< Absolute, created on disk
    std::string image_format;                ///< Lowercase format token
};

/**
 * @brief Completion report of an asynchronous probe
 */
struct ProbeOutcome {
    std::optional<ProbeResult> result;
    FailureKind failure = FailureKind::None;  ///< Probe or OutputDirectory on failure
    std::string error;

    bool ok() const { return result.has_value(); }
};

using ProbeCallback = std::function<void(const ProbeOutcome& outcome)>;

/// Script printed to the renderer's stdout in probe mode
extern const char* const PROBE_SCRIPT;

/**
 * @brief Resolve the probed output path against the scene file
 *
 * - empty, "//" or malformed: <sceneDir>/<sceneStem>_output
 * - "//rest": <sceneDir>/rest
 * - other relative paths: <sceneDir>/<path>
 * The result is absolute and lexically normalized without a trailing
 * separator.
 */
std::filesystem::path resolve_output_directory(const std::string& probed,
                                               const std::filesystem::path& scene_file);

/**
 * @brief Turn parsed probe values into a result (no filesystem changes)
 *
 * @throws ProbeError if the frame range is missing
 */
ProbeResult build_probe_result(const parsing::ProbeValues& values,
                               const std::filesystem::path& scene_file);

/**
 * @brief Create the output directory if it does not exist
 *
 * @throws OutputDirectoryError on failure
 */
void ensure_output_directory(const std::filesystem::path& directory);

/**
 * @brief Runs the renderer in probe mode
 *
 * One probe at a time. The callback is invoked once the probe process has
 * exited and all of its output has been parsed.
 */
class SceneProber {
public:
    SceneProber(std::unique_ptr<ProcessRunner> runner, std::chrono::milliseconds timeout);
    ~SceneProber();

    SceneProber(const SceneProber&) = delete;
    SceneProber& operator=(const SceneProber&) = delete;

    /**
     * @brief Start probing a scene
     *
     * Failures to even begin (probe script cannot be written) are reported
     * through the callback before this returns.
     */
    void probe(const std::filesystem::path& scene_file,
               const std::string& renderer_path,
               ProbeCallback callback);

    /// Kill a running probe; its callback is not invoked
    void cancel();

    bool is_probing() const { return active_; }

private:
    void handle_line(const std::string& line);
    void handle_finished(const ProcessExit& exit);
    void finish(const ProbeOutcome& outcome);
    void remove_script();
    std::filesystem::path write_probe_script();

    std::unique_ptr<ProcessRunner> runner_;
    std::chrono::milliseconds timeout_;

    bool active_ = false;
    std::filesystem::path scene_file_;
    std::filesystem::path script_path_;
    parsing::ProbeOutputParser parser_;
    ProbeCallback callback_;
};

} // namespace brs
