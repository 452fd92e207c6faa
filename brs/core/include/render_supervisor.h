/*
 * File:        render_supervisor.h
 * Module:      brs-core
 * Purpose:     Supervises one render process per scene job with crash recovery
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "scene_job.h"
#include "process_runner.h"
#include "frame_statistics.h"
#include "application_state.h"
#include "render_errors.h"

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace brs {

/**
 * @brief Supervisor state machine
 *
 * Idle -> Launching -> Running -> {Finished, Crashed, Cancelled}
 * Crashed immediately re-enters Launching for the same job. Failed covers
 * launch and output-directory errors, which are not retried.
 */
enum class SupervisorState {
    Idle,
    Launching,
    Running,
    Finished,
    Crashed,
    Cancelled,
    Failed
};

std::string to_string(SupervisorState state);

/**
 * @brief Progress report for the active job
 */
struct ProgressSnapshot {
    std::filesystem::path scene;
    int32_t current_frame = 0;
    int32_t start_frame = 0;       ///< Effective start of the current attempt
    int32_t end_frame = 0;
    int32_t progress_value = 0;    ///< current_frame - start_frame, clamped
    int32_t progress_maximum = 0;  ///< end_frame - start_frame + 1
    int32_t crash_count = 0;
    bool frame_seen = false;       ///< A progress line arrived in this attempt
    FrameEstimate estimate;
};

/**
 * @brief Settings for launching the render process
 */
struct RenderLaunchConfig {
    std::string renderer_path;
    std::filesystem::path render_driver_script;
    std::string frame_prefix = "frame_";
};

/**
 * @brief Arguments passed to the renderer in render mode
 *
 * -b <scene> -P <driver> -- --output_dir <dir> --prefix <prefix> --resume true
 * [--missing_frames f1,f2,...]
 */
std::vector<std::string> build_render_arguments(const SceneJob& job, const RenderLaunchConfig& config);

/**
 * @brief Drives a render process to completion
 *
 * Owns the process lifecycle for one job at a time: launches the renderer,
 * parses its output as it streams, relaunches after a crash (resuming from
 * what is on disk) and reports a terminal status. There is no retry
 * limit; every restart is logged with the cumulative crash count.
 *
 * Thread safety: none. All calls and runner callbacks happen on the control
 * thread.
 */
class RenderSupervisor {
public:
    using ProgressHandler = std::function<void(const ProgressSnapshot& snapshot)>;
    using RestartHandler = std::function<void(const SceneJob& job)>;
    using FinishedHandler = std::function<void(SceneJob& job)>;

    RenderSupervisor(std::unique_ptr<ProcessRunner> runner, TimeSource clock);
    ~RenderSupervisor();

    RenderSupervisor(const RenderSupervisor&) = delete;
    RenderSupervisor& operator=(const RenderSupervisor&) = delete;

    void set_progress_handler(ProgressHandler handler) { progress_handler_ = std::move(handler); }
    void set_restart_handler(RestartHandler handler) { restart_handler_ = std::move(handler); }
    void set_finished_handler(FinishedHandler handler) { finished_handler_ = std::move(handler); }

    /**
     * @brief Begin supervising a job
     *
     * The job must already be probed and inspected, and must outlive the
     * supervision (until the finished handler has run). The finished handler
     * may start the next job.
     */
    void start(SceneJob& job, const RenderLaunchConfig& config);

    /**
     * @brief Kill the render process and mark the job cancelled
     *
     * The finished handler runs before this returns.
     */
    void cancel();

    SupervisorState state() const { return state_; }
    bool is_active() const;

    /// Durations of frames completed in the current job
    const std::vector<Seconds>& frame_times() const { return frame_times_; }

    /// Snapshot of the current progress (meaningful while active)
    ProgressSnapshot snapshot() const;

private:
    void launch();
    void handle_started();
    void handle_line(const std::string& line);
    void handle_finished(const ProcessExit& exit);
    void handle_crash(const ProcessExit& exit);

    void enter_frame(int32_t frame);
    void close_frame(bool record);
    static bool will_render_again(const SceneJob& job, int32_t frame);
    void complete();
    void fail(FailureKind kind, const std::string& message);
    void finish(SupervisorState terminal);
    void emit_progress();

    std::unique_ptr<ProcessRunner> runner_;
    TimeSource clock_;

    ProgressHandler progress_handler_;
    RestartHandler restart_handler_;
    FinishedHandler finished_handler_;

    SupervisorState state_ = SupervisorState::Idle;
    SceneJob* job_ = nullptr;
    RenderLaunchConfig config_;

    // Per-attempt state
    int32_t attempt_start_frame_ = 0;
    int32_t current_frame_ = 0;
    bool frame_seen_ = false;
    bool done_seen_ = false;

    // Per-job timing
    std::vector<Seconds> frame_times_;
    int32_t total_frames_ = 0;
    bool frame_timer_running_ = false;
    std::chrono::steady_clock::time_point frame_started_{};
    std::chrono::steady_clock::time_point job_started_{};
};

} // namespace brs
