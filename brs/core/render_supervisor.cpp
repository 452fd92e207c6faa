/*
 * File:        render_supervisor.cpp
 * Module:      brs-core
 * Purpose:     Supervises one render process per scene job with crash recovery
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "render_supervisor.h"
#include "output_inspector.h"
#include "output_parsing.h"
#include "diagnostic_log.h"
#include "logging.h"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace brs {

std::string to_string(SupervisorState state) {
    switch (state) {
        case SupervisorState::Idle: return "Idle";
        case SupervisorState::Launching: return "Launching";
        case SupervisorState::Running: return "Running";
        case SupervisorState::Finished: return "Finished";
        case SupervisorState::Crashed: return "Crashed";
        case SupervisorState::Cancelled: return "Cancelled";
        case SupervisorState::Failed: return "Failed";
    }
    return "Unknown";
}

std::vector<std::string> build_render_arguments(const SceneJob& job, const RenderLaunchConfig& config) {
    std::vector<std::string> args = {
        "-b", job.path.string(),
        "-P", config.render_driver_script.string(),
        "--",
        "--output_dir", job.output_directory.string(),
        "--prefix", config.frame_prefix,
        "--resume", "true",
    };

    if (job.missing_frames && !job.missing_frames->empty()) {
        args.push_back("--missing_frames");
        args.push_back(fmt::format("{}", fmt::join(*job.missing_frames, ",")));
    }
    return args;
}

RenderSupervisor::RenderSupervisor(std::unique_ptr<ProcessRunner> runner, TimeSource clock)
    : runner_(std::move(runner))
    , clock_(std::move(clock))
{
}

RenderSupervisor::~RenderSupervisor()
{
    if (is_active()) {
        runner_->kill();
    }
}

bool RenderSupervisor::is_active() const
{
    return state_ == SupervisorState::Launching
        || state_ == SupervisorState::Running
        || state_ == SupervisorState::Crashed;
}

void RenderSupervisor::start(SceneJob& job, const RenderLaunchConfig& config)
{
    if (is_active()) {
        BRS_LOG_WARN("RenderSupervisor: already rendering {}, ignoring {}",
                     job_ ? job_->path.string() : "?", job.path.string());
        return;
    }

    job_ = &job;
    config_ = config;
    job.status = JobStatus::Rendering;
    job.frames_rendered = 0;

    frame_times_.clear();
    frame_timer_running_ = false;
    total_frames_ = job.frames_to_render();
    job_started_ = clock_.steady_now();

    launch();
}

void RenderSupervisor::launch()
{
    SceneJob& job = *job_;
    state_ = SupervisorState::Launching;

    attempt_start_frame_ = job.start_frame;
    current_frame_ = job.start_frame;
    frame_seen_ = false;
    done_seen_ = false;

    // A missing driver would make every attempt "crash" forever
    std::error_code ec;
    if (!fs::exists(config_.render_driver_script, ec)) {
        fail(FailureKind::Launch,
             fmt::format("Render script not found: {}", config_.render_driver_script.string()));
        return;
    }

    ProcessSpec spec;
    spec.program = config_.renderer_path;
    spec.arguments = build_render_arguments(job, config_);
    spec.merge_stderr = true;

    ProcessCallbacks callbacks;
    callbacks.on_started = [this]() { handle_started(); };
    callbacks.on_output_line = [this](const std::string& line) { handle_line(line); };
    callbacks.on_finished = [this](const ProcessExit& exit) { handle_finished(exit); };

    if (job.missing_frames) {
        BRS_LOG_INFO("Rendering {} missing frame(s) of {} (first {})",
                     job.missing_frames->size(), job.path.filename().string(), job.start_frame);
    } else {
        BRS_LOG_INFO("Rendering {} frames {}-{}",
                     job.path.filename().string(), job.start_frame, job.frame_range.end);
    }
    job.status_message = fmt::format("Rendering frames {}-{}", job.start_frame, job.frame_range.end);

    emit_progress();
    runner_->start(spec, std::move(callbacks));
}

void RenderSupervisor::handle_started()
{
    if (state_ == SupervisorState::Launching) {
        state_ = SupervisorState::Running;
        BRS_LOG_DEBUG("Render process started for {}", job_->path.filename().string());
    }
}

void RenderSupervisor::handle_line(const std::string& line)
{
    BRS_LOG_TRACE("[blender] {}", line);
    if (!job_ || done_seen_) {
        return;
    }

    const auto parsed = parsing::parse_progress_line(line);

    if (parsed.malformed_frame) {
        BRS_LOG_WARN("Ignoring malformed progress line: '{}'", line);
    } else if (parsed.frame) {
        enter_frame(*parsed.frame);
    }

    if (parsed.error) {
        BRS_LOG_WARN("Renderer reported an error: {}", line);
    }

    if (parsed.done) {
        done_seen_ = true;
        close_frame(true);
        BRS_LOG_INFO("Renderer reported completion for {}", job_->path.filename().string());
    }
}

void RenderSupervisor::enter_frame(int32_t frame)
{
    // Frames before the resume point do not move progress backwards
    if (frame < attempt_start_frame_) {
        BRS_LOG_DEBUG("Ignoring frame {} below start frame {}", frame, attempt_start_frame_);
        return;
    }
    if (frame_seen_ && frame == current_frame_) {
        return;
    }

    close_frame(true);

    current_frame_ = frame;
    frame_seen_ = true;
    frame_timer_running_ = true;
    frame_started_ = clock_.steady_now();

    job_->status_message = fmt::format("Rendering frame {}/{}", frame, job_->frame_range.end);
    emit_progress();
}

void RenderSupervisor::close_frame(bool record)
{
    if (!frame_timer_running_) {
        return;
    }
    frame_timer_running_ = false;
    if (!record) {
        return;
    }

    const Seconds duration = clock_.steady_now() - frame_started_;
    frame_times_.push_back(duration);
    job_->frames_rendered = static_cast<int32_t>(frame_times_.size());
    BRS_LOG_DEBUG("Frame {} took {:.2f}s", current_frame_, duration.count());
}

bool RenderSupervisor::will_render_again(const SceneJob& job, int32_t frame)
{
    if (!job.frame_range.contains(frame)) {
        return false;
    }
    if (job.missing_frames) {
        const auto& missing = *job.missing_frames;
        return std::find(missing.begin(), missing.end(), frame) != missing.end();
    }
    return frame >= job.start_frame;
}

void RenderSupervisor::handle_finished(const ProcessExit& exit)
{
    if (!job_ || !is_active()) {
        return;
    }

    if (exit.status == ExitStatus::FailedToStart) {
        fail(FailureKind::Launch, fmt::format("Could not start Blender: {}", exit.error));
        return;
    }

    if (done_seen_) {
        complete();
        return;
    }

    if (frame_seen_ && current_frame_ >= job_->frame_range.end) {
        BRS_LOG_INFO("Render process exited after final frame {}", current_frame_);
        close_frame(true);
        complete();
        return;
    }

    handle_crash(exit);
}

void RenderSupervisor::handle_crash(const ProcessExit& exit)
{
    SceneJob& job = *job_;
    state_ = SupervisorState::Crashed;

    job.crash_count += 1;

    BRS_LOG_WARN("[CRASH DETECTED] Render of {} ended {} (exit code {}) at frame {}; "
                 "restarting (crash #{})",
                 job.path.filename().string(), to_string(exit.status), exit.exit_code,
                 frame_seen_ ? current_frame_ : job.start_frame, job.crash_count);

    // Resume from whatever actually reached the disk
    try {
        apply_inspection(job, inspect_output(job.output_directory, job.image_format, job.frame_range));
    } catch (const OutputDirectoryError& e) {
        fail(FailureKind::OutputDirectory, e.what());
        return;
    }

    // The frame in flight counts only if it reached the disk and will not be rendered again
    close_frame(frame_seen_ && !will_render_again(job, current_frame_));

    if (job.start_frame > job.frame_range.end) {
        BRS_LOG_INFO("All frames of {} are on disk after crash; treating as complete",
                     job.path.filename().string());
        complete();
        return;
    }

    if (restart_handler_) {
        restart_handler_(job);
    }
    launch();
}

void RenderSupervisor::complete()
{
    SceneJob& job = *job_;
    close_frame(true);

    job.status = JobStatus::Completed;
    job.render_duration = clock_.steady_now() - job_started_;
    job.status_message = fmt::format("Rendering finished! {} frames rendered to: {} Crashes: {}",
                                     job.frame_range.count(),
                                     job.output_directory.string(), job.crash_count);

    state_ = SupervisorState::Finished;
    emit_progress();

    BRS_LOG_INFO("Render of {} completed: {} frame(s) in {:.1f}s, {} crash(es)",
                 job.path.filename().string(), job.frames_rendered,
                 Seconds(job.render_duration).count(), job.crash_count);
    finish(SupervisorState::Finished);
}

void RenderSupervisor::fail(FailureKind kind, const std::string& message)
{
    SceneJob& job = *job_;
    close_frame(false);

    job.status = JobStatus::Failed;
    job.render_duration = clock_.steady_now() - job_started_;
    job.status_message = message;
    BRS_LOG_ERROR("Render of {} failed ({}): {}", job.path.filename().string(), to_string(kind), message);

    if (kind == FailureKind::Launch || kind == FailureKind::OutputDirectory) {
        DiagnosticReport report;
        report.error_message = message;
        report.failure_kind = to_string(kind);
        report.context = {
            {"scene", job.path.string()},
            {"renderer", config_.renderer_path},
            {"render_script", config_.render_driver_script.string()},
            {"output_directory", job.output_directory.string()},
            {"crash_count", std::to_string(job.crash_count)},
        };
        write_diagnostic_log(job.path, report);
    }

    finish(SupervisorState::Failed);
}

void RenderSupervisor::cancel()
{
    if (!is_active()) {
        return;
    }

    runner_->kill();

    SceneJob& job = *job_;
    close_frame(false);
    job.status = JobStatus::Cancelled;
    job.render_duration = clock_.steady_now() - job_started_;
    job.status_message = "Rendering cancelled.";
    BRS_LOG_INFO("Render of {} cancelled at frame {}", job.path.filename().string(), current_frame_);

    finish(SupervisorState::Cancelled);
}

void RenderSupervisor::finish(SupervisorState terminal)
{
    state_ = terminal;

    // The handler may archive the job and start the next one
    SceneJob* job = job_;
    job_ = nullptr;
    if (finished_handler_) {
        finished_handler_(*job);
    }
}

ProgressSnapshot RenderSupervisor::snapshot() const
{
    ProgressSnapshot s;
    if (!job_) {
        return s;
    }

    s.scene = job_->path;
    s.current_frame = current_frame_;
    s.start_frame = attempt_start_frame_;
    s.end_frame = job_->frame_range.end;
    s.progress_maximum = std::max(0, s.end_frame - s.start_frame + 1);
    if (state_ == SupervisorState::Finished) {
        s.progress_value = s.progress_maximum;
    } else if (frame_seen_) {
        s.progress_value = std::clamp(current_frame_ - attempt_start_frame_, 0, s.progress_maximum);
    }
    s.crash_count = job_->crash_count;
    s.frame_seen = frame_seen_;

    const auto now = clock_.steady_now();
    s.estimate = estimate_frames(frame_times_, total_frames_, now - job_started_, clock_.wall_now());
    return s;
}

void RenderSupervisor::emit_progress()
{
    if (progress_handler_) {
        progress_handler_(snapshot());
    }
}

} // namespace brs
