/*
 * File:        render_queue.cpp
 * Module:      brs-core
 * Purpose:     Sequential render queue with single-worker exclusivity
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "render_queue.h"
#include "output_inspector.h"
#include "diagnostic_log.h"
#include "render_errors.h"
#include "logging.h"

#include <fmt/format.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace brs {

RenderQueueManager::RenderQueueManager(ApplicationState& state,
                                       std::unique_ptr<ProcessRunner> probe_runner,
                                       std::unique_ptr<ProcessRunner> render_runner)
    : state_(state)
    , prober_(std::make_unique<SceneProber>(std::move(probe_runner), state.probe_timeout))
    , supervisor_(std::make_unique<RenderSupervisor>(std::move(render_runner), state.clock))
{
    supervisor_->set_progress_handler([this](const ProgressSnapshot& snapshot) {
        if (observer_) {
            observer_->on_progress(snapshot);
        }
    });
    supervisor_->set_restart_handler([this](const SceneJob& job) {
        if (observer_) {
            observer_->on_job_restarted(job);
        }
    });
    supervisor_->set_finished_handler([this](SceneJob& job) { on_render_finished(job); });
}

RenderQueueManager::~RenderQueueManager()
{
    observer_ = nullptr;
    supervisor_->set_finished_handler(nullptr);
    supervisor_->set_progress_handler(nullptr);
    supervisor_->set_restart_handler(nullptr);
}

fs::path RenderQueueManager::normalize(const fs::path& path)
{
    return fs::absolute(path).lexically_normal();
}

RenderLaunchConfig RenderQueueManager::launch_config() const
{
    RenderLaunchConfig config;
    config.renderer_path = state_.settings.blender_path;
    config.render_driver_script = state_.render_driver_script;
    config.frame_prefix = state_.frame_prefix;
    return config;
}

EnqueueResult RenderQueueManager::enqueue(const fs::path& scene_file)
{
    validate_renderer(state_.settings);

    const fs::path path = normalize(scene_file);

    if (active_ && active_->path == path) {
        BRS_LOG_INFO("{} is already rendering", path.string());
        return EnqueueResult::AlreadyActive;
    }
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&](const SceneJob& job) { return job.path == path; });
    if (it != pending_.end()) {
        BRS_LOG_INFO("{} is already queued", path.string());
        return EnqueueResult::AlreadyQueued;
    }

    const bool starting_batch = !active_ && !advancing_;
    if (starting_batch) {
        session_.reset(state_.clock.wall_now());
        finished_.clear();
    }

    pending_.emplace_back(path);
    BRS_LOG_INFO("Queued {} ({} pending)", path.string(), pending_.size());
    if (observer_) {
        observer_->on_job_enqueued(pending_.back());
    }

    if (starting_batch) {
        advance();
    }
    return EnqueueResult::Queued;
}

bool RenderQueueManager::remove(const fs::path& scene_file)
{
    const fs::path path = normalize(scene_file);

    if (active_ && active_->path == path) {
        throw InUseError(fmt::format("{} is currently being processed", path.filename().string()));
    }

    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&](const SceneJob& job) { return job.path == path; });
    if (it == pending_.end()) {
        return false;
    }
    pending_.erase(it);
    BRS_LOG_INFO("Removed {} from the queue", path.string());
    return true;
}

void RenderQueueManager::cancel_current()
{
    if (!active_) {
        return;
    }

    if (prober_->is_probing()) {
        prober_->cancel();
        finish_active(JobStatus::Cancelled, "Rendering cancelled.");
    } else if (supervisor_->is_active()) {
        // Reports back through on_render_finished
        supervisor_->cancel();
    } else {
        finish_active(JobStatus::Cancelled, "Rendering cancelled.");
    }
}

void RenderQueueManager::clear_pending()
{
    if (!pending_.empty()) {
        BRS_LOG_INFO("Cleared {} pending job(s)", pending_.size());
    }
    pending_.clear();
}

std::vector<SceneJob> RenderQueueManager::pending_jobs() const
{
    return std::vector<SceneJob>(pending_.begin(), pending_.end());
}

void RenderQueueManager::advance()
{
    // Jobs that fail synchronously re-enter here; the outer loop continues
    if (advancing_) {
        return;
    }

    advancing_ = true;
    while (!active_ && !pending_.empty()) {
        active_ = std::make_unique<SceneJob>(std::move(pending_.front()));
        pending_.pop_front();
        begin_probe();
    }
    advancing_ = false;

    if (!active_ && pending_.empty()) {
        const auto wall = std::chrono::duration_cast<Seconds>(state_.clock.wall_now() - session_.session_start);
        BRS_LOG_INFO("Queue idle: {} scene(s), {} frame(s), {:.1f}s rendering, {:.1f}s session",
                     session_.scenes_completed, session_.frames_completed,
                     session_.total_render_time.count(), wall.count());
        if (observer_) {
            observer_->on_queue_idle(session_);
        }
    }
}

void RenderQueueManager::begin_probe()
{
    active_->status = JobStatus::Probing;
    active_->status_message = fmt::format("Processing {} currently", active_->path.filename().string());
    notify_status();

    prober_->probe(active_->path, state_.settings.blender_path,
                   [this](const ProbeOutcome& outcome) { on_probe_finished(outcome); });
}

void RenderQueueManager::on_probe_finished(const ProbeOutcome& outcome)
{
    if (!active_) {
        return;
    }
    SceneJob& job = *active_;

    if (!outcome.ok()) {
        if (outcome.failure == FailureKind::OutputDirectory) {
            DiagnosticReport report;
            report.error_message = outcome.error;
            report.failure_kind = to_string(outcome.failure);
            report.context = {
                {"scene", job.path.string()},
                {"renderer", state_.settings.blender_path},
            };
            write_diagnostic_log(job.path, report);
        }
        finish_active(JobStatus::Failed, outcome.error);
        return;
    }

    const ProbeResult& probe = *outcome.result;
    job.frame_range = probe.frame_range;
    job.output_directory = probe.output_directory;
    job.image_format = probe.image_format;
    job.start_frame = probe.frame_range.start;
    job.missing_frames.reset();

    try {
        apply_inspection(job, inspect_output(job.output_directory, job.image_format, job.frame_range));
    } catch (const OutputDirectoryError& e) {
        DiagnosticReport report;
        report.error_message = e.what();
        report.failure_kind = to_string(FailureKind::OutputDirectory);
        report.context = {
            {"scene", job.path.string()},
            {"output_directory", job.output_directory.string()},
        };
        write_diagnostic_log(job.path, report);
        finish_active(JobStatus::Failed, e.what());
        return;
    }

    if (job.start_frame > job.frame_range.end) {
        finish_active(JobStatus::AlreadyComplete, "All frames of this scene are already rendered.");
        return;
    }

    job.status = JobStatus::Rendering;
    notify_status();
    supervisor_->start(job, launch_config());
}

void RenderQueueManager::on_render_finished(SceneJob& job)
{
    if (!active_ || &job != active_.get()) {
        BRS_LOG_WARN("Render finished for a job that is not active: {}", job.path.string());
        return;
    }

    if (job.status == JobStatus::Completed) {
        session_.scenes_completed += 1;
        session_.frames_completed += job.frames_rendered;
        session_.total_render_time += std::chrono::duration_cast<Seconds>(job.render_duration);
    }

    notify_status();
    if (observer_) {
        observer_->on_job_finished(job);
    }
    retire_active();
}

void RenderQueueManager::finish_active(JobStatus status, const std::string& message)
{
    active_->status = status;
    active_->status_message = message;
    BRS_LOG_INFO("{}: {} ({})", active_->path.filename().string(), to_string(status), message);

    notify_status();
    if (observer_) {
        observer_->on_job_finished(*active_);
    }
    retire_active();
}

void RenderQueueManager::retire_active()
{
    finished_.push_back(std::move(*active_));
    active_.reset();
    advance();
}

void RenderQueueManager::notify_status()
{
    if (observer_ && active_) {
        observer_->on_job_status_changed(*active_);
    }
}

} // namespace brs
