/*
 * File:        render_queue.h
 * Module:      brs-core
 * Purpose:     Sequential render queue with single-worker exclusivity
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "scene_job.h"
#include "scene_prober.h"
#include "render_supervisor.h"
#include "frame_statistics.h"
#include "application_state.h"

#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace brs {

/**
 * @brief Receives queue events
 *
 * All methods have empty defaults so subscribers override only what they
 * display. Called on the control thread.
 */
class RenderQueueObserver {
public:
    virtual ~RenderQueueObserver() = default;

    virtual void on_job_enqueued(const SceneJob& /*job*/) {}
    virtual void on_job_status_changed(const SceneJob& /*job*/) {}
    virtual void on_progress(const ProgressSnapshot& /*snapshot*/) {}
    virtual void on_job_restarted(const SceneJob& /*job*/) {}
    virtual void on_job_finished(const SceneJob& /*job*/) {}
    virtual void on_queue_idle(const SessionStatistics& /*stats*/) {}
};

/**
 * @brief Outcome of an enqueue request
 */
enum class EnqueueResult {
    Queued,          // New job appended
    AlreadyQueued,   // Path already pending; coalesced
    AlreadyActive    // Path is the active job; coalesced
};

/**
 * @brief FIFO of scene jobs processed one at a time
 *
 * Pipeline per job: probe -> inspect output -> supervise render. Any job
 * failure ends only that job; the queue always moves on to the next one.
 * Probing happens only for the job about to become active.
 *
 * Thread safety: none. Must be driven from the control thread that delivers
 * the process runners' callbacks.
 */
class RenderQueueManager {
public:
    /**
     * @param state Application state (must outlive the manager)
     * @param probe_runner Runner used for probe processes
     * @param render_runner Runner used for render processes
     */
    RenderQueueManager(ApplicationState& state,
                       std::unique_ptr<ProcessRunner> probe_runner,
                       std::unique_ptr<ProcessRunner> render_runner);
    ~RenderQueueManager();

    RenderQueueManager(const RenderQueueManager&) = delete;
    RenderQueueManager& operator=(const RenderQueueManager&) = delete;

    /// Observer is not owned; pass nullptr to detach
    void set_observer(RenderQueueObserver* observer) { observer_ = observer; }

    /**
     * @brief Add a scene file to the queue
     *
     * Starts processing immediately if the queue is idle. A path already
     * pending or active is not duplicated; a previously finished path is
     * queued again as a fresh job.
     *
     * @throws ConfigError if no usable renderer is configured (nothing is
     *         queued and no process is spawned)
     */
    EnqueueResult enqueue(const std::filesystem::path& scene_file);

    /**
     * @brief Remove a pending scene file
     *
     * @return true if it was pending and has been removed
     * @throws InUseError if the path is the active job
     */
    bool remove(const std::filesystem::path& scene_file);

    /// Cancel the active job (probing or rendering); the queue advances
    void cancel_current();

    /// Drop every pending job (the active job is unaffected)
    void clear_pending();

    bool is_busy() const { return active_ != nullptr; }
    const SceneJob* active_job() const { return active_.get(); }
    std::vector<SceneJob> pending_jobs() const;
    /// Jobs retired in the current batch; cleared when a new batch starts
    const std::vector<SceneJob>& finished_jobs() const { return finished_; }
    const SessionStatistics& session_statistics() const { return session_; }

    const RenderSupervisor& supervisor() const { return *supervisor_; }

private:
    void advance();
    void begin_probe();
    void on_probe_finished(const ProbeOutcome& outcome);
    void on_render_finished(SceneJob& job);
    void finish_active(JobStatus status, const std::string& message);
    void retire_active();
    void notify_status();

    RenderLaunchConfig launch_config() const;
    static std::filesystem::path normalize(const std::filesystem::path& path);

    ApplicationState& state_;
    std::unique_ptr<SceneProber> prober_;
    std::unique_ptr<RenderSupervisor> supervisor_;
    RenderQueueObserver* observer_ = nullptr;

    std::unique_ptr<SceneJob> active_;
    std::deque<SceneJob> pending_;
    std::vector<SceneJob> finished_;
    SessionStatistics session_;
    bool advancing_ = false;
};

} // namespace brs
