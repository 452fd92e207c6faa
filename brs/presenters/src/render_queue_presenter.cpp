/*
 * File:        render_queue_presenter.cpp
 * Module:      brs-presenters
 * Purpose:     Render queue presenter implementation
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "render_queue_presenter.h"
#include <render_queue.h>
#include <render_errors.h>
#include <application_state.h>
#include <logging.h>

#include <fmt/format.h>
#include <filesystem>

namespace brs::presenters {

namespace {
constexpr const char* SCENE_EXTENSION = ".blend";
}

// Bridges core queue events to the presenter's callbacks
class RenderQueuePresenter::Observer : public brs::RenderQueueObserver {
public:
    explicit Observer(RenderQueuePresenter& owner) : owner_(owner) {}

    void on_job_enqueued(const brs::SceneJob&) override { owner_.publishQueue(); }

    void on_job_status_changed(const brs::SceneJob& job) override {
        owner_.publishQueue();
        if (owner_.status_ && !job.status_message.empty()) {
            owner_.status_(job.status_message);
        }
    }

    void on_progress(const brs::ProgressSnapshot& snapshot) override {
        if (owner_.progress_) {
            owner_.progress_(toProgressView(snapshot));
        }
    }

    void on_job_restarted(const brs::SceneJob& job) override {
        owner_.publishQueue();
        if (owner_.status_) {
            owner_.status_(fmt::format("{} crashed, resuming from frame {} | Crashes: {}",
                                       job.path.filename().string(), job.start_frame, job.crash_count));
        }
    }

    void on_job_finished(const brs::SceneJob& job) override {
        owner_.publishQueue();
        if (owner_.status_) {
            owner_.status_(job.status_message);
        }
    }

    void on_queue_idle(const brs::SessionStatistics& stats) override {
        owner_.publishQueue();
        if (owner_.summary_) {
            owner_.summary_(toSessionSummaryView(stats, owner_.state_.clock.wall_now()));
        }
    }

private:
    RenderQueuePresenter& owner_;
};

RenderQueuePresenter::RenderQueuePresenter(brs::ApplicationState& state,
                                           std::unique_ptr<brs::ProcessRunner> probe_runner,
                                           std::unique_ptr<brs::ProcessRunner> render_runner)
    : state_(state)
    , queue_(std::make_unique<brs::RenderQueueManager>(state, std::move(probe_runner), std::move(render_runner)))
    , observer_(std::make_unique<Observer>(*this))
{
    queue_->set_observer(observer_.get());
}

RenderQueuePresenter::~RenderQueuePresenter()
{
    queue_->set_observer(nullptr);
}

brs::ResultCode RenderQueuePresenter::submitScene(const std::string& path, std::string& message)
{
    if (!brs::is_renderer_configured(state_.settings)) {
        message = "Setup Blender path first!";
        BRS_LOG_WARN("Rejected {}: no renderer configured", path);
        return brs::ResultCode::ERROR_NOT_CONFIGURED;
    }

    const std::filesystem::path p(path);
    if (p.extension() != SCENE_EXTENSION) {
        message = "Please drop a valid .blend file.";
        BRS_LOG_WARN("Rejected {}: not a scene file", path);
        return brs::ResultCode::ERROR_INVALID_FORMAT;
    }

    try {
        switch (queue_->enqueue(p)) {
            case brs::EnqueueResult::Queued:
                message.clear();
                break;
            case brs::EnqueueResult::AlreadyQueued:
                message = fmt::format("{} is already queued.", p.filename().string());
                break;
            case brs::EnqueueResult::AlreadyActive:
                message = fmt::format("{} is already rendering.", p.filename().string());
                break;
        }
    } catch (const brs::ConfigError& e) {
        message = "Setup Blender path first!";
        BRS_LOG_WARN("Rejected {}: {}", path, e.what());
        return brs::ResultCode::ERROR_NOT_CONFIGURED;
    }
    return brs::ResultCode::SUCCESS;
}

brs::ResultCode RenderQueuePresenter::removeScene(const std::string& path, std::string& message)
{
    try {
        if (!queue_->remove(path)) {
            message = fmt::format("{} is not queued.", std::filesystem::path(path).filename().string());
            return brs::ResultCode::ERROR_FILE_NOT_FOUND;
        }
    } catch (const brs::InUseError& e) {
        message = e.what();
        return brs::ResultCode::ERROR_IN_USE;
    }

    message.clear();
    publishQueue();
    return brs::ResultCode::SUCCESS;
}

void RenderQueuePresenter::cancelCurrent()
{
    queue_->cancel_current();
}

void RenderQueuePresenter::clearPending()
{
    queue_->clear_pending();
    publishQueue();
}

brs::ResultCode RenderQueuePresenter::setRendererPath(const std::string& selection, std::string& resolved)
{
    resolved = brs::resolve_renderer_selection(selection);
    state_.settings.blender_path = resolved;
    BRS_LOG_INFO("Renderer path set to {}", resolved);

    if (!brs::is_renderer_configured(state_.settings)) {
        BRS_LOG_WARN("Renderer {} does not exist", resolved);
        return brs::ResultCode::ERROR_NOT_CONFIGURED;
    }
    return brs::ResultCode::SUCCESS;
}

bool RenderQueuePresenter::isRendererConfigured() const
{
    return brs::is_renderer_configured(state_.settings);
}

std::string RenderQueuePresenter::rendererPath() const
{
    return state_.settings.blender_path;
}

std::string RenderQueuePresenter::idleMessage() const
{
    if (state_.settings.blender_path.empty()) {
        return "Setup Blender path first!";
    }
    if (!isRendererConfigured()) {
        return "There seems to be no Blender installed on this computer!";
    }
    return "Drag a Blender file here";
}

bool RenderQueuePresenter::isBusy() const
{
    return queue_->is_busy();
}

std::vector<QueueRowView> RenderQueuePresenter::queueRows() const
{
    std::vector<QueueRowView> rows;
    for (const auto& job : queue_->finished_jobs()) {
        rows.push_back(toQueueRowView(job, false, true));
    }
    if (const brs::SceneJob* active = queue_->active_job()) {
        rows.push_back(toQueueRowView(*active, true, false));
    }
    for (const auto& job : queue_->pending_jobs()) {
        rows.push_back(toQueueRowView(job, false, false));
    }
    return rows;
}

void RenderQueuePresenter::publishQueue()
{
    if (queue_changed_) {
        queue_changed_(queueRows());
    }
}

} // namespace brs::presenters
