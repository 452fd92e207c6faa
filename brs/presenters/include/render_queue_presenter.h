/*
 * File:        render_queue_presenter.h
 * Module:      brs-presenters
 * Purpose:     Render queue presenter - MVP architecture
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include "render_queue_view_models.h"

#include <error_codes.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace brs {
struct ApplicationState;
class ProcessRunner;
class RenderQueueManager;
}

namespace brs::presenters {

/**
 * @brief RenderQueuePresenter - Connects the render queue to a view
 *
 * Owns the RenderQueueManager and turns its events into view models. The
 * view forwards user intents (add scene, remove, cancel, choose renderer) and
 * receives display updates through the registered callbacks; it never
 * touches core types directly.
 *
 * Thread safety: none. Use from the thread that runs the process runners'
 * event loop.
 */
class RenderQueuePresenter {
public:
    using QueueChangedCallback = std::function<void(const std::vector<QueueRowView>& rows)>;
    using ProgressCallback = std::function<void(const ProgressView& progress)>;
    using StatusCallback = std::function<void(const std::string& message)>;
    using SummaryCallback = std::function<void(const SessionSummaryView& summary)>;

    /**
     * @brief Construct the presenter and its queue
     * @param state Application state (must outlive this presenter)
     * @param probe_runner Runner used for probe processes
     * @param render_runner Runner used for render processes
     */
    RenderQueuePresenter(brs::ApplicationState& state,
                         std::unique_ptr<brs::ProcessRunner> probe_runner,
                         std::unique_ptr<brs::ProcessRunner> render_runner);
    ~RenderQueuePresenter();

    RenderQueuePresenter(const RenderQueuePresenter&) = delete;
    RenderQueuePresenter& operator=(const RenderQueuePresenter&) = delete;

    // === Callbacks ===

    void setQueueChangedCallback(QueueChangedCallback callback) { queue_changed_ = std::move(callback); }
    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }
    void setStatusCallback(StatusCallback callback) { status_ = std::move(callback); }
    void setSummaryCallback(SummaryCallback callback) { summary_ = std::move(callback); }

    // === User intents ===

    /**
     * @brief Submit a scene file for rendering
     *
     * @param path Scene file path (must end in .blend)
     * @param message Set to a user-facing explanation on failure
     * @return SUCCESS if queued or already queued/active,
     *         ERROR_NOT_CONFIGURED if no renderer is set up,
     *         ERROR_INVALID_FORMAT if the file is not a scene file
     */
    brs::ResultCode submitScene(const std::string& path, std::string& message);

    /**
     * @brief Remove a pending scene
     *
     * @return SUCCESS, ERROR_IN_USE for the active scene, or
     *         ERROR_FILE_NOT_FOUND if it was not queued
     */
    brs::ResultCode removeScene(const std::string& path, std::string& message);

    void cancelCurrent();
    void clearPending();

    /**
     * @brief Apply a renderer chosen by the user
     *
     * Application bundles are mapped to the executable inside them. The
     * caller is responsible for persisting the returned path.
     *
     * @param selection Path picked in a file dialog
     * @param resolved Receives the path actually stored
     * @return SUCCESS or ERROR_NOT_CONFIGURED if the path is unusable (the
     *         path is stored either way)
     */
    brs::ResultCode setRendererPath(const std::string& selection, std::string& resolved);

    // === State for display ===

    bool isRendererConfigured() const;
    std::string rendererPath() const;

    /// Idle prompt: setup hint or drop hint
    std::string idleMessage() const;

    bool isBusy() const;
    std::vector<QueueRowView> queueRows() const;

private:
    class Observer;

    void publishQueue();

    brs::ApplicationState& state_;
    std::unique_ptr<brs::RenderQueueManager> queue_;
    std::unique_ptr<Observer> observer_;

    QueueChangedCallback queue_changed_;
    ProgressCallback progress_;
    StatusCallback status_;
    SummaryCallback summary_;
};

} // namespace brs::presenters
