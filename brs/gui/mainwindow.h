/*
 * File:        mainwindow.h
 * Module:      brs-gui
 * Purpose:     Main application window
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QString>
#include <memory>
#include <vector>
#include <render_queue_view_models.h>

namespace brs {
    struct ApplicationState;
}

namespace brs::presenters {
    class RenderQueuePresenter;
}

class SettingsStore;
class QLabel;
class QListWidget;
class QProgressBar;
class QPushButton;

/**
 * Main window for brs-gui
 *
 * Layout:
 * - Drop zone label (accepts .blend files)
 * - Queue list
 * - Progress bar with frame and timing labels
 * - Cancel / clear buttons
 *
 * Architecture: This window is a thin display client.
 * All queue and supervision logic is in brs-core, reached through
 * brs::presenters::RenderQueuePresenter.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(brs::ApplicationState &state, SettingsStore &settings, QWidget *parent = nullptr);
    ~MainWindow() override;

    /// Queue a scene file (used for files given on the command line)
    void submitScene(const QString &path);

protected:
    void dragEnterEvent(QDragEnterEvent *event) override;
    void dropEvent(QDropEvent *event) override;
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onChooseBlenderPath();
    void onCancel();
    void onClearPending();
    void onRemoveSelected();

private:
    void setupUI();
    void setupMenus();
    void refreshIdleState();

    void showQueue(const std::vector<brs::presenters::QueueRowView> &rows);
    void showProgress(const brs::presenters::ProgressView &progress);
    void showSummary(const brs::presenters::SessionSummaryView &summary);

    brs::ApplicationState &state_;
    SettingsStore &settings_;
    std::unique_ptr<brs::presenters::RenderQueuePresenter> presenter_;

    QLabel *drop_label_ = nullptr;
    QLabel *frame_label_ = nullptr;
    QLabel *timing_label_ = nullptr;
    QListWidget *queue_list_ = nullptr;
    QProgressBar *progress_bar_ = nullptr;
    QPushButton *cancel_button_ = nullptr;
    QPushButton *remove_button_ = nullptr;
    QPushButton *clear_button_ = nullptr;
};

#endif // MAINWINDOW_H
