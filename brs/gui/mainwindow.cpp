/*
 * File:        mainwindow.cpp
 * Module:      brs-gui
 * Purpose:     Main application window
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "mainwindow.h"
#include "qt_process_runner.h"
#include "settings_store.h"
#include <render_queue_presenter.h>
#include <application_state.h>
#include <logging.h>

#include <QCloseEvent>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QFileDialog>
#include <QFont>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMenuBar>
#include <QMessageBox>
#include <QMimeData>
#include <QProgressBar>
#include <QPushButton>
#include <QStatusBar>
#include <QUrl>
#include <QVBoxLayout>
#include <algorithm>

using brs::presenters::QueueRowView;
using brs::presenters::ProgressView;
using brs::presenters::SessionSummaryView;

MainWindow::MainWindow(brs::ApplicationState &state, SettingsStore &settings, QWidget *parent)
    : QMainWindow(parent)
    , state_(state)
    , settings_(settings)
{
    presenter_ = std::make_unique<brs::presenters::RenderQueuePresenter>(
        state_,
        std::make_unique<QtProcessRunner>(),
        std::make_unique<QtProcessRunner>());

    presenter_->setQueueChangedCallback([this](const std::vector<QueueRowView> &rows) { showQueue(rows); });
    presenter_->setProgressCallback([this](const ProgressView &progress) { showProgress(progress); });
    presenter_->setStatusCallback([this](const std::string &message) {
        statusBar()->showMessage(QString::fromStdString(message));
    });
    presenter_->setSummaryCallback([this](const SessionSummaryView &summary) { showSummary(summary); });

    setupUI();
    setupMenus();
    refreshIdleState();
}

MainWindow::~MainWindow() = default;

void MainWindow::setupUI()
{
    setWindowTitle("Blender Render Supervisor");
    resize(600, 480);
    setAcceptDrops(true);

    auto *central = new QWidget(this);
    auto *layout = new QVBoxLayout(central);

    drop_label_ = new QLabel(central);
    drop_label_->setAlignment(Qt::AlignCenter);
    drop_label_->setStyleSheet("border: 2px dashed gray; font-size: 16px; padding: 40px;");
    layout->addWidget(drop_label_);

    queue_list_ = new QListWidget(central);
    layout->addWidget(queue_list_, 1);

    progress_bar_ = new QProgressBar(central);
    progress_bar_->setRange(0, 1);
    progress_bar_->setValue(0);
    layout->addWidget(progress_bar_);

    frame_label_ = new QLabel(central);
    frame_label_->setWordWrap(true);
    layout->addWidget(frame_label_);

    timing_label_ = new QLabel(central);
    layout->addWidget(timing_label_);

    auto *buttons = new QHBoxLayout();
    cancel_button_ = new QPushButton("Cancel Render", central);
    remove_button_ = new QPushButton("Remove Selected", central);
    clear_button_ = new QPushButton("Clear Queue", central);
    buttons->addWidget(cancel_button_);
    buttons->addWidget(remove_button_);
    buttons->addWidget(clear_button_);
    buttons->addStretch();
    layout->addLayout(buttons);

    connect(cancel_button_, &QPushButton::clicked, this, &MainWindow::onCancel);
    connect(remove_button_, &QPushButton::clicked, this, &MainWindow::onRemoveSelected);
    connect(clear_button_, &QPushButton::clicked, this, &MainWindow::onClearPending);

    setCentralWidget(central);
}

void MainWindow::setupMenus()
{
    auto *setup_menu = menuBar()->addMenu("&Setup");
    auto *choose_action = setup_menu->addAction("Choose Blender Path...");
    connect(choose_action, &QAction::triggered, this, &MainWindow::onChooseBlenderPath);
}

void MainWindow::refreshIdleState()
{
    const bool busy = presenter_->isBusy();
    cancel_button_->setEnabled(busy);
    if (!busy) {
        drop_label_->setText(QString::fromStdString(presenter_->idleMessage()));
    }
}

void MainWindow::submitScene(const QString &path)
{
    std::string message;
    const brs::ResultCode result = presenter_->submitScene(path.toStdString(), message);

    if (result == brs::ResultCode::ERROR_NOT_CONFIGURED) {
        QMessageBox::warning(this, "Setup Required", QString::fromStdString(message));
    } else if (brs::is_error(result)) {
        QMessageBox::warning(this, "Invalid File", QString::fromStdString(message));
    } else if (!message.empty()) {
        statusBar()->showMessage(QString::fromStdString(message), 5000);
    }
    refreshIdleState();
}

void MainWindow::dragEnterEvent(QDragEnterEvent *event)
{
    if (event->mimeData()->hasUrls()) {
        event->acceptProposedAction();
    } else {
        event->ignore();
    }
}

void MainWindow::dropEvent(QDropEvent *event)
{
    if (!event->mimeData()->hasUrls()) {
        event->ignore();
        return;
    }

    const QList<QUrl> urls = event->mimeData()->urls();
    for (const QUrl &url : urls) {
        submitScene(url.toLocalFile());
        if (!presenter_->isRendererConfigured()) {
            break;
        }
    }
    event->acceptProposedAction();
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (presenter_->isBusy()) {
        const auto answer = QMessageBox::question(this, "Render In Progress",
                                                  "A render is running. Cancel it and quit?");
        if (answer != QMessageBox::Yes) {
            event->ignore();
            return;
        }
        presenter_->clearPending();
        presenter_->cancelCurrent();
    }
    event->accept();
}

void MainWindow::onChooseBlenderPath()
{
    const QString path = QFileDialog::getOpenFileName(
        this, "Select Blender Executable", QString(),
        "Blender App (*.app *.exe blender);;All Files (*)");
    if (path.isEmpty()) {
        return;
    }

    std::string resolved;
    const brs::ResultCode result = presenter_->setRendererPath(path.toStdString(), resolved);
    if (!settings_.save(state_.settings)) {
        QMessageBox::warning(this, "Settings", "Could not save the Blender path to " + settings_.filePath());
    }

    if (brs::is_success(result)) {
        QMessageBox::information(this, "Blender Path Saved",
                                 "Blender path:\n" + QString::fromStdString(resolved));
    } else {
        QMessageBox::warning(this, "Blender Path",
                             "No Blender executable found at:\n" + QString::fromStdString(resolved));
    }
    refreshIdleState();
}

void MainWindow::onCancel()
{
    presenter_->cancelCurrent();
    refreshIdleState();
}

void MainWindow::onClearPending()
{
    presenter_->clearPending();
}

void MainWindow::onRemoveSelected()
{
    auto *item = queue_list_->currentItem();
    if (!item) {
        return;
    }

    std::string message;
    const brs::ResultCode result = presenter_->removeScene(item->data(Qt::UserRole).toString().toStdString(), message);
    if (result == brs::ResultCode::ERROR_IN_USE) {
        QMessageBox::warning(this, "Render In Progress", QString::fromStdString(message));
    } else if (brs::is_error(result)) {
        statusBar()->showMessage(QString::fromStdString(message), 5000);
    }
}

void MainWindow::showQueue(const std::vector<QueueRowView> &rows)
{
    queue_list_->clear();
    for (const auto &row : rows) {
        QString text = QString::fromStdString(row.file_name + "  [" + row.status + "]");
        if (row.crash_count > 0) {
            text += QString("  crashes: %1").arg(row.crash_count);
        }
        auto *item = new QListWidgetItem(text, queue_list_);
        item->setData(Qt::UserRole, QString::fromStdString(row.path));
        item->setToolTip(QString::fromStdString(row.status_message));
        if (row.is_active) {
            QFont font = item->font();
            font.setBold(true);
            item->setFont(font);
            drop_label_->setText(QString::fromStdString("Processing " + row.file_name + " currently"));
        } else if (row.is_finished) {
            item->setForeground(Qt::gray);
        }
    }
    refreshIdleState();
}

void MainWindow::showProgress(const ProgressView &progress)
{
    progress_bar_->setRange(0, std::max(1, progress.maximum));
    progress_bar_->setValue(progress.value);
    frame_label_->setText(QString::fromStdString(progress.frame_text));
    timing_label_->setText(QString::fromStdString(progress.elapsed_text + "   " + progress.average_text + "   "
                                                  + progress.remaining_text + "   " + progress.completion_text));
}

void MainWindow::showSummary(const SessionSummaryView &summary)
{
    BRS_LOG_INFO("{}", summary.text);
    statusBar()->showMessage(QString::fromStdString(summary.text));
}
