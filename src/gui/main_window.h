/*
 * src/gui/main_window.h - Main window class for the Qt GUI application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#ifndef AHOVIEW_MAIN_WINDOW_H
#define AHOVIEW_MAIN_WINDOW_H

#include <QMainWindow>
#include <QAction>
#include <QActionGroup>
#include <QLabel>
#include <QCloseEvent>
#include <QDragEnterEvent>
#include <QDragMoveEvent>
#include <QDropEvent>
#include <memory>
#include <string>

#include "ahoview/common.h"
#include "ahoview/log.h"
#include "ahoview/picture_archive.h"
#include "ahoview/settings.h"
#include "image_view.h"

namespace ahoview {

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(const Settings& settings, QWidget* parent = nullptr);
    ~MainWindow() override;

    // Open a directory or a single image. Keeps the current archive and
    // returns false if the path holds nothing showable.
    bool openPath(const QString& path);

    // Delete the current picture's file without asking and move on to the
    // next showable picture.
    bool deleteCurrent();

    const PictureArchive* archive() const { return archive_.get(); }
    RescaleMode rescaleMode() const { return settings_.rescale_mode; }

protected:
    void closeEvent(QCloseEvent* event) override;
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dragMoveEvent(QDragMoveEvent* event) override;
    void dropEvent(QDropEvent* event) override;

public slots:
    void onOpenDirectoryTriggered();
    void onOpenFileTriggered();
    void onDeleteTriggered();
    void onNext();
    void onPrevious();
    void onFirst();
    void onLast();
    void onRescaleModeTriggered(QAction* action);
    void onFullScreenToggled(bool checked);

signals:
    void logMessageReceived(const QString& message);

private slots:
    void step(int offset);
    void refreshImage();
    void showLogMessage(const QString& message);
    void onStatusMessageChanged(const QString& message);

private:
    void setupUi();
    void setupMenus();
    bool seekShowable(int direction);
    void showCurrent();
    void updateTitleAndStatus();
    void updateActions();
    void showError(const QString& title, const QString& message);
    QString startDirectory() const;

    // UI components
    ImageView* imageView_;
    QLabel* positionLabel_;

    QAction* openDirectoryAction_;
    QAction* openFileAction_;
    QAction* deleteAction_;
    QAction* quitAction_;
    QAction* nextAction_;
    QAction* previousAction_;
    QAction* firstAction_;
    QAction* lastAction_;
    QAction* fullScreenAction_;
    QActionGroup* rescaleGroup_;

    // State
    std::unique_ptr<PictureArchive> archive_;
    Settings settings_;
};

} // namespace ahoview

#endif // AHOVIEW_MAIN_WINDOW_H
