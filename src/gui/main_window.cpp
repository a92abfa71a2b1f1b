/*
 * src/gui/main_window.cpp - Main window: menus, drag-and-drop, navigation
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "main_window.h"
#include <QApplication>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QKeySequence>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QMimeData>
#include <QSettings>
#include <QStatusBar>
#include <iostream>

#include "ahoview/native_path.h"

namespace ahoview {

MainWindow::MainWindow(const Settings& settings, QWidget* parent)
    : QMainWindow(parent)
    , imageView_(nullptr)
    , positionLabel_(nullptr)
    , rescaleGroup_(nullptr)
    , settings_(settings)
{
    setWindowTitle(QString(APP_NAME));
    resize(1000, 700);
    setAcceptDrops(true);

    setupUi();
    setupMenus();
    updateActions();

    if (!settings_.window_geometry.isEmpty()) {
        restoreGeometry(settings_.window_geometry);
    }

    // Log lines may come from any thread; hop to the GUI thread for the status bar
    connect(this, &MainWindow::logMessageReceived, this, &MainWindow::showLogMessage,
            Qt::QueuedConnection);
    Logger::instance().set_sink([this](LogLevel level, LogChannel, const std::string& line) {
        std::cerr << line << std::endl;
        if (level == LogLevel::QUIET) {
            emit logMessageReceived(QString::fromStdString(line));
        }
    });
}

MainWindow::~MainWindow() {
    Logger::instance().set_sink(nullptr);
}

void MainWindow::setupUi() {
    imageView_ = new ImageView(this);
    setCentralWidget(imageView_);

    connect(imageView_, &ImageView::viewportResized, this, &MainWindow::refreshImage);
    connect(imageView_, &ImageView::stepRequested, this, &MainWindow::step);

    positionLabel_ = new QLabel();
    statusBar()->addPermanentWidget(positionLabel_);
    statusBar()->showMessage(tr("No directory open"));

    // Timed log messages leave the status bar blank when they expire
    connect(statusBar(), &QStatusBar::messageChanged, this, &MainWindow::onStatusMessageChanged);
}

void MainWindow::setupMenus() {
    // File
    QMenu* fileMenu = menuBar()->addMenu(tr("&File"));

    openDirectoryAction_ = fileMenu->addAction(tr("Open &Directory..."));
    openDirectoryAction_->setShortcut(QKeySequence::Open);
    connect(openDirectoryAction_, &QAction::triggered, this, &MainWindow::onOpenDirectoryTriggered);

    openFileAction_ = fileMenu->addAction(tr("Open &File..."));
    openFileAction_->setShortcut(QKeySequence(Qt::CTRL | Qt::SHIFT | Qt::Key_O));
    connect(openFileAction_, &QAction::triggered, this, &MainWindow::onOpenFileTriggered);

    fileMenu->addSeparator();

    deleteAction_ = fileMenu->addAction(tr("De&lete File"));
    deleteAction_->setShortcut(QKeySequence::Delete);
    connect(deleteAction_, &QAction::triggered, this, &MainWindow::onDeleteTriggered);

    fileMenu->addSeparator();

    quitAction_ = fileMenu->addAction(tr("&Quit"));
    quitAction_->setShortcut(QKeySequence::Quit);
    connect(quitAction_, &QAction::triggered, this, &QWidget::close);

    // View
    QMenu* viewMenu = menuBar()->addMenu(tr("&View"));
    rescaleGroup_ = new QActionGroup(this);
    rescaleGroup_->setExclusive(true);

    struct ModeEntry {
        RescaleMode mode;
        const char* label;
        Qt::Key key;
    };
    const ModeEntry modes[] = {
        {RescaleMode::FIT, QT_TR_NOOP("&Fit to Window"), Qt::Key_1},
        {RescaleMode::ORIGINAL, QT_TR_NOOP("&Original Size"), Qt::Key_2},
        {RescaleMode::STRETCH, QT_TR_NOOP("&Stretch"), Qt::Key_3},
        {RescaleMode::FIT_HEIGHT, QT_TR_NOOP("Fit to &Height"), Qt::Key_4},
        {RescaleMode::FIT_WIDTH, QT_TR_NOOP("Fit to &Width"), Qt::Key_5},
    };
    for (const auto& entry : modes) {
        QAction* action = viewMenu->addAction(tr(entry.label));
        action->setCheckable(true);
        action->setShortcut(QKeySequence(entry.key));
        action->setData(static_cast<int>(entry.mode));
        action->setChecked(entry.mode == settings_.rescale_mode);
        rescaleGroup_->addAction(action);
    }
    connect(rescaleGroup_, &QActionGroup::triggered, this, &MainWindow::onRescaleModeTriggered);

    viewMenu->addSeparator();

    fullScreenAction_ = viewMenu->addAction(tr("F&ull Screen"));
    fullScreenAction_->setCheckable(true);
    fullScreenAction_->setShortcut(QKeySequence(Qt::Key_F11));
    connect(fullScreenAction_, &QAction::toggled, this, &MainWindow::onFullScreenToggled);

    // Go
    QMenu* goMenu = menuBar()->addMenu(tr("&Go"));

    nextAction_ = goMenu->addAction(tr("&Next"));
    nextAction_->setShortcuts({QKeySequence(Qt::Key_Right), QKeySequence(Qt::Key_Space),
                               QKeySequence(Qt::Key_PageDown)});
    connect(nextAction_, &QAction::triggered, this, &MainWindow::onNext);

    previousAction_ = goMenu->addAction(tr("&Previous"));
    previousAction_->setShortcuts({QKeySequence(Qt::Key_Left), QKeySequence(Qt::Key_Backspace),
                                   QKeySequence(Qt::Key_PageUp)});
    connect(previousAction_, &QAction::triggered, this, &MainWindow::onPrevious);

    goMenu->addSeparator();

    firstAction_ = goMenu->addAction(tr("&First"));
    firstAction_->setShortcut(QKeySequence(Qt::Key_Home));
    connect(firstAction_, &QAction::triggered, this, &MainWindow::onFirst);

    lastAction_ = goMenu->addAction(tr("&Last"));
    lastAction_->setShortcut(QKeySequence(Qt::Key_End));
    connect(lastAction_, &QAction::triggered, this, &MainWindow::onLast);

    // Shortcuts must keep working while the menu bar is hidden in full screen
    addActions({deleteAction_, nextAction_, previousAction_, firstAction_, lastAction_,
                fullScreenAction_});
}

bool MainWindow::openPath(const QString& path) {
    if (path.isEmpty()) return false;

    log_normal(LogChannel::SYSTEM, "Opening " + path.toStdString());
    auto archive = std::make_unique<PictureArchive>(to_native_path(QDir::cleanPath(path)));
    if (!archive->showable()) {
        showError(tr("Open"), tr("No viewable images in \"%1\".").arg(path));
        return false;
    }

    archive_ = std::move(archive);

    QFileInfo info(path);
    settings_.last_directory = to_native_path(info.isDir() ? info.absoluteFilePath()
                                             : info.absolutePath());

    log_normal(LogChannel::LOADER, "Opened " + archive_->name() + " (" +
               std::to_string(archive_->size()) + " images)");
    showCurrent();
    updateActions();
    return true;
}

void MainWindow::onOpenDirectoryTriggered() {
    QString dir = QFileDialog::getExistingDirectory(this, tr("Open Directory"),
                                                    startDirectory(),
                                                    QFileDialog::ShowDirsOnly);
    if (!dir.isEmpty()) {
        openPath(dir);
    }
}

void MainWindow::onOpenFileTriggered() {
    QString file = QFileDialog::getOpenFileName(this, tr("Open File"), startDirectory(),
                                                tr("Images (*.jpg *.jpeg *.png *.bmp);;All Files (*)"));
    if (!file.isEmpty()) {
        openPath(file);
    }
}

void MainWindow::onDeleteTriggered() {
    if (!archive_) return;
    Picture* pic = archive_->current_pic();
    if (!pic) return;

    QString name = from_native_path(pic->name());
    auto answer = QMessageBox::question(this, tr("Delete File"),
                                        tr("Permanently delete \"%1\"?").arg(name),
                                        QMessageBox::Yes | QMessageBox::No, QMessageBox::No);
    if (answer == QMessageBox::Yes) {
        deleteCurrent();
    }
}

bool MainWindow::deleteCurrent() {
    Picture* pic = archive_ ? archive_->current_pic() : nullptr;
    if (!pic) return false;

    if (!pic->delete_file()) {
        showError(tr("Delete File"), QString::fromStdString(pic->last_error()));
        return false;
    }
    log_normal(LogChannel::LOADER, "Deleted " + pic->name());

    archive_->erase_current();
    seekShowable(1);
    showCurrent();
    updateActions();
    return true;
}

void MainWindow::onNext() {
    step(1);
}

void MainWindow::onPrevious() {
    step(-1);
}

void MainWindow::onFirst() {
    if (!archive_ || archive_->empty()) return;
    archive_->begin();
    seekShowable(1);
    showCurrent();
}

void MainWindow::onLast() {
    if (!archive_ || archive_->empty()) return;
    archive_->end();
    seekShowable(-1);
    showCurrent();
}

void MainWindow::step(int offset) {
    if (!archive_ || archive_->empty() || offset == 0) return;

    archive_->mv(offset);
    seekShowable(offset > 0 ? 1 : -1);

    log_verbose(LogChannel::VIEW, "Moved to " + std::to_string(archive_->index() + 1) + "/" +
                std::to_string(archive_->size()));
    showCurrent();
}

bool MainWindow::seekShowable(int direction) {
    if (!archive_) return false;

    // Skip pictures that fail to decode, in the direction of travel
    for (size_t tries = 0; tries < archive_->size(); ++tries) {
        Picture* pic = archive_->current_pic();
        if (pic && pic->showable()) return true;
        archive_->mv(direction);
    }
    return false;
}

void MainWindow::onRescaleModeTriggered(QAction* action) {
    auto mode = rescale_mode_from_int(action->data().toInt());
    if (!mode) return;

    settings_.rescale_mode = *mode;
    log_verbose(LogChannel::VIEW, std::string("Rescale mode: ") + rescale_mode_to_string(*mode));
    showCurrent();
}

void MainWindow::onFullScreenToggled(bool checked) {
    menuBar()->setVisible(!checked);
    statusBar()->setVisible(!checked);
    if (checked) {
        showFullScreen();
    } else {
        showNormal();
    }
}

void MainWindow::showCurrent() {
    Picture* pic = archive_ ? archive_->current_pic() : nullptr;
    if (!pic) {
        archive_.reset();
        imageView_->clear(tr("No images"));
        updateTitleAndStatus();
        return;
    }

    archive_->update_residency(settings_.preload_radius);

    if (!pic->showable()) {
        // Only happens once every remaining picture failed to decode
        imageView_->clear(tr("Cannot display %1\n%2")
                              .arg(from_native_path(pic->name()),
                                   QString::fromStdString(pic->last_error())));
        updateTitleAndStatus();
        return;
    }

    archive_->scale(0, imageView_->availableSize(), settings_.rescale_mode);
    imageView_->setImage(pic->scaled());
    updateTitleAndStatus();
}

void MainWindow::refreshImage() {
    if (!archive_) return;
    if (archive_->scale(0, imageView_->availableSize(), settings_.rescale_mode)) {
        imageView_->setImage(archive_->current_pic()->scaled());
    }
}

void MainWindow::updateTitleAndStatus() {
    Picture* pic = archive_ ? archive_->current_pic() : nullptr;
    if (!pic) {
        setWindowTitle(QString(APP_NAME));
        positionLabel_->clear();
        statusBar()->showMessage(tr("No directory open"));
        return;
    }

    QString path = from_native_path(pic->name());
    setWindowTitle(QString("%1 - %2").arg(QString(APP_NAME), QFileInfo(path).fileName()));
    positionLabel_->setText(QString("%1/%2").arg(archive_->index() + 1).arg(archive_->size()));

    if (pic->is_loaded()) {
        statusBar()->showMessage(QString("%1 (%2×%3)")
                                     .arg(path)
                                     .arg(pic->original().width())
                                     .arg(pic->original().height()));
    } else {
        statusBar()->showMessage(path);
    }
}

void MainWindow::updateActions() {
    const bool hasPictures = archive_ && !archive_->empty();
    deleteAction_->setEnabled(hasPictures);
    nextAction_->setEnabled(hasPictures);
    previousAction_->setEnabled(hasPictures);
    firstAction_->setEnabled(hasPictures);
    lastAction_->setEnabled(hasPictures);
}

void MainWindow::showError(const QString& title, const QString& message) {
    log_quiet(LogChannel::SYSTEM, message.toStdString());

    auto* box = new QMessageBox(QMessageBox::Warning, title, message, QMessageBox::Ok, this);
    box->setAttribute(Qt::WA_DeleteOnClose);
    box->open();
}

void MainWindow::showLogMessage(const QString& message) {
    statusBar()->showMessage(message, 5000);
}

void MainWindow::onStatusMessageChanged(const QString& message) {
    if (message.isEmpty()) {
        updateTitleAndStatus();
    }
}

QString MainWindow::startDirectory() const {
    if (!settings_.last_directory.empty()) {
        return from_native_path(settings_.last_directory);
    }
    return QDir::homePath();
}

void MainWindow::closeEvent(QCloseEvent* event) {
    settings_.window_geometry = saveGeometry();

    QSettings store;
    settings_.save(store);
    if (store.status() != QSettings::NoError) {
        log_quiet(LogChannel::SYSTEM, "Failed to write settings to " +
                  store.fileName().toStdString());
    }
    event->accept();
}

void MainWindow::dragEnterEvent(QDragEnterEvent* event) {
    const QMimeData* mime = event->mimeData();
    if (mime->hasUrls() && !resolve_drop_path(mime->urls()).empty()) {
        event->acceptProposedAction();
    } else {
        event->ignore();
    }
}

void MainWindow::dragMoveEvent(QDragMoveEvent* event) {
    if (event->mimeData()->hasUrls()) {
        event->acceptProposedAction();
    } else {
        event->ignore();
    }
}

void MainWindow::dropEvent(QDropEvent* event) {
    std::string path = resolve_drop_path(event->mimeData()->urls());
    if (path.empty()) {
        event->ignore();
        return;
    }
    event->acceptProposedAction();
    openPath(from_native_path(path));
}

} // namespace ahoview
