#include "gui/main_window.h"
#include "gui/image_view.h"
#include "ahoview/log.h"
#include "test_util.h"
#include <QApplication>
#include <QMimeData>
#include <QStatusBar>
#include <QUrl>
#include <cstdlib>
#include <iostream>
#include <cassert>

using namespace ahoview;
using namespace test_util;

// a.png and c.png decode, b.png does not
static void write_mixed_directory(const QTemporaryDir& dir) {
    write_image(dir, "a.png", 200, 100);
    write_text(dir, "b.png", "not an image");
    write_image(dir, "c.png", 200, 100);
}

static size_t current_index(const MainWindow& window) {
    assert(window.archive());
    return window.archive()->index();
}

void test_open_keeps_previous_archive() {
    QTemporaryDir pictures;
    QTemporaryDir empty;
    write_mixed_directory(pictures);

    MainWindow window{Settings()};
    window.show();

    assert(window.archive() == nullptr);
    assert(window.openPath(pictures.path()));
    assert(window.archive());
    const std::string opened = window.archive()->name();
    assert(window.archive()->size() == 3);
    assert(current_index(window) == 0);

    // Nothing viewable: the open fails and the old directory stays up
    assert(!window.openPath(empty.path()));
    assert(window.archive());
    assert(window.archive()->name() == opened);
    assert(window.archive()->size() == 3);

    assert(!window.openPath(empty.filePath("missing")));
    assert(!window.openPath(QString()));
    assert(window.archive()->name() == opened);

    std::cout << "test_open_keeps_previous_archive passed!" << std::endl;
}

void test_navigation_skips_corrupt_picture() {
    QTemporaryDir dir;
    write_mixed_directory(dir);

    MainWindow window{Settings()};
    window.show();
    assert(window.openPath(dir.path()));
    assert(current_index(window) == 0);

    window.onNext();
    assert(current_index(window) == 2);

    // Wraps around to the first picture
    window.onNext();
    assert(current_index(window) == 0);

    window.onLast();
    assert(current_index(window) == 2);

    window.onPrevious();
    assert(current_index(window) == 0);

    window.onPrevious();
    assert(current_index(window) == 2);

    window.onFirst();
    assert(current_index(window) == 0);

    std::cout << "test_navigation_skips_corrupt_picture passed!" << std::endl;
}

void test_delete_moves_to_showable_neighbour() {
    QTemporaryDir dir;
    write_mixed_directory(dir);
    const QString first = dir.filePath("a.png");

    MainWindow window{Settings()};
    window.show();
    assert(window.openPath(dir.path()));
    assert(current_index(window) == 0);

    assert(window.deleteCurrent());
    assert(!QFileInfo::exists(first));
    assert(window.archive()->size() == 2);

    // b.png would be next but cannot be shown
    const Picture* current = window.archive()->ptr(0);
    assert(current);
    assert(file_name(current->name()) == "c.png");
    assert(current_index(window) == 1);

    std::cout << "test_delete_moves_to_showable_neighbour passed!" << std::endl;
}

void test_rescale_mode_switch() {
    QTemporaryDir dir;
    write_image(dir, "wide.png", 200, 100);

    MainWindow window{Settings()};
    window.show();
    QApplication::processEvents();
    assert(window.openPath(dir.path()));

    auto* view = window.findChild<ImageView*>();
    assert(view);
    const QSize available = view->availableSize();
    assert(!available.isEmpty());

    QAction stretch;
    stretch.setData(static_cast<int>(RescaleMode::STRETCH));
    window.onRescaleModeTriggered(&stretch);
    assert(window.rescaleMode() == RescaleMode::STRETCH);

    const Picture* pic = window.archive()->ptr(0);
    assert(pic->scaled().size() == available);

    QAction fit;
    fit.setData(static_cast<int>(RescaleMode::FIT));
    window.onRescaleModeTriggered(&fit);
    assert(window.rescaleMode() == RescaleMode::FIT);

    // Fit keeps the 2:1 aspect and touches the viewport on one side
    const QSize fitted = pic->scaled().size();
    assert(fitted.width() <= available.width());
    assert(fitted.height() <= available.height());
    assert(fitted.width() == available.width() || fitted.height() == available.height());
    assert(std::abs(fitted.width() - 2 * fitted.height()) <= 2);

    // Out-of-range mode data is ignored
    QAction bogus;
    bogus.setData(42);
    window.onRescaleModeTriggered(&bogus);
    assert(window.rescaleMode() == RescaleMode::FIT);

    std::cout << "test_rescale_mode_switch passed!" << std::endl;
}

void test_drag_and_drop() {
    QTemporaryDir dir;
    write_image(dir, "a.png", 20, 10);

    MainWindow window{Settings()};
    window.show();

    QMimeData remote;
    remote.setUrls({QUrl("https://example.com/pictures/")});
    QDragEnterEvent remoteEnter(QPoint(10, 10), Qt::CopyAction, &remote,
                                Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(&window, &remoteEnter);
    assert(!remoteEnter.isAccepted());

    QMimeData text;
    text.setText(dir.path());
    QDragEnterEvent textEnter(QPoint(10, 10), Qt::CopyAction, &text,
                              Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(&window, &textEnter);
    assert(!textEnter.isAccepted());

    QMimeData local;
    local.setUrls({QUrl::fromLocalFile(dir.path())});
    QDragEnterEvent localEnter(QPoint(10, 10), Qt::CopyAction, &local,
                               Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(&window, &localEnter);
    assert(localEnter.isAccepted());

    QDropEvent drop(QPointF(10, 10), Qt::CopyAction, &local, Qt::LeftButton, Qt::NoModifier);
    QCoreApplication::sendEvent(&window, &drop);
    assert(drop.isAccepted());
    assert(window.archive());
    assert(window.archive()->size() == 1);

    std::cout << "test_drag_and_drop passed!" << std::endl;
}

void test_status_restored_after_log_message() {
    QTemporaryDir dir;
    write_image(dir, "a.png", 20, 10);

    MainWindow window{Settings()};
    window.show();
    assert(window.openPath(dir.path()));

    QStatusBar* status = window.statusBar();
    assert(status->currentMessage().contains("a.png"));

    log_quiet(LogChannel::LOADER, "Cannot read sidecar file");
    QApplication::processEvents();
    assert(status->currentMessage().contains("Cannot read sidecar file"));

    // Same path as the message timeout expiring
    status->clearMessage();
    assert(status->currentMessage().contains("a.png"));
    assert(status->currentMessage().contains("20×10"));

    std::cout << "test_status_restored_after_log_message passed!" << std::endl;
}

int main(int argc, char** argv) {
    QApplication app(argc, argv);
    Logger::instance().set_level(LogLevel::QUIET);

    try {
        test_open_keeps_previous_archive();
        test_navigation_skips_corrupt_picture();
        test_delete_moves_to_showable_neighbour();
        test_rescale_mode_switch();
        test_drag_and_drop();
        test_status_restored_after_log_message();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
