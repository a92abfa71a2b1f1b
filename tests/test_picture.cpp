#include "ahoview/picture.h"
#include "ahoview/log.h"
#include "test_util.h"
#include <QCoreApplication>
#include <QFileInfo>
#include <iostream>
#include <cassert>

using namespace ahoview;
using namespace test_util;

void test_load_valid_image() {
    QTemporaryDir dir;
    Picture pic(write_image(dir, "wide.png", 200, 100));

    assert(!pic.is_checked());
    assert(pic.showable());
    assert(pic.is_checked());
    assert(pic.is_loaded());
    assert(pic.original().width() == 200);
    assert(pic.original().height() == 100);

    // Already loaded: no-op
    assert(pic.load());

    assert(pic.unload());
    assert(!pic.is_loaded());
    assert(pic.original().isNull());
    assert(pic.load());
    assert(pic.is_loaded());

    std::cout << "test_load_valid_image passed!" << std::endl;
}

void test_missing_and_corrupt_files() {
    QTemporaryDir dir;

    Picture missing(dir.filePath("nope.png").toStdString());
    assert(!missing.load());
    assert(missing.is_checked());
    assert(!missing.is_showable());
    assert(!missing.last_error().empty());
    // Failed check is remembered
    assert(!missing.load());
    assert(!missing.showable());

    Picture corrupt(write_text(dir, "broken.png", "definitely not a png"));
    assert(!corrupt.showable());
    assert(!corrupt.is_loaded());
    assert(!corrupt.last_error().empty());

    // A directory is not a picture
    Picture folder(dir.path().toStdString());
    assert(!folder.showable());

    std::cout << "test_missing_and_corrupt_files passed!" << std::endl;
}

void test_score_thresholds() {
    QTemporaryDir dir;
    Picture pic(write_image(dir, "a.png", 10, 10));

    assert(pic.score_set(-3) == 0.0);
    assert(!pic.is_loaded());

    assert(pic.score_add(1) == 1.0);
    assert(pic.is_loaded());

    // Between thresholds nothing changes
    assert(pic.score_add(-0.5) == 0.5);
    assert(pic.is_loaded());

    assert(pic.score_add(-0.5) == 0.0);
    assert(!pic.is_loaded());

    assert(pic.score_set(0.5) == 0.5);
    assert(!pic.is_loaded());

    std::cout << "test_score_thresholds passed!" << std::endl;
}

void test_scale_modes() {
    QTemporaryDir dir;
    Picture pic(write_image(dir, "wide.png", 200, 100));

    // Fit: limited by width
    assert(pic.scale_image(QSize(100, 100), RescaleMode::FIT));
    assert(pic.scaled().size() == QSize(100, 50));
    assert(!pic.scale_image(QSize(100, 100), RescaleMode::FIT));

    // Fit: limited by height, which already matches
    assert(!pic.scale_image(QSize(400, 50), RescaleMode::FIT));
    assert(pic.scale_image(QSize(400, 80), RescaleMode::FIT));
    assert(pic.scaled().size() == QSize(160, 80));

    assert(pic.scale_image(QSize(10, 10), RescaleMode::ORIGINAL));
    assert(pic.scaled().size() == QSize(200, 100));
    assert(!pic.scale_image(QSize(10, 10), RescaleMode::ORIGINAL));

    assert(pic.scale_image(QSize(80, 60), RescaleMode::STRETCH));
    assert(pic.scaled().size() == QSize(80, 60));
    assert(!pic.scale_image(QSize(80, 60), RescaleMode::STRETCH));

    assert(pic.scale_image(QSize(100, 50), RescaleMode::FIT_HEIGHT));
    assert(pic.scaled().height() == 50);
    assert(pic.scaled().width() == 100);
    assert(!pic.scale_image(QSize(30, 50), RescaleMode::FIT_HEIGHT));

    assert(pic.scale_image(QSize(50, 100), RescaleMode::FIT_WIDTH));
    assert(pic.scaled().width() == 50);
    assert(pic.scaled().height() == 25);
    assert(!pic.scale_image(QSize(50, 1), RescaleMode::FIT_WIDTH));

    // Empty viewport never rescales
    assert(!pic.scale_image(QSize(0, 0), RescaleMode::STRETCH));

    // Unloaded pictures are loaded on demand
    pic.unload();
    assert(pic.scale_image(QSize(100, 100), RescaleMode::FIT));
    assert(pic.is_loaded());

    Picture missing(dir.filePath("missing.png").toStdString());
    assert(!missing.scale_image(QSize(100, 100), RescaleMode::FIT));

    std::cout << "test_scale_modes passed!" << std::endl;
}

void test_mode_switch_same_viewport() {
    QTemporaryDir dir;
    Picture pic(write_image(dir, "wide.png", 200, 100));
    const QSize viewport(100, 100);

    assert(pic.scale_image(viewport, RescaleMode::STRETCH));
    assert(pic.scaled().size() == QSize(100, 100));
    assert(pic.scaled_mode() == RescaleMode::STRETCH);

    // Leaving Stretch must rescale even though the viewport did not change
    assert(pic.scale_image(viewport, RescaleMode::FIT));
    assert(pic.scaled().size() == QSize(100, 50));
    assert(pic.scaled_mode() == RescaleMode::FIT);

    assert(pic.scale_image(viewport, RescaleMode::STRETCH));
    assert(pic.scale_image(viewport, RescaleMode::FIT_WIDTH));
    assert(pic.scaled().size() == QSize(100, 50));

    assert(pic.scale_image(viewport, RescaleMode::STRETCH));
    assert(pic.scale_image(QSize(100, 100), RescaleMode::FIT_HEIGHT));
    assert(pic.scaled().size() == QSize(200, 100));

    // Same mode and viewport stays cached
    assert(!pic.scale_image(QSize(100, 100), RescaleMode::FIT_HEIGHT));

    std::cout << "test_mode_switch_same_viewport passed!" << std::endl;
}

void test_delete_file() {
    QTemporaryDir dir;
    std::string path = write_image(dir, "doomed.png", 8, 8);
    Picture pic(path);
    assert(pic.load());

    assert(pic.delete_file());
    assert(!QFileInfo::exists(QString::fromStdString(path)));
    assert(!pic.is_loaded());
    assert(!pic.is_showable());
    assert(!pic.showable());

    // Second delete has nothing to remove
    assert(!pic.delete_file());
    assert(!pic.last_error().empty());

    std::cout << "test_delete_file passed!" << std::endl;
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    Logger::instance().set_level(LogLevel::QUIET);

    try {
        test_load_valid_image();
        test_missing_and_corrupt_files();
        test_score_thresholds();
        test_scale_modes();
        test_mode_switch_same_viewport();
        test_delete_file();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
