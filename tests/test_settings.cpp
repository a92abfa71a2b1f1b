#include "ahoview/settings.h"
#include "ahoview/log.h"
#include "ahoview/common.h"
#include <QCoreApplication>
#include <QSettings>
#include <QTemporaryDir>
#include <iostream>
#include <cassert>
#include <string>
#include <vector>

using namespace ahoview;

void test_rescale_mode_strings() {
    assert(rescale_mode_from_string("fit") == RescaleMode::FIT);
    assert(rescale_mode_from_string("width") == RescaleMode::FIT_WIDTH);
    assert(!rescale_mode_from_string("zoom").has_value());
    assert(std::string(rescale_mode_to_string(RescaleMode::FIT_HEIGHT)) == "height");
    assert(rescale_mode_from_int(2) == RescaleMode::STRETCH);
    assert(!rescale_mode_from_int(5).has_value());
    assert(!rescale_mode_from_int(-1).has_value());

    std::cout << "test_rescale_mode_strings passed!" << std::endl;
}

void test_settings_defaults() {
    QTemporaryDir dir;
    QSettings store(dir.filePath("empty.ini"), QSettings::IniFormat);
    Settings settings = Settings::load(store);

    assert(settings.rescale_mode == RescaleMode::FIT);
    assert(settings.preload_radius == DEFAULT_PRELOAD_RADIUS);
    assert(settings.log_level == LogLevel::NORMAL);
    assert(settings.last_directory.empty());
    assert(settings.window_geometry.isEmpty());

    std::cout << "test_settings_defaults passed!" << std::endl;
}

void test_settings_round_trip() {
    QTemporaryDir dir;
    QString path = dir.filePath("viewer.ini");
    {
        QSettings store(path, QSettings::IniFormat);
        Settings settings;
        settings.rescale_mode = RescaleMode::FIT_WIDTH;
        settings.preload_radius = 3;
        settings.log_level = LogLevel::VERBOSE;
        settings.last_directory = "/tmp/pictures";
        settings.window_geometry = QByteArray("geometry-blob");
        settings.save(store);
    }

    QSettings store(path, QSettings::IniFormat);
    Settings loaded = Settings::load(store);
    assert(loaded.rescale_mode == RescaleMode::FIT_WIDTH);
    assert(loaded.preload_radius == 3);
    assert(loaded.log_level == LogLevel::VERBOSE);
    assert(loaded.last_directory == "/tmp/pictures");
    assert(loaded.window_geometry == QByteArray("geometry-blob"));

    std::cout << "test_settings_round_trip passed!" << std::endl;
}

void test_settings_invalid_values() {
    QTemporaryDir dir;
    QSettings store(dir.filePath("bad.ini"), QSettings::IniFormat);
    store.setValue(KEY_RESCALE_MODE, 9);
    store.setValue(KEY_PRELOAD_RADIUS, 99);
    store.setValue(KEY_LOG_LEVEL, "chatty");
    store.sync();

    Settings settings = Settings::load(store);
    assert(settings.rescale_mode == RescaleMode::FIT);
    assert(settings.preload_radius == MAX_PRELOAD_RADIUS);
    assert(settings.log_level == LogLevel::NORMAL);

    store.setValue(KEY_PRELOAD_RADIUS, -4);
    store.setValue(KEY_RESCALE_MODE, "not a number");
    settings = Settings::load(store);
    assert(settings.preload_radius == 0);
    assert(settings.rescale_mode == RescaleMode::FIT);

    std::cout << "test_settings_invalid_values passed!" << std::endl;
}

void test_logger_filtering() {
    Logger& logger = Logger::instance();
    std::vector<std::string> lines;
    logger.set_sink([&lines](LogLevel, LogChannel, const std::string& line) {
        lines.push_back(line);
    });
    logger.set_level(LogLevel::NORMAL);

    log_debug(LogChannel::LOADER, "hidden");
    log_verbose(LogChannel::VIEW, "hidden too");
    log_normal(LogChannel::LOADER, "scanned folder");
    log_quiet(LogChannel::SYSTEM, "disk full");
    assert(lines.size() == 2);
    assert(lines[0].find("[LOADER] scanned folder") != std::string::npos);
    assert(lines[0][0] == '[');
    assert(lines[1].find("[SYSTEM] disk full") != std::string::npos);

    logger.set_channel_enabled(LogChannel::LOADER, false);
    log_quiet(LogChannel::LOADER, "muted");
    assert(lines.size() == 2);
    assert(!logger.should_log(LogLevel::QUIET, LogChannel::LOADER));
    logger.set_channel_enabled(LogChannel::LOADER, true);

    logger.set_level(LogLevel::DEBUG);
    log_debug(LogChannel::VIEW, "everything");
    assert(lines.size() == 3);

    assert(log_level_from_string("verbose") == LogLevel::VERBOSE);
    assert(!log_level_from_string("loud").has_value());

    logger.set_sink(nullptr);
    logger.set_level(LogLevel::QUIET);

    std::cout << "test_logger_filtering passed!" << std::endl;
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    Logger::instance().set_level(LogLevel::QUIET);

    try {
        test_rescale_mode_strings();
        test_settings_defaults();
        test_settings_round_trip();
        test_settings_invalid_values();
        test_logger_filtering();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
