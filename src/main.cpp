/*
 * src/main.cpp - Main entry point for the image viewer
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include <QApplication>
#include <QSettings>
#include <iostream>

#include "ahoview/common.h"
#include "ahoview/log.h"
#include "ahoview/native_path.h"
#include "ahoview/options.h"
#include "ahoview/settings.h"
#include "gui/main_window.h"

using namespace ahoview;

static bool answer_info_request(InfoRequest request, const char* program) {
    switch (request) {
        case InfoRequest::HELP:
            print_usage(std::cout, program);
            return true;
        case InfoRequest::VERSION:
            std::cout << APP_NAME << " " << APP_VERSION << "\n";
            return true;
        case InfoRequest::NONE:
            break;
    }
    return false;
}

int main(int argc, char** argv) {
    // Answered before QApplication so they work without a display
    if (answer_info_request(find_info_request(argc, argv), argv[0])) {
        return 0;
    }

    QApplication app(argc, argv);
    QApplication::setOrganizationName(APP_NAME);
    QApplication::setApplicationName(APP_NAME);
    QApplication::setApplicationVersion(APP_VERSION);

    CommandLine cmd;
    if (!parse_command_line(argc, argv, cmd)) {
        std::cerr << "Error: " << cmd.error << "\n";
        print_usage(std::cerr, argv[0]);
        return 1;
    }
    // Bundled short options such as -vh
    if (answer_info_request(cmd.info, argv[0])) {
        return 0;
    }

    QSettings store;
    Settings settings = Settings::load(store);
    if (cmd.rescale_mode) settings.rescale_mode = *cmd.rescale_mode;
    if (cmd.preload_radius) settings.preload_radius = *cmd.preload_radius;
    Logger::instance().set_level(cmd.log_level.value_or(settings.log_level));

    MainWindow window(settings);
    window.show();

    if (!cmd.path.empty()) {
        window.openPath(from_native_path(cmd.path));
    }

    log_debug(LogChannel::SYSTEM, "Entering event loop");
    return app.exec();
}
