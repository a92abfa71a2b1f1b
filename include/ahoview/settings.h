/*
 * settings.h - Persistent viewer settings backed by QSettings
 * Copyright © 2026 Kirn Gill II <segin2005@gmail.com>
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#pragma once

#include <string>
#include <QByteArray>
#include "ahoview/common.h"
#include "ahoview/log.h"

class QSettings;

namespace ahoview {

struct Settings {
    RescaleMode rescale_mode = RescaleMode::FIT;
    int preload_radius = DEFAULT_PRELOAD_RADIUS;
    LogLevel log_level = LogLevel::NORMAL;
    std::string last_directory;
    QByteArray window_geometry;

    // Missing or invalid keys keep their defaults
    static Settings load(QSettings& store);
    void save(QSettings& store) const;
};

// Settings keys
constexpr const char* KEY_RESCALE_MODE = "view/rescale_mode";
constexpr const char* KEY_PRELOAD_RADIUS = "view/preload_radius";
constexpr const char* KEY_LOG_LEVEL = "log/level";
constexpr const char* KEY_LAST_DIRECTORY = "window/last_directory";
constexpr const char* KEY_WINDOW_GEOMETRY = "window/geometry";

} // namespace ahoview
