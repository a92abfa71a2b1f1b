/*
 * src/settings.cpp - Settings persistence
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "ahoview/settings.h"
#include "ahoview/native_path.h"
#include <QSettings>
#include <QString>
#include <algorithm>

namespace ahoview {

Settings Settings::load(QSettings& store) {
    Settings settings;

    bool ok = false;
    int mode = store.value(KEY_RESCALE_MODE, static_cast<int>(settings.rescale_mode)).toInt(&ok);
    if (ok) {
        if (auto parsed = rescale_mode_from_int(mode)) {
            settings.rescale_mode = *parsed;
        } else {
            log_normal(LogChannel::SYSTEM, "Ignoring invalid rescale mode " + std::to_string(mode));
        }
    }

    int radius = store.value(KEY_PRELOAD_RADIUS, settings.preload_radius).toInt(&ok);
    if (ok) {
        settings.preload_radius = std::clamp(radius, 0, MAX_PRELOAD_RADIUS);
    }

    std::string level = store.value(KEY_LOG_LEVEL, log_level_to_string(settings.log_level))
                            .toString().toStdString();
    if (auto parsed = log_level_from_string(level)) {
        settings.log_level = *parsed;
    }

    settings.last_directory = to_native_path(store.value(KEY_LAST_DIRECTORY).toString());
    settings.window_geometry = store.value(KEY_WINDOW_GEOMETRY).toByteArray();
    return settings;
}

void Settings::save(QSettings& store) const {
    store.setValue(KEY_RESCALE_MODE, static_cast<int>(rescale_mode));
    store.setValue(KEY_PRELOAD_RADIUS, preload_radius);
    store.setValue(KEY_LOG_LEVEL, QString(log_level_to_string(log_level)));
    store.setValue(KEY_LAST_DIRECTORY, from_native_path(last_directory));
    if (!window_geometry.isEmpty()) {
        store.setValue(KEY_WINDOW_GEOMETRY, window_geometry);
    }
    store.sync();
}

} // namespace ahoview
