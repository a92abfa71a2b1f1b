/*
 * src/picture.cpp - Lazy image loading, scoring and scaling
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "ahoview/picture.h"
#include "ahoview/log.h"
#include "ahoview/native_path.h"
#include <QImageReader>
#include <QString>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace ahoview {

namespace {

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

} // namespace

Picture::Picture(const std::string& file_name) : name_(file_name) {
}

bool Picture::showable() {
    if (!is_checked_) {
        load();
    }
    return is_showable_;
}

bool Picture::load() {
    if (is_loaded_) return true;
    if (is_checked_ && !is_showable_) return false;

    is_checked_ = true;
    is_showable_ = false;

    if (!is_regular_file(name_)) {
        last_error_ = "Not a regular file: " + name_;
        log_debug(LogChannel::LOADER, last_error_);
        return false;
    }

    QImageReader reader(from_native_path(name_));
    reader.setAutoTransform(true);
    QImage image = reader.read();
    if (image.isNull()) {
        last_error_ = "Cannot decode " + name_ + ": " + reader.errorString().toStdString();
        log_normal(LogChannel::LOADER, last_error_);
        return false;
    }

    original_ = std::move(image);
    is_showable_ = true;
    is_loaded_ = true;
    last_error_.clear();
    log_debug(LogChannel::LOADER, "Loaded " + name_);
    return true;
}

bool Picture::unload() {
    if (is_loaded_) {
        original_ = QImage();
        scaled_ = QImage();
        is_loaded_ = false;
        log_debug(LogChannel::LOADER, "Unloaded " + name_);
    }
    return true;
}

double Picture::score_add(double n) {
    return score_set(score_ + n);
}

double Picture::score_set(double n) {
    score_ = n;
    if (score_ <= SCORE_UNLOAD) {
        score_ = SCORE_UNLOAD;
        unload();
    } else if (score_ >= SCORE_LOAD) {
        load();
    }
    return score_;
}

bool Picture::delete_file() {
    if (is_loaded_) {
        unload();
    }
    if (!is_regular_file(name_)) {
        last_error_ = "Not a regular file: " + name_;
        return false;
    }

    std::error_code ec;
    if (!fs::remove(name_, ec)) {
        last_error_ = "Failed to delete " + name_ + ": " + ec.message();
        log_quiet(LogChannel::SYSTEM, last_error_);
        return false;
    }

    is_showable_ = false;
    is_checked_ = true;
    log_normal(LogChannel::SYSTEM, "Deleted " + name_);
    return true;
}

bool Picture::scale_image(const QSize& size, RescaleMode mode) {
    if (!showable()) return false;
    if (!is_loaded_ && !load()) return false;
    if (size.isEmpty()) return false;

    // Sizes only tell whether scaled_ is current if the same mode made it
    const bool stale = scaled_.isNull() || scaled_mode_ != mode;

    switch (mode) {
        case RescaleMode::FIT: {
            // The limiting dimension decides whether the current scale still fits
            qint64 lhs = static_cast<qint64>(size.height()) * original_.width();
            qint64 rhs = static_cast<qint64>(original_.height()) * size.width();
            if (!stale) {
                if (lhs >= rhs) {
                    if (size.width() == scaled_.width()) return false;
                } else {
                    if (size.height() == scaled_.height()) return false;
                }
            }
            scaled_ = original_.scaled(size, Qt::KeepAspectRatio, Qt::SmoothTransformation);
            break;
        }
        case RescaleMode::ORIGINAL:
            if (!stale && scaled_.size() == original_.size()) return false;
            scaled_ = original_;
            break;
        case RescaleMode::STRETCH:
            if (!stale && scaled_.size() == size) return false;
            scaled_ = original_.scaled(size, Qt::IgnoreAspectRatio, Qt::SmoothTransformation);
            break;
        case RescaleMode::FIT_HEIGHT:
            if (!stale && scaled_.height() == size.height()) return false;
            scaled_ = original_.scaled(2 * size.width(), size.height(),
                                       Qt::KeepAspectRatio, Qt::SmoothTransformation);
            break;
        case RescaleMode::FIT_WIDTH:
            if (!stale && scaled_.width() == size.width()) return false;
            scaled_ = original_.scaled(size.width(), 2 * size.height(),
                                       Qt::KeepAspectRatio, Qt::SmoothTransformation);
            break;
        default:
            return false;
    }
    scaled_mode_ = mode;
    return true;
}

} // namespace ahoview
