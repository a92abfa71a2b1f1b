/*
 * src/picture_archive.cpp - Directory scanning and cursor navigation
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "ahoview/picture_archive.h"
#include "ahoview/log.h"
#include "ahoview/native_path.h"
#include <filesystem>
#include <system_error>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstddef>

namespace fs = std::filesystem;

namespace ahoview {

PictureArchive::PictureArchive(const std::string& path) : name_(path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        is_checked_ = true;
        is_showable_ = false;
        log_normal(LogChannel::LOADER, "Path does not exist: " + path);
        return;
    }

    if (fs::is_directory(path, ec)) {
        scan_directory(path);
        if (pictures_.empty()) {
            is_checked_ = true;
            is_showable_ = false;
            log_normal(LogChannel::LOADER, "No images in " + path);
        }
    } else if (fs::is_regular_file(path, ec)) {
        pictures_.emplace_back(path);
    } else {
        is_checked_ = true;
        is_showable_ = false;
    }
    index_ = 0;
}

void PictureArchive::scan_directory(const std::string& dir) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), last; !ec && it != last; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) continue;
        std::string file_name = it->path().filename().string();
        if (has_image_extension(file_name)) {
            names.push_back(std::move(file_name));
        }
    }
    if (ec) {
        log_quiet(LogChannel::LOADER, "Error reading " + dir + ": " + ec.message());
    }

    std::sort(names.begin(), names.end(), natural_less);

    pictures_.reserve(names.size());
    for (const auto& file_name : names) {
        pictures_.emplace_back((fs::path(dir) / file_name).string());
    }
    log_verbose(LogChannel::LOADER, "Found " + std::to_string(pictures_.size()) +
                " images in " + dir);
}

size_t PictureArchive::offset_idx(int offset) const {
    if (pictures_.empty()) return 0;

    const long long n = static_cast<long long>(pictures_.size());
    long long idx = (static_cast<long long>(index_) + offset) % n;
    if (idx < 0) idx += n;
    return static_cast<size_t>(idx);
}

bool PictureArchive::showable() {
    if (is_checked_) return is_showable_;

    for (size_t i = 0; i < pictures_.size(); ++i) {
        if (pictures_[i].showable()) {
            is_showable_ = true;
            is_checked_ = true;
            index_ = i;
            return true;
        }
    }

    is_showable_ = false;
    is_checked_ = true;
    return false;
}

bool PictureArchive::load(int offset) {
    if (pictures_.empty()) return false;
    return pictures_[offset_idx(offset)].load();
}

bool PictureArchive::scale(int offset, const QSize& size, RescaleMode mode) {
    if (pictures_.empty()) return false;
    return pictures_[offset_idx(offset)].scale_image(size, mode);
}

Picture* PictureArchive::ptr(int offset) {
    if (pictures_.empty()) return nullptr;
    return &pictures_[offset_idx(offset)];
}

const Picture* PictureArchive::ptr(int offset) const {
    if (pictures_.empty()) return nullptr;
    return &pictures_[offset_idx(offset)];
}

Picture* PictureArchive::mv(int offset) {
    if (pictures_.empty()) return nullptr;
    index_ = offset_idx(offset);
    return &pictures_[index_];
}

Picture* PictureArchive::begin() {
    if (pictures_.empty()) return nullptr;
    index_ = 0;
    return &pictures_[index_];
}

Picture* PictureArchive::end() {
    if (pictures_.empty()) return nullptr;
    index_ = pictures_.size() - 1;
    return &pictures_[index_];
}

Picture* PictureArchive::current_pic() {
    if (pictures_.empty()) return nullptr;
    return &pictures_[index_];
}

bool PictureArchive::erase_current() {
    if (pictures_.empty()) return false;

    pictures_.erase(pictures_.begin() + static_cast<std::ptrdiff_t>(index_));
    if (index_ >= pictures_.size()) {
        index_ = pictures_.empty() ? 0 : pictures_.size() - 1;
    }

    // Re-evaluate on next showable()
    is_checked_ = pictures_.empty();
    is_showable_ = false;
    return true;
}

void PictureArchive::update_residency(int radius) {
    if (pictures_.empty()) return;
    radius = std::clamp(radius, 0, MAX_PRELOAD_RADIUS);

    const long long n = static_cast<long long>(pictures_.size());
    for (long long i = 0; i < n; ++i) {
        // Shortest wraparound distance from the cursor
        long long d = std::llabs(i - static_cast<long long>(index_));
        d = std::min(d, n - d);
        pictures_[static_cast<size_t>(i)].score_set(d <= radius ? SCORE_LOAD : SCORE_UNLOAD);
    }
}

bool has_image_extension(const std::string& file_name) {
    std::string ext = fs::path(file_name).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const char* known : IMAGE_EXTENSIONS) {
        if (ext == known) return true;
    }
    return false;
}

bool natural_less(const std::string& a, const std::string& b) {
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        unsigned char ca = static_cast<unsigned char>(a[i]);
        unsigned char cb = static_cast<unsigned char>(b[j]);

        if (std::isdigit(ca) && std::isdigit(cb)) {
            // Skip leading zeros, then longer run is bigger, then lexicographic
            size_t si = i, sj = j;
            while (si < a.size() && a[si] == '0') ++si;
            while (sj < b.size() && b[sj] == '0') ++sj;
            size_t ei = si, ej = sj;
            while (ei < a.size() && std::isdigit(static_cast<unsigned char>(a[ei]))) ++ei;
            while (ej < b.size() && std::isdigit(static_cast<unsigned char>(b[ej]))) ++ej;

            if (ei - si != ej - sj) return (ei - si) < (ej - sj);
            int cmp = a.compare(si, ei - si, b, sj, ej - sj);
            if (cmp != 0) return cmp < 0;
            i = ei;
            j = ej;
            continue;
        }

        int la = std::tolower(ca);
        int lb = std::tolower(cb);
        if (la != lb) return la < lb;
        ++i;
        ++j;
    }
    if ((a.size() - i) != (b.size() - j)) {
        return (a.size() - i) < (b.size() - j);
    }
    // Case-insensitively equal: fall back to byte order for a strict ordering
    return a < b;
}

std::string resolve_drop_path(const QList<QUrl>& urls) {
    for (const QUrl& url : urls) {
        if (!url.isLocalFile()) continue;
        std::string path = to_native_path(url.toLocalFile());
        std::error_code ec;
        if (fs::is_directory(path, ec) || fs::is_regular_file(path, ec)) {
            return path;
        }
    }
    return std::string();
}

} // namespace ahoview
