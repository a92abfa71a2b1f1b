/*
 * picture_archive.h - Ordered set of pictures from a directory, with a cursor
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
#include <vector>
#include <QList>
#include <QSize>
#include <QUrl>
#include "ahoview/common.h"
#include "ahoview/picture.h"

namespace ahoview {

// A directory of images (or a single image file) plus a navigation cursor.
// All offsets wrap around in both directions.
//
// Picture pointers returned by ptr()/mv()/begin()/end()/current_pic() stay
// valid until erase_current() or destruction.
class PictureArchive {
public:
    explicit PictureArchive(const std::string& path = std::string());

    PictureArchive(const PictureArchive&) = delete;
    PictureArchive& operator=(const PictureArchive&) = delete;
    PictureArchive(PictureArchive&&) = default;
    PictureArchive& operator=(PictureArchive&&) = default;

    // Index `offset` steps away from the cursor; 0 when empty
    size_t offset_idx(int offset) const;

    // True if at least one picture decodes. Moves the cursor to the first
    // such picture on the first call.
    bool showable();

    bool load(int offset);
    bool scale(int offset, const QSize& size, RescaleMode mode);

    // Picture at offset without moving the cursor
    Picture* ptr(int offset = 0);
    const Picture* ptr(int offset = 0) const;

    // Move the cursor
    Picture* mv(int offset = 0);
    Picture* begin();
    Picture* end();

    Picture* current_pic();

    // Drop the picture under the cursor (after its file was deleted).
    // The cursor stays on the same slot, clamped to the new size.
    bool erase_current();

    // Keep pictures within `radius` steps of the cursor decoded and unload
    // the rest
    void update_residency(int radius);

    const std::string& name() const { return name_; }
    size_t size() const { return pictures_.size(); }
    bool empty() const { return pictures_.empty(); }
    size_t index() const { return index_; }
    bool is_checked() const { return is_checked_; }

private:
    void scan_directory(const std::string& dir);

    std::string name_;
    bool is_checked_ = false;
    bool is_showable_ = false;
    std::vector<Picture> pictures_;
    size_t index_ = 0;
};

// True if the extension (case-insensitive) is a recognised image type
bool has_image_extension(const std::string& file_name);

// Case-insensitive ordering where digit runs compare by value
bool natural_less(const std::string& a, const std::string& b);

// First local URL naming an existing directory or regular file; empty if none
std::string resolve_drop_path(const QList<QUrl>& urls);

} // namespace ahoview
