/*
 * picture.h - A single image file with lazy decoding and a residency score
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
#include <QImage>
#include <QSize>
#include "ahoview/common.h"

namespace ahoview {

class Picture {
public:
    explicit Picture(const std::string& file_name = std::string());

    // Movable, not copyable (pixel data is owned)
    Picture(const Picture&) = delete;
    Picture& operator=(const Picture&) = delete;
    Picture(Picture&&) = default;
    Picture& operator=(Picture&&) = default;

    // Loads on first call; afterwards returns the cached verdict
    bool showable();

    // Decode from disk. A failed check is remembered and not retried.
    bool load();

    // Drop decoded pixel data. Always succeeds.
    bool unload();

    // Residency score: <= 0 unloads (and clamps to 0), >= 1 loads
    double score_add(double n);
    double score_set(double n);

    // Remove the file from disk
    bool delete_file();

    // Prepare scaled() for a viewport of the given size.
    // Returns true only if scaled() changed. A different mode than the one
    // that produced scaled() always rescales.
    bool scale_image(const QSize& size, RescaleMode mode);

    const std::string& name() const { return name_; }
    double score() const { return score_; }
    bool is_checked() const { return is_checked_; }
    bool is_showable() const { return is_showable_; }
    bool is_loaded() const { return is_loaded_; }
    const QImage& original() const { return original_; }
    const QImage& scaled() const { return scaled_; }
    RescaleMode scaled_mode() const { return scaled_mode_; }
    const std::string& last_error() const { return last_error_; }

private:
    std::string name_;
    double score_ = 0.0;
    bool is_checked_ = false;
    bool is_showable_ = false;
    bool is_loaded_ = false;
    QImage original_;
    QImage scaled_;
    RescaleMode scaled_mode_ = RescaleMode::FIT;
    std::string last_error_;
};

} // namespace ahoview
