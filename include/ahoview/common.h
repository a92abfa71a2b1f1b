/*
 * common.h - Shared enums, constants and helpers for the image viewer
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
#include <optional>
#include <array>

namespace ahoview {

// How a picture is fitted into the viewport.
// Numeric values are persisted in the settings file, do not reorder.
enum class RescaleMode {
    FIT = 0,         // Keep aspect ratio, fit inside the viewport
    ORIGINAL = 1,    // 1:1 pixels
    STRETCH = 2,     // Fill the viewport, ignore aspect ratio
    FIT_HEIGHT = 3,  // Match viewport height, keep aspect ratio
    FIT_WIDTH = 4    // Match viewport width, keep aspect ratio
};

constexpr int MIN_RESCALE_MODE = 0;
constexpr int MAX_RESCALE_MODE = 4;

// Recognised image extensions (lower case, with leading dot)
constexpr std::array<const char*, 4> IMAGE_EXTENSIONS = {".jpg", ".jpeg", ".png", ".bmp"};

// Residency window around the cursor
constexpr int DEFAULT_PRELOAD_RADIUS = 1;
constexpr int MAX_PRELOAD_RADIUS = 16;

// Picture score thresholds
constexpr double SCORE_UNLOAD = 0.0;
constexpr double SCORE_LOAD = 1.0;

constexpr const char* APP_NAME = "AhoView";
constexpr const char* APP_VERSION = "1.0.0";

inline const char* rescale_mode_to_string(RescaleMode mode) {
    switch (mode) {
        case RescaleMode::FIT: return "fit";
        case RescaleMode::ORIGINAL: return "original";
        case RescaleMode::STRETCH: return "stretch";
        case RescaleMode::FIT_HEIGHT: return "height";
        case RescaleMode::FIT_WIDTH: return "width";
        default: return "unknown";
    }
}

inline std::optional<RescaleMode> rescale_mode_from_string(const std::string& str) {
    if (str == "fit") return RescaleMode::FIT;
    if (str == "original") return RescaleMode::ORIGINAL;
    if (str == "stretch") return RescaleMode::STRETCH;
    if (str == "height") return RescaleMode::FIT_HEIGHT;
    if (str == "width") return RescaleMode::FIT_WIDTH;
    return std::nullopt;
}

inline std::optional<RescaleMode> rescale_mode_from_int(int value) {
    if (value < MIN_RESCALE_MODE || value > MAX_RESCALE_MODE) {
        return std::nullopt;
    }
    return static_cast<RescaleMode>(value);
}

} // namespace ahoview
