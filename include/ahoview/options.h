/*
 * options.h - Command line parsing for the viewer executable
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
#include <ostream>
#include "ahoview/common.h"
#include "ahoview/log.h"

namespace ahoview {

// Requests that are answered without a display
enum class InfoRequest {
    NONE,
    HELP,
    VERSION
};

// Scan argv for -h/--help and -V/--version. Needs no QApplication, so it is
// run before one exists. Stops at "--".
InfoRequest find_info_request(int argc, char** argv);

struct CommandLine {
    std::optional<RescaleMode> rescale_mode;
    std::optional<int> preload_radius;
    std::optional<LogLevel> log_level;
    InfoRequest info = InfoRequest::NONE;
    std::string path;           // Native encoding, empty if none given
    std::string error;          // Set when parsing failed
};

// Full getopt_long parse. Call after QApplication removed its own options.
// Returns false and fills `error` on invalid input.
bool parse_command_line(int argc, char** argv, CommandLine& out);

void print_usage(std::ostream& os, const char* program);

} // namespace ahoview
