/*
 * log.h - Leveled, channelled logging with a pluggable sink
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
#include <functional>
#include <optional>
#include <mutex>
#include <array>

namespace ahoview {

// Log verbosity levels
enum class LogLevel {
    QUIET,    // Errors only
    NORMAL,   // + Opened folders, decode failures
    VERBOSE,  // + Navigation
    DEBUG     // Everything
};

// Log channels (can be filtered independently)
enum class LogChannel {
    SYSTEM,   // App lifecycle, file operations
    LOADER,   // Directory scans and decoding
    VIEW      // Navigation and scaling
};

constexpr int LOG_CHANNEL_COUNT = 3;

const char* log_level_to_string(LogLevel level);
std::optional<LogLevel> log_level_from_string(const std::string& str);
const char* log_channel_to_string(LogChannel channel);

// Receives fully formatted lines ("[HH:mm:ss] [LOADER] message")
using LogSink = std::function<void(LogLevel level, LogChannel channel, const std::string& line)>;

class Logger {
public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(LogLevel level);
    LogLevel level() const;

    void set_channel_enabled(LogChannel channel, bool enabled);
    bool channel_enabled(LogChannel channel) const;

    // Replace the output sink; an empty sink restores standard error
    void set_sink(LogSink sink);

    bool should_log(LogLevel level, LogChannel channel) const;
    void log(LogLevel level, LogChannel channel, const std::string& message);

private:
    Logger();

    mutable std::mutex mutex_;
    LogLevel level_ = LogLevel::NORMAL;
    std::array<bool, LOG_CHANNEL_COUNT> channels_;
    LogSink sink_;
};

inline void log_quiet(LogChannel channel, const std::string& message) {
    Logger::instance().log(LogLevel::QUIET, channel, message);
}

inline void log_normal(LogChannel channel, const std::string& message) {
    Logger::instance().log(LogLevel::NORMAL, channel, message);
}

inline void log_verbose(LogChannel channel, const std::string& message) {
    Logger::instance().log(LogLevel::VERBOSE, channel, message);
}

inline void log_debug(LogChannel channel, const std::string& message) {
    Logger::instance().log(LogLevel::DEBUG, channel, message);
}

} // namespace ahoview
