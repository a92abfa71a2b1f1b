/*
 * src/log.cpp - Leveled logging
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "ahoview/log.h"
#include <QDateTime>
#include <iostream>

namespace ahoview {

namespace {

void stderr_sink(LogLevel, LogChannel, const std::string& line) {
    std::cerr << line << std::endl;
}

} // namespace

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::QUIET: return "quiet";
        case LogLevel::NORMAL: return "normal";
        case LogLevel::VERBOSE: return "verbose";
        case LogLevel::DEBUG: return "debug";
        default: return "unknown";
    }
}

std::optional<LogLevel> log_level_from_string(const std::string& str) {
    if (str == "quiet") return LogLevel::QUIET;
    if (str == "normal") return LogLevel::NORMAL;
    if (str == "verbose") return LogLevel::VERBOSE;
    if (str == "debug") return LogLevel::DEBUG;
    return std::nullopt;
}

const char* log_channel_to_string(LogChannel channel) {
    switch (channel) {
        case LogChannel::SYSTEM: return "SYSTEM";
        case LogChannel::LOADER: return "LOADER";
        case LogChannel::VIEW: return "VIEW";
        default: return "UNKNOWN";
    }
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() : sink_(stderr_sink) {
    channels_.fill(true);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::set_channel_enabled(LogChannel channel, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    channels_[static_cast<size_t>(channel)] = enabled;
}

bool Logger::channel_enabled(LogChannel channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return channels_[static_cast<size_t>(channel)];
}

void Logger::set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : LogSink(stderr_sink);
}

bool Logger::should_log(LogLevel level, LogChannel channel) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!channels_[static_cast<size_t>(channel)]) return false;
    return static_cast<int>(level) <= static_cast<int>(level_);
}

void Logger::log(LogLevel level, LogChannel channel, const std::string& message) {
    if (!should_log(level, channel)) return;

    std::string line = QDateTime::currentDateTime().toString("[HH:mm:ss] ").toStdString();
    line += "[";
    line += log_channel_to_string(channel);
    line += "] ";
    line += message;

    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sink = sink_;
    }
    sink(level, channel, line);
}

} // namespace ahoview
