/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Formats each entry as a local timestamp, a colored severity tag and the
 * message. A process-wide threshold, set once from configuration, filters
 * entries before any lock is taken.
 */

#include "revfs/infra/logger.hpp"

#include "revfs/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace revfs::infra {

// Serializes writers; also guards std::localtime's shared buffer.
std::mutex Logger::mutex_;

// INFO until configuration says otherwise.
std::atomic<LogLevel> Logger::threshold_{LogLevel::INFO};

void Logger::set_level(LogLevel level)
{
    threshold_.store(level);
}

LogLevel Logger::level()
{
    return threshold_.load();
}

/**
 * @brief Maps a configuration spelling to a level.
 *
 * Case and surrounding whitespace are ignored; `warning` is accepted as an
 * alias of `warn`.
 */
LogLevel Logger::parse_level(const std::string& name)
{
    const std::string lowered = String::to_lower(String::trim(name));
    if (lowered == "trace")
        return LogLevel::TRACE;
    if (lowered == "debug")
        return LogLevel::DEBUG;
    if (lowered == "info")
        return LogLevel::INFO;
    if (lowered == "warn" || lowered == "warning")
        return LogLevel::WARN;
    if (lowered == "error")
        return LogLevel::ERROR;
    if (lowered == "fatal")
        return LogLevel::FATAL;
    throw std::invalid_argument("unknown log level: " + name);
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * 1. **Filtering**: Drops entries below the configured threshold.
 * 2. **Synchronization**: Acquires a `lock_guard` to prevent interleaved output.
 * 3. **Stream Segregation**: Routes messages to `stdout` or `stderr` based on severity.
 * 4. **Stylization**: Injects ANSI escape sequences for visual categorization.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    // Cheap early exit for suppressed levels; no lock needed.
    if (level < threshold_.load()) {
        return;
    }

    // One writer at a time so lines never interleave.
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    // WARN and above go to the unbuffered error stream.
    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Timestamp: [YYYY-MM-DD HH:MM:SS], local time.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    // Severity tag and ANSI color.
    switch (level) {
    case LogLevel::TRACE:
        // Gray: step-by-step detail such as per-entry archive extraction.
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        // Cyan: per-request and per-operation diagnostics.
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        // Green: lifecycle events and new revisions.
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        // Yellow: rejected input and recovered anomalies.
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        // Red: a request failed on the server side.
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        // Bold red: the process cannot continue.
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    // Message, color reset, flush.
    stream << message << "\033[0m" << std::endl;
}

} // namespace revfs::infra
