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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for the revfs service.
 *
 * @details
 * Declares the `Logger` class, the single reporting channel used by the
 * storage, archive and network subsystems. Output is serialized across worker
 * threads so that entries produced by concurrent requests never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace revfs::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 *
 * Ordered from least to most severe; the numeric order is used for threshold
 * filtering.
 */
enum class LogLevel {
    TRACE, ///< Per-entry details (individual files extracted, walked, copied).
    DEBUG, ///< Per-request diagnostics.
    INFO,  ///< Lifecycle events (startup, revision creation, shutdown).
    WARN,  ///< Client-side anomalies and tolerated filesystem problems.
    ERROR, ///< Internal errors reported to a caller as a generic failure.
    FATAL  ///< Failures that terminate the process.
};

/**
 * @class Logger
 * @brief Static, process-wide console logger.
 *
 * @details
 * Every entry is written as `[timestamp] [TAG] message`. Entries below the
 * configured minimum level are discarded before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * `TRACE`, `DEBUG` and `INFO` go to `std::cout`; `WARN` and above go to
     * `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * revfs::infra::Logger::log(LogLevel::INFO, "Storage: Revision 4 created.");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that is actually emitted.
     * @param level Entries strictly below this level are dropped.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the currently configured minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a textual level name (case-insensitive).
     *
     * Accepts `trace`, `debug`, `info`, `warn`/`warning`, `error` and `fatal`.
     *
     * @throws std::invalid_argument If the name is not a known level.
     */
    static LogLevel parse_level(const std::string& name);

  private:
    /// @brief Guards `std::cout`/`std::cerr` against interleaved writes.
    static std::mutex mutex_;

    /// @brief Minimum emitted level; read without the lock on the hot path.
    static std::atomic<LogLevel> threshold_;
};

} // namespace revfs::infra
