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
 * @file config.hpp
 * @brief Runtime configuration for the revfs service.
 *
 * @details
 * Settings are layered, lowest precedence first:
 * 1. Built-in defaults.
 * 2. An optional JSON file (`--config <file>`).
 * 3. Environment variables (`REVFS_STORAGE_ROOT`, `REVFS_HOST`, `REVFS_PORT`,
 *    `REVFS_WORKERS`, `REVFS_LOG_LEVEL`).
 * 4. Positional command line arguments `[STORAGE_ROOT] [PORT]`.
 */

#pragma once

#include "revfs/infra/logger.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace revfs::infra {

/**
 * @struct Config
 * @brief Flat bag of service settings with layered loaders.
 *
 * All `apply_*` members throw `std::invalid_argument` on malformed values and
 * leave already-applied fields untouched on failure of a later field.
 */
struct Config {
    /// @brief Directory holding `HEAD` and the numbered revision directories.
    std::string storage_root = "./decisions";

    /// @brief IPv4 address the listener binds to.
    std::string host = "0.0.0.0";

    int port = 3000;

    /// @brief Worker pool size; 0 means "hardware concurrency".
    size_t workers = 0;

    LogLevel log_level = LogLevel::INFO;

    /// @brief Largest accepted HTTP request body.
    std::uint64_t max_request_bytes = 64ULL * 1024 * 1024;

    /// @brief Seconds an idle keep-alive connection may hold a worker; 0 disables.
    std::uint64_t idle_timeout_secs = 5;

    /// @brief Upper bound on entries per imported archive.
    std::uint64_t max_archive_entries = 10000;

    /// @brief Upper bound on total uncompressed bytes per imported archive.
    std::uint64_t max_archive_bytes = 512ULL * 1024 * 1024;

    /// @brief Files larger than this are never scanned for content matches.
    std::uint64_t search_max_file_bytes = 1000000;

    /// @brief Reject paths whose symlink-resolved location leaves the sandbox.
    bool confine_symlinks = true;

    /// @brief Looks up one environment variable; returns nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Overlays values from a JSON object file.
     *
     * Recognised keys mirror the field names (`storage_root`, `host`, `port`,
     * `workers`, `log_level`, `max_request_bytes`, `idle_timeout_secs`,
     * `max_archive_entries`,
     * `max_archive_bytes`, `search_max_file_bytes`, `confine_symlinks`).
     * Unknown keys are ignored with a warning.
     *
     * @throws std::invalid_argument If the file cannot be read or parsed, or a
     * value has the wrong type.
     */
    void apply_file(const std::string& path);

    /// @brief Overlays `REVFS_*` variables from the process environment.
    void apply_env();

    /// @brief Overlays `REVFS_*` variables obtained through `lookup`.
    void apply_env(const EnvLookup& lookup);

    /**
     * @brief Overlays positional arguments (`[STORAGE_ROOT] [PORT]`).
     *
     * `args` excludes the program name and any `--config <file>` pair.
     */
    void apply_args(const std::vector<std::string>& args);

    /// @brief Worker count after resolving the "0 = auto" default.
    size_t effective_workers() const;

    /**
     * @brief Builds the full layered configuration from `main`'s arguments.
     *
     * @throws std::invalid_argument On any malformed layer.
     */
    static Config from_command_line(int argc, char* argv[]);
};

} // namespace revfs::infra
