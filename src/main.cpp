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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * This file contains the `main` function which orchestrates the startup sequence:
 * 1. Configuration layering (defaults, file, environment, arguments).
 * 2. Signal Handling Registration (SIGINT/SIGTERM).
 * 3. Subsystem Initialization (Revision store, workspace, archive pipeline).
 * 4. Main Event Loop Execution.
 */

#include "revfs/archive/pipeline.hpp"
#include "revfs/infra/config.hpp"
#include "revfs/infra/logger.hpp"
#include "revfs/network/server.hpp"
#include "revfs/storage/revision_store.hpp"
#include "revfs/storage/workspace.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

/// @brief Global pointer to the active server instance (Used by the signal handler).
static revfs::network::Server* g_server = nullptr;

/**
 * @brief System Signal Handler.
 *
 * Catches SIGINT/SIGTERM to perform a graceful shutdown instead of an abrupt
 * process termination.
 */
void signal_handler(int signum)
{
    revfs::infra::Logger::log(revfs::infra::LogLevel::WARN,
                              "System: Interrupt received (Signal " + std::to_string(signum) +
                                  "). Initiating graceful shutdown...");

    if (g_server) {
        g_server->stop();
    }
}

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [--config FILE] [STORAGE_ROOT] [PORT]\n"
              << "Options:\n"
              << "  STORAGE_ROOT   Directory holding HEAD and revisions (Default: ./decisions)\n"
              << "  PORT           TCP port to listen on (Default: 3000)\n"
              << "  --config FILE  JSON configuration file\n"
              << "  --help         Show this help message\n"
              << "Environment:\n"
              << "  REVFS_STORAGE_ROOT, REVFS_HOST, REVFS_PORT, REVFS_WORKERS, REVFS_LOG_LEVEL\n";
}

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        const revfs::infra::Config config = revfs::infra::Config::from_command_line(argc, argv);
        revfs::infra::Logger::set_level(config.log_level);

        revfs::infra::Logger::log(revfs::infra::LogLevel::INFO, "System: Booting revfs...");
        revfs::infra::Logger::log(revfs::infra::LogLevel::INFO,
                                  "Config: Storage root set to '" + config.storage_root + "'");

        // Storage subsystem: creates the root, revision 0 and HEAD as needed.
        revfs::storage::RevisionStore store(config.storage_root);
        store.bootstrap();

        revfs::storage::WorkspaceOptions workspace_options;
        workspace_options.search_max_file_bytes = config.search_max_file_bytes;
        workspace_options.confine_symlinks = config.confine_symlinks;
        revfs::storage::Workspace workspace(store, workspace_options);

        revfs::archive::ArchiveLimits limits;
        limits.max_entries = config.max_archive_entries;
        limits.max_total_bytes = config.max_archive_bytes;
        revfs::archive::ArchivePipeline archive(store, limits, config.confine_symlinks);

        revfs::network::ServerOptions server_options;
        server_options.host = config.host;
        server_options.port = config.port;
        server_options.workers = config.effective_workers();
        server_options.max_request_bytes = config.max_request_bytes;
        server_options.idle_timeout_secs = config.idle_timeout_secs;

        revfs::network::Server server({store, workspace, archive}, server_options);
        g_server = &server;

        // Blocks until stop() is called via the signal handler.
        server.run();
        g_server = nullptr;

    } catch (const std::exception& e) {
        g_server = nullptr;
        revfs::infra::Logger::log(revfs::infra::LogLevel::FATAL,
                                  "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    revfs::infra::Logger::log(revfs::infra::LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
