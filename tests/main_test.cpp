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
 * @file main_test.cpp
 * @brief Central orchestrator for the revfs test suite.
 *
 * @details
 * Aggregates unit and integration tests across all subsystems:
 * infrastructure, storage, archive and network.
 */

#include "framework.hpp"
#include "revfs/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, revision_test.cpp, etc.).

// Infrastructure Subsystem (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_to_lower_ascii_only();
void test_string_utf8_validation();
void test_string_url_decode();
void test_string_split_keeps_empty_fields();
void test_string_parse_u64();
void test_base64_known_vectors();
void test_base64_rejects_malformed();
void test_log_level_parsing();
void test_config_layering();
void test_config_rejects_bad_values();
void test_scheduler_submit();
void test_scheduler_drains_on_shutdown();

// Path Sandbox (sandbox_test.cpp)
void test_sandbox_resolves_normal_paths();
void test_sandbox_empty_and_dot_are_root();
void test_sandbox_rejects_escapes();
void test_sandbox_is_within();
void test_sandbox_confine_detects_symlink_escape();
void test_error_kind_names();

// Tree Enumerator (tree_test.cpp)
void test_tree_ordering();
void test_tree_nested_paths();
void test_tree_missing_dir_is_empty();
void test_tree_json_shape();
void test_tree_skips_dangling_link();
void test_tree_confines_links();

// Search Engine (search_test.cpp)
void test_search_name_and_content();
void test_search_name_wins_over_content();
void test_search_subtree_paths_stay_workspace_relative();
void test_search_skips_oversized_and_binary();
void test_search_errors();

// Revision Store (revision_test.cpp)
void test_revision_bootstrap_fresh_root();
void test_revision_head_persists_across_reopen();
void test_revision_read_head_is_tolerant();
void test_revision_list_is_dense();
void test_revision_snapshot_copies_tree();
void test_revision_bump_handles_leftover_dirs();
void test_revision_bootstrap_reconciles_corrupt_head();
void test_revision_failed_populate_keeps_allocation();
void test_revision_concurrent_snapshots();

// Workspace Operations (workspace_test.cpp)
void test_workspace_write_read_roundtrip();
void test_workspace_read_errors();
void test_workspace_mkdir_is_idempotent();
void test_workspace_remove();
void test_workspace_rename_creates_parents();
void test_workspace_list_and_search();
void test_workspace_follows_head();
void test_workspace_symlink_escape_is_blocked();

// Archive Pipeline (archive_test.cpp)
void test_zip_reader_stored_and_deflated();
void test_zip_reader_rejects_garbage();
void test_zip_reader_crc_mismatch();
void test_zip_reader_enforces_limit();
void test_archive_import_and_export();
void test_archive_open_file_not_found_cases();
void test_archive_rejects_zip_slip();
void test_archive_rejects_bad_payloads();
void test_archive_enforces_bounds();

// HTTP Codec (http_test.cpp)
void test_http_parse_get_with_query();
void test_http_parse_incremental_body();
void test_http_parse_rejections();
void test_http_serialize_head();
void test_server_idle_timeout_unblocks_recv();

// Route Dispatcher (handler_test.cpp)
void test_handle_health();
void test_handle_unknown_route_and_method();
void test_handle_file_lifecycle();
void test_handle_bad_bodies();
void test_handle_path_escape_mapping();
void test_handle_search();
void test_handle_revisions();
void test_handle_revision_file();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating revfs Test Suite...\033[0m" << std::endl;

    // Expected failures are exercised deliberately; keep their log lines out of the report.
    revfs::infra::Logger::set_level(revfs::infra::LogLevel::FATAL);

    // --- 1. Infrastructure Subsystem ---
    // Foundational blocks: strings, base64, config, logging, worker pool.
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_to_lower_ascii_only);
    RUN_TEST(test_string_utf8_validation);
    RUN_TEST(test_string_url_decode);
    RUN_TEST(test_string_split_keeps_empty_fields);
    RUN_TEST(test_string_parse_u64);
    RUN_TEST(test_base64_known_vectors);
    RUN_TEST(test_base64_rejects_malformed);
    RUN_TEST(test_log_level_parsing);
    RUN_TEST(test_config_layering);
    RUN_TEST(test_config_rejects_bad_values);
    RUN_TEST(test_scheduler_submit);
    RUN_TEST(test_scheduler_drains_on_shutdown);

    // --- 2. Path Sandbox ---
    // Client path resolution and symlink confinement.
    RUN_TEST(test_sandbox_resolves_normal_paths);
    RUN_TEST(test_sandbox_empty_and_dot_are_root);
    RUN_TEST(test_sandbox_rejects_escapes);
    RUN_TEST(test_sandbox_is_within);
    RUN_TEST(test_sandbox_confine_detects_symlink_escape);
    RUN_TEST(test_error_kind_names);

    // --- 3. Tree Enumerator ---
    // Ordering, nesting and the JSON node shape.
    RUN_TEST(test_tree_ordering);
    RUN_TEST(test_tree_nested_paths);
    RUN_TEST(test_tree_missing_dir_is_empty);
    RUN_TEST(test_tree_json_shape);
    RUN_TEST(test_tree_skips_dangling_link);
    RUN_TEST(test_tree_confines_links);

    // --- 4. Search Engine ---
    // Name/content matching and the skip rules.
    RUN_TEST(test_search_name_and_content);
    RUN_TEST(test_search_name_wins_over_content);
    RUN_TEST(test_search_subtree_paths_stay_workspace_relative);
    RUN_TEST(test_search_skips_oversized_and_binary);
    RUN_TEST(test_search_errors);

    // --- 5. Revision Store ---
    // HEAD durability, allocation, snapshots and concurrency.
    RUN_TEST(test_revision_bootstrap_fresh_root);
    RUN_TEST(test_revision_head_persists_across_reopen);
    RUN_TEST(test_revision_read_head_is_tolerant);
    RUN_TEST(test_revision_list_is_dense);
    RUN_TEST(test_revision_snapshot_copies_tree);
    RUN_TEST(test_revision_bump_handles_leftover_dirs);
    RUN_TEST(test_revision_bootstrap_reconciles_corrupt_head);
    RUN_TEST(test_revision_failed_populate_keeps_allocation);
    RUN_TEST(test_revision_concurrent_snapshots);

    // --- 6. Workspace Operations ---
    // File operations on the HEAD working copy.
    RUN_TEST(test_workspace_write_read_roundtrip);
    RUN_TEST(test_workspace_read_errors);
    RUN_TEST(test_workspace_mkdir_is_idempotent);
    RUN_TEST(test_workspace_remove);
    RUN_TEST(test_workspace_rename_creates_parents);
    RUN_TEST(test_workspace_list_and_search);
    RUN_TEST(test_workspace_follows_head);
    RUN_TEST(test_workspace_symlink_escape_is_blocked);

    // --- 7. Archive Pipeline ---
    // ZIP parsing, import bounds and historical export.
    RUN_TEST(test_zip_reader_stored_and_deflated);
    RUN_TEST(test_zip_reader_rejects_garbage);
    RUN_TEST(test_zip_reader_crc_mismatch);
    RUN_TEST(test_zip_reader_enforces_limit);
    RUN_TEST(test_archive_import_and_export);
    RUN_TEST(test_archive_open_file_not_found_cases);
    RUN_TEST(test_archive_rejects_zip_slip);
    RUN_TEST(test_archive_rejects_bad_payloads);
    RUN_TEST(test_archive_enforces_bounds);

    // --- 8. HTTP Codec ---
    // Request parsing and response framing.
    RUN_TEST(test_http_parse_get_with_query);
    RUN_TEST(test_http_parse_incremental_body);
    RUN_TEST(test_http_parse_rejections);
    RUN_TEST(test_http_serialize_head);
    RUN_TEST(test_server_idle_timeout_unblocks_recv);

    // --- 9. Route Dispatcher ---
    // Routing and error-to-status mapping.
    RUN_TEST(test_handle_health);
    RUN_TEST(test_handle_unknown_route_and_method);
    RUN_TEST(test_handle_file_lifecycle);
    RUN_TEST(test_handle_bad_bodies);
    RUN_TEST(test_handle_path_escape_mapping);
    RUN_TEST(test_handle_search);
    RUN_TEST(test_handle_revisions);
    RUN_TEST(test_handle_revision_file);

    // Render the final results summary to stdout.
    revfs::test::print_summary();

    return (revfs::test::failed_count == 0) ? 0 : 1;
}
