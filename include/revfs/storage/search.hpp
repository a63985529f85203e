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
 * @file search.hpp
 * @brief Filename and bounded content search over a workspace subtree.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace revfs::storage {

/// @brief Default content-scan ceiling in bytes.
inline constexpr std::uint64_t kDefaultSearchMaxFileBytes = 1000000;

enum class MatchKind { Name, Content };

/**
 * @struct SearchHit
 * @brief One matching file.
 */
struct SearchHit {
    std::string path; ///< Relative to the workspace root, `/`-separated.
    MatchKind matched = MatchKind::Name;
};

/**
 * @brief Walks a subtree and reports files matching `query`.
 *
 * The query and candidate text are ASCII case-folded. A file whose name
 * contains the query yields a `Name` hit and is not content-scanned.
 * Otherwise, files up to `max_content_bytes` that hold valid UTF-8 are scanned
 * and yield a `Content` hit on a match. Oversized, unreadable and binary files
 * are skipped without error. Directories are never reported.
 *
 * This is a blocking, potentially long traversal; it must run on a worker.
 *
 * @param workspace_root Physical root that hit paths are made relative to.
 * @param subtree Client path of the directory (or single file) to search.
 * @param query Raw query text.
 * @param max_content_bytes Content-scan ceiling.
 * @param confine_symlinks Skip symlinked files that resolve outside
 * `workspace_root`.
 * @return Hits sorted by path.
 *
 * @throws StorageError `BadRequest` if `query` is empty, `PathEscape` if
 * `subtree` fails sandboxing, `NotFound` if it does not exist.
 */
std::vector<SearchHit> search(const std::filesystem::path& workspace_root,
                              const std::string& subtree, const std::string& query,
                              std::uint64_t max_content_bytes = kDefaultSearchMaxFileBytes,
                              bool confine_symlinks = false);

/// @brief `"name"` or `"content"`.
const char* to_string(MatchKind kind);

/**
 * @brief Serializes hits as `[{"path": ..., "matched": ...}, ...]`.
 * @warning The caller owns the returned `cJSON*`.
 */
cJSON* to_json(const std::vector<SearchHit>& hits);

} // namespace revfs::storage
