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
 * @file tree.hpp
 * @brief Recursive directory listing projected into transport-ready nodes.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace revfs::storage {

/**
 * @struct Node
 * @brief One filesystem entry as shown to the editor's file tree.
 */
struct Node {
    std::string name;
    std::string path;                ///< Relative to the workspace root, `/`-separated.
    bool is_directory = false;
    std::int64_t modified = 0;       ///< Seconds since the Unix epoch.
    std::optional<std::uint64_t> size; ///< Empty for directories.
    std::vector<Node> children;      ///< Populated for directories only.
};

/**
 * @brief Lists `dir` recursively.
 *
 * Every level is sorted directories first, then by ASCII case-insensitive
 * name. Entries whose metadata cannot be read (permission errors, entries
 * removed mid-walk, dangling symlinks) are skipped. If `dir` itself cannot be
 * opened the result is empty. Symbolic links report their target's metadata;
 * a linked directory is listed without children.
 *
 * @param dir Physical directory to enumerate.
 * @param rel Logical path of `dir`; prefixed onto every child path.
 * @param confine_root When set, links resolving outside this directory are
 * skipped.
 */
std::vector<Node> build_tree(const std::filesystem::path& dir, const std::string& rel,
                             const std::optional<std::filesystem::path>& confine_root = std::nullopt);

/**
 * @brief Serializes a node list as a JSON array.
 *
 * Keys: `name`, `path`, `isDirectory`, `modified`, `size` (null for
 * directories) and `children` (directories only).
 *
 * @warning The caller owns the returned `cJSON*` and must `cJSON_Delete` it.
 */
cJSON* to_json(const std::vector<Node>& nodes);

} // namespace revfs::storage
