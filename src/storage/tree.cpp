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
 * @file tree.cpp
 * @brief Implementation of the tree enumerator.
 */

#include "revfs/storage/tree.hpp"

#include "revfs/infra/logger.hpp"
#include "revfs/infra/string.hpp"
#include "revfs/storage/error.hpp"
#include "revfs/storage/sandbox.hpp"

#include <algorithm>
#include <sys/stat.h>
#include <system_error>

namespace fs = std::filesystem;

namespace revfs::storage {

namespace {

/// Ordering key: directories first, then case-folded name, then raw name as tie-break.
bool node_less(const Node& a, const Node& b)
{
    if (a.is_directory != b.is_directory) {
        return a.is_directory;
    }
    const std::string la = infra::String::to_lower(a.name);
    const std::string lb = infra::String::to_lower(b.name);
    if (la != lb) {
        return la < lb;
    }
    return a.name < b.name;
}

} // namespace

std::vector<Node> build_tree(const fs::path& dir, const std::string& rel,
                             const std::optional<fs::path>& confine_root)
{
    std::vector<Node> out;

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Storage: Cannot list " + dir.string() + ": " + ec.message());
        return out;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        const fs::path entry_path = it->path();

        // stat() follows symlinks; a dangling link or a vanished entry is skipped.
        struct stat st {};
        if (::stat(entry_path.c_str(), &st) != 0) {
            continue;
        }

        std::error_code link_ec;
        const bool is_link = it->is_symlink(link_ec);
        if (is_link && confine_root) {
            try {
                Sandbox::confine(*confine_root, entry_path);
            } catch (const StorageError& e) {
                infra::Logger::log(infra::LogLevel::WARN,
                                   std::string("Storage: Listing skipped link: ") + e.what());
                continue;
            }
        }

        Node node;
        node.name = entry_path.filename().string();
        node.path = rel.empty() ? node.name : rel + "/" + node.name;
        node.is_directory = S_ISDIR(st.st_mode);
        node.modified = static_cast<std::int64_t>(st.st_mtime);
        if (node.is_directory) {
            // Linked directories are listed but not descended, so link cycles terminate.
            if (!is_link) {
                node.children = build_tree(entry_path, node.path, confine_root);
            }
        } else {
            node.size = static_cast<std::uint64_t>(st.st_size);
        }
        out.push_back(std::move(node));
    }

    std::sort(out.begin(), out.end(), node_less);
    return out;
}

cJSON* to_json(const std::vector<Node>& nodes)
{
    cJSON* arr = cJSON_CreateArray();
    for (const Node& node : nodes) {
        cJSON* obj = cJSON_CreateObject();
        cJSON_AddStringToObject(obj, "name", node.name.c_str());
        cJSON_AddStringToObject(obj, "path", node.path.c_str());
        cJSON_AddBoolToObject(obj, "isDirectory", node.is_directory);
        cJSON_AddNumberToObject(obj, "modified", static_cast<double>(node.modified));
        if (node.size) {
            cJSON_AddNumberToObject(obj, "size", static_cast<double>(*node.size));
        } else {
            cJSON_AddNullToObject(obj, "size");
        }
        if (node.is_directory) {
            // Ownership of the child array transfers to `obj`.
            cJSON_AddItemToObject(obj, "children", to_json(node.children));
        }
        cJSON_AddItemToArray(arr, obj);
    }
    return arr;
}

} // namespace revfs::storage
