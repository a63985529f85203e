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
 * @file search.cpp
 * @brief Implementation of the name/content search walk.
 */

#include "revfs/storage/search.hpp"

#include "revfs/infra/logger.hpp"
#include "revfs/infra/string.hpp"
#include "revfs/storage/error.hpp"
#include "revfs/storage/sandbox.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace revfs::storage {

namespace {

/// Reads the whole file, or returns false if it cannot be read in full.
bool slurp(const fs::path& path, std::uint64_t size, std::string& out)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    out.resize(static_cast<size_t>(size));
    if (size > 0) {
        file.read(&out[0], static_cast<std::streamsize>(size));
        if (file.gcount() != static_cast<std::streamsize>(size)) {
            return false;
        }
    }
    return true;
}

void inspect_file(const fs::path& workspace_root, const fs::path& file, const std::string& needle,
                  std::uint64_t max_content_bytes, std::vector<SearchHit>& out)
{
    const std::string rel = file.lexically_relative(workspace_root).generic_string();

    if (infra::String::contains(infra::String::to_lower(file.filename().string()), needle)) {
        out.push_back({rel, MatchKind::Name});
        return;
    }

    std::error_code ec;
    const std::uint64_t size = fs::file_size(file, ec);
    if (ec || size > max_content_bytes) {
        return;
    }

    std::string content;
    if (!slurp(file, size, content) || !infra::String::is_valid_utf8(content)) {
        return;
    }
    if (infra::String::contains(infra::String::to_lower(content), needle)) {
        out.push_back({rel, MatchKind::Content});
    }
}

} // namespace

std::vector<SearchHit> search(const fs::path& workspace_root, const std::string& subtree,
                              const std::string& query, std::uint64_t max_content_bytes,
                              bool confine_symlinks)
{
    if (query.empty()) {
        throw StorageError(ErrorKind::BadRequest, "search query must not be empty");
    }
    const std::string needle = infra::String::to_lower(query);
    const fs::path start = Sandbox::resolve(workspace_root, subtree);

    std::error_code ec;
    const fs::file_status status = fs::status(start, ec);
    if (ec || !fs::exists(status)) {
        throw StorageError(ErrorKind::NotFound, "search root does not exist: " + subtree);
    }

    std::vector<SearchHit> hits;

    if (fs::is_regular_file(status)) {
        inspect_file(workspace_root, start, needle, max_content_bytes, hits);
        return hits;
    }

    fs::recursive_directory_iterator it(start, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw StorageError(ErrorKind::Internal,
                           "cannot walk " + start.string() + ": " + ec.message());
    }

    size_t visited = 0;
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            // The entry vanished or became unreadable mid-walk; keep what we have.
            infra::Logger::log(infra::LogLevel::WARN,
                               "Storage: Search walk interrupted under " + start.string() + ": " +
                                   ec.message());
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec) || type_ec) {
            continue;
        }
        if (confine_symlinks && it->is_symlink(type_ec)) {
            try {
                Sandbox::confine(workspace_root, it->path());
            } catch (const StorageError& e) {
                infra::Logger::log(infra::LogLevel::WARN,
                                   std::string("Storage: Search skipped link: ") + e.what());
                continue;
            }
        }
        ++visited;
        inspect_file(workspace_root, it->path(), needle, max_content_bytes, hits);
    }

    std::sort(hits.begin(), hits.end(),
              [](const SearchHit& a, const SearchHit& b) { return a.path < b.path; });

    infra::Logger::log(infra::LogLevel::DEBUG, "Storage: Search visited " +
                                                   std::to_string(visited) + " files, " +
                                                   std::to_string(hits.size()) + " hits.");
    return hits;
}

const char* to_string(MatchKind kind)
{
    return kind == MatchKind::Name ? "name" : "content";
}

cJSON* to_json(const std::vector<SearchHit>& hits)
{
    cJSON* arr = cJSON_CreateArray();
    for (const SearchHit& hit : hits) {
        cJSON* obj = cJSON_CreateObject();
        cJSON_AddStringToObject(obj, "path", hit.path.c_str());
        cJSON_AddStringToObject(obj, "matched", to_string(hit.matched));
        cJSON_AddItemToArray(arr, obj);
    }
    return arr;
}

} // namespace revfs::storage
