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
 * @file revision_store.cpp
 * @brief Implementation of the HEAD pointer and revision directory management.
 *
 * @details
 * Crash consistency relies on ordering: the revision directory is created
 * first and HEAD is replaced last via an atomic rename. A crash between the
 * two leaves an empty orphan directory that HEAD never named; the next bump
 * reuses it. A directory with content is never reclaimed.
 */

#include "revfs/storage/revision_store.hpp"

#include "revfs/infra/logger.hpp"
#include "revfs/infra/string.hpp"
#include "revfs/storage/error.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace revfs::storage {

namespace {

/// Highest numeric directory under `root` that holds at least one entry.
std::uint64_t highest_populated_revision(const fs::path& root)
{
    std::uint64_t highest = 0;
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code type_ec;
        if (!it->is_directory(type_ec)) {
            continue;
        }
        auto id = infra::String::parse_u64(it->path().filename().string());
        if (!id || *id <= highest) {
            continue;
        }
        if (!fs::is_empty(it->path(), type_ec) && !type_ec) {
            highest = *id;
        }
    }
    return highest;
}

} // namespace

RevisionStore::RevisionStore(fs::path root)
    : root_(std::move(root)), head_path_(root_ / kHeadFile), head_(0)
{
}

/**
 * @brief Bootstraps the storage environment.
 *
 * **Startup Sequence:**
 * 1. Create the storage root and revision `0` (no-op when present).
 * 2. Initialize HEAD to `0` if the marker is missing.
 * 3. Reconcile HEAD with the highest populated revision directory, so a
 *    stale or corrupt marker never points below existing history.
 * 4. Load HEAD into the cache and make sure its directory exists.
 */
void RevisionStore::bootstrap()
{
    std::error_code ec;
    fs::create_directories(revision_dir(0), ec);
    if (ec) {
        throw StorageError(ErrorKind::Internal,
                           "cannot create storage root " + root_.string() + ": " + ec.message());
    }

    if (!fs::exists(head_path_, ec)) {
        write_head(0);
        infra::Logger::log(infra::LogLevel::INFO,
                           "Storage: Initialized HEAD at revision 0 in " + root_.string());
    }

    std::uint64_t head = read_head();
    const std::uint64_t highest = highest_populated_revision(root_);
    if (highest > head) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Storage: HEAD marker says " + std::to_string(head) +
                               " but revision " + std::to_string(highest) +
                               " exists; advancing HEAD.");
        write_head(highest);
        head = highest;
    }

    const fs::path head_dir = revision_dir(head);
    if (!fs::is_directory(head_dir, ec)) {
        infra::Logger::log(infra::LogLevel::WARN, "Storage: HEAD names missing revision " +
                                                      std::to_string(head) +
                                                      "; recreating its directory.");
        fs::create_directories(head_dir, ec);
        if (ec) {
            throw StorageError(ErrorKind::Internal,
                               "cannot create " + head_dir.string() + ": " + ec.message());
        }
    }

    head_.store(head);
    infra::Logger::log(infra::LogLevel::INFO,
                       "Storage: Online at revision " + std::to_string(head) + ".");
}

std::uint64_t RevisionStore::read_head() const
{
    std::ifstream file(head_path_, std::ios::binary);
    if (!file.is_open()) {
        return 0;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    auto value = infra::String::parse_u64(infra::String::trim(buffer.str()));
    return value ? *value : 0;
}

void RevisionStore::write_head(std::uint64_t id) const
{
    fs::path tmp = head_path_;
    tmp += ".tmp";

    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw StorageError(ErrorKind::Internal, "cannot open " + tmp.string());
        }
        const std::string text = std::to_string(id);
        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        file.flush();
        if (!file) {
            throw StorageError(ErrorKind::Internal, "cannot write " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, head_path_, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw StorageError(ErrorKind::Internal,
                           "cannot replace " + head_path_.string() + ": " + ec.message());
    }
}

std::uint64_t RevisionStore::bump()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return bump_locked();
}

std::uint64_t RevisionStore::bump_locked()
{
    const std::uint64_t next = head_.load() + 1;
    const fs::path dir = revision_dir(next);

    std::error_code ec;
    if (fs::exists(dir, ec)) {
        // Only an empty orphan (crash between mkdir and the HEAD write) is reused.
        if (!fs::is_directory(dir, ec) || !fs::is_empty(dir, ec) || ec) {
            throw StorageError(ErrorKind::Internal,
                               "revision directory " + dir.string() +
                                   " already exists with content; HEAD is behind");
        }
        infra::Logger::log(infra::LogLevel::WARN,
                           "Storage: Reusing empty unpublished revision directory " + dir.string());
    } else {
        fs::create_directory(dir, ec);
    }
    if (ec) {
        throw StorageError(ErrorKind::Internal,
                           "cannot create revision " + dir.string() + ": " + ec.message());
    }

    try {
        write_head(next);
    } catch (const StorageError&) {
        std::error_code ignored;
        fs::remove(dir, ignored);
        throw;
    }

    head_.store(next);
    infra::Logger::log(infra::LogLevel::INFO, "Storage: Allocated revision " + std::to_string(next));
    return next;
}

std::uint64_t RevisionStore::create_revision(const Populate& populate)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const std::uint64_t id = bump_locked();
    populate(revision_dir(id), id);
    return id;
}

std::uint64_t RevisionStore::snapshot()
{
    return create_revision([this](const fs::path& dir, std::uint64_t id) {
        copy_tree(revision_dir(id - 1), dir);
        infra::Logger::log(infra::LogLevel::INFO, "Storage: Snapshot " + std::to_string(id - 1) +
                                                      " -> " + std::to_string(id) + " complete.");
    });
}

RevisionList RevisionStore::list() const
{
    RevisionList out;
    out.latest = head();
    out.ids.reserve(static_cast<size_t>(out.latest) + 1);
    for (std::uint64_t id = 0; id <= out.latest; ++id) {
        out.ids.push_back(id);
    }
    return out;
}

fs::path RevisionStore::revision_dir(std::uint64_t id) const
{
    return root_ / std::to_string(id);
}

void copy_tree(const fs::path& src, const fs::path& dst)
{
    std::error_code ec;
    fs::copy(src, dst,
             fs::copy_options::recursive | fs::copy_options::copy_symlinks |
                 fs::copy_options::overwrite_existing,
             ec);
    if (ec) {
        throw StorageError(ErrorKind::Internal,
                           "copy " + src.string() + " -> " + dst.string() + " failed: " +
                               ec.message());
    }
}

} // namespace revfs::storage
