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
 * @file workspace.hpp
 * @brief File operations on the live working copy (the HEAD revision).
 */

#pragma once

#include "revfs/storage/revision_store.hpp"
#include "revfs/storage/search.hpp"
#include "revfs/storage/tree.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace revfs::storage {

/**
 * @struct WorkspaceOptions
 * @brief Tunables forwarded from the service configuration.
 */
struct WorkspaceOptions {
    std::uint64_t search_max_file_bytes = kDefaultSearchMaxFileBytes;
    bool confine_symlinks = true;
};

/**
 * @class Workspace
 * @brief Sandboxed read/write access to the current revision's directory.
 *
 * @details
 * Every call re-reads HEAD, so after a snapshot or import the next operation
 * transparently addresses the new working copy. No locking: concurrent writes
 * to one file are last-writer-wins.
 */
class Workspace {
  public:
    Workspace(RevisionStore& store, WorkspaceOptions options = {});

    /**
     * @brief Lists a directory of the working copy.
     * @throws StorageError `PathEscape`, or `NotFound` if `path` is missing.
     */
    std::vector<Node> list(const std::string& path) const;

    /**
     * @brief Returns the full text of a file.
     * @throws StorageError `NotFound` if absent or not a regular file,
     * `Internal` if unreadable, not valid UTF-8, or containing NUL.
     */
    std::string read(const std::string& path) const;

    /**
     * @brief Creates or overwrites a file, creating parent directories.
     * @throws StorageError `PathEscape`, `BadRequest` for the root itself, or
     * `Internal` on I/O failure.
     */
    void write(const std::string& path, const std::string& content) const;

    /**
     * @brief Atomically renames `from` to `to`, creating destination parents.
     * @throws StorageError `PathEscape` if either path fails sandboxing,
     * `Internal` if the rename fails.
     */
    void rename(const std::string& from, const std::string& to) const;

    /**
     * @brief Deletes a file, or a directory with everything beneath it.
     * @throws StorageError `NotFound` if `path` does not exist,
     * `BadRequest` if `path` addresses the working copy root itself.
     */
    void remove(const std::string& path) const;

    /// @brief `mkdir -p`; succeeds if the directory already exists.
    void mkdir(const std::string& path) const;

    /// @brief Name/content search under `path`; see `storage::search`.
    std::vector<SearchHit> search(const std::string& path, const std::string& query) const;

  private:
    /// @brief Resolves `path` inside the current working copy.
    std::filesystem::path locate(const std::filesystem::path& base, const std::string& path) const;

    RevisionStore& store_;
    WorkspaceOptions options_;
};

} // namespace revfs::storage
