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
 * @file revision_store.hpp
 * @brief Owner of the HEAD pointer and the numbered revision directories.
 *
 * @details
 * On-disk layout under the storage root:
 * - `HEAD`: the current revision id as plain decimal text.
 * - `<id>/`: one full-copy directory per revision, `0..=HEAD`. The directory
 *   named by HEAD is also the live working copy.
 *
 * Invariants maintained by this class:
 * 1. HEAD only moves forward, by exactly one per creation.
 * 2. The directory for a revision exists before HEAD names it.
 * 3. Revisions are never deleted or renumbered.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace revfs::storage {

/// @brief Name of the HEAD marker file inside the storage root.
inline constexpr const char* kHeadFile = "HEAD";

/**
 * @struct RevisionList
 * @brief Result of `RevisionStore::list`.
 */
struct RevisionList {
    std::uint64_t latest = 0;
    std::vector<std::uint64_t> ids; ///< Always the dense range `0..=latest`.
};

/**
 * @class RevisionStore
 * @brief Serializes revision creation and keeps an in-memory copy of HEAD.
 *
 * @details
 * **Concurrency Control:** a single `std::mutex` covers every operation that
 * advances HEAD, including the copy/extraction step of `create_revision`.
 * Readers use the cached atomic HEAD and never block on creators.
 */
class RevisionStore {
  public:
    /// @brief Callback that fills a freshly allocated revision directory.
    using Populate = std::function<void(const std::filesystem::path& dir, std::uint64_t id)>;

    /**
     * @brief Configures the store; touches nothing on disk.
     * @param root The storage root directory.
     */
    explicit RevisionStore(std::filesystem::path root);

    RevisionStore(const RevisionStore&) = delete;
    RevisionStore& operator=(const RevisionStore&) = delete;

    /**
     * @brief Ensures the storage root, revision `0` and HEAD exist.
     *
     * Idempotent. An existing HEAD is only rewritten when a populated revision
     * directory above it exists; HEAD then advances to the highest one.
     * Loads the cached HEAD.
     *
     * @throws StorageError `Internal` if the root or HEAD cannot be created.
     */
    void bootstrap();

    /**
     * @brief Tolerant read of the durable HEAD marker.
     * @return The stored id, or 0 if the marker is missing or unparsable.
     */
    std::uint64_t read_head() const;

    /// @brief Cached HEAD; equal to `read_head()` after bootstrap and every bump.
    std::uint64_t head() const { return head_.load(); }

    /**
     * @brief Allocates the next revision.
     *
     * Under the store mutex: create `<root>/<HEAD+1>/`, persist HEAD+1
     * atomically, then update the cache. The new directory is empty; callers
     * populate it. Do not retry blindly: every success allocates a revision.
     *
     * @return The new revision id.
     * An empty directory left at `HEAD+1` by an interrupted bump is reused.
     *
     * @throws StorageError `Internal` on directory creation or HEAD write
     * failure, or if `HEAD+1` already exists with content. HEAD is unchanged
     * in every case.
     */
    std::uint64_t bump();

    /**
     * @brief Allocates a revision and fills it while still holding the lock.
     *
     * If `populate` throws, the revision stays allocated (possibly partially
     * filled) and the exception propagates.
     *
     * @return The new revision id.
     */
    std::uint64_t create_revision(const Populate& populate);

    /**
     * @brief Allocates revision `HEAD+1` as a full copy of revision `HEAD`.
     * @throws StorageError `Internal` if the copy fails.
     */
    std::uint64_t snapshot();

    /// @brief `{HEAD, [0..=HEAD]}`.
    RevisionList list() const;

    /// @brief True if `id` names an allocated revision (`id <= HEAD`).
    bool exists(std::uint64_t id) const { return id <= head(); }

    /// @brief Physical directory of revision `id`; does not check existence.
    std::filesystem::path revision_dir(std::uint64_t id) const;

    /// @brief Directory of the current HEAD revision (the live working copy).
    std::filesystem::path working_dir() const { return revision_dir(head()); }

    const std::filesystem::path& root() const { return root_; }

  private:
    /// @brief Bump body; caller must hold `mutex_`.
    std::uint64_t bump_locked();

    /// @brief Atomically replaces the HEAD marker (temp file + rename).
    void write_head(std::uint64_t id) const;

    std::filesystem::path root_;
    std::filesystem::path head_path_;
    std::atomic<std::uint64_t> head_;
    std::mutex mutex_;
};

/**
 * @brief Recursively copies the contents of `src` into the existing `dst`.
 *
 * Symbolic links are copied as links, not followed.
 *
 * @throws StorageError `Internal` on any copy failure.
 */
void copy_tree(const std::filesystem::path& src, const std::filesystem::path& dst);

} // namespace revfs::storage
