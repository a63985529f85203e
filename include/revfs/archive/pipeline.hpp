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
 * @file pipeline.hpp
 * @brief Bulk revision import from ZIP archives and single-file export.
 */

#pragma once

#include "revfs/storage/revision_store.hpp"

#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace revfs::archive {

/**
 * @struct ArchiveLimits
 * @brief Upper bounds applied to every imported archive.
 */
struct ArchiveLimits {
    std::uint64_t max_entries = 10000;
    std::uint64_t max_total_bytes = 512ULL * 1024 * 1024;
};

/**
 * @struct RevisionFile
 * @brief An opened file from a historical revision, ready to be streamed.
 */
struct RevisionFile {
    std::unique_ptr<std::ifstream> stream;
    std::uint64_t size = 0;
    std::string content_type = "application/octet-stream";
    std::string name; ///< Final path component, for download naming.
};

/**
 * @class ArchivePipeline
 * @brief Turns uploaded archives into revisions and serves historical files.
 *
 * @details
 * **Import Workflow:**
 * 1. **Decode:** base64 text to bytes, then index the ZIP central directory.
 * 2. **Validate:** entry count, declared total size and every entry name
 *    (through the sandbox) are checked before anything is allocated.
 * 3. **Allocate:** `RevisionStore::create_revision` bumps HEAD.
 * 4. **Extract:** entries are written under the new revision directory with
 *    the remaining byte budget enforced on the inflated output.
 *
 * A failure in step 4 leaves the new revision allocated and possibly
 * partially populated; ids are never reused.
 */
class ArchivePipeline {
  public:
    ArchivePipeline(storage::RevisionStore& store, ArchiveLimits limits = {},
                    bool confine_symlinks = true);

    /**
     * @brief Imports a base64-encoded ZIP archive as a new revision.
     * @return The new revision id.
     * @throws StorageError `Internal` on any decode, validation or extraction failure.
     */
    std::uint64_t import_base64(std::string_view text);

    /// @brief Imports raw ZIP bytes as a new revision; see `import_base64`.
    std::uint64_t import_archive(std::vector<std::uint8_t> bytes);

    /**
     * @brief Opens `path` inside revision `rev` for reading.
     *
     * @throws StorageError `NotFound` if `rev` is beyond HEAD, `path` fails
     * sandboxing, or it is not an existing regular file. `Internal` if the
     * file exists but cannot be opened.
     */
    RevisionFile open_file(std::uint64_t rev, const std::string& path) const;

  private:
    storage::RevisionStore& store_;
    ArchiveLimits limits_;
    bool confine_symlinks_;
};

} // namespace revfs::archive
