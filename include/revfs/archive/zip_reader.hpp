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
 * @file zip_reader.hpp
 * @brief In-memory ZIP archive reader backed by zlib.
 *
 * @details
 * Supports the subset of PKWARE's APPNOTE that browsers and common tools emit
 * for workspace exports: a single-disk archive (with ZIP64 extensions), entries
 * stored (method 0) or deflated (method 8), no encryption. The central
 * directory is authoritative; local headers are only used to locate data.
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace revfs::archive {

/**
 * @class ZipError
 * @brief Raised for any malformed, unsupported or over-limit archive content.
 */
class ZipError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// @brief Compression method identifiers used by this reader.
inline constexpr std::uint16_t kMethodStored = 0;
inline constexpr std::uint16_t kMethodDeflate = 8;

/**
 * @struct ZipEntry
 * @brief One central directory record.
 */
struct ZipEntry {
    std::string name; ///< Archive-internal path, `\` already normalized to `/`.
    std::uint16_t method = 0;
    std::uint16_t flags = 0;
    std::uint32_t crc32 = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    std::uint64_t local_header_offset = 0;

    /// @brief Directory entries are recognised by a trailing `/`.
    bool is_directory() const { return !name.empty() && name.back() == '/'; }
};

/**
 * @class ZipReader
 * @brief Parses the central directory on construction and inflates on demand.
 */
class ZipReader {
  public:
    /**
     * @brief Takes ownership of the archive bytes and indexes the entries.
     * @throws ZipError If no valid end-of-central-directory record is found,
     * the archive spans disks, or any record is truncated.
     */
    explicit ZipReader(std::vector<std::uint8_t> data);

    const std::vector<ZipEntry>& entries() const { return entries_; }

    /**
     * @brief Decompresses one entry into `out`.
     *
     * Output is streamed in fixed-size chunks. The CRC-32 and the declared
     * uncompressed size are verified.
     *
     * @param entry An element of `entries()`.
     * @param out Destination stream.
     * @param limit Maximum number of bytes this call may produce.
     * @return Number of bytes written.
     * @throws ZipError On unsupported method, encryption, corrupt data, size
     * or CRC mismatch, exceeding `limit`, or a failed write to `out`.
     */
    std::uint64_t extract(const ZipEntry& entry, std::ostream& out, std::uint64_t limit) const;

  private:
    void parse_central_directory();

    /// @brief Offset of the entry's compressed data, validated against the buffer.
    std::uint64_t data_offset(const ZipEntry& entry) const;

    std::vector<std::uint8_t> data_;
    std::vector<ZipEntry> entries_;
};

} // namespace revfs::archive
