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
 * @file zip_reader.cpp
 * @brief Central directory parsing and zlib-based entry extraction.
 *
 * @details
 * All multi-byte fields are little-endian. Every read is bounds-checked
 * against the archive buffer, since the payload comes straight from a client.
 */

#include "revfs/archive/zip_reader.hpp"

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace revfs::archive {

namespace {

constexpr std::uint32_t kSigLocalHeader = 0x04034b50;
constexpr std::uint32_t kSigCentralHeader = 0x02014b50;
constexpr std::uint32_t kSigEndOfCentralDir = 0x06054b50;
constexpr std::uint32_t kSigZip64Locator = 0x07064b50;
constexpr std::uint32_t kSigZip64EndOfCentralDir = 0x06064b50;

constexpr size_t kEocdSize = 22;
constexpr size_t kZip64LocatorSize = 20;
constexpr size_t kCentralHeaderSize = 46;
constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kMaxCommentSize = 0xFFFF;

constexpr std::uint16_t kZip64ExtraId = 0x0001;
constexpr std::uint16_t kFlagEncrypted = 0x0001;

constexpr size_t kChunkSize = 64 * 1024;

/// Bounds-checked little-endian cursor over the archive buffer.
class ByteView {
  public:
    explicit ByteView(const std::vector<std::uint8_t>& data) : data_(data) {}

    void require(std::uint64_t pos, std::uint64_t len) const
    {
        if (pos > data_.size() || len > data_.size() - pos) {
            throw ZipError("zip: truncated record");
        }
    }

    std::uint16_t u16(std::uint64_t pos) const
    {
        require(pos, 2);
        return static_cast<std::uint16_t>(data_[pos] | (data_[pos + 1] << 8));
    }

    std::uint32_t u32(std::uint64_t pos) const
    {
        require(pos, 4);
        return static_cast<std::uint32_t>(data_[pos]) |
               (static_cast<std::uint32_t>(data_[pos + 1]) << 8) |
               (static_cast<std::uint32_t>(data_[pos + 2]) << 16) |
               (static_cast<std::uint32_t>(data_[pos + 3]) << 24);
    }

    std::uint64_t u64(std::uint64_t pos) const
    {
        return static_cast<std::uint64_t>(u32(pos)) |
               (static_cast<std::uint64_t>(u32(pos + 4)) << 32);
    }

    std::string str(std::uint64_t pos, std::uint64_t len) const
    {
        require(pos, len);
        return std::string(reinterpret_cast<const char*>(data_.data() + pos),
                           static_cast<size_t>(len));
    }

  private:
    const std::vector<std::uint8_t>& data_;
};

/// Owns an inflate stream for the duration of one extraction.
class InflateStream {
  public:
    InflateStream()
    {
        // Negative window bits: raw deflate data, no zlib header or trailer.
        if (inflateInit2(&zs_, -MAX_WBITS) != Z_OK) {
            throw ZipError("zip: inflateInit2 failed");
        }
    }
    ~InflateStream() { inflateEnd(&zs_); }

    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    z_stream* get() { return &zs_; }

  private:
    z_stream zs_{};
};

void emit(std::ostream& out, const std::uint8_t* buf, size_t len, std::uint64_t& written,
          std::uint64_t limit, uLong& crc)
{
    if (len > limit - written) {
        throw ZipError("zip: entry exceeds extraction limit");
    }
    crc = crc32(crc, buf, static_cast<uInt>(len));
    out.write(reinterpret_cast<const char*>(buf), static_cast<std::streamsize>(len));
    if (!out) {
        throw ZipError("zip: write to destination failed");
    }
    written += len;
}

} // namespace

ZipReader::ZipReader(std::vector<std::uint8_t> data) : data_(std::move(data))
{
    parse_central_directory();
}

void ZipReader::parse_central_directory()
{
    ByteView view(data_);

    if (data_.size() < kEocdSize) {
        throw ZipError("zip: archive too small");
    }

    // The EOCD record sits at the end, followed only by an optional comment.
    std::uint64_t eocd = 0;
    bool found = false;
    const std::uint64_t last = data_.size() - kEocdSize;
    const std::uint64_t first = last > kMaxCommentSize ? last - kMaxCommentSize : 0;
    for (std::uint64_t pos = last + 1; pos-- > first;) {
        if (view.u32(pos) == kSigEndOfCentralDir &&
            pos + kEocdSize + view.u16(pos + 20) <= data_.size()) {
            eocd = pos;
            found = true;
            break;
        }
    }
    if (!found) {
        throw ZipError("zip: end of central directory not found");
    }

    std::uint64_t disk = view.u16(eocd + 4);
    std::uint64_t cd_disk = view.u16(eocd + 6);
    std::uint64_t total = view.u16(eocd + 10);
    std::uint64_t cd_size = view.u32(eocd + 12);
    std::uint64_t cd_offset = view.u32(eocd + 16);

    const bool zip64 = total == 0xFFFF || cd_size == 0xFFFFFFFF || cd_offset == 0xFFFFFFFF;
    if (zip64) {
        if (eocd < kZip64LocatorSize ||
            view.u32(eocd - kZip64LocatorSize) != kSigZip64Locator) {
            throw ZipError("zip: ZIP64 locator missing");
        }
        const std::uint64_t rec = view.u64(eocd - kZip64LocatorSize + 8);
        if (view.u32(rec) != kSigZip64EndOfCentralDir) {
            throw ZipError("zip: ZIP64 end of central directory missing");
        }
        disk = view.u32(rec + 16);
        cd_disk = view.u32(rec + 20);
        total = view.u64(rec + 32);
        cd_size = view.u64(rec + 40);
        cd_offset = view.u64(rec + 48);
    }

    if (disk != 0 || cd_disk != 0) {
        throw ZipError("zip: multi-disk archives are not supported");
    }
    view.require(cd_offset, cd_size);
    if (total > cd_size / kCentralHeaderSize) {
        throw ZipError("zip: entry count inconsistent with directory size");
    }

    entries_.reserve(static_cast<size_t>(total));
    std::uint64_t pos = cd_offset;
    for (std::uint64_t i = 0; i < total; ++i) {
        if (view.u32(pos) != kSigCentralHeader) {
            throw ZipError("zip: bad central directory signature");
        }

        ZipEntry entry;
        entry.flags = view.u16(pos + 8);
        entry.method = view.u16(pos + 10);
        entry.crc32 = view.u32(pos + 16);
        entry.compressed_size = view.u32(pos + 20);
        entry.uncompressed_size = view.u32(pos + 24);
        const std::uint16_t name_len = view.u16(pos + 28);
        const std::uint16_t extra_len = view.u16(pos + 30);
        const std::uint16_t comment_len = view.u16(pos + 32);
        entry.local_header_offset = view.u32(pos + 42);

        entry.name = view.str(pos + kCentralHeaderSize, name_len);
        std::replace(entry.name.begin(), entry.name.end(), '\\', '/');

        // ZIP64 extended information: only saturated fields are present, in order.
        std::uint64_t extra = pos + kCentralHeaderSize + name_len;
        const std::uint64_t extra_end = extra + extra_len;
        view.require(extra, extra_len);
        while (extra + 4 <= extra_end) {
            const std::uint16_t id = view.u16(extra);
            const std::uint16_t size = view.u16(extra + 2);
            std::uint64_t field = extra + 4;
            const std::uint64_t field_end = field + size;
            if (field_end > extra_end) {
                throw ZipError("zip: truncated extra field");
            }
            if (id == kZip64ExtraId) {
                if (entry.uncompressed_size == 0xFFFFFFFF && field + 8 <= field_end) {
                    entry.uncompressed_size = view.u64(field);
                    field += 8;
                }
                if (entry.compressed_size == 0xFFFFFFFF && field + 8 <= field_end) {
                    entry.compressed_size = view.u64(field);
                    field += 8;
                }
                if (entry.local_header_offset == 0xFFFFFFFF && field + 8 <= field_end) {
                    entry.local_header_offset = view.u64(field);
                }
            }
            extra = field_end;
        }

        entries_.push_back(std::move(entry));
        pos = extra_end + comment_len;
    }
}

std::uint64_t ZipReader::data_offset(const ZipEntry& entry) const
{
    ByteView view(data_);
    const std::uint64_t header = entry.local_header_offset;
    if (view.u32(header) != kSigLocalHeader) {
        throw ZipError("zip: bad local header for " + entry.name);
    }
    const std::uint64_t offset = header + kLocalHeaderSize + view.u16(header + 26) +
                                 view.u16(header + 28);
    view.require(offset, entry.compressed_size);
    return offset;
}

std::uint64_t ZipReader::extract(const ZipEntry& entry, std::ostream& out,
                                 std::uint64_t limit) const
{
    if (entry.flags & kFlagEncrypted) {
        throw ZipError("zip: encrypted entry " + entry.name);
    }
    if (entry.uncompressed_size > limit) {
        throw ZipError("zip: entry " + entry.name + " exceeds extraction limit");
    }

    const std::uint64_t offset = data_offset(entry);
    const std::uint8_t* input = data_.data() + offset;
    std::uint64_t written = 0;
    uLong crc = crc32(0L, Z_NULL, 0);

    if (entry.method == kMethodStored) {
        if (entry.compressed_size != entry.uncompressed_size) {
            throw ZipError("zip: stored entry size mismatch for " + entry.name);
        }
        std::uint64_t done = 0;
        while (done < entry.compressed_size) {
            const size_t len =
                static_cast<size_t>(std::min<std::uint64_t>(kChunkSize, entry.compressed_size - done));
            emit(out, input + done, len, written, limit, crc);
            done += len;
        }
    } else if (entry.method == kMethodDeflate) {
        InflateStream stream;
        z_stream* zs = stream.get();
        std::vector<std::uint8_t> buf(kChunkSize);
        std::uint64_t consumed = 0;
        int rc = Z_OK;

        while (rc != Z_STREAM_END) {
            if (zs->avail_in == 0 && consumed < entry.compressed_size) {
                const std::uint64_t step = std::min<std::uint64_t>(
                    entry.compressed_size - consumed, std::numeric_limits<uInt>::max());
                zs->next_in = const_cast<Bytef*>(input + consumed);
                zs->avail_in = static_cast<uInt>(step);
                consumed += step;
            }

            zs->next_out = buf.data();
            zs->avail_out = static_cast<uInt>(buf.size());
            rc = inflate(zs, Z_NO_FLUSH);

            if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
                throw ZipError("zip: corrupt deflate data in " + entry.name);
            }
            const size_t have = buf.size() - zs->avail_out;
            if (rc == Z_BUF_ERROR && have == 0 && zs->avail_in == 0 &&
                consumed >= entry.compressed_size) {
                throw ZipError("zip: truncated deflate data in " + entry.name);
            }
            if (have > 0) {
                emit(out, buf.data(), have, written, limit, crc);
            }
        }
    } else {
        throw ZipError("zip: unsupported compression method " + std::to_string(entry.method) +
                       " for " + entry.name);
    }

    if (written != entry.uncompressed_size) {
        throw ZipError("zip: size mismatch for " + entry.name);
    }
    if (static_cast<std::uint32_t>(crc) != entry.crc32) {
        throw ZipError("zip: CRC mismatch for " + entry.name);
    }
    return written;
}

} // namespace revfs::archive
