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
 * @file zip_fixture.hpp
 * @brief Builds small ZIP archives in memory for archive tests.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <zlib.h>

namespace revfs::test {

struct FixtureEntry {
    std::string name;
    std::string data;
    bool deflate = true;
    /// @brief Overrides the CRC written to both headers.
    std::optional<std::uint32_t> crc;
    /// @brief Overrides the uncompressed size written to both headers.
    std::optional<std::uint32_t> declared_size;
};

namespace detail {

inline void put16(std::vector<std::uint8_t>& out, std::uint16_t v)
{
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
}

inline void put32(std::vector<std::uint8_t>& out, std::uint32_t v)
{
    put16(out, static_cast<std::uint16_t>(v & 0xFFFF));
    put16(out, static_cast<std::uint16_t>(v >> 16));
}

inline std::string raw_deflate(const std::string& data)
{
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
    std::string out(deflateBound(&zs, static_cast<uLong>(data.size())) + 16, '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(out.size());
    const int rc = deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("deflate did not finish");
    }
    return out;
}

} // namespace detail

/// @brief Single-disk archive with one local header per entry and no comment.
inline std::vector<std::uint8_t> make_zip(const std::vector<FixtureEntry>& entries)
{
    std::vector<std::uint8_t> out;
    std::vector<std::uint8_t> central;

    for (const FixtureEntry& e : entries) {
        const std::uint32_t crc = e.crc.value_or(static_cast<std::uint32_t>(
            crc32(0L, reinterpret_cast<const Bytef*>(e.data.data()),
                  static_cast<uInt>(e.data.size()))));
        const std::string payload = e.deflate ? detail::raw_deflate(e.data) : e.data;
        const std::uint16_t method = e.deflate ? 8 : 0;
        const std::uint32_t usize = e.declared_size.value_or(static_cast<std::uint32_t>(e.data.size()));
        const std::uint32_t csize = static_cast<std::uint32_t>(payload.size());
        const std::uint32_t offset = static_cast<std::uint32_t>(out.size());

        detail::put32(out, 0x04034b50);
        detail::put16(out, 20);
        detail::put16(out, 0);
        detail::put16(out, method);
        detail::put16(out, 0);
        detail::put16(out, 0);
        detail::put32(out, crc);
        detail::put32(out, csize);
        detail::put32(out, usize);
        detail::put16(out, static_cast<std::uint16_t>(e.name.size()));
        detail::put16(out, 0);
        out.insert(out.end(), e.name.begin(), e.name.end());
        out.insert(out.end(), payload.begin(), payload.end());

        detail::put32(central, 0x02014b50);
        detail::put16(central, 20);
        detail::put16(central, 20);
        detail::put16(central, 0);
        detail::put16(central, method);
        detail::put16(central, 0);
        detail::put16(central, 0);
        detail::put32(central, crc);
        detail::put32(central, csize);
        detail::put32(central, usize);
        detail::put16(central, static_cast<std::uint16_t>(e.name.size()));
        detail::put16(central, 0);
        detail::put16(central, 0);
        detail::put16(central, 0);
        detail::put16(central, 0);
        detail::put32(central, 0);
        detail::put32(central, offset);
        central.insert(central.end(), e.name.begin(), e.name.end());
    }

    const std::uint32_t cd_offset = static_cast<std::uint32_t>(out.size());
    out.insert(out.end(), central.begin(), central.end());

    detail::put32(out, 0x06054b50);
    detail::put16(out, 0);
    detail::put16(out, 0);
    detail::put16(out, static_cast<std::uint16_t>(entries.size()));
    detail::put16(out, static_cast<std::uint16_t>(entries.size()));
    detail::put32(out, static_cast<std::uint32_t>(central.size()));
    detail::put32(out, cd_offset);
    detail::put16(out, 0);
    return out;
}

} // namespace revfs::test
