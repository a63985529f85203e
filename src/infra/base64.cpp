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
 * @file base64.cpp
 * @brief Implementation of the base64 codec.
 */

#include "revfs/infra/base64.hpp"

#include <array>
#include <cctype>

namespace revfs::infra {

namespace {

constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::uint8_t kInvalid = 0xFF;

std::array<std::uint8_t, 256> make_reverse_table()
{
    std::array<std::uint8_t, 256> map{};
    map.fill(kInvalid);
    for (size_t i = 0; i < 64; ++i) {
        map[static_cast<std::uint8_t>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
    }
    return map;
}

} // namespace

std::string Base64::encode(const std::uint8_t* data, size_t size)
{
    std::string encoded;
    encoded.reserve(((size + 2) / 3) * 4);
    size_t index = 0;
    while (index + 3 <= size) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[index]) << 16) |
                               (static_cast<std::uint32_t>(data[index + 1]) << 8) |
                               static_cast<std::uint32_t>(data[index + 2]);
        encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        encoded.push_back(kAlphabet[triple & 0x3F]);
        index += 3;
    }

    const size_t remaining = size - index;
    if (remaining == 1) {
        std::uint32_t triple = static_cast<std::uint32_t>(data[index]) << 16;
        encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        encoded.append("==");
    } else if (remaining == 2) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[index]) << 16) |
                               (static_cast<std::uint32_t>(data[index + 1]) << 8);
        encoded.push_back(kAlphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(kAlphabet[(triple >> 6) & 0x3F]);
        encoded.push_back('=');
    }
    return encoded;
}

std::string Base64::encode(std::string_view data)
{
    return encode(reinterpret_cast<const std::uint8_t*>(data.data()), data.size());
}

std::optional<std::vector<std::uint8_t>> Base64::decode(std::string_view text)
{
    static const std::array<std::uint8_t, 256> kReverse = make_reverse_table();

    std::string filtered;
    filtered.reserve(text.size());
    for (char ch : text) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            filtered.push_back(ch);
        }
    }
    if (filtered.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> decoded;
    decoded.reserve((filtered.size() / 4) * 3);

    for (size_t i = 0; i < filtered.size(); i += 4) {
        const bool last_quad = (i + 4 == filtered.size());
        const char c2 = filtered[i + 2];
        const char c3 = filtered[i + 3];

        // Padding is only legal in the final quad, and "=x" is never valid.
        if ((c2 == '=' || c3 == '=') && !last_quad) {
            return std::nullopt;
        }
        if (c2 == '=' && c3 != '=') {
            return std::nullopt;
        }

        const std::uint8_t a = kReverse[static_cast<std::uint8_t>(filtered[i])];
        const std::uint8_t b = kReverse[static_cast<std::uint8_t>(filtered[i + 1])];
        const std::uint8_t c = (c2 == '=') ? 0 : kReverse[static_cast<std::uint8_t>(c2)];
        const std::uint8_t d = (c3 == '=') ? 0 : kReverse[static_cast<std::uint8_t>(c3)];
        if (a == kInvalid || b == kInvalid || c == kInvalid || d == kInvalid) {
            return std::nullopt;
        }

        const std::uint32_t triple = (static_cast<std::uint32_t>(a) << 18) |
                                     (static_cast<std::uint32_t>(b) << 12) |
                                     (static_cast<std::uint32_t>(c) << 6) |
                                     static_cast<std::uint32_t>(d);
        decoded.push_back(static_cast<std::uint8_t>((triple >> 16) & 0xFF));
        if (c2 != '=') {
            decoded.push_back(static_cast<std::uint8_t>((triple >> 8) & 0xFF));
        }
        if (c3 != '=') {
            decoded.push_back(static_cast<std::uint8_t>(triple & 0xFF));
        }
    }
    return decoded;
}

} // namespace revfs::infra
