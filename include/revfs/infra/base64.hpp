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
 * @file base64.hpp
 * @brief RFC 4648 base64 codec for archive payloads carried inside JSON.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace revfs::infra {

/**
 * @class Base64
 * @brief Static encoder/decoder using the standard alphabet with `=` padding.
 */
class Base64 {
  public:
    /// @brief Encodes raw bytes into padded base64 text.
    static std::string encode(const std::uint8_t* data, size_t size);

    /// @brief Convenience overload for string-held binary data.
    static std::string encode(std::string_view data);

    /**
     * @brief Decodes padded base64 text.
     *
     * ASCII whitespace (including line breaks inserted by some encoders) is
     * ignored. The remaining input must be a multiple of four characters with
     * padding only at the end.
     *
     * @return std::nullopt on malformed input.
     */
    static std::optional<std::vector<std::uint8_t>> decode(std::string_view text);
};

} // namespace revfs::infra
