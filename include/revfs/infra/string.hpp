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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` covering the text handling the service needs: trimming,
 * ASCII case folding for search and route matching, UTF-8 validation for
 * text-only reads, percent-decoding of query strings and strict integer
 * parsing for revision ids and configuration values.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace revfs::infra {

/**
 * @class String
 * @brief A static container for stateless text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed copy; empty if `s` is all whitespace.
     *
     * @code
     * std::string clean = revfs::infra::String::trim("  12\n"); // "12"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief ASCII lowercase copy of `s`.
     *
     * Bytes outside `A-Z` (including UTF-8 continuation bytes) are copied
     * unchanged, so multi-byte sequences stay intact.
     */
    static std::string to_lower(std::string_view s);

    /// @brief True when `needle` occurs in `haystack` (exact byte comparison).
    static bool contains(std::string_view haystack, std::string_view needle);

    /// @brief True when `s` begins with `prefix`.
    static bool starts_with(std::string_view s, std::string_view prefix);

    /**
     * @brief Validates that `s` is well-formed UTF-8.
     *
     * Rejects overlong encodings, surrogate code points and values above
     * U+10FFFF.
     */
    static bool is_valid_utf8(std::string_view s);

    /**
     * @brief Decodes `%XX` escapes and `+` (as space) in a URL component.
     *
     * @return std::nullopt if an escape is truncated or not hexadecimal.
     */
    static std::optional<std::string> url_decode(std::string_view s);

    /// @brief Splits `s` on every occurrence of `sep`, keeping empty fields.
    static std::vector<std::string> split(std::string_view s, char sep);

    /**
     * @brief Parses a non-negative decimal integer.
     *
     * The whole string must be digits; no sign, whitespace or suffix.
     *
     * @return std::nullopt on empty input, stray characters or overflow.
     */
    static std::optional<std::uint64_t> parse_u64(std::string_view s);
};

} // namespace revfs::infra
