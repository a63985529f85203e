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
 * @file http.hpp
 * @brief Minimal HTTP/1.1 message codec used by the server.
 *
 * @details
 * Only what the workspace API needs: `Content-Length` framed request bodies,
 * percent-decoded query strings, persistent connections. Chunked request
 * bodies are refused.
 */

#pragma once

#include <cJSON.h>
#include <cstdint>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace revfs::network {

/**
 * @struct Request
 * @brief A fully received HTTP request.
 */
struct Request {
    std::string method;
    std::string path;    ///< Target without the query string.
    std::string version; ///< e.g. `HTTP/1.1`.
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers; ///< Names lowercased.
    std::string body;

    /// @brief Header value by lowercase name; empty if absent.
    std::string header(const std::string& name) const;

    /// @brief Query parameter by name; nullopt if absent.
    std::optional<std::string> param(const std::string& name) const;

    /// @brief HTTP/1.1 defaults to persistent, HTTP/1.0 to close.
    bool keep_alive() const;
};

/**
 * @struct Response
 * @brief An HTTP response, either buffered in `body` or streamed from `file`.
 */
struct Response {
    int status = 200;
    std::string content_type;
    std::string body;

    /// @brief Sent as `Content-Disposition` when non-empty.
    std::string disposition;

    /// @brief When set, `file_size` bytes of it are sent instead of `body`.
    std::unique_ptr<std::istream> file;
    std::uint64_t file_size = 0;

    /// @brief Serializes `doc` and frees it.
    static Response json(int status, cJSON* doc);
    static Response text(int status, const std::string& body);
    /// @brief `{"status":"error","message":...}`.
    static Response error(int status, const std::string& message);
    /// @brief No body (201, 204).
    static Response empty(int status);
};

/// @brief Outcome of trying to parse one request from a receive buffer.
enum class ParseStatus {
    Complete,   ///< `out` is filled and the request bytes were consumed.
    Incomplete, ///< Need more bytes.
    Invalid,    ///< Malformed; answer 400 and close.
    TooLarge    ///< Declared body above the limit; answer 413 and close.
};

/**
 * @class Http
 * @brief Stateless request parser and response head serializer.
 */
class Http {
  public:
    /// @brief Maximum size of the request line plus headers.
    static constexpr size_t kMaxHeaderBytes = 64 * 1024;

    /**
     * @brief Parses one request from the front of `buffer`.
     *
     * On `Complete` the consumed bytes are erased, leaving any pipelined
     * follow-up data in place.
     *
     * @param buffer Bytes received so far on the connection.
     * @param out Destination for the parsed request.
     * @param max_body Largest acceptable `Content-Length`.
     */
    static ParseStatus parse(std::string& buffer, Request& out, std::uint64_t max_body);

    /**
     * @brief Status line and headers, terminated by the blank line.
     *
     * `Content-Length` is taken from `file_size` when a file is attached,
     * otherwise from `body`.
     */
    static std::string serialize_head(const Response& response, bool keep_alive);

    /// @brief Standard reason phrase for the handful of codes the API uses.
    static const char* reason(int status);
};

} // namespace revfs::network
