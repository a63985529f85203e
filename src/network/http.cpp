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
 * @file http.cpp
 * @brief Implementation of the HTTP/1.1 codec.
 */

#include "revfs/network/http.hpp"

#include "revfs/infra/string.hpp"

#include <cstdlib>

namespace revfs::network {

using infra::String;

std::string Request::header(const std::string& name) const
{
    auto it = headers.find(name);
    return it == headers.end() ? std::string() : it->second;
}

std::optional<std::string> Request::param(const std::string& name) const
{
    auto it = query.find(name);
    if (it == query.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Request::keep_alive() const
{
    const std::string connection = String::to_lower(header("connection"));
    if (version == "HTTP/1.0") {
        return connection == "keep-alive";
    }
    return connection != "close";
}

Response Response::json(int status, cJSON* doc)
{
    Response r;
    r.status = status;
    r.content_type = "application/json";
    char* raw = cJSON_PrintUnformatted(doc);
    r.body = raw ? raw : "null";
    free(raw);
    cJSON_Delete(doc);
    return r;
}

Response Response::text(int status, const std::string& body)
{
    Response r;
    r.status = status;
    r.content_type = "text/plain; charset=utf-8";
    r.body = body;
    return r;
}

Response Response::error(int status, const std::string& message)
{
    cJSON* doc = cJSON_CreateObject();
    cJSON_AddStringToObject(doc, "status", "error");
    cJSON_AddStringToObject(doc, "message", message.c_str());
    return json(status, doc);
}

Response Response::empty(int status)
{
    Response r;
    r.status = status;
    return r;
}

namespace {

/// Parses `a=1&b=two` into `out`; false on a bad percent escape.
bool parse_query(std::string_view raw, std::map<std::string, std::string>& out)
{
    for (const std::string& pair : String::split(raw, '&')) {
        if (pair.empty()) {
            continue;
        }
        const size_t eq = pair.find('=');
        auto key = String::url_decode(std::string_view(pair).substr(0, eq));
        auto value = eq == std::string::npos
                         ? std::optional<std::string>(std::string())
                         : String::url_decode(std::string_view(pair).substr(eq + 1));
        if (!key || !value) {
            return false;
        }
        out[*key] = *value;
    }
    return true;
}

} // namespace

ParseStatus Http::parse(std::string& buffer, Request& out, std::uint64_t max_body)
{
    const size_t head_end = buffer.find("\r\n\r\n");
    if (head_end == std::string::npos) {
        return buffer.size() > kMaxHeaderBytes ? ParseStatus::Invalid : ParseStatus::Incomplete;
    }
    if (head_end > kMaxHeaderBytes) {
        return ParseStatus::Invalid;
    }

    Request req;
    const std::string head = buffer.substr(0, head_end);
    size_t line_start = 0;
    bool first = true;
    while (line_start <= head.size()) {
        size_t line_end = head.find("\r\n", line_start);
        if (line_end == std::string::npos) {
            line_end = head.size();
        }
        const std::string line = head.substr(line_start, line_end - line_start);
        line_start = line_end + 2;

        if (first) {
            first = false;
            const auto parts = String::split(line, ' ');
            if (parts.size() != 3 || parts[0].empty() || parts[1].empty() ||
                !String::starts_with(parts[2], "HTTP/1.")) {
                return ParseStatus::Invalid;
            }
            req.method = parts[0];
            req.version = parts[2];

            const size_t q = parts[1].find('?');
            req.path = parts[1].substr(0, q);
            if (q != std::string::npos &&
                !parse_query(std::string_view(parts[1]).substr(q + 1), req.query)) {
                return ParseStatus::Invalid;
            }
            continue;
        }

        if (line.empty()) {
            continue;
        }
        const size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return ParseStatus::Invalid;
        }
        req.headers[String::to_lower(String::trim(line.substr(0, colon)))] =
            String::trim(line.substr(colon + 1));
    }

    if (!req.header("transfer-encoding").empty()) {
        return ParseStatus::Invalid;
    }

    std::uint64_t length = 0;
    const std::string declared = req.header("content-length");
    if (!declared.empty()) {
        auto parsed = String::parse_u64(declared);
        if (!parsed) {
            return ParseStatus::Invalid;
        }
        length = *parsed;
    }
    if (length > max_body) {
        return ParseStatus::TooLarge;
    }

    const size_t body_start = head_end + 4;
    if (buffer.size() - body_start < length) {
        return ParseStatus::Incomplete;
    }

    req.body = buffer.substr(body_start, static_cast<size_t>(length));
    buffer.erase(0, body_start + static_cast<size_t>(length));
    out = std::move(req);
    return ParseStatus::Complete;
}

std::string Http::serialize_head(const Response& response, bool keep_alive)
{
    std::string head = "HTTP/1.1 " + std::to_string(response.status) + " " +
                       reason(response.status) + "\r\n";
    if (!response.content_type.empty()) {
        head += "Content-Type: " + response.content_type + "\r\n";
    }
    if (!response.disposition.empty()) {
        head += "Content-Disposition: " + response.disposition + "\r\n";
    }
    if (response.status != 204) {
        const std::uint64_t length = response.file ? response.file_size : response.body.size();
        head += "Content-Length: " + std::to_string(length) + "\r\n";
    }
    head += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    head += "\r\n";
    return head;
}

const char* Http::reason(int status)
{
    switch (status) {
    case 200:
        return "OK";
    case 201:
        return "Created";
    case 204:
        return "No Content";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 413:
        return "Payload Too Large";
    case 500:
        return "Internal Server Error";
    default:
        return "Unknown";
    }
}

} // namespace revfs::network
