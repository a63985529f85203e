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
 * @file handler.cpp
 * @brief Implementation of the request dispatch pipeline.
 *
 * @details
 * Every request goes through the same stages:
 * 1. **Route**: match the path, then the method (405 on mismatch).
 * 2. **Decode**: pull arguments from the query string or the JSON body.
 * 3. **Execute**: call into the workspace, revision store or archive pipeline.
 * 4. **Respond**: serialize the result, or map the thrown error to a status.
 */

#include "revfs/network/handler.hpp"

#include "revfs/infra/logger.hpp"
#include "revfs/infra/string.hpp"
#include "revfs/storage/error.hpp"

#include <cJSON.h>
#include <memory>
#include <optional>

using revfs::storage::ErrorKind;
using revfs::storage::StorageError;

namespace revfs::network {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

/// Parses the request body as a JSON object; nullptr on any syntax error.
JsonPtr parse_body(const Request& request)
{
    JsonPtr doc(cJSON_ParseWithLength(request.body.data(), request.body.size()), &cJSON_Delete);
    if (doc && !cJSON_IsObject(doc.get())) {
        doc.reset();
    }
    return doc;
}

std::optional<std::string> string_field(const cJSON* doc, const char* name)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(doc, name);
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        return std::nullopt;
    }
    return std::string(item->valuestring);
}

Response id_response(std::uint64_t id)
{
    cJSON* doc = cJSON_CreateObject();
    cJSON_AddNumberToObject(doc, "id", static_cast<double>(id));
    return Response::json(200, doc);
}

Response method_not_allowed(const Request& request)
{
    return Response::error(405, "method " + request.method + " not allowed on " + request.path);
}

Response missing(const std::string& what)
{
    return Response::error(400, "missing or malformed " + what);
}

/// `attachment; filename="..."` with quotes, backslashes and control bytes replaced.
std::string attachment(const std::string& name)
{
    std::string safe;
    safe.reserve(name.size());
    for (char c : name) {
        const auto u = static_cast<unsigned char>(c);
        safe += (u < 0x20 || u == 0x7F || c == '"' || c == '\\') ? '_' : c;
    }
    return "attachment; filename=\"" + safe + "\"";
}

} // namespace

Response Handler::process(const Services& services, const Request& request)
{
    try {
        return dispatch(services, request);
    } catch (const StorageError& e) {
        switch (e.kind()) {
        case ErrorKind::NotFound:
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Network: " + request.path + " not found: " + e.what());
            return Response::error(404, "not found");
        case ErrorKind::PathEscape:
            infra::Logger::log(infra::LogLevel::WARN,
                               "Network: Rejected path on " + request.path + ": " + e.what());
            if (request.method == "GET") {
                return Response::error(404, "not found");
            }
            return Response::error(400, "path escapes the workspace");
        case ErrorKind::BadRequest:
            return Response::error(400, e.what());
        case ErrorKind::Internal:
            break;
        }
        infra::Logger::log(infra::LogLevel::ERROR, "Network: " + request.method + " " +
                                                       request.path + " failed: " + e.what());
        return Response::error(500, "internal error");
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR, "Network: " + request.method + " " +
                                                       request.path + " failed: " + e.what());
        return Response::error(500, "internal error");
    }
}

Response Handler::dispatch(const Services& services, const Request& request)
{
    const std::string& path = request.path;
    const bool get = request.method == "GET";
    const bool post = request.method == "POST";

    if (path == "/api/health") {
        if (!get) {
            return method_not_allowed(request);
        }
        return Response::text(200, "healthy");
    }

    // --- Workspace lookups ---
    if (path == "/api/fs/list") {
        if (!get) {
            return method_not_allowed(request);
        }
        const std::string dir = request.param("path").value_or("");
        return Response::json(200, storage::to_json(services.workspace.list(dir)));
    }

    if (path == "/api/fs/read") {
        if (!get) {
            return method_not_allowed(request);
        }
        auto file = request.param("path");
        if (!file) {
            return missing("?path=");
        }
        const std::string content = services.workspace.read(*file);
        return Response::json(200, cJSON_CreateString(content.c_str()));
    }

    if (path == "/api/fs/search") {
        if (!get) {
            return method_not_allowed(request);
        }
        auto q = request.param("q");
        if (!q) {
            return missing("?q=");
        }
        const std::string dir = request.param("path").value_or("");
        return Response::json(200, storage::to_json(services.workspace.search(dir, *q)));
    }

    // --- Workspace mutations ---
    if (path == "/api/fs/save" || path == "/api/fs/write") {
        if (!post) {
            return method_not_allowed(request);
        }
        JsonPtr body = parse_body(request);
        auto file = body ? string_field(body.get(), "path") : std::nullopt;
        auto content = body ? string_field(body.get(), "content") : std::nullopt;
        if (!file || !content) {
            return missing("body {path, content}");
        }
        services.workspace.write(*file, *content);
        return Response::empty(201);
    }

    if (path == "/api/fs/rename") {
        if (!post) {
            return method_not_allowed(request);
        }
        JsonPtr body = parse_body(request);
        auto from = body ? string_field(body.get(), "from") : std::nullopt;
        auto to = body ? string_field(body.get(), "to") : std::nullopt;
        if (!from || !to) {
            return missing("body {from, to}");
        }
        services.workspace.rename(*from, *to);
        return Response::empty(204);
    }

    if (path == "/api/fs/delete" || path == "/api/fs/mkdir") {
        if (!post) {
            return method_not_allowed(request);
        }
        JsonPtr body = parse_body(request);
        auto target = body ? string_field(body.get(), "path") : std::nullopt;
        if (!target) {
            return missing("body {path}");
        }
        if (path == "/api/fs/delete") {
            services.workspace.remove(*target);
            return Response::empty(204);
        }
        services.workspace.mkdir(*target);
        return Response::empty(201);
    }

    // --- Revisions ---
    if (path == "/api/fs/snapshot") {
        if (!post) {
            return method_not_allowed(request);
        }
        return id_response(services.store.snapshot());
    }

    if (path == "/api/revisions") {
        if (get) {
            const storage::RevisionList revisions = services.store.list();
            cJSON* doc = cJSON_CreateObject();
            cJSON_AddNumberToObject(doc, "latest", static_cast<double>(revisions.latest));
            cJSON* ids = cJSON_AddArrayToObject(doc, "list");
            for (std::uint64_t id : revisions.ids) {
                cJSON_AddItemToArray(ids, cJSON_CreateNumber(static_cast<double>(id)));
            }
            return Response::json(200, doc);
        }
        if (post) {
            JsonPtr body = parse_body(request);
            auto payload = body ? string_field(body.get(), "zip_b64") : std::nullopt;
            if (!payload) {
                return missing("body {zip_b64}");
            }
            return id_response(services.archive.import_base64(*payload));
        }
        return method_not_allowed(request);
    }

    if (path == "/api/revisions/file") {
        if (!get) {
            return method_not_allowed(request);
        }
        auto rev_text = request.param("rev");
        auto rev = rev_text ? infra::String::parse_u64(*rev_text) : std::nullopt;
        if (!rev) {
            return missing("?rev=");
        }
        auto file_path = request.param("path");
        if (!file_path) {
            return missing("?path=");
        }

        archive::RevisionFile file = services.archive.open_file(*rev, *file_path);
        Response response;
        response.status = 200;
        response.content_type = file.content_type;
        response.file_size = file.size;
        response.disposition = attachment(file.name);
        response.file = std::move(file.stream);
        return response;
    }

    return Response::error(404, "no route for " + path);
}

} // namespace revfs::network
