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
 * @file handler_test.cpp
 * @brief Integration tests for the route dispatcher.
 *
 * @details
 * Verifies the critical path between the application layer (Handler) and the
 * storage layer: route and method matching, JSON decoding, and the mapping of
 * storage errors onto HTTP status codes.
 */

#include "framework.hpp"
#include "revfs/archive/pipeline.hpp"
#include "revfs/infra/base64.hpp"
#include "revfs/network/handler.hpp"
#include "revfs/storage/revision_store.hpp"
#include "revfs/storage/workspace.hpp"
#include "zip_fixture.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <map>
#include <sstream>
#include <string>

using revfs::network::Handler;
using revfs::network::Request;
using revfs::network::Response;

/**
 * @class HandlerFixture
 * @brief Full service stack over a scratch storage root.
 */
class HandlerFixture {
  public:
    HandlerFixture()
        : store(dir.path()), workspace(store), archive(store),
          services{store, workspace, archive}
    {
        store.bootstrap();
    }

    Response call(const std::string& method, const std::string& path,
                  const std::string& body = "",
                  std::map<std::string, std::string> query = {}) const
    {
        Request req;
        req.method = method;
        req.path = path;
        req.version = "HTTP/1.1";
        req.body = body;
        req.query = std::move(query);
        return Handler::process(services, req);
    }

    revfs::test::TempDir dir;
    revfs::storage::RevisionStore store;
    revfs::storage::Workspace workspace;
    revfs::archive::ArchivePipeline archive;
    revfs::network::Services services;
};

namespace {

/// Reads a numeric field out of a JSON response body.
double json_number(const Response& response, const char* key)
{
    cJSON* doc = cJSON_Parse(response.body.c_str());
    const cJSON* item = cJSON_GetObjectItem(doc, key);
    const double value = cJSON_IsNumber(item) ? item->valuedouble : -1;
    cJSON_Delete(doc);
    return value;
}

} // namespace

void test_handle_health()
{
    HandlerFixture fx;
    Response r = fx.call("GET", "/api/health");
    ASSERT_EQ(r.status, 200);
    ASSERT_EQ(r.body, std::string("healthy"));
}

void test_handle_unknown_route_and_method()
{
    HandlerFixture fx;
    ASSERT_EQ(fx.call("GET", "/api/nope").status, 404);
    ASSERT_EQ(fx.call("POST", "/api/fs/list").status, 405);
    ASSERT_EQ(fx.call("DELETE", "/api/revisions").status, 405);
}

/**
 * @brief Save, read back, rename, delete through the JSON API.
 */
void test_handle_file_lifecycle()
{
    HandlerFixture fx;
    ASSERT_EQ(fx.call("POST", "/api/fs/save", R"({"path":"a/b.txt","content":"hi"})").status,
              201);

    Response read = fx.call("GET", "/api/fs/read", "", {{"path", "a/b.txt"}});
    ASSERT_EQ(read.status, 200);
    ASSERT_EQ(read.body, std::string("\"hi\""));

    ASSERT_EQ(fx.call("POST", "/api/fs/rename", R"({"from":"a/b.txt","to":"c.txt"})").status,
              204);
    ASSERT_EQ(fx.call("POST", "/api/fs/delete", R"({"path":"c.txt"})").status, 204);
    ASSERT_EQ(fx.call("POST", "/api/fs/delete", R"({"path":"c.txt"})").status, 404);
    ASSERT_EQ(fx.call("POST", "/api/fs/mkdir", R"({"path":"x/y"})").status, 201);
}

void test_handle_bad_bodies()
{
    HandlerFixture fx;
    ASSERT_EQ(fx.call("POST", "/api/fs/write", "not json").status, 400);
    ASSERT_EQ(fx.call("POST", "/api/fs/write", R"({"path":"a.txt"})").status, 400);
    ASSERT_EQ(fx.call("POST", "/api/fs/mkdir", R"({"path":7})").status, 400);
    ASSERT_EQ(fx.call("POST", "/api/revisions", "{}").status, 400);
}

/**
 * @brief Escapes are 404 on lookups, 400 on mutations.
 */
void test_handle_path_escape_mapping()
{
    HandlerFixture fx;
    ASSERT_EQ(fx.call("GET", "/api/fs/read", "", {{"path", "../HEAD"}}).status, 404);
    ASSERT_EQ(fx.call("GET", "/api/fs/list", "", {{"path", "../"}}).status, 404);
    ASSERT_EQ(fx.call("POST", "/api/fs/save", R"({"path":"../x","content":""})").status, 400);
    ASSERT_EQ(fx.call("POST", "/api/fs/rename", R"({"from":"a","to":"/etc/x"})").status, 400);
}

void test_handle_search()
{
    HandlerFixture fx;
    fx.workspace.write("FOO.txt", "");
    ASSERT_EQ(fx.call("GET", "/api/fs/search", "", {{"q", ""}}).status, 400);
    ASSERT_EQ(fx.call("GET", "/api/fs/search").status, 400);
    ASSERT_EQ(fx.call("GET", "/api/fs/search", "", {{"q", "x"}, {"path", "nope"}}).status, 404);

    Response r = fx.call("GET", "/api/fs/search", "", {{"q", "foo"}});
    ASSERT_EQ(r.status, 200);
    ASSERT_EQ(r.body, std::string(R"([{"path":"FOO.txt","matched":"name"}])"));
}

void test_handle_revisions()
{
    HandlerFixture fx;
    fx.workspace.write("seed.txt", "seed");

    Response snap = fx.call("POST", "/api/fs/snapshot");
    ASSERT_EQ(snap.status, 200);
    ASSERT_EQ(json_number(snap, "id"), 1.0);

    const auto zip = revfs::test::make_zip({{"imported.txt", "zipped", true}});
    cJSON* body = cJSON_CreateObject();
    cJSON_AddStringToObject(body, "zip_b64",
                            revfs::infra::Base64::encode(zip.data(), zip.size()).c_str());
    char* raw = cJSON_PrintUnformatted(body);
    const std::string payload = raw;
    free(raw);
    cJSON_Delete(body);

    Response created = fx.call("POST", "/api/revisions", payload);
    ASSERT_EQ(created.status, 200);
    ASSERT_EQ(json_number(created, "id"), 2.0);

    Response list = fx.call("GET", "/api/revisions");
    ASSERT_EQ(list.body, std::string(R"({"latest":2,"list":[0,1,2]})"));

    Response bad = fx.call("POST", "/api/revisions", R"({"zip_b64":"!!!"})");
    ASSERT_EQ(bad.status, 500);
    ASSERT_EQ(bad.body, std::string(R"({"status":"error","message":"internal error"})"));
}

void test_handle_revision_file()
{
    HandlerFixture fx;
    fx.workspace.write("doc.txt", "version zero");
    fx.store.snapshot();
    fx.workspace.write("doc.txt", "version one");

    Response r = fx.call("GET", "/api/revisions/file", "", {{"rev", "0"}, {"path", "doc.txt"}});
    ASSERT_EQ(r.status, 200);
    ASSERT_EQ(r.content_type, std::string("application/octet-stream"));
    ASSERT_EQ(r.file_size, static_cast<std::uint64_t>(12));
    ASSERT_EQ(r.disposition, std::string("attachment; filename=\"doc.txt\""));
    ASSERT_TRUE(r.file != nullptr);
    std::stringstream content;
    content << r.file->rdbuf();
    ASSERT_EQ(content.str(), std::string("version zero"));

    ASSERT_EQ(fx.call("GET", "/api/revisions/file", "", {{"rev", "abc"}, {"path", "doc.txt"}})
                  .status,
              400);
    ASSERT_EQ(fx.call("GET", "/api/revisions/file", "", {{"rev", "9"}, {"path", "doc.txt"}})
                  .status,
              404);
}
