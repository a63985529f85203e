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
 * @file workspace.cpp
 * @brief Implementation of the working-copy file operations.
 */

#include "revfs/storage/workspace.hpp"

#include "revfs/infra/logger.hpp"
#include "revfs/infra/string.hpp"
#include "revfs/storage/error.hpp"
#include "revfs/storage/sandbox.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace revfs::storage {

namespace {

void ensure_parent(const fs::path& target)
{
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageError(ErrorKind::Internal, "mkdir -p " + target.parent_path().string() +
                                                    " failed: " + ec.message());
    }
}

} // namespace

Workspace::Workspace(RevisionStore& store, WorkspaceOptions options)
    : store_(store), options_(options)
{
}

fs::path Workspace::locate(const fs::path& base, const std::string& path) const
{
    fs::path target = Sandbox::resolve(base, path);
    if (options_.confine_symlinks) {
        Sandbox::confine(base, target);
    }
    return target;
}

std::vector<Node> Workspace::list(const std::string& path) const
{
    const fs::path base = store_.working_dir();
    const fs::path target = locate(base, path);

    std::error_code ec;
    if (!fs::exists(target, ec)) {
        throw StorageError(ErrorKind::NotFound, "no such directory: " + path);
    }
    return build_tree(target, path,
                      options_.confine_symlinks ? std::optional<fs::path>(base) : std::nullopt);
}

std::string Workspace::read(const std::string& path) const
{
    const fs::path target = locate(store_.working_dir(), path);

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw StorageError(ErrorKind::NotFound, "no such file: " + path);
    }

    std::ifstream file(target, std::ios::binary);
    if (!file.is_open()) {
        throw StorageError(ErrorKind::Internal, "cannot open " + target.string());
    }
    std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw StorageError(ErrorKind::Internal, "read failed: " + target.string());
    }
    // NUL is valid UTF-8 but cannot cross the JSON layer's C strings intact.
    if (!infra::String::is_valid_utf8(content) || content.find('\0') != std::string::npos) {
        throw StorageError(ErrorKind::Internal, "file is not UTF-8 text: " + target.string());
    }
    return content;
}

void Workspace::write(const std::string& path, const std::string& content) const
{
    const fs::path base = store_.working_dir();
    const fs::path target = locate(base, path);
    if (target == base) {
        throw StorageError(ErrorKind::BadRequest, "cannot write to the workspace root");
    }
    ensure_parent(target);

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw StorageError(ErrorKind::Internal, "cannot open for write: " + target.string());
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.flush();
    if (!file) {
        throw StorageError(ErrorKind::Internal, "write failed: " + target.string());
    }
    infra::Logger::log(infra::LogLevel::DEBUG, "Storage: Wrote " + path + " (" +
                                                   std::to_string(content.size()) + " bytes)");
}

void Workspace::rename(const std::string& from, const std::string& to) const
{
    const fs::path base = store_.working_dir();
    const fs::path src = Sandbox::resolve(base, from);
    const fs::path dst = Sandbox::resolve(base, to);
    if (src == base || dst == base) {
        throw StorageError(ErrorKind::BadRequest, "cannot rename the workspace root");
    }
    if (options_.confine_symlinks) {
        // Only the containing directories must stay inside; the entry itself
        // may be a link, which rename(2) moves without following.
        Sandbox::confine(base, src.parent_path());
        Sandbox::confine(base, dst.parent_path());
    }

    ensure_parent(dst);

    std::error_code ec;
    fs::rename(src, dst, ec);
    if (ec) {
        throw StorageError(ErrorKind::Internal,
                           "rename " + from + " -> " + to + " failed: " + ec.message());
    }
}

void Workspace::remove(const std::string& path) const
{
    const fs::path base = store_.working_dir();
    const fs::path target = Sandbox::resolve(base, path);
    if (target == base) {
        throw StorageError(ErrorKind::BadRequest, "cannot delete the workspace root");
    }
    if (options_.confine_symlinks) {
        Sandbox::confine(base, target.parent_path());
    }

    std::error_code ec;
    const fs::file_status status = fs::symlink_status(target, ec);
    if (ec || !fs::exists(status)) {
        throw StorageError(ErrorKind::NotFound, "no such path: " + path);
    }

    if (fs::is_directory(status)) {
        fs::remove_all(target, ec);
    } else {
        fs::remove(target, ec);
    }
    if (ec) {
        throw StorageError(ErrorKind::Internal, "delete " + path + " failed: " + ec.message());
    }
}

void Workspace::mkdir(const std::string& path) const
{
    const fs::path target = locate(store_.working_dir(), path);
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        throw StorageError(ErrorKind::Internal, "mkdir " + path + " failed: " + ec.message());
    }
}

std::vector<SearchHit> Workspace::search(const std::string& path, const std::string& query) const
{
    const fs::path base = store_.working_dir();
    if (options_.confine_symlinks) {
        Sandbox::confine(base, Sandbox::resolve(base, path));
    }
    return storage::search(base, path, query, options_.search_max_file_bytes,
                           options_.confine_symlinks);
}

} // namespace revfs::storage
