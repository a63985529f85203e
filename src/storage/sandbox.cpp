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
 * @file sandbox.cpp
 * @brief Implementation of the path sandbox and the error kind names.
 */

#include "revfs/storage/sandbox.hpp"

#include "revfs/infra/string.hpp"
#include "revfs/storage/error.hpp"

#include <iterator>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace revfs::storage {

namespace {

bool looks_like_drive_prefix(const std::string& component)
{
    return component.size() >= 2 && component[1] == ':' &&
           ((component[0] >= 'a' && component[0] <= 'z') ||
            (component[0] >= 'A' && component[0] <= 'Z'));
}

} // namespace

fs::path Sandbox::resolve(const fs::path& root, std::string_view relative)
{
    if (!relative.empty() && relative.front() == '/') {
        throw StorageError(ErrorKind::PathEscape,
                           "absolute path rejected: " + std::string(relative));
    }

    fs::path out = root;
    for (const std::string& component : infra::String::split(relative, '/')) {
        if (component.empty() || component == ".") {
            continue;
        }
        if (component == "..") {
            throw StorageError(ErrorKind::PathEscape,
                               "parent traversal rejected: " + std::string(relative));
        }
        if (looks_like_drive_prefix(component) || component.find('\0') != std::string::npos) {
            throw StorageError(ErrorKind::PathEscape,
                               "non-normal path component rejected: " + std::string(relative));
        }
        out /= component;
    }
    return out;
}

bool Sandbox::is_within(const fs::path& base, const fs::path& candidate)
{
    auto b = base.begin();
    auto c = candidate.begin();
    for (; b != base.end(); ++b, ++c) {
        // A trailing separator on `base` shows up as an empty final element.
        if (b->empty() && std::next(b) == base.end()) {
            return true;
        }
        if (c == candidate.end() || *b != *c) {
            return false;
        }
    }
    return true;
}

void Sandbox::confine(const fs::path& root, const fs::path& physical)
{
    std::error_code ec;
    const fs::path real_root = fs::weakly_canonical(root, ec);
    if (ec) {
        throw StorageError(ErrorKind::Internal,
                           "cannot canonicalize root " + root.string() + ": " + ec.message());
    }
    const fs::path real_target = fs::weakly_canonical(physical, ec);
    if (ec) {
        throw StorageError(ErrorKind::Internal, "cannot canonicalize " + physical.string() +
                                                    ": " + ec.message());
    }
    if (!is_within(real_root, real_target)) {
        throw StorageError(ErrorKind::PathEscape,
                           "symlink leaves sandbox: " + physical.string() + " -> " +
                               real_target.string());
    }
}

} // namespace revfs::storage
