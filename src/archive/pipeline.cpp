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
 * @file pipeline.cpp
 * @brief Implementation of archive import and revision file export.
 */

#include "revfs/archive/pipeline.hpp"

#include "revfs/archive/zip_reader.hpp"
#include "revfs/infra/base64.hpp"
#include "revfs/infra/logger.hpp"
#include "revfs/storage/error.hpp"
#include "revfs/storage/sandbox.hpp"

#include <system_error>

namespace fs = std::filesystem;

using revfs::storage::ErrorKind;
using revfs::storage::Sandbox;
using revfs::storage::StorageError;

namespace revfs::archive {

ArchivePipeline::ArchivePipeline(storage::RevisionStore& store, ArchiveLimits limits,
                                 bool confine_symlinks)
    : store_(store), limits_(limits), confine_symlinks_(confine_symlinks)
{
}

std::uint64_t ArchivePipeline::import_base64(std::string_view text)
{
    auto bytes = infra::Base64::decode(text);
    if (!bytes) {
        throw StorageError(ErrorKind::Internal, "archive payload is not valid base64");
    }
    return import_archive(std::move(*bytes));
}

std::uint64_t ArchivePipeline::import_archive(std::vector<std::uint8_t> bytes)
{
    const size_t payload_size = bytes.size();
    std::unique_ptr<ZipReader> reader;
    try {
        reader = std::make_unique<ZipReader>(std::move(bytes));
    } catch (const ZipError& e) {
        throw StorageError(ErrorKind::Internal, std::string("malformed archive: ") + e.what());
    }

    const std::vector<ZipEntry>& entries = reader->entries();
    if (entries.size() > limits_.max_entries) {
        throw StorageError(ErrorKind::Internal,
                           "archive has " + std::to_string(entries.size()) +
                               " entries, limit is " + std::to_string(limits_.max_entries));
    }

    // Validate before allocating so a hostile or broken payload burns no id.
    std::uint64_t declared = 0;
    for (const ZipEntry& entry : entries) {
        if (entry.uncompressed_size > limits_.max_total_bytes - declared) {
            throw StorageError(ErrorKind::Internal,
                               "archive expands beyond " +
                                   std::to_string(limits_.max_total_bytes) + " bytes");
        }
        declared += entry.uncompressed_size;

        fs::path target;
        try {
            target = Sandbox::resolve(store_.root(), entry.name);
        } catch (const StorageError& e) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Archive: Rejected entry '" + entry.name + "': " + e.what());
            throw StorageError(ErrorKind::Internal, "archive entry escapes the revision: " +
                                                        entry.name);
        }
        if (target == store_.root() && !entry.is_directory()) {
            throw StorageError(ErrorKind::Internal, "archive file entry has no name");
        }
    }

    const std::uint64_t id = store_.create_revision([&](const fs::path& dir, std::uint64_t rev) {
        std::uint64_t remaining = limits_.max_total_bytes;
        std::error_code ec;

        for (const ZipEntry& entry : entries) {
            const fs::path target = Sandbox::resolve(dir, entry.name);

            if (entry.is_directory()) {
                fs::create_directories(target, ec);
                if (ec) {
                    throw StorageError(ErrorKind::Internal, "mkdir " + target.string() +
                                                                " failed: " + ec.message());
                }
                continue;
            }

            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                throw StorageError(ErrorKind::Internal, "mkdir " +
                                                            target.parent_path().string() +
                                                            " failed: " + ec.message());
            }

            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw StorageError(ErrorKind::Internal, "cannot create " + target.string());
            }
            try {
                remaining -= reader->extract(entry, out, remaining);
            } catch (const ZipError& e) {
                throw StorageError(ErrorKind::Internal, e.what());
            }
            out.close();
            if (!out) {
                throw StorageError(ErrorKind::Internal, "write failed: " + target.string());
            }
            infra::Logger::log(infra::LogLevel::TRACE, "Archive: Extracted " + entry.name);
        }

        infra::Logger::log(infra::LogLevel::INFO,
                           "Archive: Imported " + std::to_string(entries.size()) +
                               " entries into revision " + std::to_string(rev) + ".");
    });

    infra::Logger::log(infra::LogLevel::DEBUG, "Archive: Payload of " +
                                                   std::to_string(payload_size) +
                                                   " bytes became revision " + std::to_string(id));
    return id;
}

RevisionFile ArchivePipeline::open_file(std::uint64_t rev, const std::string& path) const
{
    if (!store_.exists(rev)) {
        throw StorageError(ErrorKind::NotFound, "no such revision: " + std::to_string(rev));
    }

    const fs::path base = store_.revision_dir(rev);
    fs::path target;
    try {
        target = Sandbox::resolve(base, path);
        if (confine_symlinks_) {
            Sandbox::confine(base, target);
        }
    } catch (const StorageError& e) {
        if (e.kind() != ErrorKind::PathEscape) {
            throw;
        }
        throw StorageError(ErrorKind::NotFound, e.what());
    }

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw StorageError(ErrorKind::NotFound,
                           "no such file in revision " + std::to_string(rev) + ": " + path);
    }
    const std::uint64_t size = fs::file_size(target, ec);
    if (ec) {
        throw StorageError(ErrorKind::Internal, "cannot stat " + target.string());
    }

    RevisionFile file;
    file.stream = std::make_unique<std::ifstream>(target, std::ios::binary);
    if (!file.stream->is_open()) {
        throw StorageError(ErrorKind::Internal, "cannot open " + target.string());
    }
    file.size = size;
    file.name = target.filename().string();
    return file;
}

} // namespace revfs::archive
