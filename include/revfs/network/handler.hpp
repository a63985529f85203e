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
 * @file handler.hpp
 * @brief Route dispatcher between the HTTP transport and the storage layer.
 *
 * @details
 * This header declares the `Handler` class, the application layer of the
 * service. It decodes JSON bodies and query parameters, invokes the workspace,
 * revision or archive operation, and converts results and `StorageError`s into
 * HTTP responses.
 */

#pragma once

#include "revfs/archive/pipeline.hpp"
#include "revfs/network/http.hpp"
#include "revfs/storage/revision_store.hpp"
#include "revfs/storage/workspace.hpp"

namespace revfs::network {

/**
 * @struct Services
 * @brief The storage objects shared by every request.
 */
struct Services {
    storage::RevisionStore& store;
    storage::Workspace& workspace;
    archive::ArchivePipeline& archive;
};

/**
 * @class Handler
 * @brief A static controller mapping requests to storage operations.
 *
 * @details
 * **Error Mapping:**
 * - `NotFound` -> 404.
 * - `PathEscape` -> 404 on GET lookups, 400 on mutations.
 * - `BadRequest` -> 400.
 * - `Internal` and any other `std::exception` -> 500 with a generic message;
 *   the detail is logged at ERROR.
 *
 * Unknown paths yield 404, known paths with the wrong method 405.
 */
class Handler {
  public:
    /**
     * @brief Processes one request. Never throws.
     *
     * @param services Shared storage objects.
     * @param request The parsed HTTP request.
     * @return The response to send; may carry an open file stream.
     */
    static Response process(const Services& services, const Request& request);

  private:
    static Response dispatch(const Services& services, const Request& request);
};

} // namespace revfs::network
