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
 * @file error.hpp
 * @brief Error taxonomy shared by the storage and archive layers.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace revfs::storage {

/**
 * @enum ErrorKind
 * @brief Classifies a failure by who is responsible for it.
 */
enum class ErrorKind {
    PathEscape, ///< The client addressed something outside the sandbox.
    NotFound,   ///< The address resolves to nothing.
    BadRequest, ///< Missing or malformed input (e.g. an empty search query).
    Internal    ///< Unexpected I/O or decode failure; details are never sent to clients.
};

/// @brief Stable lowercase name of a kind, used in logs.
const char* to_string(ErrorKind kind);

/**
 * @class StorageError
 * @brief Exception thrown by every storage-layer operation.
 *
 * `what()` carries the operator-facing detail. The network layer decides how
 * much of it a client gets to see based on `kind()`.
 */
class StorageError : public std::runtime_error {
  public:
    StorageError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const noexcept { return kind_; }

  private:
    ErrorKind kind_;
};

} // namespace revfs::storage
