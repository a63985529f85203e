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
 * @file error.cpp
 * @brief Names for storage error kinds.
 */

#include "revfs/storage/error.hpp"

namespace revfs::storage {

const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::PathEscape:
        return "path_escape";
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::BadRequest:
        return "bad_request";
    case ErrorKind::Internal:
        return "internal";
    }
    return "internal";
}

} // namespace revfs::storage
