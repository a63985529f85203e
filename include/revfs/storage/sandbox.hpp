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
 * @file sandbox.hpp
 * @brief Confinement of client-supplied paths to a physical root directory.
 *
 * @details
 * `Sandbox::resolve` is the only way a client path becomes a physical path.
 * It is purely syntactic: `..`, absolute markers and any other non-normal
 * component are refused, `.` is dropped. `Sandbox::confine` adds the optional
 * symlink-aware check on top.
 */

#pragma once

#include <filesystem>
#include <string_view>

namespace revfs::storage {

/**
 * @class Sandbox
 * @brief Stateless path resolver.
 */
class Sandbox {
  public:
    /**
     * @brief Maps `relative` onto `root`.
     *
     * Components are separated by `/`. Empty components (from `a//b` or a
     * trailing slash) and `.` are skipped, so `""` and `"."` resolve to `root`
     * itself.
     *
     * @throws StorageError `PathEscape` if a component is `..`, the path is
     * absolute, or a component is a drive prefix such as `C:`.
     *
     * @code
     * Sandbox::resolve("/srv/ws/3", "docs/./a.txt"); // "/srv/ws/3/docs/a.txt"
     * Sandbox::resolve("/srv/ws/3", "../2/a.txt");   // throws PathEscape
     * @endcode
     */
    static std::filesystem::path resolve(const std::filesystem::path& root,
                                         std::string_view relative);

    /**
     * @brief Verifies that `physical` really lives under `root`.
     *
     * Both paths are canonicalized with symlinks followed; a missing tail of
     * `physical` is tolerated (`weakly_canonical`) so the check also works for
     * files about to be created.
     *
     * @throws StorageError `PathEscape` if the resolved location is outside
     * the resolved root.
     */
    static void confine(const std::filesystem::path& root, const std::filesystem::path& physical);

    /// @brief True if `candidate` equals `base` or is lexically below it.
    static bool is_within(const std::filesystem::path& base,
                          const std::filesystem::path& candidate);
};

} // namespace revfs::storage
