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
 * @file search_test.cpp
 * @brief Unit tests for name/content search.
 */

#include "framework.hpp"
#include "revfs/storage/search.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using revfs::storage::MatchKind;
using revfs::storage::search;

/**
 * @brief One name hit, one content hit, nothing else.
 */
void test_search_name_and_content()
{
    revfs::test::TempDir dir;
    fs::create_directories(dir.path() / "sub");
    std::ofstream(dir.path() / "FOO.txt") << "nothing here";
    std::ofstream(dir.path() / "sub" / "bar.txt") << "this mentions Foo twice: foo";
    std::ofstream(dir.path() / "baz.txt") << "unrelated";

    const auto hits = search(dir.path(), "", "foo");
    ASSERT_EQ(hits.size(), static_cast<size_t>(2));
    ASSERT_EQ(hits[0].path, std::string("FOO.txt"));
    ASSERT_TRUE(hits[0].matched == MatchKind::Name);
    ASSERT_EQ(hits[1].path, std::string("sub/bar.txt"));
    ASSERT_TRUE(hits[1].matched == MatchKind::Content);
}

void test_search_name_wins_over_content()
{
    revfs::test::TempDir dir;
    std::ofstream(dir.path() / "notes-foo.md") << "foo foo foo";

    const auto hits = search(dir.path(), "", "FOO");
    ASSERT_EQ(hits.size(), static_cast<size_t>(1));
    ASSERT_TRUE(hits[0].matched == MatchKind::Name);
}

void test_search_subtree_paths_stay_workspace_relative()
{
    revfs::test::TempDir dir;
    fs::create_directories(dir.path() / "a" / "b");
    std::ofstream(dir.path() / "a" / "b" / "needle.txt") << "";
    std::ofstream(dir.path() / "needle-top.txt") << "";

    const auto hits = search(dir.path(), "a", "needle");
    ASSERT_EQ(hits.size(), static_cast<size_t>(1));
    ASSERT_EQ(hits[0].path, std::string("a/b/needle.txt"));
}

void test_search_skips_oversized_and_binary()
{
    revfs::test::TempDir dir;
    std::ofstream(dir.path() / "big.txt") << std::string(64, 'x') << "needle";
    std::ofstream(dir.path() / "blob.bin", std::ios::binary) << std::string("\xFF\xFE" "needle");

    ASSERT_TRUE(search(dir.path(), "", "needle", 32).empty());
}

void test_search_errors()
{
    revfs::test::TempDir dir;
    ASSERT_THROWS_KIND(search(dir.path(), "", ""), BadRequest);
    ASSERT_THROWS_KIND(search(dir.path(), "missing", "x"), NotFound);
    ASSERT_THROWS_KIND(search(dir.path(), "../..", "x"), PathEscape);
}
