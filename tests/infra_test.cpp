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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives.
 *
 * @details
 * Covers string processing, base64, configuration layering, log level
 * parsing, and the worker pool.
 */

#include "framework.hpp"
#include "revfs/infra/base64.hpp"
#include "revfs/infra/config.hpp"
#include "revfs/infra/logger.hpp"
#include "revfs/infra/scheduler.hpp"
#include "revfs/infra/string.hpp"

#include <atomic>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>

using revfs::infra::Base64;
using revfs::infra::Config;
using revfs::infra::String;

/**
 * @brief Tests the `String::trim` algorithm with nominal input.
 *
 * Scenarios verified:
 * - Elimination of leading/trailing space characters.
 * - Integrity of internal whitespace.
 */
void test_string_trim()
{
    std::string clean = String::trim("   hello revfs   ");
    ASSERT_EQ(clean, std::string("hello revfs"));
}

/**
 * @brief Strings made only of whitespace collapse to empty.
 */
void test_string_trim_empty()
{
    std::string result = String::trim("  \t\n  \r ");
    ASSERT_EQ(result, std::string(""));
    ASSERT_EQ(result.length(), static_cast<size_t>(0));
}

void test_string_to_lower_ascii_only()
{
    ASSERT_EQ(String::to_lower("FOO.Txt"), std::string("foo.txt"));
    // Multi-byte sequences pass through untouched.
    ASSERT_EQ(String::to_lower("\xC3\x84Z"), std::string("\xC3\x84z"));
}

/**
 * @brief UTF-8 validation accepts well-formed text and rejects the classic traps.
 */
void test_string_utf8_validation()
{
    ASSERT_TRUE(String::is_valid_utf8("plain ascii"));
    ASSERT_TRUE(String::is_valid_utf8("gr\xC3\xBC\xC3\x9F" "e \xE2\x82\xAC \xF0\x9F\x98\x80"));
    ASSERT_FALSE(String::is_valid_utf8("\xFF\xFE"));
    ASSERT_FALSE(String::is_valid_utf8("\xC0\xAF"));         // overlong '/'
    ASSERT_FALSE(String::is_valid_utf8("\xED\xA0\x80"));     // surrogate
    ASSERT_FALSE(String::is_valid_utf8("\xE2\x82"));         // truncated
}

void test_string_url_decode()
{
    ASSERT_EQ(String::url_decode("a%2Fb+c").value_or("?"), std::string("a/b c"));
    ASSERT_EQ(String::url_decode("%E2%82%AC").value_or("?"), std::string("\xE2\x82\xAC"));
    ASSERT_FALSE(String::url_decode("bad%2").has_value());
    ASSERT_FALSE(String::url_decode("bad%zz").has_value());
}

void test_string_split_keeps_empty_fields()
{
    const auto parts = String::split("a//b/", '/');
    ASSERT_EQ(parts.size(), static_cast<size_t>(4));
    ASSERT_EQ(parts[0], std::string("a"));
    ASSERT_EQ(parts[1], std::string(""));
    ASSERT_EQ(parts[2], std::string("b"));
    ASSERT_EQ(parts[3], std::string(""));
}

void test_string_parse_u64()
{
    ASSERT_EQ(String::parse_u64("42").value_or(0), static_cast<std::uint64_t>(42));
    ASSERT_FALSE(String::parse_u64("").has_value());
    ASSERT_FALSE(String::parse_u64("-1").has_value());
    ASSERT_FALSE(String::parse_u64("12a").has_value());
    ASSERT_FALSE(String::parse_u64("99999999999999999999999").has_value());
}

/**
 * @brief Known-answer vectors from RFC 4648 section 10.
 */
void test_base64_known_vectors()
{
    ASSERT_EQ(Base64::encode(""), std::string(""));
    ASSERT_EQ(Base64::encode("f"), std::string("Zg=="));
    ASSERT_EQ(Base64::encode("fo"), std::string("Zm8="));
    ASSERT_EQ(Base64::encode("foobar"), std::string("Zm9vYmFy"));

    auto decoded = Base64::decode("Zm9v\r\nYmE=");
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(std::string(decoded->begin(), decoded->end()), std::string("fooba"));
}

void test_base64_rejects_malformed()
{
    ASSERT_FALSE(Base64::decode("Zm9").has_value());
    ASSERT_FALSE(Base64::decode("Zm=v").has_value());
    ASSERT_FALSE(Base64::decode("Zm9v!A==").has_value());
}

void test_log_level_parsing()
{
    ASSERT_TRUE(revfs::infra::Logger::parse_level("WARNING") == revfs::infra::LogLevel::WARN);
    ASSERT_TRUE(revfs::infra::Logger::parse_level(" debug ") == revfs::infra::LogLevel::DEBUG);

    bool threw = false;
    try {
        revfs::infra::Logger::parse_level("loud");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

/**
 * @brief Each configuration layer overrides the previous one.
 *
 * defaults -> file -> environment -> positional arguments.
 */
void test_config_layering()
{
    revfs::test::TempDir dir;
    const auto file = dir.path() / "revfs.json";
    {
        std::ofstream out(file);
        out << R"({"storage_root":"/from/file","port":4000,"max_archive_entries":7,)"
            << R"("confine_symlinks":false,"log_level":"debug","idle_timeout_secs":9})";
    }

    Config config;
    ASSERT_EQ(config.storage_root, std::string("./decisions"));
    ASSERT_EQ(config.port, 3000);

    config.apply_file(file.string());
    ASSERT_EQ(config.storage_root, std::string("/from/file"));
    ASSERT_EQ(config.port, 4000);
    ASSERT_EQ(config.max_archive_entries, static_cast<std::uint64_t>(7));
    ASSERT_FALSE(config.confine_symlinks);
    ASSERT_TRUE(config.log_level == revfs::infra::LogLevel::DEBUG);
    ASSERT_EQ(config.idle_timeout_secs, static_cast<std::uint64_t>(9));

    std::map<std::string, std::string> env = {{"REVFS_PORT", "5000"},
                                                  {"REVFS_WORKERS", "3"},
                                                  {"REVFS_IDLE_TIMEOUT", "2"}};
    config.apply_env([&](const std::string& name) -> std::optional<std::string> {
        auto it = env.find(name);
        if (it == env.end()) {
            return std::nullopt;
        }
        return it->second;
    });
    ASSERT_EQ(config.port, 5000);
    ASSERT_EQ(config.effective_workers(), static_cast<size_t>(3));
    ASSERT_EQ(config.idle_timeout_secs, static_cast<std::uint64_t>(2));
    ASSERT_EQ(config.storage_root, std::string("/from/file"));

    config.apply_args({"/from/args", "6000"});
    ASSERT_EQ(config.storage_root, std::string("/from/args"));
    ASSERT_EQ(config.port, 6000);
}

void test_config_rejects_bad_values()
{
    Config config;
    bool threw = false;
    try {
        config.apply_args({"./root", "70000"});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw);

    threw = false;
    try {
        config.apply_file("/nonexistent/revfs.json");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

/**
 * @brief `submit` returns results through futures and propagates exceptions.
 */
void test_scheduler_submit()
{
    revfs::infra::Scheduler scheduler(2);
    ASSERT_EQ(scheduler.size(), static_cast<size_t>(2));

    auto answer = scheduler.submit([] { return 6 * 7; });
    ASSERT_EQ(answer.get(), 42);

    auto failing = scheduler.submit([]() -> int { throw std::runtime_error("boom"); });
    bool threw = false;
    try {
        failing.get();
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ASSERT_TRUE(threw);
}

/**
 * @brief Destruction drains the queue; a throwing task does not kill its worker.
 */
void test_scheduler_drains_on_shutdown()
{
    std::atomic<int> done{0};
    {
        revfs::infra::Scheduler scheduler(1);
        scheduler.enqueue([] { throw std::runtime_error("contained"); });
        for (int i = 0; i < 50; ++i) {
            scheduler.enqueue([&done] { done++; });
        }
    }
    ASSERT_EQ(done.load(), 50);
}
