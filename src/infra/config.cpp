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
 * @file config.cpp
 * @brief Layered configuration loading (file, environment, arguments).
 */

#include "revfs/infra/config.hpp"

#include "revfs/infra/string.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace revfs::infra {

namespace {

int parse_port(const std::string& text)
{
    auto value = String::parse_u64(String::trim(text));
    if (!value || *value == 0 || *value > 65535) {
        throw std::invalid_argument("invalid port: " + text);
    }
    return static_cast<int>(*value);
}

std::uint64_t parse_count(const std::string& name, const std::string& text)
{
    auto value = String::parse_u64(String::trim(text));
    if (!value) {
        throw std::invalid_argument("invalid value for " + name + ": " + text);
    }
    return *value;
}

std::uint64_t json_count(const cJSON* item, const char* key)
{
    if (!cJSON_IsNumber(item) || item->valuedouble < 0) {
        throw std::invalid_argument(std::string("config key '") + key +
                                    "' must be a non-negative number");
    }
    return static_cast<std::uint64_t>(item->valuedouble);
}

std::string json_string(const cJSON* item, const char* key)
{
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        throw std::invalid_argument(std::string("config key '") + key + "' must be a string");
    }
    return item->valuestring;
}

} // namespace

void Config::apply_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::invalid_argument("cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string text = buffer.str();

    std::unique_ptr<cJSON, decltype(&cJSON_Delete)> root(cJSON_Parse(text.c_str()), &cJSON_Delete);
    if (!root) {
        throw std::invalid_argument("config file is not valid JSON: " + path);
    }
    if (!cJSON_IsObject(root.get())) {
        throw std::invalid_argument("config file must contain a JSON object: " + path);
    }

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, root.get())
    {
        const std::string key = item->string ? item->string : "";
        if (key == "storage_root") {
            storage_root = json_string(item, "storage_root");
        } else if (key == "host") {
            host = json_string(item, "host");
        } else if (key == "port") {
            const std::uint64_t value = json_count(item, "port");
            if (value == 0 || value > 65535) {
                throw std::invalid_argument("config key 'port' out of range");
            }
            port = static_cast<int>(value);
        } else if (key == "workers") {
            workers = static_cast<size_t>(json_count(item, "workers"));
        } else if (key == "log_level") {
            log_level = Logger::parse_level(json_string(item, "log_level"));
        } else if (key == "max_request_bytes") {
            max_request_bytes = json_count(item, "max_request_bytes");
        } else if (key == "idle_timeout_secs") {
            idle_timeout_secs = json_count(item, "idle_timeout_secs");
        } else if (key == "max_archive_entries") {
            max_archive_entries = json_count(item, "max_archive_entries");
        } else if (key == "max_archive_bytes") {
            max_archive_bytes = json_count(item, "max_archive_bytes");
        } else if (key == "search_max_file_bytes") {
            search_max_file_bytes = json_count(item, "search_max_file_bytes");
        } else if (key == "confine_symlinks") {
            if (!cJSON_IsBool(item)) {
                throw std::invalid_argument("config key 'confine_symlinks' must be a boolean");
            }
            confine_symlinks = cJSON_IsTrue(item);
        } else {
            Logger::log(LogLevel::WARN, "Config: Ignoring unknown key '" + key + "'.");
        }
    }
}

void Config::apply_env()
{
    apply_env([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    });
}

void Config::apply_env(const EnvLookup& lookup)
{
    if (auto v = lookup("REVFS_STORAGE_ROOT"); v && !v->empty())
        storage_root = *v;
    if (auto v = lookup("REVFS_HOST"); v && !v->empty())
        host = *v;
    if (auto v = lookup("REVFS_PORT"); v && !v->empty())
        port = parse_port(*v);
    if (auto v = lookup("REVFS_WORKERS"); v && !v->empty())
        workers = static_cast<size_t>(parse_count("REVFS_WORKERS", *v));
    if (auto v = lookup("REVFS_LOG_LEVEL"); v && !v->empty())
        log_level = Logger::parse_level(*v);
    if (auto v = lookup("REVFS_IDLE_TIMEOUT"); v && !v->empty())
        idle_timeout_secs = parse_count("REVFS_IDLE_TIMEOUT", *v);
}

void Config::apply_args(const std::vector<std::string>& args)
{
    if (args.size() > 0)
        storage_root = args[0];
    if (args.size() > 1)
        port = parse_port(args[1]);
    if (args.size() > 2)
        throw std::invalid_argument("unexpected argument: " + args[2]);
}

size_t Config::effective_workers() const
{
    if (workers > 0) {
        return workers;
    }
    const unsigned hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

Config Config::from_command_line(int argc, char* argv[])
{
    Config config;
    std::optional<std::string> config_file;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                throw std::invalid_argument("--config requires a file path");
            }
            config_file = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    if (config_file) {
        config.apply_file(*config_file);
    }
    config.apply_env();
    config.apply_args(positional);
    return config;
}

} // namespace revfs::infra
