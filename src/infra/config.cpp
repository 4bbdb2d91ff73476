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
 * @brief Environment and dotenv resolution for `Config`.
 */

#include "phoneaddr/infra/config.hpp"

#include "phoneaddr/infra/string.hpp"

#include <fstream>
#include <thread>

extern char** environ;

namespace phoneaddr::infra {

namespace {

long parse_integer(const std::string& key, const std::string& raw, long min, long max)
{
    std::string value = String::trim(raw);
    size_t consumed = 0;
    long parsed = 0;
    try {
        parsed = std::stol(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": '" + raw + "'");
    }
    if (consumed != value.size()) {
        throw ConfigError("Invalid integer for " + key + ": '" + raw + "'");
    }
    if (parsed < min || parsed > max) {
        throw ConfigError("Value of " + key + " out of range [" + std::to_string(min) + ", " +
                          std::to_string(max) + "]: " + value);
    }
    return parsed;
}

bool parse_bool(const std::string& key, const std::string& raw)
{
    std::string value = String::to_lower(String::trim(raw));
    if (value == "1" || value == "true" || value == "yes" || value == "on")
        return true;
    if (value == "0" || value == "false" || value == "no" || value == "off" || value.empty())
        return false;
    throw ConfigError("Invalid boolean for " + key + ": '" + raw + "'");
}

// "/api/v1/" -> "/api/v1", "api" -> "/api", "/" -> ""
std::string normalize_prefix(const std::string& raw)
{
    std::string prefix = String::trim(raw);
    while (!prefix.empty() && prefix.back() == '/') {
        prefix.pop_back();
    }
    if (!prefix.empty() && prefix.front() != '/') {
        prefix.insert(prefix.begin(), '/');
    }
    return prefix;
}

} // namespace

size_t Config::default_workers()
{
    size_t hw = std::thread::hardware_concurrency();
    return hw < 2 ? 2 : hw;
}

std::map<std::string, std::string> Config::parse_env_file(const std::string& path)
{
    std::map<std::string, std::string> values;

    std::ifstream file(path);
    if (!file.is_open()) {
        return values;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = String::trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (String::starts_with(line, "export ")) {
            line = String::trim(line.substr(7));
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            Logger::log(LogLevel::WARN, "Config: Ignoring malformed line in " + path + ": " + line);
            continue;
        }

        std::string key = String::to_lower(String::trim(line.substr(0, eq)));
        std::string value = String::trim(line.substr(eq + 1));

        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            values[key] = value;
        }
    }
    return values;
}

Config Config::from_values(const std::map<std::string, std::string>& values)
{
    Config cfg;

    auto it = values.find("project_name");
    if (it != values.end())
        cfg.project_name = it->second;

    it = values.find("api_v1_prefix");
    if (it != values.end())
        cfg.api_v1_prefix = normalize_prefix(it->second);

    it = values.find("redis_url");
    if (it != values.end())
        cfg.redis_url = String::trim(it->second);

    it = values.find("host");
    if (it != values.end())
        cfg.host = String::trim(it->second);

    it = values.find("port");
    if (it != values.end())
        cfg.port = static_cast<int>(parse_integer("PORT", it->second, 1, 65535));

    it = values.find("workers");
    if (it != values.end())
        cfg.workers = static_cast<size_t>(parse_integer("WORKERS", it->second, 1, 1024));

    // The pool follows the worker count unless set explicitly.
    cfg.redis_pool_size = cfg.workers;
    it = values.find("redis_pool_size");
    if (it != values.end())
        cfg.redis_pool_size =
            static_cast<size_t>(parse_integer("REDIS_POOL_SIZE", it->second, 1, 1024));

    it = values.find("redis_timeout_ms");
    if (it != values.end())
        cfg.redis_timeout_ms =
            static_cast<int>(parse_integer("REDIS_TIMEOUT_MS", it->second, 1, 600000));

    it = values.find("log_level");
    if (it != values.end()) {
        auto level = Logger::parse_level(it->second);
        if (!level) {
            throw ConfigError("Invalid LOG_LEVEL: '" + it->second + "'");
        }
        cfg.log_level = *level;
    }

    it = values.find("normalize_phone");
    if (it != values.end())
        cfg.normalize_phone = parse_bool("NORMALIZE_PHONE", it->second);

    return cfg;
}

Config Config::load(const std::string& env_file)
{
    std::map<std::string, std::string> values = parse_env_file(env_file);
    if (!values.empty()) {
        Logger::log(LogLevel::DEBUG, "Config: Loaded " + std::to_string(values.size()) +
                                         " value(s) from " + env_file);
    }

    // The process environment overrides the file.
    for (char** env = environ; env && *env; ++env) {
        std::string entry(*env);
        size_t eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        values[String::to_lower(entry.substr(0, eq))] = entry.substr(eq + 1);
    }

    return from_values(values);
}

} // namespace phoneaddr::infra
