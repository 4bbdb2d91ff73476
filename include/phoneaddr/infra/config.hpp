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
 * @file config.hpp
 * @brief Process configuration, loaded once at startup.
 *
 * @details
 * Values are resolved from three layers, highest precedence first:
 * 1. The process environment.
 * 2. A `.env` file (`KEY=VALUE` per line).
 * 3. Built-in defaults.
 *
 * Variable names are matched case-insensitively, so `REDIS_URL`, `redis_url`
 * and `Redis_Url` all address the same setting. The resulting `Config` is a
 * plain value object: `main` builds it once and hands copies or const
 * references to the subsystems.
 */

#pragma once

#include "phoneaddr/infra/logger.hpp"

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

namespace phoneaddr::infra {

/**
 * @class ConfigError
 * @brief Raised for unparsable configuration values (bad port, bad boolean...).
 */
class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct Config
 * @brief Immutable runtime settings of the service.
 */
struct Config {
    /// @brief Display name, used as the OpenAPI title and `Server` header.
    std::string project_name = "Phone Address Service";

    /// @brief Mount point of the record routes; always `/`-prefixed, never `/`-suffixed.
    std::string api_v1_prefix = "/api/v1";

    /// @brief Redis connection URL (`redis://[[user]:password@]host[:port][/db]`).
    std::string redis_url = "redis://localhost:6379/0";

    /// @brief Listen address of the HTTP server.
    std::string host = "0.0.0.0";

    /// @brief Listen port of the HTTP server.
    int port = 8000;

    /// @brief Worker-pool size (connections served concurrently).
    size_t workers = default_workers();

    /// @brief Number of pooled Redis connections.
    size_t redis_pool_size = default_workers();

    /// @brief Redis connect and command timeout in milliseconds.
    int redis_timeout_ms = 2000;

    /// @brief Minimum log severity.
    LogLevel log_level = LogLevel::INFO;

    /// @brief Reduce phone keys to their digits before use.
    bool normalize_phone = false;

    /**
     * @brief Resolves the configuration from the environment and @p env_file.
     *
     * A missing `.env` file is not an error; an unreadable value is.
     *
     * @throws ConfigError On an invalid value.
     */
    static Config load(const std::string& env_file = ".env");

    /**
     * @brief Builds a configuration from already-collected raw values.
     *
     * @param values Setting name (lower-case) to raw string value. Unknown
     * names are ignored.
     * @throws ConfigError On an invalid value.
     */
    static Config from_values(const std::map<std::string, std::string>& values);

    /**
     * @brief Reads a dotenv-style file.
     *
     * Supports `#` comments, blank lines, an optional `export ` prefix and
     * single- or double-quoted values. Keys are lower-cased.
     *
     * @return The parsed values; empty if the file does not exist.
     */
    static std::map<std::string, std::string> parse_env_file(const std::string& path);

    /// @brief Default worker count: hardware concurrency, at least 2.
    static size_t default_workers();
};

} // namespace phoneaddr::infra
