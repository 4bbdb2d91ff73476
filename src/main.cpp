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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * Startup sequence:
 * 1. Argument parsing (`--env-file`, `--help`).
 * 2. Configuration loading (environment, `.env`, defaults).
 * 3. Signal handler registration (SIGINT/SIGTERM).
 * 4. Subsystem wiring: Redis store → record service → router → server.
 * 5. Accept loop until a stop signal arrives.
 */

#include "phoneaddr/infra/config.hpp"
#include "phoneaddr/infra/logger.hpp"
#include "phoneaddr/network/router.hpp"
#include "phoneaddr/network/server.hpp"
#include "phoneaddr/service/record_service.hpp"
#include "phoneaddr/storage/redis_store.hpp"

#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

using phoneaddr::infra::LogLevel;
using phoneaddr::infra::Logger;

/// @brief Active server, reachable from the signal handler.
static phoneaddr::network::Server* g_server = nullptr;

/**
 * @brief SIGINT/SIGTERM handler.
 *
 * Only calls the async-signal-safe `request_stop()`; logging happens once the
 * accept loop has returned.
 */
extern "C" void signal_handler(int)
{
    if (g_server) {
        g_server->request_stop();
    }
}

void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [--env-file PATH]\n"
              << "Options:\n"
              << "  --env-file PATH   dotenv file to read (Default: ./.env)\n"
              << "  --help            Show this help message\n"
              << "\n"
              << "Environment:\n"
              << "  REDIS_URL         Redis connection URL (Default: redis://localhost:6379/0)\n"
              << "  API_V1_PREFIX     Mount point of the API (Default: /api/v1)\n"
              << "  PROJECT_NAME      Service display name (Default: Phone Address Service)\n"
              << "  HOST, PORT        Listen address (Default: 0.0.0.0:8000)\n"
              << "  WORKERS           Worker threads (Default: CPU count, min 2)\n"
              << "  REDIS_POOL_SIZE   Pooled Redis connections (Default: WORKERS)\n"
              << "  REDIS_TIMEOUT_MS  Redis connect/command timeout (Default: 2000)\n"
              << "  LOG_LEVEL         trace|debug|info|warn|error|fatal (Default: info)\n"
              << "  NORMALIZE_PHONE   Store phones as digits only (Default: false)\n";
}

int main(int argc, char* argv[])
{
    std::string env_file = ".env";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_help(argv[0]);
            return 0;
        }
        if (arg == "--env-file" && i + 1 < argc) {
            env_file = argv[++i];
            continue;
        }
        std::cerr << "Unknown argument: " << arg << "\n";
        print_help(argv[0]);
        return 1;
    }

    try {
        phoneaddr::infra::Config config = phoneaddr::infra::Config::load(env_file);
        Logger::set_level(config.log_level);

        Logger::log(LogLevel::INFO, "System: Booting " + config.project_name + " v1.0.0...");
        Logger::log(LogLevel::INFO, "Config: API prefix '" + config.api_v1_prefix + "'");
        if (config.normalize_phone) {
            Logger::log(LogLevel::INFO, "Config: Phone normalization enabled.");
        }

        // Storage: the only process-wide shared resource, built once and injected.
        phoneaddr::storage::RedisStore store(
            phoneaddr::storage::RedisEndpoint::parse(config.redis_url), config.redis_pool_size,
            config.redis_timeout_ms);

        phoneaddr::service::RecordService service(store, config.normalize_phone);
        phoneaddr::network::Router router(service, store, config.project_name,
                                          config.api_v1_prefix);
        phoneaddr::network::Server server(router, config.host, config.port, config.workers);

        g_server = &server;
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        try {
            server.run();
        } catch (...) {
            g_server = nullptr;
            throw;
        }

        g_server = nullptr;
        Logger::log(LogLevel::WARN, "System: Stop signal received, shutting down.");
    } catch (const phoneaddr::infra::ConfigError& e) {
        Logger::log(LogLevel::FATAL, std::string("Config: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    Logger::log(LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
