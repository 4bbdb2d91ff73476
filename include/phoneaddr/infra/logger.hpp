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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for the Phone Address Service.
 *
 * @details
 * Every subsystem (bootstrap, HTTP transport, routing, Redis adapter) reports
 * through this single static interface. Entries are written whole under a
 * lock, so lines coming from concurrent workers never interleave. A
 * process-wide threshold, configured from `LOG_LEVEL`, filters out entries
 * below the requested severity.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace phoneaddr::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-command details (raw Redis commands, parser state).
    DEBUG, ///< Diagnostic information for development and troubleshooting.
    INFO,  ///< Nominal operational events (startup, request log).
    WARN,  ///< Non-blocking anomalies (rejected payloads, degraded health).
    ERROR, ///< Recoverable failures (store unreachable for one request).
    FATAL  ///< Startup failures that terminate the process.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * `TRACE`, `DEBUG` and `INFO` go to `std::cout`; `WARN` and above go to
 * `std::cerr`. Each entry carries a timestamp and a colored severity tag.
 */
class Logger {
  public:
    /**
     * @brief Writes a diagnostic message if it passes the current threshold.
     *
     * @param level The severity classification of the message.
     * @param message The content payload, conventionally prefixed with the
     * subsystem name (e.g. `"Storage: ..."`).
     *
     * @code
     * phoneaddr::infra::Logger::log(LogLevel::INFO, "Network: Listening on 0.0.0.0:8000");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that will be emitted.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a textual level name (`trace`, `debug`, `info`, `warn`,
     * `warning`, `error`, `fatal`), case-insensitively.
     *
     * @return The level, or `std::nullopt` for an unknown name.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// @brief Serializes access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum emitted severity.
    static std::atomic<LogLevel> threshold_;
};

} // namespace phoneaddr::infra
