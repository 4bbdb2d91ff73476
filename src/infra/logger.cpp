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
 * @file logger.cpp
 * @brief Implementation of the thread-safe diagnostic logging utility.
 *
 * @details
 * Concrete implementation of the `Logger` class: level filtering against the
 * process-wide threshold loaded from `LOG_LEVEL`, timestamp formatting,
 * severity tagging and ANSI color-coded output. Every subsystem of the
 * service (boot, config, storage, HTTP) reports through this one sink.
 */

#include "phoneaddr/infra/logger.hpp"

#include "phoneaddr/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace phoneaddr::infra {

// Define and initialize the static synchronization primitive and the threshold.
std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::threshold_{LogLevel::INFO};

void Logger::set_level(LogLevel level)
{
    threshold_.store(level);
}

LogLevel Logger::level()
{
    return threshold_.load();
}

/**
 * @brief Maps a `LOG_LEVEL` value to a severity.
 *
 * @details
 * Matching ignores case and surrounding whitespace. `warning` and `critical`
 * are accepted as aliases of `warn` and `fatal`.
 */
std::optional<LogLevel> Logger::parse_level(const std::string& name)
{
    std::string n = String::to_lower(String::trim(name));
    if (n == "trace")
        return LogLevel::TRACE;
    if (n == "debug")
        return LogLevel::DEBUG;
    if (n == "info")
        return LogLevel::INFO;
    if (n == "warn" || n == "warning")
        return LogLevel::WARN;
    if (n == "error")
        return LogLevel::ERROR;
    if (n == "fatal" || n == "critical")
        return LogLevel::FATAL;
    return std::nullopt;
}

/**
 * @brief Dispatches a formatted log entry to the appropriate system stream.
 *
 * Operational Logic:
 * 1. **Filtering**: Drops entries below the configured threshold without locking.
 * 2. **Synchronization**: Holds a `lock_guard` for the whole entry so lines from
 *    concurrent workers never interleave.
 * 3. **Chronometry**: Stamps the entry with local wall-clock time.
 * 4. **Stream Segregation**: WARN and above go to `stderr`, the rest to `stdout`.
 * 5. **Stylization**: Wraps the entry in an ANSI color for its severity.
 */
void Logger::log(LogLevel level, const std::string& message)
{
    // Cheap rejection of verbose levels (per-request DEBUG/TRACE lines).
    if (level < threshold_.load()) {
        return;
    }

    // One entry at a time across every worker thread.
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);

    // Warnings and failures go unbuffered to stderr.
    auto& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    // Formatting: [YYYY-MM-DD HH:MM:SS]
    // std::localtime shares a static buffer; the mutex above protects it.
    stream << "[" << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << "] ";

    switch (level) {
    case LogLevel::TRACE:
        // Gray: individual Redis commands.
        stream << "\033[90m[TRCE] ";
        break;
    case LogLevel::DEBUG:
        // Cyan: connection and record lifecycle details.
        stream << "\033[36m[DBUG] ";
        break;
    case LogLevel::INFO:
        // Green: boot progress and the per-request access line.
        stream << "\033[32m[INFO] ";
        break;
    case LogLevel::WARN:
        // Yellow: rejected payloads, degraded health, reconnects.
        stream << "\033[33m[WARN] ";
        break;
    case LogLevel::ERROR:
        // Red: storage failures and unexpected exceptions while serving.
        stream << "\033[31m[FAIL] ";
        break;
    case LogLevel::FATAL:
        // Bold red: startup aborted.
        stream << "\033[1;31m[CRIT] ";
        break;
    }

    // Payload, style reset, flush.
    stream << message << "\033[0m" << std::endl;
}

} // namespace phoneaddr::infra
