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
 * @file scheduler.hpp
 * @brief Fixed-size worker pool executing HTTP requests.
 *
 * @details
 * The server's event loop is the single producer. It enqueues a connection
 * only once a complete request is buffered on it; the worker answers every
 * buffered request and hands the connection back. Idle keep-alive
 * connections therefore never occupy a worker, and the pool size bounds the
 * number of requests processed at once.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace phoneaddr::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns @p threads workers.
     *
     * @param threads Worker count. Zero (e.g. an undetectable
     * `hardware_concurrency()`) is raised to one.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Stops accepting work, drains the queue and joins every worker.
     *
     * @note Blocking. Tasks already queued still run before the workers exit.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Queues @p task and wakes one idle worker.
     */
    void enqueue(std::function<void()> task);

    /// @brief Number of worker threads in the pool.
    size_t size() const { return workers_.size(); }

  private:
    /// @brief Worker threads owned by the pool.
    std::vector<std::thread> workers_;

    /// @brief Pending tasks, FIFO.
    std::queue<std::function<void()>> tasks_;

    /// @brief Guards `tasks_`.
    std::mutex queue_mutex_;

    /// @brief Wakes workers on new work or shutdown.
    std::condition_variable condition_;

    /// @brief Set once by the destructor.
    std::atomic<bool> stop_;
};

} // namespace phoneaddr::infra
