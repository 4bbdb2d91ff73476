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
 * @file scheduler.cpp
 * @brief Producer-consumer implementation of the request worker pool.
 *
 * @details
 * Concrete implementation of the `Scheduler` class. A fixed cohort of worker
 * threads sleeps on a condition variable until the server's event loop hands
 * it a connection with buffered requests. Teardown drains the queue, so every
 * dispatched connection is returned to the event loop before the pool dies.
 */

#include "phoneaddr/infra/scheduler.hpp"

#include "phoneaddr/infra/logger.hpp"

#include <exception>
#include <string>

namespace phoneaddr::infra {

/**
 * @brief Constructs the scheduler and spawns the worker cohort.
 *
 * @details
 * Each worker loops on the shared queue, sleeping while it is empty. An
 * undetectable core count arrives here as zero and is raised to one worker.
 *
 * @param threads The number of persistent worker threads.
 */
Scheduler::Scheduler(size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 1;
    }

    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] {
            /* * ============================================================
             * Worker Thread Loop
             * ============================================================
             */
            while (true) {
                std::function<void()> task;

                // --- Critical Section: Task Acquisition ---
                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex_);

                    // Sleep until work arrives or the pool is shutting down.
                    this->condition_.wait(lock,
                                          [this] { return this->stop_ || !this->tasks_.empty(); });

                    /* * Termination Logic:
                     * Leave only once stopping AND the queue is empty, so a
                     * connection already dispatched always gets its reply
                     * written and is handed back to the event loop.
                     */
                    if (this->stop_ && this->tasks_.empty()) {
                        return;
                    }

                    task = std::move(this->tasks_.front());
                    this->tasks_.pop();
                }
                // --- End Critical Section ---

                if (!task) {
                    continue;
                }

                // Run outside the lock. A throwing task is logged and the
                // worker carries on with the next one.
                try {
                    task();
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::ERROR,
                                std::string("Scheduler: Task aborted with exception: ") +
                                    e.what());
                }
            }
        });
    }

    Logger::log(LogLevel::DEBUG,
                "Scheduler: Started " + std::to_string(workers_.size()) + " worker(s).");
}

/**
 * @brief Destructor. Drains the queue, then joins every worker.
 */
Scheduler::~Scheduler()
{
    {
        // Flip the flag under the lock so no worker misses the wake-up.
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    // Wake every sleeping worker.
    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Queues a task and wakes one worker.
 *
 * @param task Unit of work, typically "serve the requests buffered on this
 * connection".
 */
void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    // One task, one worker.
    condition_.notify_one();
}

} // namespace phoneaddr::infra
