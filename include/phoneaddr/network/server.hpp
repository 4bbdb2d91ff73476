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
 * @file server.hpp
 * @brief TCP listener, connection event loop and request dispatcher.
 *
 * @details
 * The `Server` owns the BSD socket lifecycle (bind, listen, accept) and every
 * client socket. One event loop thread waits on all of them with `poll(2)`,
 * reads whatever arrives and frames it with `RequestReader`. Only when a
 * connection holds a complete request (or a framing error) is it handed to
 * the worker pool; the worker answers every buffered request, writes the
 * responses and hands the connection back to the loop.
 */

#pragma once

#include "phoneaddr/infra/scheduler.hpp"
#include "phoneaddr/network/http_codec.hpp"
#include "phoneaddr/network/router.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace phoneaddr::network {

/**
 * @class Server
 * @brief Multi-threaded HTTP/1.1 server.
 *
 * **Operational Workflow:**
 * 1. **Accept:** The event loop accepts new clients and starts watching them.
 * 2. **Read:** Readable clients are drained into their `RequestReader`.
 * 3. **Dispatch:** A client with a complete request leaves the poll set and
 *    is submitted to the `infra::Scheduler`.
 * 4. **Serve:** A worker routes the buffered requests, writes the responses
 *    and returns the client, open or to be closed.
 * 5. **Shutdown:** `request_stop()` wakes the loop through a self-pipe; the
 *    loop waits for in-flight requests, then closes every socket.
 *
 * Idle keep-alive clients only occupy a slot in the poll set, never a
 * worker. They are closed after `IDLE_TIMEOUT_SECONDS` without traffic.
 */
class Server {
  public:
    /// @brief Largest accepted request body.
    static constexpr size_t MAX_BODY_BYTES = 64 * 1024;

    /// @brief Idle keep-alive connections are closed after this many seconds.
    static constexpr int IDLE_TIMEOUT_SECONDS = 60;

    /**
     * @param router Request handler shared by all workers; must outlive the server.
     * @param host IPv4 listen address (`0.0.0.0` for all interfaces).
     * @param port TCP listen port. Zero picks an ephemeral port, see `bound_port()`.
     * @param workers Worker-pool size.
     * @throws std::runtime_error If the wake-up pipe cannot be created.
     */
    Server(Router& router, std::string host, int port, size_t workers);

    /// @brief Requests a stop, joins the workers and releases the wake-up pipe.
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Binds, listens and runs the event loop.
     *
     * Blocks until `request_stop()` is called. On return every client socket
     * and the listener are closed.
     *
     * @throws std::runtime_error If the socket cannot be created, bound or
     * put into listening mode.
     */
    void run();

    /**
     * @brief Asks the event loop to terminate.
     *
     * Only stores an atomic flag and writes one byte to the wake-up pipe, so
     * it is safe to call from a signal handler or another thread.
     */
    void request_stop() noexcept;

    /// @brief Port the listener is bound to, or 0 while not listening.
    int bound_port() const { return bound_port_.load(); }

  private:
    /// @brief Poll timeout; bounds how late idle connections are reaped.
    static constexpr int POLL_INTERVAL_MS = 1000;

    /**
     * @struct Session
     * @brief Per-connection framing state.
     *
     * Touched by the event loop while `busy` is false and by exactly one
     * worker while it is true.
     */
    struct Session {
        explicit Session(int socket)
            : fd(socket), reader(MAX_BODY_BYTES), last_active(std::chrono::steady_clock::now())
        {
        }

        int fd;
        RequestReader reader;
        RequestReader::State state = RequestReader::State::NEED_MORE;
        bool busy = false;
        std::chrono::steady_clock::time_point last_active;
    };

    /// @brief A connection a worker has finished with.
    struct Handback {
        int fd;
        bool keep_open;
    };

    // --- Event loop (loop thread only) ---
    void accept_clients(int listener);
    void read_client(int fd);
    void dispatch(Session& session);
    void collect_handbacks();
    void close_idle_sessions();
    void close_session(int fd);
    void shutdown_sessions();

    // --- Worker side ---
    /**
     * @brief Answers every complete request buffered on @p session.
     * @return False once the connection must be closed.
     */
    bool serve(Session& session);

    /// @brief Returns @p fd to the event loop and wakes it.
    void hand_back(int fd, bool keep_open);

    /// @brief Writes all of @p data, retrying short writes.
    static bool send_all(int socket, const std::string& data);

    // --- Self-pipe ---
    void wake() noexcept;
    void clear_wake();

    Router& router_;
    std::string host_;
    int port_;

    std::atomic<int> bound_port_;
    std::atomic<bool> running_;

    /// @brief Self-pipe: [0] watched by the loop, [1] written by `wake()`.
    int wake_fds_[2];

    /// @brief Live connections by descriptor. Owned by the event loop.
    std::map<int, std::unique_ptr<Session>> sessions_;

    /// @brief Connections returned by workers, applied by the loop.
    std::vector<Handback> handbacks_;
    size_t in_flight_ = 0;
    std::mutex handback_mutex_;
    std::condition_variable handback_cv_;

    /// @brief Declared last: destroyed (and joined) before the session registry.
    infra::Scheduler scheduler_;
};

} // namespace phoneaddr::network
