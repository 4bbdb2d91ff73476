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
 * @file redis_store.hpp
 * @brief Redis implementation of the `Store` contract, built on hiredis.
 *
 * @details
 * A hiredis `redisContext` is not thread-safe, so the store keeps a fixed pool
 * of synchronous connections. Each command leases one connection for its
 * duration and returns it afterwards; when all connections are leased the
 * caller blocks until one is released.
 *
 * **Failure policy:**
 * - Network, protocol and error replies surface as `StoreError`.
 * - A command is never retried.
 * - A connection left in an error state is discarded on release and reopened
 *   lazily by the next lease, so a Redis restart heals without a service
 *   restart.
 */

#pragma once

#include "phoneaddr/storage/store.hpp"

#include <hiredis/hiredis.h>

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace phoneaddr::storage {

/**
 * @struct RedisEndpoint
 * @brief Connection coordinates decoded from a `redis://` URL.
 */
struct RedisEndpoint {
    std::string host = "localhost";
    int port = 6379;
    int db = 0;
    std::string username;
    std::string password;

    /**
     * @brief Parses `redis://[[username]:password@]host[:port][/db]`.
     *
     * IPv6 hosts are written in brackets (`redis://[::1]:6379`). Credentials
     * may be percent-encoded. A query string is ignored.
     *
     * @throws infra::ConfigError If the scheme is not `redis` or a component
     * is malformed.
     */
    static RedisEndpoint parse(const std::string& url);

    /// @brief `host:port/db`, safe to log (no credentials).
    std::string describe() const;
};

/**
 * @class RedisStore
 * @brief Thread-safe, pooled Redis client.
 */
class RedisStore : public Store {
  public:
    /**
     * @brief Opens @p pool_size connections to @p endpoint.
     *
     * @param endpoint Target server, database and credentials.
     * @param pool_size Number of connections (at least one is opened).
     * @param timeout_ms Connect and per-command socket timeout.
     * @throws StoreError If any initial connection (or its AUTH/SELECT) fails.
     */
    RedisStore(RedisEndpoint endpoint, size_t pool_size, int timeout_ms);

    /// @brief Closes every pooled connection.
    ~RedisStore() override;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool set_if_absent(const std::string& key, const std::string& value) override;
    bool exists(const std::string& key) override;
    bool remove(const std::string& key) override;
    bool ping() noexcept override;

  private:
    struct ReplyDeleter {
        void operator()(redisReply* reply) const { freeReplyObject(reply); }
    };
    using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

    /**
     * @class Lease
     * @brief RAII handle on one pooled connection.
     */
    class Lease {
      public:
        explicit Lease(RedisStore& store);
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        redisContext* get() const { return ctx_; }

      private:
        RedisStore& store_;
        redisContext* ctx_;
    };

    /// @brief Opens and prepares (AUTH, SELECT) one connection.
    redisContext* connect();

    /// @brief Takes an idle connection, reconnecting an empty slot if needed.
    redisContext* acquire();

    /// @brief Returns a connection to the pool, discarding it if it is broken.
    void release(redisContext* ctx);

    /**
     * @brief Runs one command on a leased connection.
     *
     * Arguments are passed binary-safe (no format string), so keys and values
     * may contain spaces, `%` or any other byte.
     *
     * @throws StoreError On I/O failure or a Redis error reply.
     */
    ReplyPtr execute(const std::vector<std::string>& args);

    /// @brief Runs a command directly on @p ctx, used while preparing a fresh connection.
    static ReplyPtr execute_on(redisContext* ctx, const std::vector<std::string>& args);

    RedisEndpoint endpoint_;
    int timeout_ms_;

    /// @brief Idle connections. A null entry is a slot waiting to be reconnected.
    std::vector<redisContext*> idle_;
    std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
};

} // namespace phoneaddr::storage
