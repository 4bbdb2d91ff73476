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
 * @file store.hpp
 * @brief Key-value storage contract consumed by the record service.
 *
 * @details
 * The interface knows nothing about phones or addresses: it deals in opaque
 * string keys and values. "Key not found" is always a normal return value;
 * only infrastructure failures (network, protocol, server error replies) are
 * reported as `StoreError`.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace phoneaddr::storage {

/**
 * @class StoreError
 * @brief The backing store could not execute a command.
 *
 * Never thrown for a missing key. Not retried by the adapter.
 */
class StoreError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class Store
 * @brief Abstract key-value client shared by all concurrent requests.
 *
 * Implementations must be safe to call from several worker threads at once.
 */
class Store {
  public:
    virtual ~Store() = default;

    /**
     * @brief Fetches the value stored under @p key.
     * @return The value, or `std::nullopt` if the key does not exist.
     * @throws StoreError On infrastructure failure.
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * @brief Unconditionally writes @p value under @p key.
     * @throws StoreError On infrastructure failure.
     */
    virtual void set(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Writes @p value only if @p key does not exist yet, atomically.
     * @return true if the value was written, false if the key already existed.
     * @throws StoreError On infrastructure failure.
     */
    virtual bool set_if_absent(const std::string& key, const std::string& value) = 0;

    /**
     * @brief Checks whether @p key exists.
     * @throws StoreError On infrastructure failure.
     */
    virtual bool exists(const std::string& key) = 0;

    /**
     * @brief Deletes @p key.
     * @return true if a key was actually removed.
     * @throws StoreError On infrastructure failure.
     */
    virtual bool remove(const std::string& key) = 0;

    /**
     * @brief Liveness check.
     * @return true if the store answered. Never throws.
     */
    virtual bool ping() noexcept = 0;
};

} // namespace phoneaddr::storage
