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
 * @file memory_store.hpp
 * @brief In-memory `Store` double for service and router tests.
 *
 * @details
 * Mirrors the Redis semantics the service relies on (`SET NX`, `EXISTS`, `DEL`
 * returning a removal count). `set_failing(true)` makes every call throw
 * `StoreError`, and `ping()` report the backend as down, so the 503 and
 * degraded-health paths can be exercised without a Redis server.
 */

#pragma once

#include "phoneaddr/storage/store.hpp"

#include <map>
#include <mutex>
#include <string>

namespace phoneaddr::test {

class MemoryStore : public storage::Store {
  public:
    std::optional<std::string> get(const std::string& key) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        touch();
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string& key, const std::string& value) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        touch();
        data_[key] = value;
    }

    bool set_if_absent(const std::string& key, const std::string& value) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        touch();
        return data_.emplace(key, value).second;
    }

    bool exists(const std::string& key) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        touch();
        return data_.count(key) > 0;
    }

    bool remove(const std::string& key) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        touch();
        return data_.erase(key) > 0;
    }

    bool ping() noexcept override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return !failing_;
    }

    void set_failing(bool failing)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    /// @brief Number of data commands received (ping excluded).
    int calls()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    /// @brief Raw view of a key, bypassing the failure switch.
    std::optional<std::string> peek(const std::string& key)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

  private:
    void touch()
    {
        ++calls_;
        if (failing_) {
            throw storage::StoreError("Storage: simulated connection refused");
        }
    }

    std::mutex mutex_;
    std::map<std::string, std::string> data_;
    bool failing_ = false;
    int calls_ = 0;
};

} // namespace phoneaddr::test
