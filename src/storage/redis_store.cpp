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
 * @file redis_store.cpp
 * @brief hiredis-backed connection pool and command execution.
 */

#include "phoneaddr/storage/redis_store.hpp"

#include "phoneaddr/infra/config.hpp"
#include "phoneaddr/infra/logger.hpp"
#include "phoneaddr/infra/string.hpp"

#include <cctype>
#include <sys/time.h>

namespace phoneaddr::storage {

using infra::LogLevel;
using infra::Logger;

namespace {

int parse_number(const std::string& text, const std::string& what, const std::string& url)
{
    if (text.empty() || text.size() > 9) {
        throw infra::ConfigError("Invalid " + what + " in REDIS_URL '" + url + "'");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw infra::ConfigError("Invalid " + what + " in REDIS_URL '" + url + "'");
        }
    }
    return std::stoi(text);
}

std::string decode_credential(const std::string& text, const std::string& url)
{
    auto decoded = infra::String::percent_decode(text);
    if (!decoded) {
        throw infra::ConfigError("Invalid percent-encoding in REDIS_URL credentials '" + url +
                                 "'");
    }
    return *decoded;
}

timeval to_timeval(int timeout_ms)
{
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    return tv;
}

std::string reply_text(const redisReply* reply)
{
    return (reply->str != nullptr) ? std::string(reply->str, reply->len) : std::string();
}

} // namespace

// ============================================================================
//  RedisEndpoint
// ============================================================================

RedisEndpoint RedisEndpoint::parse(const std::string& url)
{
    const std::string scheme = "redis://";
    if (!infra::String::starts_with(infra::String::to_lower(url), scheme)) {
        throw infra::ConfigError("Unsupported REDIS_URL scheme (expected redis://): '" + url +
                                 "'");
    }

    RedisEndpoint ep;
    std::string rest = url.substr(scheme.size());

    size_t query = rest.find('?');
    if (query != std::string::npos) {
        rest.erase(query);
    }

    // Authority ends at the first '/' that is not part of the credentials.
    size_t at = rest.rfind('@');
    size_t slash = rest.find('/', at == std::string::npos ? 0 : at);
    std::string authority = rest.substr(0, slash);
    std::string path = (slash == std::string::npos) ? "" : rest.substr(slash + 1);

    at = authority.rfind('@');
    if (at != std::string::npos) {
        std::string userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);

        size_t colon = userinfo.find(':');
        if (colon == std::string::npos) {
            ep.username = decode_credential(userinfo, url);
        } else {
            ep.username = decode_credential(userinfo.substr(0, colon), url);
            ep.password = decode_credential(userinfo.substr(colon + 1), url);
        }
    }

    std::string port_text;
    bool has_port = false;
    if (!authority.empty() && authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) {
            throw infra::ConfigError("Unterminated IPv6 host in REDIS_URL '" + url + "'");
        }
        ep.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                throw infra::ConfigError("Invalid host in REDIS_URL '" + url + "'");
            }
            port_text = tail.substr(1);
            has_port = true;
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            ep.host = authority.substr(0, colon);
            port_text = authority.substr(colon + 1);
            has_port = true;
        } else {
            ep.host = authority;
        }
    }

    if (ep.host.empty()) {
        ep.host = "localhost";
    }

    if (has_port) {
        ep.port = parse_number(port_text, "port", url);
        if (ep.port < 1 || ep.port > 65535) {
            throw infra::ConfigError("Port out of range in REDIS_URL '" + url + "'");
        }
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    if (!path.empty()) {
        ep.db = parse_number(path, "database index", url);
    }

    return ep;
}

std::string RedisEndpoint::describe() const
{
    std::string h = (host.find(':') != std::string::npos) ? "[" + host + "]" : host;
    return h + ":" + std::to_string(port) + "/" + std::to_string(db);
}

// ============================================================================
//  Connection pool
// ============================================================================

RedisStore::Lease::Lease(RedisStore& store) : store_(store), ctx_(store.acquire())
{
}

RedisStore::Lease::~Lease()
{
    store_.release(ctx_);
}

RedisStore::RedisStore(RedisEndpoint endpoint, size_t pool_size, int timeout_ms)
    : endpoint_(std::move(endpoint)), timeout_ms_(timeout_ms)
{
    if (pool_size == 0) {
        pool_size = 1;
    }

    Logger::log(LogLevel::INFO, "Storage: Connecting to Redis at " + endpoint_.describe() +
                                    " (pool size " + std::to_string(pool_size) + ")");

    idle_.reserve(pool_size);
    try {
        for (size_t i = 0; i < pool_size; ++i) {
            idle_.push_back(connect());
        }
    } catch (...) {
        for (redisContext* ctx : idle_) {
            redisFree(ctx);
        }
        idle_.clear();
        throw;
    }

    Logger::log(LogLevel::INFO, "Storage: Redis connection pool ready.");
}

RedisStore::~RedisStore()
{
    std::lock_guard<std::mutex> lock(pool_mutex_);
    for (redisContext* ctx : idle_) {
        if (ctx) {
            redisFree(ctx);
        }
    }
    idle_.clear();
}

redisContext* RedisStore::connect()
{
    timeval tv = to_timeval(timeout_ms_);
    redisContext* ctx = redisConnectWithTimeout(endpoint_.host.c_str(), endpoint_.port, tv);
    if (ctx == nullptr) {
        throw StoreError("Storage: Cannot allocate Redis context for " + endpoint_.describe());
    }
    if (ctx->err) {
        std::string err = ctx->errstr;
        redisFree(ctx);
        throw StoreError("Storage: Cannot connect to Redis at " + endpoint_.describe() + ": " +
                         err);
    }

    try {
        if (redisSetTimeout(ctx, tv) != REDIS_OK) {
            throw StoreError("Storage: Cannot set Redis command timeout.");
        }

        if (!endpoint_.password.empty()) {
            if (endpoint_.username.empty()) {
                execute_on(ctx, {"AUTH", endpoint_.password});
            } else {
                execute_on(ctx, {"AUTH", endpoint_.username, endpoint_.password});
            }
        }

        if (endpoint_.db != 0) {
            execute_on(ctx, {"SELECT", std::to_string(endpoint_.db)});
        }
    } catch (...) {
        redisFree(ctx);
        throw;
    }

    Logger::log(LogLevel::DEBUG, "Storage: Opened Redis connection to " + endpoint_.describe());
    return ctx;
}

redisContext* RedisStore::acquire()
{
    redisContext* ctx = nullptr;
    {
        std::unique_lock<std::mutex> lock(pool_mutex_);
        pool_cv_.wait(lock, [this] { return !idle_.empty(); });
        ctx = idle_.back();
        idle_.pop_back();
    }

    if (ctx != nullptr) {
        return ctx;
    }

    // Empty slot: the previous connection broke. Reconnect outside the lock.
    try {
        Logger::log(LogLevel::WARN, "Storage: Reopening Redis connection to " +
                                        endpoint_.describe());
        return connect();
    } catch (...) {
        release(nullptr);
        throw;
    }
}

void RedisStore::release(redisContext* ctx)
{
    if (ctx != nullptr && ctx->err) {
        Logger::log(LogLevel::WARN,
                    std::string("Storage: Discarding broken Redis connection: ") + ctx->errstr);
        redisFree(ctx);
        ctx = nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        idle_.push_back(ctx);
    }
    pool_cv_.notify_one();
}

RedisStore::ReplyPtr RedisStore::execute_on(redisContext* ctx,
                                            const std::vector<std::string>& args)
{
    std::vector<const char*> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (const auto& a : args) {
        argv.push_back(a.data());
        argvlen.push_back(a.size());
    }

    void* raw = redisCommandArgv(ctx, static_cast<int>(argv.size()), argv.data(), argvlen.data());
    if (raw == nullptr) {
        throw StoreError("Storage: Redis " + args.front() + " failed: " +
                         std::string(ctx->err ? ctx->errstr : "no reply"));
    }

    ReplyPtr reply(static_cast<redisReply*>(raw));
    if (reply->type == REDIS_REPLY_ERROR) {
        throw StoreError("Storage: Redis " + args.front() + " rejected: " + reply_text(reply.get()));
    }
    return reply;
}

RedisStore::ReplyPtr RedisStore::execute(const std::vector<std::string>& args)
{
    Logger::log(LogLevel::TRACE, "Storage: > " + args.front() +
                                     (args.size() > 1 ? " " + args[1] : std::string()));
    Lease lease(*this);
    return execute_on(lease.get(), args);
}

// ============================================================================
//  Store operations
// ============================================================================

std::optional<std::string> RedisStore::get(const std::string& key)
{
    ReplyPtr reply = execute({"GET", key});
    if (reply->type == REDIS_REPLY_NIL) {
        return std::nullopt;
    }
    if (reply->type != REDIS_REPLY_STRING) {
        throw StoreError("Storage: Unexpected reply type " + std::to_string(reply->type) +
                         " for GET");
    }
    return reply_text(reply.get());
}

void RedisStore::set(const std::string& key, const std::string& value)
{
    ReplyPtr reply = execute({"SET", key, value});
    if (reply->type != REDIS_REPLY_STATUS) {
        throw StoreError("Storage: Unexpected reply type " + std::to_string(reply->type) +
                         " for SET");
    }
}

bool RedisStore::set_if_absent(const std::string& key, const std::string& value)
{
    ReplyPtr reply = execute({"SET", key, value, "NX"});
    if (reply->type == REDIS_REPLY_NIL) {
        return false;
    }
    if (reply->type != REDIS_REPLY_STATUS) {
        throw StoreError("Storage: Unexpected reply type " + std::to_string(reply->type) +
                         " for SET NX");
    }
    return true;
}

bool RedisStore::exists(const std::string& key)
{
    ReplyPtr reply = execute({"EXISTS", key});
    if (reply->type != REDIS_REPLY_INTEGER) {
        throw StoreError("Storage: Unexpected reply type " + std::to_string(reply->type) +
                         " for EXISTS");
    }
    return reply->integer > 0;
}

bool RedisStore::remove(const std::string& key)
{
    ReplyPtr reply = execute({"DEL", key});
    if (reply->type != REDIS_REPLY_INTEGER) {
        throw StoreError("Storage: Unexpected reply type " + std::to_string(reply->type) +
                         " for DEL");
    }
    return reply->integer > 0;
}

bool RedisStore::ping() noexcept
{
    try {
        ReplyPtr reply = execute({"PING"});
        return reply->type == REDIS_REPLY_STATUS && reply_text(reply.get()) == "PONG";
    } catch (const std::exception& e) {
        Logger::log(LogLevel::WARN, std::string("Storage: PING failed: ") + e.what());
        return false;
    }
}

} // namespace phoneaddr::storage
