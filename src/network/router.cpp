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
 * @file router.cpp
 * @brief Route matching, outcome-to-status mapping and response assembly.
 */

#include "phoneaddr/network/router.hpp"

#include "phoneaddr/infra/logger.hpp"
#include "phoneaddr/infra/string.hpp"
#include "phoneaddr/network/schema.hpp"

#include <exception>
#include <utility>

namespace phoneaddr::network {

using infra::LogLevel;
using infra::Logger;

namespace {

const char* const NOT_FOUND_DETAIL = "Phone number not found.";
const char* const CONFLICT_DETAIL = "Phone number already exists.";
const char* const INVALID_PHONE_DETAIL = "Phone number must contain at least 3 digits.";

std::string to_std(boost::beast::string_view sv)
{
    return std::string(sv.data(), sv.size());
}

} // namespace

Router::Router(service::RecordService& service, storage::Store& store, std::string project_name,
               std::string prefix)
    : service_(service), store_(store), project_name_(std::move(project_name)),
      prefix_(std::move(prefix))
{
    collection_path_ = prefix_ + "/phone-addresses";
}

Response Router::handle(const Request& req)
{
    Response res;
    try {
        res = route(req);
    } catch (const storage::StoreError& e) {
        Logger::log(LogLevel::ERROR, std::string("Http: Storage failure: ") + e.what());
        res = error(req, http::status::service_unavailable, "Storage backend unavailable.");
    } catch (const std::exception& e) {
        Logger::log(LogLevel::ERROR, std::string("Http: Unhandled exception: ") + e.what());
        res = error(req, http::status::internal_server_error, "Internal Server Error");
    }

    Logger::log(LogLevel::INFO, "Http: " + to_std(req.method_string()) + " " +
                                    to_std(req.target()) + " -> " +
                                    std::to_string(res.result_int()));
    return res;
}

Response Router::route(const Request& req)
{
    std::string path = to_std(req.target());
    size_t query = path.find('?');
    if (query != std::string::npos) {
        path.erase(query);
    }

    if (path == "/health") {
        if (req.method() != http::verb::get) {
            return method_not_allowed(req, "GET");
        }
        return health(req);
    }

    if (path == "/openapi.json") {
        if (req.method() != http::verb::get) {
            return method_not_allowed(req, "GET");
        }
        return openapi(req);
    }

    if (path == collection_path_ || path == collection_path_ + "/") {
        if (req.method() != http::verb::post) {
            return method_not_allowed(req, "POST");
        }
        return create_record(req);
    }

    const std::string item_prefix = collection_path_ + "/";
    if (infra::String::starts_with(path, item_prefix)) {
        std::string segment = path.substr(item_prefix.size());
        if (segment.empty() || segment.find('/') != std::string::npos) {
            return error(req, http::status::not_found, "Not Found");
        }

        auto phone = infra::String::percent_decode(segment);
        if (!phone) {
            return error(req, http::status::bad_request, "Invalid percent-encoding in path.");
        }
        // A phone never contains NUL; refuse one smuggled in as %00.
        if (phone->find('\0') != std::string::npos) {
            return error(req, http::status::bad_request, "Invalid character in path.");
        }

        switch (req.method()) {
        case http::verb::get:
            return get_record(req, *phone);
        case http::verb::put:
            return update_record(req, *phone);
        case http::verb::delete_:
            return delete_record(req, *phone);
        default:
            return method_not_allowed(req, "GET, PUT, DELETE");
        }
    }

    return error(req, http::status::not_found, "Not Found");
}

// ============================================================================
//  Record routes
// ============================================================================

Response Router::get_record(const Request& req, const std::string& phone)
{
    service::RecordResult result = service_.get_record(phone);
    if (result.outcome == service::Outcome::INVALID_PHONE) {
        return error(req, http::status::unprocessable_entity, INVALID_PHONE_DETAIL);
    }
    if (result.outcome == service::Outcome::NOT_FOUND) {
        return error(req, http::status::not_found, NOT_FOUND_DETAIL);
    }
    return json(req, http::status::ok, Schema::record_json(*result.record));
}

Response Router::create_record(const Request& req)
{
    auto payload = Schema::parse_create(req.body());
    if (!payload.ok()) {
        Logger::log(LogLevel::WARN, "Http: Rejected create payload: " + payload.error);
        return error(req, http::status::unprocessable_entity, payload.error);
    }

    service::RecordResult result = service_.create_record(payload.value->phone,
                                                          payload.value->address);
    if (result.outcome == service::Outcome::INVALID_PHONE) {
        return error(req, http::status::unprocessable_entity, INVALID_PHONE_DETAIL);
    }
    if (result.outcome == service::Outcome::CONFLICT) {
        return error(req, http::status::conflict, CONFLICT_DETAIL);
    }
    return json(req, http::status::created, Schema::record_json(*result.record));
}

Response Router::update_record(const Request& req, const std::string& phone)
{
    auto payload = Schema::parse_update(req.body());
    if (!payload.ok()) {
        Logger::log(LogLevel::WARN, "Http: Rejected update payload: " + payload.error);
        return error(req, http::status::unprocessable_entity, payload.error);
    }

    service::RecordResult result = service_.update_record(phone, payload.value->address);
    if (result.outcome == service::Outcome::INVALID_PHONE) {
        return error(req, http::status::unprocessable_entity, INVALID_PHONE_DETAIL);
    }
    if (result.outcome == service::Outcome::NOT_FOUND) {
        return error(req, http::status::not_found, NOT_FOUND_DETAIL);
    }
    return json(req, http::status::ok, Schema::record_json(*result.record));
}

Response Router::delete_record(const Request& req, const std::string& phone)
{
    service::RecordResult result = service_.delete_record(phone);
    if (result.outcome == service::Outcome::INVALID_PHONE) {
        return error(req, http::status::unprocessable_entity, INVALID_PHONE_DETAIL);
    }
    if (result.outcome == service::Outcome::NOT_FOUND) {
        return error(req, http::status::not_found, NOT_FOUND_DETAIL);
    }
    return no_content(req);
}

// ============================================================================
//  Service routes
// ============================================================================

Response Router::health(const Request& req)
{
    bool alive = store_.ping();
    if (!alive) {
        Logger::log(LogLevel::WARN, "Http: Health check degraded, Redis unavailable.");
    }
    return json(req, http::status::ok, Schema::health_json(alive));
}

Response Router::openapi(const Request& req)
{
    return json(req, http::status::ok, Schema::openapi_json(project_name_, prefix_));
}

// ============================================================================
//  Response builders
// ============================================================================

Response Router::json(const Request& req, http::status status, std::string body) const
{
    Response res{status, req.version()};
    res.set(http::field::server, project_name_);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

Response Router::error(const Request& req, http::status status, const std::string& detail) const
{
    return json(req, status, Schema::error_json(detail));
}

Response Router::no_content(const Request& req) const
{
    Response res{http::status::no_content, req.version()};
    res.set(http::field::server, project_name_);
    res.keep_alive(req.keep_alive());
    res.prepare_payload();
    return res;
}

Response Router::method_not_allowed(const Request& req, const char* allow) const
{
    Response res = error(req, http::status::method_not_allowed, "Method Not Allowed");
    res.set(http::field::allow, allow);
    return res;
}

Response Router::reject(http::status status, const std::string& detail, unsigned version) const
{
    Response res{status, version};
    res.set(http::field::server, project_name_);
    res.set(http::field::content_type, "application/json");
    res.keep_alive(false);
    res.body() = Schema::error_json(detail);
    res.prepare_payload();
    return res;
}

} // namespace phoneaddr::network
