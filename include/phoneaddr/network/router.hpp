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
 * @file router.hpp
 * @brief Application-layer gateway between HTTP and the record service.
 *
 * @details
 * The `Router` owns HTTP semantics only. For every request it:
 * 1. **Matches** the target against the route table (prefix-mounted record
 *    routes, `/health`, `/openapi.json`).
 * 2. **Validates** the body through `Schema`; failures answer 422 before the
 *    service is touched.
 * 3. **Dispatches** to `service::RecordService`.
 * 4. **Translates** the domain `Outcome` into a status code and JSON body.
 *
 * | Verb   | Path                            | Success | Failure    |
 * |--------|---------------------------------|---------|------------|
 * | GET    | `{prefix}/phone-addresses/{p}`  | 200     | 404        |
 * | POST   | `{prefix}/phone-addresses`      | 201     | 409, 422   |
 * | PUT    | `{prefix}/phone-addresses/{p}`  | 200     | 404, 422   |
 * | DELETE | `{prefix}/phone-addresses/{p}`  | 204     | 404        |
 *
 * Store failures become 503; any other exception becomes 500.
 */

#pragma once

#include "phoneaddr/network/http_codec.hpp"
#include "phoneaddr/service/record_service.hpp"
#include "phoneaddr/storage/store.hpp"

#include <string>

namespace phoneaddr::network {

/**
 * @class Router
 * @brief Stateless request handler; safe to share across worker threads.
 */
class Router {
  public:
    /**
     * @param service Business layer for the record routes.
     * @param store Store handle, used only by the health check.
     * @param project_name Display name for `/openapi.json` and the `Server` header.
     * @param prefix Mount point of the record routes (e.g. `/api/v1`).
     */
    Router(service::RecordService& service, storage::Store& store, std::string project_name,
           std::string prefix);

    /**
     * @brief Produces the response for @p req. Never throws.
     */
    Response handle(const Request& req);

    /**
     * @brief Builds a JSON error response outside of routing (framing errors).
     *
     * The response asks the client to close the connection.
     */
    Response reject(http::status status, const std::string& detail, unsigned version = 11) const;

  private:
    Response route(const Request& req);

    Response get_record(const Request& req, const std::string& phone);
    Response create_record(const Request& req);
    Response update_record(const Request& req, const std::string& phone);
    Response delete_record(const Request& req, const std::string& phone);
    Response health(const Request& req);
    Response openapi(const Request& req);

    Response json(const Request& req, http::status status, std::string body) const;
    Response error(const Request& req, http::status status, const std::string& detail) const;
    Response no_content(const Request& req) const;
    Response method_not_allowed(const Request& req, const char* allow) const;

    service::RecordService& service_;
    storage::Store& store_;
    std::string project_name_;
    std::string prefix_;
    std::string collection_path_;
};

} // namespace phoneaddr::network
