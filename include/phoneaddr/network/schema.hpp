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
 * @file schema.hpp
 * @brief Typed request/response contracts of the HTTP API.
 *
 * @details
 * Request bodies are parsed with cJSON and checked against fixed field rules
 * before any business logic runs. Anything non-conforming produces a
 * `ValidationResult` carrying a human-readable error instead of a value.
 *
 * **Field rules:**
 * - `phone`: string, 3 to 64 characters (create only).
 * - `address`: string, 1 to 1024 characters.
 * - Lengths count Unicode code points, not bytes.
 * - Unknown extra fields are ignored.
 */

#pragma once

#include "phoneaddr/service/record_service.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace phoneaddr::network {

/// @brief Body of `POST /phone-addresses`.
struct CreateRequest {
    std::string phone;
    std::string address;
};

/// @brief Body of `PUT /phone-addresses/{phone}`.
struct UpdateRequest {
    std::string address;
};

/**
 * @struct ValidationResult
 * @brief Either a validated request or the reason it was rejected.
 */
template <typename T> struct ValidationResult {
    std::optional<T> value;
    std::string error;

    bool ok() const { return value.has_value(); }

    static ValidationResult accept(T v) { return {std::move(v), {}}; }
    static ValidationResult reject(std::string reason) { return {std::nullopt, std::move(reason)}; }
};

/**
 * @class Schema
 * @brief Static JSON codec for the API's request and response bodies.
 */
class Schema {
  public:
    static constexpr size_t PHONE_MIN_LENGTH = 3;
    static constexpr size_t PHONE_MAX_LENGTH = 64;
    static constexpr size_t ADDRESS_MIN_LENGTH = 1;
    static constexpr size_t ADDRESS_MAX_LENGTH = 1024;

    /// @brief Validates a create body `{"phone": ..., "address": ...}`.
    static ValidationResult<CreateRequest> parse_create(const std::string& body);

    /// @brief Validates an update body `{"address": ...}`.
    static ValidationResult<UpdateRequest> parse_update(const std::string& body);

    /// @brief `{"phone": "...", "address": "..."}`.
    static std::string record_json(const service::Record& record);

    /// @brief `{"detail": "..."}`.
    static std::string error_json(const std::string& detail);

    /// @brief `{"status": "ok"|"degraded", "redis": "ok"|"unavailable"}`.
    static std::string health_json(bool store_alive);

    /**
     * @brief OpenAPI 3 description of the service.
     *
     * @param title Service display name (`info.title`).
     * @param prefix Mount point of the record routes.
     */
    static std::string openapi_json(const std::string& title, const std::string& prefix);

    /// @brief Number of UTF-8 code points in @p s.
    static size_t utf8_length(const std::string& s);
};

} // namespace phoneaddr::network
