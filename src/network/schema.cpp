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
 * @file schema.cpp
 * @brief cJSON-based parsing, validation and serialization of API bodies.
 */

#include "phoneaddr/network/schema.hpp"

#include <cJSON.h>

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace phoneaddr::network {

namespace {

struct JsonDeleter {
    void operator()(cJSON* node) const { cJSON_Delete(node); }
};
using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

std::string print(const cJSON* node)
{
    char* raw = cJSON_PrintUnformatted(node);
    if (raw == nullptr) {
        throw std::runtime_error("JSON serialization failed");
    }
    std::string out(raw);
    cJSON_free(raw);
    return out;
}

/**
 * Parses @p body as a JSON object. On failure fills @p error and returns null.
 * Trailing bytes after the document are rejected.
 */
JsonPtr parse_object(const std::string& body, std::string& error)
{
    if (body.empty()) {
        error = "Request body is required.";
        return nullptr;
    }
    if (body.find('\0') != std::string::npos) {
        error = "Request body is not valid JSON.";
        return nullptr;
    }

    JsonPtr root(cJSON_ParseWithOpts(body.c_str(), nullptr, 1));
    if (!root) {
        error = "Request body is not valid JSON.";
        return nullptr;
    }
    if (!cJSON_IsObject(root.get())) {
        error = "Request body must be a JSON object.";
        return nullptr;
    }
    return root;
}

/**
 * Extracts a bounded string field. Returns false and fills @p error when the
 * field is missing, not a string, or outside [min, max] code points.
 */
bool read_string_field(const cJSON* root, const char* name, size_t min, size_t max,
                       std::string& out, std::string& error)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, name);
    if (item == nullptr || cJSON_IsNull(item)) {
        error = std::string("Field '") + name + "' is required.";
        return false;
    }
    if (!cJSON_IsString(item) || item->valuestring == nullptr) {
        error = std::string("Field '") + name + "' must be a string.";
        return false;
    }

    std::string value(item->valuestring);
    size_t length = Schema::utf8_length(value);
    if (length < min || length > max) {
        error = std::string("Field '") + name + "' must be between " + std::to_string(min) +
                " and " + std::to_string(max) + " characters.";
        return false;
    }

    out = std::move(value);
    return true;
}

void add_operation(cJSON* path_item, const char* method, const char* summary,
                   const std::vector<std::pair<const char*, const char*>>& responses)
{
    cJSON* op = cJSON_AddObjectToObject(path_item, method);
    cJSON_AddStringToObject(op, "summary", summary);
    cJSON* resp = cJSON_AddObjectToObject(op, "responses");
    for (const auto& [code, description] : responses) {
        cJSON* r = cJSON_AddObjectToObject(resp, code);
        cJSON_AddStringToObject(r, "description", description);
    }
}

} // namespace

size_t Schema::utf8_length(const std::string& s)
{
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

ValidationResult<CreateRequest> Schema::parse_create(const std::string& body)
{
    std::string error;
    JsonPtr root = parse_object(body, error);
    if (!root) {
        return ValidationResult<CreateRequest>::reject(error);
    }

    CreateRequest req;
    if (!read_string_field(root.get(), "phone", PHONE_MIN_LENGTH, PHONE_MAX_LENGTH, req.phone,
                           error) ||
        !read_string_field(root.get(), "address", ADDRESS_MIN_LENGTH, ADDRESS_MAX_LENGTH,
                           req.address, error)) {
        return ValidationResult<CreateRequest>::reject(error);
    }
    return ValidationResult<CreateRequest>::accept(std::move(req));
}

ValidationResult<UpdateRequest> Schema::parse_update(const std::string& body)
{
    std::string error;
    JsonPtr root = parse_object(body, error);
    if (!root) {
        return ValidationResult<UpdateRequest>::reject(error);
    }

    UpdateRequest req;
    if (!read_string_field(root.get(), "address", ADDRESS_MIN_LENGTH, ADDRESS_MAX_LENGTH,
                           req.address, error)) {
        return ValidationResult<UpdateRequest>::reject(error);
    }
    return ValidationResult<UpdateRequest>::accept(std::move(req));
}

std::string Schema::record_json(const service::Record& record)
{
    JsonPtr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "phone", record.phone.c_str());
    cJSON_AddStringToObject(root.get(), "address", record.address.c_str());
    return print(root.get());
}

std::string Schema::error_json(const std::string& detail)
{
    JsonPtr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "detail", detail.c_str());
    return print(root.get());
}

std::string Schema::health_json(bool store_alive)
{
    JsonPtr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "status", store_alive ? "ok" : "degraded");
    cJSON_AddStringToObject(root.get(), "redis", store_alive ? "ok" : "unavailable");
    return print(root.get());
}

std::string Schema::openapi_json(const std::string& title, const std::string& prefix)
{
    JsonPtr root(cJSON_CreateObject());
    cJSON_AddStringToObject(root.get(), "openapi", "3.0.3");

    cJSON* info = cJSON_AddObjectToObject(root.get(), "info");
    cJSON_AddStringToObject(info, "title", title.c_str());
    cJSON_AddStringToObject(info, "version", "1.0.0");
    cJSON_AddStringToObject(info, "description",
                            "Service for storing and managing phone - address pairs.");

    cJSON* paths = cJSON_AddObjectToObject(root.get(), "paths");

    const std::string collection = prefix + "/phone-addresses";
    cJSON* coll = cJSON_AddObjectToObject(paths, collection.c_str());
    add_operation(coll, "post", "Create new phone-address record",
                  {{"201", "Record created."},
                   {"409", "Phone number already exists and cannot be created again."},
                   {"422", "Request body failed validation."}});

    const std::string item = collection + "/{phone}";
    cJSON* single = cJSON_AddObjectToObject(paths, item.c_str());
    add_operation(single, "get", "Get address by phone number",
                  {{"200", "Record found."},
                   {"404", "Phone number was not found in the storage."}});
    add_operation(single, "put", "Update existing phone-address record",
                  {{"200", "Record updated."},
                   {"404", "Phone number not found; nothing to update."},
                   {"422", "Request body failed validation."}});
    add_operation(single, "delete", "Delete phone-address record",
                  {{"204", "Record was successfully deleted."},
                   {"404", "Phone number not found; nothing to delete."}});

    cJSON* health = cJSON_AddObjectToObject(paths, "/health");
    add_operation(health, "get", "Health check", {{"200", "Service and storage status."}});

    return print(root.get());
}

} // namespace phoneaddr::network
