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
 * @file schema_test.cpp
 * @brief Tests for request validation and JSON rendering.
 */

#include "framework.hpp"
#include "phoneaddr/network/schema.hpp"

#include <cJSON.h>

#include <string>

using phoneaddr::network::Schema;

void test_schema_parse_create_valid()
{
    auto result = Schema::parse_create(R"({"phone": "+79990000000", "address": "Moscow"})");
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value->phone, std::string("+79990000000"));
    ASSERT_EQ(result.value->address, std::string("Moscow"));

    // Unknown fields are ignored.
    ASSERT_TRUE(Schema::parse_create(R"({"phone":"123","address":"a","extra":1})").ok());
}

void test_schema_parse_create_rejects()
{
    auto missing = Schema::parse_create(R"({"phone": "+79990000000"})");
    ASSERT_FALSE(missing.ok());
    ASSERT_EQ(missing.error, std::string("Field 'address' is required."));

    auto typed = Schema::parse_create(R"({"phone": 79990000000, "address": "Moscow"})");
    ASSERT_EQ(typed.error, std::string("Field 'phone' must be a string."));

    auto short_phone = Schema::parse_create(R"({"phone": "12", "address": "Moscow"})");
    ASSERT_EQ(short_phone.error, std::string("Field 'phone' must be between 3 and 64 characters."));

    auto empty_address = Schema::parse_create(R"({"phone": "123", "address": ""})");
    ASSERT_EQ(empty_address.error,
              std::string("Field 'address' must be between 1 and 1024 characters."));

    ASSERT_EQ(Schema::parse_create("").error, std::string("Request body is required."));
    ASSERT_EQ(Schema::parse_create("{not json").error,
              std::string("Request body is not valid JSON."));
    ASSERT_EQ(Schema::parse_create(R"({"phone":"123","address":"a"} trailing)").error,
              std::string("Request body is not valid JSON."));
    ASSERT_EQ(Schema::parse_create(R"(["123", "a"])").error,
              std::string("Request body must be a JSON object."));
}

/**
 * @brief Length bounds count code points, not bytes.
 */
void test_schema_length_bounds()
{
    std::string phone_max(Schema::PHONE_MAX_LENGTH, '1');
    ASSERT_TRUE(Schema::parse_create(R"({"phone":")" + phone_max + R"(","address":"a"})").ok());
    ASSERT_FALSE(
        Schema::parse_create(R"({"phone":")" + phone_max + R"(1","address":"a"})").ok());

    std::string address_max(Schema::ADDRESS_MAX_LENGTH, 'x');
    ASSERT_TRUE(Schema::parse_update(R"({"address":")" + address_max + R"("})").ok());
    ASSERT_FALSE(Schema::parse_update(R"({"address":")" + address_max + R"(x"})").ok());

    // Three Cyrillic letters: six bytes, three characters.
    ASSERT_EQ(Schema::utf8_length("\xD0\x9C\xD0\xBE\xD1\x81"), static_cast<size_t>(3));
    ASSERT_TRUE(Schema::parse_create("{\"phone\":\"\xD0\x9C\xD0\xBE\xD1\x81\",\"address\":\"a\"}")
                    .ok());
}

void test_schema_parse_update()
{
    auto ok = Schema::parse_update(R"({"address": "Kazan"})");
    ASSERT_TRUE(ok.ok());
    ASSERT_EQ(ok.value->address, std::string("Kazan"));

    ASSERT_EQ(Schema::parse_update("{}").error, std::string("Field 'address' is required."));
    ASSERT_EQ(Schema::parse_update(R"({"address": null})").error,
              std::string("Field 'address' is required."));
    ASSERT_EQ(Schema::parse_update(R"({"address": ["Kazan"]})").error,
              std::string("Field 'address' must be a string."));
}

void test_schema_render()
{
    ASSERT_EQ(Schema::record_json({"+79990000000", "Moscow"}),
              std::string(R"({"phone":"+79990000000","address":"Moscow"})"));
    ASSERT_EQ(Schema::error_json("Phone number not found."),
              std::string(R"({"detail":"Phone number not found."})"));
    ASSERT_EQ(Schema::health_json(true), std::string(R"({"status":"ok","redis":"ok"})"));
    ASSERT_EQ(Schema::health_json(false),
              std::string(R"({"status":"degraded","redis":"unavailable"})"));
}

void test_schema_openapi_document()
{
    std::string doc = Schema::openapi_json("Custom Service", "/v2");
    cJSON* root = cJSON_Parse(doc.c_str());
    ASSERT_TRUE(root != nullptr);

    cJSON* info = cJSON_GetObjectItemCaseSensitive(root, "info");
    cJSON* title = cJSON_GetObjectItemCaseSensitive(info, "title");
    cJSON* version = cJSON_GetObjectItemCaseSensitive(info, "version");
    cJSON* paths = cJSON_GetObjectItemCaseSensitive(root, "paths");

    bool title_ok = cJSON_IsString(title) && std::string(title->valuestring) == "Custom Service";
    bool version_ok = cJSON_IsString(version) && std::string(version->valuestring) == "1.0.0";
    bool collection_ok = cJSON_HasObjectItem(paths, "/v2/phone-addresses");
    bool item_ok = cJSON_HasObjectItem(paths, "/v2/phone-addresses/{phone}");
    cJSON_Delete(root);

    ASSERT_TRUE(title_ok);
    ASSERT_TRUE(version_ok);
    ASSERT_TRUE(collection_ok);
    ASSERT_TRUE(item_ok);
}
