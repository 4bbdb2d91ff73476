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
 * @file record_service.cpp
 * @brief Existence-branch decisions for each record operation.
 */

#include "phoneaddr/service/record_service.hpp"

#include "phoneaddr/infra/logger.hpp"
#include "phoneaddr/infra/string.hpp"

namespace phoneaddr::service {

using infra::LogLevel;
using infra::Logger;

RecordService::RecordService(storage::Store& store, bool normalize_phone)
    : store_(store), normalize_phone_(normalize_phone)
{
}

std::string RecordService::canonical(const std::string& phone) const
{
    return normalize_phone_ ? infra::String::digits_only(phone) : phone;
}

std::string RecordService::make_key(const std::string& phone) const
{
    return std::string(KEY_PREFIX) + canonical(phone);
}

bool RecordService::accepts(const std::string& phone) const
{
    return !normalize_phone_ || canonical(phone).size() >= MIN_NORMALIZED_DIGITS;
}

RecordResult RecordService::get_record(const std::string& phone)
{
    if (!accepts(phone)) {
        return {Outcome::INVALID_PHONE, std::nullopt};
    }
    auto address = store_.get(make_key(phone));
    if (!address) {
        return {Outcome::NOT_FOUND, std::nullopt};
    }
    return {Outcome::OK, Record{canonical(phone), *address}};
}

RecordResult RecordService::create_record(const std::string& phone, const std::string& address)
{
    if (!accepts(phone)) {
        return {Outcome::INVALID_PHONE, std::nullopt};
    }
    if (!store_.set_if_absent(make_key(phone), address)) {
        Logger::log(LogLevel::DEBUG, "Service: Create rejected, phone already exists: " + phone);
        return {Outcome::CONFLICT, std::nullopt};
    }
    Logger::log(LogLevel::DEBUG, "Service: Created record for " + phone);
    return {Outcome::OK, Record{canonical(phone), address}};
}

RecordResult RecordService::update_record(const std::string& phone, const std::string& address)
{
    if (!accepts(phone)) {
        return {Outcome::INVALID_PHONE, std::nullopt};
    }
    const std::string key = make_key(phone);
    if (!store_.exists(key)) {
        return {Outcome::NOT_FOUND, std::nullopt};
    }
    store_.set(key, address);
    Logger::log(LogLevel::DEBUG, "Service: Updated record for " + phone);
    return {Outcome::OK, Record{canonical(phone), address}};
}

RecordResult RecordService::delete_record(const std::string& phone)
{
    if (!accepts(phone)) {
        return {Outcome::INVALID_PHONE, std::nullopt};
    }
    if (!store_.remove(make_key(phone))) {
        return {Outcome::NOT_FOUND, std::nullopt};
    }
    Logger::log(LogLevel::DEBUG, "Service: Deleted record for " + phone);
    return {Outcome::OK, std::nullopt};
}

} // namespace phoneaddr::service
