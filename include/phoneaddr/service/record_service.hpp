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
 * @file record_service.hpp
 * @brief Business rules for phone-address records.
 *
 * @details
 * The `RecordService` is the only component that knows what a record is. It
 * turns each intent (read, create, update, delete) into store calls and
 * reports an existence-based `Outcome`. It performs no input validation: the
 * routing layer hands it payloads that already passed the schema checks.
 */

#pragma once

#include "phoneaddr/storage/store.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace phoneaddr::service {

/**
 * @struct Record
 * @brief One phone to address association.
 */
struct Record {
    std::string phone;
    std::string address;
};

/**
 * @enum Outcome
 * @brief Domain-level result of a record operation, before HTTP translation.
 */
enum class Outcome {
    OK,           ///< The operation took effect.
    NOT_FOUND,    ///< The phone has no record (get, update, delete).
    CONFLICT,     ///< The phone already has a record (create).
    INVALID_PHONE ///< Normalization left the phone too few digits to be a key.
};

/**
 * @struct RecordResult
 * @brief An `Outcome` plus the affected record when there is one.
 *
 * `record` is set for successful get, create and update; it is empty for
 * delete and for every failure outcome.
 */
struct RecordResult {
    Outcome outcome;
    std::optional<Record> record;
};

/**
 * @class RecordService
 * @brief Existence-checked CRUD over a `storage::Store`.
 *
 * Infrastructure failures (`storage::StoreError`) propagate unmodified.
 */
class RecordService {
  public:
    /// @brief Namespace prepended to every phone to form its store key.
    static constexpr const char* KEY_PREFIX = "phone_address:";

    /// @brief Fewest digits a phone may keep after normalization.
    static constexpr size_t MIN_NORMALIZED_DIGITS = 3;

    /**
     * @param store Shared store handle; must outlive the service.
     * @param normalize_phone When true, phones are reduced to their digits
     * before use as keys and in returned records.
     */
    explicit RecordService(storage::Store& store, bool normalize_phone = false);

    RecordResult get_record(const std::string& phone);

    /**
     * @brief Creates a record if the phone is unknown.
     *
     * Uses the store's atomic set-if-absent, so an existing address is never
     * overwritten, even by concurrent creates.
     */
    RecordResult create_record(const std::string& phone, const std::string& address);

    /**
     * @brief Replaces the address of an existing record.
     *
     * @note Existence check and write are two separate commands; a concurrent
     * delete between them resurrects the record.
     */
    RecordResult update_record(const std::string& phone, const std::string& address);

    RecordResult delete_record(const std::string& phone);

    /// @brief Store key for @p phone (after optional normalization).
    std::string make_key(const std::string& phone) const;

    /**
     * @brief False if normalization would leave @p phone with fewer than
     * `MIN_NORMALIZED_DIGITS` digits. Always true when normalization is off.
     *
     * Every operation answers `INVALID_PHONE` for such a phone without
     * touching the store, so distinct inputs like "abc" and "xyz" never
     * collapse onto one key.
     */
    bool accepts(const std::string& phone) const;

  private:
    std::string canonical(const std::string& phone) const;

    storage::Store& store_;
    bool normalize_phone_;
};

} // namespace phoneaddr::service
