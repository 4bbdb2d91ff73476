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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * Stateless helpers used by the configuration loader (trimming, case folding),
 * the HTTP router (percent-decoding of path parameters) and the record
 * service (phone normalization).
 */

#pragma once

#include <optional>
#include <string>

namespace phoneaddr::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return A new string without surrounding whitespace. Empty if the input
     * consists solely of whitespace.
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Returns an ASCII lower-cased copy of @p s.
     */
    static std::string to_lower(const std::string& s);

    /**
     * @brief Checks whether @p s begins with @p prefix.
     */
    static bool starts_with(const std::string& s, const std::string& prefix);

    /**
     * @brief Keeps only the decimal digits of @p s.
     *
     * Used to reduce phone numbers written in any human format to a canonical
     * key: `"+7 (999) 123-45-67"` becomes `"79991234567"`. A string with no
     * digits at all yields an empty string.
     */
    static std::string digits_only(const std::string& s);

    /**
     * @brief Decodes `%XX` escape sequences in a URL path segment.
     *
     * `+` is left untouched (it only means space in form-encoded query
     * strings, not in paths).
     *
     * @return The decoded string, or `std::nullopt` if an escape sequence is
     * truncated or not hexadecimal.
     */
    static std::optional<std::string> percent_decode(const std::string& s);
};

} // namespace phoneaddr::infra
