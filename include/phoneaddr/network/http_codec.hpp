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
 * @file http_codec.hpp
 * @brief HTTP/1.1 framing on top of raw socket bytes.
 *
 * @details
 * The server reads from plain BSD sockets; this codec turns the byte stream
 * into Boost.Beast request messages and Beast responses back into bytes. It
 * owns no socket, so the framing logic is exercised directly in tests.
 *
 * Pipelined requests are supported: bytes following a complete request stay
 * buffered and are parsed on the next `poll()`.
 */

#pragma once

#include <boost/beast/http.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace phoneaddr::network {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

/**
 * @class RequestReader
 * @brief Incremental parser for a stream of HTTP requests.
 */
class RequestReader {
  public:
    enum class State {
        NEED_MORE, ///< A request is incomplete; feed more bytes.
        COMPLETE,  ///< A request is ready; call `take()`.
        FAILED     ///< The stream is malformed; see `error_status()`.
    };

    /**
     * @param body_limit Largest accepted request body, in bytes. A larger
     * body fails the stream with 413.
     */
    explicit RequestReader(size_t body_limit);

    /// @brief Appends received bytes and parses as far as possible.
    State feed(const char* data, size_t len);

    /// @brief Parses buffered bytes without adding new ones.
    State poll();

    /**
     * @brief Hands out the completed request and resets for the next one.
     * @pre The last `feed()`/`poll()` returned `COMPLETE`.
     */
    Request take();

    /// @brief Status to answer a `FAILED` stream with (400, 413 or 431).
    http::status error_status() const { return error_status_; }

    /// @brief Human-readable reason for the failure.
    const std::string& error_message() const { return error_message_; }

    /// @brief True if bytes of an unfinished request are buffered.
    bool has_partial() const { return !buffer_.empty(); }

  private:
    void reset_parser();

    size_t body_limit_;
    std::string buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    bool failed_ = false;
    http::status error_status_ = http::status::bad_request;
    std::string error_message_;
};

/// @brief Wire form of @p response (status line, headers, body).
std::string serialize(const Response& response);

} // namespace phoneaddr::network
