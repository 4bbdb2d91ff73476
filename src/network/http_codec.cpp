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
 * @file http_codec.cpp
 * @brief Beast parser driving and response serialization.
 */

#include "phoneaddr/network/http_codec.hpp"

#include <boost/asio/buffer.hpp>

#include <sstream>

namespace phoneaddr::network {

RequestReader::RequestReader(size_t body_limit) : body_limit_(body_limit)
{
    reset_parser();
}

void RequestReader::reset_parser()
{
    parser_.emplace();
    parser_->body_limit(body_limit_);
    parser_->eager(true);
}

RequestReader::State RequestReader::feed(const char* data, size_t len)
{
    buffer_.append(data, len);
    return poll();
}

RequestReader::State RequestReader::poll()
{
    if (failed_) {
        return State::FAILED;
    }

    // Beast needs the whole header in one contiguous buffer; until it is there
    // put() consumes nothing and reports need_more.
    while (!parser_->is_done() && !buffer_.empty()) {
        boost::beast::error_code ec;
        size_t used = parser_->put(boost::asio::buffer(buffer_.data(), buffer_.size()), ec);
        buffer_.erase(0, used);

        if (ec == http::error::need_more) {
            return State::NEED_MORE;
        }
        if (ec) {
            failed_ = true;
            if (ec == http::error::body_limit) {
                error_status_ = http::status::payload_too_large;
                error_message_ = "Request body too large.";
            } else if (ec == http::error::header_limit) {
                error_status_ = http::status::request_header_fields_too_large;
                error_message_ = "Request header too large.";
            } else {
                error_status_ = http::status::bad_request;
                error_message_ = "Malformed HTTP request: " + ec.message();
            }
            return State::FAILED;
        }
        if (used == 0) {
            break;
        }
    }

    return parser_->is_done() ? State::COMPLETE : State::NEED_MORE;
}

Request RequestReader::take()
{
    Request req = parser_->release();
    reset_parser();
    return req;
}

std::string serialize(const Response& response)
{
    std::ostringstream os;
    os << response;
    return os.str();
}

} // namespace phoneaddr::network
