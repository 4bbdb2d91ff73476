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
 * @file server_test.cpp
 * @brief Socket-level tests: a live server on a loopback ephemeral port.
 *
 * @details
 * Each test starts a `Server` over the in-memory store on `127.0.0.1:0`,
 * talks to it through plain blocking client sockets and stops it again.
 * Client reads time out after a few seconds, so a stalled server fails the
 * test instead of hanging the suite.
 */

#include "framework.hpp"
#include "memory_store.hpp"
#include "phoneaddr/network/router.hpp"
#include "phoneaddr/network/server.hpp"
#include "phoneaddr/service/record_service.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>

using phoneaddr::network::Router;
using phoneaddr::network::Server;
using phoneaddr::service::RecordService;
using phoneaddr::test::MemoryStore;

namespace {

constexpr int CLIENT_TIMEOUT_SECONDS = 5;

/**
 * @brief Server on an ephemeral loopback port, running on its own thread.
 *
 * The constructor returns once the listener is bound; the destructor stops
 * the event loop and joins it.
 */
class RunningServer {
  public:
    explicit RunningServer(size_t workers)
        : server_(router_, "127.0.0.1", 0, workers), thread_([this] {
              try {
                  server_.run();
              } catch (const std::exception& e) {
                  failure_ = e.what();
                  failed_ = true;
              }
          })
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (server_.bound_port() == 0) {
            if (failed_ || std::chrono::steady_clock::now() > deadline) {
                stop();
                throw std::runtime_error("Server did not start: " + failure_);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        port_ = server_.bound_port();
    }

    ~RunningServer() { stop(); }

    RunningServer(const RunningServer&) = delete;
    RunningServer& operator=(const RunningServer&) = delete;

    /// @brief Requests a stop and waits for `run()` to return.
    void stop()
    {
        server_.request_stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    int port() const { return port_; }
    Server& server() { return server_; }
    MemoryStore& store() { return store_; }

  private:
    MemoryStore store_;
    RecordService service_{store_};
    Router router_{service_, store_, "Phone Address Service", "/api/v1"};
    Server server_;

    std::string failure_;
    std::atomic<bool> failed_{false};
    int port_ = 0;

    /// @brief Declared last: started once every member above exists.
    std::thread thread_;
};

/**
 * @brief Blocking loopback client that reads whole HTTP responses.
 */
class Client {
  public:
    explicit Client(int port)
    {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            throw std::runtime_error("socket() failed");
        }

        struct timeval tv;
        tv.tv_sec = CLIENT_TIMEOUT_SECONDS;
        tv.tv_usec = 0;
        if (setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
            close(fd_);
            throw std::runtime_error("setsockopt(SO_RCVTIMEO) failed");
        }

        struct sockaddr_in address;
        std::memset(&address, 0, sizeof(address));
        address.sin_family = AF_INET;
        address.sin_port = htons(static_cast<uint16_t>(port));
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

        if (connect(fd_, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
            close(fd_);
            throw std::runtime_error("connect() failed: " + std::string(std::strerror(errno)));
        }
    }

    ~Client() { close(fd_); }

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    bool send_text(const std::string& data)
    {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    /**
     * @brief Next complete response (head and Content-Length body).
     * @return Empty on EOF, error or timeout.
     */
    std::string read_response()
    {
        while (true) {
            size_t head_end = pending_.find("\r\n\r\n");
            if (head_end != std::string::npos) {
                size_t total = head_end + 4 + content_length(pending_.substr(0, head_end));
                if (pending_.size() >= total) {
                    std::string response = pending_.substr(0, total);
                    pending_.erase(0, total);
                    return response;
                }
            }
            if (!fill()) {
                return "";
            }
        }
    }

    /// @brief True when the server has closed the connection.
    bool closed_by_peer()
    {
        if (!pending_.empty()) {
            return false;
        }
        char byte;
        return recv(fd_, &byte, 1, 0) == 0;
    }

  private:
    bool fill()
    {
        char buffer[4096];
        ssize_t n = recv(fd_, buffer, sizeof(buffer), 0);
        if (n <= 0) {
            return false;
        }
        pending_.append(buffer, static_cast<size_t>(n));
        return true;
    }

    static size_t content_length(const std::string& head)
    {
        const std::string name = "Content-Length:";
        size_t pos = head.find(name);
        if (pos == std::string::npos) {
            return 0;
        }
        return static_cast<size_t>(std::strtoul(head.c_str() + pos + name.size(), nullptr, 10));
    }

    int fd_;
    std::string pending_;
};

const char* const HEALTH_REQUEST = "GET /health HTTP/1.1\r\nHost: localhost\r\n\r\n";

bool starts_with(const std::string& text, const std::string& prefix)
{
    return text.rfind(prefix, 0) == 0;
}

} // namespace

/**
 * @brief Idle keep-alive clients hold no worker: with a single worker and two
 * quiet connections open, a third client is still answered at once.
 */
void test_server_idle_connections_do_not_block()
{
    RunningServer server(1);

    // One kept-alive client idles after its first response, another stalls
    // mid-request.
    Client idle(server.port());
    ASSERT_TRUE(idle.send_text(HEALTH_REQUEST));
    ASSERT_TRUE(starts_with(idle.read_response(), "HTTP/1.1 200"));
    Client partial(server.port());
    ASSERT_TRUE(partial.send_text("GET /health HTTP/1.1\r\nHo"));

    auto started = std::chrono::steady_clock::now();
    Client active(server.port());
    ASSERT_TRUE(active.send_text(HEALTH_REQUEST));
    std::string response = active.read_response();
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(starts_with(response, "HTTP/1.1 200"));
    ASSERT_TRUE(elapsed < std::chrono::seconds(2));

    // The half-sent request is still served once it completes.
    ASSERT_TRUE(partial.send_text("st: localhost\r\n\r\n"));
    ASSERT_TRUE(starts_with(partial.read_response(), "HTTP/1.1 200"));
}

void test_server_keep_alive()
{
    RunningServer server(2);
    Client client(server.port());

    const std::string body = R"({"phone": "+79990000000", "address": "Moscow"})";
    ASSERT_TRUE(client.send_text("POST /api/v1/phone-addresses HTTP/1.1\r\n"
                                 "Host: localhost\r\nContent-Type: application/json\r\n"
                                 "Content-Length: " +
                                 std::to_string(body.size()) + "\r\n\r\n" + body));
    std::string created = client.read_response();
    ASSERT_TRUE(starts_with(created, "HTTP/1.1 201"));

    ASSERT_TRUE(client.send_text("GET /api/v1/phone-addresses/%2B79990000000 HTTP/1.1\r\n"
                                 "Host: localhost\r\n\r\n"));
    std::string fetched = client.read_response();
    ASSERT_TRUE(starts_with(fetched, "HTTP/1.1 200"));
    ASSERT_TRUE(fetched.find(R"({"phone":"+79990000000","address":"Moscow"})") !=
                std::string::npos);

    ASSERT_EQ(*server.store().peek("phone_address:+79990000000"), std::string("Moscow"));
}

void test_server_pipelined_requests()
{
    RunningServer server(2);
    Client client(server.port());

    ASSERT_TRUE(client.send_text(std::string(HEALTH_REQUEST) +
                                 "GET /api/v1/phone-addresses/123 HTTP/1.1\r\n"
                                 "Host: localhost\r\n\r\n"));
    ASSERT_TRUE(starts_with(client.read_response(), "HTTP/1.1 200"));
    ASSERT_TRUE(starts_with(client.read_response(), "HTTP/1.1 404"));
}

void test_server_body_too_large()
{
    RunningServer server(2);
    Client client(server.port());

    ASSERT_TRUE(client.send_text("POST /api/v1/phone-addresses HTTP/1.1\r\n"
                                 "Host: localhost\r\nContent-Type: application/json\r\n"
                                 "Content-Length: " +
                                 std::to_string(Server::MAX_BODY_BYTES + 1) + "\r\n\r\n"));

    std::string response = client.read_response();
    ASSERT_TRUE(starts_with(response, "HTTP/1.1 413"));
    ASSERT_TRUE(response.find(R"({"detail":"Request body too large."})") != std::string::npos);
    ASSERT_TRUE(client.closed_by_peer());
    ASSERT_EQ(server.store().calls(), 0);
}

void test_server_connection_close()
{
    RunningServer server(2);
    Client client(server.port());

    ASSERT_TRUE(client.send_text("GET /health HTTP/1.1\r\nHost: localhost\r\n"
                                 "Connection: close\r\n\r\n"));
    ASSERT_TRUE(starts_with(client.read_response(), "HTTP/1.1 200"));
    ASSERT_TRUE(client.closed_by_peer());
}

/**
 * @brief `request_stop()` ends `run()`, closes open clients and the listener.
 */
void test_server_shutdown()
{
    RunningServer server(2);
    int port = server.port();

    Client idle(port);
    ASSERT_TRUE(idle.send_text(HEALTH_REQUEST));
    ASSERT_TRUE(starts_with(idle.read_response(), "HTTP/1.1 200"));

    server.stop();

    ASSERT_EQ(server.server().bound_port(), 0);
    ASSERT_TRUE(idle.closed_by_peer());
    ASSERT_THROWS(std::runtime_error, Client late(port));
}
