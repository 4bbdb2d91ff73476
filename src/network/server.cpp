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
 * @file server.cpp
 * @brief Implementation of the poll-driven HTTP server.
 */

#include "phoneaddr/network/server.hpp"

#include "phoneaddr/infra/logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <utility>

namespace phoneaddr::network {

using infra::LogLevel;
using infra::Logger;

Server::Server(Router& router, std::string host, int port, size_t workers)
    : router_(router), host_(std::move(host)), port_(port), bound_port_(0), running_(true),
      scheduler_(workers)
{
    if (pipe2(wake_fds_, O_NONBLOCK | O_CLOEXEC) < 0) {
        throw std::runtime_error("Network: Failed to create wake-up pipe: " +
                                 std::string(std::strerror(errno)));
    }
}

Server::~Server()
{
    request_stop();
    close(wake_fds_[0]);
    close(wake_fds_[1]);
}

void Server::request_stop() noexcept
{
    running_ = false;
    wake();
}

void Server::wake() noexcept
{
    char byte = 1;
    // EAGAIN means the pipe is full, so a wake-up is already pending.
    if (::write(wake_fds_[1], &byte, 1) < 0) {
        return;
    }
}

void Server::clear_wake()
{
    char buf[64];
    while (::read(wake_fds_[0], buf, sizeof(buf)) > 0) {
    }
}

// ============================================================================
//  Event loop
// ============================================================================

void Server::run()
{
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::runtime_error("Network: Failed to create socket: " +
                                 std::string(std::strerror(errno)));
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        close(fd);
        throw std::runtime_error("Network: setsockopt(SO_REUSEADDR) failed.");
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(port_));
    if (inet_pton(AF_INET, host_.c_str(), &address.sin_addr) != 1) {
        close(fd);
        throw std::runtime_error("Network: Invalid IPv4 listen address '" + host_ + "'");
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        std::string reason = std::strerror(errno);
        close(fd);
        throw std::runtime_error("Network: Failed to bind " + host_ + ":" +
                                 std::to_string(port_) + ": " + reason);
    }

    if (listen(fd, SOMAXCONN) < 0) {
        close(fd);
        throw std::runtime_error("Network: Failed to listen.");
    }

    struct sockaddr_in bound;
    socklen_t bound_len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) < 0) {
        close(fd);
        throw std::runtime_error("Network: getsockname() failed.");
    }
    bound_port_ = ntohs(bound.sin_port);

    Logger::log(LogLevel::INFO, "Network: Listening on " + host_ + ":" +
                                    std::to_string(bound_port_.load()) + " with " +
                                    std::to_string(scheduler_.size()) + " worker(s)");

    std::vector<struct pollfd> fds;

    // A stop requested before the listener existed leaves running_ false here.
    while (running_) {
        // Watch set: listener, wake-up pipe, then every client not held by a worker.
        fds.clear();
        fds.push_back({fd, POLLIN, 0});
        fds.push_back({wake_fds_[0], POLLIN, 0});
        for (const auto& entry : sessions_) {
            if (!entry.second->busy) {
                fds.push_back({entry.first, POLLIN, 0});
            }
        }

        int ready = poll(fds.data(), fds.size(), POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::log(LogLevel::ERROR,
                        "Network: poll() failed: " + std::string(std::strerror(errno)));
            break;
        }
        if (!running_) {
            break;
        }

        if (fds[1].revents != 0) {
            clear_wake();
        }
        collect_handbacks();

        if (fds[0].revents & POLLIN) {
            accept_clients(fd);
        }

        // Descriptors closed above were busy, hence not in this watch set.
        for (size_t i = 2; i < fds.size(); ++i) {
            if (fds[i].revents != 0) {
                read_client(fds[i].fd);
            }
        }

        close_idle_sessions();
    }

    Logger::log(LogLevel::INFO, "Network: Closing listener and active sessions...");
    bound_port_ = 0;
    close(fd);
    shutdown_sessions();
    Logger::log(LogLevel::INFO, "Network: Server event loop terminated.");
}

void Server::accept_clients(int listener)
{
    while (true) {
        struct sockaddr_in client_addr;
        socklen_t len = sizeof(client_addr);

        // Client sockets stay blocking for the workers' writes (bounded by a
        // send timeout); the loop reads them with MSG_DONTWAIT.
        int sock = accept4(listener, reinterpret_cast<struct sockaddr*>(&client_addr), &len,
                           SOCK_CLOEXEC);
        if (sock < 0) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                Logger::log(LogLevel::ERROR,
                            "Network: Accept failed: " + std::string(std::strerror(errno)));
            }
            return;
        }

        struct timeval tv;
        tv.tv_sec = IDLE_TIMEOUT_SECONDS;
        tv.tv_usec = 0;
        if (setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
            Logger::log(LogLevel::WARN, "Network: Cannot set send timeout on client socket.");
        }

        char ip[INET_ADDRSTRLEN] = "unknown";
        inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
        Logger::log(LogLevel::DEBUG, "Network: New connection from " + std::string(ip));

        sessions_[sock] = std::make_unique<Session>(sock);
    }
}

void Server::read_client(int fd)
{
    auto it = sessions_.find(fd);
    if (it == sessions_.end() || it->second->busy) {
        return;
    }
    Session& session = *it->second;

    char buffer[8192];
    ssize_t read_len = recv(fd, buffer, sizeof(buffer), MSG_DONTWAIT);

    if (read_len == 0) {
        Logger::log(LogLevel::DEBUG, "Network: Client disconnected.");
        close_session(fd);
        return;
    }
    if (read_len < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        Logger::log(LogLevel::DEBUG,
                    "Network: Socket read error: " + std::string(std::strerror(errno)));
        close_session(fd);
        return;
    }

    session.last_active = std::chrono::steady_clock::now();
    session.state = session.reader.feed(buffer, static_cast<size_t>(read_len));

    if (session.state != RequestReader::State::NEED_MORE) {
        dispatch(session);
    }
}

void Server::dispatch(Session& session)
{
    session.busy = true;
    {
        std::lock_guard<std::mutex> lock(handback_mutex_);
        ++in_flight_;
    }
    // The session outlives the task: busy sessions are never erased.
    Session* target = &session;
    scheduler_.enqueue([this, target]() {
        bool keep_open = false;
        try {
            keep_open = this->serve(*target);
        } catch (const std::exception& e) {
            Logger::log(LogLevel::ERROR,
                        std::string("Network: Dropping connection after failure: ") + e.what());
        }
        // Always returned, or shutdown would wait on it forever.
        this->hand_back(target->fd, keep_open);
    });
}

void Server::collect_handbacks()
{
    std::vector<Handback> done;
    {
        std::lock_guard<std::mutex> lock(handback_mutex_);
        done.swap(handbacks_);
    }

    for (const Handback& h : done) {
        auto it = sessions_.find(h.fd);
        if (it == sessions_.end()) {
            continue;
        }
        if (!h.keep_open) {
            close_session(h.fd);
            continue;
        }
        it->second->busy = false;
        it->second->last_active = std::chrono::steady_clock::now();
    }
}

void Server::close_idle_sessions()
{
    auto now = std::chrono::steady_clock::now();
    auto limit = std::chrono::seconds(IDLE_TIMEOUT_SECONDS);

    for (auto it = sessions_.begin(); it != sessions_.end();) {
        Session& s = *it->second;
        if (!s.busy && now - s.last_active > limit) {
            Logger::log(LogLevel::DEBUG, "Network: Closing idle connection.");
            close(s.fd);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
}

void Server::close_session(int fd)
{
    close(fd);
    sessions_.erase(fd);
}

void Server::shutdown_sessions()
{
    // Let in-flight requests finish writing their responses.
    {
        std::unique_lock<std::mutex> lock(handback_mutex_);
        handback_cv_.wait(lock, [this] { return in_flight_ == 0; });
        handbacks_.clear();
    }

    for (auto& entry : sessions_) {
        close(entry.first);
    }
    sessions_.clear();
}

// ============================================================================
//  Worker side
// ============================================================================

bool Server::serve(Session& session)
{
    bool keep_open = true;
    RequestReader::State state = session.state;

    // Pipelined requests are answered in order.
    while (state == RequestReader::State::COMPLETE) {
        Request req = session.reader.take();
        Response res = router_.handle(req);

        if (!send_all(session.fd, serialize(res)) || !res.keep_alive()) {
            keep_open = false;
            break;
        }
        state = session.reader.poll();
    }

    if (keep_open && state == RequestReader::State::FAILED) {
        Logger::log(LogLevel::WARN, "Network: " + session.reader.error_message());
        if (!send_all(session.fd, serialize(router_.reject(session.reader.error_status(),
                                                           session.reader.error_message())))) {
            Logger::log(LogLevel::DEBUG, "Network: Could not deliver error response.");
        }
        keep_open = false;
    }

    session.state = state;
    return keep_open;
}

void Server::hand_back(int fd, bool keep_open)
{
    {
        std::lock_guard<std::mutex> lock(handback_mutex_);
        handbacks_.push_back({fd, keep_open});
        --in_flight_;
    }
    handback_cv_.notify_all();
    wake();
}

bool Server::send_all(int sock, const std::string& data)
{
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(sock, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::log(LogLevel::DEBUG,
                        "Network: Socket write error: " + std::string(std::strerror(errno)));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace phoneaddr::network
