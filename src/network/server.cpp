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
 * @brief Implementation of the HTTP listener and per-connection loop.
 */

#include "revfs/network/server.hpp"

#include "revfs/infra/logger.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace revfs::network {

namespace {

constexpr size_t kRecvBufferSize = 64 * 1024;
constexpr size_t kFileChunkSize = 64 * 1024;

} // namespace

Server::Server(const Services& services, ServerOptions options)
    : services_(services), options_(std::move(options)), server_fd_(-1), running_(false),
      scheduler_(options_.workers)
{
}

Server::~Server()
{
    stop();
}

void Server::stop()
{
    if (!running_.exchange(false))
        return;

    infra::Logger::log(infra::LogLevel::INFO,
                       "Network: Shutdown signal received. Stopping server...");

    // 1. Terminate the main listener socket
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }

    // 2. Unblock workers still waiting on their peers; they close the fds.
    {
        std::lock_guard<std::mutex> lock(client_mutex_);
        for (int sock : client_sockets_) {
            shutdown(sock, SHUT_RDWR);
        }
    }
}

bool set_idle_timeout(int sock, std::uint64_t seconds)
{
    struct timeval tv;
    tv.tv_sec = static_cast<time_t>(seconds);
    tv.tv_usec = 0;
    return setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

void Server::run()
{
    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error("Network: Failed to create socket: " +
                                 std::string(std::strerror(errno)));
    }

    // Allow immediate address reuse to facilitate quick restarts
    int opt = 1;
    if (setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt))) {
        infra::Logger::log(infra::LogLevel::WARN, "Network: setsockopt(SO_REUSEADDR) failed.");
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(options_.port));
    if (inet_pton(AF_INET, options_.host.c_str(), &address.sin_addr) != 1) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Network: Invalid bind address '" + options_.host + "'");
    }

    if (bind(server_fd_, (struct sockaddr*)&address, sizeof(address)) < 0) {
        const std::string reason = std::strerror(errno);
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Network: Failed to bind to " + options_.host + ":" +
                                 std::to_string(options_.port) + ": " + reason);
    }

    if (listen(server_fd_, 128) < 0) {
        close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Network: Failed to listen.");
    }

    running_ = true;
    infra::Logger::log(infra::LogLevel::INFO, "Network: revfs listening on " + options_.host +
                                                  ":" + std::to_string(options_.port) + " with " +
                                                  std::to_string(scheduler_.size()) +
                                                  " workers");

    // Accept Loop: The Delegator
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t len = sizeof(client_addr);

        int sock = accept(server_fd_, (struct sockaddr*)&client_addr, &len);

        if (sock >= 0) {
            if (!running_) {
                close(sock);
                break;
            }

            char ip[INET_ADDRSTRLEN] = "unknown";
            inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
            infra::Logger::log(infra::LogLevel::DEBUG,
                               "Network: New connection from " + std::string(ip));

            if (!set_idle_timeout(sock, options_.idle_timeout_secs)) {
                infra::Logger::log(infra::LogLevel::WARN,
                                   "Network: setsockopt(SO_RCVTIMEO) failed.");
            }

            add_client(sock);
            scheduler_.enqueue([this, sock]() { this->handle_client(sock); });

        } else if (running_) {
            if (errno == EINTR) {
                continue;
            }
            infra::Logger::log(infra::LogLevel::ERROR, "Network: Accept failed (Error code: " +
                                                           std::to_string(errno) + ")");
        } else {
            // Intentional shutdown
            break;
        }
    }

    infra::Logger::log(infra::LogLevel::INFO, "Network: Server event loop terminated.");
}

/**
 * @brief Client Handler Routine (Worker Thread Context).
 *
 * Accumulates bytes until a full request is buffered, answers it, and keeps
 * any pipelined remainder for the next iteration.
 */
void Server::handle_client(int sock)
{
    std::vector<char> chunk(kRecvBufferSize);
    std::string buffer;

    while (running_) {
        Request request;
        const ParseStatus status = Http::parse(buffer, request, options_.max_request_bytes);

        if (status == ParseStatus::Complete) {
            Response response = Handler::process(services_, request);
            const bool keep_alive = request.keep_alive();
            infra::Logger::log(infra::LogLevel::DEBUG, "Network: " + request.method + " " +
                                                           request.path + " -> " +
                                                           std::to_string(response.status));
            if (!send_response(sock, response, keep_alive) || !keep_alive) {
                break;
            }
            continue;
        }

        if (status == ParseStatus::Invalid || status == ParseStatus::TooLarge) {
            Response response = status == ParseStatus::Invalid
                                    ? Response::error(400, "malformed HTTP request")
                                    : Response::error(413, "request body too large");
            infra::Logger::log(infra::LogLevel::WARN,
                               "Network: Rejected request with status " +
                                   std::to_string(response.status));
            send_response(sock, response, false);
            break;
        }

        ssize_t read_len = recv(sock, chunk.data(), chunk.size(), 0);
        if (read_len > 0) {
            buffer.append(chunk.data(), static_cast<size_t>(read_len));
        } else if (read_len == 0) {
            infra::Logger::log(infra::LogLevel::DEBUG, "Network: Client disconnected cleanly.");
            break;
        } else {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                infra::Logger::log(infra::LogLevel::DEBUG,
                                   "Network: Idle connection timed out; releasing worker.");
            } else {
                infra::Logger::log(infra::LogLevel::DEBUG, "Network: Socket read error.");
            }
            break;
        }
    }

    remove_client(sock);
}

bool Server::send_all(int sock, const char* data, size_t len)
{
    while (len > 0) {
        ssize_t sent = send(sock, data, len, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        data += sent;
        len -= static_cast<size_t>(sent);
    }
    return true;
}

bool Server::send_response(int sock, Response& response, bool keep_alive)
{
    const std::string head = Http::serialize_head(response, keep_alive);
    if (!send_all(sock, head.data(), head.size())) {
        return false;
    }

    if (!response.file) {
        return send_all(sock, response.body.data(), response.body.size());
    }

    std::vector<char> buf(kFileChunkSize);
    std::uint64_t remaining = response.file_size;
    while (remaining > 0) {
        const size_t want = static_cast<size_t>(std::min<std::uint64_t>(buf.size(), remaining));
        response.file->read(buf.data(), static_cast<std::streamsize>(want));
        const std::streamsize got = response.file->gcount();
        if (got <= 0) {
            // The file shrank after its size was taken; the framing is now wrong.
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Network: File body ended early; closing connection.");
            return false;
        }
        if (!send_all(sock, buf.data(), static_cast<size_t>(got))) {
            return false;
        }
        remaining -= static_cast<std::uint64_t>(got);
    }
    return true;
}

void Server::add_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_sockets_.push_back(sock);
}

void Server::remove_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    auto it = std::find(client_sockets_.begin(), client_sockets_.end(), sock);
    if (it != client_sockets_.end()) {
        close(sock);
        client_sockets_.erase(it);
    }
}

} // namespace revfs::network
