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
 * @file server.hpp
 * @brief Multi-threaded HTTP listener and connection dispatcher.
 *
 * @details
 * This header declares the `Server` class, the network entry point of the
 * service. It handles the low-level BSD socket operations (bind, listen,
 * accept) and dispatches each client connection to the worker pool
 * (`Scheduler`).
 */

#pragma once

#include "revfs/infra/scheduler.hpp"
#include "revfs/network/handler.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace revfs::network {

/**
 * @struct ServerOptions
 * @brief Listener settings taken from the service configuration.
 */
struct ServerOptions {
    std::string host = "0.0.0.0";
    int port = 3000;
    size_t workers = 1;
    std::uint64_t max_request_bytes = 64ULL * 1024 * 1024;
    std::uint64_t idle_timeout_secs = 5; ///< 0 waits on idle peers forever.
};

/**
 * @brief Bounds how long a blocking `recv` on `socket` may wait (SO_RCVTIMEO).
 *
 * An idle keep-alive peer then releases its worker instead of holding it.
 *
 * @param seconds Timeout; 0 clears it.
 * @return False if the option could not be set.
 */
bool set_idle_timeout(int socket, std::uint64_t seconds);

/**
 * @class Server
 * @brief A thread-pooled HTTP/1.1 server for the workspace API.
 *
 * @details
 * **Operational Workflow:**
 * 1. **Accept:** The main thread blocks on `accept()`.
 * 2. **Dispatch:** The socket is submitted to the `infra::Scheduler`.
 * 3. **Process:** A worker runs `handle_client`, parsing requests and
 *    answering them through `Handler` until the peer closes, asks to close,
 *    stays idle past `idle_timeout_secs`, or sends something malformed.
 * 4. **Cleanup:** Active sockets are tracked so `stop()` can unblock workers.
 */
class Server {
  public:
    /**
     * @brief Constructs the server; binds nothing until `run()`.
     *
     * @param services Storage objects shared by every connection.
     * @param options Bind address, port, pool size and body limit.
     */
    Server(const Services& services, ServerOptions options);

    /// @brief Calls `stop()`, then lets the scheduler drain and join.
    ~Server();

    /**
     * @brief Binds, listens and runs the accept loop.
     *
     * @note Blocking. Returns once `stop()` is called.
     * @throws std::runtime_error If the socket cannot be created, bound or
     * put into listening state.
     */
    void run();

    /**
     * @brief Signals the server to shut down.
     *
     * Closes the listening socket (unblocking `accept`) and shuts down every
     * active client socket.
     */
    void stop();

  private:
    void handle_client(int socket);

    /// @brief Writes the whole buffer; false if the peer is gone.
    bool send_all(int socket, const char* data, size_t len);

    /// @brief Sends head and body (buffered or streamed); false on I/O failure.
    bool send_response(int socket, Response& response, bool keep_alive);

    void add_client(int socket);
    void remove_client(int socket);

    Services services_;
    ServerOptions options_;
    int server_fd_;
    std::atomic<bool> running_;
    infra::Scheduler scheduler_;

    std::vector<int> client_sockets_;
    std::mutex client_mutex_;
};

} // namespace revfs::network
