/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <sys/socket.h>
#include "ph/observer.hpp"
#include "ph/server_config.hpp"
#include "ph/static_document.hpp"
#include "ph/types.hpp"
#include "ph/internal/conn_set.hpp"
#include "ph/internal/tls_ctx.hpp"

namespace ph {

// Single-page HTTPS server.
//
// start() loads the identity and binds the listener on the caller's thread,
// then a listener thread reports `ready` (-> Running with the advertised URL)
// and accepts connections, each handled on its own detached thread.
// stop() only requests cancellation; the listener thread cancels in-flight
// connections, waits for them and reports `cancelled`.
//
// The observer (if any) must outlive the Server. Without one, events go to
// log_line().
//
// SIGPIPE is left to the application; ignore it before serving.
class Server {
public:
    explicit Server(const ServerConfig& cfg, ServerObserver* observer = nullptr);
    ~Server();

    void start();
    void stop();

    ServerStatus status() const;

    // Bound port while a listener exists, configured port otherwise.
    uint16_t port() const;

    std::size_t active_connections() const;

    const StaticDocument& document() const { return *_doc; }

    // non-copyable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

private:
    ServerConfig _cfg;
    ServerObserver* _observer;
    std::shared_ptr<const StaticDocument> _doc;

    std::mutex _lifecycle_mtx;   // serialises start()/stop()
    std::mutex _publish_mtx;     // state changes + observer callbacks
    mutable std::mutex _state_mtx;
    ServerStatus _status;

    std::mutex _listen_mtx;
    int _listen_fd = -1;
    std::atomic<uint16_t> _bound_port{0};
    std::atomic<bool> _stop{false};
    std::thread _listener;

    std::atomic<std::uint64_t> _conn_seq{0};
    internal::ConnectionSet _conns;
    std::shared_ptr<internal::TlsContext> _tls;

    void emit(EventKind kind, const std::string& msg, std::uint64_t conn_id = 0);
    void emit_unlocked(EventKind kind, const std::string& msg, std::uint64_t conn_id = 0);
    void set_status_unlocked(const ServerStatus& s);
    ServerState state_unlocked() const;
    void fail_start(const std::string& reason);

    // listener thread
    void listen_loop(int listen_fd);
    void on_ready();
    void on_failed(const std::string& reason);
    void on_cancelled();
    void dispatch(int fd, const sockaddr_storage& peer);

    int create_listen_socket();
    void release_listener();
};

} // namespace ph
