/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "ph/server.hpp"
#include "ph/errors.hpp"
#include "ph/identity.hpp"
#include "ph/log.hpp"
#include "ph/internal/https_conn.hpp"
#include "ph/internal/net_iface.hpp"

#include <chrono>
#include <optional>
#include <cstring>
#include <cerrno>
#include <system_error>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace ph {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_keepalive(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

// "ip:port", "[ip6]:port" or "unknown"
static std::string sockaddr_to_peer(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        if (!inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf))) return "unknown";
        return std::string(buf) + ":" + std::to_string(ntohs(a->sin_port));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        if (!inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf))) return "unknown";
        return "[" + std::string(buf) + "]:" + std::to_string(ntohs(a->sin6_port));
    }
    return "unknown";
}

// accept() errors after which the listener keeps going without comment
static bool is_retryable_accept_error(int err) {
    switch (err) {
        case EINTR: case ECONNABORTED: case EAGAIN:
        case ENETDOWN: case EPROTO: case ENOPROTOOPT: case EHOSTDOWN:
        case ENONET: case EHOSTUNREACH: case EOPNOTSUPP: case ENETUNREACH:
            return true;
        default:
            return false;
    }
}

// resource exhaustion: report as `waiting` and back off
static bool is_waiting_accept_error(int err) {
    return err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM;
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg, ServerObserver* observer)
    : _cfg(cfg), _observer(observer), _conns(cfg.max_connections)
{
    StaticDocument doc = StaticDocument::load(_cfg.document_file);
    if (doc.is_fallback()) {
        emit(EventKind::Warning, _cfg.document_file + " not found, serving a placeholder page");
    } else {
        emit(EventKind::Success, _cfg.document_file + " loaded (" +
                                 std::to_string(doc.size()) + " bytes)");
    }
    _doc = std::make_shared<const StaticDocument>(std::move(doc));

    emit(EventKind::Info, "server initialised");
}

Server::~Server() {
    ServerState st = status().state;
    if (st == ServerState::Running || st == ServerState::Starting) {
        stop();
    }
    if (_listener.joinable()) {
        _listener.join();
    }
}

ServerStatus Server::status() const {
    std::lock_guard<std::mutex> lk(_state_mtx);
    return _status;
}

uint16_t Server::port() const {
    uint16_t p = _bound_port.load();
    return p != 0 ? p : _cfg.port;
}

std::size_t Server::active_connections() const {
    return _conns.size();
}

// ---------- publication ----------

void Server::emit(EventKind kind, const std::string& msg, std::uint64_t conn_id) {
    std::lock_guard<std::mutex> pl(_publish_mtx);
    emit_unlocked(kind, msg, conn_id);
}

void Server::emit_unlocked(EventKind kind, const std::string& msg, std::uint64_t conn_id) {
    Event ev;
    ev.kind = kind;
    ev.message = msg;
    ev.conn_id = conn_id;
    ev.timestamp = std::chrono::system_clock::now();
    if (_observer) {
        _observer->on_event(ev);
    } else {
        ph::log_line(format_event(ev));
    }
}

void Server::set_status_unlocked(const ServerStatus& s) {
    {
        std::lock_guard<std::mutex> lk(_state_mtx);
        if (_status.state == s.state && _status.url == s.url && _status.reason == s.reason) return;
        _status = s;
    }
    if (_observer) _observer->on_state(s);
}

ServerState Server::state_unlocked() const {
    std::lock_guard<std::mutex> lk(_state_mtx);
    return _status.state;
}

void Server::fail_start(const std::string& reason) {
    std::lock_guard<std::mutex> pl(_publish_mtx);
    set_status_unlocked(ServerStatus{ServerState::Failed, "", reason});
    emit_unlocked(EventKind::Error, reason);
}

// ---------- lifecycle ----------

void Server::start() {
    std::lock_guard<std::mutex> lk(_lifecycle_mtx);
    {
        std::lock_guard<std::mutex> pl(_publish_mtx);
        ServerState st = state_unlocked();
        if (st == ServerState::Running || st == ServerState::Starting) {
            emit_unlocked(EventKind::Warning, "server is already running");
            return;
        }
    }

    // The previous run's listener has been cancelled; let it finish draining.
    if (_listener.joinable()) {
        _listener.join();
    }

    {
        std::lock_guard<std::mutex> pl(_publish_mtx);
        emit_unlocked(EventKind::Info, "starting server...");
        set_status_unlocked(ServerStatus{ServerState::Starting, "", ""});
    }

    // --- TLS identity, reloaded on every start ---
    try {
        std::unique_ptr<TlsIdentity> id = load_identity(_cfg.identity_file, _cfg.identity_passphrase);
        _tls = std::make_shared<internal::TlsContext>(*id);
        const std::string cn = id->common_name();
        emit(EventKind::Success, "certificate loaded" + (cn.empty() ? std::string() : " (CN=" + cn + ")"));
    } catch (const IdentityError& e) {
        fail_start(std::string("certificate load failed: ") + e.what());
        return;
    } catch (const TlsError& e) {
        fail_start(std::string("TLS setup failed: ") + e.what());
        return;
    }

    // --- listener ---
    int fd = -1;
    try {
        fd = create_listen_socket();
    } catch (const ListenerError& e) {
        _tls.reset();
        fail_start(std::string("listener failed: ") + e.what());
        return;
    }

    {
        std::lock_guard<std::mutex> ll(_listen_mtx);
        _listen_fd = fd;
    }
    _stop.store(false);
    _conns.reset();
    _conn_seq.store(0);

    try {
        _listener = std::thread(&Server::listen_loop, this, fd);
    } catch (const std::system_error& e) {
        release_listener();
        _tls.reset();
        fail_start(std::string("cannot start listener thread: ") + e.what());
    }
}

void Server::stop() {
    std::lock_guard<std::mutex> lk(_lifecycle_mtx);
    {
        std::lock_guard<std::mutex> pl(_publish_mtx);
        ServerState st = state_unlocked();
        if (st != ServerState::Running && st != ServerState::Starting) {
            emit_unlocked(EventKind::Warning, "server is not running");
            return;
        }
        emit_unlocked(EventKind::Info, "stopping server...");
        _stop.store(true);
        set_status_unlocked(ServerStatus{ServerState::Stopped, "", ""});
    }

    // Wakes the blocked accept(); the listener thread closes the socket.
    {
        std::lock_guard<std::mutex> ll(_listen_mtx);
        if (_listen_fd >= 0) {
            (void)::shutdown(_listen_fd, SHUT_RDWR);
        }
    }
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        throw ListenerError(std::string("socket() failed: ") + std::strerror(errno));
    }
    (void)set_reuseaddr(srv);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(_cfg.port);
    if (inet_pton(AF_INET, _cfg.bind_addr.c_str(), &addr.sin_addr) != 1) {
        ::close(srv);
        throw ListenerError("invalid bind address: " + _cfg.bind_addr);
    }

    if (bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(srv);
        throw ListenerError("bind() to port " + std::to_string(_cfg.port) +
                            " failed: " + std::strerror(err));
    }
    if (listen(srv, _cfg.listen_backlog) < 0) {
        int err = errno;
        ::close(srv);
        throw ListenerError(std::string("listen() failed: ") + std::strerror(err));
    }

    sockaddr_in bound{};
    socklen_t bl = sizeof(bound);
    if (getsockname(srv, reinterpret_cast<sockaddr*>(&bound), &bl) == 0) {
        _bound_port.store(ntohs(bound.sin_port));
    } else {
        _bound_port.store(_cfg.port);
    }
    return srv;
}

void Server::release_listener() {
    std::lock_guard<std::mutex> ll(_listen_mtx);
    if (_listen_fd >= 0) {
        ::close(_listen_fd);
        _listen_fd = -1;
    }
    _bound_port.store(0);
}

// ---------- listener thread ----------

void Server::listen_loop(int listen_fd) {
    on_ready();

    std::string failure;
    bool waiting = false;
    while (!_stop.load()) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(listen_fd, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            int err = errno;
            if (_stop.load()) break;
            if (is_retryable_accept_error(err)) continue;
            if (is_waiting_accept_error(err)) {
                if (!waiting) {
                    emit(EventKind::Warning, std::string("waiting: accept() failed: ") + std::strerror(err));
                    waiting = true;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }
            failure = std::string("accept() failed: ") + std::strerror(err);
            break;
        }
        waiting = false;
        dispatch(fd, cli);
    }

    release_listener();
    _conns.cancel_all();
    _conns.wait_empty();
    _tls.reset();
    // no dispatch() can run past this point, so ids cannot collide
    _conn_seq.store(0);

    if (!failure.empty()) {
        on_failed(failure);
    } else {
        on_cancelled();
    }
}

void Server::on_ready() {
    const uint16_t p = port();
    std::optional<std::string> ip = internal::resolve_local_address(_cfg.wifi_interface);
    const std::string url = "https://" + (ip ? *ip : std::string("localhost")) +
                            ":" + std::to_string(p) + "/";

    std::lock_guard<std::mutex> pl(_publish_mtx);
    if (_stop.load() || state_unlocked() != ServerState::Starting) return;

    set_status_unlocked(ServerStatus{ServerState::Running, url, ""});
    emit_unlocked(EventKind::Success, "server started on port " + std::to_string(p));
    if (ip) {
        emit_unlocked(EventKind::Info, "address: " + url);
    } else {
        emit_unlocked(EventKind::Warning, "no IPv4 address on interface " + _cfg.wifi_interface +
                                          ", check the WiFi connection; advertising " + url);
    }
}

void Server::on_failed(const std::string& reason) {
    std::lock_guard<std::mutex> pl(_publish_mtx);
    set_status_unlocked(ServerStatus{ServerState::Failed, "", reason});
    emit_unlocked(EventKind::Error, "server error: " + reason);
}

void Server::on_cancelled() {
    std::lock_guard<std::mutex> pl(_publish_mtx);
    set_status_unlocked(ServerStatus{ServerState::Stopped, "", ""});
    emit_unlocked(EventKind::Info, "server stopped");
}

void Server::dispatch(int fd, const sockaddr_storage& cli) {
    (void)set_keepalive(fd);
    (void)set_nodelay(fd);
    std::string peer = sockaddr_to_peer(cli);

    const std::uint64_t id = ++_conn_seq;
    if (!_conns.add(id, fd)) {
        ::close(fd);
        emit(EventKind::Warning, "[" + std::to_string(id) + "] connection limit (" +
                                 std::to_string(_cfg.max_connections) + ") reached, dropped " + peer, id);
        return;
    }

    std::shared_ptr<internal::TlsContext> tls = _tls;
    std::shared_ptr<const StaticDocument> doc = _doc;
    try {
        // Detach a per-connection handler; it unregisters and closes the fd itself.
        std::thread([this, fd, id, peer, tls, doc]() {
            internal::TlsConnection conn(fd, id, peer, tls->ctx(), *doc, _cfg, _conns,
                [this](EventKind k, const std::string& m, std::uint64_t cid) { emit(k, m, cid); });
            conn.run();
        }).detach();
    } catch (const std::system_error& e) {
        _conns.remove(id);
        ::close(fd);
        emit(EventKind::Warning, "[" + std::to_string(id) + "] cannot spawn handler: " + e.what(), id);
    }
}

} // namespace ph
