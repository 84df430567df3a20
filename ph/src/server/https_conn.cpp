/*
 * Part of the PageHost (PH) project.
 *
 * SPDX-FileCopyrightText: 2025 PageHost contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of PageHost (PH). See LICENSE for details.
 * Coded by DooKoo2: https://github.com/Dookoo2
 */

#include "ph/internal/https_conn.hpp"
#include "ph/internal/http_parser.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <utility>

namespace ph::internal {

const char* to_string(ConnError e) {
    switch (e) {
        case ConnError::None:      return "none";
        case ConnError::Handshake: return "TLS handshake failed";
        case ConnError::Tls:       return "TLS protocol error";
        case ConnError::Timeout:   return "timed out";
        case ConnError::Decode:    return "request is not UTF-8 text";
        case ConnError::PeerReset: return "connection reset by peer";
        case ConnError::Send:      return "send failed";
        case ConnError::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool is_reported(ConnError e) {
    switch (e) {
        case ConnError::Timeout:
        case ConnError::Decode:
        case ConnError::PeerReset:
        case ConnError::Send:
            return true;
        default:
            return false;
    }
}

// --- TLS I/O helpers ---

// 1 on success, otherwise the failing SSL_write() return value.
static int ssl_send_all(SSL* ssl, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        int n = SSL_write(ssl, d + off, static_cast<int>(len - off));
        if (n <= 0) return n;
        off += static_cast<std::size_t>(n);
    }
    return 1;
}

static std::string tag(std::uint64_t id) {
    return "[" + std::to_string(id) + "] ";
}

// --- TlsConnection ---

TlsConnection::TlsConnection(int fd,
                             std::uint64_t id,
                             std::string peer,
                             SSL_CTX* ctx,
                             const ph::StaticDocument& doc,
                             const ph::ServerConfig& cfg,
                             ConnectionSet& set,
                             EmitFn emit)
    : _fd(fd), _id(id), _peer(std::move(peer)), _ctx(ctx),
      _doc(doc), _cfg(cfg), _set(set), _emit(std::move(emit))
{}

TlsConnection::~TlsConnection() {
    close();
}

void TlsConnection::run() {
    if (!open()) return;

    std::string req;
    if (!receive(req)) return;

    if (!respond()) return;
    close();
}

bool TlsConnection::open() {
    // Bounds the handshake as well as the request read.
    timeval tv{_cfg.idle_timeout_sec, 0};
    (void)setsockopt(_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    (void)setsockopt(_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    _ssl = SSL_new(_ctx);
    if (!_ssl) {
        ERR_clear_error();
        fail(ConnError::Tls, "SSL_new failed");
        return false;
    }
    SSL_set_fd(_ssl, _fd);

    int rc = SSL_accept(_ssl);
    if (rc <= 0) {
        ConnError e = classify(rc);
        fail(e == ConnError::Cancelled ? e : ConnError::Handshake, to_string(ConnError::Handshake));
        return false;
    }
    _tls_healthy = true;
    _emit(EventKind::Connection, tag(_id) + "connected: " + _peer, _id);
    return true;
}

bool TlsConnection::receive(std::string& req) {
    _state = ConnState::Receiving;

    req.resize(_cfg.recv_max > 0 ? _cfg.recv_max : 1);
    int n = SSL_read(_ssl, req.data(), static_cast<int>(req.size()));
    if (n <= 0) {
        ConnError e = classify(n);
        if (e == ConnError::None) {
            // peer finished without sending anything
            close();
        } else {
            fail(e, to_string(e));
        }
        return false;
    }
    req.resize(static_cast<std::size_t>(n));

    if (!is_valid_utf8(req.data(), req.size())) {
        fail(ConnError::Decode, to_string(ConnError::Decode));
        return false;
    }

    const std::string line = first_request_line(req);
    if (is_logged_request_line(line)) {
        _emit(EventKind::Info, tag(_id) + utf8_prefix(line, 40), _id);
    }
    return true;
}

bool TlsConnection::respond() {
    _state = ConnState::Responding;

    const std::string resp = build_static_response(_doc.bytes());
    int rc = ssl_send_all(_ssl, resp.data(), resp.size());
    if (rc <= 0) {
        ConnError e = classify(rc);
        if (e != ConnError::Cancelled && e != ConnError::Timeout && e != ConnError::Tls) {
            e = ConnError::Send;
        }
        fail(e, to_string(e));
        return false;
    }

    _emit(EventKind::Success,
          tag(_id) + "responded (" + std::to_string(_doc.size()) + " bytes)", _id);
    return true;
}

// Maps an SSL_accept/SSL_read/SSL_write failure onto ConnError.
// None means the peer closed the stream without an error.
ConnError TlsConnection::classify(int ret) {
    const int saved_errno = errno;
    const int err = SSL_get_error(_ssl, ret);
    const unsigned long first = ERR_peek_error();
    ERR_clear_error();

    if (err != SSL_ERROR_ZERO_RETURN) _tls_healthy = false;
    if (_set.cancelled()) return ConnError::Cancelled;

    switch (err) {
        case SSL_ERROR_ZERO_RETURN:
            return ConnError::None;
        case SSL_ERROR_WANT_READ:
        case SSL_ERROR_WANT_WRITE:
            // blocking socket: only SO_RCVTIMEO/SO_SNDTIMEO get us here
            return ConnError::Timeout;
        case SSL_ERROR_SYSCALL:
            if (saved_errno == EAGAIN || saved_errno == EWOULDBLOCK) return ConnError::Timeout;
            if (saved_errno == 0) return ConnError::None;
            return ConnError::PeerReset;
        case SSL_ERROR_SSL:
            if (ERR_GET_REASON(first) == SSL_R_UNEXPECTED_EOF_WHILE_READING) {
                return ConnError::None;
            }
            return ConnError::Tls;
        default:
            return ConnError::Tls;
    }
}

void TlsConnection::fail(ConnError e, const std::string& detail) {
    if (_state == ConnState::Closed) return;
    _error = e;
    if (is_reported(e)) {
        _emit(EventKind::Warning, tag(_id) + "connection failed: " + detail, _id);
    }
    close();
}

void TlsConnection::close() {
    if (_state == ConnState::Closed) return;
    _state = ConnState::Closed;

    if (_ssl) {
        if (_tls_healthy) (void)SSL_shutdown(_ssl);
        SSL_free(_ssl);
        _ssl = nullptr;
        ERR_clear_error();
    }
    _set.remove(_id);
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

} // namespace ph::internal
